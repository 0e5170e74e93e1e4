// BADPATH - Checker Settings
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Maps a parsed configuration onto checker options and deny-list entries.
//
//   [checker]
//   mode = write            # read | write
//   system_ok = no          # individual flags override the mode
//   cwd_only = yes
//
//   [userpaths]
//   path = ~/.ssh
//   path = ${HOME}/.gnupg
//
//   [log]
//   level = debug
//   categories = normalize, match   # default: every stage

#ifndef BADPATH_CHECKER_SETTINGS_H
#define BADPATH_CHECKER_SETTINGS_H

#include "badpath/checker/checker.h"
#include "badpath/checker/registry.h"
#include "badpath/util/config.h"
#include "badpath/util/logging.h"

#include <string>
#include <vector>

namespace badpath {
namespace checker {

namespace Section {
    constexpr const char* CHECKER = "checker";
    constexpr const char* USERPATHS = "userpaths";
    constexpr const char* LOG = "log";
}

struct Settings {
    CheckerOptions options;
    std::vector<std::string> userPaths;
    util::LogLevel logLevel{util::LogLevel::Warn};
    std::vector<std::string> logCategories;  // Empty means all
};

/// Register the keys LoadSettings understands so ConfigManager::Validate()
/// can flag typos
void AllowSettingsKeys(util::ConfigManager& config);

/**
 * Read checker settings.
 *
 * @throws std::invalid_argument on an unknown mode or a non-boolean flag
 */
Settings LoadSettings(const util::ConfigManager& config);

/// Add the configured user paths to a registry
void ApplySettings(const Settings& settings, UserPathRegistry& registry);

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_SETTINGS_H
