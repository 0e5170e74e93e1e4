// BADPATH - Checker Settings Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/settings.h"

#include "badpath/util/fs.h"

#include <stdexcept>

namespace badpath {
namespace checker {

namespace {

const char* const FLAG_KEYS[] = {
    "system_ok", "user_paths_ok", "not_writeable", "cwd_only", "raise_error"
};

void ReadFlag(const util::ConfigManager& config, const char* key, bool& target) {
    if (!config.HasKey(key, Section::CHECKER)) {
        return;
    }
    auto value = config.TryGetBool(key, Section::CHECKER);
    if (!value) {
        throw std::invalid_argument(std::string("Invalid boolean for [checker] ") + key + ": '" +
                                    config.GetString(key, "", Section::CHECKER) + "'");
    }
    target = *value;
}

} // namespace

void AllowSettingsKeys(util::ConfigManager& config) {
    config.AllowKey("mode", Section::CHECKER);
    for (const char* key : FLAG_KEYS) {
        config.AllowKey(key, Section::CHECKER);
    }
    config.AllowKey("path", Section::USERPATHS);
    config.AllowKey("level", Section::LOG);
    config.AllowKey("categories", Section::LOG);
}

Settings LoadSettings(const util::ConfigManager& config) {
    Settings settings;

    if (auto mode = config.TryGetString("mode", Section::CHECKER)) {
        settings.options = CheckerOptions::ForMode(ParseAccessMode(*mode));
    }

    ReadFlag(config, "system_ok", settings.options.systemOk);
    ReadFlag(config, "user_paths_ok", settings.options.userPathsOk);
    ReadFlag(config, "not_writeable", settings.options.notWriteable);
    ReadFlag(config, "cwd_only", settings.options.cwdOnly);
    ReadFlag(config, "raise_error", settings.options.raiseError);

    for (const auto& path : config.GetList("path", Section::USERPATHS, false)) {
        settings.userPaths.push_back(util::fs::ExpandUser(path));
    }

    if (auto level = config.TryGetString("level", Section::LOG)) {
        settings.logLevel = util::LogLevelFromString(*level);
    }
    settings.logCategories = config.GetList("categories", Section::LOG);

    LOG_DEBUG(util::LogCategory::CONFIG)
        << "Loaded settings: " << settings.userPaths.size() << " user path(s)";
    return settings;
}

void ApplySettings(const Settings& settings, UserPathRegistry& registry) {
    for (const auto& path : settings.userPaths) {
        registry.Add(path);
    }
}

} // namespace checker
} // namespace badpath
