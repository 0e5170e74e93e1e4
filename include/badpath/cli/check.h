// BADPATH - badpath-check Command Line Front End
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// The badpath-check tool classifies each path given on the command line and
// prints one verdict line per path. The exit status is 0 when every path is
// safe, 1 when any path is dangerous and 2 on a usage or configuration error.

#ifndef BADPATH_CLI_CHECK_H
#define BADPATH_CLI_CHECK_H

#include "badpath/checker/settings.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace badpath {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "badpath-check";

namespace exitcode {
    constexpr int SAFE = 0;
    constexpr int DANGEROUS = 1;
    constexpr int USAGE = 2;
}

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    std::string configFile;
    std::optional<std::string> mode;
    bool cwdOnly{false};
    bool systemOk{false};
    bool userPathsOk{false};
    bool notWriteable{false};
    std::vector<std::string> userPaths;
    bool listPaths{false};
    bool quiet{false};
    bool debug{false};
    bool showHelp{false};
    bool showVersion{false};
    std::vector<std::string> paths;
};

/// Fill config from argv. False on an unknown option or a missing argument.
bool ParseCommandLine(int argc, char* argv[], CLIConfig& config);

/**
 * Combine the config file, --mode and the policy flags, in that order of
 * precedence (later wins).
 *
 * @throws std::invalid_argument on an unknown mode or a bad config value
 * @return false if the config file cannot be parsed
 */
bool BuildSettings(const CLIConfig& config, checker::Settings& settings, std::ostream& err);

/**
 * Run the tool. Verdicts, help and listings go to out; errors go to err.
 *
 * @return One of the exitcode values
 */
int AppMain(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace badpath

#endif // BADPATH_CLI_CHECK_H
