// BADPATH - badpath-check Command Line Front End Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/cli/check.h"

#include "badpath/checker/checker.h"
#include "badpath/checker/registry.h"
#include "badpath/util/config.h"
#include "badpath/util/logging.h"

#include <exception>
#include <getopt.h>
#include <memory>

namespace badpath {
namespace cli {

namespace {

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp(std::ostream& out) {
    out << CLIENT_NAME << " v" << VERSION << "\n\n";
    out << "Usage: badpath-check [options] PATH...\n\n";
    out << "Options:\n";
    out << "  -h, --help                 Show this help message\n";
    out << "  -v, --version              Show version information\n";
    out << "  -c, --conf=FILE            Config file path\n";
    out << "  -m, --mode=read|write      Apply the read or write policy (default: write)\n";
    out << "\nPolicy Options:\n";
    out << "  --cwd-only                 Paths must stay inside the working directory\n";
    out << "  --system-ok                Accept system locations\n";
    out << "  --user-paths-ok            Accept registered sensitive locations\n";
    out << "  --not-writeable            Accept existing read-only paths\n";
    out << "  -u, --user-path=PATH       Register a sensitive location (repeatable)\n";
    out << "\nOutput Options:\n";
    out << "  --list                     Print the dangerous locations and exit\n";
    out << "  -q, --quiet                Print nothing, report through the exit status\n";
    out << "  -d, --debug                Log every classification step to stderr\n";
    out << "\nExit status:\n";
    out << "  0 all paths safe, 1 a path is dangerous, 2 usage or configuration error\n";
    out << "\nExamples:\n";
    out << "  badpath-check /etc/passwd ./output.txt\n";
    out << "  badpath-check --mode=read /usr/share/dict/words\n";
    out << "  badpath-check --cwd-only -u ~/.ssh ../escape.txt\n";
    out << "\n";
}

void PrintVersion(std::ostream& out) {
    out << CLIENT_NAME << " v" << VERSION << "\n";
    out << "Copyright (c) 2024 BADPATH Developers\n";
    out << "MIT License\n";
}

void SetupLogging(const CLIConfig& config, const checker::Settings& settings) {
    util::LogLevel level = config.debug ? util::LogLevel::Debug : settings.logLevel;

    util::Logger& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.AddSink(std::make_shared<util::ConsoleSink>(level));
    logger.SetLevel(level);
    logger.SetCategories(settings.logCategories);
}

int Run(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    CLIConfig config;

    if (!ParseCommandLine(argc, argv, config)) {
        err << "Error parsing command line. Use --help for usage.\n";
        return exitcode::USAGE;
    }

    if (config.showHelp) {
        PrintHelp(out);
        return exitcode::SAFE;
    }

    if (config.showVersion) {
        PrintVersion(out);
        return exitcode::SAFE;
    }

    checker::Settings settings;

    // Warnings from the config file should reach the user
    SetupLogging(config, settings);

    if (!BuildSettings(config, settings, err)) {
        return exitcode::USAGE;
    }
    SetupLogging(config, settings);

    auto registry = checker::DefaultUserPathRegistry();
    checker::ApplySettings(settings, *registry);

    if (config.listPaths) {
        for (const auto& path : GetDangerousPaths()) {
            out << path << "\n";
        }
        return exitcode::SAFE;
    }

    if (config.paths.empty()) {
        err << "Error: No path specified.\n";
        err << "Use 'badpath-check --help' for usage information.\n";
        return exitcode::USAGE;
    }

    int status = exitcode::SAFE;
    for (const auto& path : config.paths) {
        PathChecker checker(path, settings.options, registry);
        if (checker.IsDangerous()) {
            status = exitcode::DANGEROUS;
        }
        if (config.quiet) {
            continue;
        }
        out << (checker.IsSafe() ? "safe" : "dangerous") << "  " << path;
        if (checker.IsDangerous()) {
            out << "  [" << checker.Reasons().ToString() << "]";
        }
        out << "\n";
    }

    return status;
}

} // namespace

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"mode", required_argument, nullptr, 'm'},
        {"user-path", required_argument, nullptr, 'u'},
        {"quiet", no_argument, nullptr, 'q'},
        {"debug", no_argument, nullptr, 'd'},
        {"cwd-only", no_argument, nullptr, 1001},
        {"system-ok", no_argument, nullptr, 1002},
        {"user-paths-ok", no_argument, nullptr, 1003},
        {"not-writeable", no_argument, nullptr, 1004},
        {"list", no_argument, nullptr, 1005},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    // Reset getopt
    optind = 1;

    while ((opt = getopt_long(argc, argv, "hvc:m:u:qd", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configFile = optarg;
                break;
            case 'm':
                config.mode = optarg;
                break;
            case 'u':
                config.userPaths.push_back(optarg);
                break;
            case 'q':
                config.quiet = true;
                break;
            case 'd':
                config.debug = true;
                break;
            case 1001:  // --cwd-only
                config.cwdOnly = true;
                break;
            case 1002:  // --system-ok
                config.systemOk = true;
                break;
            case 1003:  // --user-paths-ok
                config.userPathsOk = true;
                break;
            case 1004:  // --not-writeable
                config.notWriteable = true;
                break;
            case 1005:  // --list
                config.listPaths = true;
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.paths.push_back(argv[i]);
    }

    return true;
}

// ============================================================================
// Settings
// ============================================================================

bool BuildSettings(const CLIConfig& config, checker::Settings& settings, std::ostream& err) {
    if (!config.configFile.empty()) {
        util::ConfigManager manager;
        checker::AllowSettingsKeys(manager);

        util::ConfigParseResult result = manager.ParseFile(config.configFile);
        if (!result.success) {
            err << "Error: " << result.Describe() << "\n";
            return false;
        }
        for (const auto& warning : manager.Validate()) {
            LOG_WARN(util::LogCategory::CONFIG) << warning;
        }
        settings = checker::LoadSettings(manager);
    }

    if (config.mode) {
        CheckerOptions modeOptions = CheckerOptions::ForMode(ParseAccessMode(*config.mode));
        settings.options.systemOk = modeOptions.systemOk;
        settings.options.userPathsOk = modeOptions.userPathsOk;
        settings.options.notWriteable = modeOptions.notWriteable;
    }

    if (config.cwdOnly) settings.options.cwdOnly = true;
    if (config.systemOk) settings.options.systemOk = true;
    if (config.userPathsOk) settings.options.userPathsOk = true;
    if (config.notWriteable) settings.options.notWriteable = true;

    // The tool reports through its output and exit status, never by throwing
    settings.options.raiseError = false;

    settings.userPaths.insert(settings.userPaths.end(),
                              config.userPaths.begin(), config.userPaths.end());
    return true;
}

// ============================================================================
// Entry Point
// ============================================================================

int AppMain(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    try {
        return Run(argc, argv, out, err);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return exitcode::USAGE;
    }
}

} // namespace cli
} // namespace badpath
