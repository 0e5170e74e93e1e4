// BADPATH - Platform Path Database Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/platform/platform.h"

#include "badpath/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace badpath {

namespace {

// Shared core of the Unix-like lists
const char* const UNIX_CORE[] = {
    "/etc", "/bin", "/sbin", "/boot", "/sys", "/proc", "/dev"
};

std::vector<std::string> BuildPosixPrefixes() {
    std::vector<std::string> prefixes(std::begin(UNIX_CORE), std::end(UNIX_CORE));
    for (const char* p : {"/root", "/lib", "/lib64", "/usr", "/var", "/opt"}) {
        prefixes.emplace_back(p);
    }
    return prefixes;
}

std::vector<std::string> BuildDarwinPrefixes() {
    std::vector<std::string> prefixes(std::begin(UNIX_CORE), std::end(UNIX_CORE));
    for (const char* p : {"/System", "/Library", "/Applications", "/usr", "/private/etc"}) {
        prefixes.emplace_back(p);
    }
    // Only the protected parts of /var, so /private/var/folders stays usable
    for (const char* sub : {"root", "db", "log", "audit", "vm", "backups"}) {
        prefixes.push_back(std::string("/private/var/") + sub);
    }
    for (const char* sub : {"root", "db", "log", "audit", "vm", "backups"}) {
        prefixes.push_back(std::string("/var/") + sub);
    }
    return prefixes;
}

std::vector<std::string> BuildWindowsPrefixes() {
    std::vector<std::string> prefixes = {
        "C:\\Windows",
        "C:\\Windows\\System32",
        "C:\\Program Files",
        "C:\\Program Files (x86)",
        "C:\\ProgramData",
    };

    if (HostPlatform() != Platform::Windows) {
        return prefixes;
    }

    for (const char* var : {"WINDIR", "SYSTEMROOT"}) {
        const char* value = std::getenv(var);
        if (value == nullptr || *value == '\0') {
            continue;
        }
        std::string entry(value);
        while (entry.size() > 3 && (entry.back() == '\\' || entry.back() == '/')) {
            entry.pop_back();
        }
        bool known = std::any_of(prefixes.begin(), prefixes.end(),
            [&entry](const std::string& p) {
                if (p.size() != entry.size()) return false;
                for (size_t i = 0; i < p.size(); ++i) {
                    if (std::tolower(static_cast<unsigned char>(p[i])) !=
                        std::tolower(static_cast<unsigned char>(entry[i]))) {
                        return false;
                    }
                }
                return true;
            });
        if (!known) {
            LOG_DEBUG(util::LogCategory::PLATFORM)
                << "Adding %" << var << "% location " << entry;
            prefixes.push_back(entry);
        }
    }
    return prefixes;
}

std::vector<char> BuildWindowsInvalidChars() {
    std::vector<char> chars = {'<', '>', ':', '"', '|', '?', '*'};
    for (int c = 0; c < 32; ++c) {
        chars.push_back(static_cast<char>(c));
    }
    return chars;
}

std::vector<std::string> BuildWindowsReservedNames() {
    std::vector<std::string> names = {"CON", "PRN", "AUX", "NUL"};
    for (int i = 1; i <= 9; ++i) {
        names.push_back("COM" + std::to_string(i));
    }
    for (int i = 1; i <= 9; ++i) {
        names.push_back("LPT" + std::to_string(i));
    }
    return names;
}

} // namespace

// ============================================================================
// Platform
// ============================================================================

Platform HostPlatform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::Darwin;
#else
    return Platform::Posix;
#endif
}

const char* PlatformToString(Platform platform) {
    switch (platform) {
        case Platform::Posix:   return "posix";
        case Platform::Darwin:  return "darwin";
        case Platform::Windows: return "windows";
    }
    return "unknown";
}

std::optional<Platform> PlatformFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "posix" || lower == "linux") return Platform::Posix;
    if (lower == "darwin" || lower == "macos") return Platform::Darwin;
    if (lower == "windows") return Platform::Windows;
    return std::nullopt;
}

// ============================================================================
// Platform Rules
// ============================================================================

const std::vector<std::string>& DangerousPrefixes(Platform platform) {
    static const std::vector<std::string> posix = BuildPosixPrefixes();
    static const std::vector<std::string> darwin = BuildDarwinPrefixes();
    static const std::vector<std::string> windows = BuildWindowsPrefixes();

    switch (platform) {
        case Platform::Darwin:  return darwin;
        case Platform::Windows: return windows;
        case Platform::Posix:   break;
    }
    return posix;
}

const std::vector<char>& InvalidCharacters(Platform platform) {
    static const std::vector<char> posix = {'\0'};
    static const std::vector<char> darwin = {'\0', ':'};
    static const std::vector<char> windows = BuildWindowsInvalidChars();

    switch (platform) {
        case Platform::Darwin:  return darwin;
        case Platform::Windows: return windows;
        case Platform::Posix:   break;
    }
    return posix;
}

const std::vector<std::string>& ReservedNames(Platform platform) {
    static const std::vector<std::string> none;
    static const std::vector<std::string> windows = BuildWindowsReservedNames();

    return platform == Platform::Windows ? windows : none;
}

bool HasInvalidTrailingChar(Platform platform, const std::string& component) {
    if (platform != Platform::Windows || component.empty()) {
        return false;
    }
    char last = component.back();
    return last == ' ' || last == '.';
}

bool IsCaseSensitive(Platform platform) {
    return platform != Platform::Windows;
}

char PreferredSeparator(Platform platform) {
    return platform == Platform::Windows ? '\\' : '/';
}

} // namespace badpath
