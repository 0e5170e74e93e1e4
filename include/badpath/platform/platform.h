// BADPATH - Platform Path Database
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Static per-OS data used by the classifier: dangerous directory prefixes,
// invalid filename characters, reserved device names and the trailing
// character rule. Every lookup takes the platform explicitly so the Windows
// and Darwin rules can be evaluated on any host.

#ifndef BADPATH_PLATFORM_PLATFORM_H
#define BADPATH_PLATFORM_PLATFORM_H

#include <optional>
#include <string>
#include <vector>

namespace badpath {

// ============================================================================
// Platform
// ============================================================================

enum class Platform {
    Posix,      // Linux and other Unix-likes
    Darwin,     // macOS
    Windows
};

/// The platform this process was compiled for
Platform HostPlatform();

/// "posix", "darwin" or "windows"
const char* PlatformToString(Platform platform);

/// Accepts posix, linux, darwin, macos and windows (case-insensitive)
std::optional<Platform> PlatformFromString(const std::string& name);

// ============================================================================
// Platform Rules
// ============================================================================

/**
 * Canonical prefixes of the directories that must not be touched.
 *
 * On a Windows host the values of %WINDIR% and %SYSTEMROOT% are appended
 * (first call only; the list is then fixed for the process).
 */
const std::vector<std::string>& DangerousPrefixes(Platform platform);

/// Characters that may not appear anywhere in a path
const std::vector<char>& InvalidCharacters(Platform platform);

/// Reserved base names (empty except on Windows)
const std::vector<std::string>& ReservedNames(Platform platform);

/// True on Windows when the component ends with a space or a period
bool HasInvalidTrailingChar(Platform platform, const std::string& component);

/// Whether path comparison distinguishes case
bool IsCaseSensitive(Platform platform);

/// Preferred separator for joining components
char PreferredSeparator(Platform platform);

} // namespace badpath

#endif // BADPATH_PLATFORM_PLATFORM_H
