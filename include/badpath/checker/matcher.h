// BADPATH - Dangerous-Path Matcher
// Copyright (c) 2024 BADPATH Developers
// MIT License

#ifndef BADPATH_CHECKER_MATCHER_H
#define BADPATH_CHECKER_MATCHER_H

#include "badpath/checker/registry.h"
#include "badpath/platform/platform.h"

#include <string>
#include <vector>

namespace badpath {
namespace checker {

/**
 * Ancestor-or-equal test on whole components.
 *
 * Both sides are lexically normalized first. "/etcx" is not within "/etc".
 * Case-insensitive on Windows.
 */
bool PathIsWithin(const std::string& path, const std::string& prefix, Platform platform);

/// True if the path lies in any of the given locations
bool MatchesAny(const std::string& path, const std::vector<std::string>& prefixes,
                Platform platform);

/// True if the normalized path lies in a platform system location.
/// On the host the resolved form of each prefix is tried as well.
bool IsSystemPath(const std::string& normalized, Platform platform = HostPlatform());

/// True if the normalized path lies in a registered sensitive location
bool IsSensitivePath(const std::string& normalized, const UserPathRegistry& registry,
                     Platform platform = HostPlatform());

/// Same as above against an already-taken snapshot of entries
bool IsSensitivePath(const std::string& normalized, const std::vector<std::string>& entries,
                     Platform platform = HostPlatform());

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_MATCHER_H
