// BADPATH - Path Normalizer
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Turns caller-supplied path text into the canonical absolute form that the
// matcher and the traversal guard compare against.
//
// For the host platform the OS is asked to resolve symlinks. When the path
// (or part of it) does not exist, the longest existing ancestor is resolved
// and the rest is appended lexically. Foreign platforms, and text carrying a
// NUL byte, only get the lexical treatment. Nothing here throws.

#ifndef BADPATH_CHECKER_NORMALIZER_H
#define BADPATH_CHECKER_NORMALIZER_H

#include "badpath/platform/platform.h"

#include <string>
#include <vector>

namespace badpath {
namespace checker {

// ============================================================================
// Path Components
// ============================================================================

/// A path split into its root and its named components
struct PathComponents {
    /// "/" on Unix, "C:\" / "C:" / "\" / "\\server\share\" on Windows,
    /// empty for a relative path
    std::string root;
    std::vector<std::string> parts;

    /// True when the root pins the path to a fixed location
    bool IsAbsolute() const;
};

/// Split without collapsing anything but empty components
PathComponents SplitComponents(const std::string& path, Platform platform);

/// Join components back with the platform separator
std::string JoinComponents(const PathComponents& components, Platform platform);

// ============================================================================
// Normalization
// ============================================================================

/**
 * Purely textual cleanup.
 *
 * Collapses "." and "..", drops ".." at the root, keeps leading ".." of
 * relative paths, removes empty components and rejoins with the platform
 * separator. An empty relative result becomes ".".
 */
std::string LexicalNormalize(const std::string& path, Platform platform);

/**
 * Canonical absolute form of a path.
 *
 * Components are resolved left to right while they exist, so "link/.."
 * leaves the directory the link points into. Whatever does not exist is
 * appended lexically.
 *
 * @param input Path as supplied by the caller
 * @param platform Rules to apply (resolution only happens for the host)
 * @return Normalized path; Normalize(Normalize(x)) == Normalize(x)
 */
std::string Normalize(const std::string& input, Platform platform = HostPlatform());

/// Compare two components using the platform's case rules
bool ComponentsEqual(const std::string& a, const std::string& b, Platform platform);

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_NORMALIZER_H
