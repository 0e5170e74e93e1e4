// BADPATH - Dangerous-Path Matcher Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/matcher.h"

#include "badpath/checker/normalizer.h"
#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

namespace badpath {
namespace checker {

namespace {

/// System prefixes plus the resolved form of those that are symlinks
/// (e.g. /etc -> /private/etc on macOS)
std::vector<std::string> BuildHostPrefixes() {
    const Platform host = HostPlatform();
    std::vector<std::string> prefixes = DangerousPrefixes(host);

    for (const auto& prefix : DangerousPrefixes(host)) {
        std::string resolved = util::fs::CanonicalPath(prefix);
        if (resolved.empty()) {
            continue;
        }
        resolved = LexicalNormalize(resolved, host);

        bool seen = false;
        for (const auto& p : prefixes) {
            if (ComponentsEqual(LexicalNormalize(p, host), resolved, host)) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            LOG_DEBUG(util::LogCategory::MATCH)
                << "System location " << prefix << " resolves to " << resolved;
            prefixes.push_back(resolved);
        }
    }
    return prefixes;
}

} // namespace

bool PathIsWithin(const std::string& path, const std::string& prefix, Platform platform) {
    PathComponents p = SplitComponents(LexicalNormalize(path, platform), platform);
    PathComponents pre = SplitComponents(LexicalNormalize(prefix, platform), platform);

    if (!ComponentsEqual(p.root, pre.root, platform)) {
        return false;
    }
    if (pre.parts.size() > p.parts.size()) {
        return false;
    }
    for (size_t i = 0; i < pre.parts.size(); ++i) {
        if (!ComponentsEqual(p.parts[i], pre.parts[i], platform)) {
            return false;
        }
    }
    return true;
}

bool MatchesAny(const std::string& path, const std::vector<std::string>& prefixes,
                Platform platform) {
    for (const auto& prefix : prefixes) {
        if (PathIsWithin(path, prefix, platform)) {
            LOG_TRACE(util::LogCategory::MATCH) << path << " is within " << prefix;
            return true;
        }
    }
    return false;
}

bool IsSystemPath(const std::string& normalized, Platform platform) {
    if (platform == HostPlatform()) {
        static const std::vector<std::string> hostPrefixes = BuildHostPrefixes();
        return MatchesAny(normalized, hostPrefixes, platform);
    }
    return MatchesAny(normalized, DangerousPrefixes(platform), platform);
}

bool IsSensitivePath(const std::string& normalized, const UserPathRegistry& registry,
                     Platform platform) {
    return IsSensitivePath(normalized, registry.Snapshot(), platform);
}

bool IsSensitivePath(const std::string& normalized, const std::vector<std::string>& entries,
                     Platform platform) {
    for (const auto& entry : entries) {
        // An empty entry names no location
        if (entry.empty()) {
            continue;
        }
        if (PathIsWithin(normalized, Normalize(entry, platform), platform)) {
            LOG_TRACE(util::LogCategory::MATCH) << normalized << " matches sensitive " << entry;
            return true;
        }
    }
    return false;
}

} // namespace checker
} // namespace badpath
