// BADPATH - Path Normalizer Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/normalizer.h"

#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

#include <cctype>

namespace badpath {
namespace checker {

namespace {

bool IsSeparator(char c, Platform platform) {
    return c == '/' || (platform == Platform::Windows && c == '\\');
}

bool IsDriveOnly(const std::string& root) {
    return root.size() == 2 && root[1] == ':';
}

/// Expand "~" and "~/" (also "~\" for Windows rules)
std::string ExpandHome(const std::string& input, Platform platform) {
    if (input.empty() || input[0] != '~') {
        return input;
    }
    if (input.size() > 1 && !IsSeparator(input[1], platform)) {
        return input;
    }

    std::string home = util::fs::HomeDirectory();
    if (home.empty()) {
        LOG_DEBUG(util::LogCategory::NORMALIZE) << "No home directory to expand " << input;
        return input;
    }
    return home + input.substr(1);
}

} // namespace

// ============================================================================
// Path Components
// ============================================================================

bool PathComponents::IsAbsolute() const {
    return !root.empty() && !IsDriveOnly(root);
}

PathComponents SplitComponents(const std::string& path, Platform platform) {
    PathComponents result;
    size_t pos = 0;
    const size_t size = path.size();

    if (platform == Platform::Windows) {
        if (size >= 2 && IsSeparator(path[0], platform) && IsSeparator(path[1], platform)) {
            // UNC: \\server\share
            size_t serverEnd = 2;
            while (serverEnd < size && !IsSeparator(path[serverEnd], platform)) ++serverEnd;
            std::string server = path.substr(2, serverEnd - 2);

            if (server.empty()) {
                result.root = "\\";
                pos = 2;
            } else {
                size_t shareStart = serverEnd < size ? serverEnd + 1 : size;
                size_t shareEnd = shareStart;
                while (shareEnd < size && !IsSeparator(path[shareEnd], platform)) ++shareEnd;
                std::string share = path.substr(shareStart, shareEnd - shareStart);

                result.root = "\\\\" + server + "\\";
                if (!share.empty()) {
                    result.root += share + "\\";
                }
                pos = shareEnd;
            }
        } else if (size >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) &&
                   path[1] == ':') {
            result.root = path.substr(0, 2);
            pos = 2;
            if (pos < size && IsSeparator(path[pos], platform)) {
                result.root += '\\';
            }
        } else if (size > 0 && IsSeparator(path[0], platform)) {
            result.root = "\\";
        }
    } else if (size > 0 && path[0] == '/') {
        result.root = "/";
    }

    std::string current;
    for (size_t i = pos; i < size; ++i) {
        if (IsSeparator(path[i], platform)) {
            if (!current.empty()) {
                result.parts.push_back(current);
                current.clear();
            }
        } else {
            current += path[i];
        }
    }
    if (!current.empty()) {
        result.parts.push_back(current);
    }

    return result;
}

std::string JoinComponents(const PathComponents& components, Platform platform) {
    const char sep = PreferredSeparator(platform);
    std::string out = components.root;
    for (size_t i = 0; i < components.parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += components.parts[i];
    }
    return out.empty() ? "." : out;
}

bool ComponentsEqual(const std::string& a, const std::string& b, Platform platform) {
    if (IsCaseSensitive(platform)) {
        return a == b;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Normalization
// ============================================================================

std::string LexicalNormalize(const std::string& path, Platform platform) {
    PathComponents in = SplitComponents(path, platform);
    PathComponents out;
    out.root = in.root;

    for (const auto& part : in.parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!out.parts.empty() && out.parts.back() != "..") {
                out.parts.pop_back();
            } else if (out.root.empty()) {
                out.parts.push_back(part);
            }
            // ".." above the root stays at the root
            continue;
        }
        out.parts.push_back(part);
    }

    return JoinComponents(out, platform);
}

std::string Normalize(const std::string& input, Platform platform) {
    std::string expanded = ExpandHome(input, platform);

    if (platform != HostPlatform() || util::fs::HasEmbeddedNul(expanded)) {
        return LexicalNormalize(expanded, platform);
    }

    PathComponents components = SplitComponents(expanded, platform);
    std::string absolute;
    if (components.IsAbsolute()) {
        absolute = expanded;
    } else if (!components.root.empty()) {
        // "C:foo" is taken relative to the drive root
        components.root += '\\';
        absolute = JoinComponents(components, platform);
    } else {
        std::string cwd = util::fs::CurrentPath();
        if (cwd.empty()) {
            LOG_DEBUG(util::LogCategory::NORMALIZE)
                << "Working directory unavailable, keeping " << expanded << " relative";
            return LexicalNormalize(expanded, platform);
        }
        absolute = cwd + PreferredSeparator(platform) + expanded;
    }

    std::string resolved = util::fs::CanonicalPath(absolute);
    if (!resolved.empty()) {
        return LexicalNormalize(resolved, platform);
    }

    LOG_DEBUG(util::LogCategory::NORMALIZE)
        << "Cannot resolve " << absolute << ", resolving component by component";

    // Walk the raw components so a ".." is applied to the resolved prefix.
    // Parts [0, resolvedDepth) of current are real; the rest do not exist.
    PathComponents raw = SplitComponents(absolute, platform);
    PathComponents current;
    current.root = raw.root;
    size_t resolvedDepth = 0;

    for (const auto& part : raw.parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!current.parts.empty()) {
                current.parts.pop_back();
            }
            if (current.parts.size() < resolvedDepth) {
                resolvedDepth = current.parts.size();
            }
            continue;
        }
        if (current.parts.size() > resolvedDepth) {
            current.parts.push_back(part);
            continue;
        }

        PathComponents candidate = current;
        candidate.parts.push_back(part);
        std::string real = util::fs::CanonicalPath(JoinComponents(candidate, platform));
        if (real.empty()) {
            current.parts.push_back(part);
            continue;
        }
        current = SplitComponents(real, platform);
        resolvedDepth = current.parts.size();
    }

    return JoinComponents(current, platform);
}

} // namespace checker
} // namespace badpath
