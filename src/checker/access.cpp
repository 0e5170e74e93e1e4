// BADPATH - Accessibility Probe Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/access.h"

#include "badpath/checker/normalizer.h"
#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

namespace badpath {
namespace checker {

using util::fs::AccessRight;

bool IsReadable(const std::string& path) {
    return util::fs::HasAccess(path, AccessRight::Read);
}

bool IsWritable(const std::string& path) {
    return util::fs::HasAccess(path, AccessRight::Write);
}

bool IsCreatable(const std::string& path) {
    if (path.empty() || util::fs::HasEmbeddedNul(path)) {
        return false;
    }
    // A dangling symlink counts as existing
    if (util::fs::SymlinkStatus(path).Exists()) {
        return false;
    }

    const Platform host = HostPlatform();
    PathComponents components = SplitComponents(LexicalNormalize(path, host), host);

    while (!components.parts.empty()) {
        components.parts.pop_back();
        std::string ancestor = JoinComponents(components, host);

        util::fs::FileStatus status = util::fs::Status(ancestor);
        if (!status.Exists()) {
            continue;
        }
        if (!status.IsDirectory()) {
            LOG_DEBUG(util::LogCategory::ACCESS)
                << "Nearest existing ancestor " << ancestor << " is not a directory";
            return false;
        }
        return util::fs::HasAccess(ancestor, AccessRight::Write | AccessRight::Execute);
    }

    return false;
}

} // namespace checker
} // namespace badpath
