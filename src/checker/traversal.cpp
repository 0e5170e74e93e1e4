// BADPATH - Traversal Guard Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/traversal.h"

#include "badpath/checker/matcher.h"
#include "badpath/checker/normalizer.h"
#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

namespace badpath {
namespace checker {

bool IsOutsideCwd(const std::string& normalized, Platform platform) {
    std::string cwd = util::fs::CurrentPath();
    if (cwd.empty()) {
        LOG_DEBUG(util::LogCategory::CHECKER)
            << "Working directory unavailable, treating " << normalized << " as outside";
        return true;
    }

    std::string base = Normalize(cwd, platform);
    bool outside = !PathIsWithin(normalized, base, platform);

    LOG_TRACE(util::LogCategory::CHECKER)
        << normalized << (outside ? " is outside " : " is inside ") << base;
    return outside;
}

} // namespace checker
} // namespace badpath
