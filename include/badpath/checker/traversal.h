// BADPATH - Traversal Guard
// Copyright (c) 2024 BADPATH Developers
// MIT License

#ifndef BADPATH_CHECKER_TRAVERSAL_H
#define BADPATH_CHECKER_TRAVERSAL_H

#include "badpath/platform/platform.h"

#include <string>

namespace badpath {
namespace checker {

/**
 * Confinement check against the current working directory.
 *
 * The working directory is read and normalized on every call, so a chdir
 * between two calls is honoured. If it cannot be determined the path is
 * reported as outside.
 *
 * @param normalized Path already passed through Normalize()
 * @return true if the path is neither the working directory nor below it
 */
bool IsOutsideCwd(const std::string& normalized, Platform platform = HostPlatform());

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_TRAVERSAL_H
