// BADPATH - Accessibility Probe
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Advisory permission checks for the calling process. The answers can be
// stale by the time the caller acts on them.

#ifndef BADPATH_CHECKER_ACCESS_H
#define BADPATH_CHECKER_ACCESS_H

#include <string>

namespace badpath {
namespace checker {

/// Path exists and the process may read it
bool IsReadable(const std::string& path);

/// Path exists and the process may write it
bool IsWritable(const std::string& path);

/// Path does not exist and its nearest existing ancestor is a directory
/// the process may write into and search
bool IsCreatable(const std::string& path);

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_ACCESS_H
