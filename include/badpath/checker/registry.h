// BADPATH - User Path Registry
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Caller-supplied deny-list of sensitive locations. Entries are stored
// verbatim, in insertion order, and are normalized only when matched.

#ifndef BADPATH_CHECKER_REGISTRY_H
#define BADPATH_CHECKER_REGISTRY_H

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace badpath {
namespace checker {

/**
 * Thread-safe, insertion-ordered set of sensitive paths.
 *
 * Every operation takes the internal lock; use Snapshot() for a consistent
 * view across several lookups.
 */
class UserPathRegistry {
public:
    UserPathRegistry() = default;

    UserPathRegistry(const UserPathRegistry&) = delete;
    UserPathRegistry& operator=(const UserPathRegistry&) = delete;

    /// Add a path. Returns false if it was already present.
    bool Add(const std::string& path);

    /// Remove a path
    /// @throws std::invalid_argument if the path was never added
    void Remove(const std::string& path);

    /// True if exactly this text was added
    bool Contains(const std::string& path) const;

    void Clear();

    /// Copy of the entries in insertion order
    std::vector<std::string> Snapshot() const;

    size_t Size() const;
    bool Empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> paths_;
};

/// Process-wide registry backing the free functions
std::shared_ptr<UserPathRegistry> DefaultUserPathRegistry();

} // namespace checker
} // namespace badpath

#endif // BADPATH_CHECKER_REGISTRY_H
