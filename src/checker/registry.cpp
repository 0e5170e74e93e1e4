// BADPATH - User Path Registry Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/registry.h"

#include "badpath/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace badpath {
namespace checker {

bool UserPathRegistry::Add(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(paths_.begin(), paths_.end(), path) != paths_.end()) {
        return false;
    }
    paths_.push_back(path);
    LOG_INFO(util::LogCategory::CHECKER) << "Added sensitive path " << path;
    return true;
}

void UserPathRegistry::Remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(paths_.begin(), paths_.end(), path);
    if (it == paths_.end()) {
        throw std::invalid_argument("Path '" + path + "' is not in the user-defined paths list");
    }
    paths_.erase(it);
    LOG_INFO(util::LogCategory::CHECKER) << "Removed sensitive path " << path;
}

bool UserPathRegistry::Contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(paths_.begin(), paths_.end(), path) != paths_.end();
}

void UserPathRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paths_.empty()) {
        LOG_INFO(util::LogCategory::CHECKER)
            << "Cleared " << paths_.size() << " sensitive path(s)";
    }
    paths_.clear();
}

std::vector<std::string> UserPathRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_;
}

size_t UserPathRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.size();
}

bool UserPathRegistry::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.empty();
}

std::shared_ptr<UserPathRegistry> DefaultUserPathRegistry() {
    static const std::shared_ptr<UserPathRegistry> registry =
        std::make_shared<UserPathRegistry>();
    return registry;
}

} // namespace checker
} // namespace badpath
