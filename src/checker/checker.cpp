// BADPATH - Path Checker Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/checker/checker.h"

#include "badpath/checker/access.h"
#include "badpath/checker/matcher.h"
#include "badpath/checker/normalizer.h"
#include "badpath/checker/traversal.h"
#include "badpath/checker/validator.h"
#include "badpath/platform/platform.h"
#include "badpath/util/fs.h"
#include "badpath/util/logging.h"

#include <algorithm>
#include <sstream>

namespace badpath {

// ============================================================================
// Options
// ============================================================================

AccessMode ParseAccessMode(const std::string& mode) {
    if (mode == "read") return AccessMode::Read;
    if (mode == "write") return AccessMode::Write;
    throw std::invalid_argument("Invalid mode '" + mode + "'. Must be 'read' or 'write'");
}

const char* AccessModeToString(AccessMode mode) {
    return mode == AccessMode::Read ? "read" : "write";
}

CheckerOptions CheckerOptions::ForMode(AccessMode mode) {
    CheckerOptions options;
    if (mode == AccessMode::Read) {
        options.systemOk = true;
        options.userPathsOk = true;
        options.notWriteable = true;
    }
    return options;
}

// ============================================================================
// Danger Reasons
// ============================================================================

std::string DangerReasons::ToString() const {
    std::vector<const char*> names;
    if (invalidChars) names.push_back("invalid-chars");
    if (systemPath) names.push_back("system");
    if (sensitivePath) names.push_back("sensitive");
    if (outsideCwd) names.push_back("outside-cwd");
    if (notWritable) names.push_back("not-writable");

    if (names.empty()) {
        return "none";
    }

    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ",";
        out += names[i];
    }
    return out;
}

bool DangerReasons::operator==(const DangerReasons& other) const {
    return invalidChars == other.invalidChars &&
           systemPath == other.systemPath &&
           sensitivePath == other.sensitivePath &&
           outsideCwd == other.outsideCwd &&
           notWritable == other.notWritable;
}

// ============================================================================
// Errors
// ============================================================================

DangerousPathError::DangerousPathError(const std::string& path, const DangerReasons& reasons)
    : std::runtime_error("Path '" + path + "' points to a dangerous location")
    , path_(path)
    , reasons_(reasons) {}

DangerousPathError::DangerousPathError(const std::string& message, const std::string& path,
                                       const DangerReasons& reasons)
    : std::runtime_error(message)
    , path_(path)
    , reasons_(reasons) {}

// ============================================================================
// Path Checker
// ============================================================================

PathChecker::PathChecker(const std::string& path,
                         const CheckerOptions& options,
                         std::shared_ptr<checker::UserPathRegistry> registry)
    : path_(path)
    , options_(options)
    , registry_(registry ? std::move(registry) : checker::DefaultUserPathRegistry()) {
    userPaths_ = registry_->Snapshot();
    Classify();

    if (options_.raiseError && IsDangerous()) {
        LOG_WARN(util::LogCategory::CHECKER)
            << "Dangerous path " << path_ << " (" << reasons_.ToString() << ")";
        throw DangerousPathError(path_, reasons_);
    }
}

PathChecker::Verdict PathChecker::Evaluate(const std::string& path) const {
    const Platform host = HostPlatform();
    Verdict verdict;

    // Raw text, before normalization can hide anything
    verdict.invalidChars = checker::HasInvalidChars(path, host);
    verdict.normalized = checker::Normalize(path, host);
    verdict.systemPath = checker::IsSystemPath(verdict.normalized, host);
    verdict.sensitivePath = checker::IsSensitivePath(verdict.normalized, userPaths_, host);
    verdict.exists = util::fs::Exists(verdict.normalized);

    if (options_.cwdOnly) {
        verdict.outsideCwd = checker::IsOutsideCwd(verdict.normalized, host);
    }

    LOG_DEBUG(util::LogCategory::CHECKER)
        << path << " -> " << verdict.normalized
        << " system=" << verdict.systemPath
        << " sensitive=" << verdict.sensitivePath
        << " invalid=" << verdict.invalidChars
        << " exists=" << verdict.exists;

    return verdict;
}

DangerReasons PathChecker::Judge(const Verdict& verdict, bool writable) const {
    DangerReasons reasons;
    reasons.invalidChars = verdict.invalidChars;
    reasons.systemPath = verdict.systemPath && !options_.systemOk;
    reasons.sensitivePath = verdict.sensitivePath && !options_.userPathsOk;
    reasons.outsideCwd = verdict.outsideCwd.value_or(false);
    reasons.notWritable = verdict.exists && !options_.notWriteable && !writable;
    return reasons;
}

void PathChecker::Classify() {
    verdict_ = Evaluate(path_);
    readable_.reset();
    writable_.reset();
    creatable_.reset();

    // Only probe writability when the policy depends on it
    bool writable = true;
    if (verdict_.exists && !options_.notWriteable) {
        writable = IsWritable();
    }
    reasons_ = Judge(verdict_, writable);
}

bool PathChecker::IsReadable() const {
    if (!readable_) {
        readable_ = checker::IsReadable(verdict_.normalized);
    }
    return *readable_;
}

bool PathChecker::IsWritable() const {
    if (!writable_) {
        writable_ = checker::IsWritable(verdict_.normalized);
    }
    return *writable_;
}

bool PathChecker::IsCreatable() const {
    if (!creatable_) {
        creatable_ = checker::IsCreatable(verdict_.normalized);
    }
    return *creatable_;
}

bool PathChecker::Check(const std::string& otherPath, bool raiseError) const {
    Verdict verdict = Evaluate(otherPath);

    bool writable = true;
    if (verdict.exists && !options_.notWriteable) {
        writable = checker::IsWritable(verdict.normalized);
    }
    DangerReasons reasons = Judge(verdict, writable);

    if (raiseError && reasons.Any()) {
        LOG_WARN(util::LogCategory::CHECKER)
            << "Dangerous path " << otherPath << " (" << reasons.ToString() << ")";
        throw DangerousPathError(otherPath, reasons);
    }
    return reasons.Any();
}

bool PathChecker::Recheck(bool raiseError) {
    userPaths_ = registry_->Snapshot();
    Classify();

    if (raiseError && IsDangerous()) {
        LOG_WARN(util::LogCategory::CHECKER)
            << "Dangerous path " << path_ << " (" << reasons_.ToString() << ")";
        throw DangerousPathError(path_, reasons_);
    }
    return IsDangerous();
}

std::string PathChecker::ToString() const {
    std::ostringstream oss;
    oss << "PathChecker('" << path_ << "', " << (IsSafe() ? "safe" : "dangerous") << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const PathChecker& checker) {
    return os << checker.ToString();
}

// ============================================================================
// Free Functions
// ============================================================================

bool IsDangerousPath(const std::string& path, bool raiseError) {
    PathChecker checker(path);
    if (raiseError && checker.IsDangerous()) {
        LOG_WARN(util::LogCategory::CHECKER)
            << "Dangerous path " << path << " (" << checker.Reasons().ToString() << ")";
        throw DangerousPathError("Path '" + path + "' points to a dangerous system location",
                                 path, checker.Reasons());
    }
    return checker.IsDangerous();
}

bool IsSystemPath(const std::string& path) {
    const Platform host = HostPlatform();
    return checker::IsSystemPath(checker::Normalize(path, host), host);
}

bool IsSensitivePath(const std::string& path) {
    const Platform host = HostPlatform();
    return checker::IsSensitivePath(checker::Normalize(path, host),
                                    *checker::DefaultUserPathRegistry(), host);
}

std::vector<std::string> GetDangerousPaths() {
    std::vector<std::string> paths = GetSystemPaths();
    for (const auto& userPath : GetUserPaths()) {
        if (std::find(paths.begin(), paths.end(), userPath) == paths.end()) {
            paths.push_back(userPath);
        }
    }
    return paths;
}

std::vector<std::string> GetSystemPaths() {
    return DangerousPrefixes(HostPlatform());
}

void AddUserPath(const std::string& path) {
    checker::DefaultUserPathRegistry()->Add(path);
}

void RemoveUserPath(const std::string& path) {
    checker::DefaultUserPathRegistry()->Remove(path);
}

void ClearUserPaths() {
    checker::DefaultUserPathRegistry()->Clear();
}

std::vector<std::string> GetUserPaths() {
    return checker::DefaultUserPathRegistry()->Snapshot();
}

} // namespace badpath
