// BADPATH - Path Checker
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Public entry points of the classifier. PathChecker composes the
// normalizer, matcher, validator, traversal guard and accessibility probe
// into a single verdict; the free functions cover the common one-shot
// queries against the process-wide registry.
//
// Example:
//   badpath::PathChecker checker(userSuppliedPath);
//   if (!checker) {
//       std::cerr << "refusing " << checker.Path() << ": "
//                 << checker.Reasons().ToString() << "\n";
//   }

#ifndef BADPATH_CHECKER_CHECKER_H
#define BADPATH_CHECKER_CHECKER_H

#include "badpath/checker/registry.h"

#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace badpath {

// ============================================================================
// Options
// ============================================================================

/// Intended use of the path
enum class AccessMode {
    Read,
    Write
};

/// Parse "read" or "write" (case-sensitive)
/// @throws std::invalid_argument for anything else
AccessMode ParseAccessMode(const std::string& mode);

const char* AccessModeToString(AccessMode mode);

/// Policy knobs for PathChecker. The defaults are the strict write policy.
struct CheckerOptions {
    bool systemOk{false};       // System locations are acceptable
    bool userPathsOk{false};    // Registered sensitive locations are acceptable
    bool notWriteable{false};   // Existing read-only paths are acceptable
    bool cwdOnly{false};        // Path must stay inside the working directory
    bool raiseError{false};     // Throw DangerousPathError from the constructor

    /// Read waives the system, sensitive and writability rules; Write
    /// enforces all three. cwdOnly and raiseError stay false.
    static CheckerOptions ForMode(AccessMode mode);
};

// ============================================================================
// Danger Reasons
// ============================================================================

/// Which conditions made a path dangerous
struct DangerReasons {
    bool invalidChars{false};
    bool systemPath{false};
    bool sensitivePath{false};
    bool outsideCwd{false};
    bool notWritable{false};

    bool Any() const {
        return invalidChars || systemPath || sensitivePath || outsideCwd || notWritable;
    }

    /// Comma-separated names, "none" when empty
    std::string ToString() const;

    bool operator==(const DangerReasons& other) const;
    bool operator!=(const DangerReasons& other) const { return !(*this == other); }
};

// ============================================================================
// Errors
// ============================================================================

class DangerousPathError : public std::runtime_error {
public:
    DangerousPathError(const std::string& path, const DangerReasons& reasons);
    DangerousPathError(const std::string& message, const std::string& path,
                       const DangerReasons& reasons);

    const std::string& Path() const { return path_; }
    const DangerReasons& Reasons() const { return reasons_; }

private:
    std::string path_;
    DangerReasons reasons_;
};

// ============================================================================
// Path Checker
// ============================================================================

/**
 * Classification of a single path.
 *
 * Normalization and matching happen in the constructor. The readable,
 * writable and creatable probes run on first use and are cached. Not
 * thread-safe.
 */
class PathChecker {
public:
    /**
     * Classify a path.
     *
     * @param path Path text as supplied by the caller
     * @param options Danger policy
     * @param registry Sensitive locations (process-wide registry if null)
     * @throws DangerousPathError if options.raiseError and the path is dangerous
     */
    explicit PathChecker(const std::string& path,
                         const CheckerOptions& options = CheckerOptions(),
                         std::shared_ptr<checker::UserPathRegistry> registry = nullptr);

    // ========================================================================
    // Verdict
    // ========================================================================

    bool IsSafe() const { return !reasons_.Any(); }
    bool IsDangerous() const { return reasons_.Any(); }
    explicit operator bool() const { return IsSafe(); }

    const DangerReasons& Reasons() const { return reasons_; }

    /// Original input
    const std::string& Path() const { return path_; }

    const std::string& NormalizedPath() const { return verdict_.normalized; }

    bool IsSystemPath() const { return verdict_.systemPath; }
    bool IsSensitivePath() const { return verdict_.sensitivePath; }
    bool HasInvalidChars() const { return verdict_.invalidChars; }

    /// Engaged only when options.cwdOnly is set
    std::optional<bool> IsOutsideCwd() const { return verdict_.outsideCwd; }

    const CheckerOptions& Options() const { return options_; }

    // ========================================================================
    // Accessibility (lazy, cached)
    // ========================================================================

    bool IsReadable() const;
    bool IsWritable() const;
    bool IsCreatable() const;

    // ========================================================================
    // Re-evaluation
    // ========================================================================

    /**
     * Classify another path with this checker's options and the registry
     * entries captured at construction (or the last Recheck). Does not
     * change this checker.
     *
     * @return true if the other path is dangerous
     */
    bool Check(const std::string& otherPath, bool raiseError = false) const;

    /**
     * Re-read the registry and classify the original path again.
     *
     * @return true if the path is dangerous
     */
    bool Recheck(bool raiseError = false);

    /// "PathChecker('<path>', safe|dangerous)"
    std::string ToString() const;

private:
    struct Verdict {
        std::string normalized;
        bool invalidChars{false};
        bool systemPath{false};
        bool sensitivePath{false};
        bool exists{false};
        std::optional<bool> outsideCwd;
    };

    Verdict Evaluate(const std::string& path) const;
    DangerReasons Judge(const Verdict& verdict, bool writable) const;
    void Classify();

    std::string path_;
    CheckerOptions options_;
    std::shared_ptr<checker::UserPathRegistry> registry_;
    std::vector<std::string> userPaths_;  // Registry snapshot

    Verdict verdict_;
    DangerReasons reasons_;

    mutable std::optional<bool> readable_;
    mutable std::optional<bool> writable_;
    mutable std::optional<bool> creatable_;
};

std::ostream& operator<<(std::ostream& os, const PathChecker& checker);

// ============================================================================
// Free Functions (host platform, process-wide registry)
// ============================================================================

/**
 * Classify a path with the default write policy.
 *
 * @throws DangerousPathError if raiseError and the path is dangerous
 */
bool IsDangerousPath(const std::string& path, bool raiseError = false);

/// Path lies in a platform system location
bool IsSystemPath(const std::string& path);

/// Path lies in a location registered with AddUserPath
bool IsSensitivePath(const std::string& path);

/// System prefixes followed by the registered paths, without duplicates
std::vector<std::string> GetDangerousPaths();

/// System prefixes of the host platform
std::vector<std::string> GetSystemPaths();

void AddUserPath(const std::string& path);

/// @throws std::invalid_argument if the path was never added
void RemoveUserPath(const std::string& path);

void ClearUserPaths();

std::vector<std::string> GetUserPaths();

} // namespace badpath

#endif // BADPATH_CHECKER_CHECKER_H
