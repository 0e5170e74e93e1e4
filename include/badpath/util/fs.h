// BADPATH - Filesystem Utilities
// Copyright (c) 2024 BADPATH Developers
// MIT License
//
// Thin, non-throwing wrappers over the host filesystem:
// - Status and permission queries
// - Working/home/temp directory lookup and canonical resolution
// - Directory and file helpers used by the tools and the test suite
//
// Every function returning bool reports failure as false; none of them
// throw. Paths containing an embedded NUL byte are rejected up front since
// the OS would silently truncate them.

#ifndef BADPATH_UTIL_FS_H
#define BADPATH_UTIL_FS_H

#include <cstdint>
#include <string>
#include <vector>

namespace badpath {
namespace util {
namespace fs {

// ============================================================================
// Path Constants
// ============================================================================

#ifdef _WIN32
constexpr char PATH_SEPARATOR = '\\';
#else
constexpr char PATH_SEPARATOR = '/';
#endif

/// True if the text carries a NUL byte anywhere
inline bool HasEmbeddedNul(const std::string& path) {
    return path.find('\0') != std::string::npos;
}

// ============================================================================
// File Status
// ============================================================================

enum class FileType {
    None,           // Not found or error
    Regular,
    Directory,
    Symlink,
    Other           // Device, fifo, socket
};

struct FileStatus {
    FileType type{FileType::None};
    uint16_t mode{0};              // Permission bits (0777 mask)

    bool Exists() const { return type != FileType::None; }
    bool IsFile() const { return type == FileType::Regular; }
    bool IsDirectory() const { return type == FileType::Directory; }
    bool IsSymlink() const { return type == FileType::Symlink; }
};

/// Status following symlinks
FileStatus Status(const std::string& path);

/// Status of the link itself
FileStatus SymlinkStatus(const std::string& path);

bool Exists(const std::string& path);
bool IsDirectory(const std::string& path);
bool IsSymlink(const std::string& path);

// ============================================================================
// Permission Queries
// ============================================================================

/// Access rights, combinable with operator|
enum class AccessRight : int {
    Exists = 0,
    Read = 4,
    Write = 2,
    Execute = 1
};

inline AccessRight operator|(AccessRight a, AccessRight b) {
    return static_cast<AccessRight>(static_cast<int>(a) | static_cast<int>(b));
}

/// Ask the OS whether the current process holds `rights` on `path`
/// (access(2) on POSIX, _access on Windows). False on any error.
bool HasAccess(const std::string& path, AccessRight rights);

// ============================================================================
// Path Queries
// ============================================================================

/// Current working directory (empty on failure)
std::string CurrentPath();

/// Change working directory
bool SetCurrentPath(const std::string& path);

/// Temporary directory ($TMPDIR or /tmp)
std::string TempDirectoryPath();

/// Home directory ($HOME, then the password database; %USERPROFILE% on Windows)
std::string HomeDirectory();

/// Resolve symlinks, "." and ".." of an existing path (empty on failure)
std::string CanonicalPath(const std::string& path);

/// Expand a leading "~" or "~/" to the home directory
std::string ExpandUser(const std::string& path);

// ============================================================================
// Directory and File Operations
// ============================================================================

bool CreateDirectory(const std::string& path);

/// Create directory and all missing parents
bool CreateDirectories(const std::string& path);

/// Remove a file or a directory tree (true if nothing remains)
bool RemoveAll(const std::string& path);

/// Names of the entries of a directory, "." and ".." excluded
std::vector<std::string> ListDirectory(const std::string& path);

bool WriteFile(const std::string& path, const std::string& content);

bool CreateSymlink(const std::string& target, const std::string& link);

/// chmod the path (no-op returning false on Windows)
bool SetPermissions(const std::string& path, uint16_t mode);

// ============================================================================
// Temporary Directories
// ============================================================================

/// Create a fresh directory below `parent` (TempDirectoryPath() if empty)
/// @return Path of the created directory (empty on failure)
std::string CreateTempDirectory(const std::string& prefix = "badpath_",
                                const std::string& parent = "");

/// RAII temporary directory (removed recursively on destruction)
class TempDirectory {
public:
    TempDirectory();
    explicit TempDirectory(const std::string& prefix, const std::string& parent = "");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    const std::string& GetPath() const { return path_; }

    /// Release ownership (won't be deleted)
    std::string Release();

    bool IsValid() const { return !path_.empty(); }

private:
    std::string path_;
};

} // namespace fs
} // namespace util
} // namespace badpath

#endif // BADPATH_UTIL_FS_H
