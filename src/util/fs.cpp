// BADPATH - Filesystem Utilities Implementation
// Copyright (c) 2024 BADPATH Developers
// MIT License

#include "badpath/util/fs.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <windows.h>
#include <direct.h>
#include <io.h>
#else
#include <dirent.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <climits>
#endif

namespace badpath {
namespace util {
namespace fs {

// ============================================================================
// File Status Functions
// ============================================================================

FileStatus Status(const std::string& path) {
    FileStatus status;
    if (path.empty() || HasEmbeddedNul(path)) {
        return status;
    }

#ifdef _WIN32
    DWORD attrs = GetFileAttributesA(path.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) {
        return status;
    }
    status.type = (attrs & FILE_ATTRIBUTE_DIRECTORY) ? FileType::Directory
                                                     : FileType::Regular;
    status.mode = (attrs & FILE_ATTRIBUTE_READONLY) ? 0444 : 0666;
#else
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return status;
    }

    if (S_ISREG(st.st_mode)) status.type = FileType::Regular;
    else if (S_ISDIR(st.st_mode)) status.type = FileType::Directory;
    else if (S_ISLNK(st.st_mode)) status.type = FileType::Symlink;
    else status.type = FileType::Other;

    status.mode = static_cast<uint16_t>(st.st_mode & 0777);
#endif

    return status;
}

FileStatus SymlinkStatus(const std::string& path) {
#ifndef _WIN32
    FileStatus status;
    if (path.empty() || HasEmbeddedNul(path)) {
        return status;
    }

    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return status;
    }

    if (S_ISREG(st.st_mode)) status.type = FileType::Regular;
    else if (S_ISDIR(st.st_mode)) status.type = FileType::Directory;
    else if (S_ISLNK(st.st_mode)) status.type = FileType::Symlink;
    else status.type = FileType::Other;

    status.mode = static_cast<uint16_t>(st.st_mode & 0777);
    return status;
#else
    return Status(path);
#endif
}

bool Exists(const std::string& path) {
    return Status(path).Exists();
}

bool IsDirectory(const std::string& path) {
    return Status(path).IsDirectory();
}

bool IsSymlink(const std::string& path) {
    return SymlinkStatus(path).IsSymlink();
}

// ============================================================================
// Permission Queries
// ============================================================================

bool HasAccess(const std::string& path, AccessRight rights) {
    if (path.empty() || HasEmbeddedNul(path)) {
        return false;
    }
#ifdef _WIN32
    // _access knows no execute bit; directories are always searchable
    int mode = static_cast<int>(rights) & 6;
    return _access(path.c_str(), mode) == 0;
#else
    return access(path.c_str(), static_cast<int>(rights)) == 0;
#endif
}

// ============================================================================
// Path Queries
// ============================================================================

std::string CurrentPath() {
#ifdef _WIN32
    char buf[MAX_PATH];
    if (_getcwd(buf, MAX_PATH) == nullptr) return std::string();
    return std::string(buf);
#else
    char buf[PATH_MAX];
    if (getcwd(buf, PATH_MAX) == nullptr) return std::string();
    return std::string(buf);
#endif
}

bool SetCurrentPath(const std::string& path) {
    if (HasEmbeddedNul(path)) return false;
#ifdef _WIN32
    return _chdir(path.c_str()) == 0;
#else
    return chdir(path.c_str()) == 0;
#endif
}

std::string TempDirectoryPath() {
#ifdef _WIN32
    char buf[MAX_PATH];
    DWORD len = GetTempPathA(MAX_PATH, buf);
    if (len == 0 || len > MAX_PATH) return std::string();
    return std::string(buf);
#else
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) return std::string(tmpdir);
    return "/tmp";
#endif
}

std::string HomeDirectory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (home) return std::string(home);

    const char* drive = std::getenv("HOMEDRIVE");
    const char* path = std::getenv("HOMEPATH");
    if (drive && path) return std::string(drive) + path;

    return std::string();
#else
    const char* home = std::getenv("HOME");
    if (home && *home) return std::string(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return std::string(pw->pw_dir);

    return std::string();
#endif
}

std::string CanonicalPath(const std::string& path) {
    if (path.empty() || HasEmbeddedNul(path)) {
        return std::string();
    }
#ifdef _WIN32
    if (GetFileAttributesA(path.c_str()) == INVALID_FILE_ATTRIBUTES) {
        return std::string();
    }
    char buf[MAX_PATH];
    DWORD len = GetFullPathNameA(path.c_str(), MAX_PATH, buf, nullptr);
    if (len == 0 || len > MAX_PATH) return std::string();
    return std::string(buf);
#else
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) == nullptr) return std::string();
    return std::string(buf);
#endif
}

std::string ExpandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    // "~user" forms are left alone
    if (path.length() > 1 && path[1] != '/' && path[1] != '\\') {
        return path;
    }

    std::string home = HomeDirectory();
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

// ============================================================================
// Directory and File Operations
// ============================================================================

bool CreateDirectory(const std::string& path) {
    if (path.empty() || HasEmbeddedNul(path)) return false;
#ifdef _WIN32
    return CreateDirectoryA(path.c_str(), nullptr) != 0;
#else
    return mkdir(path.c_str(), 0755) == 0;
#endif
}

bool CreateDirectories(const std::string& path) {
    if (path.empty()) return false;
    if (Exists(path)) return IsDirectory(path);

    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos && pos > 0) {
        std::string parent = path.substr(0, pos);
        if (!Exists(parent) && !CreateDirectories(parent)) {
            return false;
        }
    }

    return CreateDirectory(path);
}

std::vector<std::string> ListDirectory(const std::string& path) {
    std::vector<std::string> names;
    if (HasEmbeddedNul(path)) return names;

#ifdef _WIN32
    WIN32_FIND_DATAA findData;
    std::string pattern = path + "\\*";
    HANDLE hFind = FindFirstFileA(pattern.c_str(), &findData);
    if (hFind == INVALID_HANDLE_VALUE) return names;

    do {
        std::string name = findData.cFileName;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    } while (FindNextFileA(hFind, &findData));

    FindClose(hFind);
#else
    DIR* dir = opendir(path.c_str());
    if (!dir) return names;

    while (struct dirent* ent = readdir(dir)) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    }

    closedir(dir);
#endif
    return names;
}

bool RemoveAll(const std::string& path) {
    if (path.empty() || HasEmbeddedNul(path)) return false;

    FileStatus link = SymlinkStatus(path);
    if (!link.Exists()) {
        return true;
    }

    // Never descend through a symlink
    if (link.IsDirectory()) {
        // Restore write permission so children can be unlinked
        SetPermissions(path, 0755);
        for (const auto& name : ListDirectory(path)) {
            if (!RemoveAll(path + PATH_SEPARATOR + name)) {
                return false;
            }
        }
#ifdef _WIN32
        return RemoveDirectoryA(path.c_str()) != 0;
#else
        return rmdir(path.c_str()) == 0;
#endif
    }

    return std::remove(path.c_str()) == 0;
}

bool WriteFile(const std::string& path, const std::string& content) {
    if (HasEmbeddedNul(path)) return false;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) return false;
    file << content;
    return file.good();
}

bool CreateSymlink(const std::string& target, const std::string& link) {
    if (HasEmbeddedNul(target) || HasEmbeddedNul(link)) return false;
#ifdef _WIN32
    DWORD flags = IsDirectory(target) ? SYMBOLIC_LINK_FLAG_DIRECTORY : 0;
    return CreateSymbolicLinkA(link.c_str(), target.c_str(), flags) != 0;
#else
    return symlink(target.c_str(), link.c_str()) == 0;
#endif
}

bool SetPermissions(const std::string& path, uint16_t mode) {
    if (path.empty() || HasEmbeddedNul(path)) return false;
#ifdef _WIN32
    (void)mode;
    return false;
#else
    return chmod(path.c_str(), static_cast<mode_t>(mode)) == 0;
#endif
}

// ============================================================================
// Temporary Directories
// ============================================================================

std::string CreateTempDirectory(const std::string& prefix, const std::string& parent) {
    std::string base = parent.empty() ? TempDirectoryPath() : parent;
    if (base.empty()) {
        return std::string();
    }
    if (base.back() != '/' && base.back() != '\\') {
        base += PATH_SEPARATOR;
    }

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 35);
    const char* alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

    for (int attempt = 0; attempt < 100; ++attempt) {
        std::string name = prefix;
        for (int i = 0; i < 10; ++i) {
            name += alphabet[dis(gen)];
        }
        std::string path = base + name;
        if (CreateDirectory(path)) {
            return path;
        }
    }

    return std::string();
}

TempDirectory::TempDirectory() : path_(CreateTempDirectory()) {}

TempDirectory::TempDirectory(const std::string& prefix, const std::string& parent)
    : path_(CreateTempDirectory(prefix, parent)) {}

TempDirectory::~TempDirectory() {
    if (!path_.empty()) {
        RemoveAll(path_);
    }
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.empty()) {
            RemoveAll(path_);
        }
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::string TempDirectory::Release() {
    std::string p = std::move(path_);
    path_.clear();
    return p;
}

} // namespace fs
} // namespace util
} // namespace badpath
