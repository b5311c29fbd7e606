#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <memory>

namespace photodb::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

// File type constants from dirent.h
constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_DIR = 4;
constexpr uint8_t TYPE_REG = 8;

namespace {

int64_t to_ns(const struct timespec& ts) {
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

// Closes the descriptor on every exit path
struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) close(fd); }
};

}  // namespace

std::string DirectoryScanner::normalize(const std::filesystem::path& path) {
    std::string str = path.string();
    while (str.length() > 1 && str.back() == '/') {
        str.pop_back();
    }
    return str;
}

std::optional<int64_t> DirectoryScanner::mtime_ns(const std::filesystem::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return to_ns(st.st_mtim);
}

std::optional<DirectoryScanner::Listing> DirectoryScanner::list_directory(
    const std::filesystem::path& dir_path
) {
    const std::string dir = normalize(dir_path);

    FdGuard guard{open(dir.c_str(), O_RDONLY | O_DIRECTORY)};
    if (guard.fd < 0) {
        Logger::error("DirectoryScanner: open failed for " + dir + ": " + std::strerror(errno));
        return std::nullopt;
    }

    Listing listing;

    struct stat dir_stat;
    if (fstat(guard.fd, &dir_stat) != 0) {
        Logger::error("DirectoryScanner: fstat failed for " + dir + ": " + std::strerror(errno));
        return std::nullopt;
    }
    listing.mtime_ns = to_ns(dir_stat.st_mtim);

    // Heap buffer: listings run on the synchronizer thread and recurse
    auto buffer = std::make_unique<char[]>(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, guard.fd, buffer.get(), BUFFER_SIZE);

        if (nread == -1) {
            Logger::error("DirectoryScanner: getdents64 failed for " + dir + ": " + std::strerror(errno));
            return std::nullopt;
        }

        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.get() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = dir + "/" + d->d_name;
            uint8_t type = d->d_type;

            if (type == TYPE_UNKNOWN) {
                // Filesystem doesn't fill d_type, fall back to stat without following links
                struct stat entry_stat;
                if (fstatat(guard.fd, d->d_name, &entry_stat, AT_SYMLINK_NOFOLLOW) != 0) {
                    continue;
                }
                if (S_ISREG(entry_stat.st_mode)) type = TYPE_REG;
                else if (S_ISDIR(entry_stat.st_mode)) type = TYPE_DIR;
            }

            if (type == TYPE_REG) {
                listing.files.push_back(std::move(full_path));
            } else if (type == TYPE_DIR) {
                listing.subdirectories.push_back(std::move(full_path));
            }
        }
    }

    std::sort(listing.files.begin(), listing.files.end());
    std::sort(listing.subdirectories.begin(), listing.subdirectories.end());

    Logger::debug("DirectoryScanner: " + dir + " has " + std::to_string(listing.files.size()) +
                  " files, " + std::to_string(listing.subdirectories.size()) + " subdirectories");
    return listing;
}

}  // namespace photodb::util
