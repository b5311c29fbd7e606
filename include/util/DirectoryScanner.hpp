#pragma once

#include <filesystem>
#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace photodb::util {

/**
 * DirectoryScanner: single-level directory listing using the getdents64 syscall.
 *
 * Uses a 256KB buffer to batch syscalls and the d_type field to avoid a stat()
 * per entry. Only regular files and directories are reported; symlinks, sockets,
 * fifos and devices are ignored.
 */
class DirectoryScanner {
public:
    struct Listing {
        std::vector<std::string> files;           // Regular files (absolute, sorted)
        std::vector<std::string> subdirectories;  // Directories (absolute, sorted)
        int64_t mtime_ns = 0;                     // Directory mtime at listing time
    };

    /**
     * Lists the immediate entries of a directory.
     *
     * @param dir_path Directory to list
     * @return Listing, or nullopt if the directory cannot be opened or read
     */
    [[nodiscard]] static std::optional<Listing> list_directory(const std::filesystem::path& dir_path);

    /**
     * Modification time of a path in nanoseconds since the epoch.
     */
    [[nodiscard]] static std::optional<int64_t> mtime_ns(const std::filesystem::path& path);

    /**
     * Strips trailing slashes so listings never produce "//" paths.
     */
    [[nodiscard]] static std::string normalize(const std::filesystem::path& path);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB buffer for getdents64
};

}  // namespace photodb::util
