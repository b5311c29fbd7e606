#pragma once

#include <filesystem>
#include <string>

namespace photodb::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_data_directory();
    static std::filesystem::path get_cache_directory();

    // Expands a leading "~/" using $HOME
    static std::filesystem::path expand_home(const std::string& path);

    // True for .heic / .heif, case-insensitive
    static bool is_heic_file(const std::filesystem::path& path);
};

}  // namespace photodb::util
