#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>

namespace photodb::util {

std::filesystem::path Platform::get_config_directory() {
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "photodb";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "photodb";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/photodb");
    return ".config/photodb";
}

std::filesystem::path Platform::get_data_directory() {
    if (auto xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "photodb";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / "photodb";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .local/share/photodb");
    return ".local/share/photodb";
}

std::filesystem::path Platform::get_cache_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "photodb";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .cache/photodb");
    return ".cache/photodb";
}

std::filesystem::path Platform::expand_home(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        if (auto home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

bool Platform::is_heic_file(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".heic" || ext == ".heif";
}

}  // namespace photodb::util
