#pragma once

#include "util/FileHasher.hpp"
#include <filesystem>
#include <iosfwd>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace photodb::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // [paths]
    std::filesystem::path archive_root;
    std::filesystem::path incoming_dir;
    std::filesystem::path duplicates_dir;   // Empty: <archive_root>/duplicates
    std::filesystem::path fingerprint_db;
    std::filesystem::path geocode_db;
    std::filesystem::path log_file;

    // [scan]
    size_t workers = 4;
    std::set<std::string> skip_files;
    util::HashAlgorithm fingerprint = util::HashAlgorithm::Fnv1a64;
    bool move_duplicates = false;

    // [geocode]
    bool geocode_enabled = true;
    std::string geocode_endpoint = "https://nominatim.openstreetmap.org";
    std::string geocode_user_agent = "photodb";
    int geocode_min_interval_ms = 5000;
    int geocode_timeout_s = 10;

    // [locations]: "<house_number> <road>, <city>, <state>" -> display name
    std::map<std::string, std::string> locations;

    [[nodiscard]] std::filesystem::path effective_duplicates_dir() const {
        return duplicates_dir.empty() ? archive_root / "duplicates" : duplicates_dir;
    }
};

class ConfigLoader {
public:
    // Resolution order: explicit path, $PHOTODB_CONFIG, ~/.config/photodb/config.toml.
    // A missing default file yields defaults; a missing explicit file throws ConfigError.
    static Config load_config(const std::filesystem::path& explicit_path = {});

    // Throws ConfigError on unreadable files and malformed values (with line number)
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(std::istream& in, const std::string& origin = "<input>");

    // Writes a commented config file; returns false if it cannot be written
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace photodb::config
