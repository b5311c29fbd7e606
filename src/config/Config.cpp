#include "config/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/RateLimiter.hpp"
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <string>

namespace photodb::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.length() - 2);
    }
    return value;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

// Reads a quoted token starting at line[0]; handles \" and \\ escapes
bool read_quoted(const std::string& line, std::string& token, size_t& end) {
    token.clear();
    for (size_t i = 1; i < line.size(); i++) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            token += line[++i];
        } else if (c == '"') {
            end = i + 1;
            return true;
        } else {
            token += c;
        }
    }
    return false;
}

class LineError {
public:
    LineError(const std::string& origin, int line) : origin_(origin), line_(line) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw ConfigError(std::format("{}:{}: {}", origin_, line_, what));
    }

private:
    const std::string& origin_;
    int line_;
};

bool parse_bool(const std::string& value, const LineError& err) {
    if (value == "true") return true;
    if (value == "false") return false;
    err.fail("expected true or false, got '" + value + "'");
}

int parse_int(const std::string& value, int min, const LineError& err) {
    int out = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || out < min) {
        err.fail("expected an integer >= " + std::to_string(min) + ", got '" + value + "'");
    }
    return out;
}

std::set<std::string> parse_list(const std::string& value) {
    std::set<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) out.insert(item);
    }
    return out;
}

}  // namespace

Config ConfigLoader::load_config(const std::filesystem::path& explicit_path) {
    std::filesystem::path config_file = explicit_path;
    bool required = !config_file.empty();

    if (config_file.empty()) {
        if (const char* env = std::getenv("PHOTODB_CONFIG"); env && *env) {
            config_file = util::Platform::expand_home(env);
            required = true;
        } else {
            config_file = get_config_file();
        }
    }

    std::error_code ec;
    if (!std::filesystem::exists(config_file, ec)) {
        if (required) {
            throw ConfigError("config file not found: " + config_file.string());
        }
        util::Logger::info("Config: " + config_file.string() + " not found, using defaults");
        return create_default_config();
    }

    util::Logger::info("Config: Loading " + config_file.string());
    return load_from_file(config_file);
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot read config file: " + path.string());
    }
    return parse(file, path.string());
}

Config ConfigLoader::parse(std::istream& in, const std::string& origin) {
    Config cfg = create_default_config();

    std::string raw, current_section;
    int line_no = 0;
    while (std::getline(in, raw)) {
        ++line_no;
        LineError err(origin, line_no);

        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value; keys may be quoted so they can carry commas and spaces
        std::string key, value;
        if (line[0] == '"') {
            size_t end = 0;
            if (!read_quoted(line, key, end)) err.fail("unterminated quoted key");
            std::string rest = trim(line.substr(end));
            if (rest.empty() || rest[0] != '=') err.fail("expected '=' after key");
            value = trim(rest.substr(1));
        } else {
            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) err.fail("expected key = value");
            key = trim(line.substr(0, eq_pos));
            value = trim(line.substr(eq_pos + 1));
        }

        if (!value.empty() && value.front() == '"') {
            std::string unquoted;
            size_t end = 0;
            if (!read_quoted(value, unquoted, end)) err.fail("unterminated string");
            value = unquoted;
        }

        if (current_section == "paths") {
            auto p = util::Platform::expand_home(value);
            if (key == "archive_root") cfg.archive_root = p;
            else if (key == "incoming_dir") cfg.incoming_dir = p;
            else if (key == "duplicates_dir") cfg.duplicates_dir = p;
            else if (key == "fingerprint_db") cfg.fingerprint_db = p;
            else if (key == "geocode_db") cfg.geocode_db = p;
            else if (key == "log_file") cfg.log_file = p;
            else util::Logger::warn("Config: unknown key paths." + key);
        }
        else if (current_section == "scan") {
            if (key == "workers") cfg.workers = static_cast<size_t>(parse_int(value, 1, err));
            else if (key == "skip_files") cfg.skip_files = parse_list(value);
            else if (key == "move_duplicates") cfg.move_duplicates = parse_bool(value, err);
            else if (key == "fingerprint") {
                auto algo = util::FileHasher::parse_algorithm(value);
                if (!algo) err.fail("unknown fingerprint algorithm '" + value + "'");
                cfg.fingerprint = *algo;
            }
            else util::Logger::warn("Config: unknown key scan." + key);
        }
        else if (current_section == "geocode") {
            if (key == "enabled") cfg.geocode_enabled = parse_bool(value, err);
            else if (key == "endpoint") cfg.geocode_endpoint = value;
            else if (key == "user_agent") cfg.geocode_user_agent = value;
            else if (key == "min_interval_ms") {
                // The geocode window may be widened, never narrowed
                const int floor_ms = static_cast<int>(util::RateLimiter::GEOCODE_INTERVAL.count());
                int ms = parse_int(value, 0, err);
                if (ms < floor_ms) {
                    util::Logger::warn(std::format("Config: {}:{}: geocode.min_interval_ms {} raised to {}",
                                                   origin, line_no, ms, floor_ms));
                    ms = floor_ms;
                }
                cfg.geocode_min_interval_ms = ms;
            }
            else if (key == "timeout_s") cfg.geocode_timeout_s = parse_int(value, 1, err);
            else util::Logger::warn("Config: unknown key geocode." + key);
        }
        else if (current_section == "locations") {
            cfg.locations[key] = value;
        }
        else {
            util::Logger::warn("Config: ignoring key '" + key + "' in section [" + current_section + "]");
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: cannot write " + path.string());
        return false;
    }

    file << "# photodb config\n\n";

    file << "[paths]\n";
    file << "# Root of the organised archive (<year>/<date>[ - <location>]/<file>)\n";
    file << "archive_root = " << quote(cfg.archive_root.string()) << "\n";
    file << "# Staging area used by --import\n";
    file << "incoming_dir = " << quote(cfg.incoming_dir.string()) << "\n";
    file << "# Where duplicates are moved; empty means <archive_root>/duplicates\n";
    file << "duplicates_dir = " << quote(cfg.duplicates_dir.string()) << "\n";
    file << "fingerprint_db = " << quote(cfg.fingerprint_db.string()) << "\n";
    file << "geocode_db = " << quote(cfg.geocode_db.string()) << "\n";
    file << "log_file = " << quote(cfg.log_file.string()) << "\n\n";

    file << "[scan]\n";
    file << "workers = " << cfg.workers << "\n";
    file << "# Comma separated file names that are never processed\n";
    std::string skip;
    for (const auto& name : cfg.skip_files) {
        if (!skip.empty()) skip += ",";
        skip += name;
    }
    file << "skip_files = " << quote(skip) << "\n";
    file << "# \"fnv1a64\" or \"sha256\"; keep the one the archive was built with\n";
    file << "fingerprint = " << quote(util::FileHasher::algorithm_name(cfg.fingerprint)) << "\n";
    file << "move_duplicates = " << (cfg.move_duplicates ? "true" : "false") << "\n\n";

    file << "[geocode]\n";
    file << "enabled = " << (cfg.geocode_enabled ? "true" : "false") << "\n";
    file << "endpoint = " << quote(cfg.geocode_endpoint) << "\n";
    file << "user_agent = " << quote(cfg.geocode_user_agent) << "\n";
    file << "# Milliseconds between geocode requests; values below 5000 are raised to 5000\n";
    file << "min_interval_ms = " << cfg.geocode_min_interval_ms << "\n";
    file << "timeout_s = " << cfg.geocode_timeout_s << "\n\n";

    file << "[locations]\n";
    file << "# \"<house_number> <road>, <city>, <state>\" = \"Display name\"\n";
    for (const auto& [key, name] : cfg.locations) {
        file << quote(key) << " = " << quote(name) << "\n";
    }

    file.close();
    if (!file) {
        util::Logger::error("Config: write failed for " + path.string());
        return false;
    }
    return true;
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    auto data_dir = util::Platform::get_data_directory();
    cfg.archive_root = util::Platform::expand_home("~/Pictures");
    cfg.incoming_dir = util::Platform::expand_home("~/Pictures/incoming");
    cfg.fingerprint_db = data_dir / "fingerprints.db";
    cfg.geocode_db = data_dir / "geocode.db";
    cfg.log_file = util::Platform::get_cache_directory() / "photodb.log";
    cfg.skip_files = {".DS_Store", "Thumbs.db", "desktop.ini"};
    return cfg;
}

}  // namespace photodb::config
