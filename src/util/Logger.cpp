#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <mutex>
#include <format>
#include <system_error>

namespace photodb::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open between writes
static Logger::Options log_options;
static size_t log_bytes = 0;

namespace {

std::string_view level_label(Logger::Level level) {
    switch (level) {
        case Logger::Level::Debug: return "[DEBUG] ";
        case Logger::Level::Info:  return "[INFO]  ";
        case Logger::Level::Warn:  return "[WARN]  ";
        case Logger::Level::Error: return "[ERROR] ";
    }
    return "[?]     ";
}

// Caller holds log_mutex.
void rotate_locked() {
    namespace fs = std::filesystem;
    log_file.close();

    std::error_code ec;
    const std::string base = log_options.file.string();
    for (int i = log_options.backup_count - 1; i >= 1; --i) {
        fs::path from = base + "." + std::to_string(i);
        fs::path to = base + "." + std::to_string(i + 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, to, ec);
        }
    }
    if (log_options.backup_count > 0) {
        fs::rename(log_options.file, base + ".1", ec);
    } else {
        fs::remove(log_options.file, ec);
    }

    log_file.open(log_options.file, std::ios::trunc);
    log_bytes = 0;
}

}  // namespace

void Logger::init(const Options& options) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_options = options;
    log_bytes = 0;

    if (log_options.file.empty()) return;

    std::error_code ec;
    if (log_options.file.has_parent_path()) {
        std::filesystem::create_directories(log_options.file.parent_path(), ec);
    }
    log_file.open(log_options.file, std::ios::app);
    if (log_file) {
        auto size = std::filesystem::file_size(log_options.file, ec);
        log_bytes = ec ? 0 : static_cast<size_t>(size);
    } else {
        std::cerr << "Logger: cannot open " << log_options.file << ", logging to console only\n";
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.flush();
        log_file.close();
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream stamp;
    stamp << std::put_time(&tm, "[%H:%M:%S] ");
    std::string line = stamp.str() + std::format("{}{}\n", level_label(level), message);

    if (level >= log_options.console_level) {
        std::cerr << line;
    }

    if (!log_file.is_open()) return;

    if (log_options.max_file_bytes > 0 && log_bytes + line.size() > log_options.max_file_bytes) {
        rotate_locked();
        if (!log_file.is_open()) return;
    }
    log_file << line;
    log_file.flush();
    log_bytes += line.size();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace photodb::util
