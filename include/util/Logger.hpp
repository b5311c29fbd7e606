#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace photodb::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    struct Options {
        std::filesystem::path file;                 // Empty: console only
        Level console_level = Level::Info;          // Minimum level echoed to stderr
        size_t max_file_bytes = 5 * 1024 * 1024;    // Rotate when the file grows past this
        int backup_count = 3;                       // photodb.log.1 .. photodb.log.N
    };

    static void init(const Options& options);
    static void shutdown();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace photodb::util
