#include "archive/DirectorySynchronizer.hpp"
#include "archive/FileProcessor.hpp"
#include "archive/PlacementPolicy.hpp"
#include "archive/RunContext.hpp"
#include "config/Config.hpp"
#include "geo/GeocodeCache.hpp"
#include "geo/NominatimClient.hpp"
#include "metadata/ExifTagReader.hpp"
#include "metadata/FFmpegContainerReader.hpp"
#include "metadata/HeifJpegTranscoder.hpp"
#include "metadata/MetadataResolver.hpp"
#include "store/FingerprintStore.hpp"
#include "util/Logger.hpp"
#include "util/RateLimiter.hpp"
#include "util/WorkerPool.hpp"
#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using namespace photodb;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FATAL = 2;

struct CliOptions {
    fs::path config_path;
    std::optional<fs::path> scan_root;
    std::optional<size_t> workers;
    bool import_mode = false;
    bool move_duplicates = false;
    bool force = false;
    bool verbose = false;
    bool help = false;
    bool write_config = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: photodb [options] [DIR]\n"
           "\n"
           "Fingerprints media under DIR (default: the archive root, or the\n"
           "incoming directory with --import) and records where each file lives.\n"
           "\n"
           "Options:\n"
           "  --config PATH        Config file (default: $PHOTODB_CONFIG or ~/.config/photodb/config.toml)\n"
           "  --import             Copy new files from the incoming directory into the archive\n"
           "  --move-duplicates    Move duplicates into the duplicates directory\n"
           "  --force              Rescan directories even if unchanged\n"
           "  --workers N          Worker threads per directory batch\n"
           "  --verbose            Echo debug messages to the console\n"
           "  --write-config       Write the effective config to the config path and exit\n"
           "  --help               Show this help\n";
}

std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions cli;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next_value = [&](std::string_view flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "photodb: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--import") {
            cli.import_mode = true;
        } else if (arg == "--move-duplicates") {
            cli.move_duplicates = true;
        } else if (arg == "--force") {
            cli.force = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cli.verbose = true;
        } else if (arg == "--write-config") {
            cli.write_config = true;
        } else if (arg == "--config") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            cli.config_path = *value;
        } else if (arg == "--workers") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            size_t n = 0;
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), n);
            if (ec != std::errc() || ptr != value->data() + value->size() || n == 0) {
                std::cerr << "photodb: --workers expects a positive integer, got '" << *value << "'\n";
                return std::nullopt;
            }
            cli.workers = n;
        } else if (arg.starts_with("-")) {
            std::cerr << "photodb: unknown option " << arg << "\n";
            return std::nullopt;
        } else if (!cli.scan_root) {
            cli.scan_root = fs::path(arg);
        } else {
            std::cerr << "photodb: only one directory may be given\n";
            return std::nullopt;
        }
    }

    return cli;
}

}  // namespace

int main(int argc, char** argv) {
    auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (cli->help) {
        print_usage(std::cout);
        return 0;
    }

    // Console only until the config names a log file
    util::Logger::init({.file = {}, .console_level = cli->verbose ? util::Logger::Level::Debug
                                                                  : util::Logger::Level::Info});

    try {
        config::Config cfg = config::ConfigLoader::load_config(cli->config_path);

        if (cli->write_config) {
            fs::path target = cli->config_path.empty() ? config::ConfigLoader::get_config_file() : cli->config_path;
            return config::ConfigLoader::save_config(cfg, target) ? 0 : EXIT_FATAL;
        }

        if (cli->workers) cfg.workers = *cli->workers;
        if (cli->move_duplicates) cfg.move_duplicates = true;

        util::Logger::Options log_options;
        log_options.file = cfg.log_file;
        log_options.console_level = cli->verbose ? util::Logger::Level::Debug : util::Logger::Level::Info;
        util::Logger::init(log_options);
        util::Logger::info("photodb starting");

        fs::path root = cli->scan_root.value_or(cli->import_mode ? cfg.incoming_dir : cfg.archive_root);
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            util::Logger::error("Fatal: " + root.string() + " is not a directory");
            return EXIT_FATAL;
        }
        root = fs::absolute(root).lexically_normal();
        const fs::path archive_root = fs::absolute(cfg.archive_root).lexically_normal();
        const fs::path duplicates_dir = fs::absolute(cfg.effective_duplicates_dir()).lexically_normal();

        archive::RunOptions options;
        options.import_mode = cli->import_mode;
        options.move_duplicates = cfg.move_duplicates;
        options.force = cli->force;
        options.algorithm = cfg.fingerprint;
        options.skip_files = cfg.skip_files;
        options.excluded_dirs.push_back(duplicates_dir);
        if (!cli->import_mode && !cfg.incoming_dir.empty()) {
            options.excluded_dirs.push_back(fs::absolute(cfg.incoming_dir).lexically_normal());
        }

        util::RateLimiter limiter(std::chrono::milliseconds(cfg.geocode_min_interval_ms));

        std::unique_ptr<geo::NominatimClient> geocoder;
        std::unique_ptr<geo::GeocodeCache> geocache;
        if (cfg.geocode_enabled) {
            geo::NominatimClient::Options geo_options;
            geo_options.endpoint = cfg.geocode_endpoint;
            geo_options.user_agent = cfg.geocode_user_agent;
            geo_options.timeout = std::chrono::seconds(cfg.geocode_timeout_s);
            geocoder = std::make_unique<geo::NominatimClient>(geo_options);
            geocache = std::make_unique<geo::GeocodeCache>(cfg.geocode_db, geocoder.get(), limiter);
        } else {
            util::Logger::info("Geocoding disabled");
        }

        store::FingerprintStore store(cfg.fingerprint_db, archive_root);

        metadata::ExifTagReader tag_reader;
        metadata::FFmpegContainerReader container_reader;
        metadata::HeifJpegTranscoder transcoder;
        metadata::MetadataResolver resolver(&tag_reader, &container_reader, geocache.get(), cfg.locations);

        archive::PlacementPolicy placement(archive_root, duplicates_dir);
        archive::RunContext ctx{options, store, resolver, placement, &transcoder};
        archive::FileProcessor processor(ctx);

        archive::SyncStats stats;
        {
            util::WorkerPool pool(cfg.workers);
            archive::DirectorySynchronizer synchronizer(ctx, processor, pool);
            stats = synchronizer.run(root);
        }

        if (geocache) {
            util::Logger::info("Geocode lookups sent: " + std::to_string(geocache->remote_calls()));
        }
        util::Logger::info("photodb finished: " + stats.summary());
        util::Logger::shutdown();
        return 0;
    } catch (const config::ConfigError& e) {
        util::Logger::error(std::string("Fatal: config: ") + e.what());
        util::Logger::shutdown();
        return EXIT_FATAL;
    } catch (const store::StoreError& e) {
        util::Logger::error(std::string("Fatal: store: ") + e.what());
        util::Logger::shutdown();
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal error: ") + e.what());
        util::Logger::shutdown();
        return EXIT_FATAL;
    }
}
