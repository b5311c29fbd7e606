#include "archive/PlacementPolicy.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <format>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace photodb::archive {

PlacementPolicy::PlacementPolicy(fs::path archive_root, fs::path duplicates_dir)
    : archive_root_(std::move(archive_root)),
      duplicates_dir_(std::move(duplicates_dir)) {}

std::string PlacementPolicy::sanitize(const std::string& component) {
    std::string out = component;
    for (char& c : out) {
        if (c == '/' || c == '\0') c = '-';
    }
    return out;
}

fs::path PlacementPolicy::with_suffix(const fs::path& path, int n) {
    fs::path out = path.parent_path();
    out /= std::format("{}_{:03}{}", path.stem().string(), n, path.extension().string());
    return out;
}

fs::path PlacementPolicy::destination_for(const model::MediaRecord& record, const std::string& filename) const {
    std::string folder = record.date;
    if (record.location && !record.location->empty()) {
        folder += " - " + sanitize(*record.location);
    }
    return archive_root_ / record.year / folder / filename;
}

std::optional<fs::path> PlacementPolicy::reserve(const fs::path& desired) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto taken = [this](const fs::path& p) {
        std::error_code ec;
        return reserved_.contains(p) || fs::exists(fs::symlink_status(p, ec));
    };

    fs::path candidate = desired;
    for (int n = 1; taken(candidate); ++n) {
        if (n > MAX_SUFFIX) {
            util::Logger::error("PlacementPolicy: no free name for " + desired.string() + " (op=reserve)");
            return std::nullopt;
        }
        candidate = with_suffix(desired, n);
    }

    reserved_.insert(candidate);
    return candidate;
}

void PlacementPolicy::release(const fs::path& reserved) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(reserved);
}

bool PlacementPolicy::transfer(const fs::path& source, const fs::path& target, bool keep_source) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        util::Logger::error("PlacementPolicy: cannot create " + target.parent_path().string() +
                            ": " + ec.message() + " (op=mkdir)");
        return false;
    }

    if (!keep_source) {
        fs::rename(source, target, ec);
        if (!ec) return true;
        if (ec != std::errc::cross_device_link) {
            util::Logger::error("PlacementPolicy: rename " + source.string() + " -> " + target.string() +
                                " failed: " + ec.message() + " (op=move)");
            return false;
        }
        ec.clear();
    }

    // Never clobber: fails if something appeared at target meanwhile
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec) {
        util::Logger::error("PlacementPolicy: copy " + source.string() + " -> " + target.string() +
                            " failed: " + ec.message() + " (op=copy)");
        return false;
    }

    if (!keep_source) {
        fs::remove(source, ec);
        if (ec) {
            util::Logger::warn("PlacementPolicy: copied but could not remove " + source.string() +
                               ": " + ec.message());
        }
    }
    return true;
}

std::optional<fs::path> PlacementPolicy::copy_to(const fs::path& source, const fs::path& reserved) {
    bool ok = transfer(source, reserved, true);
    release(reserved);
    if (!ok) return std::nullopt;

    util::Logger::info("Copying " + source.string() + " to " + reserved.string());
    return reserved;
}

std::optional<fs::path> PlacementPolicy::move_to(const fs::path& source, const fs::path& desired) {
    auto target = reserve(desired);
    if (!target) return std::nullopt;

    bool ok = transfer(source, *target, false);
    release(*target);
    if (!ok) return std::nullopt;

    util::Logger::info("Moving " + source.string() + " to " + target->string());
    return target;
}

std::optional<fs::path> PlacementPolicy::relocate_duplicate(const fs::path& source, const fs::path& scan_root) {
    fs::path rel = source.lexically_normal().lexically_relative(scan_root.lexically_normal());
    if (rel.empty() || *rel.begin() == "..") {
        rel = source.filename();
    }
    return move_to(source, duplicates_dir_ / rel);
}

}  // namespace photodb::archive
