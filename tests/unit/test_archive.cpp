#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "archive/PlacementPolicy.hpp"
#include "archive/DedupEngine.hpp"
#include "store/FingerprintStore.hpp"
#include "util/FileHasher.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace photodb;
using archive::DedupOutcome;
using archive::PlacementPolicy;
using photodb::test::TempDir;
using photodb::test::read_file;
using photodb::test::write_file;

namespace fs = std::filesystem;

namespace {

model::MediaRecord media(const std::string& date, std::optional<std::string> location = std::nullopt) {
    model::MediaRecord m;
    m.date = date;
    m.year = date.substr(0, 4);
    m.location = std::move(location);
    return m;
}

util::Fingerprint fingerprint_of(const fs::path& path) {
    auto fp = util::FileHasher::fingerprint_file(path);
    if (!fp) throw std::runtime_error("cannot fingerprint " + path.string());
    return *fp;
}

model::FingerprintRecord candidate(const store::FingerprintStore& fps, const fs::path& path) {
    model::FingerprintRecord r;
    r.canonical_path = fps.to_stored_path(path);
    r.date = "2020-01-02";
    return r;
}

}  // namespace

TEST_CASE(test_destination_layout) {
    PlacementPolicy policy("/archive", "/archive/duplicates");

    ASSERT_EQ(policy.destination_for(media("2020-01-02"), "a.jpg"),
              fs::path("/archive/2020/2020-01-02/a.jpg"));
    ASSERT_EQ(policy.destination_for(media("2020-01-02", "Main St, Springfield, IL"), "a.jpg"),
              fs::path("/archive/2020/2020-01-02 - Main St, Springfield, IL/a.jpg"));
    ASSERT_EQ(policy.destination_for(media("2020-01-02", "AC/DC Lane, Town, ST"), "a.jpg"),
              fs::path("/archive/2020/2020-01-02 - AC-DC Lane, Town, ST/a.jpg"));
}

TEST_CASE(test_suffix_format) {
    ASSERT_EQ(PlacementPolicy::with_suffix("/x/name.ext", 1), fs::path("/x/name_001.ext"));
    ASSERT_EQ(PlacementPolicy::with_suffix("/x/name.tar.gz", 12), fs::path("/x/name.tar_012.gz"));
    ASSERT_EQ(PlacementPolicy::with_suffix("/x/README", 3), fs::path("/x/README_003"));
}

TEST_CASE(test_collision_safe_naming) {
    TempDir dir;
    PlacementPolicy policy(dir.path(), dir / "duplicates");

    write_file(dir / "src1.jpg", "one");
    write_file(dir / "src2.jpg", "two");
    write_file(dir / "src3.jpg", "three");
    fs::path desired = dir / "2020" / "2020-01-02" / "name.jpg";

    auto first = policy.move_to(dir / "src1.jpg", desired);
    auto second = policy.move_to(dir / "src2.jpg", desired);
    auto third = policy.move_to(dir / "src3.jpg", desired);

    ASSERT_EQ(*first, desired);
    ASSERT_EQ(*second, dir / "2020" / "2020-01-02" / "name_001.jpg");
    ASSERT_EQ(*third, dir / "2020" / "2020-01-02" / "name_002.jpg");
    ASSERT_EQ(read_file(*second), std::string("two"));
    ASSERT_FALSE(fs::exists(dir / "src2.jpg"));
}

TEST_CASE(test_reservations_are_exclusive) {
    TempDir dir;
    PlacementPolicy policy(dir.path(), dir / "duplicates");
    fs::path desired = dir / "slot.jpg";

    auto a = policy.reserve(desired);
    auto b = policy.reserve(desired);
    ASSERT_EQ(*a, desired);
    ASSERT_EQ(*b, dir / "slot_001.jpg");

    policy.release(*a);
    ASSERT_EQ(*policy.reserve(desired), desired);
}

TEST_CASE(test_concurrent_reservations_never_share) {
    TempDir dir;
    PlacementPolicy policy(dir.path(), dir / "duplicates");
    fs::path desired = dir / "same.jpg";

    std::vector<fs::path> got(16);
    {
        std::vector<std::jthread> threads;
        for (size_t i = 0; i < got.size(); ++i) {
            threads.emplace_back([&, i]() { got[i] = *policy.reserve(desired); });
        }
    }
    std::set<fs::path> unique(got.begin(), got.end());
    ASSERT_EQ(unique.size(), got.size());
}

TEST_CASE(test_copy_preserves_source) {
    TempDir dir;
    PlacementPolicy policy(dir / "archive", dir / "archive" / "duplicates");
    write_file(dir / "incoming" / "a.jpg", "payload");

    auto slot = policy.reserve(dir / "archive" / "2020" / "2020-01-02" / "a.jpg");
    auto placed = policy.copy_to(dir / "incoming" / "a.jpg", *slot);
    ASSERT_TRUE(placed.has_value());
    ASSERT_EQ(read_file(*placed), std::string("payload"));
    ASSERT_TRUE(fs::exists(dir / "incoming" / "a.jpg"));
}

TEST_CASE(test_copy_refuses_to_clobber) {
    TempDir dir;
    PlacementPolicy policy(dir.path(), dir / "duplicates");
    write_file(dir / "src.jpg", "new");
    write_file(dir / "taken.jpg", "old");

    test::LogCapture log(dir / "log" / "photodb.log");

    // Pretend someone else created the file after we reserved it
    ASSERT_FALSE(policy.copy_to(dir / "src.jpg", dir / "taken.jpg").has_value());
    ASSERT_EQ(read_file(dir / "taken.jpg"), std::string("old"));

    const std::string text = log.text();
    ASSERT_TRUE(text.find((dir / "src.jpg").string()) != std::string::npos);
    ASSERT_TRUE(text.find("(op=copy)") != std::string::npos);
}

TEST_CASE(test_relocate_duplicate_keeps_relative_path) {
    TempDir dir;
    PlacementPolicy policy(dir / "root", dir / "dups");
    write_file(dir / "root" / "2019" / "trip" / "x.jpg", "dup");

    auto moved = policy.relocate_duplicate(dir / "root" / "2019" / "trip" / "x.jpg", dir / "root");
    ASSERT_EQ(*moved, dir / "dups" / "2019" / "trip" / "x.jpg");
    ASSERT_FALSE(fs::exists(dir / "root" / "2019" / "trip" / "x.jpg"));

    write_file(dir / "root" / "2019" / "trip" / "x.jpg", "dup again");
    moved = policy.relocate_duplicate(dir / "root" / "2019" / "trip" / "x.jpg", dir / "root");
    ASSERT_EQ(*moved, dir / "dups" / "2019" / "trip" / "x_001.jpg");
}

TEST_CASE(test_move_missing_source_fails) {
    TempDir dir;
    PlacementPolicy policy(dir.path(), dir / "duplicates");
    ASSERT_FALSE(policy.move_to(dir / "ghost.jpg", dir / "out" / "ghost.jpg").has_value());

    // The failed slot is free again
    ASSERT_EQ(*policy.reserve(dir / "out" / "ghost.jpg"), dir / "out" / "ghost.jpg");
}

TEST_CASE(test_dedup_new_then_already_archived) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir / "archive");
    archive::DedupEngine engine(fps);
    write_file(dir / "archive" / "a.jpg", "same bytes");

    auto fp = fingerprint_of(dir / "archive" / "a.jpg");
    auto first = engine.classify(fp, candidate(fps, dir / "archive" / "a.jpg"));
    ASSERT_TRUE(first.outcome == DedupOutcome::New);
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("a.jpg"));

    auto second = engine.classify(fp, candidate(fps, dir / "archive" / "a.jpg"));
    ASSERT_TRUE(second.outcome == DedupOutcome::AlreadyArchived);
}

TEST_CASE(test_dedup_identical_files_leave_one_record) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir / "archive");
    archive::DedupEngine engine(fps);
    write_file(dir / "archive" / "p1.jpg", "same bytes");
    write_file(dir / "archive" / "sub" / "p2.jpg", "same bytes");

    auto fp = fingerprint_of(dir / "archive" / "p1.jpg");
    ASSERT_TRUE(fp == fingerprint_of(dir / "archive" / "sub" / "p2.jpg"));

    ASSERT_TRUE(engine.classify(fp, candidate(fps, dir / "archive" / "p1.jpg")).outcome == DedupOutcome::New);
    auto dup = engine.classify(fp, candidate(fps, dir / "archive" / "sub" / "p2.jpg"));
    ASSERT_TRUE(dup.outcome == DedupOutcome::Duplicate);
    ASSERT_EQ(dup.existing->canonical_path, std::string("p1.jpg"));
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("p1.jpg"));
}

TEST_CASE(test_dedup_stale_record_is_replaced) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir / "archive");
    archive::DedupEngine engine(fps);
    write_file(dir / "archive" / "old.jpg", "bytes");
    auto fp = fingerprint_of(dir / "archive" / "old.jpg");

    ASSERT_TRUE(engine.classify(fp, candidate(fps, dir / "archive" / "old.jpg")).outcome == DedupOutcome::New);

    fs::create_directories(dir / "archive" / "moved");
    fs::rename(dir / "archive" / "old.jpg", dir / "archive" / "moved" / "new.jpg");

    auto healed = engine.classify(fp, candidate(fps, dir / "archive" / "moved" / "new.jpg"));
    ASSERT_TRUE(healed.outcome == DedupOutcome::StaleReplaced);
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("moved/new.jpg"));

    // A directory where the record points is not a live file either
    fs::remove(dir / "archive" / "moved" / "new.jpg");
    fs::create_directories(dir / "archive" / "moved" / "new.jpg");
    write_file(dir / "archive" / "third.jpg", "bytes");
    auto again = engine.classify(fp, candidate(fps, dir / "archive" / "third.jpg"));
    ASSERT_TRUE(again.outcome == DedupOutcome::StaleReplaced);
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("third.jpg"));
}

TEST_CASE(test_dedup_concurrent_first_sightings) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir / "archive");
    archive::DedupEngine engine(fps);

    const int n = 8;
    for (int i = 0; i < n; ++i) {
        write_file(dir / "archive" / ("copy" + std::to_string(i) + ".jpg"), "identical");
    }
    auto fp = fingerprint_of(dir / "archive" / "copy0.jpg");

    std::atomic<int> news{0};
    std::atomic<int> dups{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&, i]() {
                auto path = dir / "archive" / ("copy" + std::to_string(i) + ".jpg");
                auto result = engine.classify(fp, candidate(fps, path));
                if (result.outcome == DedupOutcome::New) ++news;
                if (result.outcome == DedupOutcome::Duplicate) ++dups;
            });
        }
    }

    ASSERT_EQ(news.load(), 1);
    ASSERT_EQ(dups.load(), n - 1);
}

int main() {
    return photodb::test::TestRunner::instance().run_all("archive");
}
