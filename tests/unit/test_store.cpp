#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "store/Codec.hpp"
#include "store/KeyValueStore.hpp"
#include "store/FingerprintStore.hpp"
#include "util/FileHasher.hpp"

using namespace photodb;
using photodb::test::TempDir;
using photodb::test::write_file;

namespace {

util::Fingerprint make_fp(uint8_t seed) {
    util::Fingerprint fp;
    fp.algorithm = util::HashAlgorithm::Fnv1a64;
    fp.digest = {seed, 1, 2, 3, 4, 5, 6, 7};
    return fp;
}

model::FingerprintRecord make_record(const std::string& path) {
    return {path, "2020-01-02", "Main St, Springfield, IL"};
}

}  // namespace

TEST_CASE(test_kv_put_get_remove) {
    TempDir dir;
    store::KeyValueStore kv(dir / "kv.db");

    ASSERT_FALSE(kv.get("k").has_value());
    ASSERT_TRUE(kv.put("k", "v1", true));
    ASSERT_EQ(kv.get("k"), std::optional<std::string>("v1"));
    ASSERT_EQ(kv.size(), 1u);

    ASSERT_TRUE(kv.remove("k"));
    ASSERT_FALSE(kv.get("k").has_value());
    ASSERT_TRUE(kv.remove("k"));  // Absent key is not an error
}

TEST_CASE(test_kv_conditional_insert_keeps_first_value) {
    TempDir dir;
    store::KeyValueStore kv(dir / "kv.db");

    ASSERT_TRUE(kv.put("k", "v1", false));
    ASSERT_FALSE(kv.put("k", "v2", false));
    ASSERT_EQ(*kv.get("k"), std::string("v1"));

    ASSERT_TRUE(kv.put("k", "v3", true));
    ASSERT_EQ(*kv.get("k"), std::string("v3"));
}

TEST_CASE(test_kv_binary_keys_and_values) {
    TempDir dir;
    store::KeyValueStore kv(dir / "kv.db");

    std::string key("a\0b", 3);
    std::string value("\0\xff\0", 3);
    ASSERT_TRUE(kv.put(key, value, false));
    ASSERT_EQ(*kv.get(key), value);
    ASSERT_FALSE(kv.get(std::string("a")).has_value());
}

TEST_CASE(test_kv_persists_across_reopen) {
    TempDir dir;
    {
        store::KeyValueStore kv(dir / "kv.db");
        ASSERT_TRUE(kv.put("persist", "yes", false));
    }
    store::KeyValueStore kv(dir / "kv.db");
    ASSERT_EQ(*kv.get("persist"), std::string("yes"));
}

TEST_CASE(test_kv_closed_store_returns_sentinels) {
    TempDir dir;
    store::KeyValueStore kv(dir / "kv.db");
    kv.close();
    kv.close();

    ASSERT_FALSE(kv.is_open());
    ASSERT_FALSE(kv.get("k").has_value());
    ASSERT_FALSE(kv.put("k", "v", true));
}

TEST_CASE(test_kv_open_failure_throws) {
    TempDir dir;
    write_file(dir / "blocker", "not a directory");

    bool threw = false;
    try {
        store::KeyValueStore kv(dir / "blocker" / "kv.db");
    } catch (const store::StoreError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST_CASE(test_codec_keys_do_not_collide) {
    auto fp_key = store::Codec::fingerprint_key(make_fp(9));
    auto wm_key = store::Codec::watermark_key("/photos");
    auto geo_key = store::Codec::geocode_key("1.000000,2.000000");

    ASSERT_NE(fp_key[0], wm_key[0]);
    ASSERT_NE(wm_key[0], geo_key[0]);
    ASSERT_NE(fp_key[0], geo_key[0]);

    util::Fingerprint sha = make_fp(9);
    sha.algorithm = util::HashAlgorithm::Sha256;
    ASSERT_NE(store::Codec::fingerprint_key(sha), fp_key);
}

TEST_CASE(test_codec_rejects_truncated_and_foreign_values) {
    auto bytes = store::Codec::encode_record(make_record("2020/2020-01-02/a.jpg"));
    ASSERT_TRUE(store::Codec::decode_record(bytes).has_value());

    for (size_t len = 0; len < bytes.size(); ++len) {
        ASSERT_FALSE(store::Codec::decode_record(std::string_view(bytes).substr(0, len)).has_value());
    }

    std::string bad_magic = bytes;
    bad_magic[0] ^= 0x5a;
    ASSERT_FALSE(store::Codec::decode_record(bad_magic).has_value());

    // A watermark is not a record
    ASSERT_FALSE(store::Codec::decode_record(store::Codec::encode_watermark(42)).has_value());
}

TEST_CASE(test_codec_address_keeps_missing_fields_missing) {
    model::Address a;
    a.road = "Main St";
    a.state_code = "US-IL";

    auto decoded = store::Codec::decode_address(store::Codec::encode_address(a));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(*decoded == a);
    ASSERT_FALSE(decoded->city.has_value());
}

TEST_CASE(test_fingerprint_store_claim_and_lookup) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir.path());

    auto fp = make_fp(1);
    ASSERT_FALSE(fps.lookup(fp).has_value());
    ASSERT_TRUE(fps.claim(fp, make_record("a.jpg")));
    ASSERT_FALSE(fps.claim(fp, make_record("b.jpg")));
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("a.jpg"));

    ASSERT_TRUE(fps.replace(fp, make_record("c.jpg")));
    ASSERT_EQ(fps.lookup(fp)->canonical_path, std::string("c.jpg"));

    ASSERT_TRUE(fps.forget(fp));
    ASSERT_FALSE(fps.lookup(fp).has_value());
}

TEST_CASE(test_fingerprint_store_watermarks) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", dir.path());

    ASSERT_FALSE(fps.watermark("/photos/2020").has_value());
    ASSERT_TRUE(fps.commit_watermark("/photos/2020", 1234567890123LL));
    ASSERT_EQ(*fps.watermark("/photos/2020"), 1234567890123LL);
    ASSERT_TRUE(fps.commit_watermark("/photos/2020", 5));
    ASSERT_EQ(*fps.watermark("/photos/2020"), 5);
    ASSERT_TRUE(fps.clear_watermark("/photos/2020"));
    ASSERT_FALSE(fps.watermark("/photos/2020").has_value());
}

TEST_CASE(test_fingerprint_store_paths_relative_to_root) {
    TempDir dir;
    store::FingerprintStore fps(dir / "fp.db", "/archive/");

    ASSERT_EQ(fps.to_stored_path("/archive/2020/a.jpg"), std::string("2020/a.jpg"));
    ASSERT_EQ(fps.to_stored_path("/elsewhere/a.jpg"), std::string("/elsewhere/a.jpg"));
    ASSERT_EQ(fps.to_stored_path("/archive2/a.jpg"), std::string("/archive2/a.jpg"));

    ASSERT_EQ(fps.resolve_path(make_record("2020/a.jpg")), std::filesystem::path("/archive/2020/a.jpg"));
    ASSERT_EQ(fps.resolve_path(make_record("/elsewhere/a.jpg")), std::filesystem::path("/elsewhere/a.jpg"));
}

TEST_CASE(test_fingerprint_store_survives_reopen) {
    TempDir dir;
    auto fp = make_fp(7);
    {
        store::FingerprintStore fps(dir / "fp.db", dir.path());
        ASSERT_TRUE(fps.claim(fp, make_record("keep.jpg")));
    }
    store::FingerprintStore fps(dir / "fp.db", dir.path());
    ASSERT_TRUE(*fps.lookup(fp) == make_record("keep.jpg"));
}

int main() {
    return photodb::test::TestRunner::instance().run_all("store");
}
