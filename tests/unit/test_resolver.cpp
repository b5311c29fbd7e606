#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "metadata/MetadataResolver.hpp"
#include "geo/GeocodeCache.hpp"
#include "geo/NominatimClient.hpp"
#include "util/RateLimiter.hpp"
#include <chrono>
#include <thread>
#include <vector>

using namespace photodb;
using metadata::MetadataResolver;
using photodb::test::TempDir;
using photodb::test::write_file;

namespace {

model::Address springfield() {
    model::Address a;
    a.house_number = "742";
    a.road = "Evergreen Terrace";
    a.city = "Springfield";
    a.state_code = "US-IL";
    a.state = "Illinois";
    a.country_code = "us";
    return a;
}

}  // namespace

TEST_CASE(test_coordinate_sign_handling) {
    metadata::ImageTags tags;
    tags.gps_latitude = metadata::DmsTriple{10, 30, 0};
    tags.gps_latitude_ref = "N";
    tags.gps_longitude = metadata::DmsTriple{20, 15, 0};
    tags.gps_longitude_ref = "W";

    auto c = MetadataResolver::coordinate_from_tags(tags);
    ASSERT_TRUE(c.has_value());
    ASSERT_NEAR(c->latitude, 10.5, 1e-9);
    ASSERT_NEAR(c->longitude, -20.25, 1e-9);

    tags.gps_latitude_ref = "S";
    tags.gps_longitude_ref = "E";
    c = MetadataResolver::coordinate_from_tags(tags);
    ASSERT_NEAR(c->latitude, -10.5, 1e-9);
    ASSERT_NEAR(c->longitude, 20.25, 1e-9);

    ASSERT_NEAR(MetadataResolver::dms_to_decimal({1, 0, 36}), 1.01, 1e-9);
}

TEST_CASE(test_coordinate_requires_both_axes) {
    metadata::ImageTags tags;
    tags.gps_latitude = metadata::DmsTriple{10, 30, 0};
    ASSERT_FALSE(MetadataResolver::coordinate_from_tags(tags).has_value());
}

TEST_CASE(test_parse_exif_datetime) {
    auto ts = MetadataResolver::parse_exif_datetime("2019:07:04 18:30:59");
    ASSERT_TRUE(ts.has_value());
    ASSERT_EQ(ts->year, 2019);
    ASSERT_EQ(ts->month, 7);
    ASSERT_EQ(ts->day, 4);
    ASSERT_EQ(ts->hour, 18);
    ASSERT_EQ(ts->second, 59);
    ASSERT_EQ(MetadataResolver::format_date(*ts), std::string("2019-07-04"));
    ASSERT_EQ(MetadataResolver::format_year(*ts), std::string("2019"));

    ASSERT_FALSE(MetadataResolver::parse_exif_datetime("0000:00:00 00:00:00").has_value());
    ASSERT_FALSE(MetadataResolver::parse_exif_datetime("    :  :     :  :  ").has_value());
    ASSERT_FALSE(MetadataResolver::parse_exif_datetime("").has_value());
}

TEST_CASE(test_parse_container_datetime) {
    auto mediainfo = MetadataResolver::parse_container_datetime("UTC 2021-06-01 10:20:30");
    ASSERT_TRUE(mediainfo.has_value());
    ASSERT_EQ(MetadataResolver::format_date(*mediainfo), std::string("2021-06-01"));
    ASSERT_EQ(mediainfo->minute, 20);

    auto iso = MetadataResolver::parse_container_datetime("2021-06-01T10:20:30.000000Z");
    ASSERT_TRUE(iso.has_value());
    ASSERT_TRUE(*iso == *mediainfo);

    ASSERT_FALSE(MetadataResolver::parse_container_datetime("yesterday").has_value());
}

TEST_CASE(test_display_location_rules) {
    MetadataResolver::LocationOverrides none;
    auto a = springfield();

    ASSERT_EQ(MetadataResolver::override_key(a), std::string("742 Evergreen Terrace, Springfield, IL"));
    ASSERT_EQ(*MetadataResolver::display_location(a, none), std::string("Evergreen Terrace, Springfield, IL"));

    MetadataResolver::LocationOverrides overrides{{"742 Evergreen Terrace, Springfield, IL", "Home"}};
    ASSERT_EQ(*MetadataResolver::display_location(a, overrides), std::string("Home"));

    a.road.reset();
    ASSERT_EQ(*MetadataResolver::display_location(a, none), std::string("Springfield, IL"));
}

TEST_CASE(test_display_location_fallbacks) {
    MetadataResolver::LocationOverrides none;

    model::Address a;
    a.town = "Shelbyville";
    a.state = "Illinois";
    ASSERT_EQ(*MetadataResolver::display_location(a, none), std::string("Shelbyville, Illinois"));

    model::Address b;
    b.county = "Cook County";
    b.state_code = "CA-ON";
    ASSERT_EQ(*MetadataResolver::display_location(b, none), std::string("Cook County, ON"));

    // Missing fields render as empty text in the override key
    model::Address c;
    c.city = "Paris";
    ASSERT_EQ(MetadataResolver::override_key(c), std::string(" , Paris, "));
    MetadataResolver::LocationOverrides overrides{{" , Paris, ", "Paris"}};
    ASSERT_EQ(*MetadataResolver::display_location(c, overrides), std::string("Paris"));

    model::Address nothing;
    nothing.country_code = "aq";
    ASSERT_FALSE(MetadataResolver::display_location(nothing, none).has_value());
}

TEST_CASE(test_resolve_prefers_embedded_tags) {
    TempDir dir;
    write_file(dir / "a.jpg", "img");

    test::FakeTagReader tags;
    test::FakeContainerReader container;
    container.by_name["a.jpg"].creation_time = "2001-01-01T00:00:00Z";
    MetadataResolver resolver(&tags, &container, nullptr, {});

    auto record = resolver.resolve(dir / "a.jpg");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->timestamp_source == model::TimestampSource::EmbeddedTag);
    ASSERT_EQ(record->date, std::string("2020-01-02"));
    ASSERT_EQ(record->year, std::string("2020"));
}

TEST_CASE(test_resolve_tag_priority) {
    TempDir dir;
    write_file(dir / "b.jpg", "img");

    test::FakeTagReader tags;
    metadata::ImageTags t;
    t.date_time_original = "garbage";
    t.date_time_digitized = "2018:05:06 07:08:09";
    t.date_time = "2017:01:01 00:00:00";
    tags.by_name["b.jpg"] = t;
    MetadataResolver resolver(&tags, nullptr, nullptr, {});

    ASSERT_EQ(resolver.resolve(dir / "b.jpg")->date, std::string("2018-05-06"));
}

TEST_CASE(test_resolve_container_for_non_images) {
    TempDir dir;
    write_file(dir / "clip.mov", "movie");

    test::FakeTagReader tags;
    test::FakeContainerReader container;
    metadata::StreamDescriptor video;
    video.media_type = "video";
    video.creation_time = "2015-03-04T05:06:07.000000Z";
    container.by_name["clip.mov"].streams.push_back(video);
    MetadataResolver resolver(&tags, &container, nullptr, {});

    auto record = resolver.resolve(dir / "clip.mov");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->timestamp_source == model::TimestampSource::Container);
    ASSERT_EQ(record->date, std::string("2015-03-04"));
    ASSERT_FALSE(record->coordinate.has_value());
}

TEST_CASE(test_resolve_falls_back_to_filesystem_time) {
    TempDir dir;
    write_file(dir / "notes.txt", "plain");

    test::FakeTagReader tags;
    test::FakeContainerReader container;
    MetadataResolver resolver(&tags, &container, nullptr, {});

    auto record = resolver.resolve(dir / "notes.txt");
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(record->timestamp_source == model::TimestampSource::Filesystem);
    ASSERT_EQ(record->date.size(), 10u);

    ASSERT_FALSE(resolver.resolve(dir / "missing.txt").has_value());
}

TEST_CASE(test_resolve_location_through_cache) {
    TempDir dir;
    write_file(dir / "gps.jpg", "img");

    test::FakeTagReader tags;
    tags.default_tags.gps_latitude = metadata::DmsTriple{39, 48, 0};
    tags.default_tags.gps_latitude_ref = "N";
    tags.default_tags.gps_longitude = metadata::DmsTriple{89, 39, 0};
    tags.default_tags.gps_longitude_ref = "W";

    test::FakeGeocoder geocoder;
    geocoder.result = springfield();
    util::RateLimiter limiter(std::chrono::milliseconds(0));
    geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);

    MetadataResolver resolver(&tags, nullptr, &cache, {{"742 Evergreen Terrace, Springfield, IL", "Home"}});
    auto record = resolver.resolve(dir / "gps.jpg");
    ASSERT_TRUE(record.has_value());
    ASSERT_NEAR(record->coordinate->latitude, 39.8, 1e-9);
    ASSERT_NEAR(record->coordinate->longitude, -89.65, 1e-9);
    ASSERT_EQ(*record->location, std::string("Home"));

    auto again = resolver.resolve(dir / "gps.jpg");
    ASSERT_EQ(*again->location, std::string("Home"));
    ASSERT_EQ(geocoder.call_count(), 1u);
}

TEST_CASE(test_geocode_bucket_key) {
    ASSERT_EQ(geo::GeocodeCache::bucket_key({10.5, -20.25}), std::string("10.500000,-20.250000"));
    ASSERT_EQ(geo::GeocodeCache::bucket_key({1.23456749, 2.0000004}), std::string("1.234567,2.000000"));
    ASSERT_EQ(geo::GeocodeCache::bucket_key({-0.0000001, 0.0}), std::string("0.000000,0.000000"));
}

TEST_CASE(test_geocode_cache_hits_and_persists) {
    TempDir dir;
    test::FakeGeocoder geocoder;
    geocoder.result = springfield();
    util::RateLimiter limiter(std::chrono::milliseconds(0));

    {
        geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);
        ASSERT_TRUE(*cache.lookup({39.8, -89.65}) == springfield());
        ASSERT_TRUE(*cache.lookup({39.8000001, -89.6500002}) == springfield());  // Same bucket
        ASSERT_EQ(cache.remote_calls(), 1u);
    }

    geo::GeocodeCache reopened(dir / "geo.db", nullptr, limiter);
    ASSERT_TRUE(reopened.cached({39.8, -89.65}).has_value());
    ASSERT_TRUE(reopened.lookup({39.8, -89.65}).has_value());
    ASSERT_FALSE(reopened.lookup({1.0, 1.0}).has_value());
}

TEST_CASE(test_geocode_failures_are_not_cached) {
    TempDir dir;
    test::FakeGeocoder geocoder;
    util::RateLimiter limiter(std::chrono::milliseconds(0));
    geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);

    ASSERT_FALSE(cache.lookup({1.0, 2.0}).has_value());
    geocoder.result = model::Address{};  // Empty address counts as failure
    ASSERT_FALSE(cache.lookup({1.0, 2.0}).has_value());
    ASSERT_EQ(geocoder.call_count(), 2u);

    geocoder.result = springfield();
    ASSERT_TRUE(cache.lookup({1.0, 2.0}).has_value());
    ASSERT_TRUE(cache.cached({1.0, 2.0}).has_value());
}

TEST_CASE(test_geocode_rate_limit_across_threads) {
    using namespace std::chrono;
    TempDir dir;
    test::FakeGeocoder geocoder;
    geocoder.result = springfield();
    util::RateLimiter limiter(milliseconds(80));
    geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);

    const int n = 4;
    auto start = steady_clock::now();
    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < n; ++i) {
            workers.emplace_back([&cache, i]() {
                // Distinct buckets so every lookup misses
                auto address = cache.lookup({10.0 + i, 20.0});
                (void)address;
            });
        }
    }
    auto elapsed = steady_clock::now() - start;

    ASSERT_EQ(geocoder.call_count(), static_cast<size_t>(n));
    ASSERT_TRUE(elapsed >= milliseconds((n - 1) * 80));
}

TEST_CASE(test_geocode_concurrent_misses_share_one_call) {
    using namespace std::chrono;
    TempDir dir;
    test::FakeGeocoder geocoder;
    geocoder.result = springfield();
    util::RateLimiter limiter(milliseconds(200));
    geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);

    limiter.acquire();  // The next permit is a full interval away

    const int n = 4;
    std::vector<std::optional<model::Address>> results(n);
    auto start = steady_clock::now();
    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < n; ++i) {
            workers.emplace_back([&cache, &results, i]() {
                results[i] = cache.lookup({45.123456, -122.654321});
            });
        }
    }
    auto elapsed = steady_clock::now() - start;

    ASSERT_EQ(geocoder.call_count(), 1u);
    ASSERT_EQ(cache.remote_calls(), 1u);
    for (const auto& r : results) {
        ASSERT_TRUE(r.has_value() && *r == springfield());
    }
    ASSERT_TRUE(elapsed < milliseconds(2 * 200));
}

TEST_CASE(test_geocode_waiter_retries_after_failed_fetch) {
    TempDir dir;
    test::FakeGeocoder geocoder;
    util::RateLimiter limiter(std::chrono::milliseconds(50));
    geo::GeocodeCache cache(dir / "geo.db", &geocoder, limiter);

    // Nothing to cache: every caller has to ask for itself
    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < 3; ++i) {
            workers.emplace_back([&cache]() {
                auto address = cache.lookup({1.5, 2.5});
                (void)address;
            });
        }
    }
    ASSERT_EQ(geocoder.call_count(), 3u);
    ASSERT_FALSE(cache.cached({1.5, 2.5}).has_value());
}

TEST_CASE(test_nominatim_response_parsing) {
    const std::string body = R"({
        "place_id": 1,
        "display_name": "742, Evergreen Terrace, Springfield",
        "address": {
            "house_number": "742",
            "road": "Evergreen Terrace",
            "city": "Springfield",
            "state": "Illinois",
            "ISO3166-2-lvl4": "US-IL",
            "country_code": "us"
        }
    })";

    auto a = geo::NominatimClient::parse_response(body);
    ASSERT_TRUE(a.has_value());
    ASSERT_EQ(*a->road, std::string("Evergreen Terrace"));
    ASSERT_EQ(*a->state_code, std::string("US-IL"));
    ASSERT_FALSE(a->town.has_value());

    ASSERT_FALSE(geo::NominatimClient::parse_response(R"({"error":"Unable to geocode"})").has_value());
    ASSERT_FALSE(geo::NominatimClient::parse_response("<html>").has_value());
}

int main() {
    return photodb::test::TestRunner::instance().run_all("resolver");
}
