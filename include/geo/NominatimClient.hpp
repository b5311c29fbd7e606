#pragma once

#include "geo/ReverseGeocoder.hpp"
#include <string>
#include <chrono>

namespace photodb::geo {

/**
 * Reverse geocoder backed by the Nominatim /reverse endpoint (jsonv2).
 * Timeouts, transport errors, non-200 replies and malformed JSON all
 * resolve to nullopt. Call spacing is the caller's job (GeocodeCache).
 */
class NominatimClient : public ReverseGeocoder {
public:
    struct Options {
        std::string endpoint = "https://nominatim.openstreetmap.org";
        std::string user_agent = "photodb";
        std::chrono::seconds timeout{10};
    };

    explicit NominatimClient(Options options);

    [[nodiscard]] std::optional<model::Address> reverse(const model::Coordinate& coordinate) override;

    // Maps a jsonv2 reply body onto Address; nullopt if it has no "address" object
    [[nodiscard]] static std::optional<model::Address> parse_response(const std::string& body);

private:
    Options options_;
};

}  // namespace photodb::geo
