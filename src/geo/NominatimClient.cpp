#include "geo/NominatimClient.hpp"
#include "util/Logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <format>
#include <utility>

using nlohmann::json;

namespace photodb::geo {

namespace {

std::optional<std::string> string_field(const json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

}  // namespace

NominatimClient::NominatimClient(Options options)
    : options_(std::move(options)) {}

std::optional<model::Address> NominatimClient::parse_response(const std::string& body) {
    try {
        auto doc = json::parse(body);
        if (!doc.is_object()) return std::nullopt;

        auto it = doc.find("address");
        if (it == doc.end() || !it->is_object()) return std::nullopt;
        const json& a = *it;

        model::Address address;
        address.house_number = string_field(a, "house_number");
        address.road = string_field(a, "road");
        address.city = string_field(a, "city");
        address.town = string_field(a, "town");
        address.county = string_field(a, "county");
        address.state_code = string_field(a, "ISO3166-2-lvl4");
        address.state = string_field(a, "state");
        address.country_code = string_field(a, "country_code");
        return address;
    } catch (const json::exception& e) {
        util::Logger::warn(std::string("NominatimClient: bad JSON: ") + e.what());
        return std::nullopt;
    }
}

std::optional<model::Address> NominatimClient::reverse(const model::Coordinate& coordinate) {
    const std::string query = std::format("/reverse?format=jsonv2&lat={:.6f}&lon={:.6f}",
                                          coordinate.latitude, coordinate.longitude);
    try {
        httplib::Client client(options_.endpoint);
        client.set_connection_timeout(options_.timeout);
        client.set_read_timeout(options_.timeout);
        client.set_follow_location(true);

        httplib::Headers headers = {
            {"User-Agent", options_.user_agent},
            {"Accept", "application/json"},
        };

        auto res = client.Get(query, headers);
        if (!res) {
            util::Logger::warn("NominatimClient: request failed (" +
                               httplib::to_string(res.error()) + ") for " + query);
            return std::nullopt;
        }
        if (res->status != 200) {
            util::Logger::warn(std::format("NominatimClient: HTTP {} for {}", res->status, query));
            return std::nullopt;
        }

        return parse_response(res->body);
    } catch (const std::exception& e) {
        util::Logger::error(std::string("NominatimClient: ") + e.what() + " (op=geocode)");
        return std::nullopt;
    }
}

}  // namespace photodb::geo
