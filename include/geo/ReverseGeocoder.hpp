#pragma once

#include "model/Media.hpp"
#include <optional>

namespace photodb::geo {

// External coordinate -> address service.
// Implementations return nullopt (or an empty Address) on any failure and never throw.
class ReverseGeocoder {
public:
    virtual ~ReverseGeocoder() = default;

    [[nodiscard]] virtual std::optional<model::Address> reverse(const model::Coordinate& coordinate) = 0;
};

}  // namespace photodb::geo
