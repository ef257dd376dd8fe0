#pragma once

#include <algorithm>
#include <cmath>
#include <numbers>

#include "../models/geo/coordinates.hpp"

namespace itinera::planner {

    constexpr double earth_radius_km = 6371.2;

    inline double haversine(double theta) {
        return (1.0 - std::cos(theta)) / 2.0;
    }

    /**
     * Great-circle distance between two points, in kilometers.
     */
    inline double distance_km(const models::coordinates& a, const models::coordinates& b) {
        constexpr double to_radians = std::numbers::pi / 180.0;

        const double f1 = a.latitude * to_radians;
        const double f2 = b.latitude * to_radians;
        const double df = f2 - f1;
        const double dl = (b.longitude - a.longitude) * to_radians;

        const double theta = haversine(df) + std::cos(f1) * std::cos(f2) * haversine(dl);
        // Rounding can push theta a hair outside [0, 1] for antipodal points
        return 2.0 * earth_radius_km * std::asin(std::sqrt(std::clamp(theta, 0.0, 1.0)));
    }
}
