#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace itinera::models {

    // Latitude and longitude in decimal degrees. Use make() to get range checking.
    struct coordinates {
        double latitude{0.0};
        double longitude{0.0};

        static coordinates make(double latitude, double longitude) {
            if (latitude < -90.0 || latitude > 90.0) {
                throw std::invalid_argument(std::format(
                    "The latitude of the coordinate point must be between -90 and 90 degrees, got {}", latitude));
            }
            if (longitude < -180.0 || longitude > 180.0) {
                throw std::invalid_argument(std::format(
                    "The longitude of the coordinate point must be between -180 and 180 degrees, got {}", longitude));
            }
            return coordinates{latitude, longitude};
        }

        bool operator==(const coordinates&) const = default;
    };
}
