#pragma once

#include <algorithm>
#include <format>
#include <vector>

#include "../helpers/debug.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "fares.hpp"
#include "geo_distance.hpp"

namespace itinera::planner {

    constexpr double walking_limit_km = 0.5;
    constexpr double public_transport_limit_km = 3.0;
    constexpr double taxi_rate_per_km = 1.20;

    /**
     * Picks how to get from one activity to the next. Both activities must
     * carry coordinates.
     */
    inline models::travel_segment classify_travel_segment(const models::scheduled_activity& from,
                                                          const models::scheduled_activity& to,
                                                          const fare_options& fares = {}) {
        const double km = distance_km(*from.location, *to.location);

        models::travel_segment segment;
        segment.from_activity_id = from.id;
        segment.to_activity_id = to.id;

        if (km <= walking_limit_km) {
            segment.mode = models::transport_mode::walking;
            segment.duration_minutes = static_cast<int>(std::max(5.0, km * 12.0));
            segment.cost = 0.0;
            segment.instructions = std::format("Walk {}m to {} ({} mins)",
                                               static_cast<int>(km * 1000.0), to.name, segment.duration_minutes);
        } else if (km <= public_transport_limit_km) {
            segment.mode = models::transport_mode::public_transport;
            segment.duration_minutes = static_cast<int>(std::max(10.0, km * 8.0));
            segment.cost = fares.average_public_transport_fare;
            segment.instructions = std::format("Take public transport to {} ({} mins, €{:.2f})",
                                               to.name, segment.duration_minutes, segment.cost);
        } else {
            segment.mode = models::transport_mode::taxi;
            segment.duration_minutes = static_cast<int>(std::max(15.0, km * 5.0));
            segment.cost = fares.base_taxi_fare + km * taxi_rate_per_km;
            segment.instructions = std::format("Take taxi to {} ({} mins, ~€{:.2f})",
                                               to.name, segment.duration_minutes, segment.cost);
        }
        return segment;
    }

    // Segments between neighbours in start order; pairs without coordinates or sharing a start are skipped
    inline std::vector<models::travel_segment> calculate_travel_segments(
        const std::vector<models::scheduled_activity>& activities,
        const fare_options& fares = {}) {
        std::vector<models::travel_segment> segments;
        for (std::size_t i = 1; i < activities.size(); ++i) {
            const auto& from = activities[i - 1];
            const auto& to = activities[i];
            if (!from.location || !to.location || from.start_time == to.start_time) {
                continue;
            }
            segments.push_back(classify_travel_segment(from, to, fares));
            ROUTE_TRACE_FMT("{} -> {}: {}", from.id, to.id, segments.back().instructions);
        }
        return segments;
    }
}
