#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "activity_factory.hpp"
#include "geo_distance.hpp"

namespace itinera::planner {

    constexpr std::chrono::minutes travel_buffer{30};

    // Activities the optimizer may move: located, and not bound to a fixed time
    inline bool is_movable(const models::scheduled_activity& a) {
        return a.location.has_value() &&
               a.type != models::activity_type::accommodation &&
               a.type != models::activity_type::event;
    }

    // Length in km of the walk through the movable activities, in list order
    inline double route_length_km(const std::vector<models::scheduled_activity>& activities) {
        double total = 0.0;
        const models::scheduled_activity* previous = nullptr;
        for (const auto& a : activities) {
            if (!is_movable(a)) continue;
            if (previous) {
                total += distance_km(*previous->location, *a.location);
            }
            previous = &a;
        }
        return total;
    }

    // True when some activity ends after midnight of the day the first one starts
    inline bool overruns_day(const std::vector<models::scheduled_activity>& activities) {
        if (activities.empty()) {
            return false;
        }
        const auto next_day = helpers::time_helper::date_of(activities.front().start_time) + std::chrono::days{1};
        return std::any_of(activities.begin(), activities.end(),
                           [next_day](const auto& a) { return a.end_time > helpers::timestamp{next_day}; });
    }

    /**
     * Reorders the movable activities of a day by nearest neighbour, starting
     * from the first one, and retimes them back to back: each lasts its
     * place's typical stay and the next starts 30 minutes after. Fixed
     * activities keep their times. The result is sorted by start time.
     */
    inline std::vector<models::scheduled_activity> optimize_route(const std::vector<models::scheduled_activity>& activities,
                                                                  const std::vector<models::place>& places) {
        std::vector<models::scheduled_activity> movable;
        std::vector<models::scheduled_activity> fixed;
        for (const auto& a : activities) {
            (is_movable(a) ? movable : fixed).push_back(a);
        }

        if (movable.size() <= 2) {
            ROUTE_TRACE_FMT("{} movable activities, nothing to optimize", movable.size());
            return activities;
        }

        std::map<std::string, const models::place*> by_id;
        for (const auto& p : places) {
            by_id.emplace(p.id, &p);
        }

        const double before = route_length_km(movable);

        std::vector<models::scheduled_activity> ordered;
        ordered.reserve(movable.size());
        std::vector<bool> visited(movable.size(), false);
        std::size_t current = 0;
        visited[0] = true;
        ordered.push_back(movable[0]);

        for (std::size_t step = 1; step < movable.size(); ++step) {
            std::size_t best = current;
            double best_distance = std::numeric_limits<double>::max();
            for (std::size_t i = 0; i < movable.size(); ++i) {
                if (visited[i]) continue;
                const double d = distance_km(*movable[current].location, *movable[i].location);
                if (d < best_distance) {
                    best_distance = d;
                    best = i;
                }
            }
            visited[best] = true;
            ordered.push_back(movable[best]);
            current = best;
        }

        auto cursor = ordered.front().start_time;
        for (auto& a : ordered) {
            double hours = default_stay_hours;
            if (a.place_id) {
                auto it = by_id.find(*a.place_id);
                if (it != by_id.end()) {
                    hours = stay_hours(*it->second);
                }
            }
            a.start_time = cursor;
            a.end_time = cursor + std::max<std::chrono::seconds>(helpers::time_helper::hours(hours), std::chrono::minutes{1});
            cursor = a.end_time + travel_buffer;
        }

        if (overruns_day(ordered)) {
            ROUTE_WARN_FMT("Back-to-back schedule of {} activities ends at {}, past the end of the day",
                           ordered.size(), helpers::time_helper::format_timestamp(ordered.back().end_time));
        }

        ROUTE_DEBUG_FMT("Reordered {} activities, path {:.2f} km -> {:.2f} km",
                        ordered.size(), before, route_length_km(ordered));

        ordered.insert(ordered.end(), fixed.begin(), fixed.end());
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const auto& a, const auto& b) { return a.start_time < b.start_time; });
        return ordered;
    }
}
