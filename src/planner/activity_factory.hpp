#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"

namespace itinera::planner {

    constexpr double default_stay_hours = 2.0;

    inline models::activity_type activity_type_for(const models::place& p) {
        return std::visit(models::overloaded{
            [](const models::landmark&) { return models::activity_type::sightseeing; },
            [](const models::establishment&) { return models::activity_type::dining; },
            [](const models::event&) { return models::activity_type::event; },
            [](const models::accommodation&) { return models::activity_type::accommodation; },
        }, p.details);
    }

    /**
     * How long a visit lasts. The place's own typical stay wins; the requested
     * duration only fills in when the place does not know, and 2 hours after that.
     */
    inline double stay_hours(const models::place& p, double requested_hours = 0.0) {
        if (p.typical_hours_of_stay > 0.0) return p.typical_hours_of_stay;
        if (requested_hours > 0.0) return requested_hours;
        return default_stay_hours;
    }

    class activity_factory {
    public:
        static models::scheduled_activity from_place(const models::place& p,
                                                     std::string activity_id,
                                                     helpers::timestamp start_time,
                                                     double requested_hours = 0.0) {
            models::scheduled_activity activity;
            activity.id = std::move(activity_id);
            activity.place_id = p.id;
            activity.type = activity_type_for(p);
            activity.name = p.name;
            activity.description = p.reason_to_go;
            if (p.weather_dependent) {
                activity.description += " (Weather dependent - check forecast!)";
            }
            activity.start_time = start_time;
            const auto stay = std::max<std::chrono::seconds>(
                helpers::time_helper::hours(stay_hours(p, requested_hours)), std::chrono::minutes{1});
            activity.end_time = start_time + stay;
            activity.estimated_cost = models::estimate_place_cost(p);
            activity.location = p.location;
            activity.booking_required = p.booking_required();
            activity.booking_url = p.website;
            for (const auto& [days, hours] : p.opening_schedule) {
                activity.notes.push_back(std::format("Open {}: {}", days, hours));
            }
            return activity;
        }
    };
}
