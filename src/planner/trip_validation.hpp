#pragma once

#include <algorithm>
#include <format>
#include <set>
#include <vector>

#include "../helpers/time_helper.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "errors.hpp"

namespace itinera::planner {

    /**
     * Rejects a malformed trip request before any planning starts.
     * @param today injected so the "not in the past" rule is testable
     */
    inline void validate_trip_request(const models::trip_request& trip, helpers::date today) {
        if (trip.destination.empty()) {
            throw input_invalid("The destination must not be empty");
        }
        if (trip.start_date >= trip.end_date) {
            throw input_invalid("Start date needs to be before end date");
        }
        if (trip.end_date < today) {
            throw input_invalid("You cannot specify a trip in the past");
        }
        if (!(trip.budget > 0.0)) {
            throw input_invalid(std::format("The budget must be positive, got {}", trip.budget));
        }
        if (trip.travelers <= 0) {
            throw input_invalid(std::format("The number of travelers must be positive, got {}", trip.travelers));
        }
        const bool has_interest = std::any_of(trip.interests.begin(), trip.interests.end(),
                                              [](const auto& interest) { return !interest.empty(); });
        if (!has_interest) {
            throw input_invalid("At least one interest is required");
        }
    }

    // Every candidate needs a unique, non-empty id for schedules to reference it
    inline void validate_places(const std::vector<models::place>& places) {
        std::set<std::string> seen;
        for (const auto& p : places) {
            if (p.id.empty()) {
                throw input_invalid(std::format("Place '{}' has no id", p.name));
            }
            if (!seen.insert(p.id).second) {
                throw input_invalid(std::format("Duplicate place id '{}'", p.id));
            }
        }
    }
}
