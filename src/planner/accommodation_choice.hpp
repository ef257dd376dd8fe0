#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "activity_factory.hpp"
#include "errors.hpp"

namespace itinera::planner {

    constexpr double accommodation_budget_tolerance = 1.2;
    constexpr std::chrono::hours check_in_time{22};
    constexpr std::chrono::hours check_out_time{9};

    inline double accommodation_priority_weight(models::priority p) {
        switch (p) {
            case models::priority::essential: return 3.0;
            case models::priority::high: return 2.0;
            case models::priority::medium: return 1.0;
            case models::priority::low: return 0.0;
        }
        return 0.0;
    }

    inline double nightly_price(const models::place& p) {
        const auto* a = p.as<models::accommodation>();
        return a ? models::min_price(a->price_options) : 0.0;
    }

    /**
     * Best stay among the accommodations: affordable ones (cheapest night at
     * most 1.2 x budget per traveler per night) ranked by priority plus up to
     * 2 points for being cheap. When none is affordable, the cheapest wins.
     */
    inline models::place select_best_accommodation(const std::vector<models::place>& accommodations,
                                                   const models::trip_request& trip) {
        if (accommodations.empty()) {
            throw planning_error("No accommodations available");
        }

        const double per_night_per_person = trip.budget / trip.travelers / std::max(trip.total_nights(), 1);

        std::vector<const models::place*> affordable;
        for (const auto& a : accommodations) {
            if (nightly_price(a) <= per_night_per_person * accommodation_budget_tolerance) {
                affordable.push_back(&a);
            }
        }

        if (affordable.empty()) {
            auto cheapest = std::min_element(accommodations.begin(), accommodations.end(),
                [](const auto& a, const auto& b) { return nightly_price(a) < nightly_price(b); });
            PLAN_WARN_FMT("No accommodation within {:.2f} per night, taking the cheapest: {}",
                          per_night_per_person, cheapest->name);
            return *cheapest;
        }

        auto [lowest, highest] = std::minmax_element(affordable.begin(), affordable.end(),
            [](const auto* a, const auto* b) { return nightly_price(*a) < nightly_price(*b); });
        const double min_price = nightly_price(**lowest);
        const double max_price = nightly_price(**highest);

        const models::place* best = nullptr;
        double best_score = 0.0;
        for (const auto* a : affordable) {
            double score = accommodation_priority_weight(a->priority);
            if (max_price > min_price) {
                score += 2.0 * (1.0 - (nightly_price(*a) - min_price) / (max_price - min_price));
            }
            if (!best || score > best_score) {
                best = a;
                best_score = score;
            }
        }

        PLAN_INFO_FMT("Chose accommodation {} (score {:.2f}, {:.2f} per night)", best->name, best_score, nightly_price(*best));
        return *best;
    }

    // One overnight stay per night of the trip, 22:00 to 09:00
    inline std::vector<models::scheduled_activity> plan_accommodation(const models::place& accommodation,
                                                                      const models::trip_request& trip) {
        std::vector<models::scheduled_activity> nights;
        for (int night = 0; night < trip.total_nights(); ++night) {
            const auto night_date = trip.start_date + std::chrono::days{night};
            auto activity = activity_factory::from_place(accommodation, std::format("n{}", night + 1),
                                                         helpers::time_helper::at(night_date, check_in_time));
            activity.end_time = helpers::time_helper::at(night_date + std::chrono::days{1}, check_out_time);
            activity.estimated_cost = nightly_price(accommodation) / trip.travelers;
            nights.push_back(std::move(activity));
        }
        return nights;
    }
}
