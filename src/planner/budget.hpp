#pragma once

#include <vector>

#include "../helpers/debug.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"

namespace itinera::planner {

    // Over budget iff the day totals add up to more than the trip budget
    inline models::budget_tracker validate_budget(const models::trip_request& trip,
                                                  const std::vector<models::day_itinerary>& days) {
        models::budget_tracker tracker;
        for (const auto& day : days) {
            tracker.total_estimated_cost += day.total_estimated_cost;
        }
        tracker.is_over_budget = tracker.total_estimated_cost > trip.budget;
        BUDGET_DEBUG_FMT("Estimated {:.2f} against budget {:.2f}{}", tracker.total_estimated_cost, trip.budget,
                         tracker.is_over_budget ? " (over)" : "");
        return tracker;
    }

    /**
     * Cost by category for the whole group. Activity costs are per person, so
     * dining and events scale by travelers; sightseeing and transport do not.
     * The accommodation is its cheapest nightly price per traveler.
     */
    inline models::cost_breakdown create_budget_breakdown(const models::place& accommodation,
                                                          const std::vector<models::day_itinerary>& days,
                                                          int nights,
                                                          int travelers) {
        const auto* stay = accommodation.as<models::accommodation>();
        const double nightly = stay ? models::min_price(stay->price_options) : 0.0;

        models::cost_breakdown breakdown{
            {"accommodation", nightly * nights * travelers},
            {"dining", 0.0},
            {"attractions", 0.0},
            {"transportation", 0.0},
            {"events", 0.0},
        };

        for (const auto& day : days) {
            for (const auto& activity : day.activities) {
                switch (activity.type) {
                    case models::activity_type::dining:
                        breakdown["dining"] += activity.estimated_cost * travelers;
                        break;
                    case models::activity_type::event:
                        breakdown["events"] += activity.estimated_cost * travelers;
                        break;
                    default:
                        breakdown["attractions"] += activity.estimated_cost;
                        break;
                }
            }
            for (const auto& segment : day.travel_segments) {
                breakdown["transportation"] += segment.cost;
            }
        }

        double total = 0.0;
        for (const auto& [category, amount] : breakdown) {
            total += amount;
        }
        breakdown["total"] = total;
        return breakdown;
    }
}
