#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "../services/content_generation.hpp"
#include "day_schedule_builder.hpp"
#include "errors.hpp"
#include "fares.hpp"

namespace itinera::planner {

    struct planner_options {
        int max_replan_attempts{5};
        services::retry_policy generation{};
        // Fail instead of returning the cheapest over-budget itinerary
        bool fail_when_over_budget{false};
    };

    constexpr double replan_budget_step = 0.15;
    constexpr double replan_budget_floor = 0.25;

    /**
     * Runs the whole build for one trip:
     *
     *   FILTER_PLACES -> PLAN_THEMES -> ALLOCATE_ACCOMMODATION -> BUILD_SCHEDULES
     *     -> OPTIMIZE_ROUTES -> VALIDATE_BUDGET -> (BUILD_SCHEDULES again | FINALIZE)
     *
     * Over-budget plans are rebuilt with a shrinking daily spend target, at
     * most max_replan_attempts times. Any failure surfaces as a single
     * build_failure naming the stage; a partial itinerary is never returned.
     */
    class itinerary_orchestrator {
    public:
        itinerary_orchestrator(services::content_generation_service& service, planner_options options = {})
            : service_(service), options_(options), builder_(service, options.generation) {}

        models::trip_itinerary build(const models::trip_request& trip,
                                     const std::vector<models::place>& places,
                                     helpers::date today = helpers::time_helper::today()) const;

        // Per-day spend target for replan attempt n (n >= 1)
        static double replan_day_budget(const models::trip_request& trip, int attempt);

        // Orders, routes and totals one freshly built day
        static models::day_itinerary finish_day(models::day_itinerary day,
                                                const std::vector<models::place>& places,
                                                const fare_options& fares);

    private:
        std::vector<models::day_itinerary> build_schedules(const models::trip_request& trip,
                                                           const std::vector<models::place>& schedulable,
                                                           const std::vector<std::string>& themes,
                                                           const std::optional<replan_context>& replan) const;

        services::content_generation_service& service_;
        planner_options options_;
        day_schedule_builder builder_;
    };
}
