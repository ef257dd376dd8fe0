#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "../services/content_generation.hpp"
#include "../services/generation_types.hpp"

namespace itinera::planner {

    constexpr std::size_t context_landmarks = 5;
    constexpr std::size_t context_establishments = 4;
    constexpr std::size_t min_pool_before_reset = 6;

    // Spend target handed to every schedule pass after the first
    struct replan_context {
        int attempt{1};
        double day_budget{0.0};
    };

    struct day_request {
        int day_number{1};
        helpers::date day_date;
        std::string theme;
    };

    struct day_build_result {
        models::day_itinerary day;
        std::vector<models::place> remaining_pool;
    };

    /**
     * Builds the activity list of one day.
     *
     * The pool of places not yet used by earlier days comes in as a snapshot
     * and the shrunken pool comes back in the result; nothing is shared
     * between builds. The content-generation service decides the order and
     * times, the place catalog decides everything else.
     */
    class day_schedule_builder {
    public:
        day_schedule_builder(services::content_generation_service& service, services::retry_policy policy)
            : service_(service), policy_(policy) {}

        day_build_result build(const models::trip_request& trip,
                               const day_request& request,
                               const std::vector<models::place>& full_pool,
                               const std::vector<models::place>& available_pool,
                               const std::optional<replan_context>& replan = std::nullopt) const;

        // Candidates sent to the service for a day, grouped by kind
        struct candidates {
            std::vector<models::place> landmarks;
            std::vector<models::place> establishments;
            std::vector<models::place> events;
        };

        static candidates gather_candidates(const std::vector<models::place>& day_places,
                                            const std::vector<models::place>& full_pool,
                                            helpers::date day_date,
                                            const std::optional<replan_context>& replan);

        static std::string build_context(const models::trip_request& trip,
                                         const day_request& request,
                                         const candidates& c,
                                         const std::optional<replan_context>& replan);

        static std::vector<models::scheduled_activity> to_activities(const services::daily_activities& response,
                                                                     const std::vector<models::place>& full_pool,
                                                                     const day_request& request);

    private:
        services::content_generation_service& service_;
        services::retry_policy policy_;
    };
}
