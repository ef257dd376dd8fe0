#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"

namespace itinera::planner {

    constexpr int max_activities_per_day = 6;
    constexpr double selection_budget_share = 0.8;

    inline double priority_weight(models::priority p) {
        switch (p) {
            case models::priority::essential: return 10.0;
            case models::priority::high: return 7.0;
            case models::priority::medium: return 4.0;
            case models::priority::low: return 1.0;
        }
        return 0.0;
    }

    /**
     * Relevance of a place for this particular trip: priority first, then
     * interest overlap, then a small bonus for what suits the group.
     */
    inline double calculate_place_score(const models::place& p, const models::trip_request& trip) {
        double score = priority_weight(p.priority);

        const auto text = p.search_text();
        for (const auto& interest : trip.interests) {
            if (!interest.empty() && text.find(helpers::StringHelper::to_lower(interest)) != std::string::npos) {
                score += 2.0;
            }
        }

        switch (trip.type) {
            case models::trip_type::friends:
            case models::trip_type::group:
                if (p.is(models::place_kind::establishment)) {
                    score += 1.0;
                }
                break;
            case models::trip_type::couple: {
                auto reason = helpers::StringHelper::to_lower(p.reason_to_go);
                if (helpers::StringHelper::contains_any(reason, {"romantic", "sunset", "view", "garden", "park"})) {
                    score += 1.5;
                }
                break;
            }
            case models::trip_type::solo:
                break;
        }

        return score;
    }

    /**
     * Builds the working set: best-scoring places first, admitted while they fit
     * in 80% of the per-person budget and the 6-per-day cap. Essential places
     * skip the budget check but never the cap.
     */
    inline std::vector<models::place> select_places(const std::vector<models::place>& places,
                                                    const models::trip_request& trip) {
        struct scored_place {
            const models::place* place;
            double score;
        };

        std::vector<scored_place> scored;
        scored.reserve(places.size());
        for (const auto& p : places) {
            scored.push_back({&p, calculate_place_score(p, trip)});
        }
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.score > b.score; });

        const auto cap = static_cast<std::size_t>(trip.total_days() * max_activities_per_day);
        const double budget_per_person = trip.budget / trip.travelers;

        std::vector<models::place> selected;
        double total_estimated_cost = 0.0;

        for (const auto& [p, score] : scored) {
            if (selected.size() >= cap) {
                break;
            }
            const double cost = models::estimate_place_cost(*p);

            if (total_estimated_cost + cost <= budget_per_person * selection_budget_share) {
                selected.push_back(*p);
                total_estimated_cost += cost;
                SELECT_TRACE_FMT("Admitted '{}' (score {:.1f}, cost {:.2f})", p->name, score, cost);
            } else if (p->priority == models::priority::essential) {
                selected.push_back(*p);
                SELECT_DEBUG_FMT("Admitted essential '{}' over budget (cost {:.2f})", p->name, cost);
            } else {
                SELECT_TRACE_FMT("Skipped '{}' (score {:.1f}, cost {:.2f})", p->name, score, cost);
            }
        }

        SELECT_INFO_FMT("Selected {} of {} places (cap {}, estimated spend {:.2f})",
                        selected.size(), places.size(), cap, total_estimated_cost);
        return selected;
    }
}
