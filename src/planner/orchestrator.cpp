#include "orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "../helpers/debug.hpp"
#include "accommodation_choice.hpp"
#include "budget.hpp"
#include "place_selector.hpp"
#include "route_optimizer.hpp"
#include "themes.hpp"
#include "travel_segments.hpp"
#include "trip_validation.hpp"

namespace itinera::planner {

constexpr std::size_t max_highlights = 3;

double itinerary_orchestrator::replan_day_budget(const models::trip_request& trip, int attempt) {
    const double factor = std::max(1.0 - replan_budget_step * attempt, replan_budget_floor);
    return trip.budget / trip.total_days() * factor;
}

models::day_itinerary itinerary_orchestrator::finish_day(models::day_itinerary day,
                                                         const std::vector<models::place>& places,
                                                         const fare_options& fares) {
    std::stable_sort(day.activities.begin(), day.activities.end(),
                     [](const auto& a, const auto& b) { return a.start_time < b.start_time; });
    day.activities = optimize_route(day.activities, places);
    day.travel_segments = calculate_travel_segments(day.activities, fares);

    day.total_estimated_cost = 0.0;
    for (const auto& a : day.activities) {
        day.total_estimated_cost += a.estimated_cost;
    }
    for (const auto& s : day.travel_segments) {
        day.total_estimated_cost += s.cost;
    }

    std::map<std::string, const models::place*> by_id;
    for (const auto& p : places) {
        by_id.emplace(p.id, &p);
    }

    day.key_highlights.clear();
    std::vector<std::string> weather_dependent;
    for (const auto& a : day.activities) {
        if (a.type == models::activity_type::sightseeing && day.key_highlights.size() < max_highlights) {
            day.key_highlights.push_back(a.name);
        }
        if (a.place_id) {
            auto it = by_id.find(*a.place_id);
            if (it != by_id.end() && it->second->weather_dependent) {
                weather_dependent.push_back(a.name);
            }
        }
    }

    day.weather_note.reset();
    if (!weather_dependent.empty()) {
        std::string names;
        for (const auto& name : weather_dependent) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        day.weather_note = std::format("Check the forecast, weather dependent: {}", names);
    }
    return day;
}

std::vector<models::day_itinerary> itinerary_orchestrator::build_schedules(
    const models::trip_request& trip,
    const std::vector<models::place>& schedulable,
    const std::vector<std::string>& themes,
    const std::optional<replan_context>& replan) const {

    std::vector<models::day_itinerary> days;
    std::vector<models::place> pool = schedulable;
    for (int i = 0; i < trip.total_days(); ++i) {
        day_request request{i + 1, trip.start_date + std::chrono::days{i}, themes[static_cast<std::size_t>(i)]};
        auto result = builder_.build(trip, request, schedulable, pool, replan);
        days.push_back(std::move(result.day));
        pool = std::move(result.remaining_pool);
    }
    return days;
}

models::trip_itinerary itinerary_orchestrator::build(const models::trip_request& trip,
                                                     const std::vector<models::place>& places,
                                                     helpers::date today) const {
    validate_trip_request(trip, today);
    validate_places(places);
    if (options_.max_replan_attempts < 0) {
        throw input_invalid(std::format("max_replan_attempts must not be negative, got {}",
                                        options_.max_replan_attempts));
    }

    PLAN_INFO_FMT("Planning {} days in {} for {} travelers, budget {:.2f}",
                  trip.total_days(), trip.destination, trip.travelers, trip.budget);

    auto stage = build_stage::filter_places;
    try {
        std::vector<models::place> accommodations;
        std::vector<models::place> others;
        for (const auto& p : places) {
            (p.is(models::place_kind::accommodation) ? accommodations : others).push_back(p);
        }

        const auto schedulable = select_places(others, trip);
        if (schedulable.empty()) {
            throw build_failure(stage, "No place fits the trip");
        }

        stage = build_stage::plan_themes;
        const auto themes = generate_daily_themes(service_, trip, schedulable, options_.generation);

        stage = build_stage::allocate_accommodation;
        auto accommodation = select_best_accommodation(accommodations, trip);
        auto accommodation_plan = plan_accommodation(accommodation, trip);

        stage = build_stage::optimize_routes;
        const auto fares = lookup_fares(service_, trip, options_.generation);

        std::optional<std::vector<models::day_itinerary>> best;
        models::budget_tracker best_tracker;
        int attempts = 0;

        for (int attempt = 0; attempt <= options_.max_replan_attempts; ++attempt) {
            attempts = attempt + 1;

            std::optional<replan_context> replan;
            if (attempt > 0) {
                replan = replan_context{attempt, replan_day_budget(trip, attempt)};
                PLAN_INFO_FMT("Replanning ({}/{}), daily spend target {:.2f}",
                              attempt, options_.max_replan_attempts, replan->day_budget);
            }

            stage = build_stage::build_schedules;
            auto days = build_schedules(trip, schedulable, themes, replan);

            stage = build_stage::optimize_routes;
            for (auto& day : days) {
                day = finish_day(std::move(day), schedulable, fares);
            }

            stage = build_stage::validate_budget;
            auto tracker = validate_budget(trip, days);
            if (!best || tracker.total_estimated_cost < best_tracker.total_estimated_cost) {
                best = std::move(days);
                best_tracker = tracker;
            }
            if (!tracker.is_over_budget) {
                break;
            }
            BUDGET_WARN_FMT("Attempt {} is over budget: {:.2f} > {:.2f}",
                            attempts, tracker.total_estimated_cost, trip.budget);
        }

        if (best_tracker.is_over_budget) {
            if (options_.fail_when_over_budget) {
                throw build_failure(stage, std::format(
                    "Budget exceeded after {} attempt(s): cheapest plan costs {:.2f}, budget is {:.2f}",
                    attempts, best_tracker.total_estimated_cost, trip.budget));
            }
            PLAN_WARN_FMT("Keeping the cheapest plan found ({:.2f}) although it exceeds the budget of {:.2f}",
                          best_tracker.total_estimated_cost, trip.budget);
        }

        stage = build_stage::finalize;
        models::trip_itinerary itinerary;
        itinerary.destination = trip.destination;
        itinerary.start_date = trip.start_date;
        itinerary.end_date = trip.end_date;
        itinerary.total_days = trip.total_days();
        itinerary.daily_itineraries = std::move(*best);
        itinerary.budget_breakdown = create_budget_breakdown(accommodation, itinerary.daily_itineraries,
                                                             trip.total_nights(), trip.travelers);
        itinerary.accommodation = std::move(accommodation);
        itinerary.accommodation_plan = std::move(accommodation_plan);
        itinerary.total_estimated_cost = best_tracker.total_estimated_cost;
        itinerary.budget = best_tracker;
        itinerary.planning_attempts = attempts;

        PLAN_INFO_FMT("Itinerary ready after {} attempt(s), estimated {:.2f}", attempts, itinerary.total_estimated_cost);
        return itinerary;
    } catch (const build_failure&) {
        throw;
    } catch (const std::exception& e) {
        PLAN_ERROR_FMT("Build failed at {}: {}", build_stage_to_string(stage), e.what());
        throw build_failure(stage, e.what());
    }
}

}
