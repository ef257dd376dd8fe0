#include "day_schedule_builder.hpp"
#include <glaze/json.hpp>
#include <algorithm>
#include <format>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../helpers/debug.hpp"
#include "activity_factory.hpp"
#include "theme_assigner.hpp"

namespace itinera::planner {

// What the service sees of a candidate place
struct candidate_view {
    std::string place_id;
    std::string name;
    std::string kind;
    std::string priority;
    std::string reason_to_go;
    double typical_hours_of_stay{0.0};
    double estimated_cost{0.0};
    std::map<std::string, std::string> opening_schedule;
    std::optional<std::string> starts_at;

    struct glaze {
        using T = candidate_view;
        static constexpr auto value = glz::object(
            "place_id", &T::place_id,
            "name", &T::name,
            "kind", &T::kind,
            "priority", &T::priority,
            "reason_to_go", &T::reason_to_go,
            "typical_hours_of_stay", &T::typical_hours_of_stay,
            "estimated_cost", &T::estimated_cost,
            "opening_schedule", &T::opening_schedule,
            "starts_at", &T::starts_at
        );
    };
};

static candidate_view to_view(const models::place& p) {
    candidate_view view{
        p.id,
        p.name,
        models::place_kind_to_string(p.kind()),
        models::priority_to_string(p.priority),
        p.reason_to_go,
        p.typical_hours_of_stay,
        models::estimate_place_cost(p),
        p.opening_schedule,
        std::nullopt
    };
    if (const auto* e = p.as<models::event>()) {
        view.starts_at = helpers::time_helper::format_timestamp(e->date_and_time);
    }
    return view;
}

static std::string to_json(const std::vector<models::place>& places) {
    std::vector<candidate_view> views;
    views.reserve(places.size());
    for (const auto& p : places) {
        views.push_back(to_view(p));
    }
    std::string out;
    auto error = glz::write_json(views, out);
    if (error) {
        throw std::runtime_error("Failed to serialize candidates: " + glz::format_error(error));
    }
    return out;
}

// Append from src into dest until dest holds target_count places, skipping ids already present
static void extend_unique_until(std::vector<models::place>& dest,
                                const std::vector<models::place>& src,
                                std::size_t target_count) {
    std::set<std::string> seen;
    for (const auto& p : dest) {
        seen.insert(p.id);
    }
    for (const auto& p : src) {
        if (dest.size() >= target_count) {
            break;
        }
        if (seen.insert(p.id).second) {
            dest.push_back(p);
        }
    }
}

static const models::place* find_place(const std::vector<models::place>& pool, const std::string& id) {
    auto it = std::find_if(pool.begin(), pool.end(), [&id](const auto& p) { return p.id == id; });
    return it == pool.end() ? nullptr : &*it;
}

day_schedule_builder::candidates day_schedule_builder::gather_candidates(
    const std::vector<models::place>& day_places,
    const std::vector<models::place>& full_pool,
    helpers::date day_date,
    const std::optional<replan_context>& replan) {

    auto affordable = [&replan](const models::place& p) {
        return !replan || models::estimate_place_cost(p) <= replan->day_budget;
    };
    auto of_kind = [&affordable](const std::vector<models::place>& src, models::place_kind kind) {
        std::vector<models::place> out;
        std::copy_if(src.begin(), src.end(), std::back_inserter(out),
                     [&](const auto& p) { return p.is(kind) && affordable(p); });
        return out;
    };
    auto by_priority = [](const auto& a, const auto& b) { return a.priority < b.priority; };
    auto by_cost = [](const auto& a, const auto& b) {
        return models::estimate_place_cost(a) < models::estimate_place_cost(b);
    };

    candidates c;
    c.landmarks = of_kind(day_places, models::place_kind::landmark);
    c.establishments = of_kind(day_places, models::place_kind::establishment);
    std::stable_sort(c.landmarks.begin(), c.landmarks.end(), by_priority);
    std::stable_sort(c.establishments.begin(), c.establishments.end(), by_priority);

    extend_unique_until(c.landmarks, of_kind(full_pool, models::place_kind::landmark), context_landmarks);
    extend_unique_until(c.establishments, of_kind(full_pool, models::place_kind::establishment), context_establishments);
    if (c.landmarks.size() > context_landmarks) c.landmarks.resize(context_landmarks);
    if (c.establishments.size() > context_establishments) c.establishments.resize(context_establishments);

    for (const auto& p : of_kind(full_pool, models::place_kind::event)) {
        if (helpers::time_helper::date_of(p.as<models::event>()->date_and_time) == day_date) {
            c.events.push_back(p);
        }
    }

    if (replan) {
        std::stable_sort(c.landmarks.begin(), c.landmarks.end(), by_cost);
        std::stable_sort(c.establishments.begin(), c.establishments.end(), by_cost);
        std::stable_sort(c.events.begin(), c.events.end(), by_cost);
    }
    return c;
}

std::string day_schedule_builder::build_context(const models::trip_request& trip,
                                                const day_request& request,
                                                const candidates& c,
                                                const std::optional<replan_context>& replan) {
    std::string context = std::format(
        "Day {} of a trip to {} ({}), theme: {}.\n\n"
        "Trip details:\n{}\n"
        "Consider the following places:\n"
        "- Landmarks:\n{}\n\n"
        "- Establishments (Restaurants, Cafes, etc.):\n{}\n\n"
        "- Events:\n{}\n\n"
        "Your task is to create activities for the entire day and organize them. "
        "Reference places by their place_id and give start_time as HH:MM.",
        request.day_number, trip.destination, helpers::time_helper::format_date(request.day_date),
        request.theme, trip.format_for_llm(),
        to_json(c.landmarks), to_json(c.establishments), to_json(c.events));

    if (replan) {
        context += std::format(
            "\n\nThe previous plan went over budget (attempt {}). Keep the paid activities of "
            "this day under {:.2f} EUR in total and prefer the cheaper places.",
            replan->attempt, replan->day_budget);
    }
    return context;
}

std::vector<models::scheduled_activity> day_schedule_builder::to_activities(
    const services::daily_activities& response,
    const std::vector<models::place>& full_pool,
    const day_request& request) {

    std::vector<models::scheduled_activity> activities;
    for (const auto& entry : response.activities) {
        const auto* p = find_place(full_pool, entry.place_id);
        if (!p) {
            SCHEDULE_WARN_FMT("Day {}: dropping unknown place id '{}'", request.day_number, entry.place_id);
            continue;
        }

        helpers::timestamp start;
        if (const auto* e = p->as<models::event>()) {
            if (helpers::time_helper::date_of(e->date_and_time) != request.day_date) {
                SCHEDULE_WARN_FMT("Day {}: dropping event '{}' held on another day", request.day_number, p->name);
                continue;
            }
            start = e->date_and_time;
        } else {
            auto clock = helpers::time_helper::parse_clock_time(entry.start_time);
            if (!clock) {
                SCHEDULE_WARN_FMT("Day {}: dropping '{}' with bad start time '{}'",
                                  request.day_number, p->name, entry.start_time);
                continue;
            }
            start = helpers::time_helper::at(request.day_date, *clock);
        }

        auto id = std::format("d{}-a{}", request.day_number, activities.size() + 1);
        activities.push_back(activity_factory::from_place(*p, std::move(id), start, entry.duration_hours));
    }
    return activities;
}

day_build_result day_schedule_builder::build(const models::trip_request& trip,
                                             const day_request& request,
                                             const std::vector<models::place>& full_pool,
                                             const std::vector<models::place>& available_pool,
                                             const std::optional<replan_context>& replan) const {
    const bool reset = available_pool.size() < min_pool_before_reset;
    const auto& pool = reset ? full_pool : available_pool;
    if (reset) {
        SCHEDULE_DEBUG_FMT("Day {}: only {} places left, making all {} available again",
                           request.day_number, available_pool.size(), full_pool.size());
    }

    const auto day_places = assign_places_to_day(pool, request.theme, request.day_number);
    const auto c = gather_candidates(day_places, full_pool, request.day_date, replan);

    day_build_result result;
    result.day.day_date = request.day_date;
    result.day.day_number = request.day_number;
    result.day.theme = request.theme;

    if (c.landmarks.empty() && c.establishments.empty() && c.events.empty()) {
        SCHEDULE_WARN_FMT("Day {}: no candidate places, leaving the day free", request.day_number);
    } else {
        SCHEDULE_INFO_FMT("Day {}: asking for a schedule over {} landmarks, {} establishments, {} events",
                          request.day_number, c.landmarks.size(), c.establishments.size(), c.events.size());

        auto response = services::generate_structured<services::daily_activities>(
            service_, "daily_activities", build_context(trip, request, c, replan),
            services::daily_activities::schema(), policy_,
            [&full_pool](const services::daily_activities& r) -> std::optional<std::string> {
                const bool any_known = std::any_of(r.activities.begin(), r.activities.end(),
                    [&full_pool](const auto& a) { return find_place(full_pool, a.place_id) != nullptr; });
                if (!any_known) {
                    return "no activity references a known place";
                }
                return std::nullopt;
            });
        result.day.activities = to_activities(response, full_pool, request);
    }

    std::set<std::string> used;
    for (const auto& p : day_places) {
        used.insert(p.id);
    }
    for (const auto& a : result.day.activities) {
        if (a.place_id) used.insert(*a.place_id);
    }
    std::copy_if(pool.begin(), pool.end(), std::back_inserter(result.remaining_pool),
                 [&used](const auto& p) { return !used.contains(p.id); });

    SCHEDULE_INFO_FMT("Day {}: {} activities, {} places left for later days",
                      request.day_number, result.day.activities.size(), result.remaining_pool.size());
    return result;
}

}
