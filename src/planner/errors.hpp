#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace itinera::planner {

    // Pipeline stages, in the order the orchestrator runs them
    enum class build_stage {
        validate_input,
        filter_places,
        plan_themes,
        allocate_accommodation,
        build_schedules,
        optimize_routes,
        validate_budget,
        finalize
    };

    inline std::string build_stage_to_string(build_stage s) {
        switch (s) {
            case build_stage::validate_input: return "VALIDATE_INPUT";
            case build_stage::filter_places: return "FILTER_PLACES";
            case build_stage::plan_themes: return "PLAN_THEMES";
            case build_stage::allocate_accommodation: return "ALLOCATE_ACCOMMODATION";
            case build_stage::build_schedules: return "BUILD_SCHEDULES";
            case build_stage::optimize_routes: return "OPTIMIZE_ROUTES";
            case build_stage::validate_budget: return "VALIDATE_BUDGET";
            case build_stage::finalize: return "FINALIZE";
        }
        return "UNKNOWN";
    }

    class planning_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Malformed trip request, coordinates or place catalog
    class input_invalid : public planning_error {
    public:
        using planning_error::planning_error;
    };

    // The content-generation service gave no usable structured result
    class collaborator_failure : public planning_error {
    public:
        collaborator_failure(std::string call_site, int attempts, const std::string& last_error)
            : planning_error(std::format("{} failed after {} attempt(s): {}", call_site, attempts, last_error)),
              call_site_(std::move(call_site)),
              attempts_(attempts) {}

        const std::string& call_site() const { return call_site_; }
        int attempts() const { return attempts_; }

    private:
        std::string call_site_;
        int attempts_;
    };

    // The single terminal error of a failed itinerary build
    class build_failure : public planning_error {
    public:
        build_failure(build_stage stage, const std::string& reason)
            : planning_error(std::format("Itinerary build failed at {}: {}", build_stage_to_string(stage), reason)),
              stage_(stage) {}

        build_stage stage() const { return stage_; }

    private:
        build_stage stage_;
    };
}
