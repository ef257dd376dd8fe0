#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../helpers/time_helper.hpp"
#include "../geo/coordinates.hpp"
#include "../places/place.hpp"

namespace itinera::models {

    enum class activity_type {
        sightseeing,
        dining,
        event,
        accommodation
    };

    enum class transport_mode {
        walking,
        public_transport,
        taxi
    };

    inline std::string activity_type_to_string(activity_type t) {
        switch (t) {
            case activity_type::sightseeing: return "Sightseeing";
            case activity_type::dining: return "Dining";
            case activity_type::event: return "Event";
            case activity_type::accommodation: return "Accommodation";
        }
        return "Unknown";
    }

    inline std::string transport_mode_to_string(transport_mode m) {
        switch (m) {
            case transport_mode::walking: return "Walking";
            case transport_mode::public_transport: return "Public Transport";
            case transport_mode::taxi: return "Taxi";
        }
        return "Unknown";
    }

    struct scheduled_activity {
        std::string id;
        std::optional<std::string> place_id;
        activity_type type{activity_type::sightseeing};
        std::string name;
        std::string description;
        helpers::timestamp start_time;
        helpers::timestamp end_time;
        double estimated_cost{0.0};
        std::optional<coordinates> location;
        bool booking_required{false};
        std::optional<std::string> booking_url;
        std::vector<std::string> notes;
    };

    // Directional leg between two adjacent activities of the same day
    struct travel_segment {
        std::string from_activity_id;
        std::string to_activity_id;
        transport_mode mode{transport_mode::walking};
        int duration_minutes{0};
        double cost{0.0};
        std::string instructions;
    };

    struct day_itinerary {
        helpers::date day_date;
        int day_number{1};
        std::optional<std::string> theme;
        std::vector<scheduled_activity> activities;
        std::vector<travel_segment> travel_segments;
        double total_estimated_cost{0.0};
        std::vector<std::string> key_highlights;
        std::optional<std::string> weather_note;
    };

    struct budget_tracker {
        double total_estimated_cost{0.0};
        bool is_over_budget{false};
    };

    using cost_breakdown = std::map<std::string, double>;

    struct trip_itinerary {
        std::string destination;
        helpers::date start_date;
        helpers::date end_date;
        int total_days{0};
        std::vector<day_itinerary> daily_itineraries;
        place accommodation;
        std::vector<scheduled_activity> accommodation_plan;
        double total_estimated_cost{0.0};
        cost_breakdown budget_breakdown;
        budget_tracker budget;
        int planning_attempts{1};
    };
}
