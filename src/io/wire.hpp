#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glaze/glaze.hpp>

// JSON shapes of the documents itinera reads and writes. Dates travel as
// "YYYY-MM-DD" strings and timestamps as "YYYY-MM-DDTHH:MM".
namespace itinera::io {

    struct coordinates_wire {
        double latitude{0.0};
        double longitude{0.0};

        struct glaze {
            using T = coordinates_wire;
            static constexpr auto value = glz::object(
                "latitude", &T::latitude,
                "longitude", &T::longitude
            );
        };
    };

    struct trip_request_wire {
        std::string destination;
        std::string start_date;
        std::string end_date;
        double budget{0.0};
        int travelers{1};
        std::string trip_type{"solo"};
        std::vector<std::string> interests;

        struct glaze {
            using T = trip_request_wire;
            static constexpr auto value = glz::object(
                "destination", &T::destination,
                "start_date", &T::start_date,
                "end_date", &T::end_date,
                "budget", &T::budget,
                "travelers", &T::travelers,
                "trip_type", &T::trip_type,
                "interests", &T::interests
            );
        };
    };

    // One catalog entry; the array it sits in decides the kind
    struct place_wire {
        std::string id;
        std::string name;
        std::optional<coordinates_wire> coordinates;
        std::string priority{"Medium"};
        std::string reason_to_go;
        std::optional<std::string> website;
        std::string booking_type{"None"};
        double typical_hours_of_stay{0.0};
        bool weather_dependent{false};
        std::map<std::string, std::string> opening_schedule;

        // Establishment
        double average_price{0.0};
        std::string establishment_type;

        // Event
        std::optional<std::string> date_and_time;

        // Event and accommodation
        std::vector<double> price_options;

        struct glaze {
            using T = place_wire;
            static constexpr auto value = glz::object(
                "id", &T::id,
                "name", &T::name,
                "coordinates", &T::coordinates,
                "priority", &T::priority,
                "reason_to_go", &T::reason_to_go,
                "website", &T::website,
                "booking_type", &T::booking_type,
                "typical_hours_of_stay", &T::typical_hours_of_stay,
                "weather_dependent", &T::weather_dependent,
                "opening_schedule", &T::opening_schedule,
                "average_price", &T::average_price,
                "establishment_type", &T::establishment_type,
                "date_and_time", &T::date_and_time,
                "price_options", &T::price_options
            );
        };
    };

    struct catalog_wire {
        std::vector<place_wire> landmarks;
        std::vector<place_wire> establishments;
        std::vector<place_wire> events;
        std::vector<place_wire> accommodations;

        struct glaze {
            using T = catalog_wire;
            static constexpr auto value = glz::object(
                "landmarks", &T::landmarks,
                "establishments", &T::establishments,
                "events", &T::events,
                "accommodations", &T::accommodations
            );
        };
    };

    struct activity_wire {
        std::string id;
        std::optional<std::string> place_id;
        std::string activity_type;
        std::string name;
        std::string description;
        std::string start_time;
        std::string end_time;
        double estimated_cost{0.0};
        std::optional<coordinates_wire> coordinates;
        bool booking_required{false};
        std::optional<std::string> booking_url;
        std::vector<std::string> notes;

        struct glaze {
            using T = activity_wire;
            static constexpr auto value = glz::object(
                "id", &T::id,
                "place_id", &T::place_id,
                "activity_type", &T::activity_type,
                "name", &T::name,
                "description", &T::description,
                "start_time", &T::start_time,
                "end_time", &T::end_time,
                "estimated_cost", &T::estimated_cost,
                "coordinates", &T::coordinates,
                "booking_required", &T::booking_required,
                "booking_url", &T::booking_url,
                "notes", &T::notes
            );
        };
    };

    struct travel_segment_wire {
        std::string from_activity_id;
        std::string to_activity_id;
        std::string transport_mode;
        int duration_minutes{0};
        double cost{0.0};
        std::string instructions;

        struct glaze {
            using T = travel_segment_wire;
            static constexpr auto value = glz::object(
                "from_activity_id", &T::from_activity_id,
                "to_activity_id", &T::to_activity_id,
                "transport_mode", &T::transport_mode,
                "duration_minutes", &T::duration_minutes,
                "cost", &T::cost,
                "instructions", &T::instructions
            );
        };
    };

    struct day_itinerary_wire {
        std::string date;
        int day_number{1};
        std::optional<std::string> theme;
        std::vector<activity_wire> activities;
        std::vector<travel_segment_wire> travel_segments;
        double total_estimated_cost{0.0};
        std::vector<std::string> key_highlights;
        std::optional<std::string> weather_note;

        struct glaze {
            using T = day_itinerary_wire;
            static constexpr auto value = glz::object(
                "date", &T::date,
                "day_number", &T::day_number,
                "theme", &T::theme,
                "activities", &T::activities,
                "travel_segments", &T::travel_segments,
                "total_estimated_cost", &T::total_estimated_cost,
                "key_highlights", &T::key_highlights,
                "weather_note", &T::weather_note
            );
        };
    };

    struct budget_tracker_wire {
        double total_estimated_cost{0.0};
        bool is_over_budget{false};

        struct glaze {
            using T = budget_tracker_wire;
            static constexpr auto value = glz::object(
                "total_estimated_cost", &T::total_estimated_cost,
                "is_over_budget", &T::is_over_budget
            );
        };
    };

    struct accommodation_wire {
        std::string id;
        std::string name;
        std::optional<coordinates_wire> coordinates;
        std::optional<std::string> website;
        std::vector<double> price_options;

        struct glaze {
            using T = accommodation_wire;
            static constexpr auto value = glz::object(
                "id", &T::id,
                "name", &T::name,
                "coordinates", &T::coordinates,
                "website", &T::website,
                "price_options", &T::price_options
            );
        };
    };

    struct trip_itinerary_wire {
        std::string destination;
        std::string start_date;
        std::string end_date;
        int total_days{0};
        std::vector<day_itinerary_wire> daily_itineraries;
        accommodation_wire accommodation;
        std::vector<activity_wire> accommodation_plan;
        double total_estimated_cost{0.0};
        std::map<std::string, double> budget_breakdown;
        budget_tracker_wire budget;
        int planning_attempts{1};

        struct glaze {
            using T = trip_itinerary_wire;
            static constexpr auto value = glz::object(
                "destination", &T::destination,
                "start_date", &T::start_date,
                "end_date", &T::end_date,
                "total_days", &T::total_days,
                "daily_itineraries", &T::daily_itineraries,
                "accommodation", &T::accommodation,
                "accommodation_plan", &T::accommodation_plan,
                "total_estimated_cost", &T::total_estimated_cost,
                "budget_breakdown", &T::budget_breakdown,
                "budget", &T::budget,
                "planning_attempts", &T::planning_attempts
            );
        };
    };
}
