#pragma once

#include <string>
#include <vector>

#include <glaze/glaze.hpp>

#include "content_generation.hpp"

namespace itinera::services {

    struct daily_themes {
        std::vector<std::string> list;

        struct glaze {
            using T = daily_themes;
            static constexpr auto value = glz::object(
                "list", &T::list
            );
        };

        static output_schema schema() {
            return {"DailyThemes", R"({"type":"object","properties":{"list":{"type":"array","items":{"type":"string"}}},"required":["list"]})"};
        }
    };

    struct activity_schedule {
        std::string place_id;
        std::string start_time; // HH:MM
        double duration_hours{0.0};

        struct glaze {
            using T = activity_schedule;
            static constexpr auto value = glz::object(
                "place_id", &T::place_id,
                "start_time", &T::start_time,
                "duration_hours", &T::duration_hours
            );
        };
    };

    struct daily_activities {
        std::vector<activity_schedule> activities;

        struct glaze {
            using T = daily_activities;
            static constexpr auto value = glz::object(
                "activities", &T::activities
            );
        };

        static output_schema schema() {
            return {"DailyActivities",
                    R"({"type":"object","properties":{"activities":{"type":"array","items":{"type":"object",)"
                    R"("properties":{"place_id":{"type":"string"},"start_time":{"type":"string","description":"HH:MM"},)"
                    R"("duration_hours":{"type":"number"}},"required":["place_id","start_time","duration_hours"]}}},)"
                    R"("required":["activities"]})"};
        }
    };

    struct travel_segment_options {
        double average_public_transport_fare{2.5};
        double base_taxi_fare{1.5};

        struct glaze {
            using T = travel_segment_options;
            static constexpr auto value = glz::object(
                "average_public_transport_fare", &T::average_public_transport_fare,
                "base_taxi_fare", &T::base_taxi_fare
            );
        };

        static output_schema schema() {
            return {"TravelSegmentOptions",
                    R"({"type":"object","properties":{"average_public_transport_fare":{"type":"number"},)"
                    R"("base_taxi_fare":{"type":"number"}},"required":["average_public_transport_fare","base_taxi_fare"]})"};
        }
    };
}
