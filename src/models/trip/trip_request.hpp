#pragma once

#include <chrono>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include "../../helpers/string_helper.hpp"
#include "../../helpers/time_helper.hpp"

namespace itinera::models {

    enum class trip_type {
        solo,
        couple,
        friends,
        group
    };

    inline std::string trip_type_to_string(trip_type t) {
        switch (t) {
            case trip_type::solo: return "solo";
            case trip_type::couple: return "couple";
            case trip_type::friends: return "friends";
            case trip_type::group: return "group";
        }
        return "unknown";
    }

    inline std::optional<trip_type> string_to_trip_type(const std::string& s) {
        auto lowered = helpers::StringHelper::to_lower(s);
        if (lowered == "solo") return trip_type::solo;
        if (lowered == "couple") return trip_type::couple;
        if (lowered == "friends") return trip_type::friends;
        if (lowered == "group") return trip_type::group;
        return std::nullopt;
    }

    // What the traveler asked for. Budget is the total for the whole group.
    struct trip_request {
        std::string destination;
        helpers::date start_date;
        helpers::date end_date;
        double budget{0.0};
        int travelers{1};
        models::trip_type type{trip_type::solo};
        std::vector<std::string> interests;

        int total_nights() const {
            return static_cast<int>((end_date - start_date).count());
        }

        int total_days() const {
            return total_nights() + 1;
        }

        std::string format_interests() const {
            std::string out;
            for (const auto& interest : interests) {
                if (!out.empty()) out += ", ";
                out += interest;
            }
            return out;
        }

        // Short description handed to the content-generation collaborator
        std::string format_for_llm() const {
            return std::format(
                "- Destination: {}\n"
                "- Duration: {} days ({} to {})\n"
                "- Budget: {:.2f} EUR in total\n"
                "- Group: {} travelers - '{}' trip\n"
                "- Interests: {}\n",
                destination, total_days(),
                helpers::time_helper::format_date(start_date),
                helpers::time_helper::format_date(end_date),
                budget, travelers, trip_type_to_string(type), format_interests());
        }
    };
}
