#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "../../helpers/string_helper.hpp"
#include "../../helpers/time_helper.hpp"
#include "../geo/coordinates.hpp"

namespace itinera::models {

    enum class priority {
        essential,
        high,
        medium,
        low
    };

    enum class booking_type {
        required,
        recommended,
        none
    };

    inline std::string priority_to_string(priority p) {
        switch (p) {
            case priority::essential: return "Essential";
            case priority::high: return "High";
            case priority::medium: return "Medium";
            case priority::low: return "Low";
        }
        return "Unknown";
    }

    inline std::optional<priority> string_to_priority(const std::string& s) {
        if (s == "Essential") return priority::essential;
        if (s == "High") return priority::high;
        if (s == "Medium") return priority::medium;
        if (s == "Low") return priority::low;
        return std::nullopt;
    }

    inline std::optional<booking_type> string_to_booking_type(const std::string& s) {
        if (s == "Required") return booking_type::required;
        if (s == "Recommended") return booking_type::recommended;
        if (s == "None") return booking_type::none;
        return std::nullopt;
    }

    struct landmark {};

    struct establishment {
        double average_price{0.0};
        std::string establishment_type; // Restaurant, Cafe, Bar, Pub, ...
    };

    struct event {
        helpers::timestamp date_and_time;
        std::vector<double> price_options;
    };

    // Prices are nightly and per room.
    struct accommodation {
        std::vector<double> price_options;
    };

    using place_details = std::variant<landmark, establishment, event, accommodation>;

    enum class place_kind {
        landmark,
        establishment,
        event,
        accommodation
    };

    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };

    inline double min_price(const std::vector<double>& options) {
        return options.empty() ? 0.0 : *std::min_element(options.begin(), options.end());
    }

    // A candidate point of interest produced by discovery. Read-only for the planner.
    struct place {
        std::string id;
        std::string name;
        std::optional<coordinates> location;
        models::priority priority{models::priority::medium};
        std::string reason_to_go;
        std::optional<std::string> website;
        models::booking_type booking{models::booking_type::none};
        double typical_hours_of_stay{0.0};
        bool weather_dependent{false};
        std::map<std::string, std::string> opening_schedule; // empty means open 24/7
        place_details details;

        place_kind kind() const {
            return std::visit(overloaded{
                [](const landmark&) { return place_kind::landmark; },
                [](const establishment&) { return place_kind::establishment; },
                [](const event&) { return place_kind::event; },
                [](const accommodation&) { return place_kind::accommodation; },
            }, details);
        }

        bool is(place_kind k) const { return kind() == k; }

        template <typename T>
        const T* as() const { return std::get_if<T>(&details); }

        bool booking_required() const { return booking == booking_type::required; }

        // "{name} {reason}" lower-cased, the text all keyword matching runs on
        std::string search_text() const {
            return helpers::StringHelper::to_lower(name + " " + reason_to_go);
        }
    };

    /**
     * Estimated per-person cost of visiting a place, assuming the cheapest option.
     * Accommodation is priced separately by the accommodation plan, so it counts as free here.
     */
    inline double estimate_place_cost(const place& p) {
        return std::visit(overloaded{
            [](const landmark&) { return 0.0; },
            [](const establishment& e) { return e.average_price; },
            [](const event& e) { return min_price(e.price_options); },
            [](const accommodation&) { return 0.0; },
        }, p.details);
    }

    inline std::string place_kind_to_string(place_kind k) {
        switch (k) {
            case place_kind::landmark: return "Landmark";
            case place_kind::establishment: return "Establishment";
            case place_kind::event: return "Event";
            case place_kind::accommodation: return "Accommodation";
        }
        return "Unknown";
    }
}

