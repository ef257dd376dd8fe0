#pragma once

#include <array>
#include <cstddef>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include "../helpers/debug.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "../services/content_generation.hpp"
#include "../services/generation_types.hpp"
#include "errors.hpp"

namespace itinera::planner {

    inline constexpr std::array<const char*, 7> fallback_themes = {
        "Historic City Center", "Museums & Culture", "Local Neighborhoods",
        "Nature & Parks", "Food & Markets", "Hidden Gems", "Relaxation Day"
    };

    inline std::vector<std::string> fallback_theme_rotation(int total_days) {
        std::vector<std::string> themes;
        for (int i = 0; i < total_days; ++i) {
            themes.emplace_back(fallback_themes[static_cast<std::size_t>(i) % fallback_themes.size()]);
        }
        return themes;
    }

    // Pads a short list with "Exploration Day N" and cuts a long one
    inline void fit_theme_count(std::vector<std::string>& themes, int total_days) {
        const auto wanted = static_cast<std::size_t>(total_days);
        for (auto i = themes.size(); i < wanted; ++i) {
            themes.push_back(std::format("Exploration Day {}", i + 1));
        }
        themes.resize(wanted);
    }

    inline std::string themes_context(const models::trip_request& trip, std::size_t place_count) {
        return std::format(
            "Plan {} daily themes for a trip to {}.\n\n"
            "Trip details:\n{}\n"
            "Available places: {} locations\n\n"
            "Create logical themes that:\n"
            "1. Group related activities/areas together\n"
            "2. Consider travel logistics (don't zigzag across the city)\n"
            "3. Balance must-see attractions with interests\n"
            "4. Account for opening hours and booking requirements\n\n"
            "Return only a list of theme names, one per day.",
            trip.total_days(), trip.destination, trip.format_for_llm(), place_count);
    }

    /**
     * One theme per trip day. Generation failures are not fatal here: the
     * fixed rotation stands in for the collaborator.
     */
    inline std::vector<std::string> generate_daily_themes(services::content_generation_service& service,
                                                          const models::trip_request& trip,
                                                          const std::vector<models::place>& places,
                                                          const services::retry_policy& policy) {
        const int total_days = trip.total_days();
        try {
            auto themes = services::generate_structured<services::daily_themes>(
                service, "daily_themes", themes_context(trip, places.size()),
                services::daily_themes::schema(), policy);
            fit_theme_count(themes.list, total_days);
            THEME_INFO_FMT("Generated {} daily themes", themes.list.size());
            return themes.list;
        } catch (const collaborator_failure& e) {
            THEME_WARN_FMT("Using fallback themes: {}", e.what());
            return fallback_theme_rotation(total_days);
        }
    }
}
