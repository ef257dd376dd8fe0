#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../models/places/place.hpp"

namespace itinera::planner {

    enum class theme_bucket {
        historic,
        culture,
        food,
        nature,
        local,
        general
    };

    constexpr std::size_t themed_fallback_count = 8;
    constexpr std::size_t max_essential_per_day = 3;
    constexpr std::size_t max_high_per_day = 3;
    constexpr std::size_t max_medium_per_day = 2;

    /**
     * Classify a free-text day theme ("Historic City Center", "Food & Markets")
     * into a keyword bucket. The first bucket whose trigger word appears wins.
     */
    inline theme_bucket classify_theme(std::string_view theme) {
        using helpers::StringHelper;
        const auto lowered = StringHelper::to_lower(theme);

        if (StringHelper::contains_any(lowered, {"historic"})) return theme_bucket::historic;
        if (StringHelper::contains_any(lowered, {"museum", "culture"})) return theme_bucket::culture;
        if (StringHelper::contains_any(lowered, {"food", "market"})) return theme_bucket::food;
        if (StringHelper::contains_any(lowered, {"nature", "park"})) return theme_bucket::nature;
        if (StringHelper::contains_any(lowered, {"neighborhood", "neighbourhood", "local"})) return theme_bucket::local;
        return theme_bucket::general;
    }

    inline bool matches_theme(const models::place& p, theme_bucket bucket) {
        using helpers::StringHelper;
        const auto text = p.search_text();

        switch (bucket) {
            case theme_bucket::historic:
                return StringHelper::contains_any(text, {"historic", "old", "ancient", "cathedral", "palace", "monument"});
            case theme_bucket::culture:
                return StringHelper::contains_any(text, {"museum", "gallery", "art", "cultural", "exhibition"});
            case theme_bucket::food:
                return p.is(models::place_kind::establishment) ||
                       StringHelper::contains_any(text, {"market", "food", "restaurant"});
            case theme_bucket::nature:
                return StringHelper::contains_any(text, {"park", "garden", "nature", "outdoor", "beach", "mountain"});
            case theme_bucket::local:
                return StringHelper::contains_any(text, {"neighborhood", "neighbourhood", "local", "district", "quarter"});
            case theme_bucket::general:
                return true;
        }
        return true;
    }

    /**
     * Picks the places for one day: theme matches first, then at most
     * 3 essential + 3 high + 2 medium of them in arrival order. Never returns
     * an empty set for a non-empty input.
     */
    inline std::vector<models::place> assign_places_to_day(const std::vector<models::place>& places,
                                                           std::string_view theme,
                                                           int day_number) {
        if (places.empty()) {
            return {};
        }

        const auto bucket = classify_theme(theme);
        std::vector<models::place> day_places;
        std::copy_if(places.begin(), places.end(), std::back_inserter(day_places),
                     [bucket](const auto& p) { return matches_theme(p, bucket); });

        THEME_DEBUG_FMT("{} places match theme '{}' for day {}", day_places.size(), theme, day_number);

        if (day_places.empty()) {
            const auto count = std::min(themed_fallback_count, places.size());
            day_places.assign(places.begin(), places.begin() + static_cast<std::ptrdiff_t>(count));
            THEME_WARN_FMT("No place matches theme '{}' for day {}, taking the first {}", theme, day_number, count);
        }

        std::vector<models::place> selected;
        auto take = [&](models::priority p, std::size_t limit) {
            std::size_t taken = 0;
            for (const auto& place : day_places) {
                if (taken == limit) break;
                if (place.priority == p) {
                    selected.push_back(place);
                    ++taken;
                }
            }
        };
        take(models::priority::essential, max_essential_per_day);
        take(models::priority::high, max_high_per_day);
        take(models::priority::medium, max_medium_per_day);

        if (selected.empty()) {
            // Only low-priority places matched; keep a few rather than starve the day
            const auto count = std::min(themed_fallback_count, day_places.size());
            selected.assign(day_places.begin(), day_places.begin() + static_cast<std::ptrdiff_t>(count));
            THEME_WARN_FMT("Day {} has only low-priority candidates, keeping {}", day_number, count);
        }

        THEME_INFO_FMT("Assigned {} places to day {} ('{}')", selected.size(), day_number, theme);
        return selected;
    }
}
