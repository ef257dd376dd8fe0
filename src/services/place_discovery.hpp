#pragma once

#include <array>
#include <future>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "../helpers/debug.hpp"
#include "../io/itinerary_json.hpp"
#include "../io/wire.hpp"
#include "../models/places/place.hpp"
#include "../planner/trip_validation.hpp"

namespace itinera::services {

    constexpr double default_search_radius_km = 10.0;

    // Source of candidate places around a destination, one category at a time
    class place_discovery_service {
    public:
        virtual ~place_discovery_service() = default;

        virtual std::vector<models::place> discover(const std::string& destination,
                                                    models::place_kind kind,
                                                    double radius_km) const = 0;
    };

    /**
     * Discovery over a fixed JSON catalog. The destination and radius are
     * not used for filtering: the catalog is assumed to describe the
     * destination already.
     */
    class catalog_place_discovery : public place_discovery_service {
    public:
        explicit catalog_place_discovery(io::catalog_wire catalog) : catalog_(std::move(catalog)) {}

        static catalog_place_discovery from_json(const std::string& json) {
            return catalog_place_discovery(io::parse_catalog(json));
        }

        std::vector<models::place> discover(const std::string& destination,
                                            models::place_kind kind,
                                            double radius_km) const override {
            const auto& entries = entries_for(kind);
            std::vector<models::place> places;
            places.reserve(entries.size());
            for (const auto& entry : entries) {
                places.push_back(io::to_place(entry, kind));
            }
            DISCOVERY_DEBUG_FMT("{} {} entries for {} within {:.1f} km",
                                places.size(), models::place_kind_to_string(kind), destination, radius_km);
            return places;
        }

    private:
        const std::vector<io::place_wire>& entries_for(models::place_kind kind) const {
            switch (kind) {
                case models::place_kind::landmark: return catalog_.landmarks;
                case models::place_kind::establishment: return catalog_.establishments;
                case models::place_kind::event: return catalog_.events;
                case models::place_kind::accommodation: return catalog_.accommodations;
            }
            return catalog_.landmarks;
        }

        io::catalog_wire catalog_;
    };

    /**
     * Runs the four category lookups concurrently and concatenates them as
     * landmarks, establishments, events, accommodations. The first failing
     * lookup's exception propagates once every lookup has finished.
     */
    inline std::vector<models::place> discover_all(const place_discovery_service& discovery,
                                                   const std::string& destination,
                                                   double radius_km = default_search_radius_km) {
        constexpr std::array kinds{
            models::place_kind::landmark,
            models::place_kind::establishment,
            models::place_kind::event,
            models::place_kind::accommodation,
        };

        std::vector<std::future<std::vector<models::place>>> lookups;
        for (auto kind : kinds) {
            lookups.push_back(std::async(std::launch::async, [&discovery, &destination, kind, radius_km]() {
                return discovery.discover(destination, kind, radius_km);
            }));
        }

        for (auto& lookup : lookups) {
            lookup.wait();
        }

        std::vector<models::place> places;
        for (auto& lookup : lookups) {
            auto batch = lookup.get();
            places.insert(places.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
        }

        planner::validate_places(places);
        DISCOVERY_INFO_FMT("Discovered {} places for {}", places.size(), destination);
        return places;
    }
}
