#pragma once

#include <format>
#include <optional>
#include <string>

#include "../helpers/debug.hpp"
#include "../models/trip/trip_request.hpp"
#include "../services/content_generation.hpp"
#include "../services/generation_types.hpp"
#include "errors.hpp"

namespace itinera::planner {

    using fare_options = services::travel_segment_options;

    /**
     * Local fares for the destination. Anything unusable falls back to the
     * static defaults so route costing never blocks the build.
     */
    inline fare_options lookup_fares(services::content_generation_service& service,
                                     const models::trip_request& trip,
                                     const services::retry_policy& policy) {
        const auto context = std::format(
            "Estimate local transport fares in EUR for {}: the average single public "
            "transport ticket and the base taxi fare.", trip.destination);
        try {
            auto fares = services::generate_structured<fare_options>(
                service, "travel_segment_options", context, fare_options::schema(), policy,
                [](const fare_options& f) -> std::optional<std::string> {
                    if (f.average_public_transport_fare <= 0.0 || f.base_taxi_fare <= 0.0) {
                        return "fares must be positive";
                    }
                    return std::nullopt;
                });
            ROUTE_INFO_FMT("Fares for {}: public transport {:.2f}, taxi base {:.2f}",
                           trip.destination, fares.average_public_transport_fare, fares.base_taxi_fare);
            return fares;
        } catch (const collaborator_failure& e) {
            ROUTE_INFO_FMT("Using default fares: {}", e.what());
            return fare_options{};
        }
    }
}
