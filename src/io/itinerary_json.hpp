#pragma once

#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glaze/glaze.hpp>

#include "../helpers/time_helper.hpp"
#include "../models/itinerary/itinerary.hpp"
#include "../models/places/place.hpp"
#include "../models/trip/trip_request.hpp"
#include "../planner/errors.hpp"
#include "wire.hpp"

namespace itinera::io {

    inline std::string read_text_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            throw planner::input_invalid(std::format("Cannot open {}", path.string()));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    template <typename T>
    T read_document(const std::string& json, std::string_view what) {
        T value{};
        auto error = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (error) {
            throw planner::input_invalid(std::format("Malformed {}: {}", what, glz::format_error(error, json)));
        }
        return value;
    }

    inline models::trip_request to_trip_request(const trip_request_wire& wire) {
        auto type = models::string_to_trip_type(wire.trip_type);
        if (!type) {
            throw planner::input_invalid(std::format("Unknown trip type '{}'", wire.trip_type));
        }
        try {
            return models::trip_request{
                wire.destination,
                helpers::time_helper::parse_date(wire.start_date),
                helpers::time_helper::parse_date(wire.end_date),
                wire.budget,
                wire.travelers,
                *type,
                wire.interests
            };
        } catch (const std::invalid_argument& e) {
            throw planner::input_invalid(e.what());
        }
    }

    inline models::trip_request parse_trip_request(const std::string& json) {
        return to_trip_request(read_document<trip_request_wire>(json, "trip request"));
    }

    inline models::place to_place(const place_wire& wire, models::place_kind kind) {
        models::place p;
        p.id = wire.id;
        p.name = wire.name;
        p.reason_to_go = wire.reason_to_go;
        p.website = wire.website;
        p.typical_hours_of_stay = wire.typical_hours_of_stay;
        p.weather_dependent = wire.weather_dependent;
        p.opening_schedule = wire.opening_schedule;

        auto priority = models::string_to_priority(wire.priority);
        if (!priority) {
            throw planner::input_invalid(std::format("Place '{}' has unknown priority '{}'", wire.id, wire.priority));
        }
        p.priority = *priority;

        auto booking = models::string_to_booking_type(wire.booking_type);
        if (!booking) {
            throw planner::input_invalid(std::format("Place '{}' has unknown booking type '{}'", wire.id, wire.booking_type));
        }
        p.booking = *booking;

        try {
            if (wire.coordinates) {
                p.location = models::coordinates::make(wire.coordinates->latitude, wire.coordinates->longitude);
            }

            switch (kind) {
                case models::place_kind::landmark:
                    p.details = models::landmark{};
                    break;
                case models::place_kind::establishment:
                    p.details = models::establishment{wire.average_price, wire.establishment_type};
                    break;
                case models::place_kind::event:
                    if (!wire.date_and_time) {
                        throw planner::input_invalid(std::format("Event '{}' has no date_and_time", wire.id));
                    }
                    p.details = models::event{helpers::time_helper::parse_timestamp(*wire.date_and_time), wire.price_options};
                    break;
                case models::place_kind::accommodation:
                    if (wire.price_options.empty()) {
                        throw planner::input_invalid(std::format("Accommodation '{}' has no price options", wire.id));
                    }
                    p.details = models::accommodation{wire.price_options};
                    break;
            }
        } catch (const std::invalid_argument& e) {
            throw planner::input_invalid(std::format("Place '{}': {}", wire.id, e.what()));
        }
        return p;
    }

    inline catalog_wire parse_catalog(const std::string& json) {
        return read_document<catalog_wire>(json, "place catalog");
    }

    inline std::optional<coordinates_wire> to_wire(const std::optional<models::coordinates>& c) {
        if (!c) return std::nullopt;
        return coordinates_wire{c->latitude, c->longitude};
    }

    inline activity_wire to_wire(const models::scheduled_activity& a) {
        return activity_wire{
            a.id,
            a.place_id,
            models::activity_type_to_string(a.type),
            a.name,
            a.description,
            helpers::time_helper::format_timestamp(a.start_time),
            helpers::time_helper::format_timestamp(a.end_time),
            a.estimated_cost,
            to_wire(a.location),
            a.booking_required,
            a.booking_url,
            a.notes
        };
    }

    inline trip_itinerary_wire to_wire(const models::trip_itinerary& itinerary) {
        trip_itinerary_wire wire;
        wire.destination = itinerary.destination;
        wire.start_date = helpers::time_helper::format_date(itinerary.start_date);
        wire.end_date = helpers::time_helper::format_date(itinerary.end_date);
        wire.total_days = itinerary.total_days;

        for (const auto& day : itinerary.daily_itineraries) {
            day_itinerary_wire d;
            d.date = helpers::time_helper::format_date(day.day_date);
            d.day_number = day.day_number;
            d.theme = day.theme;
            for (const auto& a : day.activities) {
                d.activities.push_back(to_wire(a));
            }
            for (const auto& s : day.travel_segments) {
                d.travel_segments.push_back({s.from_activity_id, s.to_activity_id,
                                             models::transport_mode_to_string(s.mode),
                                             s.duration_minutes, s.cost, s.instructions});
            }
            d.total_estimated_cost = day.total_estimated_cost;
            d.key_highlights = day.key_highlights;
            d.weather_note = day.weather_note;
            wire.daily_itineraries.push_back(std::move(d));
        }

        const auto& stay = itinerary.accommodation;
        const auto* details = stay.as<models::accommodation>();
        wire.accommodation = accommodation_wire{stay.id, stay.name, to_wire(stay.location), stay.website,
                                                details ? details->price_options : std::vector<double>{}};
        for (const auto& night : itinerary.accommodation_plan) {
            wire.accommodation_plan.push_back(to_wire(night));
        }

        wire.total_estimated_cost = itinerary.total_estimated_cost;
        wire.budget_breakdown = itinerary.budget_breakdown;
        wire.budget = {itinerary.budget.total_estimated_cost, itinerary.budget.is_over_budget};
        wire.planning_attempts = itinerary.planning_attempts;
        return wire;
    }

    inline std::string write_itinerary(const models::trip_itinerary& itinerary) {
        std::string out;
        auto error = glz::write_json(to_wire(itinerary), out);
        if (error) {
            throw std::runtime_error("Failed to serialize itinerary: " + glz::format_error(error));
        }
        return out;
    }
}
