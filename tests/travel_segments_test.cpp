#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "helpers/time_helper.hpp"
#include "planner/travel_segments.hpp"
#include "test_places.hpp"

using namespace itinera;
using namespace itinera::test_support;
using namespace std::chrono_literals;

namespace {

models::scheduled_activity stop(const std::string& id, const std::string& name,
                                std::optional<models::coordinates> location,
                                std::chrono::minutes start) {
    models::scheduled_activity a;
    a.id = id;
    a.name = name;
    a.location = location;
    a.start_time = helpers::time_helper::at(day(2030, 5, 10), start);
    a.end_time = a.start_time + 1h;
    return a;
}

// Latitude offsets of roughly 0.4, 2 and 10 km
const models::coordinates origin{41.9000, 12.5000};
const models::coordinates near_by{41.9036, 12.5000};
const models::coordinates across_town{41.9180, 12.5000};
const models::coordinates far_away{41.9900, 12.5000};

}

TEST(TravelSegments, ShortHopsAreWalked) {
    auto segment = planner::classify_travel_segment(stop("a", "Start", origin, 9h),
                                                    stop("b", "Trevi Fountain", near_by, 11h));

    EXPECT_EQ(segment.mode, models::transport_mode::walking);
    EXPECT_DOUBLE_EQ(segment.cost, 0.0);
    EXPECT_EQ(segment.duration_minutes, 5);
    EXPECT_EQ(segment.instructions, "Walk 400m to Trevi Fountain (5 mins)");
    EXPECT_EQ(segment.from_activity_id, "a");
    EXPECT_EQ(segment.to_activity_id, "b");
}

TEST(TravelSegments, MidRangeUsesPublicTransport) {
    auto segment = planner::classify_travel_segment(stop("a", "Start", origin, 9h),
                                                    stop("b", "Vatican", across_town, 11h));

    EXPECT_EQ(segment.mode, models::transport_mode::public_transport);
    EXPECT_DOUBLE_EQ(segment.cost, 2.5);
    EXPECT_EQ(segment.duration_minutes, 16);
    EXPECT_EQ(segment.instructions, "Take public transport to Vatican (16 mins, €2.50)");
}

TEST(TravelSegments, LongDistancesTakeATaxi) {
    auto segment = planner::classify_travel_segment(stop("a", "Start", origin, 9h),
                                                    stop("b", "Ostia", far_away, 11h));

    EXPECT_EQ(segment.mode, models::transport_mode::taxi);
    EXPECT_NEAR(segment.cost, 1.5 + 12.0, 0.05);
    EXPECT_EQ(segment.duration_minutes, 50);
}

TEST(TravelSegments, UsesTheGivenFares) {
    planner::fare_options fares;
    fares.average_public_transport_fare = 1.9;
    fares.base_taxi_fare = 4.0;

    auto bus = planner::classify_travel_segment(stop("a", "Start", origin, 9h),
                                                stop("b", "Vatican", across_town, 11h), fares);
    EXPECT_DOUBLE_EQ(bus.cost, 1.9);

    auto taxi = planner::classify_travel_segment(stop("a", "Start", origin, 9h),
                                                 stop("b", "Ostia", far_away, 11h), fares);
    EXPECT_NEAR(taxi.cost, 4.0 + 12.0, 0.05);
}

TEST(TravelSegments, OnlyBetweenLocatedActivitiesWithDistinctStarts) {
    std::vector<models::scheduled_activity> day{
        stop("a", "A", origin, 9h),
        stop("b", "B", across_town, 11h),
        stop("c", "C", std::nullopt, 13h),
        stop("d", "D", origin, 15h),
        stop("e", "E", near_by, 15h),
        stop("f", "F", far_away, 17h),
    };

    auto segments = planner::calculate_travel_segments(day);

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].from_activity_id, "a");
    EXPECT_EQ(segments[0].to_activity_id, "b");
    EXPECT_EQ(segments[1].from_activity_id, "e");
    EXPECT_EQ(segments[1].to_activity_id, "f");
}
