#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "helpers/time_helper.hpp"
#include "planner/activity_factory.hpp"
#include "planner/route_optimizer.hpp"
#include "test_places.hpp"

using namespace itinera;
using namespace itinera::test_support;
using namespace std::chrono_literals;
using itinera::planner::activity_factory;

namespace {

const auto trip_day = day(2030, 5, 10);

helpers::timestamp at(std::chrono::minutes time_of_day) {
    return helpers::time_helper::at(trip_day, time_of_day);
}

std::vector<models::place> line_of_sights() {
    return {
        make_landmark("a", "A", models::priority::high, models::coordinates{41.90, 12.50}),
        make_landmark("c", "C", models::priority::high, models::coordinates{41.92, 12.50}),
        make_landmark("b", "B", models::priority::high, models::coordinates{41.91, 12.50}),
        make_landmark("d", "D", models::priority::high, models::coordinates{41.93, 12.50}),
    };
}

std::vector<models::scheduled_activity> schedule(const std::vector<models::place>& places) {
    std::vector<models::scheduled_activity> activities;
    auto start = at(9h);
    for (const auto& p : places) {
        activities.push_back(activity_factory::from_place(p, "x-" + p.id, start, 1.0));
        start += 3h;
    }
    return activities;
}

std::vector<std::string> place_ids(const std::vector<models::scheduled_activity>& activities) {
    std::vector<std::string> ids;
    for (const auto& a : activities) {
        ids.push_back(a.place_id.value_or("-"));
    }
    return ids;
}

}

TEST(RouteOptimizer, VisitsNearestNeighbourFirst) {
    auto places = line_of_sights();
    auto optimized = planner::optimize_route(schedule(places), places);

    EXPECT_EQ(place_ids(optimized), (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(RouteOptimizer, RetimesBackToBackWithTravelBuffer) {
    auto places = line_of_sights();
    auto optimized = planner::optimize_route(schedule(places), places);

    ASSERT_EQ(optimized.size(), 4u);
    EXPECT_EQ(optimized[0].start_time, at(9h));
    for (std::size_t i = 0; i < optimized.size(); ++i) {
        EXPECT_EQ(optimized[i].end_time - optimized[i].start_time, 2h);
        if (i > 0) {
            EXPECT_EQ(optimized[i].start_time, optimized[i - 1].end_time + planner::travel_buffer);
        }
    }
    EXPECT_EQ(optimized[3].start_time, at(16h + 30min));
}

TEST(RouteOptimizer, FixedActivitiesKeepTheirTimes) {
    auto places = line_of_sights();
    auto activities = schedule(places);

    auto concert = make_event("concert", "Concert", at(13h), {40.0});
    concert.location = models::coordinates{41.95, 12.50};
    activities.push_back(activity_factory::from_place(concert, "x-concert", at(13h)));
    auto unlocated = make_landmark("hidden", "Hidden courtyard", models::priority::low);
    activities.push_back(activity_factory::from_place(unlocated, "x-hidden", at(20h)));

    auto optimized = planner::optimize_route(activities, places);

    ASSERT_EQ(optimized.size(), 6u);
    EXPECT_TRUE(std::is_sorted(optimized.begin(), optimized.end(),
                               [](const auto& x, const auto& y) { return x.start_time < y.start_time; }));
    auto concert_it = std::find_if(optimized.begin(), optimized.end(),
                                   [](const auto& a) { return a.id == "x-concert"; });
    ASSERT_NE(concert_it, optimized.end());
    EXPECT_EQ(concert_it->start_time, at(13h));
    auto hidden_it = std::find_if(optimized.begin(), optimized.end(),
                                  [](const auto& a) { return a.id == "x-hidden"; });
    ASSERT_NE(hidden_it, optimized.end());
    EXPECT_EQ(hidden_it->start_time, at(20h));
}

TEST(RouteOptimizer, LeavesTwoOrFewerUntouched) {
    auto places = line_of_sights();
    places.resize(2);
    auto activities = schedule(places);

    auto optimized = planner::optimize_route(activities, places);

    ASSERT_EQ(optimized.size(), 2u);
    EXPECT_EQ(optimized[0].start_time, activities[0].start_time);
    EXPECT_EQ(optimized[1].start_time, activities[1].start_time);
    EXPECT_EQ(optimized[1].end_time, activities[1].end_time);
}

TEST(RouteOptimizer, RerunningDoesNotLengthenThePath) {
    std::vector<models::place> places{
        make_landmark("p1", "P1", models::priority::high, models::coordinates{41.900, 12.470}),
        make_landmark("p2", "P2", models::priority::high, models::coordinates{41.890, 12.500}),
        make_landmark("p3", "P3", models::priority::high, models::coordinates{41.905, 12.480}),
        make_landmark("p4", "P4", models::priority::high, models::coordinates{41.880, 12.490}),
        make_landmark("p5", "P5", models::priority::high, models::coordinates{41.895, 12.475}),
    };
    auto input = schedule(places);

    auto once = planner::optimize_route(input, places);
    auto twice = planner::optimize_route(once, places);

    EXPECT_LE(planner::route_length_km(once), planner::route_length_km(input));
    EXPECT_LE(planner::route_length_km(twice), planner::route_length_km(once) + 1e-9);
}

TEST(RouteOptimizer, FlagsSchedulesRunningPastMidnight) {
    std::vector<models::place> places{
        make_landmark("a", "A", models::priority::high, models::coordinates{41.90, 12.50}, "", 8.0),
        make_landmark("b", "B", models::priority::high, models::coordinates{41.91, 12.50}, "", 8.0),
        make_landmark("c", "C", models::priority::high, models::coordinates{41.92, 12.50}, "", 8.0),
    };

    auto optimized = planner::optimize_route(schedule(places), places);

    // 09:00-17:00, 17:30-01:30 the next day, 02:00-10:00
    ASSERT_EQ(optimized.size(), 3u);
    EXPECT_EQ(optimized[1].end_time, helpers::time_helper::at(trip_day + std::chrono::days{1}, 1h + 30min));
    EXPECT_TRUE(planner::overruns_day(optimized));
}

TEST(RouteOptimizer, OrdinaryDayDoesNotOverrun) {
    auto places = line_of_sights();
    EXPECT_FALSE(planner::overruns_day(planner::optimize_route(schedule(places), places)));
    EXPECT_FALSE(planner::overruns_day({}));
}
