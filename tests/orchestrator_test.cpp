#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <vector>

#include "fakes/scripted_content_service.hpp"
#include "planner/errors.hpp"
#include "planner/orchestrator.hpp"
#include "test_places.hpp"

using namespace itinera;
using namespace itinera::test_support;

namespace {

const auto today = day(2030, 1, 1);

std::vector<std::string> ids_of(const std::vector<models::place>& places) {
    std::vector<std::string> ids;
    for (const auto& p : places) {
        ids.push_back(p.id);
    }
    return ids;
}

// Six free sights a few hundred metres apart, two pricey essential restaurants, one hotel
std::vector<models::place> city_with_expensive_dinners() {
    std::vector<models::place> places;
    for (int i = 0; i < 6; ++i) {
        places.push_back(make_landmark(std::format("sight{}", i), std::format("Old sight {}", i),
                                       models::priority::high, models::coordinates{41.900 + 0.002 * i, 12.480},
                                       "Ancient ruins"));
    }
    places.push_back(make_establishment("dinner1", "Chef's table", 150.0, models::priority::essential,
                                        models::coordinates{41.901, 12.481}));
    places.push_back(make_establishment("dinner2", "Rooftop", 150.0, models::priority::essential,
                                        models::coordinates{41.903, 12.481}));
    places.push_back(make_accommodation("hotel", "Hotel", {50.0}));
    return places;
}

}

TEST(Orchestrator, BuildsACompleteItinerary) {
    auto trip = make_trip(3, 2000.0, 2);
    auto places = city_with_expensive_dinners();

    scripted_content_service service;
    service.queue("DailyThemes", R"({"list":["Historic Rome","Food & Markets","Local Neighborhoods"]})");
    service.queue("TravelSegmentOptions", R"({"average_public_transport_fare":1.5,"base_taxi_fare":3.0})");
    service.on("DailyActivities", schedule_offered(ids_of(places)));

    planner::itinerary_orchestrator orchestrator(service);
    auto itinerary = orchestrator.build(trip, places, today);

    EXPECT_EQ(itinerary.destination, "Rome");
    EXPECT_EQ(itinerary.total_days, 3);
    ASSERT_EQ(itinerary.daily_itineraries.size(), 3u);
    EXPECT_EQ(itinerary.daily_itineraries[1].theme, "Food & Markets");
    EXPECT_EQ(itinerary.daily_itineraries[2].day_date, trip.start_date + std::chrono::days{2});
    EXPECT_EQ(itinerary.accommodation.id, "hotel");
    EXPECT_EQ(itinerary.accommodation_plan.size(), 2u);
    EXPECT_EQ(itinerary.planning_attempts, 1);
    EXPECT_FALSE(itinerary.budget.is_over_budget);
    EXPECT_TRUE(itinerary.budget_breakdown.contains("total"));
    EXPECT_DOUBLE_EQ(itinerary.budget_breakdown.at("accommodation"), 50.0 * 2 * 2);

    double total = 0.0;
    for (const auto& d : itinerary.daily_itineraries) {
        EXPECT_FALSE(d.activities.empty());
        EXPECT_TRUE(std::is_sorted(d.activities.begin(), d.activities.end(),
                                   [](const auto& a, const auto& b) { return a.start_time < b.start_time; }));
        EXPECT_LE(d.key_highlights.size(), 3u);
        total += d.total_estimated_cost;
        for (const auto& a : d.activities) {
            EXPECT_NE(a.type, models::activity_type::accommodation);
        }
    }
    EXPECT_DOUBLE_EQ(itinerary.total_estimated_cost, total);
}

TEST(Orchestrator, ReplansWithASmallerDailyTarget) {
    // 300 for one traveler cannot pay 150 restaurants every day
    auto trip = make_trip(3, 300.0, 1);
    auto places = city_with_expensive_dinners();

    scripted_content_service service;
    service.on("DailyActivities", schedule_offered(ids_of(places)));

    planner::itinerary_orchestrator orchestrator(service);
    auto itinerary = orchestrator.build(trip, places, today);

    EXPECT_EQ(itinerary.planning_attempts, 2);
    EXPECT_FALSE(itinerary.budget.is_over_budget);

    // Three days on the first pass, three on the replan
    const auto& contexts = service.contexts("DailyActivities");
    ASSERT_EQ(contexts.size(), 6u);
    EXPECT_NE(contexts[0].find("dinner1"), std::string::npos);
    for (std::size_t i = 3; i < contexts.size(); ++i) {
        EXPECT_EQ(contexts[i].find("dinner1"), std::string::npos);
        EXPECT_NE(contexts[i].find("over budget"), std::string::npos);
    }
}

TEST(Orchestrator, AcceptsTheCheapestPlanWhenReplansRunOut) {
    // Sights 11 km apart: every day pays for taxis the budget cannot cover
    auto trip = make_trip(3, 10.0, 1);
    std::vector<models::place> places;
    for (int i = 0; i < 6; ++i) {
        places.push_back(make_landmark(std::format("far{}", i), std::format("Far {}", i), models::priority::high,
                                       models::coordinates{41.5 + 0.1 * i, 12.5}));
    }
    places.push_back(make_accommodation("hotel", "Hotel", {50.0}));

    scripted_content_service service;
    service.on("DailyActivities", schedule_offered(ids_of(places)));

    planner::planner_options options;
    options.max_replan_attempts = 2;
    planner::itinerary_orchestrator orchestrator(service, options);
    auto itinerary = orchestrator.build(trip, places, today);

    EXPECT_EQ(itinerary.planning_attempts, 3);
    EXPECT_TRUE(itinerary.budget.is_over_budget);
    EXPECT_GT(itinerary.total_estimated_cost, trip.budget);
}

TEST(Orchestrator, StrictBudgetFailsInsteadOfAccepting) {
    auto trip = make_trip(3, 10.0, 1);
    std::vector<models::place> places;
    for (int i = 0; i < 6; ++i) {
        places.push_back(make_landmark(std::format("far{}", i), std::format("Far {}", i), models::priority::high,
                                       models::coordinates{41.5 + 0.1 * i, 12.5}));
    }
    places.push_back(make_accommodation("hotel", "Hotel", {50.0}));

    scripted_content_service service;
    service.on("DailyActivities", schedule_offered(ids_of(places)));

    planner::planner_options options;
    options.max_replan_attempts = 0;
    options.fail_when_over_budget = true;
    planner::itinerary_orchestrator orchestrator(service, options);

    try {
        orchestrator.build(trip, places, today);
        FAIL() << "expected build_failure";
    } catch (const planner::build_failure& e) {
        EXPECT_EQ(e.stage(), planner::build_stage::validate_budget);
        EXPECT_NE(std::string(e.what()).find("VALIDATE_BUDGET"), std::string::npos);
    }
}

TEST(Orchestrator, NoSchedulablePlaceFailsAtFilterPlaces) {
    scripted_content_service service;
    planner::itinerary_orchestrator orchestrator(service);

    try {
        orchestrator.build(make_trip(), {make_accommodation("hotel", "Hotel", {50.0})}, today);
        FAIL() << "expected build_failure";
    } catch (const planner::build_failure& e) {
        EXPECT_EQ(e.stage(), planner::build_stage::filter_places);
    }
}

TEST(Orchestrator, MissingAccommodationFailsAtAllocation) {
    scripted_content_service service;
    planner::itinerary_orchestrator orchestrator(service);

    try {
        orchestrator.build(make_trip(), {make_landmark("a", "A", models::priority::high)}, today);
        FAIL() << "expected build_failure";
    } catch (const planner::build_failure& e) {
        EXPECT_EQ(e.stage(), planner::build_stage::allocate_accommodation);
    }
}

TEST(Orchestrator, CollaboratorFailureFailsAtBuildSchedules) {
    auto places = city_with_expensive_dinners();
    scripted_content_service service;
    planner::itinerary_orchestrator orchestrator(service);

    try {
        orchestrator.build(make_trip(3, 900.0, 2), places, today);
        FAIL() << "expected build_failure";
    } catch (const planner::build_failure& e) {
        EXPECT_EQ(e.stage(), planner::build_stage::build_schedules);
        EXPECT_NE(std::string(e.what()).find("daily_activities"), std::string::npos);
    }
}

TEST(Orchestrator, InvalidRequestIsRejectedBeforePlanning) {
    scripted_content_service service;
    planner::itinerary_orchestrator orchestrator(service);
    auto trip = make_trip();
    trip.budget = -1.0;

    EXPECT_THROW(orchestrator.build(trip, city_with_expensive_dinners(), today), planner::input_invalid);
    EXPECT_EQ(service.calls("DailyThemes"), 0);
}

TEST(Orchestrator, ReplanTargetShrinksToAFloor) {
    auto trip = make_trip(3, 900.0, 2);
    EXPECT_NEAR(planner::itinerary_orchestrator::replan_day_budget(trip, 1), 255.0, 1e-9);
    EXPECT_NEAR(planner::itinerary_orchestrator::replan_day_budget(trip, 5), 75.0, 1e-9);
    EXPECT_NEAR(planner::itinerary_orchestrator::replan_day_budget(trip, 9), 75.0, 1e-9);
}

TEST(Orchestrator, NegativeReplanLimitIsRejected) {
    scripted_content_service service;
    planner::planner_options options;
    options.max_replan_attempts = -1;
    planner::itinerary_orchestrator orchestrator(service, options);

    EXPECT_THROW(orchestrator.build(make_trip(3, 2000.0, 2), city_with_expensive_dinners(), today),
                 planner::input_invalid);
    EXPECT_EQ(service.calls("DailyThemes"), 0);
    EXPECT_EQ(service.calls("DailyActivities"), 0);
}
