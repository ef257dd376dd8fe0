#include <gtest/gtest.h>

#include <initializer_list>
#include <vector>

#include "planner/budget.hpp"
#include "test_places.hpp"

using namespace itinera;
using namespace itinera::test_support;

namespace {

std::vector<models::day_itinerary> days_costing(std::initializer_list<double> totals) {
    std::vector<models::day_itinerary> days;
    int n = 1;
    for (double total : totals) {
        models::day_itinerary d;
        d.day_number = n++;
        d.total_estimated_cost = total;
        days.push_back(d);
    }
    return days;
}

models::scheduled_activity costing(models::activity_type type, double cost) {
    models::scheduled_activity a;
    a.type = type;
    a.estimated_cost = cost;
    return a;
}

}

TEST(BudgetValidator, WithinBudget) {
    auto trip = make_trip(3, 400.0, 2);
    auto tracker = planner::validate_budget(trip, days_costing({100.0, 150.0, 90.0}));

    EXPECT_DOUBLE_EQ(tracker.total_estimated_cost, 340.0);
    EXPECT_FALSE(tracker.is_over_budget);
}

TEST(BudgetValidator, OverBudget) {
    auto trip = make_trip(3, 300.0, 2);
    auto tracker = planner::validate_budget(trip, days_costing({100.0, 150.0, 90.0}));

    EXPECT_DOUBLE_EQ(tracker.total_estimated_cost, 340.0);
    EXPECT_TRUE(tracker.is_over_budget);
}

TEST(BudgetValidator, ExactlyOnBudgetIsNotOver) {
    auto trip = make_trip(3, 340.0, 2);
    EXPECT_FALSE(planner::validate_budget(trip, days_costing({100.0, 150.0, 90.0})).is_over_budget);
}

TEST(BudgetBreakdown, ScalesPerPersonCategoriesByTravelers) {
    auto hotel = make_accommodation("hotel", "Hotel Artemide", {120.0, 80.0});

    models::day_itinerary d;
    d.activities = {
        costing(models::activity_type::dining, 20.0),
        costing(models::activity_type::event, 30.0),
        costing(models::activity_type::sightseeing, 10.0),
    };
    models::travel_segment bus;
    bus.cost = 2.5;
    d.travel_segments = {bus};

    auto breakdown = planner::create_budget_breakdown(hotel, {d}, 2, 2);

    EXPECT_DOUBLE_EQ(breakdown.at("accommodation"), 80.0 * 2 * 2);
    EXPECT_DOUBLE_EQ(breakdown.at("dining"), 40.0);
    EXPECT_DOUBLE_EQ(breakdown.at("events"), 60.0);
    EXPECT_DOUBLE_EQ(breakdown.at("attractions"), 10.0);
    EXPECT_DOUBLE_EQ(breakdown.at("transportation"), 2.5);
    EXPECT_DOUBLE_EQ(breakdown.at("total"), 320.0 + 40.0 + 60.0 + 10.0 + 2.5);
}
