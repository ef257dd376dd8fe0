#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <vector>

#include "planner/theme_assigner.hpp"
#include "test_places.hpp"

using namespace itinera;
using namespace itinera::test_support;
using itinera::planner::theme_bucket;

TEST(ThemeAssigner, ClassifiesFreeTextThemes) {
    EXPECT_EQ(planner::classify_theme("Historic City Center"), theme_bucket::historic);
    EXPECT_EQ(planner::classify_theme("Museums & Culture"), theme_bucket::culture);
    EXPECT_EQ(planner::classify_theme("Food & Markets"), theme_bucket::food);
    EXPECT_EQ(planner::classify_theme("Nature & Parks"), theme_bucket::nature);
    EXPECT_EQ(planner::classify_theme("Local Neighborhoods"), theme_bucket::local);
    EXPECT_EQ(planner::classify_theme("Relaxation Day"), theme_bucket::general);
}

TEST(ThemeAssigner, FiltersByKeywordsInNameAndReason) {
    std::vector<models::place> places{
        make_landmark("pantheon", "Pantheon", models::priority::essential, std::nullopt, "Ancient temple"),
        make_landmark("borghese", "Villa Borghese", models::priority::high, std::nullopt, "A huge park"),
        make_landmark("cathedral", "St John Cathedral", models::priority::medium),
    };

    auto historic = planner::assign_places_to_day(places, "Historic City Center", 1);
    ASSERT_EQ(historic.size(), 2u);
    EXPECT_EQ(historic[0].id, "pantheon");
    EXPECT_EQ(historic[1].id, "cathedral");

    auto nature = planner::assign_places_to_day(places, "Nature & Parks", 2);
    ASSERT_EQ(nature.size(), 1u);
    EXPECT_EQ(nature[0].id, "borghese");
}

TEST(ThemeAssigner, FoodThemeTakesEveryEstablishment) {
    std::vector<models::place> places{
        make_establishment("bar", "Bar del Fico", 10.0, models::priority::high),
        make_landmark("campo", "Campo de' Fiori", models::priority::high, std::nullopt, "Morning market"),
        make_landmark("forum", "Forum", models::priority::high),
    };

    auto food = planner::assign_places_to_day(places, "Food & Markets", 1);
    ASSERT_EQ(food.size(), 2u);
    EXPECT_EQ(food[0].id, "bar");
    EXPECT_EQ(food[1].id, "campo");
}

TEST(ThemeAssigner, CapsEachPriorityAndDropsLow) {
    std::vector<models::place> places;
    for (int i = 0; i < 5; ++i) {
        places.push_back(make_landmark(std::format("e{}", i), "Sight", models::priority::essential));
        places.push_back(make_landmark(std::format("h{}", i), "Sight", models::priority::high));
        places.push_back(make_landmark(std::format("m{}", i), "Sight", models::priority::medium));
        places.push_back(make_landmark(std::format("l{}", i), "Sight", models::priority::low));
    }

    auto day = planner::assign_places_to_day(places, "Relaxation Day", 1);

    ASSERT_EQ(day.size(), 8u);
    auto count = [&day](models::priority p) {
        return std::count_if(day.begin(), day.end(), [p](const auto& place) { return place.priority == p; });
    };
    EXPECT_EQ(count(models::priority::essential), 3);
    EXPECT_EQ(count(models::priority::high), 3);
    EXPECT_EQ(count(models::priority::medium), 2);
    EXPECT_EQ(count(models::priority::low), 0);
    EXPECT_EQ(day[0].id, "e0");
    EXPECT_EQ(day[3].id, "h0");
    EXPECT_EQ(day[6].id, "m0");
}

TEST(ThemeAssigner, FallsBackToTheFirstEightWhenNothingMatches) {
    std::vector<models::place> places;
    for (int i = 0; i < 10; ++i) {
        places.push_back(make_landmark(std::format("p{}", i), "Piazza", models::priority::medium));
    }

    auto day = planner::assign_places_to_day(places, "Historic City Center", 1);

    // First eight taken, then at most two medium ones kept
    ASSERT_EQ(day.size(), 2u);
    EXPECT_EQ(day[0].id, "p0");
    EXPECT_EQ(day[1].id, "p1");
}

TEST(ThemeAssigner, KeepsLowPriorityPlacesRatherThanAnEmptyDay) {
    std::vector<models::place> places{
        make_landmark("a", "Quiet courtyard", models::priority::low),
        make_landmark("b", "Side street", models::priority::low),
    };

    auto day = planner::assign_places_to_day(places, "Hidden Gems", 1);
    EXPECT_EQ(day.size(), 2u);
    EXPECT_TRUE(planner::assign_places_to_day({}, "Hidden Gems", 1).empty());
}
