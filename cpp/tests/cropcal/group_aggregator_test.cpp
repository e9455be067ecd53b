#include <gtest/gtest.h>
#include <cropcal/group_aggregator.hpp>
#include <gaez/exceptions.hpp>
#include <geo/exceptions.hpp>
#include <geo/memory_raster_source.hpp>

#include "../raster_helpers.hpp"

#include <cmath>

class GroupAggregatorTest : public ::testing::Test {
protected:
    void add_yield(const std::string &crop, const geo::raster &value) {
        source.add(resolver.yield_path(request.variable_family, request.period, request.climate_model,
                                       request.scenario, crop, request.water_code), value);
    }

    void add_area(const std::string &group, const std::string &area_water, const geo::raster &value) {
        source.add(resolver.harvested_area_path(group, area_water), value);
    }

    geo::memory_raster_source source;
    gaez::path_resolver resolver{"mem"};
    cropcal::aggregation_request request{"RES05-YCX", "FP2140", "ENSEMBLE", "SSP370", "HILM"};
    geo::grid grid = test_helpers::unit_grid(2, 2);
};

TEST_F(GroupAggregatorTest, mean_yield_times_area_times_kcal) {
    add_yield("BANA", geo::raster::filled("bana", grid, 2.0f));
    add_area("BAN", "WSI", geo::raster::filled("area", grid, 100.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    auto result = aggregator.aggregate({"BAN", {"BANA", "PLNT"}, 39.4}, request);

    EXPECT_EQ("kcal_BAN", result.name());
    EXPECT_EQ(grid, result.grid());
    for (auto v: result.values()) {
        EXPECT_FLOAT_EQ(7880.0f, v);
    }
}

TEST_F(GroupAggregatorTest, mean_skips_nodata) {
    add_yield("MZE", test_helpers::with_values("a", grid, {20.0f, test_helpers::NaN, 1.0f, test_helpers::NaN}));
    add_yield("MZX", test_helpers::with_values("b", grid, {30.0f, 30.0f, 3.0f, test_helpers::NaN}));
    add_area("MZE", "WSI", geo::raster::filled("area", grid, 1.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    auto result = aggregator.aggregate({"MZE", {"MZE", "MZX"}, 1.0}, request);

    EXPECT_FLOAT_EQ(25.0f, result.at(0, 0));
    EXPECT_FLOAT_EQ(30.0f, result.at(0, 1));
    EXPECT_FLOAT_EQ(2.0f, result.at(1, 0));
    EXPECT_TRUE(std::isnan(result.at(1, 1)));
}

TEST_F(GroupAggregatorTest, no_members_gives_zero_layer_on_area_mask) {
    add_area("OTH", "WSI", test_helpers::with_values("area", grid, {1.0f, test_helpers::NaN, 3.0f, 4.0f}));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    for (const auto &members: {std::vector<std::string>{}, std::vector<std::string>{"XXX"}}) {
        auto result = aggregator.aggregate({"OTH", members, 5000.0}, request);
        EXPECT_EQ("kcal_OTH", result.name());
        EXPECT_EQ(grid, result.grid());
        EXPECT_EQ(0.0f, result.at(0, 0));
        EXPECT_TRUE(std::isnan(result.at(0, 1)));
        EXPECT_EQ(0.0f, result.at(1, 0));
        EXPECT_EQ(0.0f, result.at(1, 1));
    }
}

TEST_F(GroupAggregatorTest, malformed_member_is_skipped) {
    add_yield("BAN", geo::raster::filled("ban", grid, 2.0f));
    source.add_malformed(resolver.yield_path(request.variable_family, request.period, request.climate_model,
                                             request.scenario, "PLN", request.water_code));
    add_area("BAN", "WSI", geo::raster::filled("area", grid, 1.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    auto result = aggregator.aggregate({"BAN", {"BAN", "PLN"}, 10.0}, request);
    EXPECT_FLOAT_EQ(20.0f, result.at(0, 0));
}

TEST_F(GroupAggregatorTest, missing_area_fails) {
    add_yield("BAN", geo::raster::filled("ban", grid, 2.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    EXPECT_THROW(aggregator.aggregate({"BAN", {"BAN"}, 985.0}, request), geo::source_unavailable);
}

TEST_F(GroupAggregatorTest, rainfed_uses_rainfed_area) {
    request.water_code = "HRLM";
    add_yield("BAN", geo::raster::filled("ban", grid, 2.0f));
    add_area("BAN", "WSI", geo::raster::filled("irrigated", grid, 100.0f));
    add_area("BAN", "WSR", geo::raster::filled("rainfed", grid, 3.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);
    auto result = aggregator.aggregate({"BAN", {"BAN"}, 1.0}, request);
    EXPECT_FLOAT_EQ(6.0f, result.at(1, 1));
}

TEST_F(GroupAggregatorTest, unknown_water_code) {
    request.water_code = "WSI";
    auto aggregator = cropcal::group_aggregator(source, resolver);
    EXPECT_THROW(aggregator.aggregate({"BAN", {"BAN"}, 1.0}, request), gaez::unknown_water_code);
}

TEST_F(GroupAggregatorTest, first_loaded_member_defines_grid) {
    geo::grid fine{"", {0.0, 0.5, 0.0, 2.0, 0.0, -0.5}, 4, 4};
    add_yield("AAA", geo::raster::filled("coarse", grid, 2.0f));
    add_yield("BBB", geo::raster::filled("fine", fine, 4.0f));
    add_area("GRP", "WSI", geo::raster::filled("area", grid, 1.0f));

    auto aggregator = cropcal::group_aggregator(source, resolver);

    auto coarse = aggregator.aggregate({"GRP", {"AAA", "BBB"}, 1.0}, request);
    EXPECT_EQ(grid, coarse.grid());
    EXPECT_FLOAT_EQ(3.0f, coarse.at(0, 0));

    auto fine_first = aggregator.aggregate({"GRP", {"ZZZ", "BBB", "AAA"}, 1.0}, request);
    EXPECT_EQ(fine, fine_first.grid());
    EXPECT_FLOAT_EQ(3.0f, fine_first.at(3, 3));
}
