#include <gtest/gtest.h>
#include <geo/exceptions.hpp>
#include <geo/grid.hpp>
#include <geo/raster.hpp>

#include "../raster_helpers.hpp"

TEST(GridTest, compatible_with) {
    auto a = test_helpers::unit_grid(2, 3);
    auto b = test_helpers::unit_grid(2, 3);
    EXPECT_EQ(6, a.size());
    EXPECT_TRUE(a.compatible_with(b));

    b.transform[1] = 0.5;
    EXPECT_FALSE(a.compatible_with(b));

    auto c = test_helpers::unit_grid(3, 2);
    EXPECT_FALSE(a.compatible_with(c));

    auto d = test_helpers::unit_grid(2, 3);
    d.crs = "EPSG:4326";
    EXPECT_FALSE(a.compatible_with(d));
}

TEST(RasterTest, shape_mismatch) {
    auto grid = test_helpers::unit_grid(2, 2);
    EXPECT_THROW(geo::raster("r", grid, {1.0f, 2.0f, 3.0f}), geo::shape_mismatch);
}

TEST(RasterTest, values_are_shared) {
    auto grid = test_helpers::unit_grid(2, 2);
    auto r = test_helpers::with_values("r", grid, {1.0f, 2.0f, 3.0f, 4.0f});
    EXPECT_EQ(3.0f, r.at(1, 0));

    auto tagged = r.with_metadata("units", "ha");
    EXPECT_EQ("r", tagged.name());
    EXPECT_TRUE(tagged.shares_values_with(r));
    EXPECT_EQ("ha", tagged.metadata().at("units"));
    EXPECT_TRUE(r.metadata().empty());

    auto other = test_helpers::with_values("r", grid, {1.0f, 2.0f, 3.0f, 4.0f});
    EXPECT_FALSE(other.shares_values_with(r));
}
