#include <gtest/gtest.h>
#include <gaez/exceptions.hpp>
#include <gaez/water_regime.hpp>

TEST(WaterRegimeTest, area_water_code) {
    EXPECT_EQ("WSI", gaez::area_water_code("HILM"));
    EXPECT_EQ("WSI", gaez::area_water_code("LILM"));
    EXPECT_EQ("WSR", gaez::area_water_code("HRLM"));
    EXPECT_EQ("WSR", gaez::area_water_code("LRLM"));
}

TEST(WaterRegimeTest, unknown_code) {
    EXPECT_THROW(gaez::area_water_code("WSI"), gaez::unknown_water_code);
    EXPECT_THROW(gaez::area_water_code("hilm"), gaez::unknown_water_code);
    EXPECT_THROW(gaez::area_water_code(""), gaez::unknown_water_code);
}

TEST(WaterRegimeTest, yield_water_codes) {
    const std::vector<std::string> expected = {"HILM", "LILM", "HRLM", "LRLM"};
    EXPECT_EQ(expected, gaez::yield_water_codes());
    for (const auto &code: expected) {
        EXPECT_TRUE(gaez::is_yield_water_code(code));
    }
    EXPECT_FALSE(gaez::is_yield_water_code("WSR"));
}
