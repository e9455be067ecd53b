#include <gtest/gtest.h>
#include <gaez/exceptions.hpp>
#include <gaez/path_resolver.hpp>

#include <set>

TEST(PathResolverTest, harvested_area_url) {
    auto resolver = gaez::path_resolver();
    const std::string expected =
            "https://storage.googleapis.com/fao-gismgr-gaez-v5-data/DATA/GAEZ-V5/MAPSET/RES06-HAR/GAEZ-V5.RES06-HAR.MAIZ.WSI.tif";
    EXPECT_EQ(expected, resolver.harvested_area_path("MAIZ", "WSI"));
    EXPECT_EQ(expected, resolver.harvested_area_path("MAIZ", "WSI"));
}

TEST(PathResolverTest, yield_path) {
    auto resolver = gaez::path_resolver(gaez::storage_scheme::https);
    EXPECT_EQ("https://storage.googleapis.com/fao-gismgr-gaez-v5-data/DATA/GAEZ-V5/MAPSET/RES05-YCX/"
              "GAEZ-V5.RES05-YCX.FP2140.ENSEMBLE.SSP370.MZE.HILM.tif",
              resolver.yield_path("RES05-YCX", "FP2140", "ENSEMBLE", "SSP370", "MZE", "HILM"));
}

TEST(PathResolverTest, gs_and_local_roots) {
    auto gs = gaez::path_resolver(gaez::storage_scheme::gs);
    EXPECT_EQ("gs://fao-gismgr-gaez-v5-data/DATA/GAEZ-V5/MAPSET/RES06-HAR/GAEZ-V5.RES06-HAR.WHEA.WSR.tif",
              gs.harvested_area_path("WHEA", "WSR"));

    auto local = gaez::path_resolver("/data/gaez/MAPSET//");
    EXPECT_EQ("/data/gaez/MAPSET", local.root());
    EXPECT_EQ("/data/gaez/MAPSET/RES02-YLD/GAEZ-V5.RES02-YLD.HP0120.AGERA5.HIST.RICE.LRLM.tif",
              local.yield_path("RES02-YLD", "HP0120", "AGERA5", "HIST", "RICE", "LRLM"));

    EXPECT_THROW(gaez::path_resolver(gaez::storage_scheme::local), gaez::missing_path_component);
    EXPECT_THROW(gaez::path_resolver(std::string()), gaez::missing_path_component);
}

TEST(PathResolverTest, classify_family) {
    EXPECT_EQ(gaez::naming_scheme::time_series, gaez::classify_family("RES02-YLD"));
    EXPECT_EQ(gaez::naming_scheme::time_series, gaez::classify_family("RES03-X"));
    EXPECT_EQ(gaez::naming_scheme::time_series, gaez::classify_family("RES04-Y"));
    EXPECT_EQ(gaez::naming_scheme::time_series, gaez::classify_family("RES05-YCX"));
    EXPECT_EQ(gaez::naming_scheme::static_layer, gaez::classify_family("RES06-HAR"));
    EXPECT_THROW(gaez::classify_family("RES01-ABC"), gaez::unrecognized_family);
    EXPECT_THROW(gaez::classify_family(""), gaez::unrecognized_family);
}

TEST(PathResolverTest, unrecognized_family) {
    auto resolver = gaez::path_resolver();
    EXPECT_THROW(resolver.yield_path("RES09-XYZ", "FP2140", "ENSEMBLE", "SSP370", "MZE", "HILM"), gaez::unrecognized_family);
}

TEST(PathResolverTest, missing_component) {
    auto resolver = gaez::path_resolver();
    EXPECT_THROW(resolver.resolve({"RES05-YCX", std::nullopt, "ENSEMBLE", "SSP370", "MZE", "HILM"}),
                 gaez::missing_path_component);
    EXPECT_THROW(resolver.resolve({"RES05-YCX", "FP2140", "", "SSP370", "MZE", "HILM"}),
                 gaez::missing_path_component);
    EXPECT_THROW(resolver.resolve({"RES05-YCX", "FP2140", "ENSEMBLE", "SSP370", "MZE", ""}),
                 gaez::missing_path_component);
    EXPECT_THROW(resolver.harvested_area_path("", "WSI"), gaez::missing_path_component);

    try {
        resolver.resolve({"RES05-YCX", "FP2140", "ENSEMBLE", std::nullopt, "MZE", "HILM"});
        FAIL() << "Expected missing_path_component";
    } catch (const gaez::missing_path_component &e) {
        EXPECT_EQ("scenario", e.params().at("component"));
        EXPECT_EQ("RES05-YCX", e.params().at("family"));
    }
}

TEST(PathResolverTest, static_layer_ignores_time_components) {
    auto resolver = gaez::path_resolver();
    auto with_period = resolver.resolve({"RES06-HAR", "FP2140", "ENSEMBLE", "SSP370", "MAIZ", "WSI"});
    EXPECT_EQ(resolver.harvested_area_path("MAIZ", "WSI"), with_period);
}

TEST(PathResolverTest, distinct_keys_distinct_paths) {
    auto resolver = gaez::path_resolver();
    std::set<std::string> paths;
    int count = 0;
    for (const auto &period: {"FP2140", "FP4160"}) {
        for (const auto &scenario: {"SSP126", "SSP585"}) {
            for (const auto &crop: {"MZE", "WHE"}) {
                for (const auto &water: {"HILM", "HRLM"}) {
                    paths.insert(resolver.yield_path("RES05-YCX", period, "ENSEMBLE", scenario, crop, water));
                    ++count;
                }
            }
        }
    }
    EXPECT_EQ(count, paths.size());
}

TEST(PathResolverTest, parse_storage_scheme) {
    EXPECT_EQ(gaez::storage_scheme::https, gaez::parse_storage_scheme("https"));
    EXPECT_EQ(gaez::storage_scheme::gs, gaez::parse_storage_scheme("gs"));
    EXPECT_EQ(gaez::storage_scheme::local, gaez::parse_storage_scheme("local"));
    EXPECT_THROW(gaez::parse_storage_scheme("s3"), gaez::unknown_storage_scheme);
}
