#include "../base_test.hpp"
#include "../raster_helpers.hpp"
#include <cropcal/dataset_builder.hpp>
#include <cropcal/exceptions.hpp>
#include <geo/exceptions.hpp>
#include <geo/gdal_env.hpp>
#include <geo/netcdf_writer.hpp>
#include <geo/raster_writer.hpp>
#include <storage/local_storage.hpp>

#include <cmath>
#include <memory>

using test_helpers::NaN;

class DatasetBuilderTest : public base_test {
protected:
    void SetUp() override {
        base_test::SetUp();
        outputs = std::make_shared<storage::local_storage>(test_dir + "/out");
    }

    void write_layer(const std::string &path, const geo::raster &value) {
        geo::raster_writer(outputs).write(value, path);
    }

    std::shared_ptr<storage::local_storage> outputs;
    geo::grid grid = test_helpers::unit_grid(2, 2);
};

TEST_F(DatasetBuilderTest, layer_paths) {
    write_layer("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP4160_ENSEMBLE_SSP370_HILM.tif", geo::raster::filled("b", grid, 1.0f));
    write_layer("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HILM.tif", geo::raster::filled("a", grid, 1.0f));
    write_layer("/cal_yld/RES05-YCX/other.tif", geo::raster::filled("c", grid, 1.0f));
    outputs->set_bytes("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_notes.txt", "text");

    auto builder = cropcal::dataset_builder(outputs);
    auto paths = builder.layer_paths("/cal_yld/RES05-YCX", "cal_yld_RES05-YCX");
    ASSERT_EQ(2, paths.size());
    EXPECT_EQ("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HILM.tif", paths[0]);
    EXPECT_EQ("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP4160_ENSEMBLE_SSP370_HILM.tif", paths[1]);
}

TEST_F(DatasetBuilderTest, negatives_are_clamped) {
    write_layer("/har_area/har_area_HILM.tif", test_helpers::with_values("h", grid, {-5.0f, 2.0f, NaN, -0.5f}));

    auto layers = cropcal::dataset_builder(outputs).load_layers("/har_area", "har_area");
    ASSERT_EQ(1, layers.size());
    EXPECT_EQ("har_area_HILM", layers[0].name());
    EXPECT_EQ(0.0f, layers[0].at(0, 0));
    EXPECT_EQ(2.0f, layers[0].at(0, 1));
    EXPECT_TRUE(std::isnan(layers[0].at(1, 0)));
    EXPECT_EQ(0.0f, layers[0].at(1, 1));
}

TEST_F(DatasetBuilderTest, mismatched_grid_is_aligned_to_first) {
    geo::grid fine{"", {0.0, 0.5, 0.0, 2.0, 0.0, -0.5}, 4, 4};
    write_layer("/har_area/har_area_HILM.tif", test_helpers::with_values("h", grid, {1.0f, 2.0f, 3.0f, 4.0f}));
    write_layer("/har_area/har_area_HRLM.tif", geo::raster::filled("r", fine, 7.0f));

    auto layers = cropcal::dataset_builder(outputs).load_layers("/har_area", "har_area");
    ASSERT_EQ(2, layers.size());
    EXPECT_EQ(layers[0].grid(), layers[1].grid());
    EXPECT_EQ(grid, layers[1].grid());
    EXPECT_EQ(7.0f, layers[1].at(1, 1));
}

TEST_F(DatasetBuilderTest, empty_folder) {
    auto builder = cropcal::dataset_builder(outputs);
    EXPECT_THROW(builder.load_layers("/har_area", "har_area"), cropcal::no_layers_found);
    EXPECT_THROW(builder.calorie_dataset("RES05-YCX"), cropcal::no_layers_found);
}

TEST_F(DatasetBuilderTest, harvested_area_dataset) {
    write_layer("/har_area/har_area_HRLM.tif", geo::raster::filled("r", grid, 2.0f));
    write_layer("/har_area/har_area_HILM.tif", geo::raster::filled("i", grid, 1.0f));

    auto dataset = cropcal::dataset_builder(outputs).harvested_area_dataset();
    EXPECT_EQ("har_area", dataset.name);
    ASSERT_EQ(2, dataset.variables.size());
    EXPECT_EQ("har_area_HILM", dataset.variables[0].name());
    EXPECT_EQ("ha", dataset.variables[0].metadata().at("units"));
    EXPECT_EQ("Harvested area (HRLM)", dataset.variables[1].metadata().at("long_name"));
    EXPECT_EQ("har_area (harvested area per cell)", dataset.attributes.at("title"));
    EXPECT_EQ("5 arc-min, WGS84", dataset.attributes.at("grid"));
    EXPECT_EQ("GAEZ v5 + pipeline", dataset.attributes.at("source"));
    EXPECT_TRUE(dataset.attributes.contains("note"));
}

TEST_F(DatasetBuilderTest, netcdf_attributes_and_values) {
    write_layer("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HILM.tif",
                test_helpers::with_values("a", grid, {1.0f, -2.0f, NaN, 4.0f}));
    write_layer("/cal_yld/RES05-YCX/cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HRLM.tif",
                geo::raster::filled("b", grid, 5.0f));

    auto dataset = cropcal::dataset_builder(outputs).calorie_dataset("RES05-YCX");
    geo::netcdf_writer(outputs).write(dataset, "/cal_yld_RES05-YCX.nc");
    ASSERT_TRUE(outputs->file("/cal_yld_RES05-YCX.nc").exists());

    geo::ensure_gdal_registered();
    const auto path = (outputs->root() / "cal_yld_RES05-YCX.nc").string();
    GDALDatasetUniquePtr nc(GDALDataset::Open(path.c_str(), GDAL_OF_MULTIDIM_RASTER));
    ASSERT_TRUE(nc);
    auto root = nc->GetRootGroup();
    ASSERT_TRUE(root);
    EXPECT_STREQ("cal_yld_RES05-YCX (calories per cell)", root->GetAttribute("title")->ReadAsString());
    EXPECT_STREQ("5 arc-min, WGS84", root->GetAttribute("grid")->ReadAsString());
    EXPECT_STREQ("GAEZ v5 + pipeline", root->GetAttribute("source")->ReadAsString());
    EXPECT_TRUE(root->GetAttribute("note"));

    auto array = root->OpenMDArray("cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HILM");
    ASSERT_TRUE(array);
    ASSERT_EQ(2, array->GetDimensionCount());
    EXPECT_EQ(GDT_Float32, array->GetDataType().GetNumericDataType());
    EXPECT_STREQ("kcal", array->GetAttribute("units")->ReadAsString());

    float values[4] = {};
    const GUInt64 start[2] = {0, 0};
    const size_t count[2] = {2, 2};
    ASSERT_TRUE(array->Read(start, count, nullptr, nullptr, GDALExtendedDataType::Create(GDT_Float32), values));
    EXPECT_EQ(1.0f, values[0]);
    EXPECT_EQ(0.0f, values[1]);
    EXPECT_TRUE(std::isnan(values[2]));
    EXPECT_EQ(4.0f, values[3]);

    auto x = root->OpenMDArray("x");
    ASSERT_TRUE(x);
    EXPECT_STREQ("longitude", x->GetAttribute("standard_name")->ReadAsString());
    EXPECT_TRUE(root->OpenMDArray("cal_yld_RES05-YCX_FP2140_ENSEMBLE_SSP370_HRLM"));
}

TEST_F(DatasetBuilderTest, writer_rejects_mixed_grids) {
    geo::dataset mixed{"mixed",
                       {geo::raster::filled("a", grid, 1.0f), geo::raster::filled("b", test_helpers::unit_grid(3, 3), 1.0f)},
                       {}};
    EXPECT_THROW(geo::netcdf_writer::encode(mixed), geo::raster_write_failed);
    EXPECT_THROW(geo::netcdf_writer::encode(geo::dataset{"empty", {}, {}}), geo::raster_write_failed);
}
