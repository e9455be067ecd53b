#include "gdal_raster_source.hpp"
#include "exceptions.hpp"
#include "gdal_env.hpp"

#include <spdlog/spdlog.h>

#include <cpl_error.h>
#include <cpl_vsi.h>

#include <atomic>
#include <cmath>
#include <filesystem>
#include <limits>

namespace geo {

    namespace {
        std::string layer_name(const std::string &identifier) {
            return std::filesystem::path(identifier).stem().string();
        }

        std::string next_memory_path() {
            static std::atomic<unsigned long> counter = 0;
            return "/vsimem/cropcal_read_" + std::to_string(counter.fetch_add(1)) + ".tif";
        }

        raster read_band(const std::string &vsi_path, const std::string &identifier, const std::string &name) {
            GDALDatasetUniquePtr dataset(GDALDataset::Open(vsi_path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
            if (!dataset) {
                throw source_malformed(identifier, last_gdal_error("not a recognized raster"));
            }
            if (dataset->GetRasterCount() < 1) {
                throw source_malformed(identifier, "raster has no bands");
            }
            if (dataset->GetRasterCount() > 1) {
                spdlog::debug("{} has {} bands, reading band 1", identifier, dataset->GetRasterCount());
            }

            grid source_grid;
            if (dataset->GetGeoTransform(source_grid.transform.data()) != CE_None) {
                throw source_malformed(identifier, "raster has no geotransform");
            }
            const char *wkt = dataset->GetProjectionRef();
            source_grid.crs = wkt == nullptr ? "" : wkt;
            source_grid.rows = dataset->GetRasterYSize();
            source_grid.cols = dataset->GetRasterXSize();

            auto *band = dataset->GetRasterBand(1);
            std::vector<float> values(source_grid.size());
            auto err = band->RasterIO(GF_Read, 0, 0,
                                      static_cast<int>(source_grid.cols), static_cast<int>(source_grid.rows),
                                      values.data(),
                                      static_cast<int>(source_grid.cols), static_cast<int>(source_grid.rows),
                                      GDT_Float32, 0, 0, nullptr);
            if (err != CE_None) {
                throw source_malformed(identifier, last_gdal_error("pixel read failed"));
            }

            int has_nodata = 0;
            const double nodata = band->GetNoDataValue(&has_nodata);
            if (has_nodata && !std::isnan(nodata)) {
                const auto nodata_value = static_cast<float>(nodata);
                for (auto &v: values) {
                    if (v == nodata_value) {
                        v = std::numeric_limits<float>::quiet_NaN();
                    }
                }
            }

            spdlog::debug("Loaded {} ({}x{})", identifier, source_grid.rows, source_grid.cols);
            return {name, std::move(source_grid), std::move(values)};
        }
    }

    gdal_raster_source::gdal_raster_source() {
        ensure_gdal_registered();
    }

    raster gdal_raster_source::load(const std::string &identifier) const {
        const auto vsi_path = to_vsi_path(identifier);
        remote_read_scope read_options;
        CPLErrorReset();

        VSIStatBufL stat;
        if (VSIStatExL(vsi_path.c_str(), &stat, VSI_STAT_EXISTS_FLAG) != 0) {
            throw source_unavailable(identifier, last_gdal_error("no such object"));
        }
        return read_band(vsi_path, identifier, layer_name(identifier));
    }

    raster gdal_raster_source::decode(const std::string &name, const std::vector<uint8_t> &bytes) {
        ensure_gdal_registered();
        const auto path = next_memory_path();
        CPLErrorReset();
        auto *file = VSIFileFromMemBuffer(path.c_str(), const_cast<GByte *>(bytes.data()),
                                          static_cast<vsi_l_offset>(bytes.size()), FALSE);
        if (file == nullptr) {
            throw source_malformed(name, last_gdal_error("cannot map raster bytes"));
        }
        VSIFCloseL(file);
        try {
            auto value = read_band(path, name, name);
            VSIUnlink(path.c_str());
            return value;
        } catch (const source_malformed &) {
            VSIUnlink(path.c_str());
            throw;
        }
    }

}
