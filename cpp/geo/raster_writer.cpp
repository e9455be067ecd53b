#include "raster_writer.hpp"
#include "exceptions.hpp"
#include "gdal_env.hpp"

#include <spdlog/spdlog.h>

#include <cpl_string.h>
#include <cpl_vsi.h>

#include <atomic>
#include <limits>

namespace geo {

    namespace {
        std::string next_memory_path() {
            static std::atomic<unsigned long> counter = 0;
            return "/vsimem/cropcal_" + std::to_string(counter.fetch_add(1)) + ".tif";
        }

        CPLStringList creation_options() {
            CPLStringList options;
            options.SetNameValue("TILED", "YES");
            options.SetNameValue("BLOCKXSIZE", "512");
            options.SetNameValue("BLOCKYSIZE", "512");
            options.SetNameValue("COMPRESS", "ZSTD");
            options.SetNameValue("ZSTD_LEVEL", "5");
            options.SetNameValue("BIGTIFF", "IF_SAFER");
            options.SetNameValue("SPARSE_OK", "TRUE");
            options.SetNameValue("NUM_THREADS", "ALL_CPUS");
            return options;
        }

        void fill_dataset(GDALDataset &dataset, const raster &value) {
            const auto &g = value.grid();
            if (!apply_grid(dataset, g)) {
                throw raster_write_failed(value.name(), last_gdal_error("invalid crs '" + g.crs + "'"));
            }
            for (const auto &[key, item]: value.metadata()) {
                if (dataset.SetMetadataItem(key.c_str(), item.c_str()) != CE_None) {
                    throw raster_write_failed(value.name(), last_gdal_error("cannot set metadata " + key));
                }
            }
            auto *band = dataset.GetRasterBand(1);
            band->SetDescription(value.name().c_str());
            if (band->SetNoDataValue(std::numeric_limits<double>::quiet_NaN()) != CE_None) {
                throw raster_write_failed(value.name(), last_gdal_error("cannot set nodata"));
            }
            auto err = band->RasterIO(GF_Write, 0, 0,
                                      static_cast<int>(g.cols), static_cast<int>(g.rows),
                                      const_cast<float *>(value.values().data()),
                                      static_cast<int>(g.cols), static_cast<int>(g.rows),
                                      GDT_Float32, 0, 0, nullptr);
            if (err != CE_None) {
                throw raster_write_failed(value.name(), last_gdal_error("pixel write failed"));
            }
        }
    }

    raster_writer::raster_writer(std::shared_ptr<storage::storage> storage) : storage_(std::move(storage)) {
        ensure_gdal_registered();
    }

    std::string raster_writer::encode(const raster &value) {
        ensure_gdal_registered();
        auto *driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        if (driver == nullptr) {
            throw raster_write_failed(value.name(), "GDAL GTiff driver is not available");
        }

        const auto path = next_memory_path();
        const auto &g = value.grid();
        auto options = creation_options();
        CPLErrorReset();
        GDALDatasetUniquePtr dataset(driver->Create(path.c_str(), static_cast<int>(g.cols), static_cast<int>(g.rows), 1, GDT_Float32, options.List()));
        if (!dataset) {
            throw raster_write_failed(value.name(), last_gdal_error("cannot create GeoTIFF"));
        }
        try {
            fill_dataset(*dataset, value);
        } catch (const raster_write_failed &) {
            dataset.reset();
            VSIUnlink(path.c_str());
            throw;
        }
        dataset.reset();

        vsi_l_offset length = 0;
        GByte *data = VSIGetMemFileBuffer(path.c_str(), &length, TRUE);
        if (data == nullptr || length == 0) {
            VSIFree(data);
            throw raster_write_failed(value.name(), last_gdal_error("GeoTIFF encoding produced no data"));
        }
        std::string bytes(reinterpret_cast<const char *>(data), static_cast<size_t>(length));
        VSIFree(data);
        return bytes;
    }

    void raster_writer::write(const raster &value, const std::string &path) const {
        auto bytes = encode(value);
        spdlog::debug("Writing {} ({} bytes) to {}", value.name(), bytes.size(), path);
        storage_->set_bytes(path, bytes);
    }

}
