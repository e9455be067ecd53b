#include "netcdf_writer.hpp"
#include "exceptions.hpp"
#include "gdal_env.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cpl_string.h>
#include <cpl_vsi.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <limits>

namespace geo {

    namespace {
        const int64_t CHUNK_SIZE = 256;
        const std::string DEFLATE_LEVEL = "4";

        void write_string_attribute(GDALIHasAttribute &target, const std::string &dataset_name,
                                    const std::string &key, const std::string &text) {
            auto attribute = target.CreateAttribute(key, {}, GDALExtendedDataType::CreateString());
            if (!attribute || !attribute->Write(text.c_str())) {
                throw raster_write_failed(dataset_name, last_gdal_error("cannot write attribute " + key));
            }
        }

        std::vector<double> cell_centers(double origin, double step, int64_t count) {
            std::vector<double> centers(static_cast<size_t>(count));
            for (int64_t i = 0; i < count; ++i) {
                centers[static_cast<size_t>(i)] = origin + (static_cast<double>(i) + 0.5) * step;
            }
            return centers;
        }

        void write_coordinate(GDALGroup &group, const std::shared_ptr<GDALDimension> &dimension,
                              const std::vector<double> &centers, const std::string &standard_name,
                              const std::string &units, const std::string &dataset_name) {
            auto array = group.CreateMDArray(dimension->GetName(), {dimension}, GDALExtendedDataType::Create(GDT_Float64));
            if (!array) {
                throw raster_write_failed(dataset_name, last_gdal_error("cannot create coordinate " + dimension->GetName()));
            }
            const GUInt64 start[1] = {0};
            const size_t count[1] = {centers.size()};
            if (!array->Write(start, count, nullptr, nullptr, GDALExtendedDataType::Create(GDT_Float64), centers.data())) {
                throw raster_write_failed(dataset_name, last_gdal_error("cannot write coordinate " + dimension->GetName()));
            }
            write_string_attribute(*array, dataset_name, "standard_name", standard_name);
            write_string_attribute(*array, dataset_name, "units", units);
        }

        void fill_dataset(GDALGroup &group, const dataset &value) {
            const auto &g = value.variables.front().grid();

            auto y = group.CreateDimension("y", GDAL_DIM_TYPE_HORIZONTAL_Y, std::string(), static_cast<GUInt64>(g.rows));
            auto x = group.CreateDimension("x", GDAL_DIM_TYPE_HORIZONTAL_X, std::string(), static_cast<GUInt64>(g.cols));
            if (!y || !x) {
                throw raster_write_failed(value.name, last_gdal_error("cannot create dimensions"));
            }
            write_coordinate(group, y, cell_centers(g.transform[3], g.transform[5], g.rows), "latitude", "degrees_north", value.name);
            write_coordinate(group, x, cell_centers(g.transform[0], g.transform[1], g.cols), "longitude", "degrees_east", value.name);

            OGRSpatialReference srs;
            const bool has_srs = !g.crs.empty() && srs.SetFromUserInput(g.crs.c_str()) == OGRERR_NONE;
            if (!g.crs.empty() && !has_srs) {
                throw raster_write_failed(value.name, "invalid crs '" + g.crs + "'");
            }
            srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

            CPLStringList options;
            options.SetNameValue("COMPRESS", "DEFLATE");
            options.SetNameValue("ZLEVEL", DEFLATE_LEVEL.c_str());
            options.SetNameValue("BLOCKSIZE", fmt::format("{},{}", std::min(CHUNK_SIZE, g.rows), std::min(CHUNK_SIZE, g.cols)).c_str());

            const GUInt64 start[2] = {0, 0};
            const size_t count[2] = {static_cast<size_t>(g.rows), static_cast<size_t>(g.cols)};
            for (const auto &variable: value.variables) {
                auto array = group.CreateMDArray(variable.name(), {y, x}, GDALExtendedDataType::Create(GDT_Float32), options.List());
                if (!array) {
                    throw raster_write_failed(value.name, last_gdal_error("cannot create variable " + variable.name()));
                }
                if (!array->SetNoDataValue(std::numeric_limits<double>::quiet_NaN())) {
                    throw raster_write_failed(value.name, last_gdal_error("cannot set fill value of " + variable.name()));
                }
                if (has_srs && !array->SetSpatialRef(&srs)) {
                    throw raster_write_failed(value.name, last_gdal_error("cannot set crs of " + variable.name()));
                }
                for (const auto &[key, item]: variable.metadata()) {
                    write_string_attribute(*array, value.name, key, item);
                }
                if (!array->Write(start, count, nullptr, nullptr, GDALExtendedDataType::Create(GDT_Float32), variable.values().data())) {
                    throw raster_write_failed(value.name, last_gdal_error("cannot write variable " + variable.name()));
                }
            }

            for (const auto &[key, item]: value.attributes) {
                write_string_attribute(group, value.name, key, item);
            }
        }

        void check_variables(const dataset &value) {
            if (value.variables.empty()) {
                throw raster_write_failed(value.name, "dataset has no variables");
            }
            const auto &reference = value.variables.front().grid();
            for (const auto &variable: value.variables) {
                if (!variable.grid().compatible_with(reference)) {
                    throw raster_write_failed(value.name, "variable " + variable.name() + " is not on the dataset grid");
                }
            }
        }
    }

    netcdf_writer::netcdf_writer(std::shared_ptr<storage::storage> storage) : storage_(std::move(storage)) {
        ensure_gdal_registered();
    }

    std::string netcdf_writer::encode(const dataset &value) {
        check_variables(value);
        ensure_gdal_registered();
        auto *driver = GetGDALDriverManager()->GetDriverByName("netCDF");
        if (driver == nullptr) {
            throw raster_write_failed(value.name, "GDAL netCDF driver is not available");
        }

        // the netCDF library writes real files only, so encode through a temporary file
        const std::string path = std::string(CPLGenerateTempFilename("cropcal")) + ".nc";
        CPLStringList options;
        options.SetNameValue("FORMAT", "NC4");
        CPLErrorReset();
        try {
            GDALDatasetUniquePtr nc(driver->CreateMultiDimensional(path.c_str(), nullptr, options.List()));
            if (!nc) {
                throw raster_write_failed(value.name, last_gdal_error("cannot create NetCDF file"));
            }
            auto group = nc->GetRootGroup();
            if (!group) {
                throw raster_write_failed(value.name, last_gdal_error("NetCDF file has no root group"));
            }
            fill_dataset(*group, value);
        } catch (const raster_write_failed &) {
            VSIUnlink(path.c_str());
            throw;
        }

        GByte *data = nullptr;
        vsi_l_offset length = 0;
        const bool ingested = VSIIngestFile(nullptr, path.c_str(), &data, &length, -1) != 0;
        VSIUnlink(path.c_str());
        if (!ingested || data == nullptr) {
            VSIFree(data);
            throw raster_write_failed(value.name, last_gdal_error("cannot read back NetCDF file"));
        }
        std::string bytes(reinterpret_cast<const char *>(data), static_cast<size_t>(length));
        VSIFree(data);
        return bytes;
    }

    void netcdf_writer::write(const dataset &value, const std::string &path) const {
        auto bytes = encode(value);
        spdlog::debug("Writing dataset {} ({} variables, {} bytes) to {}", value.name, value.variables.size(), bytes.size(), path);
        storage_->set_bytes(path, bytes);
    }

}
