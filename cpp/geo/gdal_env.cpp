#include "gdal_env.hpp"
#include "exceptions.hpp"

#include <http/url.hpp>

#include <cpl_error.h>
#include <ogr_spatialref.h>

#include <limits>
#include <mutex>

namespace geo {

    void ensure_gdal_registered() {
        static std::once_flag registered;
        std::call_once(registered, [] {
            GDALAllRegister();
        });
    }

    std::string to_vsi_path(const std::string &identifier) {
        if (http::is_http_path(identifier)) {
            return "/vsicurl/" + identifier;
        }
        if (http::is_gcs_path(identifier)) {
            return "/vsigs/" + http::strip_scheme(identifier);
        }
        if (http::is_file_url(identifier)) {
            return http::strip_scheme(identifier);
        }
        return identifier;
    }

    std::string last_gdal_error(const std::string &fallback) {
        const char *message = CPLGetLastErrorMsg();
        if (message == nullptr || *message == '\0') {
            return fallback;
        }
        return message;
    }

    remote_read_scope::remote_read_scope() {
        static const std::vector<std::pair<const char *, const char *>> settings = {
                {"GDAL_DISABLE_READDIR_ON_OPEN", "TRUE"},
                {"CPL_VSIL_CURL_ALLOWED_EXTENSIONS", ".tif"},
                {"CPL_VSIL_CURL_CHUNK_SIZE", "10485760"},
                {"GDAL_HTTP_MAX_RETRY", "3"},
                {"GDAL_HTTP_RETRY_DELAY", "1"},
                {"GS_NO_SIGN_REQUEST", "YES"},
        };
        for (const auto &[key, value]: settings) {
            options_.push_back(std::make_unique<CPLConfigOptionSetter>(key, value, true));
        }
    }

    bool apply_grid(GDALDataset &dataset, const grid &target) {
        auto transform = target.transform;
        if (dataset.SetGeoTransform(transform.data()) != CE_None) {
            return false;
        }
        if (target.crs.empty()) {
            return true;
        }
        OGRSpatialReference srs;
        if (srs.SetFromUserInput(target.crs.c_str()) != OGRERR_NONE) {
            return false;
        }
        srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
        return dataset.SetSpatialRef(&srs) == CE_None;
    }

    GDALDatasetUniquePtr create_mem_dataset(const grid &target, const std::string &name) {
        ensure_gdal_registered();
        auto *driver = GetGDALDriverManager()->GetDriverByName("MEM");
        if (driver == nullptr) {
            throw alignment_failed(name, "GDAL MEM driver is not available");
        }
        GDALDatasetUniquePtr dataset(driver->Create("", static_cast<int>(target.cols), static_cast<int>(target.rows), 1, GDT_Float32, nullptr));
        if (!dataset) {
            throw alignment_failed(name, last_gdal_error("cannot create in-memory dataset"));
        }
        if (!apply_grid(*dataset, target)) {
            throw alignment_failed(name, last_gdal_error("invalid crs '" + target.crs + "'"));
        }
        auto *band = dataset->GetRasterBand(1);
        const auto nodata = std::numeric_limits<double>::quiet_NaN();
        if (band->SetNoDataValue(nodata) != CE_None || band->Fill(nodata) != CE_None) {
            throw alignment_failed(name, last_gdal_error("cannot initialize in-memory band"));
        }
        return dataset;
    }

}
