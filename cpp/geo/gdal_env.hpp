#pragma once

/**
 * @file gdal_env.hpp
 * @brief GDAL process setup and helpers shared by the loader, aligner and writer.
 */

#include "grid.hpp"

#include <gdal_priv.h>

#include <cpl_conv.h>

#include <memory>
#include <string>
#include <vector>

namespace geo {

    /**
     * @brief Registers the GDAL drivers once per process.
     */
    void ensure_gdal_registered();

    /**
     * @brief Maps an identifier to the GDAL virtual file system path that reads it.
     *
     * `https://` goes through `/vsicurl/`, `gs://` through `/vsigs/`, `file://` and plain paths are local.
     * Both remote handlers read by HTTP range requests.
     */
    std::string to_vsi_path(const std::string &identifier);

    /**
     * @brief Last GDAL error message of this thread, or the fallback if there is none.
     */
    std::string last_gdal_error(const std::string &fallback);

    /**
     * @brief Thread-local GDAL options for lean remote reads, active for the lifetime of the scope.
     */
    class remote_read_scope {
    public:
        remote_read_scope();

        remote_read_scope(const remote_read_scope &) = delete;
        remote_read_scope &operator=(const remote_read_scope &) = delete;

    private:
        std::vector<std::unique_ptr<CPLConfigOptionSetter>> options_;
    };

    /**
     * @brief Single band float32 dataset on the grid, filled with NaN, NaN as nodata.
     *
     * @throws alignment_failed if the MEM driver is missing or the crs cannot be parsed.
     */
    GDALDatasetUniquePtr create_mem_dataset(const grid &target, const std::string &name);

    /**
     * @brief Sets transform and crs of the dataset. Returns false if the crs text cannot be parsed.
     */
    bool apply_grid(GDALDataset &dataset, const grid &target);

}
