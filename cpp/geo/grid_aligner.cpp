#include "grid_aligner.hpp"
#include "exceptions.hpp"
#include "gdal_env.hpp"

#include <spdlog/spdlog.h>

#include <gdal_alg.h>
#include <gdalwarper.h>

#include <limits>

namespace geo {

    namespace {
        GDALDatasetUniquePtr to_mem_dataset(const raster &source) {
            auto dataset = create_mem_dataset(source.grid(), source.name());
            const auto &g = source.grid();
            auto err = dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0,
                                                           static_cast<int>(g.cols), static_cast<int>(g.rows),
                                                           const_cast<float *>(source.values().data()),
                                                           static_cast<int>(g.cols), static_cast<int>(g.rows),
                                                           GDT_Float32, 0, 0, nullptr);
            if (err != CE_None) {
                throw alignment_failed(source.name(), last_gdal_error("cannot copy values into memory dataset"));
            }
            return dataset;
        }

        struct warp_options_deleter {
            void operator()(GDALWarpOptions *options) const {
                if (options->pTransformerArg != nullptr) {
                    GDALDestroyGenImgProjTransformer(options->pTransformerArg);
                }
                GDALDestroyWarpOptions(options);
            }
        };

        void warp(GDALDataset &source, GDALDataset &target, const std::string &name) {
            std::unique_ptr<GDALWarpOptions, warp_options_deleter> options(GDALCreateWarpOptions());
            options->hSrcDS = static_cast<GDALDatasetH>(&source);
            options->hDstDS = static_cast<GDALDatasetH>(&target);
            options->eResampleAlg = GRA_NearestNeighbour;
            options->eWorkingDataType = GDT_Float32;
            options->nBandCount = 1;
            options->panSrcBands = static_cast<int *>(CPLMalloc(sizeof(int)));
            options->panSrcBands[0] = 1;
            options->panDstBands = static_cast<int *>(CPLMalloc(sizeof(int)));
            options->panDstBands[0] = 1;
            options->padfSrcNoDataReal = static_cast<double *>(CPLMalloc(sizeof(double)));
            options->padfSrcNoDataReal[0] = std::numeric_limits<double>::quiet_NaN();
            options->padfDstNoDataReal = static_cast<double *>(CPLMalloc(sizeof(double)));
            options->padfDstNoDataReal[0] = std::numeric_limits<double>::quiet_NaN();
            options->papszWarpOptions = CSLSetNameValue(options->papszWarpOptions, "INIT_DEST", "NO_DATA");

            options->pTransformerArg = GDALCreateGenImgProjTransformer2(options->hSrcDS, options->hDstDS, nullptr);
            if (options->pTransformerArg == nullptr) {
                throw alignment_failed(name, last_gdal_error("cannot create transformer"));
            }
            options->pfnTransformer = GDALGenImgProjTransform;

            GDALWarpOperation operation;
            if (operation.Initialize(options.get()) != CE_None) {
                throw alignment_failed(name, last_gdal_error("cannot initialize warp"));
            }
            if (operation.ChunkAndWarpImage(0, 0, target.GetRasterXSize(), target.GetRasterYSize()) != CE_None) {
                throw alignment_failed(name, last_gdal_error("warp failed"));
            }
        }
    }

    raster align(const grid &reference, const raster &candidate) {
        if (candidate.grid().compatible_with(reference)) {
            return candidate;
        }
        spdlog::debug("Reprojecting {} ({}x{}) onto {}x{} reference grid",
                      candidate.name(), candidate.grid().rows, candidate.grid().cols, reference.rows, reference.cols);

        CPLErrorReset();
        auto source = to_mem_dataset(candidate);
        auto target = create_mem_dataset(reference, candidate.name());
        warp(*source, *target, candidate.name());

        std::vector<float> values(reference.size());
        auto err = target->GetRasterBand(1)->RasterIO(GF_Read, 0, 0,
                                                      static_cast<int>(reference.cols), static_cast<int>(reference.rows),
                                                      values.data(),
                                                      static_cast<int>(reference.cols), static_cast<int>(reference.rows),
                                                      GDT_Float32, 0, 0, nullptr);
        if (err != CE_None) {
            throw alignment_failed(candidate.name(), last_gdal_error("cannot read warped values"));
        }

        auto aligned = raster(candidate.name(), reference, std::move(values));
        for (const auto &[key, value]: candidate.metadata()) {
            aligned = aligned.with_metadata(key, value);
        }
        return aligned;
    }

}
