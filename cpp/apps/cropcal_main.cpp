#include <base/exception.hpp>
#include <base/logging.hpp>
#include <cropcal/pipeline.hpp>
#include <cropcal/run_configuration.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

namespace {
    const int EXIT_REQUEST_FAILED = 1;
    const int EXIT_USAGE = 2;

    void print_usage() {
        std::cerr << "Usage: cropcal <config.json> [calories|area|dataset|all]" << std::endl;
    }
}

int main(int argc, char **argv) {
    if (argc < 2 || argc > 3) {
        print_usage();
        return EXIT_USAGE;
    }
    const std::string config_path = argv[1];
    const std::string mode = argc == 3 ? argv[2] : "all";
    if (mode != "calories" && mode != "area" && mode != "dataset" && mode != "all") {
        print_usage();
        return EXIT_USAGE;
    }

    try {
        auto config = cropcal::run_configuration::load(config_path);
        base::configure_logging(config.log_level);
        spdlog::debug("Configuration: {}", config.to_json().dump());

        auto pipeline = cropcal::pipeline::create(config);
        cropcal::run_summary summary;
        if (mode == "calories" || mode == "all") {
            summary.merge(pipeline.run_calories());
        }
        if (mode == "area" || mode == "all") {
            summary.merge(pipeline.run_harvested_area());
        }
        if (mode == "dataset" || mode == "all") {
            summary.merge(pipeline.run_datasets());
        }

        spdlog::info("Done: {} written, {} skipped, {} failed", summary.written.size(), summary.skipped.size(), summary.failed.size());
        for (const auto &failure: summary.failed) {
            spdlog::error("  {}: {}", failure.name, failure.message);
        }
        return summary.ok() ? 0 : EXIT_REQUEST_FAILED;
    } catch (const base::exception &e) {
        spdlog::error("{}", e.message());
        return EXIT_USAGE;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return EXIT_USAGE;
    }
}
