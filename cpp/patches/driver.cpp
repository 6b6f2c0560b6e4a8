// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"

#include "patch_sampler.h"
#include "settings_patches.h"

#include <abi/granule_locator.h>
#include <common/io.h>
#include <common/lightning_grid.h>
#include <common/patch_dataset.h>
#include <common/timer.h>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace goes {

auto driver(const SettingsPatches& settings,
            const int argc,
            const char* const argv[]) -> void
{
    // Set up loggers and print general information
    initLogging();
    printHeading("GOES ABI patch extraction", false);
    printSystemInfo(GOES_PROJECT_VERSION,
                    GOES_GIT_COMMIT_ABBREV,
                    GOES_CMAKE_HOST_SYSTEM,
                    GOES_EXECUTABLE,
                    GOES_CXX_COMPILER,
                    GOES_CXX_COMPILER_FLAGS,
                    GOES_LIBRARIES);

    const GranuleLocator locator { settings.abi.path,
                                   settings.abi.product,
                                   settings.abi.satellite,
                                   settings.abi.file_date,
                                   settings.abi.search_adjacent_days };
    SamplingParameters params {};
    params.channels = settings.abi.channels;
    params.lead_time = parseDuration(settings.sampling.lead_time);
    params.patch_width = settings.sampling.patch_x_pixels;
    params.patch_height = settings.sampling.patch_y_pixels;
    params.samples_per_time = settings.sampling.samples_per_time;
    params.time_range_minutes = settings.abi.time_range_minutes;
    params.seed = settings.sampling.seed;
    params.n_threads = settings.sampling.n_threads;
    const std::chrono::seconds file_freq { parseDuration(
      settings.glm.file_freq) };
    prepareOutputDirectory(settings.io_files.patch_path);
    const std::string config { settings.getConfig() };

    Timer timer_read {};
    Timer timer_sample {};
    Timer timer_write {};
    for (const auto& date_str : settings.glm.file_dates) {
        const TimePoint date { parseDateTime(date_str) };
        printHeading("Lightning grid " + date_str);
        const std::string grid_filename { lightningGridFilename(
          settings.glm.path, date, file_freq, settings.glm.date_format) };
        if (!std::filesystem::exists(grid_filename)) {
            throw std::runtime_error { grid_filename + " not found" };
        }
        spdlog::info("Reading {}", grid_filename);
        timer_read.start();
        const LightningGrid grid { readLightningGrid(grid_filename) };
        timer_read.stop();

        timer_sample.start();
        const PatchDataset dataset { samplePatches(grid, locator, params) };
        timer_sample.stop();

        timer_write.start();
        writePatches(patchFilename(settings.io_files.patch_path,
                                   date,
                                   settings.glm.date_format),
                     config,
                     dataset,
                     settings.compress,
                     argc,
                     argv);
        timer_write.stop();
    }

    printHeading("Timings");
    spdlog::info("Reading lightning grids: {:8.3f} s", timer_read.time());
    spdlog::info("Sampling patches:        {:8.3f} s", timer_sample.time());
    spdlog::info("Writing output:          {:8.3f} s", timer_write.time());

    printHeading("Success");
}

} // namespace goes
