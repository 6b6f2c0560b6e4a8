// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "patch_sampler.h"

#include <abi/granule_locator.h>
#include <abi/satellite_image.h>
#include <algorithm>
#include <atomic>
#include <common/io.h>
#include <common/lightning_grid.h>
#include <common/patch_dataset.h>
#include <exception>
#include <filesystem>
#include <iterator>
#include <numeric>
#include <random>
#include <spdlog/spdlog.h>

namespace goes {

[[nodiscard]] auto sampleCells(const int n_cells,
                               const int n_samples,
                               const int seed,
                               const int step) -> std::vector<int>
{
    if (n_samples < 0 || n_samples > n_cells) {
        throw std::invalid_argument {
            "cannot draw " + std::to_string(n_samples)
            + " distinct samples from " + std::to_string(n_cells) + " cells"
        };
    }
    std::seed_seq seq { static_cast<uint32_t>(seed),
                        static_cast<uint32_t>(step) };
    std::mt19937_64 generator { seq };
    std::vector<int> all_cells(n_cells);
    std::iota(all_cells.begin(), all_cells.end(), 0);
    std::vector<int> cells {};
    cells.reserve(n_samples);
    std::sample(all_cells.cbegin(),
                all_cells.cend(),
                std::back_inserter(cells),
                n_samples,
                generator);
    return cells;
}

// Copy a patch into the dataset at its position inside the window
static auto storePatch(const Patch& patch,
                       const int i_patch,
                       PatchDataset& dataset) -> void
{
    for (int i_row {}; i_row < patch.nRows(); ++i_row) {
        const int i_y { patch.row_offset + i_row };
        for (int i_col {}; i_col < patch.nCols(); ++i_col) {
            const int i_x { patch.col_offset + i_col };
            for (int i_band {}; i_band < dataset.nBands(); ++i_band) {
                dataset.abi[dataset.abiIdx(i_patch, i_y, i_x, i_band)] =
                  static_cast<float>(patch.radiance[i_band](i_row, i_col));
            }
            const size_t idx { dataset.pixelIdx(i_patch, i_y, i_x) };
            dataset.lon[idx] = static_cast<float>(patch.lon(i_row, i_col));
            dataset.lat[idx] = static_cast<float>(patch.lat(i_row, i_col));
        }
    }
}

// Sample all patches of one lightning grid time
static auto sampleTimeStep(const LightningGrid& grid,
                           const GranuleLocator& locator,
                           const SamplingParameters& params,
                           const int i_time,
                           PatchDataset& dataset) -> void
{
    const TimePoint label_time { grid.time[i_time] };
    const TimePoint obs_time { label_time - params.lead_time };
    const std::vector<int> cells { sampleCells(grid.nRows() * grid.nCols(),
                                               params.samples_per_time,
                                               params.seed,
                                               i_time) };
    SatelliteImage image {
        obs_time, params.channels, locator, params.time_range_minutes
    };
    spdlog::info("Lightning time {}, satellite time {}",
                 formatTime(label_time, "%Y-%m-%d %H:%M:%S"),
                 formatTime(image.observationTime(), "%Y-%m-%d %H:%M:%S"));
    for (int i_sample {}; i_sample < params.samples_per_time; ++i_sample) {
        const int i_patch { i_time * params.samples_per_time + i_sample };
        const int row { cells[i_sample] / grid.nCols() };
        const int col { cells[i_sample] % grid.nCols() };
        const Patch patch { image.extractPatch(grid.lon(row, col),
                                               grid.lat(row, col),
                                               params.patch_width,
                                               params.patch_height) };
        storePatch(patch, i_patch, dataset);
        dataset.time[i_patch] = label_time.time_since_epoch().count();
        dataset.flash_counts[i_patch] = grid.counts[i_time](row, col);
        dataset.row[i_patch] = row;
        dataset.col[i_patch] = col;
    }
    image.close();
}

[[nodiscard]] auto samplePatches(const LightningGrid& grid,
                                 const GranuleLocator& locator,
                                 const SamplingParameters& params)
  -> PatchDataset
{
    const int n_cells { grid.nRows() * grid.nCols() };
    if (params.samples_per_time < 0 || params.samples_per_time > n_cells) {
        throw std::invalid_argument {
            "samples per time (" + std::to_string(params.samples_per_time)
            + ") must be between 0 and the number of grid cells ("
            + std::to_string(n_cells) + ")"
        };
    }
    if (params.n_threads < 1) {
        throw std::invalid_argument { "number of threads must be at least 1" };
    }
    std::vector<int> bands { params.channels };
    std::ranges::sort(bands);
    PatchDataset dataset { grid.nTimes() * params.samples_per_time,
                           params.patch_height,
                           params.patch_width,
                           bands };
    if (dataset.n_patches == 0) {
        return dataset;
    }

    std::exception_ptr error {};
    std::atomic<bool> failed { false };
    int n_done {};
    // File access inside the loop is serialized by Granule
#pragma omp parallel for schedule(dynamic) num_threads(params.n_threads)
    for (int i_time = 0; i_time < grid.nTimes(); ++i_time) {
        if (failed) {
            continue;
        }
        try {
            sampleTimeStep(grid, locator, params, i_time, dataset);
        } catch (const std::exception&) {
#pragma omp critical
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
            failed = true;
        }
        int n_done_cur {};
#pragma omp atomic capture
        n_done_cur = ++n_done;
        printPercentage(n_done_cur, grid.nTimes(), "Sampling patches:");
    }
    if (error) {
        std::rethrow_exception(error);
    }
    return dataset;
}

[[nodiscard]] auto lightningGridFilename(const std::string& path,
                                         const TimePoint date,
                                         const std::chrono::seconds freq,
                                         const std::string& date_format)
  -> std::string
{
    return (std::filesystem::path { path }
            / ("glm_grid_s" + formatTime(date, date_format) + "_e"
               + formatTime(date + freq, date_format) + ".nc"))
      .string();
}

[[nodiscard]] auto patchFilename(const std::string& path,
                                 const TimePoint date,
                                 const std::string& date_format)
  -> std::string
{
    return (std::filesystem::path { path }
            / ("abi_patches_" + formatTime(date, date_format) + ".nc"))
      .string();
}

} // namespace goes
