// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Random sampling of ABI patches centered on lightning grid cells

#pragma once

#include <chrono>
#include <common/time.h>
#include <vector>

namespace goes {

class GranuleLocator;
struct LightningGrid;
struct PatchDataset;

struct SamplingParameters
{
    // ABI bands to extract
    std::vector<int> channels {};
    // The satellite image is taken at lightning time - lead_time
    std::chrono::seconds lead_time {};
    int patch_width { 32 };
    int patch_height { 32 };
    int samples_per_time { 100 };
    // Tolerance for matching granules to the observation time
    double time_range_minutes { 11.0 };
    int seed {};
    // Number of time steps processed concurrently
    int n_threads { 1 };
};

// Draw n_samples distinct indices from 0..n_cells-1 uniformly without
// replacement. The generator is seeded with (seed, step) so each time
// step has its own reproducible draw.
[[nodiscard]] auto sampleCells(const int n_cells,
                               const int n_samples,
                               const int seed,
                               const int step) -> std::vector<int>;

// For every time of the lightning grid, open the ABI image closest to
// the observation time, sample grid cells, and extract one patch
// around each sampled cell. Patch t * samples_per_time + s of the
// result is sample s of time step t. The first failure of any time
// step aborts the run and is rethrown after all images are closed.
[[nodiscard]] auto samplePatches(const LightningGrid& grid,
                                 const GranuleLocator& locator,
                                 const SamplingParameters& params)
  -> PatchDataset;

// Path of the lightning grid file glm_grid_s<start>_e<end>.nc that
// covers date..date+freq
[[nodiscard]] auto lightningGridFilename(const std::string& path,
                                         const TimePoint date,
                                         const std::chrono::seconds freq,
                                         const std::string& date_format)
  -> std::string;

// Path of the output file abi_patches_<date>.nc
[[nodiscard]] auto patchFilename(const std::string& path,
                                 const TimePoint date,
                                 const std::string& date_format)
  -> std::string;

} // namespace goes
