// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Flattened collection of ABI patches with their lightning labels.
// Patch n occupies the n-th block of every per-patch array. Image data
// are stored in the (patch, y, x, band) order of the output file.

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace goes {

struct PatchDataset
{
    int n_patches {};
    // Patch dimensions in pixels
    int n_y {};
    int n_x {};
    // ABI band number of each entry along the last dimension of abi
    std::vector<int> bands {};
    // Radiances, n_patches x n_y x n_x x bands.size(). Parts of the
    // window outside the ABI image are NaN.
    std::vector<float> abi {};
    // Lightning grid time of each patch, seconds since 1970-01-01
    std::vector<int64_t> time {};
    // Pixel centers, n_patches x n_y x n_x
    std::vector<float> lon {};
    std::vector<float> lat {};
    // Lightning count of the grid cell the patch is centered on
    std::vector<int> flash_counts {};
    // Grid cell the patch is centered on
    std::vector<int> row {};
    std::vector<int> col {};

    PatchDataset() = default;
    // Allocate all arrays and fill the image data with NaN
    PatchDataset(const int n_patches,
                 const int n_y,
                 const int n_x,
                 const std::vector<int>& bands);
    [[nodiscard]] auto nBands() const -> int
    {
        return static_cast<int>(bands.size());
    }
    // Flat index of element (i_patch, i_y, i_x, i_band) of abi
    [[nodiscard]] auto abiIdx(const int i_patch,
                              const int i_y,
                              const int i_x,
                              const int i_band) const -> size_t
    {
        return ((static_cast<size_t>(i_patch) * n_y + i_y) * n_x + i_x)
                 * bands.size()
               + i_band;
    }
    // Flat index of element (i_patch, i_y, i_x) of lon and lat
    [[nodiscard]] auto pixelIdx(const int i_patch,
                                const int i_y,
                                const int i_x) const -> size_t
    {
        return (static_cast<size_t>(i_patch) * n_y + i_y) * n_x + i_x;
    }
};

} // namespace goes
