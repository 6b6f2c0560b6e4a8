// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "patch_dataset.h"

#include <limits>
#include <stdexcept>

namespace goes {

PatchDataset::PatchDataset(const int n_patches,
                           const int n_y,
                           const int n_x,
                           const std::vector<int>& bands)
  : n_patches { n_patches }, n_y { n_y }, n_x { n_x }, bands { bands }
{
    if (n_patches < 0 || n_y <= 0 || n_x <= 0 || bands.empty()) {
        throw std::invalid_argument { "invalid patch dataset dimensions" };
    }
    constexpr float nan { std::numeric_limits<float>::quiet_NaN() };
    const size_t n_pixels { static_cast<size_t>(n_patches) * n_y * n_x };
    abi.assign(n_pixels * bands.size(), nan);
    lon.assign(n_pixels, nan);
    lat.assign(n_pixels, nan);
    time.assign(n_patches, 0);
    flash_counts.assign(n_patches, 0);
    row.assign(n_patches, 0);
    col.assign(n_patches, 0);
}

} // namespace goes
