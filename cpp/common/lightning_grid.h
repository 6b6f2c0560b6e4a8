// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Gridded GLM lightning counts read from one grid file

#pragma once

#include "eigen.h"
#include "time.h"

namespace goes {

struct LightningGrid
{
    // Nominal time of each count map
    std::vector<TimePoint> time {};
    // Cell centers, dimensions n_rows x n_cols [deg]
    ArrayXXd lon {};
    ArrayXXd lat {};
    // One n_rows x n_cols count map per time
    std::vector<ArrayXXi> counts {};

    [[nodiscard]] auto nTimes() const -> int
    {
        return static_cast<int>(time.size());
    }
    [[nodiscard]] auto nRows() const -> int
    {
        return static_cast<int>(lon.rows());
    }
    [[nodiscard]] auto nCols() const -> int
    {
        return static_cast<int>(lon.cols());
    }
};

} // namespace goes
