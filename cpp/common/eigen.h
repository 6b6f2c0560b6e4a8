// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>

// This array is used for all image-like data (radiances, coordinate
// grids, patches). Row-major access matches the (y, x) layout of ABI
// granules and makes it easy to read and write NetCDF variables
// because NetCDF is row-major. For linear algebra operations, where
// needed, we'll make use of the normal Eigen::Matrix class.
using ArrayXXd =
  Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using ArrayXXi =
  Eigen::Array<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
