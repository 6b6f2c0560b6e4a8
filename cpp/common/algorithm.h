// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// General purpose search routines

#pragma once

#include <Eigen/Dense>

namespace goes {

// Do a binary search to locate an index n such that x falls in the
// range list[n]...list[n+1]. The list must be sorted in ascending
// order. Values outside the list return the first or last index.
[[nodiscard]] auto binaryFindIdx(const Eigen::ArrayXd& list,
                                 const double x) -> int;

// Return the index of the element closest to x (minimum absolute
// difference). This is a linear search and the list need not be
// sorted. If several elements are equally close, the first one is
// returned. Throws if x is not finite or the list is empty.
[[nodiscard]] auto nearestIdx(const Eigen::ArrayXd& list,
                              const double x) -> int;

} // namespace goes
