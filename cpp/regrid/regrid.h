// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Resampling of an image from one map projection to another using a
// bivariate B-spline fitted to the source image

#pragma once

#include <common/eigen.h>

namespace goes {

class Projection;

struct SplineOptions
{
    // B-spline order (polynomial degree) in both directions
    int order { 3 };
    // Weight of the second-difference roughness penalty. With 0 the
    // spline interpolates the source image.
    double smoothing {};
};

// Resample an image given on the rectilinear grid (y_src, x_src) of
// proj_src onto the points (x_dst, y_dst) of proj_dst. Rows of the
// image follow y_src and columns follow x_src. The axes must be
// strictly monotonic, either increasing or decreasing. The result has
// the shape of x_dst. Destination points that have no image in the
// source projection or lie more than half a grid spacing outside the
// source grid are NaN.
[[nodiscard]] auto regrid(const ArrayXXd& image,
                          const Eigen::ArrayXd& x_src,
                          const Eigen::ArrayXd& y_src,
                          const ArrayXXd& x_dst,
                          const ArrayXXd& y_dst,
                          const Projection& proj_src,
                          const Projection& proj_dst,
                          const SplineOptions& options = {}) -> ArrayXXd;

} // namespace goes
