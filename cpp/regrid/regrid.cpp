// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "regrid.h"

#include <abi/projection.h>
#include <cmath>
#include <common/b_spline_2d.h>
#include <spdlog/spdlog.h>

namespace goes {

// Check that an axis is strictly monotonic and return whether it is
// decreasing
static auto isDecreasing(const Eigen::ArrayXd& axis,
                         const std::string& name) -> bool
{
    if (!axis.isFinite().all()) {
        throw std::invalid_argument { name + " axis must be finite" };
    }
    const Eigen::ArrayXd diff { axis.tail(axis.size() - 1)
                                - axis.head(axis.size() - 1) };
    if ((diff > 0.0).all()) {
        return false;
    }
    if ((diff < 0.0).all()) {
        return true;
    }
    throw std::invalid_argument { name + " axis must be strictly monotonic" };
}

// Range of coordinates covered by an ascending axis, extended by half
// a grid spacing on both sides
static auto axisExtent(const Eigen::ArrayXd& axis) -> std::pair<double, double>
{
    const Eigen::Index n { axis.size() };
    return { axis(0) - 0.5 * (axis(1) - axis(0)),
             axis(n - 1) + 0.5 * (axis(n - 1) - axis(n - 2)) };
}

[[nodiscard]] auto regrid(const ArrayXXd& image,
                          const Eigen::ArrayXd& x_src,
                          const Eigen::ArrayXd& y_src,
                          const ArrayXXd& x_dst,
                          const ArrayXXd& y_dst,
                          const Projection& proj_src,
                          const Projection& proj_dst,
                          const SplineOptions& options) -> ArrayXXd
{
    if (image.rows() != y_src.size() || image.cols() != x_src.size()) {
        throw std::invalid_argument {
            "image dimensions (" + std::to_string(image.rows()) + 'x'
            + std::to_string(image.cols()) + ") do not match the source axes ("
            + std::to_string(y_src.size()) + 'x' + std::to_string(x_src.size())
            + ")"
        };
    }
    if (x_dst.rows() != y_dst.rows() || x_dst.cols() != y_dst.cols()) {
        throw std::invalid_argument { "destination x and y grids differ in "
                                      "shape" };
    }
    if (options.order < 1 || options.order > BSpline::max_order) {
        throw std::invalid_argument { "invalid spline order "
                                      + std::to_string(options.order) };
    }
    if (x_src.size() < options.order + 1 || y_src.size() < options.order + 1) {
        throw std::invalid_argument {
            "a spline of order " + std::to_string(options.order)
            + " requires at least " + std::to_string(options.order + 1)
            + " points along each source axis"
        };
    }
    if (!image.isFinite().all()) {
        throw std::invalid_argument { "source image contains non-finite "
                                      "values" };
    }

    // The spline is always fitted on ascending axes
    Eigen::ArrayXd x_axis { x_src };
    Eigen::ArrayXd y_axis { y_src };
    ArrayXXd data { image };
    if (isDecreasing(x_src, "x")) {
        x_axis.reverseInPlace();
        data = data.rowwise().reverse().eval();
    }
    if (isDecreasing(y_src, "y")) {
        y_axis.reverseInPlace();
        data = data.colwise().reverse().eval();
    }
    const BSpline2D spline {
        options.order, y_axis, x_axis, data, options.smoothing
    };

    // Destination points in source coordinates
    ArrayXXd x_proj {};
    ArrayXXd y_proj {};
    transformPoints(proj_dst, proj_src, x_dst, y_dst, x_proj, y_proj);

    const std::pair<double, double> x_extent { axisExtent(x_axis) };
    const std::pair<double, double> y_extent { axisExtent(y_axis) };
    const auto inside { [&x_extent, &y_extent](const double x,
                                               const double y) {
        return std::isfinite(x) && std::isfinite(y) && x >= x_extent.first
               && x <= x_extent.second && y >= y_extent.first
               && y <= y_extent.second;
    } };
    // Points without a valid source location are evaluated at a
    // harmless location and masked afterwards.
    ArrayXXd x_eval(x_proj.rows(), x_proj.cols());
    ArrayXXd y_eval(x_proj.rows(), x_proj.cols());
    int n_outside {};
    for (Eigen::Index i {}; i < x_proj.size(); ++i) {
        const bool valid { inside(x_proj.data()[i], y_proj.data()[i]) };
        x_eval.data()[i] = valid ? x_proj.data()[i] : x_axis(0);
        y_eval.data()[i] = valid ? y_proj.data()[i] : y_axis(0);
        if (!valid) {
            ++n_outside;
        }
    }
    ArrayXXd result { spline.eval(y_eval, x_eval) };
    for (Eigen::Index i {}; i < x_proj.size(); ++i) {
        if (!inside(x_proj.data()[i], y_proj.data()[i])) {
            result.data()[i] = fill::nan;
        }
    }
    if (n_outside > 0) {
        spdlog::debug("regrid: {} of {} destination points outside the "
                      "source grid",
                      n_outside,
                      x_proj.size());
    }
    return result;
}

} // namespace goes
