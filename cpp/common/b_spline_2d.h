// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for generating and evaluating 2D B-splines on a rectilinear
// input grid. Example usage:
//   // Initialize a 3-order b-spline with the grid coordinates across
//   // rows and columns and a set of data points on that grid.
//   BSpline2D spline { 3, rows, cols, data };
//   // Evaluate b-spline for some argument
//   spline.eval(arg_r, arg_c);

#pragma once

#include "b_spline.h"
#include "eigen.h"

namespace goes {

class BSpline2D
{
private:
    // 1D B-spline across rows of the input grid
    BSpline b_spline_r {};
    // 1D B-spline across columns of the input grid
    BSpline b_spline_c {};
    // Control point matrix with dimensions Nr x Nc where Nr is the
    // number of B-spline states across rows (see BSpline::nStates).
    Eigen::MatrixXd control_points {};
    // Evaluate the spline at one point using preallocated work arrays
    auto evalPoint(const double x_r,
                   const double x_c,
                   std::vector<double>& control_points_tmp,
                   std::vector<double>& b_spline_r_values,
                   std::vector<double>& b_spline_c_values) const -> double;

public:
    BSpline2D() = default;
    // Construct 1D B-splines and solve the 2D B-spline equation to
    // find the control points:
    //
    //   (A^T A + s R^T R) Q (B^T B + s S^T S) - A^T P B = 0,
    //
    // where A is the B-spline matrix across rows, B the B-spline
    // matrix across columns, R and S the corresponding second-order
    // difference matrices, s the smoothing weight, P is a set of data
    // points on the input grid, and Q is a set of control points. The
    // control points can be expressed as
    //
    //   Q = X P Y^T,
    //   X = (A^T A + s R^T R)^-1 A^T,
    //   Y = (B^T B + s S^T S)^-1 B^T,
    //
    // where X and Y are found by solving
    //
    //   (A^T A + s R^T R) X = A^T,
    //   (B^T B + s S^T S) Y = B^T.
    //
    // With s = 0 the spline interpolates the data.
    //
    // Parameters
    // ----------
    // order
    //     B-spline order, same in both directions
    // x_values_r
    //     Input grid coordinates across rows (ascending), to be used
    //     as the B-spline knots.
    // x_values_c
    //     Input grid coordinates across columns (ascending)
    // data
    //     Data values on the input grid, dimensions
    //     x_values_r.size() x x_values_c.size().
    // smoothing
    //     Weight of the roughness penalty, non-negative
    BSpline2D(const int order,
              const Eigen::ArrayXd& x_values_r,
              const Eigen::ArrayXd& x_values_c,
              const ArrayXXd& data,
              const double smoothing = 0.0);
    // Evaluate the 2D B-spline at one point. The result can be
    // expressed as
    //
    //   z(x_r,x_c) = Sum_i Sum_j N_i(x_r) N_j(x_c) Q_ij,
    //
    // where N_i is the ith B-spline basis function across rows and
    // N_j the jth basis function across columns. While the sum
    // formally runs over all basis functions in both directions, in
    // practice only the non-zero basis functions are evaluated by
    // making use of de Boor's algorithm.
    [[nodiscard]] auto eval(const double x_r, const double x_c) const
      -> double;
    // Evaluate for points on a target grid (can be irregular)
    [[nodiscard]] auto eval(const ArrayXXd& x_r, const ArrayXXd& x_c) const
      -> ArrayXXd;
};

} // namespace goes
