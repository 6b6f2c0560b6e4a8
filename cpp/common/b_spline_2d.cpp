// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "b_spline_2d.h"

#include <Eigen/SparseCholesky>
#include <stdexcept>

namespace goes {

// Find the matrix X = (A^T A + s R^T R)^-1 A^T for a 1D B-spline
// where A is the B-spline matrix and R the difference matrix.
static auto genInverse(BSpline& b_spline,
                       const Eigen::ArrayXd& x_values,
                       const double smoothing) -> Eigen::MatrixXd
{
    const Eigen::SparseMatrix<double> B_mat { b_spline.genBasis(x_values) };
    Eigen::SparseMatrix<double> normal { B_mat.transpose() * B_mat };
    if (smoothing > 0.0 && b_spline.nStates() > 2) {
        const Eigen::SparseMatrix<double> D_mat { b_spline.genPenalty() };
        normal += smoothing * Eigen::SparseMatrix<double>(D_mat.transpose()
                                                          * D_mat);
    }
    // The normal matrix is symmetric positive definite and banded
    const Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> ldlt { normal };
    if (ldlt.info() != Eigen::Success) {
        throw std::invalid_argument {
            "B-spline normal equations could not be factorized"
        };
    }
    const Eigen::MatrixXd B_mat_full(B_mat.transpose());
    return ldlt.solve(B_mat_full);
}

BSpline2D::BSpline2D(const int order,
                     const Eigen::ArrayXd& x_values_r,
                     const Eigen::ArrayXd& x_values_c,
                     const ArrayXXd& data,
                     const double smoothing)
{
    if (data.rows() != x_values_r.size() || data.cols() != x_values_c.size()) {
        throw std::invalid_argument {
            "data dimensions do not match the grid: "
            + std::to_string(data.rows()) + 'x' + std::to_string(data.cols())
            + " vs " + std::to_string(x_values_r.size()) + 'x'
            + std::to_string(x_values_c.size())
        };
    }
    if (smoothing < 0.0) {
        throw std::invalid_argument { "smoothing must be non-negative" };
    }
    // Initialize 1D B-splines across rows and columns of the input grid
    b_spline_r = { order, x_values_r };
    b_spline_c = { order, x_values_c };
    const Eigen::MatrixXd X { genInverse(b_spline_r, x_values_r, smoothing) };
    const Eigen::MatrixXd Y { genInverse(b_spline_c, x_values_c, smoothing) };
    // Control points are given by X P Y^T where P are the datapoints
    control_points = X * data.matrix() * Y.transpose();
}

// Given a target point x, find the knot interval i_x ... i_x+1 and
// only evaluate x for basis functions i_x-N ... i_x where N is the
// B-spline order. The rest of the basis functions do not contribute
// to the spline value at x.
static auto nonzeroBSplineValues(const BSpline& b_spline,
                                 const double x,
                                 std::vector<double>& control_points,
                                 std::vector<double>& b_spline_values) -> void
{
    const int i_x { b_spline.findInterval(x) };
    for (int k {}; k <= b_spline.getOrder(); ++k) {
        control_points[i_x - k] = 1.0;
        b_spline_values[k] = b_spline.deBoor(control_points, x);
        control_points[i_x - k] = 0.0;
    }
}

auto BSpline2D::evalPoint(const double x_r,
                          const double x_c,
                          std::vector<double>& control_points_tmp,
                          std::vector<double>& b_spline_r_values,
                          std::vector<double>& b_spline_c_values) const
  -> double
{
    const int i_r { b_spline_r.findInterval(x_r) };
    const int i_c { b_spline_c.findInterval(x_c) };
    nonzeroBSplineValues(b_spline_r, x_r, control_points_tmp, b_spline_r_values);
    nonzeroBSplineValues(b_spline_c, x_c, control_points_tmp, b_spline_c_values);
    double z {};
    for (int i {}; i <= b_spline_r.getOrder(); ++i) {
        for (int j {}; j <= b_spline_c.getOrder(); ++j) {
            z += control_points(i_r - i, i_c - j) * b_spline_r_values[i]
                 * b_spline_c_values[j];
        }
    }
    return z;
}

// Work array for evaluating B-spline at x for individual basis
// functions, large enough for both 1D B-splines.
static auto workArraySize(const BSpline& b_spline_r,
                          const BSpline& b_spline_c) -> size_t
{
    return static_cast<size_t>(
      std::max(b_spline_r.nStates(), b_spline_c.nStates())
      + b_spline_r.getOrder() + 1);
}

[[nodiscard]] auto BSpline2D::eval(const double x_r, const double x_c) const
  -> double
{
    std::vector<double> control_points_tmp(
      workArraySize(b_spline_r, b_spline_c), 0.0);
    std::vector<double> b_spline_r_values(b_spline_r.getOrder() + 1);
    std::vector<double> b_spline_c_values(b_spline_c.getOrder() + 1);
    return evalPoint(x_r,
                     x_c,
                     control_points_tmp,
                     b_spline_r_values,
                     b_spline_c_values);
}

[[nodiscard]] auto BSpline2D::eval(const ArrayXXd& x_r,
                                   const ArrayXXd& x_c) const -> ArrayXXd
{
    if (x_r.rows() != x_c.rows() || x_r.cols() != x_c.cols()) {
        throw std::invalid_argument {
            "row and column coordinates of target points differ in shape"
        };
    }
    ArrayXXd z(x_r.rows(), x_r.cols());
#pragma omp parallel
    {
        std::vector<double> control_points_tmp(
          workArraySize(b_spline_r, b_spline_c), 0.0);
        std::vector<double> b_spline_r_values(b_spline_r.getOrder() + 1);
        std::vector<double> b_spline_c_values(b_spline_c.getOrder() + 1);
#pragma omp for
        for (int i_row = 0; i_row < static_cast<int>(x_r.rows()); ++i_row) {
            for (int i_col {}; i_col < static_cast<int>(x_r.cols()); ++i_col) {
                z(i_row, i_col) = evalPoint(x_r(i_row, i_col),
                                            x_c(i_row, i_col),
                                            control_points_tmp,
                                            b_spline_r_values,
                                            b_spline_c_values);
            }
        }
    }
    return z;
}

} // namespace goes
