// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for generating and evaluating 1D B-splines. The data
// coordinates double as knots: interior knots are a subset of the
// data points so that the number of B-spline states equals the number
// of data points and a plain least squares fit interpolates the data.
// Example usage:
//   // Initialize 3-order b-spline with a set of knots
//   BSpline spline { 3, knots };
//   // Construct the b-spline matrix with a set of data x-coordinates
//   const Eigen::SparseMatrix<double> A { spline.genBasis(x_values) };
//   // Solve A C = P for control points C where P are the data values
//   ...
//   // Evaluate b-spline for some argument
//   spline.deBoor(C, 7.2);

#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace goes {

class BSpline
{
private:
    // B-spline knots with both endpoints padded
    Eigen::ArrayXd knots {};
    // B-spline (polynomial) order
    int order {};
    // Work array for controlling which splines are evaluated. This is
    // used in the construction of the B-spline matrix.
    std::vector<double> control_points_tmp {};

public:
    // Highest order supported by deBoor
    static constexpr int max_order { 19 };

    BSpline() = default;
    // The knots must be sorted in ascending order and there must be
    // at least order + 1 of them.
    BSpline(const int order, const Eigen::ArrayXd& knots);
    [[nodiscard]] auto getOrder() const -> int { return order; }
    // Size of the state vector for linear inversion. It is (order+1)
    // less than the number of padded knots.
    [[nodiscard]] auto nStates() const -> int;
    // Return index i such that x is in knots[i]..knots[i+1]
    [[nodiscard]] auto findInterval(const double x) const -> int;
    // Evaluate the B-spline using de Boor algorithm for a given set
    // of control points and argument x.
    [[nodiscard]] auto deBoor(const std::vector<double>& control_points,
                              const double x) const -> double;
    // Construct B-spline matrix for a set of data x-values
    auto genBasis(const Eigen::ArrayXd& x_data) -> Eigen::SparseMatrix<double>;
    // Second-order difference matrix acting on the B-spline states
    // (nStates-2 x nStates). D^T D penalizes roughness of the control
    // points in a smoothing (penalized least squares) fit.
    [[nodiscard]] auto genPenalty() const -> Eigen::SparseMatrix<double>;
    ~BSpline() = default;
};

} // namespace goes
