// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "algorithm.h"

#include <cmath>
#include <stdexcept>

namespace goes {

[[nodiscard]] auto binaryFindIdx(const Eigen::ArrayXd& list,
                                 const double x) -> int
{
    int i_begin {};
    int i_end { static_cast<int>(list.size() - 1) };
    if (x <= list(0)) {
        return i_begin;
    }
    if (x >= list(list.size() - 1)) {
        return i_end;
    }
    while (true) {
        const int i_mid { (i_begin + i_end) / 2 };
        if (x < list(i_mid)) {
            i_end = i_mid - 1;
        } else if (x < list(i_mid + 1)) {
            return i_mid;
        } else {
            i_begin = i_mid + 1;
        }
    }
}

[[nodiscard]] auto nearestIdx(const Eigen::ArrayXd& list,
                              const double x) -> int
{
    if (list.size() == 0 || !std::isfinite(x)) {
        throw std::invalid_argument {
            "nearest index search requires a finite value and a nonempty "
            "list"
        };
    }
    int idx {};
    double min_diff { std::abs(list(0) - x) };
    for (int i { 1 }; i < static_cast<int>(list.size()); ++i) {
        if (const double diff { std::abs(list(i) - x) }; diff < min_diff) {
            min_diff = diff;
            idx = i;
        }
    }
    return idx;
}

} // namespace goes
