// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock timer for the processing steps of the driver. Calls to
// start and stop from threads other than the OpenMP master thread are
// ignored.

#pragma once

#include <chrono>

namespace goes {

class Timer
{
private:
    std::chrono::time_point<std::chrono::steady_clock> wall_timestamp;
    double total_wall_time {};

public:
    Timer() = default;
    auto start() -> void;
    // Stop the timer and add the elapsed time since the last start
    // to the total
    auto stop() -> void;
    // Total wall time in seconds accumulated between start/stop pairs
    [[nodiscard]] auto time() const -> double { return total_wall_time; }
};

} // namespace goes
