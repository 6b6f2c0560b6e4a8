// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

#include <omp.h>

namespace goes {

auto Timer::start() -> void
{
    if (omp_get_thread_num() == 0) {
        wall_timestamp = std::chrono::steady_clock::now();
    }
}

auto Timer::stop() -> void
{
    if (omp_get_thread_num() == 0) {
        const std::chrono::duration<double> elapsed {
            std::chrono::steady_clock::now() - wall_timestamp
        };
        total_wall_time += elapsed.count();
    }
}

} // namespace goes
