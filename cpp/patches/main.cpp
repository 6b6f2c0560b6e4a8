// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"
#include "settings_patches.h"

#include <common/io.h>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>

auto main(int argc, char* argv[]) -> int
{
    std::cout.precision(16);
    if (argc == 1) {
        // When called without an argument print the default
        // configuration.
        std::cout << "%YAML 1.2\n---\n"
                  << goes::SettingsPatches {}.c_str() << '\n';
        return EXIT_SUCCESS;
    }
    try {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        goes::SettingsPatches settings { argv[1] };
        settings.init();
        goes::driver(settings, argc, argv);
    } catch (const std::exception& e) {
        goes::initLogging();
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
