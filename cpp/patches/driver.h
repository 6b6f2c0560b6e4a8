// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace goes {

class SettingsPatches;

// Extract patches for every configured lightning grid file and write
// one patch file per grid file. argc and argv are for generating the
// history attribute.
auto driver(const SettingsPatches& settings,
            const int argc = 0,
            const char* const argv[] = nullptr) -> void;

} // namespace goes
