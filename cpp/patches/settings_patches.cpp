// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_patches.h"

#include <common/io.h>
#include <common/time.h>
#include <spdlog/spdlog.h>

namespace goes {

auto SettingsPatches::scanKeys() -> void
{
    scan(processing_version);
    scan(compress);

    scan(abi.path);
    scan(abi.channels);
    scan(abi.time_range_minutes);
    scan(abi.product);
    scan(abi.satellite);
    scan(abi.file_date);
    scan(abi.search_adjacent_days);

    scan(glm.path);
    scan(glm.file_dates);
    scan(glm.file_freq);
    scan(glm.date_format);

    scan(sampling.lead_time);
    scan(sampling.patch_x_pixels);
    scan(sampling.patch_y_pixels);
    scan(sampling.samples_per_time);
    scan(sampling.seed);
    scan(sampling.n_threads);

    scan(io_files.patch_path);
}

auto SettingsPatches::checkParameters() -> void
{
    checkPresenceOfDirectory(abi.path);
    checkPresenceOfDirectory(glm.path);
    if (io_files.patch_path.empty()) {
        throw std::runtime_error { "missing " + io_files.patch_path.keyToStr() };
    }
    if (abi.channels.empty()) {
        throw std::invalid_argument { abi.channels.keyToStr()
                                      + " must not be empty" };
    }
    for (const int channel : abi.channels) {
        if (channel < goes::abi::first_band
            || channel > goes::abi::last_band) {
            throw std::invalid_argument {
                abi.channels.keyToStr() + " contains invalid band "
                + std::to_string(channel) + ", valid bands are "
                + std::to_string(goes::abi::first_band) + ".."
                + std::to_string(goes::abi::last_band)
            };
        }
    }
    if (!(abi.time_range_minutes >= 0.0)) {
        throw std::invalid_argument { abi.time_range_minutes.keyToStr()
                                      + " must be non-negative" };
    }
    if (glm.file_dates.empty()) {
        spdlog::warn("{} is empty, nothing to do", glm.file_dates.keyToStr());
    }
    // Fail early on malformed dates and durations
    for (const auto& date : glm.file_dates) {
        static_cast<void>(parseDateTime(date));
    }
    static_cast<void>(parseDuration(glm.file_freq));
    static_cast<void>(parseDuration(sampling.lead_time));
    if (sampling.patch_x_pixels <= 0 || sampling.patch_y_pixels <= 0) {
        throw std::invalid_argument { "patch dimensions must be positive" };
    }
    if (sampling.samples_per_time < 0) {
        throw std::invalid_argument { sampling.samples_per_time.keyToStr()
                                      + " must be non-negative" };
    }
    if (sampling.n_threads < 1) {
        throw std::invalid_argument { sampling.n_threads.keyToStr()
                                      + " must be at least 1" };
    }
}

} // namespace goes
