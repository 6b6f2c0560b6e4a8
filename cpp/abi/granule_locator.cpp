// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "granule_locator.h"

#include "granule.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <spdlog/spdlog.h>

namespace goes {

GranuleLocator::GranuleLocator(const std::string& search_root,
                               const std::string& product,
                               const std::string& satellite,
                               const GranuleTime file_date,
                               const bool search_adjacent_days)
  : search_root { search_root }
  , product { product }
  , satellite { satellite }
  , file_date { file_date }
  , search_adjacent_days { search_adjacent_days }
{}

// Day directories to be searched, in chronological order
static auto dayDirectories(const std::filesystem::path& root,
                           const TimePoint time,
                           const double tolerance_minutes,
                           const bool search_adjacent_days)
  -> std::vector<std::filesystem::path>
{
    if (!search_adjacent_days) {
        return { root / formatTime(time, "%Y%m%d") };
    }
    const std::chrono::seconds tolerance { static_cast<long long>(
      std::ceil(tolerance_minutes * 60.0)) };
    const auto first_day { std::chrono::floor<std::chrono::days>(time
                                                                 - tolerance) };
    const auto last_day { std::chrono::floor<std::chrono::days>(time
                                                                + tolerance) };
    std::vector<std::filesystem::path> dirs {};
    for (auto day { first_day }; day <= last_day; day += std::chrono::days { 1 }) {
        dirs.push_back(root
                       / formatTime(std::chrono::time_point_cast<
                                      std::chrono::seconds>(day),
                                    "%Y%m%d"));
    }
    return dirs;
}

[[nodiscard]] auto GranuleLocator::locate(const TimePoint time,
                                          const int channel,
                                          const double tolerance_minutes) const
  -> std::string
{
    if (!(tolerance_minutes >= 0.0)) {
        throw std::invalid_argument { "time tolerance must be non-negative" };
    }
    std::vector<std::filesystem::path> candidates {};
    for (const auto& dir : dayDirectories(
           search_root, time, tolerance_minutes, search_adjacent_days)) {
        if (!std::filesystem::is_directory(dir)) {
            spdlog::debug("granule directory {} does not exist", dir.string());
            continue;
        }
        std::vector<std::filesystem::path> dir_candidates {};
        for (const auto& entry : std::filesystem::directory_iterator { dir }) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto name { parseGranuleName(
              entry.path().filename().string()) };
            if (name && name->product == product
                && name->satellite == satellite && name->channel == channel) {
                dir_candidates.push_back(entry.path());
            }
        }
        std::ranges::sort(dir_candidates);
        candidates.insert(
          candidates.end(), dir_candidates.cbegin(), dir_candidates.cend());
    }

    const std::string description { product + " channel "
                                    + std::to_string(channel) + " at "
                                    + formatTime(time, "%Y-%m-%dT%H:%M:%SZ") };
    if (candidates.empty()) {
        throw GranuleNotFound { "no granules found for " + description,
                                std::numeric_limits<double>::infinity() };
    }
    // Linear search, first minimum wins
    size_t best {};
    double best_diff { std::numeric_limits<double>::infinity() };
    for (size_t i {}; i < candidates.size(); ++i) {
        const auto name { parseGranuleName(
          candidates[i].filename().string()) };
        const double diff { minutesBetween(name->time(file_date), time) };
        if (diff < best_diff) {
            best = i;
            best_diff = diff;
        }
    }
    if (best_diff > tolerance_minutes) {
        throw GranuleNotFound { "no granule within "
                                  + std::to_string(tolerance_minutes)
                                  + " min of " + description
                                  + ", nearest is "
                                  + std::to_string(best_diff) + " min away",
                                best_diff };
    }
    spdlog::debug("Channel {}: {} ({:.2f} min from requested time)",
                  channel,
                  candidates[best].string(),
                  best_diff);
    return candidates[best].string();
}

} // namespace goes
