// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Time and date related functions. All times are UTC with a
// resolution of one second.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace goes {

using TimePoint = std::chrono::sys_seconds;

auto getDate() -> std::string;

// Format YYYY-mm-ddTHH:MM:SSZ
auto getDateAndTime() -> std::string;

// Format a time point using strftime conversion specifiers
[[nodiscard]] auto formatTime(const TimePoint time,
                              const std::string& format) -> std::string;

// Parse a date of the form YYYY-mm-dd, optionally followed by a time
// of day HH:MM:SS separated by 'T' or a space.
[[nodiscard]] auto parseDateTime(const std::string& str) -> TimePoint;

// Parse the compact timestamp of ABI file names: 4-digit year,
// 3-digit day of year, and 2 digits each for hour, minute, and
// second (YYYYJJJHHMMSS).
[[nodiscard]] auto parseDayOfYearStamp(const std::string& stamp) -> TimePoint;

// Parse a duration such as "30min", "1D", "6h", or "90s". A bare
// number is interpreted as minutes.
[[nodiscard]] auto parseDuration(const std::string& str)
  -> std::chrono::seconds;

// Convert values of a CF time variable to time points. The units
// attribute has the form "<unit> since <reference date>" where unit
// is one of days, hours, minutes, seconds, milliseconds,
// microseconds, or nanoseconds.
[[nodiscard]] auto decodeCFTimes(const std::vector<double>& values,
                                 const std::string& units)
  -> std::vector<TimePoint>;

// Absolute difference between two times in minutes
[[nodiscard]] auto minutesBetween(const TimePoint a,
                                  const TimePoint b) -> double;

} // namespace goes
