// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time.h"

#include <array>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace goes {

constexpr int date_size { 100 };

auto getDate() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date[date_size] {};
    std::strftime(
      date, date_size * sizeof(char), "%Y %B %d %a UTC%z", std::localtime(&t));
    return date;
}

auto getDateAndTime() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date_and_time[date_size] {};
    std::strftime(
      date_and_time, date_size * sizeof(char), "%FT%TZ", std::gmtime(&t));
    return date_and_time;
}

[[nodiscard]] auto formatTime(const TimePoint time,
                              const std::string& format) -> std::string
{
    const std::time_t t { std::chrono::system_clock::to_time_t(time) };
    std::tm tm {};
    gmtime_r(&t, &tm);
    char buf[date_size] {};
    if (std::strftime(buf, date_size * sizeof(char), format.c_str(), &tm)
        == 0) {
        throw std::invalid_argument { "cannot format time with \"" + format
                                      + '"' };
    }
    return buf;
}

// Build a time point from calendar fields, checking that the date
// exists.
static auto toTimePoint(const int year,
                        const unsigned month,
                        const unsigned day,
                        const int hour,
                        const int minute,
                        const int second) -> TimePoint
{
    const std::chrono::year_month_day ymd { std::chrono::year { year },
                                            std::chrono::month { month },
                                            std::chrono::day { day } };
    if (!ymd.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59
        || second < 0 || second > 60) {
        throw std::invalid_argument { "invalid date or time of day" };
    }
    return std::chrono::sys_days { ymd } + std::chrono::hours { hour }
           + std::chrono::minutes { minute } + std::chrono::seconds { second };
}

[[nodiscard]] auto parseDateTime(const std::string& str) -> TimePoint
{
    constexpr std::array formats { "%Y-%m-%dT%H:%M:%S",
                                   "%Y-%m-%d %H:%M:%S",
                                   "%Y-%m-%d" };
    for (const char* format : formats) {
        std::tm tm {};
        std::istringstream ss { str };
        ss >> std::get_time(&tm, format);
        // The whole string must be consumed
        if (!ss.fail() && ss.peek() == std::char_traits<char>::eof()) {
            return toTimePoint(tm.tm_year + 1900,
                               static_cast<unsigned>(tm.tm_mon + 1),
                               static_cast<unsigned>(tm.tm_mday),
                               tm.tm_hour,
                               tm.tm_min,
                               tm.tm_sec);
        }
    }
    throw std::invalid_argument { "cannot parse date: " + str };
}

[[nodiscard]] auto parseDayOfYearStamp(const std::string& stamp) -> TimePoint
{
    constexpr size_t stamp_size { 13 };
    if (stamp.size() != stamp_size
        || stamp.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument { "invalid YYYYJJJHHMMSS timestamp: "
                                      + stamp };
    }
    const int year { std::stoi(stamp.substr(0, 4)) };
    const int day_of_year { std::stoi(stamp.substr(4, 3)) };
    const std::chrono::year y { year };
    const int days_in_year { y.is_leap() ? 366 : 365 };
    if (day_of_year < 1 || day_of_year > days_in_year) {
        throw std::invalid_argument { "invalid day of year in timestamp: "
                                      + stamp };
    }
    const TimePoint new_year { toTimePoint(year,
                                           1,
                                           1,
                                           std::stoi(stamp.substr(7, 2)),
                                           std::stoi(stamp.substr(9, 2)),
                                           std::stoi(stamp.substr(11, 2))) };
    return new_year + std::chrono::days { day_of_year - 1 };
}

// Length of one unit of time in seconds
static const std::map<std::string, double> unit_to_seconds {
    { "D", 86400.0 },       { "d", 86400.0 },     { "day", 86400.0 },
    { "days", 86400.0 },    { "h", 3600.0 },      { "H", 3600.0 },
    { "hour", 3600.0 },     { "hours", 3600.0 },  { "min", 60.0 },
    { "T", 60.0 },          { "minute", 60.0 },   { "minutes", 60.0 },
    { "s", 1.0 },           { "S", 1.0 },         { "second", 1.0 },
    { "seconds", 1.0 },     { "ms", 1e-3 },       { "milliseconds", 1e-3 },
    { "us", 1e-6 },         { "microseconds", 1e-6 },
    { "ns", 1e-9 },         { "nanoseconds", 1e-9 },
};

[[nodiscard]] auto parseDuration(const std::string& str)
  -> std::chrono::seconds
{
    const auto unit_pos { str.find_first_not_of("+-0123456789.") };
    const std::string number { str.substr(0, unit_pos) };
    const std::string unit { unit_pos == std::string::npos
                               ? "min"
                               : str.substr(unit_pos) };
    if (number.empty() || !unit_to_seconds.contains(unit)) {
        throw std::invalid_argument { "cannot parse duration: " + str };
    }
    return std::chrono::seconds { std::llround(std::stod(number)
                                               * unit_to_seconds.at(unit)) };
}

[[nodiscard]] auto decodeCFTimes(const std::vector<double>& values,
                                 const std::string& units)
  -> std::vector<TimePoint>
{
    const std::string separator { " since " };
    const auto pos { units.find(separator) };
    if (pos == std::string::npos
        || !unit_to_seconds.contains(units.substr(0, pos))) {
        throw std::invalid_argument { "unsupported time units: " + units };
    }
    const double factor { unit_to_seconds.at(units.substr(0, pos)) };
    const TimePoint reference { parseDateTime(
      units.substr(pos + separator.size())) };
    std::vector<TimePoint> times(values.size());
    for (size_t i {}; i < values.size(); ++i) {
        times[i] = reference
                   + std::chrono::seconds { std::llround(values[i] * factor) };
    }
    return times;
}

[[nodiscard]] auto minutesBetween(const TimePoint a,
                                  const TimePoint b) -> double
{
    return std::abs(static_cast<double>((a - b).count())) / 60.0;
}

} // namespace goes
