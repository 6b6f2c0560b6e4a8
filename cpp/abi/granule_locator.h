// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Find the ABI file of one channel closest in time to a requested
// time. Files are expected in day directories root/YYYYMMDD/ and the
// time of a file is taken from its name. The locator only reads
// directory listings and is safe to share between threads.

#pragma once

#include <common/constants.h>
#include <common/time.h>
#include <stdexcept>

namespace goes {

// No granule within the tolerance. nearestMiss is the time difference
// of the closest candidate in minutes, or infinity if there were no
// candidates at all.
class GranuleNotFound : public std::runtime_error
{
private:
    double nearest_miss {};

public:
    GranuleNotFound(const std::string& message, const double nearest_miss)
      : std::runtime_error { message }, nearest_miss { nearest_miss }
    {}
    [[nodiscard]] auto nearestMiss() const -> double { return nearest_miss; }
};

class GranuleLocator
{
private:
    std::string search_root {};
    std::string product {};
    std::string satellite {};
    GranuleTime file_date {};
    bool search_adjacent_days {};

public:
    // If search_adjacent_days is set, all day directories touched by
    // the tolerance window are searched instead of only the directory
    // of the requested day.
    explicit GranuleLocator(const std::string& search_root,
                            const std::string& product = "ABI-L1b-RadC",
                            const std::string& satellite = "G16",
                            const GranuleTime file_date = GranuleTime::end,
                            const bool search_adjacent_days = false);
    // Return the path of the file of the given channel whose timestamp
    // (start, end, or creation time as chosen in the constructor) is
    // closest to time. Of equally close files the first in name order
    // wins. Throws GranuleNotFound if the closest file is more than
    // tolerance_minutes away.
    [[nodiscard]] auto locate(const TimePoint time,
                              const int channel,
                              const double tolerance_minutes) const
      -> std::string;
};

} // namespace goes
