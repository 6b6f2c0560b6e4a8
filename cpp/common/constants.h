// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <limits>

namespace goes {

namespace fill {

// Invalid floating point value (off-Earth pixels, padding of edge
// patches, failed projections)
constexpr double nan { std::numeric_limits<double>::quiet_NaN() };

} // namespace fill

namespace math {

// Multiply with this factor to convert from degrees to radians
constexpr double deg_to_rad { 0.017453292519943295 };

} // namespace math

// GRS80 ellipsoid, used by the GOES-R ground system. Granules carry
// the axes in goes_imager_projection and these are only the
// defaults.
namespace earth {

constexpr double a { 6378137.0 };
constexpr double b { 6356752.31414 };

} // namespace earth

namespace abi {

// Valid ABI band (channel) numbers
constexpr int first_band { 1 };
constexpr int last_band { 16 };
// Nominal perspective point height of GOES-R satellites [m]
constexpr double perspective_point_height { 35786023.0 };

} // namespace abi

// Which of the three timestamps encoded in an ABI file name to match
// against.
enum class GranuleTime
{
    start,
    end,
    creation,
};

} // namespace goes
