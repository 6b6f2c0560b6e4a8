// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Co-registered ABI granules of several channels for one nominal
// time along with the image geometry. The lon/lat grid is computed
// once during construction. Radiances are read only for requested
// patches.

#pragma once

#include "granule.h"

namespace goes {

class GranuleLocator;

// A block of the image cut around a center pixel. The block is
// smaller than the requested window at image edges. Element (0, 0) of
// the block is element (row_offset, col_offset) of the requested
// window.
struct Patch
{
    // Requested window size in pixels
    int width {};
    int height {};
    // Position of the block in the requested window
    int row_offset {};
    int col_offset {};
    // Position of the block in the image
    int row_beg {};
    int col_beg {};
    // Center pixel in the image
    int center_row {};
    int center_col {};
    // ABI band numbers, ascending
    std::vector<int> channels {};
    // One block of radiances per channel
    std::vector<ArrayXXd> radiance {};
    ArrayXXd lon {};
    ArrayXXd lat {};

    [[nodiscard]] auto nRows() const -> int
    {
        return static_cast<int>(lon.rows());
    }
    [[nodiscard]] auto nCols() const -> int
    {
        return static_cast<int>(lon.cols());
    }
};

class SatelliteImage
{
private:
    TimePoint time {};
    std::vector<int> channels {};
    // One granule per channel in the same order as channels
    std::vector<Granule> granules {};
    std::unique_ptr<GeosProjection> projection {};
    // Pixel center coordinates [m]
    Eigen::ArrayXd x {};
    Eigen::ArrayXd y {};
    // Pixel centers [deg], NaN off the Earth disk
    ArrayXXd lon {};
    ArrayXXd lat {};

public:
    // Locate and open one granule per channel. The channel with the
    // lowest number is the reference that defines the projection and
    // the grid. Throws if any granule is missing or if the granules
    // differ in projection or grid size.
    SatelliteImage(const TimePoint time,
                   const std::vector<int>& channels,
                   const GranuleLocator& locator,
                   const double tolerance_minutes);
    SatelliteImage(const SatelliteImage&) = delete;
    auto operator=(const SatelliteImage&) -> SatelliteImage& = delete;

    // Requested time
    [[nodiscard]] auto getTime() const -> TimePoint { return time; }
    // Start time of the reference granule
    [[nodiscard]] auto observationTime() const -> TimePoint;
    [[nodiscard]] auto getChannels() const -> const std::vector<int>&
    {
        return channels;
    }
    [[nodiscard]] auto getGranule(const int channel) const -> const Granule&;
    [[nodiscard]] auto getProjection() const -> const GeosProjection&
    {
        return *projection;
    }
    [[nodiscard]] auto getX() const -> const Eigen::ArrayXd& { return x; }
    [[nodiscard]] auto getY() const -> const Eigen::ArrayXd& { return y; }
    [[nodiscard]] auto getLon() const -> const ArrayXXd& { return lon; }
    [[nodiscard]] auto getLat() const -> const ArrayXXd& { return lat; }
    [[nodiscard]] auto nRows() const -> int
    {
        return static_cast<int>(y.size());
    }
    [[nodiscard]] auto nCols() const -> int
    {
        return static_cast<int>(x.size());
    }
    // Meshgrids of x and y, dimensions nRows x nCols
    [[nodiscard]] auto xGrid() const -> ArrayXXd;
    [[nodiscard]] auto yGrid() const -> ArrayXXd;
    // Pixel (row, col) closest to a geodetic location. Throws if the
    // location is not visible from the satellite.
    [[nodiscard]] auto nearestPixel(const double center_lon,
                                    const double center_lat) const
      -> std::pair<int, int>;
    // Cut a window of width x height pixels around the pixel nearest
    // to (center_lon, center_lat). The window starts height/2 rows
    // above and width/2 columns left of the center pixel (integer
    // division) and is clipped to the image.
    [[nodiscard]] auto extractPatch(const double center_lon,
                                    const double center_lat,
                                    const int width,
                                    const int height) const -> Patch;
    // Close all granules. Safe to call more than once.
    auto close() -> void;
    ~SatelliteImage();
};

} // namespace goes
