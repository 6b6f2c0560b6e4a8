// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "satellite_image.h"

#include "granule_locator.h"

#include <algorithm>
#include <common/algorithm.h>
#include <spdlog/spdlog.h>
#include <tuple>

namespace goes {

SatelliteImage::SatelliteImage(const TimePoint time,
                               const std::vector<int>& channels,
                               const GranuleLocator& locator,
                               const double tolerance_minutes)
  : time { time }, channels { channels }
{
    if (channels.empty()) {
        throw std::invalid_argument { "no ABI channels requested" };
    }
    std::ranges::sort(this->channels);
    if (std::ranges::adjacent_find(this->channels) != this->channels.end()) {
        throw std::invalid_argument { "duplicate ABI channel requested" };
    }
    for (const int channel : this->channels) {
        if (channel < abi::first_band || channel > abi::last_band) {
            throw std::invalid_argument { "invalid ABI channel "
                                          + std::to_string(channel) };
        }
    }
    // Granules opened so far are closed by their destructors if
    // anything below throws.
    granules.reserve(this->channels.size());
    for (const int channel : this->channels) {
        granules.emplace_back(
          locator.locate(time, channel, tolerance_minutes));
    }

    // The reference channel defines the geometry
    const Granule& ref { granules.front() };
    for (const Granule& granule : granules) {
        if (granule.projectionParameters() != ref.projectionParameters()) {
            throw std::invalid_argument {
                "projection of " + granule.getFilename() + " differs from "
                + ref.getFilename()
            };
        }
        if (granule.nRows() != ref.nRows() || granule.nCols() != ref.nCols()) {
            throw std::invalid_argument {
                "grid of " + granule.getFilename() + " ("
                + std::to_string(granule.nRows()) + 'x'
                + std::to_string(granule.nCols()) + ") differs from "
                + ref.getFilename() + " (" + std::to_string(ref.nRows()) + 'x'
                + std::to_string(ref.nCols()) + ")"
            };
        }
    }
    projection =
      std::make_unique<GeosProjection>(ref.projectionParameters());
    const double height { ref.projectionParameters().height };
    x = ref.xScan() * height;
    y = ref.yScan() * height;
    projection->inverse(xGrid(), yGrid(), lon, lat);
    spdlog::debug("ABI image with {} channels and {}x{} pixels",
                  channels.size(),
                  nRows(),
                  nCols());
}

[[nodiscard]] auto SatelliteImage::observationTime() const -> TimePoint
{
    return granules.front().time(GranuleTime::start);
}

[[nodiscard]] auto SatelliteImage::getGranule(const int channel) const
  -> const Granule&
{
    const auto it { std::ranges::find(channels, channel) };
    if (it == channels.end()) {
        throw std::out_of_range { "channel " + std::to_string(channel)
                                  + " not loaded" };
    }
    return granules.at(std::distance(channels.begin(), it));
}

[[nodiscard]] auto SatelliteImage::xGrid() const -> ArrayXXd
{
    return x.transpose().replicate(y.size(), 1);
}

[[nodiscard]] auto SatelliteImage::yGrid() const -> ArrayXXd
{
    return y.replicate(1, x.size());
}

[[nodiscard]] auto SatelliteImage::nearestPixel(const double center_lon,
                                                const double center_lat) const
  -> std::pair<int, int>
{
    const Eigen::Vector2d xy { projection->forward(center_lon, center_lat) };
    if (!std::isfinite(xy(0)) || !std::isfinite(xy(1))) {
        throw std::invalid_argument {
            "location (" + std::to_string(center_lon) + ", "
            + std::to_string(center_lat) + ") is not visible from the satellite"
        };
    }
    return { nearestIdx(y, xy(1)), nearestIdx(x, xy(0)) };
}

// Intersection of the window [begin, begin + size) with [0, n). The
// result is given as begin and size.
static auto clipWindow(const int begin,
                       const int size,
                       const int n) -> std::pair<int, int>
{
    const int clipped_beg { std::max(0, begin) };
    const int clipped_end { std::min(n, begin + size) };
    return { clipped_beg, std::max(0, clipped_end - clipped_beg) };
}

[[nodiscard]] auto SatelliteImage::extractPatch(const double center_lon,
                                                const double center_lat,
                                                const int width,
                                                const int height) const
  -> Patch
{
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument { "patch size must be positive" };
    }
    Patch patch {};
    patch.width = width;
    patch.height = height;
    patch.channels = channels;
    std::tie(patch.center_row, patch.center_col) =
      nearestPixel(center_lon, center_lat);
    const int window_row { patch.center_row - height / 2 };
    const int window_col { patch.center_col - width / 2 };
    const auto [row_beg, n_rows] { clipWindow(window_row, height, nRows()) };
    const auto [col_beg, n_cols] { clipWindow(window_col, width, nCols()) };
    patch.row_beg = row_beg;
    patch.col_beg = col_beg;
    patch.row_offset = row_beg - window_row;
    patch.col_offset = col_beg - window_col;
    for (const Granule& granule : granules) {
        patch.radiance.push_back(
          granule.readRadiance(row_beg, n_rows, col_beg, n_cols));
    }
    patch.lon = lon.block(row_beg, col_beg, n_rows, n_cols);
    patch.lat = lat.block(row_beg, col_beg, n_rows, n_cols);
    return patch;
}

auto SatelliteImage::close() -> void
{
    for (Granule& granule : granules) {
        granule.close();
    }
}

SatelliteImage::~SatelliteImage()
{
    close();
}

} // namespace goes
