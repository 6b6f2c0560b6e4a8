// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// One ABI L1b radiance file (one channel, one scan). The file stays
// open for the lifetime of the object, or until close(), and
// radiances are read on demand for a window of the image.

#pragma once

#include "projection.h"

#include <common/time.h>
#include <optional>

namespace netCDF {

class NcFile;

} // namespace netCDF

namespace goes {

// Fields of an ABI file name such as
// OR_ABI-L1b-RadC-M3C02_G16_s20172000002189_e20172000004562_c20172000004595.nc
struct GranuleName
{
    std::string product {};
    std::string mode {};
    int channel {};
    std::string satellite {};
    TimePoint start {};
    TimePoint end {};
    TimePoint creation {};

    [[nodiscard]] auto time(const GranuleTime which) const -> TimePoint;
};

// Split a file name (without directory) into its fields. Returns
// nothing if the name does not follow the ABI naming scheme.
[[nodiscard]] auto parseGranuleName(const std::string& filename)
  -> std::optional<GranuleName>;

class Granule
{
private:
    std::string filename {};
    std::unique_ptr<netCDF::NcFile> nc;
    GranuleName name {};
    // Scan angles of pixel centers [rad]
    Eigen::ArrayXd x_scan {};
    Eigen::ArrayXd y_scan {};
    GeosParameters projection {};
    // Packing of Rad
    double scale_factor { 1.0 };
    double add_offset {};
    std::optional<double> fill_value {};
    bool is_unsigned {};

public:
    // Open the file and read the metadata. Throws if the file name
    // does not follow the ABI naming scheme or required variables or
    // attributes are missing.
    explicit Granule(const std::string& filename);
    Granule(Granule&&) noexcept;
    auto operator=(Granule&&) noexcept -> Granule&;
    Granule(const Granule&) = delete;
    auto operator=(const Granule&) -> Granule& = delete;

    [[nodiscard]] auto getFilename() const -> const std::string&
    {
        return filename;
    }
    [[nodiscard]] auto channel() const -> int { return name.channel; }
    [[nodiscard]] auto time(const GranuleTime which) const -> TimePoint
    {
        return name.time(which);
    }
    [[nodiscard]] auto xScan() const -> const Eigen::ArrayXd&
    {
        return x_scan;
    }
    [[nodiscard]] auto yScan() const -> const Eigen::ArrayXd&
    {
        return y_scan;
    }
    [[nodiscard]] auto projectionParameters() const -> const GeosParameters&
    {
        return projection;
    }
    [[nodiscard]] auto nRows() const -> int
    {
        return static_cast<int>(y_scan.size());
    }
    [[nodiscard]] auto nCols() const -> int
    {
        return static_cast<int>(x_scan.size());
    }
    [[nodiscard]] auto isOpen() const -> bool { return nc != nullptr; }
    // Read radiances of rows row_beg..row_beg+n_rows-1 and columns
    // col_beg..col_beg+n_cols-1. Packed values are decoded and fill
    // values become NaN.
    [[nodiscard]] auto readRadiance(const int row_beg,
                                    const int n_rows,
                                    const int col_beg,
                                    const int n_cols) const -> ArrayXXd;
    // Release the file handle. Calling this more than once has no
    // effect.
    auto close() -> void;
    ~Granule();
};

} // namespace goes
