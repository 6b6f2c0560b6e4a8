// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "granule.h"

#include <common/io.h>
#include <filesystem>
#include <mutex>
#include <netcdf>
#include <spdlog/spdlog.h>

namespace goes {

// The netCDF library is not thread-safe. Every call into it made by a
// granule (open, read, close) holds this lock.
static std::mutex netcdf_mutex {};

[[nodiscard]] auto GranuleName::time(const GranuleTime which) const
  -> TimePoint
{
    switch (which) {
    case GranuleTime::start:
        return start;
    case GranuleTime::end:
        return end;
    case GranuleTime::creation:
    default:
        return creation;
    }
}

// Timestamp field of a file name, e.g. s20172000002189 where the
// leading letter identifies the field and the last digit is tenths
// of a second.
static auto parseStampField(const std::string& field,
                            const char letter) -> std::optional<TimePoint>
{
    constexpr size_t field_size { 15 };
    if (field.size() != field_size || field.front() != letter
        || field.find_first_not_of("0123456789", 1) != std::string::npos) {
        return std::nullopt;
    }
    try {
        return parseDayOfYearStamp(field.substr(1, field_size - 2));
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

[[nodiscard]] auto parseGranuleName(const std::string& filename)
  -> std::optional<GranuleName>
{
    const std::string suffix { ".nc" };
    if (filename.size() <= suffix.size()
        || !filename.ends_with(suffix)) {
        return std::nullopt;
    }
    const auto fields { splitString(
      filename.substr(0, filename.size() - suffix.size()), '_') };
    constexpr size_t n_fields { 6 };
    if (fields.size() != n_fields || fields[0] != "OR") {
        return std::nullopt;
    }
    GranuleName name {};
    // Product and scan mode, e.g. ABI-L1b-RadC-M3C02
    const auto dash { fields[1].rfind('-') };
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    name.product = fields[1].substr(0, dash);
    const std::string mode_channel { fields[1].substr(dash + 1) };
    const auto c_pos { mode_channel.find('C') };
    // Channel numbers have at most two digits
    constexpr size_t max_channel_digits { 2 };
    if (mode_channel.size() < 4 || mode_channel.front() != 'M'
        || c_pos == std::string::npos || c_pos < 2
        || c_pos + 1 == mode_channel.size()
        || mode_channel.size() - c_pos - 1 > max_channel_digits
        || mode_channel.find_first_not_of("0123456789", c_pos + 1)
             != std::string::npos) {
        return std::nullopt;
    }
    name.mode = mode_channel.substr(1, c_pos - 1);
    name.channel = std::stoi(mode_channel.substr(c_pos + 1));
    name.satellite = fields[2];
    const auto start { parseStampField(fields[3], 's') };
    const auto end { parseStampField(fields[4], 'e') };
    const auto creation { parseStampField(fields[5], 'c') };
    if (!start || !end || !creation) {
        return std::nullopt;
    }
    name.start = start.value();
    name.end = end.value();
    name.creation = creation.value();
    return name;
}

// Return an attribute of a variable as double or the default value if
// the attribute is absent
static auto getAttOr(const netCDF::NcVar& var,
                     const std::string& att_name,
                     const std::optional<double> default_value)
  -> std::optional<double>
{
    const auto atts { var.getAtts() };
    const auto it { atts.find(att_name) };
    if (it == atts.end()) {
        return default_value;
    }
    double value {};
    it->second.getValues(&value);
    return value;
}

// Read a 1D coordinate variable and decode it
static auto readAxis(const netCDF::NcFile& nc,
                     const std::string& var_name,
                     const std::string& filename) -> Eigen::ArrayXd
{
    const auto var { nc.getVar(var_name) };
    if (var.isNull() || var.getDimCount() != 1) {
        throw std::invalid_argument { filename + ": missing 1D variable "
                                      + var_name };
    }
    Eigen::ArrayXd axis(var.getDim(0).getSize());
    var.getVar(axis.data());
    axis = axis * getAttOr(var, "scale_factor", 1.0).value()
           + getAttOr(var, "add_offset", 0.0).value();
    return axis;
}

Granule::Granule(const std::string& filename) : filename { filename }
{
    const auto parsed { parseGranuleName(
      std::filesystem::path { filename }.filename().string()) };
    if (!parsed) {
        throw std::invalid_argument { filename
                                      + " does not follow the ABI file naming "
                                        "scheme" };
    }
    name = parsed.value();
    const std::lock_guard<std::mutex> lock { netcdf_mutex };
    // Owned locally until the metadata is read so that a failure closes
    // the file while the lock is held
    auto file { std::make_unique<netCDF::NcFile>(filename,
                                                 netCDF::NcFile::read) };

    x_scan = readAxis(*file, "x", filename);
    y_scan = readAxis(*file, "y", filename);

    const auto rad { file->getVar("Rad") };
    if (rad.isNull() || rad.getDimCount() != 2
        || rad.getDim(0).getSize() != static_cast<size_t>(y_scan.size())
        || rad.getDim(1).getSize() != static_cast<size_t>(x_scan.size())) {
        throw std::invalid_argument { filename
                                      + ": Rad must have dimensions (y, x)" };
    }
    scale_factor = getAttOr(rad, "scale_factor", 1.0).value();
    add_offset = getAttOr(rad, "add_offset", 0.0).value();
    fill_value = getAttOr(rad, "_FillValue", std::nullopt);
    if (const auto atts { rad.getAtts() }; atts.contains("_Unsigned")) {
        std::string unsigned_str {};
        atts.at("_Unsigned").getValues(unsigned_str);
        is_unsigned = unsigned_str == "true";
    }
    if (is_unsigned && fill_value && fill_value.value() < 0.0) {
        fill_value = fill_value.value() + 65536.0;
    }

    const auto proj_var { file->getVar("goes_imager_projection") };
    if (proj_var.isNull()) {
        throw std::invalid_argument {
            filename + ": missing variable goes_imager_projection"
        };
    }
    const auto height { getAttOr(
      proj_var, "perspective_point_height", std::nullopt) };
    if (!height) {
        throw std::invalid_argument { filename
                                      + ": missing perspective_point_height" };
    }
    projection.height = height.value();
    projection.lon_0 =
      getAttOr(proj_var, "longitude_of_projection_origin", 0.0).value();
    projection.semi_major =
      getAttOr(proj_var, "semi_major_axis", earth::a).value();
    projection.semi_minor =
      getAttOr(proj_var, "semi_minor_axis", earth::b).value();
    if (const auto atts { proj_var.getAtts() };
        atts.contains("sweep_angle_axis")) {
        atts.at("sweep_angle_axis").getValues(projection.sweep);
    }
    nc = std::move(file);
    spdlog::debug("Opened {} (channel {}, {}x{} pixels)",
                  filename,
                  name.channel,
                  y_scan.size(),
                  x_scan.size());
}

Granule::Granule(Granule&&) noexcept = default;

auto Granule::operator=(Granule&& other) noexcept -> Granule&
{
    if (this != &other) {
        close();
        filename = std::move(other.filename);
        nc = std::move(other.nc);
        name = std::move(other.name);
        x_scan = std::move(other.x_scan);
        y_scan = std::move(other.y_scan);
        projection = std::move(other.projection);
        scale_factor = other.scale_factor;
        add_offset = other.add_offset;
        fill_value = other.fill_value;
        is_unsigned = other.is_unsigned;
    }
    return *this;
}

[[nodiscard]] auto Granule::readRadiance(const int row_beg,
                                         const int n_rows,
                                         const int col_beg,
                                         const int n_cols) const -> ArrayXXd
{
    if (!nc) {
        throw std::runtime_error { "cannot read from closed granule "
                                   + filename };
    }
    if (row_beg < 0 || col_beg < 0 || n_rows < 0 || n_cols < 0
        || row_beg + n_rows > nRows() || col_beg + n_cols > nCols()) {
        throw std::out_of_range { "radiance window outside the image of "
                                  + filename };
    }
    ArrayXXd radiance(n_rows, n_cols);
    if (radiance.size() == 0) {
        return radiance;
    }
    const std::lock_guard<std::mutex> lock { netcdf_mutex };
    nc->getVar("Rad").getVar({ static_cast<size_t>(row_beg),
                               static_cast<size_t>(col_beg) },
                             { static_cast<size_t>(n_rows),
                               static_cast<size_t>(n_cols) },
                             radiance.data());
    radiance = radiance.unaryExpr([this](double value) {
        if (is_unsigned && value < 0.0) {
            value += 65536.0;
        }
        if (fill_value && value == fill_value.value()) {
            return fill::nan;
        }
        return value * scale_factor + add_offset;
    });
    return radiance;
}

auto Granule::close() -> void
{
    if (nc) {
        const std::lock_guard<std::mutex> lock { netcdf_mutex };
        nc.reset();
    }
}

Granule::~Granule()
{
    close();
}

} // namespace goes
