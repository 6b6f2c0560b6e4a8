// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "projection.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <common/io.h>
#include <map>
#include <numbers>
#include <optional>
#include <spdlog/spdlog.h>

namespace goes {

auto Projection::forward(const ArrayXXd& lon,
                         const ArrayXXd& lat,
                         ArrayXXd& x,
                         ArrayXXd& y) const -> void
{
    if (lon.rows() != lat.rows() || lon.cols() != lat.cols()) {
        throw std::invalid_argument { "longitude and latitude arrays differ "
                                      "in shape" };
    }
    x.resize(lon.rows(), lon.cols());
    y.resize(lon.rows(), lon.cols());
#pragma omp parallel for
    for (int i_row = 0; i_row < static_cast<int>(lon.rows()); ++i_row) {
        for (int i_col {}; i_col < static_cast<int>(lon.cols()); ++i_col) {
            const Eigen::Vector2d xy { forward(lon(i_row, i_col),
                                               lat(i_row, i_col)) };
            x(i_row, i_col) = xy(0);
            y(i_row, i_col) = xy(1);
        }
    }
}

auto Projection::inverse(const ArrayXXd& x,
                         const ArrayXXd& y,
                         ArrayXXd& lon,
                         ArrayXXd& lat) const -> void
{
    if (x.rows() != y.rows() || x.cols() != y.cols()) {
        throw std::invalid_argument { "x and y arrays differ in shape" };
    }
    lon.resize(x.rows(), x.cols());
    lat.resize(x.rows(), x.cols());
#pragma omp parallel for
    for (int i_row = 0; i_row < static_cast<int>(x.rows()); ++i_row) {
        for (int i_col {}; i_col < static_cast<int>(x.cols()); ++i_col) {
            const Eigen::Vector2d lonlat { inverse(x(i_row, i_col),
                                                   y(i_row, i_col)) };
            lon(i_row, i_col) = lonlat(0);
            lat(i_row, i_col) = lonlat(1);
        }
    }
}

GeosProjection::GeosProjection(const GeosParameters& params) : params { params }
{
    if (!std::isfinite(params.height) || params.height <= 0.0) {
        throw std::invalid_argument {
            "perspective point height must be positive, got "
            + std::to_string(params.height)
        };
    }
    if (params.sweep != "x" && params.sweep != "y") {
        throw std::invalid_argument { "sweep angle axis must be x or y, got "
                                      + params.sweep };
    }
    if (!std::isfinite(params.semi_major) || !std::isfinite(params.semi_minor)
        || params.semi_minor <= 0.0 || params.semi_minor > params.semi_major) {
        throw std::invalid_argument { "invalid ellipsoid axes" };
    }
    if (!std::isfinite(params.lon_0)) {
        throw std::invalid_argument { "invalid longitude of projection "
                                      "origin" };
    }
    radius_g = params.semi_major + params.height;
    ratio_ab2 = (params.semi_major * params.semi_major)
                / (params.semi_minor * params.semi_minor);
    sweep_x = params.sweep == "x";
}

// Bring a longitude into the range -180..180
static auto wrapLongitude(const double lon) -> double
{
    double lon_wrapped { std::fmod(lon + 180.0, 360.0) };
    if (lon_wrapped < 0.0) {
        lon_wrapped += 360.0;
    }
    return lon_wrapped - 180.0;
}

[[nodiscard]] auto GeosProjection::forward(const double lon,
                                           const double lat) const
  -> Eigen::Vector2d
{
    if (!std::isfinite(lon) || !std::isfinite(lat) || std::abs(lat) > 90.0) {
        return { fill::nan, fill::nan };
    }
    const double phi { lat * math::deg_to_rad };
    const double lambda { (lon - params.lon_0) * math::deg_to_rad };
    // Point on the ellipsoid in Earth-centered coordinates with the x
    // axis pointing at the sub-satellite point
    const double e2 { 1.0 - 1.0 / ratio_ab2 };
    const double sin_phi { std::sin(phi) };
    const double n { params.semi_major
                     / std::sqrt(1.0 - e2 * sin_phi * sin_phi) };
    const Eigen::Vector3d pos { n * std::cos(phi) * std::cos(lambda),
                                n * std::cos(phi) * std::sin(lambda),
                                n * (1.0 - e2) * sin_phi };
    // The point is visible only if the line of sight does not cross
    // the ellipsoid before reaching it.
    const double tmp { radius_g - pos(0) };
    if (tmp * pos(0) - pos(1) * pos(1) - pos(2) * pos(2) * ratio_ab2 < 0.0) {
        return { fill::nan, fill::nan };
    }
    if (sweep_x) {
        return { params.height * std::atan(pos(1) / std::hypot(pos(2), tmp)),
                 params.height * std::atan(pos(2) / tmp) };
    }
    return { params.height * std::atan(pos(1) / tmp),
             params.height * std::atan(pos(2) / std::hypot(pos(1), tmp)) };
}

// Given a line-of-sight (LOS) vector and the satellite position in
// cartesian coordinates, return the point of intersection with the
// Earth ellipsoid in cartesian coordinates or nothing if the LOS
// misses the Earth.
static auto intersectEllipsoid(const Eigen::Vector3d& los,
                               const Eigen::Vector3d& sat,
                               const double semi_major,
                               const double semi_minor)
  -> std::optional<Eigen::Vector3d>
{
    const Eigen::Array3d scaling { semi_major, semi_major, semi_minor };
    const Eigen::Vector3d los0 = los.array() / scaling;
    const Eigen::Vector3d sat0 = sat.array() / scaling;
    const double ps { los0.dot(sat0) };
    const double pp { los0.dot(los0) };
    const double ss { sat0.dot(sat0) };
    const double discriminant { ps * ps - pp * (ss - 1.0) };
    if (discriminant < 0.0) {
        return std::nullopt;
    }
    const double d { (-ps - std::sqrt(discriminant)) / pp };
    const Eigen::Vector3d pos = (sat0 + d * los0).array() * scaling;
    return pos;
}

[[nodiscard]] auto GeosProjection::inverse(const double x,
                                           const double y) const
  -> Eigen::Vector2d
{
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return { fill::nan, fill::nan };
    }
    // Scan angles to a line of sight pointing from the satellite
    // towards the Earth center
    const double angle_x { x / params.height };
    const double angle_y { y / params.height };
    // Beyond +-90 degrees the line of sight points away from Earth
    if (std::abs(angle_x) >= std::numbers::pi / 2
        || std::abs(angle_y) >= std::numbers::pi / 2) {
        return { fill::nan, fill::nan };
    }
    double v_y {};
    double v_z {};
    if (sweep_x) {
        v_z = std::tan(angle_y);
        v_y = std::tan(angle_x) * std::hypot(1.0, v_z);
    } else {
        v_y = std::tan(angle_x);
        v_z = std::tan(angle_y) * std::hypot(1.0, v_y);
    }
    const auto pos { intersectEllipsoid({ -1.0, v_y, v_z },
                                        { radius_g, 0.0, 0.0 },
                                        params.semi_major,
                                        params.semi_minor) };
    if (!pos) {
        return { fill::nan, fill::nan };
    }
    const Eigen::Vector3d& p { pos.value() };
    // Geodetic latitude of a point on the ellipsoid surface
    const double lat { std::atan(ratio_ab2 * p(2) / std::hypot(p(0), p(1))) };
    const double lon { std::atan2(p(1), p(0)) };
    return { wrapLongitude(lon / math::deg_to_rad + params.lon_0),
             lat / math::deg_to_rad };
}

[[nodiscard]] auto LonLatProjection::forward(const double lon,
                                             const double lat) const
  -> Eigen::Vector2d
{
    return { lon, lat };
}

[[nodiscard]] auto LonLatProjection::inverse(const double x,
                                             const double y) const
  -> Eigen::Vector2d
{
    return { x, y };
}

// Semi-major and semi-minor axes of ellipsoids that may be referred to
// by name
static const std::map<std::string, std::pair<double, double>> ellipsoids {
    { "GRS80", { earth::a, earth::b } },
    { "WGS84", { 6378137.0, 6356752.314245 } },
};

[[nodiscard]] auto projectionFromProj4(const std::string& definition)
  -> std::unique_ptr<Projection>
{
    std::map<std::string, std::string> params {};
    for (const auto& token : splitString(definition, ' ')) {
        if (token.empty()) {
            continue;
        }
        if (token.front() != '+') {
            throw std::invalid_argument { "invalid PROJ parameter \"" + token
                                          + "\" in: " + definition };
        }
        const auto eq { token.find('=') };
        params[token.substr(1, eq == std::string::npos ? eq : eq - 1)] =
          eq == std::string::npos ? "" : token.substr(eq + 1);
    }
    const auto getDouble { [&](const std::string& key) -> double {
        try {
            size_t n_parsed {};
            const double value { std::stod(params.at(key), &n_parsed) };
            if (n_parsed != params.at(key).size()) {
                throw std::invalid_argument { key };
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::invalid_argument { "invalid or missing +" + key
                                          + " in: " + definition };
        }
    } };
    if (!params.contains("proj")) {
        throw std::invalid_argument { "missing +proj in: " + definition };
    }
    const std::string& proj { params.at("proj") };
    if (proj == "longlat" || proj == "latlong" || proj == "lonlat") {
        return std::make_unique<LonLatProjection>();
    }
    if (proj != "geos") {
        throw std::invalid_argument { "unsupported projection: " + proj };
    }
    GeosParameters geos {};
    geos.height = getDouble("h");
    if (params.contains("lon_0")) {
        geos.lon_0 = getDouble("lon_0");
    }
    // PROJ defaults to the Meteosat convention
    geos.sweep = params.contains("sweep") ? params.at("sweep") : "y";
    if (params.contains("ellps")) {
        const auto it { ellipsoids.find(params.at("ellps")) };
        if (it == ellipsoids.end()) {
            throw std::invalid_argument { "unsupported ellipsoid: "
                                          + params.at("ellps") };
        }
        geos.semi_major = it->second.first;
        geos.semi_minor = it->second.second;
    }
    if (params.contains("a")) {
        geos.semi_major = getDouble("a");
        geos.semi_minor = params.contains("b") ? getDouble("b") : geos.semi_major;
    } else if (params.contains("b")) {
        geos.semi_minor = getDouble("b");
    }
    for (const auto& [key, value] : params) {
        constexpr std::array known { "proj",  "h",     "lon_0", "sweep",
                                     "ellps", "a",     "b",     "units",
                                     "datum", "no_defs" };
        if (std::ranges::find(known, key) == known.end()) {
            spdlog::warn("ignoring PROJ parameter +{}", key);
        }
    }
    return std::make_unique<GeosProjection>(geos);
}

auto transformPoints(const Projection& src,
                     const Projection& dst,
                     const ArrayXXd& x,
                     const ArrayXXd& y,
                     ArrayXXd& x_out,
                     ArrayXXd& y_out) -> void
{
    ArrayXXd lon {};
    ArrayXXd lat {};
    src.inverse(x, y, lon, lat);
    dst.forward(lon, lat, x_out, y_out);
}

} // namespace goes
