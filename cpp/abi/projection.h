// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Map projections between geodetic coordinates (longitude, latitude
// in degrees) and projected coordinates. A projection has no mutable
// state after construction and can be shared between threads.
//
// Points that have no image under a projection (e.g. locations not
// visible from a geostationary satellite) map to NaN.

#pragma once

#include <common/constants.h>
#include <common/eigen.h>
#include <memory>
#include <string>

namespace goes {

class Projection
{
public:
    Projection() = default;
    // Geodetic (lon, lat) in degrees to projected (x, y)
    [[nodiscard]] virtual auto forward(const double lon,
                                       const double lat) const
      -> Eigen::Vector2d = 0;
    // Projected (x, y) to geodetic (lon, lat) in degrees
    [[nodiscard]] virtual auto inverse(const double x, const double y) const
      -> Eigen::Vector2d = 0;
    // Element-wise versions of the above. Output arrays are resized
    // to the shape of the input.
    auto forward(const ArrayXXd& lon,
                 const ArrayXXd& lat,
                 ArrayXXd& x,
                 ArrayXXd& y) const -> void;
    auto inverse(const ArrayXXd& x,
                 const ArrayXXd& y,
                 ArrayXXd& lon,
                 ArrayXXd& lat) const -> void;
    virtual ~Projection() = default;
};

// Parameters of the geostationary projection as found in the
// goes_imager_projection variable of ABI files
struct GeosParameters
{
    // Satellite height above the ellipsoid [m]
    double height { abi::perspective_point_height };
    // Longitude of the sub-satellite point [deg]
    double lon_0 {};
    // Axis of the outer gimbal, "x" for GOES-R and "y" for Meteosat
    std::string sweep { "x" };
    double semi_major { earth::a };
    double semi_minor { earth::b };

    auto operator==(const GeosParameters&) const -> bool = default;
};

// Geostationary satellite view following the conventions of the PROJ
// geos projection: projected coordinates are scan angles multiplied by
// the satellite height.
class GeosProjection : public Projection
{
private:
    GeosParameters params {};
    // Distance of the satellite from the Earth center
    double radius_g {};
    // (a/b)^2
    double ratio_ab2 {};
    bool sweep_x {};

public:
    using Projection::forward;
    using Projection::inverse;

    // Throws if the height is not positive, the sweep axis is not x or
    // y, or the ellipsoid axes are invalid.
    explicit GeosProjection(const GeosParameters& params);
    [[nodiscard]] auto parameters() const -> const GeosParameters&
    {
        return params;
    }
    [[nodiscard]] auto forward(const double lon, const double lat) const
      -> Eigen::Vector2d override;
    [[nodiscard]] auto inverse(const double x, const double y) const
      -> Eigen::Vector2d override;
};

// Plate carree in degrees, i.e. the identity transform
class LonLatProjection : public Projection
{
public:
    using Projection::forward;
    using Projection::inverse;

    [[nodiscard]] auto forward(const double lon, const double lat) const
      -> Eigen::Vector2d override;
    [[nodiscard]] auto inverse(const double x, const double y) const
      -> Eigen::Vector2d override;
};

// Construct a projection from a PROJ.4 style definition. Supported are
//
//   +proj=geos +h=<m> [+lon_0=<deg>] [+sweep=x|y] [+a=<m> +b=<m>]
//     [+ellps=GRS80|WGS84]
//   +proj=longlat (or latlong, lonlat)
//
// Parameters +units=m, +datum, and +no_defs are accepted and ignored.
[[nodiscard]] auto projectionFromProj4(const std::string& definition)
  -> std::unique_ptr<Projection>;

// Transform coordinates from one projection to another by going
// through geodetic coordinates. NaN propagates.
auto transformPoints(const Projection& src,
                     const Projection& dst,
                     const ArrayXXd& x,
                     const ArrayXXd& y,
                     ArrayXXd& x_out,
                     ArrayXXd& y_out) -> void;

} // namespace goes
