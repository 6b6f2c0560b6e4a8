// Unit tests for the ABI geometry and granule handling

#include "../testing.h"

#include <abi/granule_locator.h>
#include <abi/satellite_image.h>
#include <limits>
#include <tuple>
#include <vector>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// Parameters of the GOES-16 fixed grid
static auto goesEast() -> goes::GeosParameters
{
    goes::GeosParameters params {};
    params.height = 35786023.0;
    params.lon_0 = -75.0;
    params.semi_major = 6378137.0;
    params.semi_minor = 6356752.31414;
    return params;
}

TEST_CASE("geostationary projection")
{
    const goes::GeosParameters params { goesEast() };
    const goes::GeosProjection proj { params };

    SECTION("Sub-satellite point")
    {
        const Eigen::Vector2d xy { proj.forward(-75.0, 0.0) };
        CHECK_THAT(xy(0), WithinAbs(0.0, 1e-6));
        CHECK_THAT(xy(1), WithinAbs(0.0, 1e-6));
        const Eigen::Vector2d lonlat { proj.inverse(0.0, 0.0) };
        CHECK_THAT(lonlat(0), WithinAbs(-75.0, 1e-12));
        CHECK_THAT(lonlat(1), WithinAbs(0.0, 1e-12));
    }

    SECTION("Reference point of the fixed grid")
    {
        // Scan angles of a location in Georgia, USA
        const double x { -0.024052 * params.height };
        const double y { 0.095340 * params.height };
        const Eigen::Vector2d lonlat { proj.inverse(x, y) };
        CHECK_THAT(lonlat(0), WithinAbs(-84.690932, 1e-3));
        CHECK_THAT(lonlat(1), WithinAbs(33.846162, 1e-3));
        const Eigen::Vector2d xy { proj.forward(-84.690932, 33.846162) };
        CHECK_THAT(xy(0) / params.height, WithinAbs(-0.024052, 1e-6));
        CHECK_THAT(xy(1) / params.height, WithinAbs(0.095340, 1e-6));
    }

    SECTION("Round trip")
    {
        for (const std::string sweep : { "x", "y" }) {
            goes::GeosParameters sweep_params { params };
            sweep_params.sweep = sweep;
            const goes::GeosProjection sweep_proj { sweep_params };
            for (const auto& [lon, lat] :
                 std::vector<std::pair<double, double>> {
                   { -100.0, 40.0 }, { -60.0, -30.0 }, { -75.0, 60.0 } }) {
                const Eigen::Vector2d xy { sweep_proj.forward(lon, lat) };
                REQUIRE(std::isfinite(xy(0)));
                const Eigen::Vector2d lonlat { sweep_proj.inverse(xy(0),
                                                                  xy(1)) };
                CHECK_THAT(lonlat(0), WithinAbs(lon, 1e-8));
                CHECK_THAT(lonlat(1), WithinAbs(lat, 1e-8));
            }
        }
    }

    SECTION("Sweep axis")
    {
        goes::GeosParameters y_params { params };
        y_params.sweep = "y";
        const goes::GeosProjection y_proj { y_params };
        const Eigen::Vector2d xy_x { proj.forward(-100.0, 40.0) };
        const Eigen::Vector2d xy_y { y_proj.forward(-100.0, 40.0) };
        CHECK(std::abs(xy_x(0) - xy_y(0)) > 1.0);
        // Along the equator both conventions agree
        const Eigen::Vector2d eq_x { proj.forward(-90.0, 0.0) };
        const Eigen::Vector2d eq_y { y_proj.forward(-90.0, 0.0) };
        CHECK_THAT(eq_x(0), WithinAbs(eq_y(0), 1e-6));
    }

    SECTION("Points off the Earth disk")
    {
        const Eigen::Vector2d far_side { proj.forward(105.0, 0.0) };
        CHECK(std::isnan(far_side(0)));
        CHECK(std::isnan(far_side(1)));
        CHECK(std::isnan(proj.forward(-75.0, 85.0)(0)));
        CHECK(std::isnan(proj.forward(std::nan(""), 10.0)(0)));
        const Eigen::Vector2d space { proj.inverse(0.2 * params.height, 0.0) };
        CHECK(std::isnan(space(0)));
        CHECK(std::isnan(space(1)));
        CHECK(std::isnan(proj.inverse(0.0, std::nan(""))(1)));
    }

    SECTION("Longitudes are wrapped")
    {
        goes::GeosParameters pacific { params };
        pacific.lon_0 = 175.0;
        const goes::GeosProjection pacific_proj { pacific };
        const Eigen::Vector2d xy { pacific_proj.forward(-170.0, 10.0) };
        const Eigen::Vector2d lonlat { pacific_proj.inverse(xy(0), xy(1)) };
        CHECK_THAT(lonlat(0), WithinAbs(-170.0, 1e-8));
    }

    SECTION("Arrays")
    {
        ArrayXXd lon(2, 2);
        ArrayXXd lat(2, 2);
        lon << -75.0, -80.0, 105.0, -70.0;
        lat << 0.0, 20.0, 0.0, -10.0;
        ArrayXXd x {};
        ArrayXXd y {};
        proj.forward(lon, lat, x, y);
        REQUIRE(x.rows() == 2);
        REQUIRE(x.cols() == 2);
        CHECK(std::isnan(x(1, 0)));
        CHECK(x(0, 1) == proj.forward(-80.0, 20.0)(0));
        ArrayXXd lon_back {};
        ArrayXXd lat_back {};
        proj.inverse(x, y, lon_back, lat_back);
        CHECK_THAT(lon_back(1, 1), WithinAbs(-70.0, 1e-8));
        CHECK_THAT(lat_back(0, 1), WithinAbs(20.0, 1e-8));
        CHECK(std::isnan(lat_back(1, 0)));
        CHECK_THROWS_AS(proj.forward(lon, lat.leftCols(1), x, y),
                        std::invalid_argument);
    }

    SECTION("Invalid parameters")
    {
        goes::GeosParameters bad { params };
        bad.height = 0.0;
        CHECK_THROWS_AS(goes::GeosProjection { bad }, std::invalid_argument);
        bad = params;
        bad.sweep = "z";
        CHECK_THROWS_AS(goes::GeosProjection { bad }, std::invalid_argument);
        bad = params;
        bad.semi_minor = 2.0 * bad.semi_major;
        CHECK_THROWS_AS(goes::GeosProjection { bad }, std::invalid_argument);
    }
}

TEST_CASE("PROJ definitions")
{
    SECTION("Geostationary")
    {
        const auto proj { goes::projectionFromProj4(
          "+proj=geos +h=35786023 +lon_0=-75 +sweep=x +ellps=GRS80 +units=m "
          "+no_defs") };
        const auto* geos { dynamic_cast<const goes::GeosProjection*>(
          proj.get()) };
        REQUIRE(geos != nullptr);
        CHECK(geos->parameters().height == 35786023.0);
        CHECK(geos->parameters().lon_0 == -75.0);
        CHECK(geos->parameters().sweep == "x");
        CHECK(geos->parameters().semi_major == goes::earth::a);
    }

    SECTION("Defaults and explicit axes")
    {
        const auto proj { goes::projectionFromProj4(
          "+proj=geos +h=35785831 +a=6378169 +b=6356583.8") };
        const auto* geos { dynamic_cast<const goes::GeosProjection*>(
          proj.get()) };
        REQUIRE(geos != nullptr);
        CHECK(geos->parameters().sweep == "y");
        CHECK(geos->parameters().lon_0 == 0.0);
        CHECK(geos->parameters().semi_major == 6378169.0);
        CHECK(geos->parameters().semi_minor == 6356583.8);
    }

    SECTION("Geographic")
    {
        for (const std::string name : { "longlat", "latlong", "lonlat" }) {
            const auto proj { goes::projectionFromProj4("+proj=" + name) };
            CHECK(dynamic_cast<const goes::LonLatProjection*>(proj.get())
                  != nullptr);
            const Eigen::Vector2d xy { proj->forward(12.5, -3.0) };
            CHECK(xy(0) == 12.5);
            CHECK(xy(1) == -3.0);
        }
    }

    SECTION("Invalid definitions")
    {
        CHECK_THROWS_AS(goes::projectionFromProj4("+proj=merc"),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::projectionFromProj4("+proj=geos"),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::projectionFromProj4("+proj=geos +h=high"),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::projectionFromProj4("+h=35786023"),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::projectionFromProj4("proj=longlat"),
                        std::invalid_argument);
        CHECK_THROWS_AS(
          goes::projectionFromProj4("+proj=geos +h=35786023 +ellps=intl"),
          std::invalid_argument);
    }

    SECTION("Transform between projections")
    {
        const auto geos { goes::projectionFromProj4(
          "+proj=geos +h=35786023 +lon_0=-75 +sweep=x") };
        const goes::LonLatProjection lonlat {};
        ArrayXXd lon(1, 2);
        ArrayXXd lat(1, 2);
        lon << -90.0, 100.0;
        lat << 30.0, 0.0;
        ArrayXXd x {};
        ArrayXXd y {};
        goes::transformPoints(lonlat, *geos, lon, lat, x, y);
        ArrayXXd lon_back {};
        ArrayXXd lat_back {};
        goes::transformPoints(*geos, lonlat, x, y, lon_back, lat_back);
        CHECK_THAT(lon_back(0, 0), WithinAbs(-90.0, 1e-8));
        CHECK_THAT(lat_back(0, 0), WithinAbs(30.0, 1e-8));
        CHECK(std::isnan(lon_back(0, 1)));
    }
}

TEST_CASE("ABI file names")
{
    SECTION("Valid name")
    {
        const auto name { goes::parseGranuleName(
          "OR_ABI-L1b-RadC-M3C02_G16_s20172000002189_e20172000004562_"
          "c20172000004595.nc") };
        REQUIRE(name.has_value());
        CHECK(name->product == "ABI-L1b-RadC");
        CHECK(name->mode == "3");
        CHECK(name->channel == 2);
        CHECK(name->satellite == "G16");
        // Day 200 of 2017 is July 19, tenths of seconds are dropped
        CHECK(name->start == date("2017-07-19T00:00:21"));
        CHECK(name->end == date("2017-07-19T00:04:56"));
        CHECK(name->creation == date("2017-07-19T00:04:59"));
        CHECK(name->time(goes::GranuleTime::start) == name->start);
        CHECK(name->time(goes::GranuleTime::end) == name->end);
        CHECK(name->time(goes::GranuleTime::creation) == name->creation);
    }

    SECTION("Other scan modes and products")
    {
        const auto name { goes::parseGranuleName(
          "OR_ABI-L1b-RadF-M6C13_G17_s20200010000000_e20200010009000_"
          "c20200010009300.nc") };
        REQUIRE(name.has_value());
        CHECK(name->product == "ABI-L1b-RadF");
        CHECK(name->mode == "6");
        CHECK(name->channel == 13);
        CHECK(name->satellite == "G17");
    }

    SECTION("Generated names")
    {
        const auto end { date("2024-02-29T12:05:00") };
        const auto name { goes::parseGranuleName(granuleName(8, end)) };
        REQUIRE(name.has_value());
        CHECK(name->channel == 8);
        CHECK(name->end == end);
        CHECK(name->start == end - std::chrono::minutes { 2 });
    }

    SECTION("Invalid names")
    {
        for (const std::string filename :
             { "",
               "readme.txt",
               "OR_ABI-L1b-RadC-M3C02_G16_s20172000002189_e20172000004562.nc",
               "XX_ABI-L1b-RadC-M3C02_G16_s20172000002189_e20172000004562_"
               "c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3C02_G16_s20172000002189_e20172000004562_"
               "c20172000004595.h5",
               "OR_ABI-L1b-RadC-M3_G16_s20172000002189_e20172000004562_"
               "c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3Cxx_G16_s20172000002189_e20172000004562_"
               "c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3C99999999999_G16_s20172000002189_"
               "e20172000004562_c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3C002_G16_s20172000002189_e20172000004562_"
               "c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3C02_G16_x20172000002189_e20172000004562_"
               "c20172000004595.nc",
               "OR_ABI-L1b-RadC-M3C02_G16_s20173990002189_e20172000004562_"
               "c20172000004595.nc" }) {
            CHECK(!goes::parseGranuleName(filename).has_value());
        }
    }
}

TEST_CASE("granule search")
{
    const std::string root { makeTmpDir("goes_test_locator") };
    const std::string day_dir { root + "/20240101/" };
    touch(day_dir + granuleName(8, date("2024-01-01T00:00:00")));
    touch(day_dir + granuleName(8, date("2024-01-01T00:10:00")));
    // Exact matches for other channels and products must be ignored
    touch(day_dir + granuleName(13, date("2024-01-01T00:02:30")));
    touch(day_dir
          + granuleName(8, date("2024-01-01T00:02:30"), "ABI-L1b-RadF"));
    touch(day_dir
          + granuleName(8, date("2024-01-01T00:02:30"), "ABI-L1b-RadC", "G17"));
    touch(day_dir + "notes.txt");
    const goes::GranuleLocator locator { root };

    SECTION("Closest file within tolerance")
    {
        const std::string filename { locator.locate(
          date("2024-01-01T00:02:30"), 8, 5.0) };
        CHECK(filename
              == day_dir + granuleName(8, date("2024-01-01T00:00:00")));
        CHECK(locator.locate(date("2024-01-01T00:09:00"), 8, 5.0)
              == day_dir + granuleName(8, date("2024-01-01T00:10:00")));
        CHECK(locator.locate(date("2024-01-01T00:02:30"), 13, 0.0)
              == day_dir + granuleName(13, date("2024-01-01T00:02:30")));
    }

    SECTION("Nothing within tolerance")
    {
        try {
            std::ignore = locator.locate(date("2024-01-01T00:02:30"), 8, 1.0);
            FAIL("expected GranuleNotFound");
        } catch (const goes::GranuleNotFound& e) {
            CHECK_THAT(e.nearestMiss(), WithinRel(2.5, 1e-12));
        }
    }

    SECTION("Ties go to the first file")
    {
        touch(day_dir + granuleName(8, date("2024-01-01T00:05:00")));
        CHECK(locator.locate(date("2024-01-01T00:02:30"), 8, 5.0)
              == day_dir + granuleName(8, date("2024-01-01T00:00:00")));
    }

    SECTION("Start time of the scan")
    {
        touch(day_dir + granuleName(8, date("2024-01-01T00:05:00")));
        const goes::GranuleLocator start_locator {
            root, "ABI-L1b-RadC", "G16", goes::GranuleTime::start
        };
        // Scan starting at 00:03:00
        CHECK(start_locator.locate(date("2024-01-01T00:02:30"), 8, 5.0)
              == day_dir + granuleName(8, date("2024-01-01T00:05:00")));
    }

    SECTION("No candidates")
    {
        try {
            std::ignore = locator.locate(date("2024-01-02T00:00:00"), 8, 60.0);
            FAIL("expected GranuleNotFound");
        } catch (const goes::GranuleNotFound& e) {
            CHECK(e.nearestMiss() == std::numeric_limits<double>::infinity());
        }
        CHECK_THROWS_AS(locator.locate(date("2024-01-01T00:00:00"), 7, 60.0),
                        goes::GranuleNotFound);
    }

    SECTION("Adjacent days")
    {
        const std::string other_root { makeTmpDir("goes_test_locator_days") };
        const std::string filename {
            other_root + "/20231231/"
            + granuleName(8, date("2023-12-31T23:59:00"))
        };
        touch(filename);
        const goes::GranuleLocator same_day { other_root };
        const goes::GranuleLocator adjacent_days {
            other_root, "ABI-L1b-RadC", "G16", goes::GranuleTime::end, true
        };
        CHECK_THROWS_AS(same_day.locate(date("2024-01-01T00:01:00"), 8, 5.0),
                        goes::GranuleNotFound);
        CHECK(adjacent_days.locate(date("2024-01-01T00:01:00"), 8, 5.0)
              == filename);
    }

    SECTION("Negative tolerance")
    {
        CHECK_THROWS_AS(locator.locate(date("2024-01-01T00:00:00"), 8, -1.0),
                        std::invalid_argument);
    }
}

TEST_CASE("granule")
{
    const std::string dir { makeTmpDir("goes_test_granule") };
    const Eigen::ArrayXd x_scan { scanAxis(4, 0.01, 56e-6) };
    const Eigen::ArrayXd y_scan { scanAxis(3, 0.05, -56e-6) };
    ArrayXXd radiance(3, 4);
    radiance << 1.0, 2.5, 3.0, 4.0, 5.0, 6.0, 7.0, 8.5, 9.0, 10.0, 11.0,
      std::nan("");
    const auto end { date("2024-01-01T00:10:00") };
    const std::string filename { dir + '/' + granuleName(13, end) };
    writeGranule(filename, x_scan, y_scan, radiance, goesEast());

    SECTION("Metadata")
    {
        const goes::Granule granule { filename };
        CHECK(granule.isOpen());
        CHECK(granule.getFilename() == filename);
        CHECK(granule.channel() == 13);
        CHECK(granule.time(goes::GranuleTime::end) == end);
        CHECK(granule.nRows() == 3);
        CHECK(granule.nCols() == 4);
        CHECK_THAT(granule.xScan()(1), WithinRel(x_scan(1), 1e-12));
        CHECK_THAT(granule.yScan()(2), WithinRel(y_scan(2), 1e-12));
        CHECK(granule.projectionParameters() == goesEast());
    }

    SECTION("Radiances are decoded")
    {
        const goes::Granule granule { filename };
        const ArrayXXd all { granule.readRadiance(0, 3, 0, 4) };
        CHECK_THAT(all(0, 1), WithinAbs(2.5, 1e-12));
        CHECK_THAT(all(1, 3), WithinAbs(8.5, 1e-12));
        CHECK(std::isnan(all(2, 3)));
        const ArrayXXd window { granule.readRadiance(1, 2, 2, 2) };
        REQUIRE(window.rows() == 2);
        REQUIRE(window.cols() == 2);
        CHECK_THAT(window(0, 0), WithinAbs(7.0, 1e-12));
        CHECK_THAT(window(1, 0), WithinAbs(11.0, 1e-12));
        CHECK(granule.readRadiance(0, 0, 0, 4).size() == 0);
        CHECK_THROWS_AS(granule.readRadiance(2, 2, 0, 1), std::out_of_range);
        CHECK_THROWS_AS(granule.readRadiance(-1, 1, 0, 1), std::out_of_range);
    }

    SECTION("Close")
    {
        goes::Granule granule { filename };
        granule.close();
        CHECK(!granule.isOpen());
        CHECK_NOTHROW(granule.close());
        CHECK_THROWS_AS(granule.readRadiance(0, 1, 0, 1), std::runtime_error);
    }

    SECTION("Open and read from several threads")
    {
        constexpr int n_reads { 64 };
        std::vector<ArrayXXd> windows(n_reads);
        std::vector<int> channels(n_reads);
#pragma omp parallel for num_threads(4)
        for (int i = 0; i < n_reads; ++i) {
            goes::Granule granule { filename };
            channels[i] = granule.channel();
            windows[i] = granule.readRadiance(i % 2, 2, i % 2, 2);
            if (i % 3 == 0) {
                granule.close();
            }
        }
        const goes::Granule reference { filename };
        for (int i {}; i < n_reads; ++i) {
            CHECK(channels[i] == 13);
            CHECK((windows[i] == reference.readRadiance(i % 2, 2, i % 2, 2))
                    .all());
        }
    }

    SECTION("Move assignment closes the previous file")
    {
        goes::Granule granule { filename };
        goes::Granule other { filename };
        granule = std::move(other);
        CHECK(granule.isOpen());
        CHECK_THAT(granule.readRadiance(0, 1, 1, 1)(0, 0),
                   WithinAbs(2.5, 1e-12));
    }

    SECTION("Invalid files")
    {
        CHECK_THROWS_AS(goes::Granule { dir + "/radiance.nc" },
                        std::invalid_argument);
        // Valid name but no projection information
        const std::string no_projection { dir + '/'
                                          + granuleName(14, end) };
        {
            netCDF::NcFile nc { no_projection, netCDF::NcFile::replace };
            const auto nc_y { nc.addDim("y", 3) };
            const auto nc_x { nc.addDim("x", 4) };
            nc.addVar("x", netCDF::ncDouble, nc_x).putVar(x_scan.data());
            nc.addVar("y", netCDF::ncDouble, nc_y).putVar(y_scan.data());
            nc.addVar("Rad", netCDF::ncDouble, { nc_y, nc_x })
              .putVar(radiance.data());
        }
        CHECK_THROWS_AS(goes::Granule { no_projection },
                        std::invalid_argument);
    }
}

TEST_CASE("satellite image")
{
    const std::string root { makeTmpDir("goes_test_image") };
    const auto end { date("2024-01-01T00:05:00") };
    const std::string day_dir { root + "/20240101/" };
    // 5x5 pixels around the sub-satellite point with north at the top
    const Eigen::ArrayXd x_scan { scanAxis(5, 0.0, 56e-6) };
    const Eigen::ArrayXd y_scan { scanAxis(5, 0.0, -56e-6) };
    ArrayXXd radiance_8(5, 5);
    ArrayXXd radiance_13(5, 5);
    for (int i {}; i < 5; ++i) {
        for (int j {}; j < 5; ++j) {
            radiance_8(i, j) = 10.0 * i + j;
            radiance_13(i, j) = 100.0 + 10.0 * i + j;
        }
    }
    radiance_13(4, 4) = std::nan("");
    writeGranule(day_dir + granuleName(13, end),
                 x_scan,
                 y_scan,
                 radiance_13,
                 goesEast());
    writeGranule(day_dir + granuleName(8, end),
                 x_scan,
                 y_scan,
                 radiance_8,
                 goesEast());
    const goes::GranuleLocator locator { root };

    SECTION("Geometry")
    {
        const goes::SatelliteImage image { end, { 13, 8 }, locator, 5.0 };
        CHECK(image.getChannels() == std::vector<int> { 8, 13 });
        CHECK(image.getGranule(8).channel() == 8);
        CHECK_THROWS_AS(image.getGranule(2), std::out_of_range);
        CHECK(image.getTime() == end);
        CHECK(image.observationTime() == end - std::chrono::minutes { 2 });
        CHECK(image.nRows() == 5);
        CHECK(image.nCols() == 5);
        CHECK_THAT(image.getX()(4),
                   WithinRel(2.0 * 56e-6 * goesEast().height, 1e-12));
        CHECK(image.xGrid()(3, 1) == image.getX()(1));
        CHECK(image.yGrid()(3, 1) == image.getY()(3));
        CHECK_THAT(image.getLon()(2, 2), WithinAbs(-75.0, 1e-9));
        CHECK_THAT(image.getLat()(2, 2), WithinAbs(0.0, 1e-9));
        // North is at the top and east to the right
        CHECK(image.getLat()(0, 2) > image.getLat()(4, 2));
        CHECK(image.getLon()(2, 4) > image.getLon()(2, 0));
        const auto [row, col] { image.nearestPixel(image.getLon()(1, 3),
                                                   image.getLat()(1, 3)) };
        CHECK(row == 1);
        CHECK(col == 3);
    }

    SECTION("Patch in the interior")
    {
        const goes::SatelliteImage image { end, { 8, 13 }, locator, 5.0 };
        const goes::Patch patch { image.extractPatch(-75.0, 0.0, 3, 3) };
        CHECK(patch.center_row == 2);
        CHECK(patch.center_col == 2);
        CHECK(patch.row_beg == 1);
        CHECK(patch.col_beg == 1);
        CHECK(patch.row_offset == 0);
        CHECK(patch.col_offset == 0);
        REQUIRE(patch.nRows() == 3);
        REQUIRE(patch.nCols() == 3);
        REQUIRE(patch.radiance.size() == 2);
        CHECK((patch.radiance[0] == radiance_8.block(1, 1, 3, 3)).all());
        CHECK((patch.radiance[1] == radiance_13.block(1, 1, 3, 3)).all());
        CHECK((patch.lon == image.getLon().block(1, 1, 3, 3)).all());
        CHECK((patch.lat == image.getLat().block(1, 1, 3, 3)).all());
    }

    SECTION("Even window size")
    {
        const goes::SatelliteImage image { end, { 8 }, locator, 5.0 };
        const goes::Patch patch { image.extractPatch(-75.0, 0.0, 4, 2) };
        CHECK(patch.row_beg == 1);
        CHECK(patch.col_beg == 0);
        CHECK(patch.nRows() == 2);
        CHECK(patch.nCols() == 4);
        CHECK((patch.radiance[0] == radiance_8.block(1, 0, 2, 4)).all());
    }

    SECTION("Patches at the image edges")
    {
        const goes::SatelliteImage image { end, { 8, 13 }, locator, 5.0 };
        const goes::Patch top_left { image.extractPatch(
          image.getLon()(0, 0), image.getLat()(0, 0), 3, 3) };
        CHECK(top_left.center_row == 0);
        CHECK(top_left.center_col == 0);
        CHECK(top_left.nRows() == 2);
        CHECK(top_left.nCols() == 2);
        CHECK(top_left.row_offset == 1);
        CHECK(top_left.col_offset == 1);
        CHECK((top_left.radiance[0] == radiance_8.block(0, 0, 2, 2)).all());

        const goes::Patch bottom_right { image.extractPatch(
          image.getLon()(4, 4), image.getLat()(4, 4), 3, 3) };
        CHECK(bottom_right.nRows() == 2);
        CHECK(bottom_right.nCols() == 2);
        CHECK(bottom_right.row_beg == 3);
        CHECK(bottom_right.col_beg == 3);
        CHECK(bottom_right.row_offset == 0);
        CHECK(bottom_right.col_offset == 0);
        CHECK(bottom_right.radiance[0](1, 1) == 44.0);
        CHECK(std::isnan(bottom_right.radiance[1](1, 1)));
    }

    SECTION("Invalid requests")
    {
        const goes::SatelliteImage image { end, { 8 }, locator, 5.0 };
        CHECK_THROWS_AS(image.extractPatch(105.0, 0.0, 3, 3),
                        std::invalid_argument);
        CHECK_THROWS_AS(image.extractPatch(-75.0, 0.0, 0, 3),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::SatelliteImage(end, {}, locator, 5.0),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::SatelliteImage(end, { 8, 8 }, locator, 5.0),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::SatelliteImage(end, { 8, 17 }, locator, 5.0),
                        std::invalid_argument);
        CHECK_THROWS_AS(goes::SatelliteImage(end, { 8, 10 }, locator, 5.0),
                        goes::GranuleNotFound);
    }

    SECTION("Granules that do not match")
    {
        writeGranule(day_dir + granuleName(14, end),
                     x_scan,
                     y_scan.head(4),
                     radiance_8.topRows(4),
                     goesEast());
        CHECK_THROWS_AS(goes::SatelliteImage(end, { 8, 14 }, locator, 5.0),
                        std::invalid_argument);
        goes::GeosParameters west { goesEast() };
        west.lon_0 = -137.0;
        writeGranule(
          day_dir + granuleName(15, end), x_scan, y_scan, radiance_8, west);
        CHECK_THROWS_AS(goes::SatelliteImage(end, { 8, 15 }, locator, 5.0),
                        std::invalid_argument);
    }

    SECTION("Close")
    {
        goes::SatelliteImage image { end, { 8, 13 }, locator, 5.0 };
        image.close();
        CHECK(!image.getGranule(8).isOpen());
        CHECK_NOTHROW(image.close());
        CHECK_THROWS_AS(image.extractPatch(-75.0, 0.0, 3, 3),
                        std::runtime_error);
    }
}
