// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include "lightning_grid.h"
#include "patch_dataset.h"
#include "time.h"

#include <filesystem>
#include <limits>
#include <netcdf>
#include <numeric>
#include <omp.h>
#include <sstream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

namespace goes {

// Deflate level of the bulk arrays of the patch dataset
constexpr int compression_level { 5 };

auto goes_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                 const std::tm& /* tm_time */,
                                 spdlog::memory_buf_t& dest) -> void
{
    std::string text {};
    switch (log_msg.level) {
    case spdlog::level::info:
        break;
    case spdlog::level::warn:
        text = " [warning]";
        break;
    case spdlog::level::err:
        text = " [error]";
        break;
    case spdlog::level::debug:
        text = " [debug]";
        break;
    case spdlog::level::off:
    case spdlog::level::trace:
    case spdlog::level::critical:
    case spdlog::level::n_levels:
    default:
        text = " [unknown]";
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    dest.append(text.data(), text.data() + text.size());
}

auto goes_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<goes_formatter_flag>();
}

auto initLogging() -> void
{
    // Only if the logger does not already exist
    if (!spdlog::get("plain")) {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<goes_formatter_flag>('*').set_pattern(
          "[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        spdlog::stdout_color_mt("plain");
        spdlog::get("plain")->set_pattern("%v");
    }
    spdlog::set_level(spdlog::level::info);
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    if (incl_empty_line) {
        spdlog::get("plain")->info("");
    }
    std::string hash_line(heading.size() + 4, '#');
    spdlog::get("plain")->info(hash_line);
    spdlog::get("plain")->info("# " + heading + " #");
    spdlog::get("plain")->info(hash_line);
}

auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void
{
    spdlog::get("plain")->info("Version                 : {}", project_version);
    if (git_commit != "GITDIR-N") {
        spdlog::get("plain")->info("Commit hash             : {}", git_commit);
    }
    spdlog::get("plain")->info("Date and timezone       : {}", getDate());
    spdlog::get("plain")->info("Host system             : {}",
                               cmake_host_system);
    spdlog::get("plain")->info("Executable location     : {}", executable);
    spdlog::get("plain")->info("C++ compiler            : {}", compiler);
    spdlog::get("plain")->info("C++ compiler flags      : {}", compiler_flags);
    spdlog::get("plain")->info("Number of threads       : {}",
                               omp_get_max_threads());
    for (bool first_line { true };
         const auto& lib : splitString(libraries, ' ')) {
        if (first_line) {
            spdlog::get("plain")->info("Linking against         : {}", lib);
            first_line = false;
        } else {
            spdlog::get("plain")->info("                          {}", lib);
        }
    }
}

auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void
{
    if (omp_get_thread_num() != 0) {
        return;
    }
    spdlog::info(
      "{} {:6.2f}%",
      text,
      std::min(100.0, 1e2 * iteration / static_cast<double>(work_size)));
}

auto checkPresenceOfDirectory(const Setting<std::string>& setting) -> void
{
    if (setting.empty()) {
        throw std::runtime_error { "missing " + setting.keyToStr() };
    }
    if (!std::filesystem::is_directory(std::string { setting })) {
        throw std::runtime_error { "directory " + setting
                                   + " given by " + setting.keyToStr()
                                   + " does not exist" };
    }
}

auto prepareOutputDirectory(const std::string& directory) -> void
{
    if (directory.empty()) {
        return;
    }
    std::filesystem::create_directories(directory);
    if (static_cast<bool>(access(directory.c_str(), W_OK))) {
        throw std::runtime_error { directory + " is not writable" };
    }
}

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>
{
    std::stringstream ss { list };
    std::string name {};
    std::vector<std::string> strings {};
    while (getline(ss, name, delimiter)) {
        strings.push_back(name);
    }
    return strings;
}

[[nodiscard]] auto readLightningGrid(const std::string& filename)
  -> LightningGrid
{
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    LightningGrid grid {};

    const auto nc_time { nc.getVar("time") };
    const auto nc_lon { nc.getVar("lon") };
    const auto nc_lat { nc.getVar("lat") };
    const auto nc_counts { nc.getVar("lightning_counts") };
    if (nc_time.isNull() || nc_lon.isNull() || nc_lat.isNull()
        || nc_counts.isNull()) {
        throw std::invalid_argument {
            filename + " must contain the variables time, lon, lat, and "
                       "lightning_counts"
        };
    }
    if (nc_time.getDimCount() != 1 || nc_lon.getDimCount() != 2
        || nc_lat.getDimCount() != 2) {
        throw std::invalid_argument {
            "time must be 1D and lon and lat must be 2D in " + filename
        };
    }
    const size_t n_time { nc_time.getDim(0).getSize() };
    const size_t n_y { nc_lon.getDim(0).getSize() };
    const size_t n_x { nc_lon.getDim(1).getSize() };
    if (nc_lat.getDim(0).getSize() != n_y
        || nc_lat.getDim(1).getSize() != n_x) {
        throw std::invalid_argument { "lon and lat have different "
                                      "dimensions in "
                                      + filename };
    }
    if (nc_counts.getDimCount() != 3
        || nc_counts.getDim(0).getSize() != n_time
        || nc_counts.getDim(1).getSize() != n_y
        || nc_counts.getDim(2).getSize() != n_x) {
        throw std::invalid_argument {
            "lightning_counts must have dimensions (time, y, x) matching "
            "those of time and lon in "
            + filename
        };
    }

    // Time axis
    std::vector<double> time_values(n_time);
    nc_time.getVar(time_values.data());
    const auto atts { nc_time.getAtts() };
    const auto units_att { atts.find("units") };
    if (units_att == atts.end()) {
        throw std::invalid_argument { "time variable of " + filename
                                      + " has no units" };
    }
    std::string units {};
    units_att->second.getValues(units);
    grid.time = decodeCFTimes(time_values, units);

    // Cell centers
    grid.lon.resize(n_y, n_x);
    grid.lat.resize(n_y, n_x);
    nc_lon.getVar(grid.lon.data());
    nc_lat.getVar(grid.lat.data());

    // Counts, one time step at a time
    grid.counts.resize(n_time);
    for (size_t i_time {}; i_time < n_time; ++i_time) {
        grid.counts[i_time].resize(n_y, n_x);
        nc_counts.getVar(
          { i_time, 0, 0 }, { 1, n_y, n_x }, grid.counts[i_time].data());
    }
    spdlog::info("Lightning grid: {} times, {}x{} cells",
                 grid.nTimes(),
                 grid.nRows(),
                 grid.nCols());
    return grid;
}

// Apply compression to a NetCDF variable
static auto setCompression(const bool compress,
                           netCDF::NcVar& nc_var,
                           std::vector<size_t> chunksizes) -> void
{
    if (compress) {
        nc_var.setCompression(true, true, compression_level);
        nc_var.setChunking(netCDF::NcVar::nc_CHUNKED, chunksizes);
    }
}

// Write global attributes to a NetCDF file
static auto writeHeader(netCDF::NcFile& nc,
                        const std::string& filename,
                        const std::string& config,
                        const int argc,
                        const char* const argv[]) -> void
{
    nc.putAtt("Conventions", "CF-1.11");
    nc.putAtt("title", "GOES-16 ABI patches centered on GLM lightning grid "
                       "cells");
    nc.putAtt("instrument", "ABI");
    nc.putAtt("product_name",
              std::filesystem::path { filename }.filename().string());
    nc.putAtt("date_created", getDateAndTime());
    const std::string no_git_commit { "GITDIR-N" };
    if (GOES_GIT_COMMIT_ABBREV != no_git_commit) {
        nc.putAtt("git_commit", GOES_GIT_COMMIT_ABBREV);
    }
    std::string command_line { argc > 0 ? argv[0] : "" };
    for (int i { 1 }; i < argc; ++i) {
        command_line = command_line + ' ' + argv[i];
    }
    nc.putAtt("history", command_line);
    // Extract processing version from the configuration
    const std::string processing_version {
        YAML::Load(config)["processing_version"].as<std::string>("")
    };
    nc.putAtt("processing_version", processing_version);

    auto nc_var { nc.addVar("configuration", netCDF::ncString) };
    nc_var.putAtt("comment",
                  "configuration parameters used for producing this file");
    const char* conf_char { config.c_str() };
    nc_var.putVar(&conf_char);
}

// Write all variables of the dataset to an open file
static auto writeDataset(netCDF::NcFile& nc,
                         const PatchDataset& dataset,
                         const bool compress) -> void
{
    const auto n_patches { static_cast<size_t>(dataset.n_patches) };
    const auto n_y { static_cast<size_t>(dataset.n_y) };
    const auto n_x { static_cast<size_t>(dataset.n_x) };
    const auto n_bands { static_cast<size_t>(dataset.nBands()) };
    // A zero-length dimension would be unlimited and cannot be
    // chunked with a zero chunk size.
    const bool do_compress { compress && n_patches > 0 };

    const auto nc_patch { nc.addDim("patch", n_patches) };
    const auto nc_y { nc.addDim("y", n_y) };
    const auto nc_x { nc.addDim("x", n_x) };
    const auto nc_band { nc.addDim("band", n_bands) };

    // Coordinate variables
    auto nc_var { nc.addVar("patch", netCDF::ncInt64, nc_patch) };
    nc_var.putAtt("long_name", "patch index");
    std::vector<int64_t> patch_idx(n_patches);
    std::iota(patch_idx.begin(), patch_idx.end(), 0);
    if (n_patches > 0) {
        nc_var.putVar(patch_idx.data());
    }
    nc_var = nc.addVar("y", netCDF::ncInt, nc_y);
    nc_var.putAtt("long_name", "pixel row inside the patch window");
    std::vector<int> y_idx(n_y);
    std::iota(y_idx.begin(), y_idx.end(), 0);
    nc_var.putVar(y_idx.data());
    nc_var = nc.addVar("x", netCDF::ncInt, nc_x);
    nc_var.putAtt("long_name", "pixel column inside the patch window");
    std::vector<int> x_idx(n_x);
    std::iota(x_idx.begin(), x_idx.end(), 0);
    nc_var.putVar(x_idx.data());
    nc_var = nc.addVar("band", netCDF::ncInt, nc_band);
    nc_var.putAtt("long_name", "ABI band number");
    nc_var.putVar(dataset.bands.data());

    if (n_patches == 0) {
        spdlog::warn("writing an empty patch dataset");
    }

    // Bulk data
    constexpr float nan { std::numeric_limits<float>::quiet_NaN() };
    nc_var = nc.addVar(
      "abi", netCDF::ncFloat, { nc_patch, nc_y, nc_x, nc_band });
    nc_var.putAtt("long_name", "ABI L1b radiances");
    nc_var.putAtt("units", "mW m-2 sr-1 (cm-1)-1");
    nc_var.putAtt("_FillValue", netCDF::ncFloat, nan);
    setCompression(do_compress, nc_var, { 1, n_y, n_x, n_bands });
    if (n_patches > 0) {
        nc_var.putVar(dataset.abi.data());
    }

    nc_var = nc.addVar("lon", netCDF::ncFloat, { nc_patch, nc_y, nc_x });
    nc_var.putAtt("long_name", "longitude of pixel centers");
    nc_var.putAtt("units", "degrees_east");
    nc_var.putAtt("_FillValue", netCDF::ncFloat, nan);
    setCompression(do_compress, nc_var, { 1, n_y, n_x });
    if (n_patches > 0) {
        nc_var.putVar(dataset.lon.data());
    }

    nc_var = nc.addVar("lat", netCDF::ncFloat, { nc_patch, nc_y, nc_x });
    nc_var.putAtt("long_name", "latitude of pixel centers");
    nc_var.putAtt("units", "degrees_north");
    nc_var.putAtt("_FillValue", netCDF::ncFloat, nan);
    setCompression(do_compress, nc_var, { 1, n_y, n_x });
    if (n_patches > 0) {
        nc_var.putVar(dataset.lat.data());
    }

    // Per-patch labels
    nc_var = nc.addVar("time", netCDF::ncInt64, nc_patch);
    nc_var.putAtt("long_name", "lightning grid time");
    nc_var.putAtt("units", "seconds since 1970-01-01 00:00:00");
    nc_var.putAtt("calendar", "standard");
    if (n_patches > 0) {
        nc_var.putVar(dataset.time.data());
    }

    nc_var = nc.addVar("flash_counts", netCDF::ncInt, nc_patch);
    nc_var.putAtt("long_name", "GLM flash count of the center grid cell");
    if (n_patches > 0) {
        nc_var.putVar(dataset.flash_counts.data());
    }

    nc_var = nc.addVar("row", netCDF::ncInt, nc_patch);
    nc_var.putAtt("long_name", "lightning grid row of the patch center");
    if (n_patches > 0) {
        nc_var.putVar(dataset.row.data());
    }

    nc_var = nc.addVar("col", netCDF::ncInt, nc_patch);
    nc_var.putAtt("long_name", "lightning grid column of the patch center");
    if (n_patches > 0) {
        nc_var.putVar(dataset.col.data());
    }
}

auto writePatches(const std::string& filename,
                  const std::string& config,
                  const PatchDataset& dataset,
                  const bool compress,
                  const int argc,
                  const char* const argv[]) -> void
{
    const std::string tmp_filename { filename + ".tmp" };
    try {
        {
            netCDF::NcFile nc { tmp_filename, netCDF::NcFile::replace };
            writeHeader(nc, filename, config, argc, argv);
            writeDataset(nc, dataset, compress);
        }
        std::filesystem::rename(tmp_filename, filename);
    } catch (const std::exception&) {
        std::error_code ec {};
        std::filesystem::remove(tmp_filename, ec);
        throw;
    }
    spdlog::info("Wrote {} patches to {}", dataset.n_patches, filename);
}

} // namespace goes
