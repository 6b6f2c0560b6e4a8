// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Functions for formatting the output to stdout, for manipulating
// input/output files, and tests for things like whether a directory
// is readable/writable. Also, provide the main functions for reading
// lightning grids and writing patch datasets.

#pragma once

#include "setting.h"

#include <spdlog/pattern_formatter.h>

namespace goes {

struct LightningGrid;
struct PatchDataset;

// Define a new spdlog formatter flag. The primary purpose is to show
// labels such as [warning] for warnings but no label for regular
// (info) messages.
class goes_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set up two loggers: one with a verbose pattern (mostly used
// throughout the code) and a plain one (clean pattern, i.e. prints
// just the message text).
auto initLogging() -> void;

// Print the name of a processing section. For example, reading the
// lightning grid would start with
//
// ###########################
// # Reading lightning grids #
// ###########################
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Print information about the host system and how the executable or
// library was built and some runtime options.
auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void;

// Print the percentage of work done (iteration / work_size). Call
// this in OpenMP parallel for loops with dynamic scheduling.
auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void;

// Check that the directory given by a setting exists. An empty
// setting is an error.
auto checkPresenceOfDirectory(const Setting<std::string>& setting) -> void;

// Create a directory (and its parents) if absent and check that it
// is writable
auto prepareOutputDirectory(const std::string& directory) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

// Read a gridded lightning product. The file must contain the
// variables time(time), lon(y, x), lat(y, x), and
// lightning_counts(time, y, x) where time carries CF-style units.
[[nodiscard]] auto readLightningGrid(const std::string& filename)
  -> LightningGrid;

// Write a patch dataset to file. The dataset is first written to a
// temporary file in the same directory which is renamed to filename
// only if everything succeeded. argc and argv are used to record how
// the program was invoked.
auto writePatches(const std::string& filename,
                  const std::string& config,
                  const PatchDataset& dataset,
                  const bool compress,
                  const int argc = 0,
                  const char* const argv[] = nullptr) -> void;

} // namespace goes
