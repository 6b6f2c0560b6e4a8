// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the patch
// extraction

#pragma once

#include <common/settings.h>

namespace goes {

class SettingsPatches : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    Setting<std::string> processing_version {
        { "processing_version" },
        {},
        "version of the processing toolchain"
    };
    Setting<bool> compress { { "compress" },
                             true,
                             "whether to compress the patch files" };

    struct
    {
        Setting<std::string> path {
            { "abi", "path" },
            {},
            "root directory of ABI granules, organized in day directories\n"
            "YYYYMMDD/"
        };
        Setting<std::vector<int>> channels { { "abi", "channels" },
                                             { 8, 10, 13, 14 },
                                             "ABI band numbers to extract" };
        Setting<double> time_range_minutes {
            { "abi", "time_range_minutes" },
            11.0,
            "maximum difference between the requested time and the time\n"
            "of a granule, in minutes"
        };
        Setting<std::string> product { { "abi", "product" },
                                       "ABI-L1b-RadC",
                                       "ABI product in the file names" };
        Setting<std::string> satellite { { "abi", "satellite" },
                                         "G16",
                                         "satellite identifier in the file "
                                         "names" };
        Setting<GranuleTime> file_date {
            { "abi", "file_date" },
            GranuleTime::end,
            "which timestamp of the file name to match (start, end,\n"
            "creation)"
        };
        Setting<bool> search_adjacent_days {
            { "abi", "search_adjacent_days" },
            false,
            "also search the day directories before and after the\n"
            "requested day if the time tolerance reaches into them"
        };
    } abi;

    struct
    {
        Setting<std::string> path {
            { "glm", "path" },
            {},
            "directory containing the lightning grid files"
        };
        Setting<std::vector<std::string>> file_dates {
            { "glm", "file_dates" },
            {},
            "start dates of the lightning grid files to process, e.g.\n"
            "2020-06-01 or 2020-06-01T00:00:00. One patch file is written\n"
            "per date."
        };
        Setting<std::string> file_freq { { "glm", "file_freq" },
                                         "1D",
                                         "time span covered by one lightning "
                                         "grid file" };
        Setting<std::string> date_format {
            { "glm", "date_format" },
            "%Y%m%dT%H%M%S",
            "strftime format of dates in the grid and patch file names"
        };
    } glm;

    struct
    {
        Setting<std::string> lead_time {
            { "sampling", "lead_time" },
            "0min",
            "offset between the lightning time and the satellite\n"
            "observation (observation = lightning time - lead time)"
        };
        Setting<int> patch_x_pixels { { "sampling", "patch_x_pixels" },
                                      32,
                                      "patch width in pixels" };
        Setting<int> patch_y_pixels { { "sampling", "patch_y_pixels" },
                                      32,
                                      "patch height in pixels" };
        Setting<int> samples_per_time {
            { "sampling", "samples_per_time" },
            100,
            "number of grid cells sampled per lightning grid time"
        };
        Setting<int> seed { { "sampling", "seed" },
                            0,
                            "seed of the random cell selection" };
        Setting<int> n_threads {
            { "sampling", "n_threads" },
            1,
            "number of time steps processed concurrently. Each one keeps\n"
            "a set of granules open."
        };
    } sampling;

    struct
    {
        Setting<std::string> patch_path {
            { "io_files", "patch_path" },
            {},
            "output directory for patch files, created if absent"
        };
    } io_files;

    SettingsPatches() = default;
    SettingsPatches(const std::string& yaml_file) : Settings { yaml_file } {}
    auto scanKeys() -> void override;
};

} // namespace goes
