// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "yaml.h"

#include <algorithm>
#include <map>

// Names of the timestamps in an ABI file name (s<start>_e<end>_c<creation>)
const std::map<std::string, goes::GranuleTime> granule_time_to_enum {
    { "start", goes::GranuleTime::start },
    { "end", goes::GranuleTime::end },
    { "creation", goes::GranuleTime::creation },
};

namespace YAML {

auto convert<goes::GranuleTime>::decode(const Node& node,
                                        goes::GranuleTime& rhs) -> bool
{
    try {
        rhs = granule_time_to_enum.at(node.as<std::string>());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument { "unknown granule time: "
                                      + node.as<std::string>() };
    }
    return true;
}

} // namespace YAML

namespace goes {

auto operator<<(YAML::Emitter& out,
                const GranuleTime granule_time) -> YAML::Emitter&
{
    out << granuleTimeToString(granule_time);
    return out;
}

[[nodiscard]] auto granuleTimeToString(const GranuleTime granule_time)
  -> std::string
{
    const auto it { std::ranges::find_if(
      granule_time_to_enum,
      [granule_time](const auto& item) { return item.second == granule_time; }) };
    return it->first;
}

} // namespace goes
