// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Extensions of the YAML library that are necessary to work with
// non-standard types of this project.

#pragma once

#include "constants.h"
#include "setting.h"

#include <yaml-cpp/yaml.h>

// Instruct YAML how to read values into non-standard types, e.g., how
// to read into a parameter of type std::optional.
namespace YAML {

template <typename T>
struct convert<std::optional<T>>
{
    static auto decode(const Node& node, std::optional<T>& rhs) -> bool
    {
        // Null values are okay. Then the optional parameter remains unset.
        if (!node.IsNull()) {
            rhs.emplace(node.as<T>());
        }
        return true;
    }
};

template <>
struct convert<goes::GranuleTime>
{
    static auto decode(const Node& node, goes::GranuleTime& rhs) -> bool;
};

} // namespace YAML

namespace goes {

template <typename T>
auto operator<<(YAML::Emitter& out,
                const std::optional<T> value) -> YAML::Emitter&
{
    if (value) {
        out << value.value();
    } else {
        out << YAML::Null;
    }
    return out;
}

auto operator<<(YAML::Emitter& out,
                const GranuleTime granule_time) -> YAML::Emitter&;

// Convert a granule time key to the name used in the configuration
[[nodiscard]] auto granuleTimeToString(const GranuleTime granule_time)
  -> std::string;

// Emitter with a switch for printing the info and type of each
// parameter along with its value
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

template <typename T>
static auto operator<<(Emitter& out, const Setting<T> setting) -> Emitter&
{
    out << YAML::Key << setting.yaml_keys.back();
    if (out.verbose) {
        out << YAML::Value;
        out << YAML::BeginMap;
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Key << "default" << YAML::Value << static_cast<T>(setting);
        out << YAML::Key << "type" << YAML::Value << setting.type;
        out << YAML::Key << "info" << YAML::Value << YAML::Literal
            << setting.info;
        out << YAML::EndMap;
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Value << static_cast<T>(setting);
    }
    return out;
}

} // namespace goes
