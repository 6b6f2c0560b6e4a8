// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A single user defined configuration parameter. Setting<T> stores
// where the parameter lives in the YAML configuration (yaml_keys),
// what it does (info), and its value.
//
// For primitive types (bool, int, double, enums) the value is kept in
// the "value" member and the class converts implicitly to T so that
// one can write
//
//   if (settings.compress) {
//
// For strings, lists and optionals the setting inherits from the
// standard type so that, e.g., settings.abi.channels.size() works
// directly. The chain of YAML keys for
//
//   sampling:
//     seed: 3
//
// is { "sampling", "seed" } and the last key is the parameter name.

#pragma once

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace goes {

// Meta information shared by all settings. The type string is only
// used when printing the configuration.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    SettingBase() = default;
    SettingBase(const bool is_list,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys }, info { info }
    {
        const std::string suffix { is_list ? " list" : "" };
        if constexpr (std::is_same_v<T, bool>) {
            type = "boolean" + suffix;
        } else if constexpr (std::is_same_v<T, int>) {
            type = "integer" + suffix;
        } else if constexpr (std::is_same_v<T, size_t>) {
            type = "unsigned integer" + suffix;
        } else if constexpr (std::is_same_v<T, double>) {
            type = "double (float64)" + suffix;
        } else if constexpr (std::is_same_v<T, std::string>
                             || std::is_enum_v<T>) {
            type = "string" + suffix;
        } else {
            throw std::domain_error {
                "type not supported by the Setting class"
            };
        }
    }
    // Convert the list of YAML keys into a string [a][b]...
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::stringstream s {};
        for (const auto& key : yaml_keys) {
            s << '[' << key << ']';
        }
        return s.str();
    }
    ~SettingBase() = default;
};

// Setting for primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, value { value }
    {}

    operator T() const { return value; }
    auto operator=(const T& value) -> Setting<T>&
    {
        this->value = value;
        return *this;
    }

    ~Setting() = default;
};

// Setting holding a list of values
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }, std::vector<T> { value }
    {}
    // Assign to the std::vector base, leaving the meta data intact
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting without a sensible default value. Whether the user must set
// it is decided in checkParameters of the derived Settings class.
template <typename T>
class Setting<std::optional<T>>
  : public SettingBase<T>
  , public std::optional<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys, const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, std::optional<T> {}
    {}
    auto operator=(const std::optional<T>& value) -> Setting<std::optional<T>>&
    {
        std::optional<T>* base { this };
        *base = value;
        return *this;
    }
};

template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { false, yaml_keys, info }
      , std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace goes
