// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Abstract class for storing all user defined configuration
// parameters. The parameters themselves are Setting instances defined
// in a derived class, each with its YAML path, default value (omitted
// for Setting<std::optional<T>>), and an info string:
//
// class SettingsDerived : public Settings
// {
// public:
//     SettingsDerived(const std::string& yaml_file) : Settings { yaml_file } {}
//     struct
//     {
//         Setting<int> seed { { "sampling", "seed" }, 0, "description" };
//     } sampling;
//     auto scanKeys() -> void override { scan(sampling.seed); }
//     auto checkParameters() -> void override {}
// };
//
// Grouping parameters into nested structs mirrors the nesting of the
// YAML file but is otherwise not required. Newlines in the info
// strings are kept by YAML::Emitter when printing the configuration.

#pragma once

#include "yaml.h"

namespace goes {

class Settings
{
private:
    // Whether scan should dump a setting into yaml_emitter instead of
    // reading it from config
    bool do_dump { false };
    // Warn about keys in the configuration file that no setting uses
    auto unrecognizedKeywordCheck() const -> void;
    // YAML keys of the map currently open in yaml_emitter, i.e. the
    // keys of the last dumped setting minus its name
    std::vector<std::string> cur_map_loc {};
    Emitter yaml_emitter {};
    // Write one setting to the emitter, opening and closing YAML maps
    // as the key path changes between consecutive settings.
    template <typename T>
    auto dump(Emitter& emitter, const Setting<T>& setting) -> void
    {
        const auto& keys { setting.yaml_keys };
        // Leaving one or more nested maps
        while (cur_map_loc.size() + 1 > keys.size()) {
            emitter << YAML::EndMap;
            cur_map_loc.pop_back();
        }
        for (int i { static_cast<int>(
               std::min(cur_map_loc.size(), keys.size() - 1) - 1) };
             i >= 0;
             --i) {
            if (cur_map_loc.at(i) != keys.at(i)) {
                emitter << YAML::EndMap;
                cur_map_loc.pop_back();
            }
        }
        // Entering one or more nested maps
        for (int i { static_cast<int>(cur_map_loc.size()) };
             i < static_cast<int>(keys.size() - 1);
             ++i) {
            cur_map_loc.push_back(keys.at(i));
            emitter << YAML::Key << cur_map_loc.back() << YAML::Value
                    << YAML::BeginMap;
        }
        emitter << setting;
    }

protected:
    // Configuration as read from file
    YAML::Node config {};
    // Configuration with default values only
    YAML::Node default_config {};
    // Every key visited by scan, for detecting unknown keys
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Check parameter values (file paths, ranges) and consistency
    // between parameters. May edit parameter values.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    Settings(const std::string& yaml_file)
      : config { YAML::LoadFile(yaml_file) }
    {}
    Settings(const Settings& /* settings */) {};
    // Read all parameters from the configuration and check them
    auto init() -> void;
    // Call scan on every parameter. Used both for reading and for
    // printing the configuration.
    virtual auto scanKeys() -> void = 0;
    // Either dump a setting into the emitter or set it from the YAML
    // configuration. A key missing from the configuration leaves the
    // default value untouched.
    template <typename T>
    auto scan(Setting<T>& item)
    {
        if (do_dump) {
            dump(yaml_emitter, item);
            return;
        }
        if (item.yaml_keys.empty()) {
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        YAML::Node node { YAML::Clone(config) };
        for (const auto& key : item.yaml_keys) {
            node = node[key];
            if (!node) {
                return;
            }
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            std::string str_value {};
            try {
                str_value = node.as<std::string>();
            } catch (const YAML::BadConversion&) {
                // Value is not a scalar, leave it out of the message
            }
            throw std::runtime_error { "cannot set " + item.keyToStr()
                                       + ", which is of type " + item.type
                                       + ", to the value " + str_value };
        }
    }
    // Configuration as a YAML string. If only the default constructor
    // was called, this is the default configuration.
    auto c_str(const bool verbose = true) -> const char*;
    // Configuration with defaults filled in for every parameter the
    // user did not set
    auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace goes
