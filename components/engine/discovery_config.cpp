#include "discovery_config.hpp"
#include "netmapper/discovery_interface.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace netmapper::components {

namespace {

std::string scalar_to_string(const std::string& key, const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        throw ConfigError("'" + key + "' must be an integer");
    }
    throw ConfigError("'" + key + "' has an unsupported type");
}

} // namespace

std::map<std::string, std::string> flatten_config(const nlohmann::json& settings) {
    if (!settings.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    std::map<std::string, std::string> config;
    for (const auto& [key, value] : settings.items()) {
        if (value.is_null()) {
            continue;
        }
        if (value.is_object()) {
            throw ConfigError("'" + key + "' must not be a nested object");
        }
        if (value.is_array()) {
            const char separator = (key == "commands" || key == "device_info_commands") ? ';' : ',';
            std::string joined;
            for (const auto& item : value) {
                if (!joined.empty()) {
                    joined += separator;
                }
                joined += scalar_to_string(key, item);
            }
            config[key] = joined;
            continue;
        }
        config[key] = scalar_to_string(key, value);
    }
    return config;
}

std::map<std::string, std::string> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path);
    }

    nlohmann::json settings;
    try {
        file >> settings;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    return flatten_config(settings);
}

} // namespace netmapper::components
