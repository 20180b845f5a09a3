#pragma once

#include <map>
#include <string>

// Forward declarations
#include <nlohmann/json_fwd.hpp>

namespace netmapper::components {

// Flattens a JSON settings object into the key/value form accepted by
// DiscoveryEngine::configure. Arrays become ';' (commands) or ','
// separated lists; nested objects are rejected.
std::map<std::string, std::string> flatten_config(const nlohmann::json& settings);

std::map<std::string, std::string> load_config_file(const std::string& path);

} // namespace netmapper::components
