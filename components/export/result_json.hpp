#pragma once

#include "netmapper/discovery_interface.hpp"
#include <memory>
#include <string>

// Forward declarations
#include <nlohmann/json_fwd.hpp>

namespace spdlog {
class logger;
}

namespace netmapper {

// nlohmann::json serializers, found through ADL
void to_json(nlohmann::json& json, const DiscoveredDevice& device);
void to_json(nlohmann::json& json, const NeighborEdge& edge);
void to_json(nlohmann::json& json, const DiscoveryFailure& failure);

namespace components {

nlohmann::json result_to_json(const DiscoveryResult& result);
std::string result_to_string(const DiscoveryResult& result, int indent = 2);
bool save_result(const DiscoveryResult& result, const std::string& path,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace components

} // namespace netmapper
