#include "result_json.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace netmapper {

void to_json(nlohmann::json& json, const DiscoveredDevice& device) {
    json = nlohmann::json{
        {"canonical_id", device.canonical_id},
        {"hostname", device.hostname},
        {"platform", device.platform},
        {"management_address", device.management_address},
        {"hop_distance", device.hop_distance},
        {"status", to_string(device.status)},
        {"discovered_via", device.discovered_via},
        {"capabilities", device.capabilities},
        {"neighbor_count", device.neighbor_count}
    };
    if (!device.resolved_address.empty()) {
        json["resolved_address"] = device.resolved_address;
    }
    if (!device.successful_credential.empty()) {
        json["credential_id"] = device.successful_credential;
    }
    if (!device.serial_number.empty()) {
        json["serial_number"] = device.serial_number;
    }
    if (!device.model.empty()) {
        json["model"] = device.model;
    }
    if (!device.software_version.empty()) {
        json["software_version"] = device.software_version;
    }
    if (!device.productive_commands.empty()) {
        json["productive_commands"] = device.productive_commands;
    }
    if (device.last_error != ErrorKind::NONE) {
        json["error"] = to_string(device.last_error);
    }
}

void to_json(nlohmann::json& json, const NeighborEdge& edge) {
    json = nlohmann::json{
        {"local_device", edge.local_device_id},
        {"local_interface", edge.local_interface},
        {"remote_device", edge.remote_device_id},
        {"remote_interface", edge.remote_interface},
        {"protocol", edge.protocol}
    };
}

void to_json(nlohmann::json& json, const DiscoveryFailure& failure) {
    json = nlohmann::json{
        {"device_id", failure.device_id},
        {"kind", to_string(failure.kind)},
        {"reason", failure.reason}
    };
}

namespace components {

namespace {

std::string utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream stream;
    stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return stream.str();
}

} // namespace

nlohmann::json result_to_json(const DiscoveryResult& result) {
    nlohmann::json devices = nlohmann::json::object();
    uint32_t max_hop = 0;
    size_t with_hostname = 0;
    size_t with_platform = 0;
    for (const auto& [id, device] : result.devices) {
        devices[id] = device;
        max_hop = std::max(max_hop, device.hop_distance);
        if (!device.hostname.empty()) {
            ++with_hostname;
        }
        if (!device.platform.empty()) {
            ++with_platform;
        }
    }

    nlohmann::json json;
    json["devices"] = devices;
    json["edges"] = result.edges;
    json["failures"] = result.failures;
    json["metadata"] = {
        {"version", NETMAPPER_VERSION},
        {"discovered_at", utc_timestamp()},
        {"total_devices", result.devices.size()},
        {"visited", result.count_with_status(DeviceStatus::VISITED)},
        {"failed", result.count_with_status(DeviceStatus::FAILED)},
        {"unreachable", result.count_with_status(DeviceStatus::UNREACHABLE)},
        {"pending", result.count_with_status(DeviceStatus::PENDING)},
        {"max_hop_count", max_hop},
        {"devices_with_hostname", with_hostname},
        {"devices_with_platform", with_platform},
        {"total_edges", result.edges.size()},
        {"cancelled", result.cancelled}
    };
    return json;
}

std::string result_to_string(const DiscoveryResult& result, int indent) {
    // Device output is not guaranteed to be UTF-8; bad bytes become U+FFFD
    return result_to_json(result).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool save_result(const DiscoveryResult& result, const std::string& path, std::shared_ptr<spdlog::logger> logger) {
    if (!logger) {
        logger = spdlog::default_logger();
    }

    std::string serialized;
    try {
        serialized = result_to_string(result);
    } catch (const nlohmann::json::exception& e) {
        logger->error("Cannot serialize topology: {}", e.what());
        return false;
    }

    std::ofstream file(path);
    if (!file) {
        logger->error("Cannot open {} for writing", path);
        return false;
    }
    file << serialized << '\n';
    if (!file) {
        logger->error("Failed writing topology to {}", path);
        return false;
    }

    logger->info("Topology written to {} ({} devices, {} edges)", path, result.devices.size(), result.edges.size());
    return true;
}

} // namespace components

} // namespace netmapper
