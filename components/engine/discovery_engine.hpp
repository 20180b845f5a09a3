#pragma once

#include "netmapper/discovery_interface.hpp"
#include "components/credentials/credential_store.hpp"
#include "components/normalizer/interface_normalizer.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace spdlog {
class logger;
}

namespace netmapper::components {

struct SeedDevice {
    std::string address;
    std::string hostname;
};

enum class LinkConflictPolicy {
    FIRST_REPORTED,     // One remote interface per (local device, local interface, remote device)
    KEEP_ALL
};

struct DiscoveryOptions {
    uint32_t max_hops = 4;
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds command_timeout{30000};
    std::chrono::milliseconds reachability_timeout{3000};
    uint16_t ssh_port = 22;
    std::vector<std::string> command_set = {
        "show cdp neighbors detail",
        "show lldp neighbors detail"
    };
    // Run on each visited device before the neighbor commands; output is read
    // for hostname, serial number, model and software version only
    std::vector<std::string> device_info_commands;
    std::vector<std::string> exclusions;
    LinkConflictPolicy link_conflict_policy = LinkConflictPolicy::FIRST_REPORTED;
    bool normalize_interfaces = true;
};

// Neighbor row after vendor field names have been mapped
struct NeighborRecord {
    std::string neighbor_name;
    std::string management_address;
    std::string platform;
    std::string local_interface;
    std::string remote_interface;
    std::string capabilities;
};

struct FrontierItem {
    std::string device_id;
    uint32_t hop_distance = 0;
};

// Working state of one run. Lives only inside run() and is passed
// explicitly to every traversal step.
struct DiscoveryContext {
    DiscoveryOptions options;
    std::deque<FrontierItem> frontier;
    std::unordered_set<std::string> visited;
    std::unordered_map<std::string, std::string> aliases;   // short name or address -> canonical id
    std::unordered_set<std::string> edge_keys;
    std::unordered_set<std::string> claimed_ports;
    DiscoveryResult result;
};

struct RunControl {
    std::function<void(const ProgressEvent&)> on_progress;
    std::function<bool()> should_stop;
};

// Breadth-first topology crawl over SSH-reachable devices
class DiscoveryEngine {
public:
    DiscoveryEngine(IReachabilityProbe& probe, IConnectionClient& client, const IOutputParser& parser,
                    std::shared_ptr<spdlog::logger> logger = nullptr);

    bool configure(const std::map<std::string, std::string>& config);
    std::map<std::string, std::string> get_configuration_schema() const;
    const DiscoveryOptions& options() const { return options_; }
    void set_options(const DiscoveryOptions& options) { options_ = options; }

    DiscoveryResult run(const std::vector<SeedDevice>& seeds, const CredentialStore& credentials,
                        const RunControl& control = RunControl());
    DiscoveryResult run(const std::vector<SeedDevice>& seeds, const CredentialStore& credentials,
                        uint32_t max_hops, const std::vector<std::string>& command_set,
                        const RunControl& control = RunControl());

    // Neighbor identity helpers
    static NeighborRecord to_neighbor_record(const ParsedRecord& record);
    static std::string normalize_device_name(const std::string& name);
    static bool is_valid_ip_address(const std::string& address);
    static bool is_excluded(const std::string& hostname, const std::vector<std::string>& exclusions);
    // "host,10.0.0.1;10.0.0.2" -> two seeds
    static std::vector<SeedDevice> parse_seed_list(const std::string& seeds);
    // Fills identity fields the device does not have yet; returns the hostname it found
    static std::string apply_device_info(DiscoveredDevice& device, const std::string& command,
                                         const std::string& output);

private:
    DiscoveryResult run_with_options(const DiscoveryOptions& options, const std::vector<SeedDevice>& seeds,
                                     const CredentialStore& credentials, const RunControl& control);
    void visit_device(DiscoveryContext& context, const FrontierItem& item,
                      const CredentialStore& credentials, const RunControl& control);
    bool probe_device(DiscoveryContext& context, DiscoveredDevice& device, std::string& address);
    std::unique_ptr<Session> open_session(const DiscoveryContext& context, DiscoveredDevice& device,
                                          const std::string& address, const CredentialStore& credentials,
                                          std::string& last_error);
    void process_neighbors(DiscoveryContext& context, DiscoveredDevice& device, const std::string& command,
                           const std::vector<ParsedRecord>& records);
    std::string resolve_neighbor_id(const DiscoveryContext& context, const NeighborRecord& neighbor) const;
    bool add_edge(DiscoveryContext& context, const NeighborEdge& edge) const;
    void backfill_device(DiscoveredDevice& device, const NeighborRecord& neighbor) const;
    void record_failure(DiscoveryContext& context, DiscoveredDevice& device, DeviceStatus status,
                        ErrorKind kind, const std::string& reason) const;
    void emit_progress(const DiscoveredDevice& device, const RunControl& control) const;
    std::string normalize_interface(const DiscoveryContext& context, const std::string& name) const;

    static void register_alias(DiscoveryContext& context, const std::string& key, const std::string& device_id);
    static std::string protocol_for_command(const std::string& command);

    IReachabilityProbe& probe_;
    IConnectionClient& client_;
    const IOutputParser& parser_;
    InterfaceNormalizer normalizer_;
    DiscoveryOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace netmapper::components
