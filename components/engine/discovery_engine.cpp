#include "discovery_engine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <sstream>

#include <arpa/inet.h>

namespace netmapper::components {

namespace {

// Field spellings used by the bundled and common community templates
const std::vector<std::string> kNameFields = {
    "NEIGHBOR_NAME", "DEVICE_ID", "HOSTNAME", "SYSTEM_NAME", "NEIGHBOR", "DESTINATION_HOST"
};
const std::vector<std::string> kAddressFields = {
    "MGMT_ADDRESS", "MANAGEMENT_ADDRESS", "MANAGEMENT_IP", "MGMT_IP", "IP_ADDRESS", "NEIGHBOR_IP"
};
const std::vector<std::string> kLocalInterfaceFields = {
    "LOCAL_INTERFACE", "LOCAL_INTF", "LOCAL_PORT", "INTERFACE", "PORT"
};
const std::vector<std::string> kRemoteInterfaceFields = {
    "NEIGHBOR_INTERFACE", "REMOTE_INTERFACE", "REMOTE_INTF", "NEIGHBOR_PORT_ID", "PORT_ID", "REMOTE_PORT"
};
const std::vector<std::string> kPlatformFields = {
    "PLATFORM", "HARDWARE", "SYSTEM_DESCRIPTION"
};
const std::vector<std::string> kCapabilityFields = {
    "CAPABILITIES", "SYSTEM_CAPABILITIES"
};

// Releases a session exactly once on every exit path
class SessionGuard {
public:
    SessionGuard(IConnectionClient& client, std::unique_ptr<Session> session,
                 std::shared_ptr<spdlog::logger> logger)
        : client_(client), session_(std::move(session)), logger_(std::move(logger)) {}

    ~SessionGuard() {
        release();
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    Session& session() { return *session_; }

    void release() {
        if (!session_) {
            return;
        }
        try {
            client_.disconnect(*session_);
        } catch (const std::exception& e) {
            logger_->warn("Disconnect from {} failed: {}", session_->address, e.what());
        }
        session_.reset();
    }

private:
    IConnectionClient& client_;
    std::unique_ptr<Session> session_;
    std::shared_ptr<spdlog::logger> logger_;
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string first_field(const std::map<std::string, std::string>& fields, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        auto it = fields.find(name);
        if (it != fields.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return {};
}

std::vector<std::string> split_capabilities(const std::string& capabilities) {
    std::vector<std::string> result;
    std::string token;
    for (char c : capabilities) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!token.empty()) {
                result.push_back(token);
                token.clear();
            }
        } else {
            token += c;
        }
    }
    if (!token.empty()) {
        result.push_back(token);
    }
    return result;
}

uint32_t parse_unsigned(const std::string& key, const std::string& value) {
    bool digits = !value.empty() && std::all_of(value.begin(), value.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (!digits) {
        throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
    }
    try {
        unsigned long parsed = std::stoul(value);
        if (parsed > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError("'" + key + "' is out of range: " + value);
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::out_of_range&) {
        throw ConfigError("'" + key + "' is out of range: " + value);
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "true" || lower == "1" || lower == "yes") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        return false;
    }
    throw ConfigError("'" + key + "' expects true or false, got '" + value + "'");
}

} // namespace

DiscoveryEngine::DiscoveryEngine(IReachabilityProbe& probe, IConnectionClient& client,
                                 const IOutputParser& parser, std::shared_ptr<spdlog::logger> logger)
    : probe_(probe), client_(client), parser_(parser),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

bool DiscoveryEngine::configure(const std::map<std::string, std::string>& config) {
    DiscoveryOptions updated = options_;

    auto hops_it = config.find("max_hops");
    if (hops_it != config.end()) {
        updated.max_hops = parse_unsigned(hops_it->first, hops_it->second);
    }

    auto connect_it = config.find("connect_timeout_ms");
    if (connect_it != config.end()) {
        updated.connect_timeout = std::chrono::milliseconds(parse_unsigned(connect_it->first, connect_it->second));
    }

    auto command_it = config.find("command_timeout_ms");
    if (command_it != config.end()) {
        updated.command_timeout = std::chrono::milliseconds(parse_unsigned(command_it->first, command_it->second));
    }

    auto reach_it = config.find("reachability_timeout_ms");
    if (reach_it != config.end()) {
        updated.reachability_timeout = std::chrono::milliseconds(parse_unsigned(reach_it->first, reach_it->second));
    }

    auto port_it = config.find("ssh_port");
    if (port_it != config.end()) {
        uint32_t port = parse_unsigned(port_it->first, port_it->second);
        if (port == 0 || port > 65535) {
            throw ConfigError("'ssh_port' must be between 1 and 65535, got " + port_it->second);
        }
        updated.ssh_port = static_cast<uint16_t>(port);
    }

    auto commands_it = config.find("commands");
    if (commands_it != config.end()) {
        updated.command_set = split(commands_it->second, ';');
        if (updated.command_set.empty()) {
            throw ConfigError("'commands' must name at least one command");
        }
    }

    auto info_it = config.find("device_info_commands");
    if (info_it != config.end()) {
        updated.device_info_commands = split(info_it->second, ';');
    }

    auto exclusions_it = config.find("exclusions");
    if (exclusions_it != config.end()) {
        updated.exclusions = split(exclusions_it->second, ',');
    }

    auto policy_it = config.find("link_conflict_policy");
    if (policy_it != config.end()) {
        if (policy_it->second == "first_reported") {
            updated.link_conflict_policy = LinkConflictPolicy::FIRST_REPORTED;
        } else if (policy_it->second == "keep_all") {
            updated.link_conflict_policy = LinkConflictPolicy::KEEP_ALL;
        } else {
            throw ConfigError("'link_conflict_policy' must be first_reported or keep_all, got '" +
                              policy_it->second + "'");
        }
    }

    auto normalize_it = config.find("normalize_interfaces");
    if (normalize_it != config.end()) {
        updated.normalize_interfaces = parse_bool(normalize_it->first, normalize_it->second);
    }

    options_ = updated;
    return true;
}

std::map<std::string, std::string> DiscoveryEngine::get_configuration_schema() const {
    return {
        {"max_hops", "integer:0-:4"},
        {"connect_timeout_ms", "integer:1-:15000"},
        {"command_timeout_ms", "integer:1-:30000"},
        {"reachability_timeout_ms", "integer:1-:3000"},
        {"ssh_port", "integer:1-65535:22"},
        {"commands", "string:semicolon-separated:show cdp neighbors detail;show lldp neighbors detail"},
        {"device_info_commands", "string:semicolon-separated:"},
        {"exclusions", "string:comma-separated:"},
        {"link_conflict_policy", "enum:first_reported,keep_all:first_reported"},
        {"normalize_interfaces", "boolean:true"}
    };
}

DiscoveryResult DiscoveryEngine::run(const std::vector<SeedDevice>& seeds, const CredentialStore& credentials,
                                     const RunControl& control) {
    return run_with_options(options_, seeds, credentials, control);
}

DiscoveryResult DiscoveryEngine::run(const std::vector<SeedDevice>& seeds, const CredentialStore& credentials,
                                     uint32_t max_hops, const std::vector<std::string>& command_set,
                                     const RunControl& control) {
    DiscoveryOptions options = options_;
    options.max_hops = max_hops;
    options.command_set = command_set;
    return run_with_options(options, seeds, credentials, control);
}

DiscoveryResult DiscoveryEngine::run_with_options(const DiscoveryOptions& options,
                                                  const std::vector<SeedDevice>& seeds,
                                                  const CredentialStore& credentials,
                                                  const RunControl& control) {
    if (parser_.template_count() == 0) {
        throw TemplateLoadError("no parse templates are loaded; refusing to start discovery");
    }

    DiscoveryContext context;
    context.options = options;

    for (const auto& seed : seeds) {
        std::string address = trim(seed.address);
        std::string hostname = trim(seed.hostname);
        if (address.empty() && hostname.empty()) {
            continue;
        }

        std::string id = address.empty() ? hostname : address;
        if (context.result.devices.count(id) > 0) {
            continue;
        }

        DiscoveredDevice device;
        device.canonical_id = id;
        device.hostname = hostname;
        device.management_address = address.empty() ? hostname : address;
        device.hop_distance = 0;
        device.discovered_via = "seed";
        context.result.devices.emplace(id, device);

        register_alias(context, id, id);
        register_alias(context, hostname, id);
        context.frontier.push_back({id, 0});
    }

    if (context.frontier.empty()) {
        logger_->warn("No usable seed devices supplied");
    }

    logger_->info("Starting discovery from {} seed(s), max hops {}, {} command(s), {} credential(s)",
                  context.frontier.size(), options.max_hops, options.command_set.size(), credentials.size());
    auto started = std::chrono::steady_clock::now();

    while (!context.frontier.empty()) {
        if (control.should_stop && control.should_stop()) {
            context.result.cancelled = true;
            logger_->warn("Discovery cancelled with {} device(s) still queued", context.frontier.size());
            break;
        }

        FrontierItem item = context.frontier.front();
        context.frontier.pop_front();

        if (!context.visited.insert(item.device_id).second) {
            logger_->debug("Skipping {}: already visited", item.device_id);
            continue;
        }

        try {
            visit_device(context, item, credentials, control);
        } catch (const std::exception& e) {
            auto& device = context.result.devices[item.device_id];
            device.canonical_id = item.device_id;
            record_failure(context, device, DeviceStatus::FAILED, ErrorKind::INTERNAL_ERROR, e.what());
            emit_progress(device, control);
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger_->info("Discovery finished in {}ms: {} device(s), {} mapped, {} edge(s), {} failure(s){}",
                  elapsed.count(), context.result.devices.size(), context.result.mapped_device_count(),
                  context.result.edges.size(), context.result.failures.size(),
                  context.result.cancelled ? " (cancelled)" : "");

    std::map<std::string, size_t> per_protocol;
    for (const auto& edge : context.result.edges) {
        ++per_protocol[edge.protocol];
    }
    for (const auto& [protocol, count] : per_protocol) {
        logger_->info("  {} edge(s) first reported via {}", count, protocol);
    }

    return std::move(context.result);
}

void DiscoveryEngine::visit_device(DiscoveryContext& context, const FrontierItem& item,
                                   const CredentialStore& credentials, const RunControl& control) {
    auto& device = context.result.devices[item.device_id];
    device.canonical_id = item.device_id;

    if (item.hop_distance > context.options.max_hops) {
        logger_->debug("{} is beyond the hop limit; recorded without exploring", item.device_id);
        emit_progress(device, control);
        return;
    }

    std::string address;
    if (!probe_device(context, device, address)) {
        record_failure(context, device, DeviceStatus::UNREACHABLE, ErrorKind::UNREACHABLE_HOST,
                       "no response on port " + std::to_string(context.options.ssh_port) + " at " + address);
        emit_progress(device, control);
        return;
    }
    device.status = DeviceStatus::REACHABLE;

    std::string last_error;
    auto session = open_session(context, device, address, credentials, last_error);
    if (!session) {
        std::string reason = credentials.empty()
            ? "no credentials configured"
            : "all " + std::to_string(credentials.size()) + " credential(s) failed, last: " + last_error;
        record_failure(context, device, DeviceStatus::FAILED, ErrorKind::AUTH_EXHAUSTED, reason);
        emit_progress(device, control);
        return;
    }

    std::vector<std::pair<std::string, CommandResult>> outputs;
    {
        SessionGuard guard(client_, std::move(session), logger_);

        const std::string& prompt_hostname = guard.session().hostname;
        if (!prompt_hostname.empty()) {
            if (device.hostname.empty()) {
                device.hostname = prompt_hostname;
            }
            register_alias(context, prompt_hostname, device.canonical_id);
        }

        for (const auto& command : context.options.device_info_commands) {
            auto result = client_.execute_command(guard.session(), command, context.options.command_timeout);
            if (!result.success) {
                logger_->debug("Device info command '{}' failed on {}: {}", command, device.canonical_id,
                               result.message);
                continue;
            }
            std::string hostname = apply_device_info(device, command, result.output);
            if (!hostname.empty()) {
                register_alias(context, hostname, device.canonical_id);
            }
        }

        // Every command runs even when an earlier one already produced neighbors
        for (const auto& command : context.options.command_set) {
            auto result = client_.execute_command(guard.session(), command, context.options.command_timeout);
            if (!result.success) {
                logger_->warn("{} on {} for '{}': {}", to_string(result.error), device.canonical_id,
                              command, result.message);
            }
            outputs.emplace_back(command, std::move(result));
        }
    }

    size_t succeeded = 0;
    ErrorKind last_kind = ErrorKind::NONE;
    std::string last_message;
    for (const auto& [command, result] : outputs) {
        if (!result.success) {
            last_kind = result.error;
            last_message = "'" + command + "': " + result.message;
            continue;
        }
        ++succeeded;

        auto records = parser_.parse(result.output, command);
        if (!records.empty()) {
            device.productive_commands.push_back(command);
        }
        process_neighbors(context, device, command, records);
    }

    if (succeeded == 0 && !outputs.empty()) {
        record_failure(context, device, DeviceStatus::FAILED, last_kind, "every command failed, last " + last_message);
        emit_progress(device, control);
        return;
    }

    device.status = DeviceStatus::VISITED;
    logger_->info("Visited {} ({}) at hop {}: {} neighbor record(s), {} queued",
                  device.canonical_id, device.hostname.empty() ? "unknown" : device.hostname,
                  device.hop_distance, device.neighbor_count, context.frontier.size());
    emit_progress(device, control);
}

bool DiscoveryEngine::probe_device(DiscoveryContext& context, DiscoveredDevice& device, std::string& address) {
    address = device.management_address.empty() ? device.canonical_id : device.management_address;
    if (probe_.check(address, context.options.reachability_timeout)) {
        return true;
    }

    // Management addresses from neighbor tables are not always routable; try DNS
    const std::string& hostname = device.hostname;
    if (hostname.empty() || hostname == address) {
        return false;
    }

    for (const auto& candidate : probe_.resolve(hostname)) {
        if (candidate == address) {
            continue;
        }
        if (probe_.check(candidate, context.options.reachability_timeout)) {
            logger_->info("{} unreachable at {}, using {} resolved from {}",
                          device.canonical_id, address, candidate, hostname);
            device.resolved_address = candidate;
            address = candidate;
            return true;
        }
    }
    return false;
}

std::unique_ptr<Session> DiscoveryEngine::open_session(const DiscoveryContext& context, DiscoveredDevice& device,
                                                       const std::string& address,
                                                       const CredentialStore& credentials,
                                                       std::string& last_error) {
    for (const auto& entry : credentials.entries()) {
        Credential credential = entry;
        if (credential.port == 0) {
            credential.port = context.options.ssh_port;
        }
        auto result = client_.connect(address, credential, context.options.connect_timeout);
        if (result.success && result.session) {
            device.successful_credential = credential.id;
            logger_->debug("Authenticated to {} with credential {}", device.canonical_id, credential.id);
            return std::move(result.session);
        }
        last_error = credential.id + ": " + result.message;
        logger_->debug("Credential {} failed on {}: {} ({})", credential.id, device.canonical_id,
                       result.message, to_string(result.error));
    }
    return nullptr;
}

void DiscoveryEngine::process_neighbors(DiscoveryContext& context, DiscoveredDevice& device,
                                        const std::string& command, const std::vector<ParsedRecord>& records) {
    std::string protocol = protocol_for_command(command);

    for (const auto& record : records) {
        NeighborRecord neighbor = to_neighbor_record(record);
        bool has_address = is_valid_ip_address(neighbor.management_address);
        if (neighbor.neighbor_name.empty() && !has_address) {
            logger_->debug("Dropping {} record from {} without name or address", protocol, device.canonical_id);
            continue;
        }

        std::string neighbor_id = resolve_neighbor_id(context, neighbor);
        if (neighbor_id == device.canonical_id) {
            continue;
        }
        ++device.neighbor_count;

        NeighborEdge edge;
        edge.local_device_id = device.canonical_id;
        edge.local_interface = normalize_interface(context, neighbor.local_interface);
        edge.remote_device_id = neighbor_id;
        edge.remote_interface = normalize_interface(context, neighbor.remote_interface);
        edge.protocol = protocol;
        add_edge(context, edge);

        register_alias(context, neighbor_id, neighbor_id);
        register_alias(context, neighbor.neighbor_name, neighbor_id);
        if (has_address) {
            register_alias(context, neighbor.management_address, neighbor_id);
        }

        auto existing = context.result.devices.find(neighbor_id);
        if (existing != context.result.devices.end()) {
            backfill_device(existing->second, neighbor);
            continue;
        }

        if (is_excluded(neighbor.neighbor_name, context.options.exclusions)) {
            logger_->info("Not queueing excluded neighbor {} ({})", neighbor.neighbor_name, neighbor_id);
            continue;
        }

        uint32_t next_hop = device.hop_distance + 1;
        if (next_hop > context.options.max_hops) {
            logger_->debug("Not queueing {}: hop {} exceeds limit {}", neighbor_id, next_hop,
                           context.options.max_hops);
            continue;
        }

        DiscoveredDevice discovered;
        discovered.canonical_id = neighbor_id;
        discovered.hostname = neighbor.neighbor_name;
        discovered.platform = neighbor.platform;
        discovered.management_address = has_address ? neighbor.management_address : std::string();
        discovered.capabilities = split_capabilities(neighbor.capabilities);
        discovered.hop_distance = next_hop;
        discovered.discovered_via = device.canonical_id;
        context.result.devices.emplace(neighbor_id, discovered);
        context.frontier.push_back({neighbor_id, next_hop});

        logger_->debug("Queued {} at hop {} via {}", neighbor_id, next_hop, device.canonical_id);
    }
}

std::string DiscoveryEngine::resolve_neighbor_id(const DiscoveryContext& context,
                                                 const NeighborRecord& neighbor) const {
    bool has_address = is_valid_ip_address(neighbor.management_address);

    if (has_address) {
        auto it = context.aliases.find(neighbor.management_address);
        if (it != context.aliases.end()) {
            return it->second;
        }
    }
    if (!neighbor.neighbor_name.empty()) {
        auto it = context.aliases.find(normalize_device_name(neighbor.neighbor_name));
        if (it != context.aliases.end()) {
            return it->second;
        }
    }
    return has_address ? neighbor.management_address : neighbor.neighbor_name;
}

bool DiscoveryEngine::add_edge(DiscoveryContext& context, const NeighborEdge& edge) const {
    if (!context.edge_keys.insert(edge.normalized_key()).second) {
        return false;
    }

    if (context.options.link_conflict_policy == LinkConflictPolicy::FIRST_REPORTED) {
        std::string local_port = edge.local_device_id + "|" + edge.local_interface + "|" + edge.remote_device_id;
        std::string remote_port = edge.remote_device_id + "|" + edge.remote_interface + "|" + edge.local_device_id;
        bool conflict = (!edge.local_interface.empty() && context.claimed_ports.count(local_port) > 0) ||
                        (!edge.remote_interface.empty() && context.claimed_ports.count(remote_port) > 0);
        if (conflict) {
            logger_->debug("Dropping conflicting {} link {}:{} <-> {}:{}", edge.protocol,
                           edge.local_device_id, edge.local_interface,
                           edge.remote_device_id, edge.remote_interface);
            return false;
        }
        if (!edge.local_interface.empty()) {
            context.claimed_ports.insert(local_port);
        }
        if (!edge.remote_interface.empty()) {
            context.claimed_ports.insert(remote_port);
        }
    }

    context.result.edges.push_back(edge);
    return true;
}

void DiscoveryEngine::backfill_device(DiscoveredDevice& device, const NeighborRecord& neighbor) const {
    if (device.hostname.empty() && !neighbor.neighbor_name.empty()) {
        device.hostname = neighbor.neighbor_name;
    }
    if (device.platform.empty() && !neighbor.platform.empty()) {
        device.platform = neighbor.platform;
    }
    if (device.capabilities.empty() && !neighbor.capabilities.empty()) {
        device.capabilities = split_capabilities(neighbor.capabilities);
    }
}

void DiscoveryEngine::record_failure(DiscoveryContext& context, DiscoveredDevice& device, DeviceStatus status,
                                     ErrorKind kind, const std::string& reason) const {
    device.status = status;
    device.last_error = kind;
    context.result.failures.push_back({device.canonical_id, kind, reason});
    logger_->warn("{} {}: {}", to_string(kind), device.canonical_id, reason);
}

void DiscoveryEngine::emit_progress(const DiscoveredDevice& device, const RunControl& control) const {
    if (!control.on_progress) {
        return;
    }
    ProgressEvent event;
    event.device_id = device.canonical_id;
    event.status = device.status;
    event.hop = device.hop_distance;
    event.error = device.last_error;
    control.on_progress(event);
}

std::string DiscoveryEngine::normalize_interface(const DiscoveryContext& context, const std::string& name) const {
    if (!context.options.normalize_interfaces) {
        return trim(name);
    }
    return normalizer_.normalize(name);
}

NeighborRecord DiscoveryEngine::to_neighbor_record(const ParsedRecord& record) {
    std::map<std::string, std::string> fields;
    for (const auto& [name, value] : record.values) {
        fields[to_upper(name)] = trim(value);
    }
    for (const auto& [name, values] : record.lists) {
        auto& slot = fields[to_upper(name)];
        if (!slot.empty()) {
            continue;
        }
        for (const auto& value : values) {
            if (!trim(value).empty()) {
                slot = trim(value);
                break;
            }
        }
    }

    NeighborRecord neighbor;
    neighbor.neighbor_name = first_field(fields, kNameFields);
    neighbor.management_address = first_field(fields, kAddressFields);
    neighbor.platform = first_field(fields, kPlatformFields);
    neighbor.local_interface = first_field(fields, kLocalInterfaceFields);
    neighbor.remote_interface = first_field(fields, kRemoteInterfaceFields);
    neighbor.capabilities = first_field(fields, kCapabilityFields);
    return neighbor;
}

std::string DiscoveryEngine::normalize_device_name(const std::string& name) {
    std::string normalized = to_lower(trim(name));
    if (normalized.empty() || is_valid_ip_address(normalized)) {
        return normalized;
    }

    // NX-OS appends the serial number in parentheses
    auto paren = normalized.find('(');
    if (paren != std::string::npos) {
        normalized = trim(normalized.substr(0, paren));
    }
    auto dot = normalized.find('.');
    if (dot != std::string::npos && dot > 0) {
        normalized = normalized.substr(0, dot);
    }
    return normalized;
}

bool DiscoveryEngine::is_valid_ip_address(const std::string& address) {
    if (address.empty()) {
        return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

bool DiscoveryEngine::is_excluded(const std::string& hostname, const std::vector<std::string>& exclusions) {
    if (hostname.empty()) {
        return false;
    }
    std::string lower = to_lower(hostname);
    return std::any_of(exclusions.begin(), exclusions.end(), [&lower](const std::string& pattern) {
        std::string needle = to_lower(trim(pattern));
        return !needle.empty() && lower.find(needle) != std::string::npos;
    });
}

std::vector<SeedDevice> DiscoveryEngine::parse_seed_list(const std::string& seeds) {
    std::vector<SeedDevice> result;
    for (const auto& entry : split(seeds, ';')) {
        auto parts = split(entry, ',');
        SeedDevice seed;
        if (parts.size() == 1) {
            seed.address = parts[0];
        } else if (parts.size() == 2) {
            seed.hostname = parts[0];
            seed.address = parts[1];
        } else {
            throw ConfigError("malformed seed entry '" + entry + "' (expected HOST,IP or IP)");
        }
        result.push_back(seed);
    }
    return result;
}

std::string DiscoveryEngine::apply_device_info(DiscoveredDevice& device, const std::string& command,
                                              const std::string& output) {
    static const std::regex hostname_pattern(R"(^\s*hostname\s+(\S+))", std::regex::icase);
    static const std::regex serial_pattern(R"((?:Processor board ID|Serial Number)[:\s]+(\S+))", std::regex::icase);
    static const std::regex model_pattern(R"(Model number[:\s]+(.+))", std::regex::icase);
    static const std::regex version_pattern(R"(Version:?\s+([^,\s]+))", std::regex::icase);

    bool hostname_query = to_lower(command).find("hostname") != std::string::npos;
    std::string hostname;

    std::istringstream stream(output);
    std::string line;
    std::smatch match;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (hostname_query && hostname.empty() && std::regex_search(line, match, hostname_pattern)) {
            hostname = match[1].str();
        }
        if (device.serial_number.empty() && std::regex_search(line, match, serial_pattern)) {
            device.serial_number = match[1].str();
        }
        if (device.model.empty() && std::regex_search(line, match, model_pattern)) {
            device.model = trim(match[1].str());
        }
        if (device.software_version.empty() && std::regex_search(line, match, version_pattern)) {
            device.software_version = match[1].str();
        }
    }

    if (!hostname.empty() && device.hostname.empty()) {
        device.hostname = hostname;
    }
    return hostname;
}

void DiscoveryEngine::register_alias(DiscoveryContext& context, const std::string& key, const std::string& device_id) {
    std::string normalized = normalize_device_name(key);
    if (!normalized.empty()) {
        context.aliases.emplace(normalized, device_id);
    }
}

std::string DiscoveryEngine::protocol_for_command(const std::string& command) {
    std::string lower = to_lower(command);
    if (lower.find("cdp") != std::string::npos) {
        return "CDP";
    }
    if (lower.find("lldp") != std::string::npos) {
        return "LLDP";
    }
    return trim(command);
}

} // namespace netmapper::components
