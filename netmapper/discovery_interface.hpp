#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmapper {

// Library version reported by the CLI and written into result metadata
#define NETMAPPER_VERSION "1.0.0"

// Per-device and startup error kinds
enum class ErrorKind {
    NONE,
    UNREACHABLE_HOST,     // Resolution or TCP probe failed
    AUTH_EXHAUSTED,       // Every credential was rejected
    CONNECT_FAILED,       // Transport failed for a single credential attempt
    COMMAND_TIMEOUT,      // Prompt did not return before the deadline
    COMMAND_ERROR,        // Device rejected the command
    PARSE_TEMPLATE_ERROR, // Template aborted on device output (never fatal)
    TEMPLATE_LOAD_ERROR,  // Malformed template file at startup
    INTERNAL_ERROR,       // Unexpected exception caught at the loop boundary
    CANCELLED
};

// Lifecycle of a device inside one discovery run
enum class DeviceStatus {
    PENDING,
    REACHABLE,
    UNREACHABLE,
    VISITED,
    FAILED
};

enum class AuthMethod {
    AUTO,
    PASSWORD,
    PUBLICKEY,
    KEYBOARD_INTERACTIVE
};

// Template methods, tried in this order
enum class ParseMethod {
    STATE_MACHINE,
    REGEX
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::UNREACHABLE_HOST: return "UnreachableHost";
        case ErrorKind::AUTH_EXHAUSTED: return "AuthExhausted";
        case ErrorKind::CONNECT_FAILED: return "ConnectFailed";
        case ErrorKind::COMMAND_TIMEOUT: return "CommandTimeout";
        case ErrorKind::COMMAND_ERROR: return "CommandError";
        case ErrorKind::PARSE_TEMPLATE_ERROR: return "ParseTemplateError";
        case ErrorKind::TEMPLATE_LOAD_ERROR: return "TemplateLoadError";
        case ErrorKind::INTERNAL_ERROR: return "InternalError";
        case ErrorKind::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

inline const char* to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::PENDING: return "pending";
        case DeviceStatus::REACHABLE: return "reachable";
        case DeviceStatus::UNREACHABLE: return "unreachable";
        case DeviceStatus::VISITED: return "visited";
        case DeviceStatus::FAILED: return "failed";
    }
    return "unknown";
}

inline const char* to_string(AuthMethod method) {
    switch (method) {
        case AuthMethod::AUTO: return "auto";
        case AuthMethod::PASSWORD: return "password";
        case AuthMethod::PUBLICKEY: return "publickey";
        case AuthMethod::KEYBOARD_INTERACTIVE: return "keyboard-interactive";
    }
    return "unknown";
}

inline const char* to_string(ParseMethod method) {
    return method == ParseMethod::STATE_MACHINE ? "state_machine" : "regex";
}

// Raised only while loading templates
class TemplateLoadError : public std::runtime_error {
public:
    explicit TemplateLoadError(const std::string& message) : std::runtime_error(message) {}
};

// Raised for malformed configuration or credential files and bad option values
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Login material; ordering inside a CredentialStore defines the trial sequence
struct Credential {
    std::string id;
    std::string username;
    std::string secret;
    std::string key_file;
    std::string key_passphrase;
    AuthMethod auth_method = AuthMethod::AUTO;
    uint16_t port = 0;                 // 0 uses the engine's ssh_port
    int32_t priority = 0;
};

struct DiscoveredDevice {
    std::string canonical_id;
    std::string hostname;
    std::string platform;
    std::string management_address;
    std::string resolved_address;      // Address actually used when DNS fallback kicked in
    uint32_t hop_distance = 0;
    DeviceStatus status = DeviceStatus::PENDING;
    std::string discovered_via;        // "seed" or the parent canonical id
    std::string successful_credential;
    std::vector<std::string> capabilities;
    std::vector<std::string> productive_commands;
    uint32_t neighbor_count = 0;
    std::string serial_number;         // From device info commands such as "show version"
    std::string model;
    std::string software_version;
    ErrorKind last_error = ErrorKind::NONE;
};

struct NeighborEdge {
    std::string local_device_id;
    std::string local_interface;
    std::string remote_device_id;
    std::string remote_interface;
    std::string protocol;              // "CDP", "LLDP" or the issuing command

    // Endpoint pairs sorted so both directions of one link share a key
    std::string normalized_key() const {
        std::string a = local_device_id + "|" + local_interface;
        std::string b = remote_device_id + "|" + remote_interface;
        return a < b ? a + "||" + b : b + "||" + a;
    }
};

struct DiscoveryFailure {
    std::string device_id;
    ErrorKind kind = ErrorKind::NONE;
    std::string reason;
};

struct DiscoveryResult {
    std::map<std::string, DiscoveredDevice> devices;
    std::vector<NeighborEdge> edges;
    std::vector<DiscoveryFailure> failures;
    bool cancelled = false;

    size_t count_with_status(DeviceStatus status) const {
        size_t count = 0;
        for (const auto& [id, device] : devices) {
            if (device.status == status) {
                ++count;
            }
        }
        return count;
    }

    // Devices whose neighbor tables were actually read
    size_t mapped_device_count() const { return count_with_status(DeviceStatus::VISITED); }
};

// One output row of a template; List values land in `lists`
struct ParsedRecord {
    std::map<std::string, std::string> values;
    std::map<std::string, std::vector<std::string>> lists;

    std::string get(const std::string& field) const {
        auto it = values.find(field);
        if (it != values.end()) {
            return it->second;
        }
        auto list_it = lists.find(field);
        if (list_it != lists.end() && !list_it->second.empty()) {
            return list_it->second.front();
        }
        return {};
    }

    bool operator==(const ParsedRecord& other) const {
        return values == other.values && lists == other.lists;
    }
};

// Authenticated connection to a single device. Clients derive their own
// session type and keep native handles there.
struct Session {
    virtual ~Session() = default;

    std::string address;
    std::string credential_id;
    std::string prompt;
    std::string hostname;              // Taken from the prompt when available
};

struct ConnectResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::unique_ptr<Session> session;
};

struct CommandResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::string output;
    std::chrono::milliseconds elapsed{0};
};

struct ProgressEvent {
    std::string device_id;
    DeviceStatus status = DeviceStatus::PENDING;
    uint32_t hop = 0;
    ErrorKind error = ErrorKind::NONE;
};

// Address resolution plus a lightweight connectivity test. Never throws on
// network-level errors.
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;

    virtual bool check(const std::string& address, std::chrono::milliseconds timeout) = 0;
    virtual std::vector<std::string> resolve(const std::string& hostname) = 0;
};

// Synchronous, blocking device sessions
class IConnectionClient {
public:
    virtual ~IConnectionClient() = default;

    virtual ConnectResult connect(const std::string& address,
                                  const Credential& credential,
                                  std::chrono::milliseconds timeout) = 0;
    virtual CommandResult execute_command(Session& session,
                                          const std::string& command,
                                          std::chrono::milliseconds timeout) = 0;
    // Idempotent; safe on closed or half-opened sessions
    virtual void disconnect(Session& session) = 0;
};

// Text-to-record extraction. Never throws for malformed device output.
class IOutputParser {
public:
    virtual ~IOutputParser() = default;

    virtual std::vector<ParsedRecord> parse(const std::string& raw_text,
                                            const std::string& command) const = 0;
    virtual size_t template_count() const = 0;
};

} // namespace netmapper
