#pragma once

#include "netmapper/discovery_interface.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct addrinfo;

namespace spdlog {
class logger;
}

namespace netmapper::components {

// Resolves an address and attempts a TCP handshake on the SSH port
class TcpReachabilityProbe : public IReachabilityProbe {
public:
    explicit TcpReachabilityProbe(uint16_t port = 22, std::shared_ptr<spdlog::logger> logger = nullptr);

    bool check(const std::string& address, std::chrono::milliseconds timeout) override;
    std::vector<std::string> resolve(const std::string& hostname) override;

    uint16_t port() const { return port_; }
    void set_port(uint16_t port) { port_ = port; }

private:
    bool try_connect(const addrinfo* info, std::chrono::milliseconds timeout) const;

    uint16_t port_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace netmapper::components
