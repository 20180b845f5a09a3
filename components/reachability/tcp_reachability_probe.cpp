#include "tcp_reachability_probe.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netmapper::components {

namespace {

// Owns a socket descriptor for the duration of one attempt
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const {
        if (info) {
            freeaddrinfo(info);
        }
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr lookup(const std::string& host, const std::string& service, int& status) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    status = getaddrinfo(host.c_str(), service.empty() ? nullptr : service.c_str(), &hints, &result);
    return AddrInfoPtr(status == 0 ? result : nullptr);
}

std::string address_to_string(const addrinfo* info) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    const void* raw = nullptr;
    if (info->ai_family == AF_INET) {
        raw = &reinterpret_cast<const sockaddr_in*>(info->ai_addr)->sin_addr;
    } else if (info->ai_family == AF_INET6) {
        raw = &reinterpret_cast<const sockaddr_in6*>(info->ai_addr)->sin6_addr;
    } else {
        return {};
    }
    if (inet_ntop(info->ai_family, raw, buffer, sizeof(buffer)) == nullptr) {
        return {};
    }
    return buffer;
}

} // namespace

TcpReachabilityProbe::TcpReachabilityProbe(uint16_t port, std::shared_ptr<spdlog::logger> logger)
    : port_(port), logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

bool TcpReachabilityProbe::check(const std::string& address, std::chrono::milliseconds timeout) {
    if (address.empty()) {
        return false;
    }

    int status = 0;
    auto results = lookup(address, std::to_string(port_), status);
    if (!results) {
        logger_->debug("Resolution failed for {}: {}", address, gai_strerror(status));
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const addrinfo* info = results.get(); info != nullptr; info = info->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        if (try_connect(info, remaining)) {
            logger_->debug("{} reachable on port {}", address, port_);
            return true;
        }
    }

    logger_->debug("{} not reachable on port {}", address, port_);
    return false;
}

std::vector<std::string> TcpReachabilityProbe::resolve(const std::string& hostname) {
    std::vector<std::string> addresses;
    if (hostname.empty()) {
        return addresses;
    }

    int status = 0;
    auto results = lookup(hostname, "", status);
    if (!results) {
        logger_->debug("DNS lookup failed for {}: {}", hostname, gai_strerror(status));
        return addresses;
    }

    for (const addrinfo* info = results.get(); info != nullptr; info = info->ai_next) {
        std::string text = address_to_string(info);
        if (!text.empty() && std::find(addresses.begin(), addresses.end(), text) == addresses.end()) {
            addresses.push_back(text);
        }
    }
    return addresses;
}

bool TcpReachabilityProbe::try_connect(const addrinfo* info, std::chrono::milliseconds timeout) const {
    SocketHandle socket_fd(::socket(info->ai_family, info->ai_socktype, info->ai_protocol));
    if (socket_fd.get() < 0) {
        return false;
    }

    int flags = fcntl(socket_fd.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(socket_fd.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }

    int rc = ::connect(socket_fd.get(), info->ai_addr, info->ai_addrlen);
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd descriptor{};
    descriptor.fd = socket_fd.get();
    descriptor.events = POLLOUT;

    do {
        rc = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);

    if (rc <= 0) {
        return false;
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (getsockopt(socket_fd.get(), SOL_SOCKET, SO_ERROR, &socket_error, &length) < 0) {
        return false;
    }
    if (socket_error != 0) {
        logger_->trace("connect to {} failed: {}", address_to_string(info), std::strerror(socket_error));
        return false;
    }
    return true;
}

} // namespace netmapper::components
