#pragma once

#include "netmapper/discovery_interface.hpp"
#include <libssh/libssh.h>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace netmapper::components {

// Interactive shell session over libssh
struct SshSession : public Session {
    ~SshSession() override;

    bool is_open() const;
    void release();

    ssh_session handle = nullptr;
    ssh_channel channel = nullptr;
    bool prompt_lost = false;       // Earlier output never ended; later reads would be misattributed
};

struct SshClientOptions {
    std::string terminal_type = "vt100";
    int terminal_columns = 200;
    int terminal_rows = 24;
    std::chrono::milliseconds prompt_timeout{10000};
    std::chrono::milliseconds read_interval{100};
    std::vector<std::string> pagination_commands = {
        "terminal length 0",
        "terminal pager 0",
        "set cli screen-length 0"
    };
    bool strict_host_key_checking = false;
};

class SshConnectionClient : public IConnectionClient {
public:
    explicit SshConnectionClient(SshClientOptions options = {}, std::shared_ptr<spdlog::logger> logger = nullptr);

    ConnectResult connect(const std::string& address, const Credential& credential,
                          std::chrono::milliseconds timeout) override;
    CommandResult execute_command(Session& session, const std::string& command,
                                  std::chrono::milliseconds timeout) override;
    void disconnect(Session& session) override;

    const SshClientOptions& options() const { return options_; }

    // Shell output helpers
    static std::string find_prompt(const std::string& buffer);
    static std::string hostname_from_prompt(const std::string& prompt);
    static bool ends_with_prompt(const std::string& buffer, const std::string& prompt);
    static std::string strip_command_echo(const std::string& output, const std::string& command,
                                          const std::string& prompt);
    static CommandResult classify_output(const std::string& command, const std::string& output);

private:
    enum class ReadStatus {
        COMPLETE,
        TIMEOUT,
        CLOSED
    };

    bool authenticate(ssh_session handle, const Credential& credential, std::string& error) const;
    bool authenticate_password(ssh_session handle, const Credential& credential) const;
    bool authenticate_publickey(ssh_session handle, const Credential& credential, std::string& error) const;
    bool authenticate_keyboard_interactive(ssh_session handle, const Credential& credential) const;
    bool open_shell(SshSession& session, std::string& error) const;
    bool write_line(SshSession& session, const std::string& line) const;
    ReadStatus read_until(SshSession& session, const std::function<bool(const std::string&)>& done,
                          std::chrono::steady_clock::time_point deadline, std::string& collected) const;
    void drain(SshSession& session) const;
    bool resynchronize(SshSession& session) const;
    void disable_pagination(SshSession& session);

    SshClientOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace netmapper::components
