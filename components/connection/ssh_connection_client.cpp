#include "ssh_connection_client.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace netmapper::components {

namespace {

const char* const kPagerMarker = "--More--";

const std::vector<std::string> kErrorIndicators = {
    "invalid input",
    "incomplete command",
    "unknown command",
    "% invalid",
    "% ambiguous command"
};

const std::vector<std::string> kDisabledIndicators = {
    "not enabled",
    "not running",
    "is disabled",
    "not configured"
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim_right(const std::string& value) {
    auto end = value.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    return trim_right(value.substr(begin));
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        lines.push_back(line);
    }
    return lines;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

SshSession::~SshSession() {
    release();
}

bool SshSession::is_open() const {
    return handle != nullptr && channel != nullptr &&
           ssh_channel_is_open(channel) != 0 && ssh_channel_is_eof(channel) == 0;
}

void SshSession::release() {
    if (channel != nullptr) {
        if (ssh_channel_is_open(channel) != 0) {
            ssh_channel_send_eof(channel);
            ssh_channel_close(channel);
        }
        ssh_channel_free(channel);
        channel = nullptr;
    }
    if (handle != nullptr) {
        if (ssh_is_connected(handle) != 0) {
            ssh_disconnect(handle);
        }
        ssh_free(handle);
        handle = nullptr;
    }
}

SshConnectionClient::SshConnectionClient(SshClientOptions options, std::shared_ptr<spdlog::logger> logger)
    : options_(std::move(options)), logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

ConnectResult SshConnectionClient::connect(const std::string& address, const Credential& credential,
                                           std::chrono::milliseconds timeout) {
    ConnectResult result;
    auto session = std::make_unique<SshSession>();
    session->address = address;
    session->credential_id = credential.id;

    session->handle = ssh_new();
    if (session->handle == nullptr) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "unable to allocate SSH session";
        return result;
    }

    unsigned int port = credential.port == 0 ? 22 : credential.port;
    long timeout_sec = std::max<long>(1, static_cast<long>(timeout.count() / 1000));
    int verbosity = SSH_LOG_NOLOG;
    ssh_options_set(session->handle, SSH_OPTIONS_HOST, address.c_str());
    ssh_options_set(session->handle, SSH_OPTIONS_PORT, &port);
    ssh_options_set(session->handle, SSH_OPTIONS_USER, credential.username.c_str());
    ssh_options_set(session->handle, SSH_OPTIONS_TIMEOUT, &timeout_sec);
    ssh_options_set(session->handle, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);

    logger_->debug("Connecting to {}:{} as '{}' (credential {})", address, port, credential.username, credential.id);

    if (ssh_connect(session->handle) != SSH_OK) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = std::string("connect failed: ") + ssh_get_error(session->handle);
        return result;
    }

    if (options_.strict_host_key_checking &&
        ssh_session_is_known_server(session->handle) != SSH_KNOWN_HOSTS_OK) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "host key for " + address + " is not trusted";
        return result;
    }

    std::string auth_error;
    if (!authenticate(session->handle, credential, auth_error)) {
        result.error = ErrorKind::AUTH_EXHAUSTED;
        result.message = auth_error;
        return result;
    }

    std::string shell_error;
    if (!open_shell(*session, shell_error)) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = shell_error;
        return result;
    }

    // Nudge the device so the prompt is printed even without a banner
    std::string banner;
    write_line(*session, "");
    auto deadline = std::chrono::steady_clock::now() + options_.prompt_timeout;
    auto status = read_until(*session, [](const std::string& buffer) { return !find_prompt(buffer).empty(); },
                             deadline, banner);
    if (status != ReadStatus::COMPLETE) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "no command prompt detected";
        return result;
    }

    session->prompt = find_prompt(banner);
    session->hostname = hostname_from_prompt(session->prompt);
    logger_->debug("Prompt on {} is '{}' (hostname '{}')", address, session->prompt, session->hostname);

    disable_pagination(*session);

    result.success = true;
    result.message = "connected";
    result.session = std::move(session);
    return result;
}

CommandResult SshConnectionClient::execute_command(Session& session, const std::string& command,
                                                   std::chrono::milliseconds timeout) {
    CommandResult result;
    auto start = std::chrono::steady_clock::now();

    auto* ssh = dynamic_cast<SshSession*>(&session);
    if (ssh == nullptr) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "session is not open";
        return result;
    }
    if (ssh->prompt_lost) {
        result.error = ErrorKind::COMMAND_TIMEOUT;
        result.message = "prompt lost after an earlier timeout; '" + command + "' not sent";
        return result;
    }
    if (!ssh->is_open()) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "session is not open";
        return result;
    }

    drain(*ssh);
    if (!write_line(*ssh, command)) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = std::string("write failed: ") + ssh_get_error(ssh->handle);
        return result;
    }

    std::string collected;
    const std::string prompt = ssh->prompt;
    auto status = read_until(*ssh, [&prompt](const std::string& buffer) { return ends_with_prompt(buffer, prompt); },
                             start + timeout, collected);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (status == ReadStatus::TIMEOUT) {
        result.error = ErrorKind::COMMAND_TIMEOUT;
        result.message = "timed out after " + std::to_string(timeout.count()) + "ms waiting for prompt";
        result.output = strip_command_echo(collected, command, prompt);
        if (!resynchronize(*ssh)) {
            ssh->prompt_lost = true;
            logger_->warn("No prompt from {} after '{}' timed out; skipping its remaining commands",
                          session.address, command);
        }
        return result;
    }
    if (status == ReadStatus::CLOSED) {
        result.error = ErrorKind::CONNECT_FAILED;
        result.message = "channel closed by device";
        return result;
    }

    CommandResult classified = classify_output(command, strip_command_echo(collected, command, prompt));
    classified.elapsed = result.elapsed;
    logger_->debug("'{}' on {} finished in {}ms ({} bytes)", command, session.address,
                   classified.elapsed.count(), classified.output.size());
    return classified;
}

void SshConnectionClient::disconnect(Session& session) {
    auto* ssh = dynamic_cast<SshSession*>(&session);
    if (ssh == nullptr) {
        return;
    }
    if (ssh->handle != nullptr) {
        logger_->debug("Disconnecting from {}", session.address);
    }
    ssh->release();
}

std::string SshConnectionClient::find_prompt(const std::string& buffer) {
    static const std::regex prompt_pattern(R"(^\S+[#>]\s*$)");

    auto lines = split_lines(buffer);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = trim(*it);
        if (line.empty()) {
            continue;
        }
        return std::regex_match(line, prompt_pattern) ? line : std::string();
    }
    return {};
}

std::string SshConnectionClient::hostname_from_prompt(const std::string& prompt) {
    std::string hostname = trim(prompt);
    while (!hostname.empty() && (hostname.back() == '#' || hostname.back() == '>')) {
        hostname.pop_back();
    }
    auto paren = hostname.find('(');
    if (paren != std::string::npos) {
        hostname = hostname.substr(0, paren);
    }
    auto at = hostname.find('@');
    if (at != std::string::npos) {
        hostname = hostname.substr(at + 1);
    }
    return hostname;
}

bool SshConnectionClient::ends_with_prompt(const std::string& buffer, const std::string& prompt) {
    std::string trimmed_prompt = trim(prompt);
    if (trimmed_prompt.empty()) {
        return !find_prompt(buffer).empty();
    }
    return ends_with(trim_right(buffer), trimmed_prompt);
}

std::string SshConnectionClient::strip_command_echo(const std::string& output, const std::string& command,
                                                    const std::string& prompt) {
    auto lines = split_lines(output);
    std::string trimmed_prompt = trim(prompt);
    std::string trimmed_command = trim(command);

    while (!lines.empty() && trim(lines.front()).empty()) {
        lines.erase(lines.begin());
    }
    if (!lines.empty() && !trimmed_command.empty() && lines.front().find(trimmed_command) != std::string::npos) {
        lines.erase(lines.begin());
    }

    while (!lines.empty() && trim(lines.back()).empty()) {
        lines.pop_back();
    }
    if (!lines.empty() && !trimmed_prompt.empty() && ends_with(trim(lines.back()), trimmed_prompt)) {
        lines.pop_back();
    }

    std::string cleaned;
    for (const auto& line : lines) {
        cleaned += line;
        cleaned += '\n';
    }
    return cleaned;
}

CommandResult SshConnectionClient::classify_output(const std::string& command, const std::string& output) {
    CommandResult result;
    std::string lower = to_lower(output);

    for (const auto& indicator : kErrorIndicators) {
        if (lower.find(indicator) != std::string::npos) {
            result.error = ErrorKind::COMMAND_ERROR;
            auto lines = split_lines(output);
            auto first = std::find_if(lines.begin(), lines.end(),
                [](const std::string& line) { return !trim(line).empty(); });
            result.message = "device rejected '" + command + "'";
            if (first != lines.end()) {
                result.message += ": " + trim(*first);
            }
            result.output = output;
            return result;
        }
    }

    // A short notice such as "% CDP is not enabled" means no neighbors, not an error
    auto lines = split_lines(output);
    size_t content_lines = static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
        [](const std::string& line) { return !trim(line).empty(); }));
    if (content_lines <= 3) {
        for (const auto& indicator : kDisabledIndicators) {
            if (lower.find(indicator) != std::string::npos) {
                result.success = true;
                result.message = "protocol disabled";
                return result;
            }
        }
    }

    result.success = true;
    result.message = "ok";
    result.output = output;
    return result;
}

bool SshConnectionClient::authenticate(ssh_session handle, const Credential& credential, std::string& error) const {
    int rc = ssh_userauth_none(handle, nullptr);
    if (rc == SSH_AUTH_SUCCESS) {
        return true;
    }
    if (rc == SSH_AUTH_ERROR) {
        error = std::string("authentication error: ") + ssh_get_error(handle);
        return false;
    }

    int methods = ssh_userauth_list(handle, nullptr);
    auto offered = [methods](int method) { return methods == 0 || (methods & method) != 0; };

    bool authenticated = false;
    switch (credential.auth_method) {
        case AuthMethod::PASSWORD:
            authenticated = authenticate_password(handle, credential);
            break;
        case AuthMethod::PUBLICKEY:
            authenticated = authenticate_publickey(handle, credential, error);
            break;
        case AuthMethod::KEYBOARD_INTERACTIVE:
            authenticated = authenticate_keyboard_interactive(handle, credential);
            break;
        case AuthMethod::AUTO:
            if (!credential.key_file.empty() && offered(SSH_AUTH_METHOD_PUBLICKEY)) {
                authenticated = authenticate_publickey(handle, credential, error);
            }
            if (!authenticated && !credential.secret.empty() && offered(SSH_AUTH_METHOD_PASSWORD)) {
                authenticated = authenticate_password(handle, credential);
            }
            if (!authenticated && !credential.secret.empty() && offered(SSH_AUTH_METHOD_INTERACTIVE)) {
                authenticated = authenticate_keyboard_interactive(handle, credential);
            }
            break;
    }

    if (!authenticated && error.empty()) {
        error = "authentication rejected for user '" + credential.username + "' (" +
                to_string(credential.auth_method) + ")";
    }
    return authenticated;
}

bool SshConnectionClient::authenticate_password(ssh_session handle, const Credential& credential) const {
    return ssh_userauth_password(handle, nullptr, credential.secret.c_str()) == SSH_AUTH_SUCCESS;
}

bool SshConnectionClient::authenticate_publickey(ssh_session handle, const Credential& credential,
                                                 std::string& error) const {
    ssh_key key = nullptr;
    const char* passphrase = credential.key_passphrase.empty() ? nullptr : credential.key_passphrase.c_str();
    if (ssh_pki_import_privkey_file(credential.key_file.c_str(), passphrase, nullptr, nullptr, &key) != SSH_OK) {
        error = "unable to load private key " + credential.key_file;
        return false;
    }
    int rc = ssh_userauth_publickey(handle, nullptr, key);
    ssh_key_free(key);
    return rc == SSH_AUTH_SUCCESS;
}

bool SshConnectionClient::authenticate_keyboard_interactive(ssh_session handle, const Credential& credential) const {
    int rc = ssh_userauth_kbdint(handle, nullptr, nullptr);
    for (int round = 0; rc == SSH_AUTH_INFO && round < 8; ++round) {
        int prompts = ssh_userauth_kbdint_getnprompts(handle);
        for (int i = 0; i < prompts; ++i) {
            if (ssh_userauth_kbdint_setanswer(handle, static_cast<unsigned int>(i), credential.secret.c_str()) < 0) {
                return false;
            }
        }
        rc = ssh_userauth_kbdint(handle, nullptr, nullptr);
    }
    return rc == SSH_AUTH_SUCCESS;
}

bool SshConnectionClient::open_shell(SshSession& session, std::string& error) const {
    session.channel = ssh_channel_new(session.handle);
    if (session.channel == nullptr) {
        error = "unable to allocate channel";
        return false;
    }
    if (ssh_channel_open_session(session.channel) != SSH_OK) {
        error = std::string("channel open failed: ") + ssh_get_error(session.handle);
        return false;
    }
    if (ssh_channel_request_pty_size(session.channel, options_.terminal_type.c_str(),
                                     options_.terminal_columns, options_.terminal_rows) != SSH_OK) {
        error = std::string("pty request failed: ") + ssh_get_error(session.handle);
        return false;
    }
    if (ssh_channel_request_shell(session.channel) != SSH_OK) {
        error = std::string("shell request failed: ") + ssh_get_error(session.handle);
        return false;
    }
    return true;
}

bool SshConnectionClient::write_line(SshSession& session, const std::string& line) const {
    std::string data = line + "\n";
    int written = ssh_channel_write(session.channel, data.data(), static_cast<uint32_t>(data.size()));
    return written == static_cast<int>(data.size());
}

SshConnectionClient::ReadStatus SshConnectionClient::read_until(
    SshSession& session, const std::function<bool(const std::string&)>& done,
    std::chrono::steady_clock::time_point deadline, std::string& collected) const {

    char buffer[4096];
    while (true) {
        if (done(collected)) {
            return ReadStatus::COMPLETE;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadStatus::TIMEOUT;
        }

        int wait_ms = static_cast<int>(std::min(remaining, options_.read_interval).count());
        int read = ssh_channel_read_timeout(session.channel, buffer, sizeof(buffer), 0, wait_ms);
        if (read == SSH_ERROR) {
            return ReadStatus::CLOSED;
        }
        if (read > 0) {
            collected.append(buffer, static_cast<size_t>(read));

            // Page through output when the pager could not be disabled
            std::string tail = trim_right(collected);
            if (ends_with(tail, kPagerMarker)) {
                collected.erase(collected.rfind(kPagerMarker));
                ssh_channel_write(session.channel, " ", 1);
            }
        } else if (ssh_channel_is_eof(session.channel) != 0) {
            return done(collected) ? ReadStatus::COMPLETE : ReadStatus::CLOSED;
        }
    }
}

void SshConnectionClient::drain(SshSession& session) const {
    char buffer[4096];
    while (ssh_channel_read_nonblocking(session.channel, buffer, sizeof(buffer), 0) > 0) {
    }
}

// Waits once more for the prompt so the next command starts on a clean shell
bool SshConnectionClient::resynchronize(SshSession& session) const {
    std::string discarded;
    const std::string prompt = session.prompt;
    auto status = read_until(session, [&prompt](const std::string& buffer) { return ends_with_prompt(buffer, prompt); },
                             std::chrono::steady_clock::now() + options_.prompt_timeout, discarded);
    if (status != ReadStatus::COMPLETE) {
        return false;
    }
    logger_->debug("Prompt on {} returned after a timeout ({} late bytes dropped)", session.address,
                   discarded.size());
    return true;
}

void SshConnectionClient::disable_pagination(SshSession& session) {
    for (const auto& command : options_.pagination_commands) {
        auto result = execute_command(session, command, options_.prompt_timeout);
        if (result.success) {
            logger_->debug("Pagination disabled on {} with '{}'", session.address, command);
            return;
        }
    }
    logger_->debug("No pagination command accepted by {}", session.address);
}

} // namespace netmapper::components
