#include "credential_store.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace netmapper::components {

CredentialStore::CredentialStore(std::vector<Credential> credentials)
    : credentials_(std::move(credentials)) {

    std::stable_sort(credentials_.begin(), credentials_.end(),
        [](const Credential& a, const Credential& b) {
            return a.priority < b.priority;
        });

    for (size_t i = 0; i < credentials_.size(); ++i) {
        if (credentials_[i].id.empty()) {
            credentials_[i].id = credentials_[i].username.empty()
                ? "credential-" + std::to_string(i + 1)
                : credentials_[i].username;
        }
    }
}

CredentialStore CredentialStore::from_json(const std::string& json_text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("invalid credentials JSON: ") + e.what());
    }

    const nlohmann::json* list = &document;
    if (document.is_object() && document.contains("credentials")) {
        list = &document["credentials"];
    }
    if (!list->is_array()) {
        throw ConfigError("credentials must be a JSON array");
    }

    std::vector<Credential> credentials;
    size_t position = 0;
    for (const auto& entry : *list) {
        ++position;
        if (!entry.is_object()) {
            throw ConfigError("credential " + std::to_string(position) + " is not an object");
        }

        try {
            Credential credential;
            credential.id = entry.value("id", std::string());
            credential.username = entry.value("username", std::string());
            credential.secret = entry.value("password", std::string());
            credential.key_file = entry.value("key_file", entry.value("keyFile", std::string()));
            credential.key_passphrase = entry.value("key_passphrase", entry.value("keyPassphrase", std::string()));
            credential.auth_method = parse_auth_method(entry.value("auth_method", std::string("auto")));
            if (entry.contains("port") && !entry["port"].is_number_integer()) {
                throw ConfigError("port must be an integer");
            }
            int64_t port = entry.value("port", static_cast<int64_t>(0));
            if (port < 0 || port > 65535) {
                throw ConfigError("port must be between 1 and 65535 (0 or absent uses ssh_port), got " + std::to_string(port));
            }
            credential.port = static_cast<uint16_t>(port);
            credential.priority = entry.value("priority", entry.value("authPriority", static_cast<int32_t>(position)));

            if (credential.username.empty()) {
                throw ConfigError("missing username");
            }
            if (credential.secret.empty() && credential.key_file.empty()) {
                throw ConfigError("needs a password or a key_file");
            }
            credentials.push_back(credential);
        } catch (const nlohmann::json::type_error& e) {
            throw ConfigError("credential " + std::to_string(position) + ": " + e.what());
        } catch (const ConfigError& e) {
            throw ConfigError("credential " + std::to_string(position) + ": " + e.what());
        }
    }

    return CredentialStore(std::move(credentials));
}

CredentialStore CredentialStore::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open credentials file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return from_json(content.str());
}

const Credential* CredentialStore::find(const std::string& id) const {
    auto it = std::find_if(credentials_.begin(), credentials_.end(),
        [&id](const Credential& credential) { return credential.id == id; });
    return it == credentials_.end() ? nullptr : &*it;
}

AuthMethod CredentialStore::parse_auth_method(const std::string& method) {
    if (method == "auto" || method.empty()) {
        return AuthMethod::AUTO;
    }
    if (method == "password") {
        return AuthMethod::PASSWORD;
    }
    if (method == "publickey" || method == "key") {
        return AuthMethod::PUBLICKEY;
    }
    if (method == "keyboard-interactive" || method == "keyboard_interactive") {
        return AuthMethod::KEYBOARD_INTERACTIVE;
    }
    throw ConfigError("unknown auth_method '" + method + "'");
}

} // namespace netmapper::components
