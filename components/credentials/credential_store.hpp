#pragma once

#include "netmapper/discovery_interface.hpp"
#include <string>
#include <vector>

namespace netmapper::components {

// Ordered, read-only list of credentials. Entries are sorted by priority once
// at construction; equal priorities keep their input order.
class CredentialStore {
public:
    CredentialStore() = default;
    explicit CredentialStore(std::vector<Credential> credentials);

    // Accepts either a top-level array or {"credentials": [...]}
    static CredentialStore from_json(const std::string& json_text);
    static CredentialStore load_file(const std::string& path);

    const std::vector<Credential>& entries() const { return credentials_; }
    const Credential* find(const std::string& id) const;
    size_t size() const { return credentials_.size(); }
    bool empty() const { return credentials_.empty(); }

    static AuthMethod parse_auth_method(const std::string& method);

private:
    std::vector<Credential> credentials_;
};

} // namespace netmapper::components
