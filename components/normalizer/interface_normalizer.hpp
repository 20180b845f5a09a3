#pragma once

#include <regex>
#include <string>
#include <vector>

namespace netmapper::components {

// Maps vendor-specific interface spellings onto one canonical form so the
// two ends of a link reported by CDP and LLDP compare equal.
class InterfaceNormalizer {
public:
    struct InterfaceSpec {
        std::regex pattern;
        std::string long_name;
        std::string short_name;
    };

    InterfaceNormalizer();

    std::string normalize(const std::string& interface_name, bool use_short_name = true) const;
    bool is_management_interface(const std::string& interface_name) const;

private:
    std::string prepare(const std::string& interface_name) const;
    bool matches_any(const std::string& candidate) const;

    std::vector<InterfaceSpec> specs_;
    std::regex management_pattern_;
};

} // namespace netmapper::components
