#include "interface_normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <tuple>

namespace netmapper::components {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

} // namespace

InterfaceNormalizer::InterfaceNormalizer()
    : management_pattern_(R"(^(?:ma|mgmt|management|oob_management|oob|wan)(\d+(?:/\d+)*)?$)") {

    // Order matters: longer alternatives are listed before their prefixes
    const std::vector<std::tuple<std::string, std::string, std::string>> table = {
        {R"(^(?:ethernet|eth|et)(\d+(?:/\d+)*(?:\.\d+)?))", "Ethernet", "Eth"},
        {R"(^(?:gigabitethernet|gige|gig|gi)(\d+(?:/\d+)*(?:\.\d+)?))", "GigabitEthernet", "Gi"},
        {R"(^(?:tengigabitethernet|tengige|ten|te)(\d+(?:/\d+)*(?:\.\d+)?))", "TenGigabitEthernet", "Te"},
        {R"(^(?:twentyfivegigabitethernet|twentyfivegige|twe)(\d+(?:/\d+)*(?:\.\d+)?))", "TwentyFiveGigE", "Twe"},
        {R"(^(?:fortygigabitethernet|fortygige|fo)(\d+(?:/\d+)*(?:\.\d+)?))", "FortyGigabitEthernet", "Fo"},
        {R"(^(?:hundredgigabitethernet|hundredgige|100gige|hun|hu)(\d+(?:/\d+)*(?:\.\d+)?))", "HundredGigabitEthernet", "Hu"},
        {R"(^(?:port-channel|portchannel|port_channel|po)(\d+(?:\.\d+)?))", "Port-Channel", "Po"},
        {R"(^(?:vlan|vl)(\d+))", "Vlan", "Vl"},
        {R"(^(?:loopback|lo)(\d+))", "Loopback", "Lo"},
        {R"(^(?:fastethernet|fast|fa)(\d+(?:/\d+)*(?:\.\d+)?))", "FastEthernet", "Fa"},
    };

    for (const auto& [pattern, long_name, short_name] : table) {
        specs_.push_back({std::regex(pattern), long_name, short_name});
    }
}

std::string InterfaceNormalizer::normalize(const std::string& interface_name, bool use_short_name) const {
    std::string candidate = prepare(interface_name);
    if (candidate.empty()) {
        return candidate;
    }

    std::smatch match;
    if (std::regex_match(candidate, match, management_pattern_)) {
        std::string prefix = use_short_name ? "Ma" : "Management";
        return prefix + (match[1].matched ? match[1].str() : "0");
    }

    for (const auto& spec : specs_) {
        if (std::regex_search(candidate, match, spec.pattern)) {
            const std::string& prefix = use_short_name ? spec.short_name : spec.long_name;
            return prefix + match[1].str() + match.suffix().str();
        }
    }

    return candidate;
}

bool InterfaceNormalizer::is_management_interface(const std::string& interface_name) const {
    return std::regex_match(prepare(interface_name), management_pattern_);
}

std::string InterfaceNormalizer::prepare(const std::string& interface_name) const {
    std::string value = to_lower(trim(interface_name));

    // "Gig 1/0/1" style spellings: try the joined form before the last token
    if (value.find_first_of(" \t") != std::string::npos) {
        std::string joined;
        std::copy_if(value.begin(), value.end(), std::back_inserter(joined),
                     [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
        if (matches_any(joined)) {
            return joined;
        }
        value = value.substr(value.find_last_of(" \t") + 1);
    }

    // "sw1-Gi0/1" style names carry the neighbor hostname before the port
    auto dash = value.rfind('-');
    if (dash != std::string::npos && dash + 1 < value.size() && !matches_any(value)) {
        std::string tail = value.substr(dash + 1);
        if (matches_any(tail)) {
            value = tail;
        }
    }

    return value;
}

bool InterfaceNormalizer::matches_any(const std::string& candidate) const {
    if (std::regex_match(candidate, management_pattern_)) {
        return true;
    }
    return std::any_of(specs_.begin(), specs_.end(), [&candidate](const InterfaceSpec& spec) {
        return std::regex_search(candidate, spec.pattern);
    });
}

} // namespace netmapper::components
