#pragma once

#include "discovery_interface.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Forward declarations
#include <nlohmann/json_fwd.hpp>

namespace spdlog {
class logger;
}

namespace netmapper {

namespace components {
class OutputParser;
}

// One entry of a template directory's index.json
struct TemplateManifest {
    std::string name;
    std::string file;
    ParseMethod method = ParseMethod::STATE_MACHINE;
    std::vector<std::string> commands;
};

// Loads a template directory into an OutputParser. Individual malformed
// templates are reported and skipped; loading fails only when nothing usable
// remains.
class TemplateManager {
public:
    struct LoadedTemplate {
        TemplateManifest manifest;
        std::string path;
        std::chrono::system_clock::time_point loaded_at;
    };

    struct LoadReport {
        std::vector<LoadedTemplate> loaded;
        std::vector<std::string> errors;
    };

    using TemplateEventHandler = std::function<void(const std::string& template_name,
                                                    const std::string& event,
                                                    const std::string& detail)>;

    explicit TemplateManager(std::shared_ptr<spdlog::logger> logger = nullptr);

    LoadReport load_directory(const std::string& directory, components::OutputParser& parser);
    void load_template(const TemplateManifest& manifest, const std::string& directory,
                       components::OutputParser& parser);

    // index.json when present, otherwise *.textfsm and *.regex.json by file name
    std::vector<TemplateManifest> scan_template_directory(const std::string& directory) const;
    std::vector<TemplateManifest> parse_template_index(const std::string& index_path) const;

    // "cisco_ios_show_cdp_neighbors_detail.textfsm" -> "show cdp neighbors detail"
    static std::string command_from_file_name(const std::string& file_name);

    void set_event_handler(TemplateEventHandler handler);

private:
    // Manifest validation helpers
    void validate_manifest_schema(const nlohmann::json& entry, size_t position) const;
    bool validate_template_name(const std::string& name) const;
    std::string read_file(const std::string& path) const;
    void notify(const std::string& template_name, const std::string& event, const std::string& detail) const;

    std::shared_ptr<spdlog::logger> logger_;
    TemplateEventHandler event_handler_;
};

} // namespace netmapper
