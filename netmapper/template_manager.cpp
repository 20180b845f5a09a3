#include "template_manager.hpp"
#include "components/parser/output_parser.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace netmapper {

namespace {

const char* const kIndexFile = "index.json";
const char* const kStateMachineSuffix = ".textfsm";
const char* const kRegexSuffix = ".regex.json";

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TemplateManager::TemplateManager(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

TemplateManager::LoadReport TemplateManager::load_directory(const std::string& directory,
                                                            components::OutputParser& parser) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw TemplateLoadError("template directory not found: " + directory);
    }

    LoadReport report;
    for (const auto& manifest : scan_template_directory(directory)) {
        try {
            load_template(manifest, directory, parser);
            report.loaded.push_back({manifest, (fs::path(directory) / manifest.file).string(),
                                     std::chrono::system_clock::now()});
            notify(manifest.name, "loaded", manifest.file);
        } catch (const TemplateLoadError& e) {
            logger_->error("{}: {}", to_string(ErrorKind::TEMPLATE_LOAD_ERROR), e.what());
            report.errors.push_back(e.what());
            notify(manifest.name, "load_failed", e.what());
        }
    }

    if (report.loaded.empty()) {
        std::string message = "no usable templates in " + directory;
        if (!report.errors.empty()) {
            message += " (" + std::to_string(report.errors.size()) + " failed, first: " + report.errors.front() + ")";
        }
        throw TemplateLoadError(message);
    }

    logger_->info("Loaded {} template(s) from {} ({} state machine, {} regex, {} failed)",
                  report.loaded.size(), directory,
                  parser.template_count(ParseMethod::STATE_MACHINE),
                  parser.template_count(ParseMethod::REGEX),
                  report.errors.size());
    return report;
}

void TemplateManager::load_template(const TemplateManifest& manifest, const std::string& directory,
                                    components::OutputParser& parser) {
    std::string path = (fs::path(directory) / manifest.file).string();
    std::string content = read_file(path);

    if (manifest.method == ParseMethod::STATE_MACHINE) {
        parser.add_state_machine_template(manifest.name, manifest.commands, content);
    } else {
        parser.add_regex_template(manifest.name, manifest.commands, content);
    }
    logger_->debug("Loaded template '{}' from {}", manifest.name, path);
}

std::vector<TemplateManifest> TemplateManager::scan_template_directory(const std::string& directory) const {
    fs::path index_path = fs::path(directory) / kIndexFile;
    std::error_code ec;
    if (fs::exists(index_path, ec)) {
        return parse_template_index(index_path.string());
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path().filename().string());
        }
    }
    std::sort(files.begin(), files.end());

    // State-machine templates register ahead of regex ones
    std::vector<TemplateManifest> state_machine;
    std::vector<TemplateManifest> regex;
    for (const auto& file : files) {
        TemplateManifest manifest;
        manifest.file = file;
        if (ends_with(file, kStateMachineSuffix)) {
            manifest.method = ParseMethod::STATE_MACHINE;
            manifest.name = file.substr(0, file.size() - std::string(kStateMachineSuffix).size());
            manifest.commands = {command_from_file_name(file)};
            state_machine.push_back(manifest);
        } else if (ends_with(file, kRegexSuffix)) {
            manifest.method = ParseMethod::REGEX;
            manifest.name = file.substr(0, file.size() - std::string(kRegexSuffix).size());
            manifest.commands = {command_from_file_name(file)};
            regex.push_back(manifest);
        }
    }

    state_machine.insert(state_machine.end(), regex.begin(), regex.end());
    return state_machine;
}

std::vector<TemplateManifest> TemplateManager::parse_template_index(const std::string& index_path) const {
    nlohmann::json index;
    try {
        index = nlohmann::json::parse(read_file(index_path));
    } catch (const nlohmann::json::parse_error& e) {
        throw TemplateLoadError(index_path + ": invalid JSON: " + e.what());
    }

    if (!index.is_object() || !index.contains("templates") || !index["templates"].is_array()) {
        throw TemplateLoadError(index_path + ": expected a 'templates' array");
    }

    std::vector<TemplateManifest> manifests;
    size_t position = 0;
    for (const auto& entry : index["templates"]) {
        validate_manifest_schema(entry, position++);

        TemplateManifest manifest;
        manifest.file = entry["file"].get<std::string>();
        manifest.name = entry.value("name", manifest.file);
        manifest.method = entry.value("method", std::string("state_machine")) == "regex"
            ? ParseMethod::REGEX : ParseMethod::STATE_MACHINE;
        for (const auto& command : entry["commands"]) {
            manifest.commands.push_back(command.get<std::string>());
        }

        if (!validate_template_name(manifest.name)) {
            throw TemplateLoadError(index_path + ": invalid template name '" + manifest.name + "'");
        }
        manifests.push_back(manifest);
    }
    return manifests;
}

std::string TemplateManager::command_from_file_name(const std::string& file_name) {
    std::string stem = file_name;
    for (const std::string suffix : {kRegexSuffix, kStateMachineSuffix}) {
        if (ends_with(stem, suffix)) {
            stem = stem.substr(0, stem.size() - suffix.size());
            break;
        }
    }

    std::vector<std::string> words;
    std::stringstream stream(stem);
    std::string word;
    while (std::getline(stream, word, '_')) {
        if (!word.empty()) {
            words.push_back(word);
        }
    }

    // Platform prefixes such as cisco_ios precede the command verb
    auto start = std::find(words.begin(), words.end(), "show");
    if (start == words.end()) {
        start = words.begin();
    }

    std::string command;
    for (auto it = start; it != words.end(); ++it) {
        if (!command.empty()) {
            command += ' ';
        }
        command += *it;
    }
    return components::OutputParser::normalize_command(command);
}

void TemplateManager::set_event_handler(TemplateEventHandler handler) {
    event_handler_ = std::move(handler);
}

void TemplateManager::validate_manifest_schema(const nlohmann::json& entry, size_t position) const {
    std::string where = "template index entry " + std::to_string(position);
    if (!entry.is_object()) {
        throw TemplateLoadError(where + ": expected an object");
    }
    if (!entry.contains("file") || !entry["file"].is_string()) {
        throw TemplateLoadError(where + ": missing 'file'");
    }
    if (entry.contains("name") && !entry["name"].is_string()) {
        throw TemplateLoadError(where + ": 'name' must be a string");
    }
    if (entry.contains("method")) {
        if (!entry["method"].is_string() ||
            (entry["method"] != "state_machine" && entry["method"] != "regex")) {
            throw TemplateLoadError(where + ": 'method' must be \"state_machine\" or \"regex\"");
        }
    }
    if (!entry.contains("commands") || !entry["commands"].is_array() || entry["commands"].empty()) {
        throw TemplateLoadError(where + ": 'commands' must be a non-empty array");
    }
    for (const auto& command : entry["commands"]) {
        if (!command.is_string()) {
            throw TemplateLoadError(where + ": 'commands' must contain strings");
        }
    }
}

bool TemplateManager::validate_template_name(const std::string& name) const {
    if (name.empty() || name.length() > 128) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    });
}

std::string TemplateManager::read_file(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw TemplateLoadError("cannot open template file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void TemplateManager::notify(const std::string& template_name, const std::string& event,
                             const std::string& detail) const {
    if (event_handler_) {
        event_handler_(template_name, event, detail);
    }
}

} // namespace netmapper
