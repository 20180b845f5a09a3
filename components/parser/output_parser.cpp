#include "output_parser.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace netmapper::components {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

void clean_values(std::vector<ParsedRecord>& records) {
    for (auto& record : records) {
        for (auto& [field, value] : record.values) {
            value = trim(value);
        }
        for (auto& [field, list] : record.lists) {
            for (auto& item : list) {
                item = trim(item);
            }
        }
    }
}

} // namespace

OutputParser::OutputParser(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

void OutputParser::register_template(ParseTemplate parse_template) {
    for (auto& command : parse_template.commands) {
        command = normalize_command(command);
    }
    logger_->debug("Registered {} template '{}' for {} command(s)",
                   to_string(parse_template.method), parse_template.name, parse_template.commands.size());
    templates_.push_back(std::move(parse_template));
}

void OutputParser::add_state_machine_template(const std::string& name, const std::vector<std::string>& commands,
                                              const std::string& source) {
    ParseTemplate parse_template;
    parse_template.name = name;
    parse_template.method = ParseMethod::STATE_MACHINE;
    parse_template.commands = commands;
    parse_template.state_machine = std::make_shared<const StateMachineTemplate>(
        StateMachineTemplate::compile(name, source));
    register_template(std::move(parse_template));
}

void OutputParser::add_regex_template(const std::string& name, const std::vector<std::string>& commands,
                                      const std::string& json_text) {
    ParseTemplate parse_template;
    parse_template.name = name;
    parse_template.method = ParseMethod::REGEX;
    parse_template.commands = commands;
    parse_template.regex = std::make_shared<const RegexTemplate>(RegexTemplate::from_json(name, json_text));
    register_template(std::move(parse_template));
}

size_t OutputParser::template_count(ParseMethod method) const {
    return static_cast<size_t>(std::count_if(templates_.begin(), templates_.end(),
        [method](const ParseTemplate& parse_template) { return parse_template.method == method; }));
}

std::vector<const ParseTemplate*> OutputParser::templates_for(const std::string& command, ParseMethod method) const {
    std::string normalized = normalize_command(command);
    std::vector<const ParseTemplate*> exact;
    std::vector<const ParseTemplate*> contained;

    for (const auto& parse_template : templates_) {
        if (parse_template.method != method) {
            continue;
        }
        for (const auto& template_command : parse_template.commands) {
            if (template_command == normalized) {
                exact.push_back(&parse_template);
                break;
            }
            if (!template_command.empty() && normalized.find(template_command) != std::string::npos) {
                contained.push_back(&parse_template);
                break;
            }
        }
    }

    return exact.empty() ? contained : exact;
}

bool OutputParser::has_templates_for(const std::string& command) const {
    return !templates_for(command, ParseMethod::STATE_MACHINE).empty() ||
           !templates_for(command, ParseMethod::REGEX).empty();
}

std::vector<ParsedRecord> OutputParser::parse(const std::string& raw_text, const std::string& command) const {
    std::string text = clean_text(raw_text);
    if (trim(text).empty()) {
        return {};
    }

    for (auto method : {ParseMethod::STATE_MACHINE, ParseMethod::REGEX}) {
        for (const auto* parse_template : templates_for(command, method)) {
            auto records = run_template(*parse_template, text);
            if (!records.empty()) {
                logger_->debug("Template '{}' produced {} record(s) for '{}'",
                               parse_template->name, records.size(), command);
                return records;
            }
        }
    }

    logger_->debug("No template produced records for '{}'", command);
    return {};
}

std::vector<ParsedRecord> OutputParser::run_template(const ParseTemplate& parse_template,
                                                     const std::string& text) const {
    std::vector<ParsedRecord> records;
    try {
        if (parse_template.method == ParseMethod::STATE_MACHINE && parse_template.state_machine) {
            auto run = parse_template.state_machine->run(text);
            if (run.aborted) {
                logger_->warn("{} in template '{}': {}", to_string(ErrorKind::PARSE_TEMPLATE_ERROR),
                              parse_template.name, run.error);
                return {};
            }
            records = std::move(run.records);
        } else if (parse_template.method == ParseMethod::REGEX && parse_template.regex) {
            auto run = parse_template.regex->run(text);
            if (run.skipped_blocks > 0) {
                logger_->warn("{} in template '{}': skipped {} block(s) over {} bytes",
                              to_string(ErrorKind::PARSE_TEMPLATE_ERROR), parse_template.name,
                              run.skipped_blocks, RegexTemplate::kMaxBlockSize);
            }
            records = std::move(run.records);
        }
    } catch (const std::regex_error& e) {
        // error_complexity; stack depth is bounded by the per-block size limit
        logger_->warn("{} in template '{}': {}", to_string(ErrorKind::PARSE_TEMPLATE_ERROR),
                      parse_template.name, e.what());
        return {};
    }

    clean_values(records);
    return records;
}

std::string OutputParser::clean_text(const std::string& raw_text) {
    static const std::regex ansi_escape(R"(\x1b\[[0-9;?]*[A-Za-z])");
    std::string text = std::regex_replace(raw_text, ansi_escape, "");

    std::string cleaned;
    cleaned.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                continue;
            }
            cleaned += '\n';
            continue;
        }
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && c != '\n' && c != '\t') {
            continue;
        }
        if (uc == 0x7f) {
            continue;
        }
        cleaned += c;
    }
    return cleaned;
}

std::string OutputParser::normalize_command(const std::string& command) {
    std::istringstream stream(command);
    std::string word;
    std::string normalized;
    while (stream >> word) {
        if (!normalized.empty()) {
            normalized += ' ';
        }
        normalized += word;
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

} // namespace netmapper::components
