#include "regex_template.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace netmapper::components {

RegexTemplate::RegexTemplate(const std::string& name, std::vector<std::string> required_fields)
    : name_(name), required_fields_(std::move(required_fields)) {
}

RegexTemplate RegexTemplate::from_json(const std::string& name, const std::string& json_text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw TemplateLoadError(name + ": invalid JSON: " + e.what());
    }

    if (!document.is_object() || !document.contains("rules") || !document["rules"].is_array()) {
        throw TemplateLoadError(name + ": regex template requires a 'rules' array");
    }

    std::vector<std::string> required;
    if (document.contains("required")) {
        if (!document["required"].is_array()) {
            throw TemplateLoadError(name + ": 'required' must be an array of field names");
        }
        for (const auto& field : document["required"]) {
            if (!field.is_string()) {
                throw TemplateLoadError(name + ": 'required' must be an array of field names");
            }
            required.push_back(field.get<std::string>());
        }
    }

    RegexTemplate compiled(name, required);
    if (document.contains("block_start")) {
        if (!document["block_start"].is_string()) {
            throw TemplateLoadError(name + ": 'block_start' must be a pattern string");
        }
        compiled.set_block_start(document["block_start"].get<std::string>());
    }
    for (const auto& rule : document["rules"]) {
        if (!rule.is_object() || !rule.contains("pattern") || !rule["pattern"].is_string() ||
            !rule.contains("fields") || !rule["fields"].is_object()) {
            throw TemplateLoadError(name + ": each rule needs a 'pattern' string and a 'fields' object");
        }

        std::map<std::string, size_t> fields;
        for (const auto& [field, group] : rule["fields"].items()) {
            if (!group.is_number_unsigned()) {
                throw TemplateLoadError(name + ": field '" + field + "' must map to a capture group index");
            }
            fields[field] = group.get<size_t>();
        }
        compiled.add_rule(rule["pattern"].get<std::string>(), fields);
    }

    if (compiled.rules_.empty()) {
        throw TemplateLoadError(name + ": regex template has no rules");
    }
    return compiled;
}

void RegexTemplate::set_block_start(const std::string& pattern) {
    try {
        block_start_ = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw TemplateLoadError(name_ + ": invalid block_start '" + pattern + "': " + e.what());
    }
    block_start_pattern_ = pattern;
}

void RegexTemplate::add_rule(const std::string& pattern, const std::map<std::string, size_t>& fields) {
    RegexRule rule;
    rule.pattern = pattern;
    rule.fields = fields;
    try {
        rule.regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw TemplateLoadError(name_ + ": invalid pattern '" + pattern + "': " + e.what());
    }

    size_t groups = rule.regex.mark_count();
    for (const auto& [field, group] : fields) {
        if (group == 0 || group > groups) {
            throw TemplateLoadError(name_ + ": field '" + field + "' references missing group " +
                                    std::to_string(group));
        }
    }
    rules_.push_back(std::move(rule));
}

RegexRun RegexTemplate::run(const std::string& text) const {
    RegexRun run;

    for (const auto& block : split_blocks(text)) {
        if (block.size() > kMaxBlockSize) {
            ++run.skipped_blocks;
            continue;
        }
        for (const auto& rule : rules_) {
            auto begin = std::sregex_iterator(block.begin(), block.end(), rule.regex);
            for (auto it = begin; it != std::sregex_iterator(); ++it) {
                const std::smatch& match = *it;
                ParsedRecord record;
                for (const auto& [field, group] : rule.fields) {
                    record.values[field] = match[group].matched ? match[group].str() : std::string();
                }

                bool all_empty = std::all_of(record.values.begin(), record.values.end(),
                    [](const auto& entry) { return entry.second.empty(); });
                if (all_empty || !has_required_fields(record)) {
                    continue;
                }
                run.records.push_back(std::move(record));
            }
        }
    }

    return run;
}

std::vector<std::string> RegexTemplate::split_blocks(const std::string& text) const {
    if (block_start_pattern_.empty()) {
        return {text};
    }

    // Text ahead of the first block start is a banner or legend
    std::vector<std::string> blocks;
    bool in_block = false;
    size_t position = 0;
    while (position < text.size()) {
        size_t end = text.find('\n', position);
        size_t next = end == std::string::npos ? text.size() : end + 1;
        std::string line = text.substr(position, next - position);

        if (std::regex_search(line, block_start_, std::regex_constants::match_continuous)) {
            blocks.emplace_back();
            in_block = true;
        }
        if (in_block) {
            blocks.back() += line;
        }
        position = next;
    }
    return blocks;
}

bool RegexTemplate::has_required_fields(const ParsedRecord& record) const {
    return std::all_of(required_fields_.begin(), required_fields_.end(), [&record](const std::string& field) {
        return !record.get(field).empty();
    });
}

} // namespace netmapper::components
