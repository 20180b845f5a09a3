#pragma once

#include "netmapper/discovery_interface.hpp"
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace netmapper::components {

struct RegexRule {
    std::string pattern;
    std::regex regex;
    std::map<std::string, size_t> fields;   // field name -> capture group
};

struct RegexRun {
    std::vector<ParsedRecord> records;
    size_t skipped_blocks = 0;              // blocks over kMaxBlockSize
};

// Fallback extraction. The text is cut into blocks at every line matching the
// block start pattern (one block when none is set). Each rule is searched
// inside each block and every match becomes one record.
class RegexTemplate {
public:
    // std::regex backtracks recursively; larger blocks are not searched
    static constexpr size_t kMaxBlockSize = 8192;

    RegexTemplate(const std::string& name, std::vector<std::string> required_fields);

    // JSON form: {"required": [...], "block_start": "...",
    //             "rules": [{"pattern": "...", "fields": {...}}]}
    static RegexTemplate from_json(const std::string& name, const std::string& json_text);

    void set_block_start(const std::string& pattern);
    void add_rule(const std::string& pattern, const std::map<std::string, size_t>& fields);

    RegexRun run(const std::string& text) const;
    std::vector<std::string> split_blocks(const std::string& text) const;

    const std::string& name() const { return name_; }
    const std::vector<RegexRule>& rules() const { return rules_; }
    const std::vector<std::string>& required_fields() const { return required_fields_; }

private:
    bool has_required_fields(const ParsedRecord& record) const;

    std::string name_;
    std::vector<std::string> required_fields_;
    std::vector<RegexRule> rules_;
    std::string block_start_pattern_;
    std::regex block_start_;
};

} // namespace netmapper::components
