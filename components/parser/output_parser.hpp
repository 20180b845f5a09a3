#pragma once

#include "netmapper/discovery_interface.hpp"
#include "regex_template.hpp"
#include "textfsm_template.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace netmapper::components {

struct ParseTemplate {
    std::string name;
    ParseMethod method = ParseMethod::STATE_MACHINE;
    std::vector<std::string> commands;
    std::shared_ptr<const StateMachineTemplate> state_machine;
    std::shared_ptr<const RegexTemplate> regex;
};

// Template-driven parser. State-machine templates for a command are tried in
// registration order, then regex templates; the first one that yields at
// least one record wins.
class OutputParser : public IOutputParser {
public:
    explicit OutputParser(std::shared_ptr<spdlog::logger> logger = nullptr);

    void register_template(ParseTemplate parse_template);
    void add_state_machine_template(const std::string& name, const std::vector<std::string>& commands,
                                    const std::string& source);
    void add_regex_template(const std::string& name, const std::vector<std::string>& commands,
                            const std::string& json_text);

    std::vector<ParsedRecord> parse(const std::string& raw_text, const std::string& command) const override;
    size_t template_count() const override { return templates_.size(); }
    size_t template_count(ParseMethod method) const;

    std::vector<const ParseTemplate*> templates_for(const std::string& command, ParseMethod method) const;
    bool has_templates_for(const std::string& command) const;

    // CRLF to LF, ANSI escapes and stray control characters removed
    static std::string clean_text(const std::string& raw_text);
    // Lowercase with internal whitespace collapsed
    static std::string normalize_command(const std::string& command);

private:
    std::vector<ParsedRecord> run_template(const ParseTemplate& parse_template, const std::string& text) const;

    std::vector<ParseTemplate> templates_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace netmapper::components
