#include "textfsm_template.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace netmapper::components {

namespace {

const char* const kStartState = "Start";
const char* const kEndStateName = "End";
const char* const kEofStateName = "EOF";

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(text);
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

bool is_identifier(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool parse_option(const std::string& token, ValueOption& option) {
    if (token == "Required") {
        option = ValueOption::REQUIRED;
    } else if (token == "Filldown") {
        option = ValueOption::FILLDOWN;
    } else if (token == "List") {
        option = ValueOption::LIST;
    } else if (token == "Key") {
        option = ValueOption::KEY;
    } else if (token == "Fillup") {
        option = ValueOption::FILLUP;
    } else {
        return false;
    }
    return true;
}

bool parse_line_op(const std::string& token, LineOp& op) {
    if (token == "Next") {
        op = LineOp::NEXT;
    } else if (token == "Continue") {
        op = LineOp::CONTINUE;
    } else {
        return false;
    }
    return true;
}

bool parse_record_op(const std::string& token, RecordOp& op) {
    if (token == "NoRecord") {
        op = RecordOp::NO_RECORD;
    } else if (token == "Record") {
        op = RecordOp::RECORD;
    } else if (token == "Clear") {
        op = RecordOp::CLEAR;
    } else if (token == "Clearall") {
        op = RecordOp::CLEARALL;
    } else {
        return false;
    }
    return true;
}

// Skips a bracket expression starting at `pos`; returns the index of its ']'
size_t skip_char_class(const std::string& pattern, size_t pos) {
    size_t i = pos + 1;
    if (i < pattern.size() && pattern[i] == '^') {
        ++i;
    }
    if (i < pattern.size() && pattern[i] == ']') {
        ++i;
    }
    while (i < pattern.size() && pattern[i] != ']') {
        if (pattern[i] == '\\') {
            ++i;
        }
        ++i;
    }
    return i;
}

} // namespace

size_t StateMachineTemplate::count_capture_groups(const std::string& pattern) {
    size_t groups = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            ++i;
        } else if (c == '[') {
            i = skip_char_class(pattern, i);
        } else if (c == '(') {
            if (i + 1 >= pattern.size() || pattern[i + 1] != '?') {
                ++groups;
            }
        }
    }
    return groups;
}

StateMachineTemplate StateMachineTemplate::compile(const std::string& name, const std::string& source) {
    StateMachineTemplate compiled;
    compiled.name_ = name;

    auto lines = split_lines(source);
    size_t index = 0;

    // Value block: ends at the first blank line after at least one definition
    for (; index < lines.size(); ++index) {
        const std::string& line = lines[index];
        std::string stripped = trim(line);
        if (!stripped.empty() && stripped[0] == '#') {
            continue;
        }
        if (stripped.empty()) {
            if (compiled.values_.empty()) {
                continue;
            }
            ++index;
            break;
        }
        if (line.rfind("Value ", 0) != 0) {
            if (compiled.values_.empty()) {
                throw compiled.error_at(index + 1, "expected a Value definition");
            }
            break;
        }
        compiled.parse_value_line(line, index + 1);
    }

    if (compiled.values_.empty()) {
        throw compiled.error_at(0, "template defines no values");
    }

    // State block
    bool in_state = false;
    size_t current = 0;
    for (; index < lines.size(); ++index) {
        const std::string& line = lines[index];
        std::string stripped = trim(line);
        if (stripped.empty()) {
            in_state = false;
            continue;
        }
        if (stripped[0] == '#') {
            continue;
        }

        if (!std::isspace(static_cast<unsigned char>(line[0]))) {
            if (!is_identifier(stripped)) {
                throw compiled.error_at(index + 1, "invalid state name '" + stripped + "'");
            }
            if (compiled.state_index_.count(stripped) > 0) {
                throw compiled.error_at(index + 1, "state '" + stripped + "' declared twice");
            }
            if (stripped == kEndStateName) {
                throw compiled.error_at(index + 1, "'End' is reserved and cannot be declared");
            }
            compiled.state_index_[stripped] = compiled.states_.size();
            compiled.states_.push_back({stripped, {}});
            if (stripped == kEofStateName) {
                compiled.has_eof_state_ = true;
            }
            current = compiled.states_.size() - 1;
            in_state = true;
            continue;
        }

        if (!in_state) {
            throw compiled.error_at(index + 1, "rule outside of a state");
        }
        compiled.parse_rule_line(current, stripped, index + 1);
    }

    auto start_it = compiled.state_index_.find(kStartState);
    if (start_it == compiled.state_index_.end()) {
        throw compiled.error_at(0, "missing mandatory 'Start' state");
    }
    compiled.start_state_ = start_it->second;

    compiled.resolve_transitions();
    return compiled;
}

void StateMachineTemplate::parse_value_line(const std::string& line, size_t line_number) {
    std::istringstream stream(line.substr(6));
    std::string first;
    stream >> first;

    ValueDefinition value;
    std::string value_name = first;

    // An option list is only present when every comma-separated part is a known option
    std::vector<ValueOption> options;
    bool all_options = !first.empty();
    std::stringstream option_stream(first);
    std::string token;
    while (std::getline(option_stream, token, ',')) {
        ValueOption option;
        if (!parse_option(token, option)) {
            all_options = false;
            break;
        }
        options.push_back(option);
    }

    std::string rest;
    std::getline(stream, rest);
    rest = trim(rest);

    if (all_options && !rest.empty() && rest[0] != '(') {
        std::istringstream rest_stream(rest);
        rest_stream >> value_name;
        std::getline(rest_stream, rest);
        rest = trim(rest);
        for (auto option : options) {
            if (has_option(value.options, option)) {
                throw error_at(line_number, "duplicate option on value '" + value_name + "'");
            }
            value.options = value.options | option;
        }
    } else if (first.find(',') != std::string::npos || (!rest.empty() && rest[0] != '(')) {
        throw error_at(line_number, "unknown value option '" + first + "'");
    }

    if (!is_identifier(value_name)) {
        throw error_at(line_number, "invalid value name '" + value_name + "'");
    }
    if (value_index_.count(value_name) > 0) {
        throw error_at(line_number, "duplicate value '" + value_name + "'");
    }
    if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')' || rest[1] == '?') {
        throw error_at(line_number, "value '" + value_name + "' regex must be a capturing group");
    }

    try {
        std::regex check(rest);
    } catch (const std::regex_error& e) {
        throw error_at(line_number, "invalid regex for value '" + value_name + "': " + e.what());
    }

    value.name = value_name;
    value.pattern = rest;
    value_index_[value.name] = values_.size();
    values_.push_back(value);
}

void StateMachineTemplate::parse_rule_line(size_t state, const std::string& line, size_t line_number) {
    if (line[0] != '^') {
        throw error_at(line_number, "rule must start with '^'");
    }

    // The action is introduced by the last whitespace-preceded "->"
    std::string match_part = line;
    std::string action_part;
    for (size_t pos = line.rfind("->"); pos != std::string::npos && pos > 0; pos = line.rfind("->", pos - 1)) {
        if (std::isspace(static_cast<unsigned char>(line[pos - 1]))) {
            match_part = trim(line.substr(0, pos));
            action_part = trim(line.substr(pos + 2));
            break;
        }
    }

    StateRule rule;
    rule.source = line;
    rule.line_number = line_number;
    rule.action = parse_action(action_part, line_number);

    std::string expanded = expand_rule(match_part, line_number, rule.captures);
    try {
        rule.regex = std::regex(expanded, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw error_at(line_number, "invalid rule regex '" + match_part + "': " + e.what());
    }

    states_[state].rules.push_back(std::move(rule));
}

RuleAction StateMachineTemplate::parse_action(const std::string& action, size_t line_number) const {
    RuleAction result;
    if (action.empty()) {
        return result;
    }

    if (action.rfind("Error", 0) == 0) {
        std::string message = trim(action.substr(5));
        if (message.size() >= 2 && message.front() == '"' && message.back() == '"') {
            message = message.substr(1, message.size() - 2);
        }
        result.raise_error = true;
        result.error_message = message;
        return result;
    }

    auto words = split_words(action);
    if (words.size() > 2) {
        throw error_at(line_number, "malformed action '" + action + "'");
    }

    const std::string& head = words[0];
    bool head_is_operation = true;
    auto dot = head.find('.');
    if (dot != std::string::npos) {
        if (!parse_line_op(head.substr(0, dot), result.line_op) ||
            !parse_record_op(head.substr(dot + 1), result.record_op)) {
            throw error_at(line_number, "unknown action '" + head + "'");
        }
    } else if (!parse_line_op(head, result.line_op) && !parse_record_op(head, result.record_op)) {
        head_is_operation = false;
    }

    if (!head_is_operation) {
        if (words.size() != 1 || !is_identifier(head)) {
            throw error_at(line_number, "malformed action '" + action + "'");
        }
        result.next_state = head;
    } else if (words.size() == 2) {
        if (!is_identifier(words[1])) {
            throw error_at(line_number, "invalid state name '" + words[1] + "'");
        }
        result.next_state = words[1];
    }

    if (result.line_op == LineOp::CONTINUE && !result.next_state.empty()) {
        throw error_at(line_number, "'Continue' cannot change state");
    }
    return result;
}

std::string StateMachineTemplate::expand_rule(const std::string& rule, size_t line_number,
                                              std::vector<std::pair<size_t, size_t>>& captures) const {
    std::string expanded;
    size_t groups = 0;

    for (size_t i = 0; i < rule.size();) {
        char c = rule[i];

        if (c == '$') {
            if (i + 1 < rule.size() && rule[i + 1] == '$') {
                expanded += '$';
                i += 2;
                continue;
            }

            std::string value_name;
            size_t next = i + 1;
            if (next < rule.size() && rule[next] == '{') {
                auto close = rule.find('}', next);
                if (close == std::string::npos) {
                    throw error_at(line_number, "unterminated ${...} reference");
                }
                value_name = rule.substr(next + 1, close - next - 1);
                next = close + 1;
            } else {
                while (next < rule.size() &&
                       (std::isalnum(static_cast<unsigned char>(rule[next])) || rule[next] == '_')) {
                    value_name += rule[next++];
                }
            }

            if (value_name.empty()) {
                expanded += '$';
                ++i;
                continue;
            }

            auto it = value_index_.find(value_name);
            if (it == value_index_.end()) {
                throw error_at(line_number, "undefined value '${" + value_name + "}'");
            }
            const auto& value = values_[it->second];
            captures.emplace_back(it->second, groups + 1);
            groups += count_capture_groups(value.pattern);
            expanded += value.pattern;
            i = next;
            continue;
        }

        if (c == '\\') {
            expanded += rule.substr(i, 2);
            i += 2;
            continue;
        }

        if (c == '[') {
            size_t end = skip_char_class(rule, i);
            expanded += rule.substr(i, end - i + 1);
            i = end + 1;
            continue;
        }

        if (c == '(' && (i + 1 >= rule.size() || rule[i + 1] != '?')) {
            ++groups;
        }
        expanded += c;
        ++i;
    }

    return expanded;
}

void StateMachineTemplate::resolve_transitions() {
    for (auto& state : states_) {
        for (auto& rule : state.rules) {
            const std::string& target = rule.action.next_state;
            if (target.empty()) {
                rule.target_state = kStayInState;
            } else if (target == kEndStateName) {
                rule.target_state = kEndState;
            } else {
                auto it = state_index_.find(target);
                if (it == state_index_.end()) {
                    throw error_at(rule.line_number, "transition to undefined state '" + target + "'");
                }
                rule.target_state = it->second;
            }
        }
    }
}

TemplateLoadError StateMachineTemplate::error_at(size_t line_number, const std::string& message) const {
    std::string location = name_;
    if (line_number > 0) {
        location += ":" + std::to_string(line_number);
    }
    return TemplateLoadError(location + ": " + message);
}

bool StateMachineTemplate::has_state(const std::string& state) const {
    return state_index_.count(state) > 0;
}

StateMachineRun StateMachineTemplate::run(const std::string& text) const {
    StateMachineRun result;
    std::vector<ValueSlot> slots(values_.size());
    size_t state = start_state_;
    bool reached_end = false;

    auto lines = split_lines(text);
    for (size_t line_no = 0; line_no < lines.size() && !reached_end; ++line_no) {
        const std::string& line = lines[line_no];
        const auto& rules = states_[state].rules;

        for (const auto& rule : rules) {
            std::smatch match;
            if (!std::regex_search(line, match, rule.regex, std::regex_constants::match_continuous)) {
                continue;
            }

            for (const auto& [value_index, group] : rule.captures) {
                if (group < match.size() && match[group].matched) {
                    assign_value(slots, result.records, value_index, match[group].str());
                }
            }

            if (rule.action.raise_error) {
                result.records.clear();
                result.aborted = true;
                result.error = "Error action at template line " + std::to_string(rule.line_number) +
                               " on input line " + std::to_string(line_no + 1);
                if (!rule.action.error_message.empty()) {
                    result.error += ": " + rule.action.error_message;
                }
                return result;
            }

            switch (rule.action.record_op) {
                case RecordOp::RECORD:
                    append_record(slots, result.records);
                    break;
                case RecordOp::CLEAR:
                    clear_values(slots, false);
                    break;
                case RecordOp::CLEARALL:
                    clear_values(slots, true);
                    break;
                case RecordOp::NO_RECORD:
                    break;
            }

            if (rule.target_state == kEndState) {
                reached_end = true;
                break;
            }
            if (rule.target_state != kStayInState) {
                state = rule.target_state;
            }
            if (rule.action.line_op == LineOp::NEXT) {
                break;
            }
        }
    }

    if (!reached_end && !has_eof_state_) {
        append_record(slots, result.records);
    }
    return result;
}

void StateMachineTemplate::assign_value(std::vector<ValueSlot>& slots, std::vector<ParsedRecord>& records,
                                        size_t index, const std::string& value) const {
    const auto& definition = values_[index];
    auto& slot = slots[index];

    if (has_option(definition.options, ValueOption::LIST)) {
        slot.list.push_back(value);
        return;
    }
    slot.value = value;

    if (has_option(definition.options, ValueOption::FILLUP) && !value.empty()) {
        for (auto it = records.rbegin(); it != records.rend(); ++it) {
            auto& existing = it->values[definition.name];
            if (!existing.empty()) {
                break;
            }
            existing = value;
        }
    }
}

void StateMachineTemplate::append_record(std::vector<ValueSlot>& slots, std::vector<ParsedRecord>& records) const {
    bool all_empty = std::all_of(slots.begin(), slots.end(), [](const ValueSlot& slot) { return slot.empty(); });
    if (all_empty) {
        return;
    }

    for (size_t i = 0; i < values_.size(); ++i) {
        if (has_option(values_[i].options, ValueOption::REQUIRED) && slots[i].empty()) {
            clear_values(slots, false);
            return;
        }
    }

    ParsedRecord record;
    for (size_t i = 0; i < values_.size(); ++i) {
        if (has_option(values_[i].options, ValueOption::LIST)) {
            record.lists[values_[i].name] = slots[i].list;
        } else {
            record.values[values_[i].name] = slots[i].value;
        }
    }
    records.push_back(std::move(record));
    clear_values(slots, false);
}

void StateMachineTemplate::clear_values(std::vector<ValueSlot>& slots, bool include_filldown) const {
    for (size_t i = 0; i < values_.size(); ++i) {
        if (include_filldown || !has_option(values_[i].options, ValueOption::FILLDOWN)) {
            slots[i] = ValueSlot{};
        }
    }
}

} // namespace netmapper::components
