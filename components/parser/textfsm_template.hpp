#pragma once

#include "netmapper/discovery_interface.hpp"
#include <cstdint>
#include <limits>
#include <regex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace netmapper::components {

// Capture-kind annotations on a template value
enum class ValueOption : uint8_t {
    NONE = 0,
    REQUIRED = 1 << 0,
    FILLDOWN = 1 << 1,
    LIST = 1 << 2,
    KEY = 1 << 3,
    FILLUP = 1 << 4
};

inline ValueOption operator|(ValueOption a, ValueOption b) {
    return static_cast<ValueOption>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_option(ValueOption options, ValueOption flag) {
    return (static_cast<uint8_t>(options) & static_cast<uint8_t>(flag)) != 0;
}

enum class LineOp {
    NEXT,       // Advance to the next input line
    CONTINUE    // Keep matching the same line against the following rules
};

enum class RecordOp {
    NO_RECORD,
    RECORD,     // Flush captured values as one row, then clear non-Filldown values
    CLEAR,      // Clear non-Filldown values
    CLEARALL    // Clear every value
};

struct ValueDefinition {
    std::string name;
    std::string pattern;
    ValueOption options = ValueOption::NONE;
};

struct RuleAction {
    LineOp line_op = LineOp::NEXT;
    RecordOp record_op = RecordOp::NO_RECORD;
    std::string next_state;             // Empty keeps the current state
    bool raise_error = false;
    std::string error_message;
};

struct StateRule {
    std::string source;
    std::regex regex;
    std::vector<std::pair<size_t, size_t>> captures;    // value index, capture group
    RuleAction action;
    size_t target_state = 0;
    size_t line_number = 0;
};

struct TemplateState {
    std::string name;
    std::vector<StateRule> rules;
};

struct StateMachineRun {
    std::vector<ParsedRecord> records;
    bool aborted = false;
    std::string error;
};

// Compiled state-machine template. Loading validates the whole template and
// throws TemplateLoadError; running never throws on device output.
class StateMachineTemplate {
public:
    static constexpr size_t kStayInState = std::numeric_limits<size_t>::max();
    static constexpr size_t kEndState = std::numeric_limits<size_t>::max() - 1;

    static StateMachineTemplate compile(const std::string& name, const std::string& source);

    StateMachineRun run(const std::string& text) const;

    const std::string& name() const { return name_; }
    const std::vector<ValueDefinition>& values() const { return values_; }
    const std::vector<TemplateState>& states() const { return states_; }
    bool has_state(const std::string& state) const;

    // Capturing groups in a regex fragment, skipping escapes, classes and (?...)
    static size_t count_capture_groups(const std::string& pattern);

private:
    struct ValueSlot {
        std::string value;
        std::vector<std::string> list;

        bool empty() const { return value.empty() && list.empty(); }
    };

    StateMachineTemplate() = default;

    void parse_value_line(const std::string& line, size_t line_number);
    void parse_rule_line(size_t state, const std::string& line, size_t line_number);
    RuleAction parse_action(const std::string& action, size_t line_number) const;
    std::string expand_rule(const std::string& rule, size_t line_number,
                            std::vector<std::pair<size_t, size_t>>& captures) const;
    void resolve_transitions();
    TemplateLoadError error_at(size_t line_number, const std::string& message) const;

    void assign_value(std::vector<ValueSlot>& slots, std::vector<ParsedRecord>& records,
                      size_t index, const std::string& value) const;
    void append_record(std::vector<ValueSlot>& slots, std::vector<ParsedRecord>& records) const;
    void clear_values(std::vector<ValueSlot>& slots, bool include_filldown) const;

    std::string name_;
    std::vector<ValueDefinition> values_;
    std::unordered_map<std::string, size_t> value_index_;
    std::vector<TemplateState> states_;
    std::unordered_map<std::string, size_t> state_index_;
    size_t start_state_ = 0;
    bool has_eof_state_ = false;
};

} // namespace netmapper::components
