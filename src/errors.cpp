#include "errors.hpp"
#include "globalvar.hpp"
#include "string_utils.hpp"

namespace relex {

static std::string quote_pattern(const std::string& pattern) {
    return "\"" + string_utils::truncate(pattern, globalvar::pattern_display_length) + "\"";
}

// Shorter form used where the subject is shown next to the pattern
static std::string quote_short(const std::string& value) {
    return "\"" + string_utils::truncate(value, globalvar::subject_display_length) + "\"";
}

pattern_compilation_error pattern_compilation_error::invalid_syntax(const std::string& pattern, const std::string& error) {
    return pattern_compilation_error("Invalid regex pattern " + quote_pattern(pattern) + ": " + error);
}

pattern_compilation_error pattern_compilation_error::missing_delimiter(const std::string& pattern) {
    return pattern_compilation_error("Pattern " + quote_pattern(pattern) +
        " is missing delimiters. Expected format: /pattern/modifiers");
}

pattern_compilation_error pattern_compilation_error::invalid_modifier(const std::string& modifier) {
    return pattern_compilation_error("Invalid pattern modifier \"" + string_utils::make_printable(modifier) +
        "\". Valid modifiers are: i, m, s, x, u, A, D, U, J, S");
}

match_error match_error::match_failed(const std::string& pattern, const std::string& subject, const std::string& error) {
    return match_error("Error matching pattern " + quote_short(pattern) +
        " against subject " + quote_short(subject) + ": " + error);
}

match_error match_error::match_all_failed(const std::string& pattern, const std::string& subject, const std::string& error) {
    return match_error("Error matching all occurrences of pattern " + quote_short(pattern) +
        " in subject " + quote_short(subject) + ": " + error);
}

replace_error replace_error::failed(const std::string& pattern, const std::string& subject, const std::string& error) {
    return replace_error("Error replacing pattern " + quote_short(pattern) +
        " in subject " + quote_short(subject) + ": " + error);
}

replace_error replace_error::invalid_callback(const std::string& pattern) {
    return replace_error("Invalid replacement callback provided for pattern " + quote_short(pattern));
}

split_error split_error::failed(const std::string& pattern, const std::string& subject, const std::string& error) {
    return split_error("Error splitting subject " + quote_short(subject) +
        " by pattern " + quote_short(pattern) + ": " + error);
}

group_not_found_error group_not_found_error::by_index(int index, const std::string& pattern) {
    return group_not_found_error("Capture group " + std::to_string(index) +
        " does not exist in pattern " + quote_pattern(pattern));
}

group_not_found_error group_not_found_error::by_name(const std::string& name, const std::string& pattern) {
    return group_not_found_error("Named capture group \"" + name +
        "\" does not exist in pattern " + quote_pattern(pattern));
}

} // namespace relex
