#pragma once
#include "modifier.hpp"
#include <string>
#include <vector>
#include <initializer_list>

namespace relex {

// Immutable regex pattern: expression, delimiter and an ordered set of modifiers.
// Every modifier operation returns a new Pattern.
//
//   auto p = Pattern::create("\\d+").i().m();       // "/\d+/im"
//   auto q = Pattern::from("/\\d+/im");              // p == q
class Pattern {
public:
    // Pattern from a raw expression (without delimiters)
    static Pattern create(const std::string& expression, char delimiter = '/');

    // Pattern from a complete string such as "/\d+/im".
    // Throws pattern_compilation_error when the delimiters are missing.
    static Pattern from(const std::string& pattern);

    // Throws pattern_compilation_error carrying the engine diagnostic
    static void validate(const std::string& pattern);
    static bool is_valid(const std::string& pattern);

    const std::string& expression() const { return expression_; }
    char delimiter() const { return delimiter_; }
    const std::vector<Modifier>& modifiers() const { return modifiers_; }
    std::string modifier_string() const;
    bool has_modifier(Modifier modifier) const;

    // delimiter + expression + delimiter + modifiers
    std::string to_string() const;

    Pattern with_modifier(Modifier modifier) const;
    Pattern with_modifiers(std::initializer_list<Modifier> modifiers) const;
    Pattern with_modifiers(const std::vector<Modifier>& modifiers) const;
    Pattern without_modifier(Modifier modifier) const;

    Pattern case_insensitive() const { return with_modifier(Modifier::CaseInsensitive); }
    Pattern multiline() const { return with_modifier(Modifier::Multiline); }
    Pattern single_line() const { return with_modifier(Modifier::SingleLine); }
    Pattern extended() const { return with_modifier(Modifier::Extended); }
    Pattern utf8() const { return with_modifier(Modifier::Utf8); }
    Pattern anchored() const { return with_modifier(Modifier::Anchored); }
    Pattern dollar_end_only() const { return with_modifier(Modifier::DollarEndOnly); }
    Pattern ungreedy() const { return with_modifier(Modifier::Ungreedy); }
    Pattern duplicate_names() const { return with_modifier(Modifier::DuplicateNames); }
    Pattern study() const { return with_modifier(Modifier::Study); }

    // Shorthands
    Pattern i() const { return case_insensitive(); }
    Pattern m() const { return multiline(); }
    Pattern s() const { return single_line(); }
    Pattern x() const { return extended(); }
    Pattern u() const { return utf8(); }

    // Names of (?<name>...), (?P<name>...) and (?'name'...) groups, first occurrence order.
    // Scans the expression text; the pattern itself is not compiled.
    std::vector<std::string> group_names() const;
    bool has_named_groups() const;

    // Number of capture groups, group 0 excluded
    int group_count() const;

    // Modifier order does not matter
    bool operator==(const Pattern& other) const;
    bool operator!=(const Pattern& other) const { return !(*this == other); }

private:
    Pattern(std::string expression, char delimiter, std::vector<Modifier> modifiers);

    std::string expression_;
    char delimiter_;
    std::vector<Modifier> modifiers_;
};

} // namespace relex
