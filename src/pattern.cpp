#include "pattern.hpp"
#include "errors.hpp"
#include "globalvar.hpp"
#include "pcre2_regex.hpp"
#include <algorithm>
#include <utility>

namespace relex {

Pattern::Pattern(std::string expression, char delimiter, std::vector<Modifier> modifiers)
    : expression_(std::move(expression)), delimiter_(delimiter), modifiers_(std::move(modifiers)) {}

Pattern Pattern::create(const std::string& expression, char delimiter) {
    return Pattern(expression, delimiter, {});
}

Pattern Pattern::from(const std::string& pattern) {
    if (pattern.size() < 2) {
        throw pattern_compilation_error::missing_delimiter(pattern);
    }

    char delimiter = pattern[0];
    size_t last_delimiter_pos = pattern.rfind(delimiter);
    if (last_delimiter_pos == std::string::npos || last_delimiter_pos < 1) {
        throw pattern_compilation_error::missing_delimiter(pattern);
    }

    std::string expression = pattern.substr(1, last_delimiter_pos - 1);
    std::string modifier_text = pattern.substr(last_delimiter_pos + 1);
    return create(expression, delimiter).with_modifiers(modifier::from_string(modifier_text));
}

void Pattern::validate(const std::string& pattern) {
    try {
        pcre2_regex::validate_pattern(pattern);
    } catch (const pcre2_regex::regex_error& e) {
        throw pattern_compilation_error::invalid_syntax(pattern, e.what());
    }
}

bool Pattern::is_valid(const std::string& pattern) {
    try {
        validate(pattern);
        return true;
    } catch (const pattern_compilation_error&) {
        return false;
    }
}

std::string Pattern::modifier_string() const {
    return modifier::to_string(modifiers_);
}

bool Pattern::has_modifier(Modifier modifier) const {
    return std::find(modifiers_.begin(), modifiers_.end(), modifier) != modifiers_.end();
}

std::string Pattern::to_string() const {
    return std::string(1, delimiter_) + expression_ + delimiter_ + modifier_string();
}

Pattern Pattern::with_modifier(Modifier modifier) const {
    if (has_modifier(modifier)) return *this;
    auto modifiers = modifiers_;
    modifiers.push_back(modifier);
    return Pattern(expression_, delimiter_, modifiers);
}

Pattern Pattern::with_modifiers(std::initializer_list<Modifier> modifiers) const {
    return with_modifiers(std::vector<Modifier>(modifiers));
}

Pattern Pattern::with_modifiers(const std::vector<Modifier>& modifiers) const {
    auto result = modifiers_;
    for (Modifier m : modifiers) {
        if (std::find(result.begin(), result.end(), m) != result.end()) continue;
        result.push_back(m);
    }
    return Pattern(expression_, delimiter_, result);
}

Pattern Pattern::without_modifier(Modifier modifier) const {
    std::vector<Modifier> result;
    for (Modifier m : modifiers_) {
        if (m != modifier) result.push_back(m);
    }
    return Pattern(expression_, delimiter_, result);
}

std::vector<std::string> Pattern::group_names() const {
    std::vector<std::string> names;
    for (const auto& m : pcre2_regex::match_all(globalvar::named_group_scan_pattern, expression_)) {
        const std::string& name = *m.groups[1];
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

bool Pattern::has_named_groups() const {
    return !group_names().empty();
}

int Pattern::group_count() const {
    std::string pattern = to_string();
    try {
        // Trial match against the empty subject compiles the pattern and sizes its capture slots
        auto trial = pcre2_regex::match_first(pattern, "");
        if (trial) return static_cast<int>(trial->groups.size()) - 1;
        return static_cast<int>(pcre2_regex::capture_count(pattern));
    } catch (const pcre2_regex::regex_error& e) {
        throw pattern_compilation_error::invalid_syntax(pattern, e.what());
    }
}

bool Pattern::operator==(const Pattern& other) const {
    if (expression_ != other.expression_ || delimiter_ != other.delimiter_) return false;
    if (modifiers_.size() != other.modifiers_.size()) return false;
    for (Modifier m : modifiers_) {
        if (!other.has_modifier(m)) return false;
    }
    return true;
}

} // namespace relex
