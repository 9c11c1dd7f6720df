#include "split_result.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "pcre2_regex.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <utility>

namespace relex {

SplitResult::SplitResult(std::string pattern, std::string subject, std::vector<std::string> segments, long limit)
    : pattern_(std::move(pattern)), subject_(std::move(subject)), segments_(std::move(segments)), limit_(limit) {}

// Run the split primitive, reporting failures against the pattern the caller gave
static std::vector<std::string> run_split(const std::string& compiled, const std::string& reported,
                                          const std::string& subject, long limit, int flags) {
    try {
        return pcre2_regex::split(compiled, subject, limit, flags);
    } catch (const pcre2_regex::regex_error& e) {
        throw split_error::failed(reported, subject, e.what());
    }
}

SplitResult SplitResult::of(const std::string& pattern, const std::string& subject, long limit, int flags) {
    flags |= static_cast<int>(SplitFlag::NoEmpty);
    return SplitResult(pattern, subject, run_split(pattern, pattern, subject, limit, flags), limit);
}

SplitResult SplitResult::of(const Pattern& pattern, const std::string& subject, long limit, int flags) {
    return of(pattern.to_string(), subject, limit, flags);
}

SplitResult SplitResult::with_delimiters(const std::string& pattern, const std::string& subject, long limit) {
    // Group 1 spans the whole delimiter once the expression is wrapped
    int flags = options::combine(std::vector<SplitFlag>{SplitFlag::NoEmpty, SplitFlag::DelimCapture,
                                                        SplitFlag::FirstGroupOnly});
    std::string wrapped = ensure_capturing_delimiter(pattern);
    return SplitResult(pattern, subject, run_split(wrapped, pattern, subject, limit, flags), limit);
}

SplitResult SplitResult::with_delimiters(const Pattern& pattern, const std::string& subject, long limit) {
    return with_delimiters(pattern.to_string(), subject, limit);
}

std::optional<std::string> SplitResult::first() const {
    if (segments_.empty()) return std::nullopt;
    return segments_.front();
}

std::optional<std::string> SplitResult::last() const {
    if (segments_.empty()) return std::nullopt;
    return segments_.back();
}

std::optional<std::string> SplitResult::get(size_t index) const {
    if (index >= segments_.size()) return std::nullopt;
    return segments_[index];
}

SplitResult SplitResult::filter(const std::function<bool(const std::string&)>& predicate) const {
    std::vector<std::string> kept;
    for (const auto& segment : segments_) {
        if (predicate(segment)) kept.push_back(segment);
    }
    return rebuild(std::move(kept));
}

const SplitResult& SplitResult::each(const std::function<void(const std::string&, size_t)>& callback) const {
    for (size_t i = 0; i < segments_.size(); i++) callback(segments_[i], i);
    return *this;
}

std::string SplitResult::join(const std::string& separator) const {
    return string_utils::join(segments_, separator);
}

SplitResult SplitResult::take(size_t n) const {
    n = std::min(n, segments_.size());
    return rebuild(std::vector<std::string>(segments_.begin(), segments_.begin() + n));
}

SplitResult SplitResult::skip(size_t n) const {
    n = std::min(n, segments_.size());
    return rebuild(std::vector<std::string>(segments_.begin() + n, segments_.end()));
}

SplitResult SplitResult::reverse() const {
    return rebuild(std::vector<std::string>(segments_.rbegin(), segments_.rend()));
}

SplitResult SplitResult::unique() const {
    std::vector<std::string> kept;
    for (const auto& segment : segments_) {
        if (std::find(kept.begin(), kept.end(), segment) == kept.end()) kept.push_back(segment);
    }
    return rebuild(std::move(kept));
}

// True when a capturing group opens at expression[0]
static bool opens_capturing_group(const std::string& expression) {
    if (expression.empty() || expression[0] != '(') return false;
    if (expression.size() < 2) return true;
    if (expression[1] == '*') return false;  // (*VERB)
    if (expression[1] != '?') return true;
    if (string_utils::starts_with(expression, "(?P<") || string_utils::starts_with(expression, "(?'")) return true;
    // (?<name> captures; (?<= and (?<! are lookbehinds
    return string_utils::starts_with(expression, "(?<") && expression.size() > 3
        && expression[3] != '=' && expression[3] != '!';
}

// Index of the ')' closing the '(' at expression[0]; npos when unbalanced
static size_t group_end(const std::string& expression) {
    int depth = 0;
    bool in_class = false;
    for (size_t i = 0; i < expression.size(); i++) {
        char c = expression[i];
        if (c == '\\') {
            i++;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
            // A ']' right after '[' or '[^' is literal
            if (i + 1 < expression.size() && expression[i + 1] == '^') i++;
            if (i + 1 < expression.size() && expression[i + 1] == ']') i++;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

std::string ensure_capturing_delimiter(const std::string& pattern) {
    if (pattern.size() < 2) return pattern;
    char delimiter = pattern[0];
    char end_delimiter = delimiter;
    switch (delimiter) {
        case '(': end_delimiter = ')'; break;
        case '[': end_delimiter = ']'; break;
        case '{': end_delimiter = '}'; break;
        case '<': end_delimiter = '>'; break;
        default: break;
    }

    size_t last = pattern.rfind(end_delimiter);
    if (last == std::string::npos || last < 1) return pattern;

    std::string expression = pattern.substr(1, last - 1);
    std::string modifiers = pattern.substr(last + 1);

    bool wrapped = opens_capturing_group(expression) && group_end(expression) == expression.size() - 1;
    if (!wrapped) expression = "(" + expression + ")";

    return std::string(1, delimiter) + expression + std::string(1, end_delimiter) + modifiers;
}

} // namespace relex
