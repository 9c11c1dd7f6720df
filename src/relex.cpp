#include "relex.hpp"
#include "options.hpp"
#include "pcre2_regex.hpp"
#include "string_utils.hpp"

namespace relex {

MatchResult match(const PatternRef& pattern, const std::string& subject, size_t offset) {
    return MatchResult::of(pattern.str(), subject, 0, offset);
}

MatchResult match_with_offsets(const PatternRef& pattern, const std::string& subject, size_t offset) {
    return MatchResult::of(pattern.str(), subject, static_cast<int>(MatchFlag::OffsetCapture), offset);
}

MatchAllResult match_all(const PatternRef& pattern, const std::string& subject, size_t offset) {
    return MatchAllResult::of(pattern.str(), subject, 0, offset);
}

bool test(const PatternRef& pattern, const std::string& subject, size_t offset) {
    return match(pattern, subject, offset).has_match();
}

ReplaceResult replace(const PatternSet& pattern, const Replacement& replacement,
                      const SubjectSet& subject, long limit) {
    return ReplaceResult::of(pattern, replacement, subject, limit);
}

ReplaceResult replace_first(const PatternRef& pattern, const Replacement& replacement, const std::string& subject) {
    return ReplaceResult::of(pattern.str(), replacement, subject, 1);
}

SplitResult split(const PatternRef& pattern, const std::string& subject, long limit) {
    return SplitResult::of(pattern.str(), subject, limit);
}

SplitResult split_with_delimiters(const PatternRef& pattern, const std::string& subject, long limit) {
    return SplitResult::with_delimiters(pattern.str(), subject, limit);
}

Pattern compile(const std::string& expression, char delimiter) {
    return Pattern::create(expression, delimiter);
}

Pattern pattern(const std::string& pattern) {
    return Pattern::from(pattern);
}

void validate(const std::string& pattern) {
    Pattern::validate(pattern);
}

bool is_valid(const std::string& pattern) {
    return Pattern::is_valid(pattern);
}

std::string escape(const std::string& value, std::optional<char> delimiter) {
    return pcre2_regex::quote(value, delimiter);
}

Pattern any(const std::vector<std::string>& strings, char delimiter) {
    std::vector<std::string> escaped;
    escaped.reserve(strings.size());
    for (const auto& s : strings) escaped.push_back(pcre2_regex::quote(s, delimiter));
    return Pattern::create(string_utils::join(escaped, "|"), delimiter);
}

size_t count(const PatternRef& pattern, const std::string& subject) {
    return match_all(pattern, subject).count();
}

std::vector<std::string> extract(const PatternRef& pattern, const std::string& subject) {
    return match_all(pattern, subject).results();
}

std::vector<std::optional<std::string>> pluck(const PatternRef& pattern, const std::string& subject,
                                              const GroupKey& group) {
    return match_all(pattern, subject).pluck(group);
}

std::vector<std::string> filter(const PatternRef& pattern, const std::vector<std::string>& strings) {
    std::vector<std::string> result;
    for (const auto& s : strings) {
        if (test(pattern, s)) result.push_back(s);
    }
    return result;
}

std::vector<std::string> reject(const PatternRef& pattern, const std::vector<std::string>& strings) {
    std::vector<std::string> result;
    for (const auto& s : strings) {
        if (!test(pattern, s)) result.push_back(s);
    }
    return result;
}

std::optional<std::string> first(const PatternRef& pattern, const std::vector<std::string>& strings) {
    for (const auto& s : strings) {
        if (test(pattern, s)) return s;
    }
    return std::nullopt;
}

} // namespace relex
