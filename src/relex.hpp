#pragma once
#include "errors.hpp"
#include "match_all_result.hpp"
#include "match_result.hpp"
#include "pattern.hpp"
#include "replace_result.hpp"
#include "split_result.hpp"
#include <string>
#include <vector>
#include <optional>

namespace relex {

// A single pattern given as a complete string ("/\d+/i") or as a Pattern
class PatternRef {
public:
    PatternRef(const char* pattern) : text_(pattern) {}
    PatternRef(const std::string& pattern) : text_(pattern) {}
    PatternRef(const Pattern& pattern) : text_(pattern.to_string()) {}

    const std::string& str() const { return text_; }

private:
    std::string text_;
};

// First match at or after byte offset
MatchResult match(const PatternRef& pattern, const std::string& subject, size_t offset = 0);
// Like match, with a Position for every group
MatchResult match_with_offsets(const PatternRef& pattern, const std::string& subject, size_t offset = 0);
MatchAllResult match_all(const PatternRef& pattern, const std::string& subject, size_t offset = 0);
bool test(const PatternRef& pattern, const std::string& subject, size_t offset = 0);

ReplaceResult replace(const PatternSet& pattern, const Replacement& replacement,
                      const SubjectSet& subject, long limit = -1);
ReplaceResult replace_first(const PatternRef& pattern, const Replacement& replacement, const std::string& subject);

SplitResult split(const PatternRef& pattern, const std::string& subject, long limit = -1);
SplitResult split_with_delimiters(const PatternRef& pattern, const std::string& subject, long limit = -1);

Pattern compile(const std::string& expression, char delimiter = '/');
Pattern pattern(const std::string& pattern);
void validate(const std::string& pattern);
bool is_valid(const std::string& pattern);

// Escape text for literal use inside a pattern; the delimiter is escaped too
std::string escape(const std::string& value, std::optional<char> delimiter = '/');
// Pattern matching any of the given literal strings
Pattern any(const std::vector<std::string>& strings, char delimiter = '/');

size_t count(const PatternRef& pattern, const std::string& subject);
std::vector<std::string> extract(const PatternRef& pattern, const std::string& subject);
std::vector<std::optional<std::string>> pluck(const PatternRef& pattern, const std::string& subject,
                                              const GroupKey& group);

// Strings that match (filter) or do not match (reject), order preserved
std::vector<std::string> filter(const PatternRef& pattern, const std::vector<std::string>& strings);
std::vector<std::string> reject(const PatternRef& pattern, const std::vector<std::string>& strings);
std::optional<std::string> first(const PatternRef& pattern, const std::vector<std::string>& strings);

} // namespace relex
