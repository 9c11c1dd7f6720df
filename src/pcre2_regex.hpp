#pragma once
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace relex {
namespace pcre2_regex {

// Exception for bad patterns and failed engine calls; what() is the engine diagnostic
class regex_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Process-wide match limits applied to every pcre2_match call
struct Limits {
    uint32_t backtrack_limit;
    uint32_t recursion_limit;
};

void set_limits(const Limits& limits);
Limits get_limits();

// RAII wrapper for pcre2_code compiled from a delimited pattern such as "/\d+/i"
class CompiledPattern {
public:
    // Throws regex_error on delimiter, modifier or compilation errors
    explicit CompiledPattern(const std::string& pattern);
    ~CompiledPattern();
    CompiledPattern(const CompiledPattern&) = delete;
    CompiledPattern& operator=(const CompiledPattern&) = delete;

    pcre2_code* code() const { return code_; }
    bool is_utf() const { return utf_; }
    uint32_t capture_count() const { return capture_count_; }
    // Indexed by group number; "" for unnamed groups
    const std::vector<std::string>& group_names() const { return group_names_; }

private:
    pcre2_code* code_;
    bool utf_;
    uint32_t capture_count_;
    std::vector<std::string> group_names_;
};

// A single match result
struct Match {
    size_t start;  // byte offset in subject
    size_t end;    // byte offset past match
    std::string str;  // matched text

    // groups[0] = full match, groups[1] = group 1, ...; nullopt = did not participate
    std::vector<std::optional<std::string>> groups;
    // (start, end) for each group; (npos, npos) when unset
    std::vector<std::pair<size_t, size_t>> group_offsets;
    // group number -> name, "" for unnamed groups
    std::vector<std::string> group_names;
    // Highest participating group + 1
    size_t set_count;
};

// Try compiling a pattern; throws regex_error on failure
void validate_pattern(const std::string& pattern);

// Number of capture groups in the pattern (group 0 excluded)
uint32_t capture_count(const std::string& pattern);

// First match at or after byte offset; nullopt when nothing matches
std::optional<Match> match_first(const std::string& pattern, const std::string& subject, size_t offset = 0);

// All non-overlapping matches at or after byte offset, in subject order
std::vector<Match> match_all(const std::string& pattern, const std::string& subject, size_t offset = 0);

// Expand a replacement string ($1, ${1}, \1, $0 ... $99) using match data
std::string expand_replacement(const std::string& replacement, const Match& match);

struct ReplaceOutcome {
    std::string result;
    size_t count;
};

using ReplaceCallback = std::function<std::string(const Match&)>;

// Replace at most limit matches (negative = no limit)
ReplaceOutcome replace(const std::string& pattern, const std::string& replacement,
                       const std::string& subject, long limit = -1);
ReplaceOutcome replace_callback(const std::string& pattern, const ReplaceCallback& callback,
                                const std::string& subject, long limit = -1);

// Split subject by pattern into at most limit pieces (-1 or 0 = no limit).
// flags is a SplitFlag mask.
std::vector<std::string> split(const std::string& pattern, const std::string& subject,
                               long limit = -1, int flags = 0);

// Escape regex metacharacters (and the optional delimiter) so text matches literally
std::string quote(const std::string& text, std::optional<char> delimiter = std::nullopt);

} // namespace pcre2_regex
} // namespace relex
