#define PCRE2_CODE_UNIT_WIDTH 8
#include "pcre2_regex.hpp"
#include "globalvar.hpp"
#include "options.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>

namespace relex {
namespace pcre2_regex {

// Backtrack limit in the high half, recursion limit in the low half
static constexpr uint64_t pack_limits(uint32_t backtrack, uint32_t recursion) {
    return (static_cast<uint64_t>(backtrack) << 32) | recursion;
}

static std::atomic<uint64_t> engine_limits{
    pack_limits(globalvar::default_backtrack_limit, globalvar::default_recursion_limit)};

void set_limits(const Limits& limits) {
    engine_limits = pack_limits(limits.backtrack_limit, limits.recursion_limit);
}

Limits get_limits() {
    uint64_t packed = engine_limits.load();
    return Limits{static_cast<uint32_t>(packed >> 32), static_cast<uint32_t>(packed & 0xFFFFFFFFu)};
}

// Helper: get PCRE2 error message
static std::string pcre2_error_message(int errorcode) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
    return reinterpret_cast<const char*>(buffer);
}

// Diagnostic for a failed pcre2_match call
static std::string match_error_message(int rc) {
    if (rc == PCRE2_ERROR_MATCHLIMIT) return "Backtrack limit exhausted";
    if (rc == PCRE2_ERROR_DEPTHLIMIT) return "Recursion limit exhausted";
    if (rc == PCRE2_ERROR_JIT_STACKLIMIT) return "JIT stack limit exhausted";
    if (rc == PCRE2_ERROR_BADUTFOFFSET)
        return "The offset did not correspond to the beginning of a valid UTF-8 code point";
    if (rc <= PCRE2_ERROR_UTF8_ERR1 && rc >= PCRE2_ERROR_UTF8_ERR21)
        return "Malformed UTF-8 characters, possibly incorrectly encoded";
    return "Internal error: " + pcre2_error_message(rc);
}

// Expression and compile options split out of a delimited pattern
struct DelimitedPattern {
    std::string expression;
    uint32_t options;
};

// Bracket-style delimiters close with their counterpart
static char closing_delimiter(char delimiter) {
    switch (delimiter) {
        case '(': return ')';
        case '[': return ']';
        case '{': return '}';
        case '<': return '>';
        default: return delimiter;
    }
}

static DelimitedPattern parse_delimited(const std::string& pattern) {
    size_t p = 0;
    while (p < pattern.size() && std::isspace(static_cast<unsigned char>(pattern[p]))) p++;
    if (p >= pattern.size()) {
        throw regex_error("Empty regular expression");
    }

    char delimiter = pattern[p];
    if (std::isalnum(static_cast<unsigned char>(delimiter)) || delimiter == '\\' || delimiter == '\0') {
        throw regex_error("Delimiter must not be alphanumeric, backslash, or NUL byte");
    }
    p++;
    size_t start = p;

    char end_delimiter = closing_delimiter(delimiter);

    if (end_delimiter == delimiter) {
        // Scan for the closing delimiter, skipping escaped characters
        while (p < pattern.size()) {
            if (pattern[p] == '\\' && p + 1 < pattern.size()) {
                p += 2;
                continue;
            }
            if (pattern[p] == delimiter) break;
            p++;
        }
        if (p >= pattern.size()) {
            throw regex_error(std::string("No ending delimiter '") + delimiter + "' found");
        }
    } else {
        // Bracket delimiters nest
        int depth = 1;
        while (p < pattern.size()) {
            if (pattern[p] == '\\' && p + 1 < pattern.size()) {
                p += 2;
                continue;
            }
            if (pattern[p] == end_delimiter && --depth <= 0) break;
            if (pattern[p] == delimiter) depth++;
            p++;
        }
        if (p >= pattern.size()) {
            throw regex_error(std::string("No ending matching delimiter '") + end_delimiter + "' found");
        }
    }

    DelimitedPattern result{pattern.substr(start, p - start), 0};
    for (p = p + 1; p < pattern.size(); p++) {
        switch (pattern[p]) {
            case 'i': result.options |= PCRE2_CASELESS; break;
            case 'm': result.options |= PCRE2_MULTILINE; break;
            case 's': result.options |= PCRE2_DOTALL; break;
            case 'x': result.options |= PCRE2_EXTENDED; break;
            case 'u': result.options |= PCRE2_UTF | PCRE2_UCP; break;
            case 'A': result.options |= PCRE2_ANCHORED; break;
            case 'D': result.options |= PCRE2_DOLLAR_ENDONLY; break;
            case 'U': result.options |= PCRE2_UNGREEDY; break;
            case 'J': result.options |= PCRE2_DUPNAMES; break;
            case 'n': result.options |= PCRE2_NO_AUTO_CAPTURE; break;
            // Study and extra are no-ops with PCRE2
            case 'S': case 'X': break;
            case ' ': case '\n': case '\r': break;
            case 'e':
                throw regex_error("The /e modifier is no longer supported, use a replacement callback instead");
            default:
                throw regex_error("Unknown modifier '" +
                    string_utils::make_printable(std::string(1, pattern[p])) + "'");
        }
    }
    return result;
}

// Extract group names from compiled pattern, indexed by group number
static std::vector<std::string> extract_group_names(pcre2_code* code, uint32_t capture_count) {
    std::vector<std::string> names(capture_count + 1);
    uint32_t namecount = 0;
    pcre2_pattern_info(code, PCRE2_INFO_NAMECOUNT, &namecount);
    if (namecount > 0) {
        PCRE2_SPTR nametable;
        uint32_t nameentrysize;
        pcre2_pattern_info(code, PCRE2_INFO_NAMETABLE, &nametable);
        pcre2_pattern_info(code, PCRE2_INFO_NAMEENTRYSIZE, &nameentrysize);
        for (uint32_t i = 0; i < namecount; i++) {
            PCRE2_SPTR entry = nametable + i * nameentrysize;
            uint32_t group_num = (entry[0] << 8) | entry[1];
            if (group_num < names.size()) {
                names[group_num] = reinterpret_cast<const char*>(entry + 2);
            }
        }
    }
    return names;
}

CompiledPattern::CompiledPattern(const std::string& pattern) : code_(nullptr), utf_(false), capture_count_(0) {
    DelimitedPattern parsed = parse_delimited(pattern);

    int errorcode;
    PCRE2_SIZE erroroffset;
    code_ = pcre2_compile(
        reinterpret_cast<PCRE2_SPTR>(parsed.expression.c_str()),
        parsed.expression.size(),
        parsed.options,
        &errorcode, &erroroffset, nullptr);
    if (code_ == nullptr) {
        throw regex_error("Compilation failed: " + pcre2_error_message(errorcode) +
                          " at offset " + std::to_string(erroroffset));
    }
    utf_ = (parsed.options & PCRE2_UTF) != 0;
    pcre2_pattern_info(code_, PCRE2_INFO_CAPTURECOUNT, &capture_count_);
    group_names_ = extract_group_names(code_, capture_count_);
}

CompiledPattern::~CompiledPattern() {
    if (code_) pcre2_code_free(code_);
}

// RAII wrapper for pcre2_match_data
struct MatchData {
    pcre2_match_data* data;
    explicit MatchData(const CompiledPattern& cp)
        : data(pcre2_match_data_create_from_pattern(cp.code(), nullptr)) {
        if (data == nullptr) throw regex_error("Internal error: failed to allocate match data");
    }
    ~MatchData() { pcre2_match_data_free(data); }
    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;
};

// RAII wrapper for pcre2_match_context carrying the current limits
struct MatchContext {
    pcre2_match_context* context;
    MatchContext() : context(pcre2_match_context_create(nullptr)) {
        if (context == nullptr) throw regex_error("Internal error: failed to allocate match context");
        Limits limits = get_limits();
        pcre2_set_match_limit(context, limits.backtrack_limit);
        pcre2_set_depth_limit(context, limits.recursion_limit);
    }
    ~MatchContext() { pcre2_match_context_free(context); }
    MatchContext(const MatchContext&) = delete;
    MatchContext& operator=(const MatchContext&) = delete;
};

static Match build_match(const CompiledPattern& cp, const MatchData& md, int rc,
                         const std::string& subject) {
    Match m;
    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(md.data);
    uint32_t count = pcre2_get_ovector_count(md.data);

    m.start = ovector[0];
    m.end = ovector[1] < ovector[0] ? ovector[0] : ovector[1];
    m.str = subject.substr(m.start, m.end - m.start);
    m.set_count = static_cast<size_t>(rc);

    for (uint32_t i = 0; i < count; i++) {
        if (i >= static_cast<uint32_t>(rc) || ovector[2 * i] == PCRE2_UNSET) {
            m.groups.push_back(std::nullopt);
            m.group_offsets.push_back({std::string::npos, std::string::npos});
        } else {
            size_t s = ovector[2 * i];
            size_t e = ovector[2 * i + 1];
            if (e < s) e = s;
            m.groups.push_back(subject.substr(s, e - s));
            m.group_offsets.push_back({s, e});
        }
    }

    m.group_names = cp.group_names();
    m.group_names.resize(m.groups.size());
    return m;
}

// Walks the matches of a pattern through a subject the way Perl's /g does:
// after an empty match, retry at the same offset with PCRE2_NOTEMPTY_ATSTART,
// and only advance one character when that fails.
class MatchIterator {
public:
    MatchIterator(const CompiledPattern& cp, const std::string& subject, size_t offset)
        : cp_(cp), subject_(subject), md_(cp), start_(offset), options_(0), utf_check_(0) {
        if (offset > subject.size()) {
            throw regex_error("Internal error: offset " + std::to_string(offset) +
                              " exceeds subject length " + std::to_string(subject.size()));
        }
    }

    // Advance to the next match; false when there are no more
    bool next() {
        while (true) {
            int rc = pcre2_match(cp_.code(),
                                 reinterpret_cast<PCRE2_SPTR>(subject_.c_str()),
                                 subject_.size(), start_, options_ | utf_check_, md_.data,
                                 mctx_.context);
            // The subject was validated by the first call; later offsets are code point boundaries
            if (cp_.is_utf() && (rc >= 0 || rc == PCRE2_ERROR_NOMATCH)) {
                utf_check_ = PCRE2_NO_UTF_CHECK;
            }
            if (rc == PCRE2_ERROR_NOMATCH) {
                if (options_ != 0 && start_ < subject_.size()) {
                    start_ += unit_length(start_);
                    options_ = 0;
                    continue;
                }
                return false;
            }
            if (rc < 0) throw regex_error(match_error_message(rc));
            if (rc == 0) throw regex_error("Internal error: match data too small");

            current_ = build_match(cp_, md_, rc, subject_);
            start_ = current_.end;
            options_ = (current_.end == current_.start) ? (PCRE2_NOTEMPTY_ATSTART | PCRE2_ANCHORED) : 0;
            return true;
        }
    }

    const Match& current() const { return current_; }

private:
    size_t unit_length(size_t pos) const {
        if (!cp_.is_utf()) return 1;
        size_t len = string_utils::utf8_sequence_length(static_cast<unsigned char>(subject_[pos]));
        return pos + len > subject_.size() ? subject_.size() - pos : len;
    }

    const CompiledPattern& cp_;
    const std::string& subject_;
    MatchData md_;
    MatchContext mctx_;
    size_t start_;
    uint32_t options_;
    uint32_t utf_check_;
    Match current_;
};

void validate_pattern(const std::string& pattern) {
    CompiledPattern cp(pattern);
    // Zero-length trial match surfaces errors that only show at match time
    MatchData md(cp);
    MatchContext mctx;
    int rc = pcre2_match(cp.code(), reinterpret_cast<PCRE2_SPTR>(""), 0, 0, 0, md.data, mctx.context);
    if (rc < 0 && rc != PCRE2_ERROR_NOMATCH) {
        throw regex_error(match_error_message(rc));
    }
}

uint32_t capture_count(const std::string& pattern) {
    CompiledPattern cp(pattern);
    return cp.capture_count();
}

std::optional<Match> match_first(const std::string& pattern, const std::string& subject, size_t offset) {
    CompiledPattern cp(pattern);
    MatchIterator it(cp, subject, offset);
    if (!it.next()) return std::nullopt;
    return it.current();
}

std::vector<Match> match_all(const std::string& pattern, const std::string& subject, size_t offset) {
    CompiledPattern cp(pattern);
    MatchIterator it(cp, subject, offset);

    std::vector<Match> results;
    while (it.next()) {
        results.push_back(it.current());
    }
    return results;
}

// Parse a backreference at replacement[pos] ('\' or '$' followed by one or two
// digits, or "${N}"/"${NN}"). Returns the number of characters consumed, 0 if none.
static size_t parse_backref(const std::string& replacement, size_t pos, int& backref) {
    size_t p = pos;
    if (p + 1 >= replacement.size()) return 0;

    bool in_brace = false;
    if (replacement[p] == '$' && replacement[p + 1] == '{') {
        in_brace = true;
        p++;
    }
    p++;

    if (p < replacement.size() && std::isdigit(static_cast<unsigned char>(replacement[p]))) {
        backref = replacement[p] - '0';
        p++;
    } else {
        return 0;
    }
    if (p < replacement.size() && std::isdigit(static_cast<unsigned char>(replacement[p]))) {
        backref = backref * 10 + (replacement[p] - '0');
        p++;
    }

    if (in_brace) {
        if (p >= replacement.size() || replacement[p] != '}') return 0;
        p++;
    }
    return p - pos;
}

std::string expand_replacement(const std::string& replacement, const Match& match) {
    std::string result;
    char walk_last = 0;
    size_t i = 0;
    while (i < replacement.size()) {
        char c = replacement[i];
        if (c == '\\' || c == '$') {
            if (walk_last == '\\') {
                // Escaped: this character replaces the backslash before it
                result.back() = c;
                walk_last = 0;
                i++;
                continue;
            }
            int backref = 0;
            size_t consumed = parse_backref(replacement, i, backref);
            if (consumed > 0) {
                // Groups that did not participate or do not exist expand to nothing
                if (backref < static_cast<int>(match.groups.size()) && match.groups[backref]) {
                    result += *match.groups[backref];
                }
                i += consumed;
                walk_last = replacement[i - 1];
                continue;
            }
        }
        result += c;
        walk_last = c;
        i++;
    }
    return result;
}

static ReplaceOutcome replace_matches(const std::string& pattern, const std::string& subject, long limit,
                                      const ReplaceCallback& substitute) {
    CompiledPattern cp(pattern);
    MatchIterator it(cp, subject, 0);

    ReplaceOutcome outcome{"", 0};
    size_t last = 0;
    long remaining = limit;
    while (remaining != 0 && it.next()) {
        const Match& m = it.current();
        outcome.result.append(subject, last, m.start - last);
        outcome.result += substitute(m);
        last = m.end;
        outcome.count++;
        if (remaining > 0) remaining--;
    }
    outcome.result.append(subject, last, std::string::npos);
    return outcome;
}

ReplaceOutcome replace(const std::string& pattern, const std::string& replacement,
                       const std::string& subject, long limit) {
    return replace_matches(pattern, subject, limit, [&replacement](const Match& m) {
        return expand_replacement(replacement, m);
    });
}

ReplaceOutcome replace_callback(const std::string& pattern, const ReplaceCallback& callback,
                                const std::string& subject, long limit) {
    return replace_matches(pattern, subject, limit, callback);
}

std::vector<std::string> split(const std::string& pattern, const std::string& subject,
                               long limit, int flags) {
    bool no_empty = options::has_flag(flags, SplitFlag::NoEmpty);
    bool delim_capture = options::has_flag(flags, SplitFlag::DelimCapture);
    bool first_group_only = options::has_flag(flags, SplitFlag::FirstGroupOnly);
    if (limit == 0) limit = -1;

    CompiledPattern cp(pattern);
    MatchIterator it(cp, subject, 0);

    std::vector<std::string> pieces;
    size_t last = 0;
    while ((limit == -1 || limit > 1) && it.next()) {
        const Match& m = it.current();
        if (m.start < last) break;

        if (!no_empty || m.start != last) {
            pieces.push_back(subject.substr(last, m.start - last));
            // One less left to do
            if (limit != -1) limit--;
        }

        if (delim_capture) {
            size_t group_limit = first_group_only ? std::min<size_t>(m.set_count, 2) : m.set_count;
            for (size_t i = 1; i < group_limit && i < m.groups.size(); i++) {
                const auto& group = m.groups[i];
                if (!no_empty || (group && !group->empty())) {
                    pieces.push_back(group ? *group : "");
                }
            }
        }

        last = m.end;
    }

    if (!no_empty || last < subject.size()) {
        pieces.push_back(subject.substr(last));
    }
    return pieces;
}

std::string quote(const std::string& text, std::optional<char> delimiter) {
    static const std::string special = ".\\+*?[^]$(){}=!<>|:-#";
    std::string result;
    for (char c : text) {
        if (c == '\0') {
            result += "\\000";
            continue;
        }
        if (special.find(c) != std::string::npos || (delimiter && c == *delimiter)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

} // namespace pcre2_regex
} // namespace relex
