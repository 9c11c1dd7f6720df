#pragma once
#include "group_table.hpp"
#include "pattern.hpp"
#include "position.hpp"
#include "pcre2_regex.hpp"
#include <string>
#include <optional>
#include <functional>
#include <type_traits>
#include <utility>

namespace relex {

// Result of a single match: captured groups (indexed and named, unmatched
// groups present as null) and, when offsets were requested, their positions.
class MatchResult {
public:
    MatchResult(std::string pattern, std::string subject, bool matched,
                GroupMap groups = {}, std::optional<PositionMap> positions = std::nullopt);

    // Run the engine's single-match primitive starting at byte offset.
    // flags is a MatchFlag mask; UnmatchedAsNull is always added.
    // Throws match_error when the engine fails ("no match" is not a failure).
    static MatchResult of(const std::string& pattern, const std::string& subject, int flags = 0, size_t offset = 0);
    static MatchResult of(const Pattern& pattern, const std::string& subject, int flags = 0, size_t offset = 0);

    // Group map for one engine match; a named group's name entry precedes its index entry
    static GroupMap groups_from(const pcre2_regex::Match& match, bool unmatched_as_null = true);
    static PositionMap positions_from(const pcre2_regex::Match& match);

    bool has_match() const { return matched_; }
    bool failed() const { return !matched_; }

    // Full match (group 0); nullopt when nothing matched
    std::optional<std::string> result() const;
    std::string result_or(const std::string& fallback) const;

    // Throws group_not_found_error when the pattern has no such group.
    // A group that exists but did not participate yields nullopt.
    std::optional<std::string> group(const GroupKey& key) const;
    std::string group_or(const GroupKey& key, const std::string& fallback) const;
    bool has_group(const GroupKey& key) const;
    bool group_matched(const GroupKey& key) const;

    const GroupMap& groups() const { return groups_; }
    GroupMap named_groups() const { return groups_.named(); }
    GroupMap indexed_groups() const { return groups_.indexed(); }

    // nullopt when offsets were not captured or the group did not participate.
    // Throws group_not_found_error for a key absent from the positions.
    std::optional<Position> position(const GroupKey& key = 0) const;
    const std::optional<PositionMap>& positions() const { return positions_; }

    const std::string& pattern() const { return pattern_; }
    const std::string& subject() const { return subject_; }

    // fn(*this), or nullopt without calling fn when nothing matched
    template <typename F>
    auto map(F&& fn) const -> std::optional<std::decay_t<std::invoke_result_t<F, const MatchResult&>>> {
        if (!matched_) return std::nullopt;
        return std::forward<F>(fn)(*this);
    }

    const MatchResult& when_matched(const std::function<void(const MatchResult&)>& callback) const;
    const MatchResult& when_failed(const std::function<void()>& callback) const;

private:
    [[noreturn]] void throw_group_not_found(const GroupKey& key) const;

    std::string pattern_;
    std::string subject_;
    bool matched_;
    GroupMap groups_;
    std::optional<PositionMap> positions_;
};

} // namespace relex
