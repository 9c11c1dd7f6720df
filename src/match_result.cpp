#include "match_result.hpp"
#include "errors.hpp"
#include "options.hpp"
#include <algorithm>
#include <utility>

namespace relex {

MatchResult::MatchResult(std::string pattern, std::string subject, bool matched,
                         GroupMap groups, std::optional<PositionMap> positions)
    : pattern_(std::move(pattern)), subject_(std::move(subject)), matched_(matched),
      groups_(std::move(groups)), positions_(std::move(positions)) {}

GroupMap MatchResult::groups_from(const pcre2_regex::Match& match, bool unmatched_as_null) {
    GroupMap groups;
    // Without unmatched-as-null, trailing groups that did not participate are dropped
    // and the others report the empty string
    size_t count = unmatched_as_null ? match.groups.size() : std::min(match.set_count, match.groups.size());
    for (size_t i = 0; i < count; i++) {
        std::optional<std::string> value = match.groups[i];
        if (!value && !unmatched_as_null) value = "";
        if (i < match.group_names.size() && !match.group_names[i].empty()) {
            groups.set(match.group_names[i], value);
        }
        groups.set(static_cast<int>(i), value);
    }
    return groups;
}

PositionMap MatchResult::positions_from(const pcre2_regex::Match& match) {
    PositionMap positions;
    for (size_t i = 0; i < match.groups.size(); i++) {
        int64_t offset = match.groups[i] ? static_cast<int64_t>(match.group_offsets[i].first) : -1;
        Position position = Position::from_offset_capture(match.groups[i], offset);
        if (i < match.group_names.size() && !match.group_names[i].empty()) {
            positions.set(match.group_names[i], position);
        }
        positions.set(static_cast<int>(i), position);
    }
    return positions;
}

MatchResult MatchResult::of(const std::string& pattern, const std::string& subject, int flags, size_t offset) {
    // Always report unmatched groups as null for consistent behavior
    flags |= static_cast<int>(MatchFlag::UnmatchedAsNull);
    bool capture_offsets = options::has_flag(flags, MatchFlag::OffsetCapture);

    std::optional<pcre2_regex::Match> match;
    try {
        match = pcre2_regex::match_first(pattern, subject, offset);
    } catch (const pcre2_regex::regex_error& e) {
        throw match_error::match_failed(pattern, subject, e.what());
    }

    if (!match) {
        return MatchResult(pattern, subject, false);
    }

    std::optional<PositionMap> positions;
    if (capture_offsets) positions = positions_from(*match);
    return MatchResult(pattern, subject, true, groups_from(*match), positions);
}

MatchResult MatchResult::of(const Pattern& pattern, const std::string& subject, int flags, size_t offset) {
    return of(pattern.to_string(), subject, flags, offset);
}

std::optional<std::string> MatchResult::result() const {
    const auto* value = groups_.find(0);
    if (value == nullptr) return std::nullopt;
    return *value;
}

std::string MatchResult::result_or(const std::string& fallback) const {
    return result().value_or(fallback);
}

void MatchResult::throw_group_not_found(const GroupKey& key) const {
    if (auto* index = std::get_if<int>(&key)) {
        throw group_not_found_error::by_index(*index, pattern_);
    }
    throw group_not_found_error::by_name(std::get<std::string>(key), pattern_);
}

std::optional<std::string> MatchResult::group(const GroupKey& key) const {
    const auto* value = groups_.find(key);
    if (value == nullptr) throw_group_not_found(key);
    return *value;
}

std::string MatchResult::group_or(const GroupKey& key, const std::string& fallback) const {
    const auto* value = groups_.find(key);
    if (value == nullptr || !*value) return fallback;
    return **value;
}

bool MatchResult::has_group(const GroupKey& key) const {
    return groups_.contains(key);
}

bool MatchResult::group_matched(const GroupKey& key) const {
    const auto* value = groups_.find(key);
    return value != nullptr && value->has_value();
}

std::optional<Position> MatchResult::position(const GroupKey& key) const {
    if (!positions_) return std::nullopt;

    const auto* position = positions_->find(key);
    if (position == nullptr) throw_group_not_found(key);
    if (!position->is_valid()) return std::nullopt;
    return *position;
}

const MatchResult& MatchResult::when_matched(const std::function<void(const MatchResult&)>& callback) const {
    if (matched_) callback(*this);
    return *this;
}

const MatchResult& MatchResult::when_failed(const std::function<void()>& callback) const {
    if (!matched_) callback();
    return *this;
}

} // namespace relex
