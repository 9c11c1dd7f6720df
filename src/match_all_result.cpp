#include "match_all_result.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "pcre2_regex.hpp"
#include <utility>

namespace relex {

MatchAllResult::MatchAllResult(std::string pattern, std::string subject, std::vector<GroupMap> matches,
                               std::vector<PositionMap> positions)
    : pattern_(std::move(pattern)), subject_(std::move(subject)), matches_(std::move(matches)),
      positions_(std::move(positions)) {
    count_ = matches_.size();
}

MatchAllResult MatchAllResult::of(const std::string& pattern, const std::string& subject, int flags,
                                  size_t offset) {
    // Results are always in set order with unmatched groups as null
    flags |= static_cast<int>(MatchFlag::SetOrder) | static_cast<int>(MatchFlag::UnmatchedAsNull);
    bool capture_offsets = options::has_flag(flags, MatchFlag::OffsetCapture);

    std::vector<pcre2_regex::Match> raw;
    try {
        raw = pcre2_regex::match_all(pattern, subject, offset);
    } catch (const pcre2_regex::regex_error& e) {
        throw match_error::match_all_failed(pattern, subject, e.what());
    }

    std::vector<GroupMap> matches;
    std::vector<PositionMap> positions;
    matches.reserve(raw.size());
    for (const auto& m : raw) {
        matches.push_back(MatchResult::groups_from(m));
        if (capture_offsets) positions.push_back(MatchResult::positions_from(m));
    }
    return MatchAllResult(pattern, subject, std::move(matches), std::move(positions));
}

MatchAllResult MatchAllResult::of(const Pattern& pattern, const std::string& subject, int flags, size_t offset) {
    return of(pattern.to_string(), subject, flags, offset);
}

MatchResult MatchAllResult::view(size_t index) const {
    std::optional<PositionMap> positions;
    if (has_positions()) positions = positions_[index];
    return MatchResult(pattern_, subject_, true, matches_[index], positions);
}

MatchAllResult MatchAllResult::slice(size_t from, size_t to) const {
    std::vector<GroupMap> matches(matches_.begin() + from, matches_.begin() + to);
    std::vector<PositionMap> positions;
    if (has_positions()) positions.assign(positions_.begin() + from, positions_.begin() + to);
    return MatchAllResult(pattern_, subject_, std::move(matches), std::move(positions));
}

std::vector<std::string> MatchAllResult::results() const {
    std::vector<std::string> result;
    result.reserve(matches_.size());
    for (const auto& groups : matches_) {
        const auto* full = groups.find(0);
        result.push_back(full != nullptr && *full ? **full : "");
    }
    return result;
}

std::optional<MatchResult> MatchAllResult::first() const {
    if (matches_.empty()) return std::nullopt;
    return view(0);
}

std::optional<MatchResult> MatchAllResult::last() const {
    if (matches_.empty()) return std::nullopt;
    return view(matches_.size() - 1);
}

std::optional<MatchResult> MatchAllResult::get(size_t index) const {
    if (index >= matches_.size()) return std::nullopt;
    return view(index);
}

std::vector<MatchResult> MatchAllResult::all() const {
    std::vector<MatchResult> result;
    result.reserve(matches_.size());
    for (size_t i = 0; i < matches_.size(); i++) {
        result.push_back(view(i));
    }
    return result;
}

std::vector<GroupMap> MatchAllResult::named_captures() const {
    std::vector<GroupMap> result;
    result.reserve(matches_.size());
    for (const auto& groups : matches_) {
        result.push_back(groups.named());
    }
    return result;
}

std::vector<std::optional<std::string>> MatchAllResult::pluck(const GroupKey& key) const {
    std::vector<std::optional<std::string>> result;
    result.reserve(matches_.size());
    for (const auto& groups : matches_) {
        const auto* value = groups.find(key);
        if (value == nullptr) {
            result.push_back(std::nullopt);
        } else {
            result.push_back(*value);
        }
    }
    return result;
}

MatchAllResult MatchAllResult::filter(const std::function<bool(const MatchResult&)>& predicate) const {
    std::vector<GroupMap> filtered;
    std::vector<PositionMap> positions;
    for (size_t i = 0; i < matches_.size(); i++) {
        if (!predicate(view(i))) continue;
        filtered.push_back(matches_[i]);
        if (has_positions()) positions.push_back(positions_[i]);
    }
    return MatchAllResult(pattern_, subject_, std::move(filtered), std::move(positions));
}

const MatchAllResult& MatchAllResult::each(const std::function<void(const MatchResult&, size_t)>& callback) const {
    for (size_t i = 0; i < matches_.size(); i++) {
        callback(view(i), i);
    }
    return *this;
}

MatchAllResult MatchAllResult::take(size_t n) const {
    size_t end = n < matches_.size() ? n : matches_.size();
    return slice(0, end);
}

MatchAllResult MatchAllResult::skip(size_t n) const {
    size_t begin = n < matches_.size() ? n : matches_.size();
    return slice(begin, matches_.size());
}

MatchAllResult MatchAllResult::capture(CaptureMode mode) const {
    std::vector<GroupMap> projected;
    std::vector<PositionMap> positions;
    switch (mode) {
        case CaptureMode::All:
            projected = matches_;
            positions = positions_;
            break;
        case CaptureMode::First:
            for (size_t i = 0; i < matches_.size(); i++) {
                GroupMap first;
                PositionMap first_position;
                const auto* value = matches_[i].find(1);
                if (value != nullptr && *value) {
                    first.set(1, *value);
                    if (has_positions()) first_position.set(1, *positions_[i].find(1));
                }
                projected.push_back(first);
                if (has_positions()) positions.push_back(first_position);
            }
            break;
        case CaptureMode::AllButFirst:
            for (size_t i = 0; i < matches_.size(); i++) {
                projected.push_back(matches_[i].without(0));
                if (has_positions()) positions.push_back(positions_[i].without(0));
            }
            break;
        case CaptureMode::Named:
            projected = named_captures();
            for (const auto& position : positions_) positions.push_back(position.named());
            break;
        case CaptureMode::None:
            break;
    }
    return MatchAllResult(pattern_, subject_, std::move(projected), std::move(positions));
}

} // namespace relex
