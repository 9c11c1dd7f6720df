#pragma once
#include "capture_mode.hpp"
#include "group_table.hpp"
#include "match_result.hpp"
#include "pattern.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>

namespace relex {

// Result of a match-all: every match in subject order, each kept as its raw
// group map (and positions, when offsets were captured) and turned into a
// MatchResult on demand.
class MatchAllResult {
public:
    // Yields a MatchResult view per match
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = MatchResult;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = MatchResult;

        const_iterator(const MatchAllResult* owner, size_t index) : owner_(owner), index_(index) {}

        MatchResult operator*() const { return owner_->view(index_); }
        const_iterator& operator++() {
            ++index_;
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++index_;
            return previous;
        }
        bool operator==(const const_iterator& other) const {
            return owner_ == other.owner_ && index_ == other.index_;
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        const MatchAllResult* owner_;
        size_t index_;
    };

    // positions is either empty or holds one map per match
    MatchAllResult(std::string pattern, std::string subject, std::vector<GroupMap> matches,
                   std::vector<PositionMap> positions = {});

    // flags is a MatchFlag mask; UnmatchedAsNull is always applied and
    // OffsetCapture keeps positions for every match.
    // Throws match_error when the engine fails
    static MatchAllResult of(const std::string& pattern, const std::string& subject, int flags = 0,
                             size_t offset = 0);
    static MatchAllResult of(const Pattern& pattern, const std::string& subject, int flags = 0,
                             size_t offset = 0);

    bool has_match() const { return count_ > 0; }
    bool is_empty() const { return count_ == 0; }
    size_t count() const { return count_; }

    // Group 0 of every match ("" for a match without group 0)
    std::vector<std::string> results() const;

    std::optional<MatchResult> first() const;
    std::optional<MatchResult> last() const;
    // nullopt when index is out of range
    std::optional<MatchResult> get(size_t index) const;
    std::vector<MatchResult> all() const;

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, matches_.size()); }

    // Named groups of every match
    std::vector<GroupMap> named_captures() const;

    // Value of one group across all matches; nullopt where a match lacks it
    std::vector<std::optional<std::string>> pluck(const GroupKey& key) const;

    MatchAllResult filter(const std::function<bool(const MatchResult&)>& predicate) const;

    template <typename F>
    auto map(F&& fn) const -> std::vector<std::decay_t<std::invoke_result_t<F, const MatchResult&>>> {
        std::vector<std::decay_t<std::invoke_result_t<F, const MatchResult&>>> result;
        result.reserve(matches_.size());
        for (size_t i = 0; i < matches_.size(); i++) {
            result.push_back(fn(view(i)));
        }
        return result;
    }

    template <typename T, typename F>
    T reduce(F&& fn, T initial) const {
        T carry = std::move(initial);
        for (size_t i = 0; i < matches_.size(); i++) {
            carry = fn(std::move(carry), view(i));
        }
        return carry;
    }

    const MatchAllResult& each(const std::function<void(const MatchResult&, size_t)>& callback) const;

    MatchAllResult take(size_t n) const;
    MatchAllResult skip(size_t n) const;

    // Re-project every match's groups; CaptureMode::None yields no entries
    MatchAllResult capture(CaptureMode mode) const;

    const std::vector<GroupMap>& matches() const { return matches_; }
    bool has_positions() const { return !positions_.empty(); }
    const std::string& pattern() const { return pattern_; }
    const std::string& subject() const { return subject_; }

private:
    MatchResult view(size_t index) const;
    // Copy of the matches in [from, to)
    MatchAllResult slice(size_t from, size_t to) const;

    std::string pattern_;
    std::string subject_;
    std::vector<GroupMap> matches_;
    std::vector<PositionMap> positions_;
    size_t count_;
};

} // namespace relex
