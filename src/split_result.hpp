#pragma once
#include "pattern.hpp"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <type_traits>
#include <utility>

namespace relex {

// Segments of a subject split by a pattern. Empty segments are never kept.
class SplitResult {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

    SplitResult(std::string pattern, std::string subject, std::vector<std::string> segments, long limit = -1);

    // limit caps the number of pieces (-1 or 0 = no limit); flags is a SplitFlag
    // mask, NoEmpty is always added. Throws split_error when the engine fails.
    static SplitResult of(const std::string& pattern, const std::string& subject, long limit = -1, int flags = 0);
    static SplitResult of(const Pattern& pattern, const std::string& subject, long limit = -1, int flags = 0);

    // Keep the delimiters between segments. An expression that is not already
    // one capturing group is wrapped in one before compiling.
    static SplitResult with_delimiters(const std::string& pattern, const std::string& subject, long limit = -1);
    static SplitResult with_delimiters(const Pattern& pattern, const std::string& subject, long limit = -1);

    const std::vector<std::string>& results() const { return segments_; }
    std::vector<std::string> to_array() const { return segments_; }

    size_t count() const { return segments_.size(); }
    bool is_empty() const { return segments_.empty(); }
    bool is_not_empty() const { return !segments_.empty(); }

    std::optional<std::string> first() const;
    std::optional<std::string> last() const;
    // nullopt when index is out of range
    std::optional<std::string> get(size_t index) const;

    const_iterator begin() const { return segments_.begin(); }
    const_iterator end() const { return segments_.end(); }

    SplitResult filter(const std::function<bool(const std::string&)>& predicate) const;

    template <typename F>
    auto map(F&& fn) const -> std::vector<std::decay_t<std::invoke_result_t<F, const std::string&>>> {
        std::vector<std::decay_t<std::invoke_result_t<F, const std::string&>>> result;
        result.reserve(segments_.size());
        for (const auto& segment : segments_) result.push_back(fn(segment));
        return result;
    }

    const SplitResult& each(const std::function<void(const std::string&, size_t)>& callback) const;

    std::string join(const std::string& separator = "") const;

    SplitResult take(size_t n) const;
    SplitResult skip(size_t n) const;
    SplitResult reverse() const;
    // First occurrence of each segment, in order
    SplitResult unique() const;

    const std::string& pattern() const { return pattern_; }
    const std::string& subject() const { return subject_; }
    long limit() const { return limit_; }

private:
    SplitResult rebuild(std::vector<std::string> segments) const {
        return SplitResult(pattern_, subject_, std::move(segments), limit_);
    }

    std::string pattern_;
    std::string subject_;
    std::vector<std::string> segments_;
    long limit_;
};

// "/expr/mods" with expr wrapped in a capturing group unless it already is one
std::string ensure_capturing_delimiter(const std::string& pattern);

} // namespace relex
