#include "replace_result.hpp"
#include "errors.hpp"
#include "pcre2_regex.hpp"
#include "string_utils.hpp"

namespace relex {

PatternSet::PatternSet(const std::vector<Pattern>& patterns) : list_(true) {
    for (const auto& p : patterns) patterns_.push_back(p.to_string());
}

std::string PatternSet::describe() const {
    return string_utils::join(patterns_, ", ");
}

std::string Replacement::text_for(size_t i) const {
    if (!list_) return texts_.empty() ? "" : texts_.front();
    return i < texts_.size() ? texts_[i] : "";
}

ReplaceResult::ReplaceResult(PatternSet pattern, Replacement replacement, SubjectSet subject,
                             std::vector<std::string> results, size_t count)
    : pattern_(std::move(pattern)), replacement_(std::move(replacement)), subject_(std::move(subject)),
      results_(std::move(results)), count_(count) {}

ReplaceResult ReplaceResult::of(const PatternSet& pattern, const Replacement& replacement,
                                const SubjectSet& subject, long limit) {
    if (replacement.is_list() && !pattern.is_list()) {
        throw replace_error::failed(pattern.describe(), subject.describe(),
            "Parameter mismatch, pattern is a string while replacement is an array");
    }
    if (replacement.is_callback() && !replacement.callback()) {
        throw replace_error::invalid_callback(pattern.describe());
    }

    std::vector<std::string> results;
    size_t count = 0;

    try {
        for (const auto& input : subject.subjects()) {
            std::string current = input;
            const auto& patterns = pattern.patterns();
            for (size_t i = 0; i < patterns.size(); i++) {
                const std::string& p = patterns[i];
                pcre2_regex::ReplaceOutcome outcome;
                if (replacement.is_callback()) {
                    // Hand every match to the callback as a MatchResult
                    const std::string& pass_subject = current;
                    const ReplaceCallback& callback = replacement.callback();
                    outcome = pcre2_regex::replace_callback(p, [&](const pcre2_regex::Match& m) {
                        return callback(MatchResult(p, pass_subject, true, MatchResult::groups_from(m)));
                    }, current, limit);
                } else {
                    outcome = pcre2_regex::replace(p, replacement.text_for(i), current, limit);
                }
                current = std::move(outcome.result);
                count += outcome.count;
            }
            results.push_back(std::move(current));
        }
    } catch (const std::exception& e) {
        // Engine failures and exceptions thrown by the callback alike
        throw replace_error::failed(pattern.describe(), subject.describe(), e.what());
    }

    return ReplaceResult(pattern, replacement, subject, std::move(results), count);
}

std::string ReplaceResult::result() const {
    if (subject_.is_list()) return string_utils::join(results_, "");
    return results_.empty() ? "" : results_.front();
}

bool ReplaceResult::equals(const std::string& expected) const {
    return !subject_.is_list() && result() == expected;
}

ReplaceResult ReplaceResult::then(const PatternSet& pattern, const Replacement& replacement, long limit) const {
    if (subject_.is_list()) return of(pattern, replacement, SubjectSet(results_), limit);
    return of(pattern, replacement, SubjectSet(result()), limit);
}

} // namespace relex
