#pragma once
#include "match_result.hpp"
#include "pattern.hpp"
#include <string>
#include <vector>
#include <functional>
#include <type_traits>
#include <utility>

namespace relex {

// One pattern or a list of patterns, given as strings or Pattern objects
class PatternSet {
public:
    PatternSet(const char* pattern) : patterns_{pattern}, list_(false) {}
    PatternSet(const std::string& pattern) : patterns_{pattern}, list_(false) {}
    PatternSet(const Pattern& pattern) : patterns_{pattern.to_string()}, list_(false) {}
    PatternSet(const std::vector<std::string>& patterns) : patterns_(patterns), list_(true) {}
    PatternSet(const std::vector<Pattern>& patterns);

    bool is_list() const { return list_; }
    const std::vector<std::string>& patterns() const { return patterns_; }
    // Patterns joined with ", " for messages
    std::string describe() const;

private:
    std::vector<std::string> patterns_;
    bool list_;
};

// One subject or a list of subjects
class SubjectSet {
public:
    SubjectSet(const char* subject) : subjects_{subject}, list_(false) {}
    SubjectSet(const std::string& subject) : subjects_{subject}, list_(false) {}
    SubjectSet(const std::vector<std::string>& subjects) : subjects_(subjects), list_(true) {}

    bool is_list() const { return list_; }
    const std::vector<std::string>& subjects() const { return subjects_; }
    std::string describe() const { return list_ ? "[array]" : subjects_.front(); }

private:
    std::vector<std::string> subjects_;
    bool list_;
};

using ReplaceCallback = std::function<std::string(const MatchResult&)>;

// Replacement text ($N, ${N} and \N refer to groups), one text per pattern,
// or a callback receiving each match
class Replacement {
public:
    Replacement(const char* text) : texts_{text}, list_(false), is_callback_(false) {}
    Replacement(const std::string& text) : texts_{text}, list_(false), is_callback_(false) {}
    Replacement(const std::vector<std::string>& texts) : texts_(texts), list_(true), is_callback_(false) {}
    Replacement(ReplaceCallback callback) : list_(false), is_callback_(true), callback_(std::move(callback)) {}

    template <typename F, typename = std::enable_if_t<std::is_invocable_r_v<std::string, F, const MatchResult&>>>
    Replacement(F fn) : Replacement(ReplaceCallback(std::move(fn))) {}

    bool is_callback() const { return is_callback_; }
    bool is_list() const { return list_; }
    // Text used for the pattern at index i; "" past the end of a list
    std::string text_for(size_t i) const;
    const std::vector<std::string>& texts() const { return texts_; }
    const ReplaceCallback& callback() const { return callback_; }

private:
    std::vector<std::string> texts_;
    bool list_;
    bool is_callback_;
    ReplaceCallback callback_;
};

// Result of a substitution. A single subject gives one result string; a list
// of subjects gives one result per subject, in the same order.
class ReplaceResult {
public:
    // Patterns are applied in order to every subject; limit caps the
    // replacements per pattern per subject (negative = no limit).
    // Throws replace_error when the engine or the callback fails.
    static ReplaceResult of(const PatternSet& pattern, const Replacement& replacement,
                            const SubjectSet& subject, long limit = -1);

    // The result string; results of a subject list are concatenated
    std::string result() const;
    const std::vector<std::string>& results() const { return results_; }
    std::string to_string() const { return result(); }
    bool is_list() const { return subject_.is_list(); }

    size_t count() const { return count_; }
    bool has_replacements() const { return count_ > 0; }
    bool unchanged() const { return count_ == 0; }

    bool equals(const std::string& expected) const;

    // Run another replacement on this result
    ReplaceResult then(const PatternSet& pattern, const Replacement& replacement, long limit = -1) const;

    std::string pattern() const { return pattern_.describe(); }
    const PatternSet& patterns() const { return pattern_; }
    std::string subject() const { return subject_.describe(); }
    const SubjectSet& subjects() const { return subject_; }
    const Replacement& replacement() const { return replacement_; }

private:
    ReplaceResult(PatternSet pattern, Replacement replacement, SubjectSet subject,
                  std::vector<std::string> results, size_t count);

    PatternSet pattern_;
    Replacement replacement_;
    SubjectSet subject_;
    std::vector<std::string> results_;
    size_t count_;
};

} // namespace relex
