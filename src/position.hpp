#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace relex {

// A captured range inside a subject: byte offset of the start plus length.
// start == -1 marks a group that did not participate in the match.
class Position {
public:
    Position(int64_t start, int64_t length) : start_(start), length_(length) {}

    // Build from an offset-capture pair; a missing text gives an invalid position
    static Position from_offset_capture(const std::optional<std::string>& text, int64_t offset);

    int64_t start() const { return start_; }
    int64_t length() const { return length_; }
    int64_t end() const { return start_ + length_; }

    bool is_valid() const { return start_ >= 0; }

    bool contains(const Position& other) const;
    bool overlaps(const Position& other) const;

    // Substring of subject covered by this position. start is a byte offset
    // (as reported by matching) and length counts UTF-8 characters.
    std::string extract(const std::string& subject) const;

    bool operator==(const Position& other) const {
        return start_ == other.start_ && length_ == other.length_;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }

private:
    int64_t start_;
    int64_t length_;
};

} // namespace relex
