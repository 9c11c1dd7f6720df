#include "position.hpp"
#include "string_utils.hpp"

namespace relex {

Position Position::from_offset_capture(const std::optional<std::string>& text, int64_t offset) {
    if (!text || offset < 0) return Position(-1, 0);
    return Position(offset, static_cast<int64_t>(string_utils::utf8_length(*text)));
}

bool Position::contains(const Position& other) const {
    return start_ <= other.start_ && end() >= other.end();
}

bool Position::overlaps(const Position& other) const {
    return start_ < other.end() && end() > other.start_;
}

std::string Position::extract(const std::string& subject) const {
    if (!is_valid() || length_ <= 0) return "";
    size_t from = static_cast<size_t>(start_);
    if (from >= subject.size()) return "";
    return string_utils::utf8_substr(subject.substr(from), 0, static_cast<size_t>(length_));
}

} // namespace relex
