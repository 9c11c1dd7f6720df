#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <cctype>

namespace relex {
namespace string_utils {

// Check if string starts with prefix
inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Join strings with separator
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

// Number of bytes in the UTF-8 sequence starting with lead byte c
// Stray continuation bytes count as one byte
inline size_t utf8_sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

// Length in UTF-8 characters (like mb_strlen)
inline size_t utf8_length(const std::string& s) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.size()) {
        i += utf8_sequence_length(static_cast<unsigned char>(s[i]));
        count++;
    }
    return count;
}

// Byte offset of the character with index char_index (s.size() when past the end)
inline size_t utf8_byte_offset(const std::string& s, size_t char_index) {
    size_t i = 0;
    while (i < s.size() && char_index > 0) {
        i += utf8_sequence_length(static_cast<unsigned char>(s[i]));
        char_index--;
    }
    return i < s.size() ? i : s.size();
}

// Substring by UTF-8 character index and character count (like mb_substr)
inline std::string utf8_substr(const std::string& s, size_t char_start, size_t char_count) {
    size_t begin = utf8_byte_offset(s, char_start);
    size_t end = begin;
    while (end < s.size() && char_count > 0) {
        end += utf8_sequence_length(static_cast<unsigned char>(s[end]));
        char_count--;
    }
    if (end > s.size()) end = s.size();
    return s.substr(begin, end - begin);
}

// Shorten a string to at most max_chars characters, appending "..." when cut
inline std::string truncate(const std::string& s, size_t max_chars) {
    if (utf8_length(s) <= max_chars) return s;
    return utf8_substr(s, 0, max_chars) + "...";
}

// Make non-printable characters visible
inline std::string make_printable(const std::string& content) {
    std::string result;
    for (unsigned char ch : content) {
        if (std::isprint(ch) || std::isspace(ch) || ch >= 0x80) {
            result += static_cast<char>(ch);
        } else {
            // Format as <0xHH>
            char buf[8];
            std::snprintf(buf, sizeof(buf), "<0x%02x>", ch);
            result += buf;
        }
    }
    return result;
}

} // namespace string_utils
} // namespace relex
