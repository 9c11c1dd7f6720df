#include "modifier.hpp"

namespace relex {
namespace modifier {

const std::vector<Modifier> all = {
    Modifier::CaseInsensitive, Modifier::Multiline, Modifier::SingleLine, Modifier::Extended,
    Modifier::Utf8, Modifier::Anchored, Modifier::DollarEndOnly, Modifier::Ungreedy,
    Modifier::DuplicateNames, Modifier::Study
};

char to_char(Modifier m) {
    return static_cast<char>(m);
}

std::optional<Modifier> try_from(char c) {
    for (Modifier m : all) {
        if (to_char(m) == c) return m;
    }
    return std::nullopt;
}

std::string description(Modifier m) {
    switch (m) {
        case Modifier::CaseInsensitive: return "Case-insensitive matching";
        case Modifier::Multiline: return "Multiline mode (^ and $ match line boundaries)";
        case Modifier::SingleLine: return "Single-line mode (dot matches newlines)";
        case Modifier::Extended: return "Extended mode (whitespace ignored, # comments)";
        case Modifier::Utf8: return "UTF-8 mode";
        case Modifier::Anchored: return "Anchored at start of subject";
        case Modifier::DollarEndOnly: return "Dollar matches only at end of string";
        case Modifier::Ungreedy: return "Ungreedy quantifiers by default";
        case Modifier::DuplicateNames: return "Allow duplicate named groups";
        case Modifier::Study: return "Study pattern for optimization";
    }
    return "";
}

std::string to_string(const std::vector<Modifier>& modifiers) {
    std::string result;
    for (Modifier m : modifiers) result += to_char(m);
    return result;
}

std::vector<Modifier> from_string(const std::string& text) {
    std::vector<Modifier> result;
    // Bytes of multi-byte UTF-8 characters are >= 0x80 and never map to a modifier
    for (char c : text) {
        auto m = try_from(c);
        if (!m) continue;
        result.push_back(*m);
    }
    return result;
}

} // namespace modifier
} // namespace relex
