#pragma once
#include <string>
#include <vector>
#include <optional>

namespace relex {

// PCRE pattern modifiers, one canonical character each
enum class Modifier : char {
    CaseInsensitive = 'i',
    Multiline = 'm',
    SingleLine = 's',  // dot matches newlines
    Extended = 'x',    // whitespace ignored, # comments
    Utf8 = 'u',
    Anchored = 'A',
    DollarEndOnly = 'D',
    Ungreedy = 'U',
    DuplicateNames = 'J',
    Study = 'S'
};

namespace modifier {

// All modifiers in canonical order
extern const std::vector<Modifier> all;

char to_char(Modifier m);

// Map a character to its modifier; nullopt for unknown characters
std::optional<Modifier> try_from(char c);

std::string description(Modifier m);

// Concatenate the modifier characters in list order
std::string to_string(const std::vector<Modifier>& modifiers);

// Parse a modifier string; unknown characters are skipped
std::vector<Modifier> from_string(const std::string& text);

} // namespace modifier
} // namespace relex
