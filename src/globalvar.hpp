#pragma once
#include <string>
#include <cstdint>

namespace relex {
namespace globalvar {

// Version info
inline const std::string relex_version = "1.0.0";

// Delimiter used by Pattern::create() and the helpers that build patterns
constexpr char default_delimiter = '/';

// Truncation lengths (in UTF-8 characters) for exception messages
constexpr size_t pattern_display_length = 50;
constexpr size_t subject_display_length = 40;

// Default engine limits (match limit and depth limit)
constexpr uint32_t default_backtrack_limit = 1000000;
constexpr uint32_t default_recursion_limit = 100000;

// Named group syntaxes recognized by Pattern::group_names(): (?<name>, (?P<name>, (?'name'
inline const std::string named_group_scan_pattern = R"(/\(\?(?:P?<|')([a-zA-Z_]\w*)(?:>|')/)";

} // namespace globalvar
} // namespace relex
