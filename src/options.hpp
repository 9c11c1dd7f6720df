#pragma once
#include <string>
#include <vector>

namespace relex {

// Flags for match and match-all requests
// Bit values, OR-able into one mask
enum class MatchFlag : int {
    PatternOrder = 1,      // group results by capture group
    SetOrder = 2,          // group results by match occurrence
    OffsetCapture = 256,   // report byte offsets along with matched text
    UnmatchedAsNull = 512  // non-participating groups are null, not ""
};

// Flags for split requests
enum class SplitFlag : int {
    NoEmpty = 1,        // drop zero-length segments
    DelimCapture = 2,   // keep captured delimiter groups in the output
    FirstGroupOnly = 4  // with DelimCapture, keep only capture group 1
};

namespace options {

// OR a list of flags into one mask
inline int combine(const std::vector<MatchFlag>& flags) {
    int mask = 0;
    for (MatchFlag flag : flags) mask |= static_cast<int>(flag);
    return mask;
}

inline int combine(const std::vector<SplitFlag>& flags) {
    int mask = 0;
    for (SplitFlag flag : flags) mask |= static_cast<int>(flag);
    return mask;
}

inline bool has_flag(int mask, MatchFlag flag) {
    return (mask & static_cast<int>(flag)) != 0;
}

inline bool has_flag(int mask, SplitFlag flag) {
    return (mask & static_cast<int>(flag)) != 0;
}

inline std::string description(MatchFlag flag) {
    switch (flag) {
        case MatchFlag::OffsetCapture: return "Include byte offsets with matches";
        case MatchFlag::UnmatchedAsNull: return "Unmatched groups return null";
        case MatchFlag::PatternOrder: return "Group results by capture group";
        case MatchFlag::SetOrder: return "Group results by match occurrence";
    }
    return "";
}

inline std::string description(SplitFlag flag) {
    switch (flag) {
        case SplitFlag::NoEmpty: return "Only return non-empty segments";
        case SplitFlag::DelimCapture: return "Include captured delimiters in the segments";
        case SplitFlag::FirstGroupOnly: return "Include only the first captured delimiter group";
    }
    return "";
}

} // namespace options
} // namespace relex
