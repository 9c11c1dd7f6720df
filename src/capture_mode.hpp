#pragma once
#include <string>

namespace relex {

// Projection applied to every match of a MatchAllResult
enum class CaptureMode {
    All,          // full match and all groups (default)
    First,        // only group 1
    AllButFirst,  // everything except group 0
    Named,        // only named groups
    None          // nothing; the projection has no entries
};

namespace capture_mode {

inline std::string to_string(CaptureMode mode) {
    switch (mode) {
        case CaptureMode::All: return "all";
        case CaptureMode::First: return "first";
        case CaptureMode::AllButFirst: return "all_but_first";
        case CaptureMode::Named: return "named";
        case CaptureMode::None: return "none";
    }
    return "";
}

inline std::string description(CaptureMode mode) {
    switch (mode) {
        case CaptureMode::All: return "Capture full match and all groups";
        case CaptureMode::First: return "Capture only the first group";
        case CaptureMode::AllButFirst: return "Capture all groups except full match";
        case CaptureMode::Named: return "Capture only named groups";
        case CaptureMode::None: return "No capture, boolean match only";
    }
    return "";
}

} // namespace capture_mode
} // namespace relex
