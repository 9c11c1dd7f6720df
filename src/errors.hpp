#pragma once
#include <string>
#include <stdexcept>

namespace relex {

// Base class for every error raised by relex operations
class relex_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A pattern failed to compile or lacks a valid delimiter pair
class pattern_compilation_error : public relex_error {
public:
    using relex_error::relex_error;

    static pattern_compilation_error invalid_syntax(const std::string& pattern, const std::string& error);
    static pattern_compilation_error missing_delimiter(const std::string& pattern);
    static pattern_compilation_error invalid_modifier(const std::string& modifier);
};

// The match or match-all primitive failed (not the same as "no match")
class match_error : public relex_error {
public:
    using relex_error::relex_error;

    static match_error match_failed(const std::string& pattern, const std::string& subject, const std::string& error);
    static match_error match_all_failed(const std::string& pattern, const std::string& subject, const std::string& error);
};

// The replace primitive failed, or a replacement callback threw
class replace_error : public relex_error {
public:
    using relex_error::relex_error;

    static replace_error failed(const std::string& pattern, const std::string& subject, const std::string& error);
    static replace_error invalid_callback(const std::string& pattern);
};

// The split primitive failed
class split_error : public relex_error {
public:
    using relex_error::relex_error;

    static split_error failed(const std::string& pattern, const std::string& subject, const std::string& error);
};

// A group index or name that the pattern never defines
class group_not_found_error : public relex_error {
public:
    using relex_error::relex_error;

    static group_not_found_error by_index(int index, const std::string& pattern);
    static group_not_found_error by_name(const std::string& name, const std::string& pattern);
};

} // namespace relex
