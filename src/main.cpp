#include "globalvar.hpp"
#include "relex.hpp"
#include "pcre2_regex.hpp"
#include "string_utils.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <cctype>

static void print_usage() {
    std::cerr << "Usage:\n"
              << "  relex-cli match <pattern> <subject> [options]\n"
              << "  relex-cli match-all <pattern> <subject> [options]\n"
              << "  relex-cli test <pattern> <subject> [options]\n"
              << "  relex-cli replace <pattern> <replacement> <subject> [options]\n"
              << "  relex-cli split <pattern> <subject> [options]\n"
              << "  relex-cli validate <pattern>\n"
              << "  relex-cli escape <text> [options]\n"
              << "  relex-cli groups <pattern>\n"
              << "\nOptions:\n"
              << "  --offset <n>              Start matching at byte offset n\n"
              << "  --offsets                 Print the position of every group (match)\n"
              << "  --group <index|name>      Print only this group (match, match-all)\n"
              << "  --limit <n>               Maximum replacements or pieces (replace, split)\n"
              << "  --keep-delimiters         Keep captured delimiters (split)\n"
              << "  --join <separator>        Print segments joined by separator (split)\n"
              << "  --delimiter <c>           Delimiter to escape (escape, default: \"/\")\n"
              << "  --backtrack-limit <n>     Engine backtrack limit (default: "
              << relex::globalvar::default_backtrack_limit << ")\n"
              << "  --recursion-limit <n>     Engine recursion limit (default: "
              << relex::globalvar::default_recursion_limit << ")\n"
              << "  --debug                   Print debug messages\n"
              << "  --version                 Print version\n";
}

struct CliOptions {
    size_t offset = 0;
    bool offsets = false;
    long limit = -1;
    std::optional<std::string> group;
    bool keep_delimiters = false;
    std::optional<std::string> join;
    char delimiter = relex::globalvar::default_delimiter;
    bool debug = false;
    std::vector<std::string> args;
};

static bool parse_number(const std::string& option, const std::string& value, long& out) {
    try {
        size_t used = 0;
        out = std::stol(value, &used);
        if (used == value.size()) return true;
    } catch (const std::exception&) {
        // Reported below
    }
    std::cerr << "Error: invalid number \"" << value << "\" for " << option << "\n";
    return false;
}

// Collect switches and positional arguments after the subcommand
static bool parse_options(int argc, char* argv[], CliOptions& opts) {
    relex::pcre2_regex::Limits limits = relex::pcre2_regex::get_limits();
    long number = 0;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--offset" && has_value) {
            if (!parse_number(arg, argv[++i], number) || number < 0) return false;
            opts.offset = static_cast<size_t>(number);
        } else if (arg == "--offsets") {
            opts.offsets = true;
        } else if (arg == "--limit" && has_value) {
            if (!parse_number(arg, argv[++i], opts.limit)) return false;
        } else if (arg == "--group" && has_value) {
            opts.group = argv[++i];
        } else if (arg == "--keep-delimiters") {
            opts.keep_delimiters = true;
        } else if (arg == "--join" && has_value) {
            opts.join = argv[++i];
        } else if (arg == "--delimiter" && has_value) {
            std::string value = argv[++i];
            if (value.size() != 1) {
                std::cerr << "Error: delimiter must be a single character\n";
                return false;
            }
            opts.delimiter = value[0];
        } else if (arg == "--backtrack-limit" && has_value) {
            if (!parse_number(arg, argv[++i], number) || number <= 0) return false;
            limits.backtrack_limit = static_cast<uint32_t>(number);
        } else if (arg == "--recursion-limit" && has_value) {
            if (!parse_number(arg, argv[++i], number) || number <= 0) return false;
            limits.recursion_limit = static_cast<uint32_t>(number);
        } else if (arg == "--debug") {
            opts.debug = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            opts.args.push_back(arg);
        }
    }

    relex::pcre2_regex::set_limits(limits);
    if (opts.debug) {
        std::cerr << "[Debug] Backtrack limit " << limits.backtrack_limit
                  << ", recursion limit " << limits.recursion_limit << "\n";
    }
    return true;
}

static bool check_args(const CliOptions& opts, size_t count, const std::string& what) {
    if (opts.args.size() < count) {
        std::cerr << "Error: missing " << what << " argument\n";
        print_usage();
        return false;
    }
    if (opts.args.size() > count) {
        std::cerr << "Error: unexpected argument \"" << opts.args[count] << "\"\n";
        return false;
    }
    return true;
}

// "2" addresses group 2, anything else a named group
static relex::GroupKey parse_group_key(const std::string& text) {
    bool numeric = !text.empty() && text.size() < 10;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) numeric = false;
    }
    if (numeric) return std::stoi(text);
    return text;
}

static std::string display(const std::optional<std::string>& value) {
    return value ? relex::string_utils::make_printable(*value) : "(null)";
}

static int cmd_match(const CliOptions& opts) {
    if (!check_args(opts, 2, "pattern or subject")) return 1;
    auto result = opts.offsets
        ? relex::match_with_offsets(opts.args[0], opts.args[1], opts.offset)
        : relex::match(opts.args[0], opts.args[1], opts.offset);
    if (opts.debug) std::cerr << "[Debug] Matched: " << (result.has_match() ? "yes" : "no") << "\n";
    if (!result.has_match()) return 0;

    if (opts.group) {
        std::cout << display(result.group(parse_group_key(*opts.group))) << "\n";
        return 0;
    }
    for (const auto& entry : result.groups()) {
        std::cout << relex::key_to_string(entry.first) << ": " << display(entry.second);
        if (opts.offsets) {
            auto position = result.position(entry.first);
            if (position) std::cout << " @" << position->start() << "+" << position->length();
        }
        std::cout << "\n";
    }
    return 0;
}

static int cmd_match_all(const CliOptions& opts) {
    if (!check_args(opts, 2, "pattern or subject")) return 1;
    auto result = relex::match_all(opts.args[0], opts.args[1], opts.offset);
    if (opts.debug) std::cerr << "[Debug] " << result.count() << " match(es)\n";

    if (opts.group) {
        for (const auto& value : result.pluck(parse_group_key(*opts.group))) {
            std::cout << display(value) << "\n";
        }
        return 0;
    }
    for (const auto& text : result.results()) {
        std::cout << relex::string_utils::make_printable(text) << "\n";
    }
    return 0;
}

static int cmd_test(const CliOptions& opts) {
    if (!check_args(opts, 2, "pattern or subject")) return 1;
    bool matched = relex::test(opts.args[0], opts.args[1], opts.offset);
    if (opts.debug) std::cerr << "[Debug] Matched: " << (matched ? "yes" : "no") << "\n";
    return matched ? 0 : 1;
}

static int cmd_replace(const CliOptions& opts) {
    if (!check_args(opts, 3, "pattern, replacement or subject")) return 1;
    auto result = relex::replace(opts.args[0], opts.args[1], opts.args[2], opts.limit);
    if (opts.debug) std::cerr << "[Debug] " << result.count() << " replacement(s)\n";
    std::cout << result.result() << "\n";
    return 0;
}

static int cmd_split(const CliOptions& opts) {
    if (!check_args(opts, 2, "pattern or subject")) return 1;
    auto result = opts.keep_delimiters
        ? relex::split_with_delimiters(opts.args[0], opts.args[1], opts.limit)
        : relex::split(opts.args[0], opts.args[1], opts.limit);
    if (opts.debug) std::cerr << "[Debug] " << result.count() << " segment(s)\n";

    if (opts.join) {
        std::cout << result.join(*opts.join) << "\n";
        return 0;
    }
    for (const auto& segment : result) std::cout << segment << "\n";
    return 0;
}

static int cmd_validate(const CliOptions& opts) {
    if (!check_args(opts, 1, "pattern")) return 1;
    relex::validate(opts.args[0]);
    std::cout << "OK\n";
    return 0;
}

static int cmd_escape(const CliOptions& opts) {
    if (!check_args(opts, 1, "text")) return 1;
    std::cout << relex::escape(opts.args[0], opts.delimiter) << "\n";
    return 0;
}

static int cmd_groups(const CliOptions& opts) {
    if (!check_args(opts, 1, "pattern")) return 1;
    auto pattern = relex::pattern(opts.args[0]);
    if (opts.debug) std::cerr << "[Debug] Normalized pattern: " << pattern.to_string() << "\n";
    std::cout << "count: " << pattern.group_count() << "\n";
    for (const auto& name : pattern.group_names()) {
        std::cout << "name: " << name << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string subcommand = argv[1];
    if (subcommand == "--help" || subcommand == "-h") {
        print_usage();
        return 0;
    }
    if (subcommand == "--version") {
        std::cout << "relex-cli " << relex::globalvar::relex_version << "\n";
        return 0;
    }

    int (*handler)(const CliOptions&) = nullptr;
    if (subcommand == "match") handler = cmd_match;
    else if (subcommand == "match-all") handler = cmd_match_all;
    else if (subcommand == "test") handler = cmd_test;
    else if (subcommand == "replace") handler = cmd_replace;
    else if (subcommand == "split") handler = cmd_split;
    else if (subcommand == "validate") handler = cmd_validate;
    else if (subcommand == "escape") handler = cmd_escape;
    else if (subcommand == "groups") handler = cmd_groups;
    else {
        std::cerr << "Unknown subcommand: " << subcommand << "\n";
        print_usage();
        return 1;
    }

    CliOptions opts;
    if (!parse_options(argc, argv, opts)) return 1;

    try {
        return handler(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
