// parser.hpp - Localisation file parser (l_<lang> headers + key:version "value" units)
#pragma once
#include "pdxloc/diagnostics.hpp"
#include "pdxloc/env.hpp"
#include "pdxloc/localization.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pdxloc {

struct ParseOptions {
    // Skip malformed unit lines (still reported as errors) instead of failing the parse.
    bool lenient{false};
    // Trace the pipeline to stderr.
    bool trace{false};
    // Print diagnostics JSON to stderr after each parse.
    bool diagJson{false};
};

ParseOptions options_from_env(const ParseEnv& env);

class Parser {
public:
    // Options taken from PDXLOC_* environment variables.
    Parser();
    explicit Parser(ParseOptions opts) : opts_(opts) {}

    // Parse localisation text. Format errors are reported in the result, never thrown.
    ParseResult parse_string(std::string_view src, std::string_view source = "<memory>") const;

    const ParseOptions& options() const { return opts_; }

private:
    ParseOptions opts_;
};

// Strict parse. Groups come back in first-appearance order of their headers.
// Throws malformed_unit_error on the first malformed unit line.
std::vector<Localization> parse(std::string_view content);

namespace detail
{
    // Lines without terminators; a trailing '\r' is dropped, a final empty segment is not a line.
    std::vector<std::string_view> split_lines(std::string_view content);
    std::string_view trim(std::string_view s);
    // Header lines start with "l_" at column 1.
    inline bool is_header_line(std::string_view line) { return line.size() >= 2 && line[0] == 'l' && line[1] == '_'; }
    // "l_english:" -> "english"
    std::string header_lang(std::string_view line);
} // namespace detail

} // namespace pdxloc
