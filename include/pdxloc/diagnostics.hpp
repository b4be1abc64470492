// diagnostics.hpp - Coded parse diagnostics and the parse result
#pragma once
#include "pdxloc/localization.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pdxloc {

// Diagnostic codes
//  - E0001: malformed unit line (does not match key[:version] "value")
//  - E0002: version digits do not fit a signed 32-bit integer
//  - W0100: stray text before the first language header (discarded)
//  - W0101: repeated language header merged into the earlier group
namespace codes {
inline constexpr const char* kMalformedUnit = "E0001";
inline constexpr const char* kVersionOutOfRange = "E0002";
inline constexpr const char* kTextBeforeHeader = "W0100";
inline constexpr const char* kRepeatedHeader = "W0101";
} // namespace codes

struct ParseError { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::string lang; std::string text; };
struct ParseWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::string lang; std::string text; };

struct ErrorReporter {
    std::vector<ParseError>* errors=nullptr;
    std::vector<ParseWarning>* warnings=nullptr;
    void emit_error(const ParseError& e){ if(errors) errors->push_back(e); }
    void emit_warning(const ParseWarning& w){ if(warnings) warnings->push_back(w); }
    ParseError make_error(std::string code, std::string message, std::string hint, int line, int col, std::string lang, std::string text){
        return ParseError{std::move(code),std::move(message),std::move(hint),line,col,std::move(lang),std::move(text)};
    }
    ParseWarning make_warning(std::string code, std::string message, std::string hint, int line, int col, std::string lang, std::string text){
        return ParseWarning{std::move(code),std::move(message),std::move(hint),line,col,std::move(lang),std::move(text)};
    }
};

// Outcome of Parser::parse_string. In strict mode a failed parse carries no localizations.
struct ParseResult {
    bool success{false};
    std::string source;
    std::vector<Localization> localizations;
    std::vector<ParseError> errors;
    std::vector<ParseWarning> warnings;
};

// "<source>:<line>:<col>: error E0001: <message> [l_<lang>]: <text>"
std::string format_diagnostic(const ParseError& e, std::string_view source);
std::string format_diagnostic(const ParseWarning& w, std::string_view source);

struct parse_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Thrown by pdxloc::parse when a unit line is malformed.
class malformed_unit_error : public parse_error
{
public:
    malformed_unit_error(ParseError diag, const std::string& source);
    const ParseError& diagnostic() const { return diag_; }
    int line() const { return diag_.line; }
    const std::string& lang() const { return diag_.lang; }

private:
    ParseError diag_;
};

} // namespace pdxloc
