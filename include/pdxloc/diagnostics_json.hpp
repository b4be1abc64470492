// diagnostics_json.hpp - JSON serialization for ParseResult diagnostics and records
#pragma once
#include "pdxloc/diagnostics.hpp"
#include "pdxloc/localization.hpp"
#include <string>
#include <vector>

namespace pdxloc {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const ParseResult& r);

// Serialize parsed records: [{"lang":..,"units":[{"key":..,"version":..,"value":..,"line":..}]}]
std::string localizations_to_json(const std::vector<Localization>& locs);

// Diagnostics plus records in one object.
std::string result_to_json(const ParseResult& r);

// Print diagnostics JSON to stderr. Parsers built with ParseOptions::diagJson call this after each parse.
void print_json(const ParseResult& r);

} // namespace pdxloc
