#pragma once
#include <cstdlib>

namespace pdxloc {

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

struct ParseEnv {
    bool lenient = false;    // PDXLOC_LENIENT
    bool debugParse = false; // PDXLOC_DEBUG_PARSE
    bool diagJson = false;   // PDXLOC_DIAG_JSON
};

// Detect parser configuration from process env vars. Read once per Parser, never mid-parse.
ParseEnv detect_env();

} // namespace pdxloc
