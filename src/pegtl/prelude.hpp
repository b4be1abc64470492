#pragma once
#include <string>
#include <string_view>

namespace pdxloc::pegtl_front {

// Captures of one unit line, filled by the grammar actions.
struct unit_state {
    std::string key;
    std::string version; // digits only; empty when absent
    bool has_version{false};
    std::string value;
};

// Why a unit line did not match; col is 1-based within the matched text.
struct unit_failure {
    std::string message;
    std::string hint;
    int col{0};
};

// Match one trimmed, non-blank, non-comment line against the unit grammar.
bool match_unit_line(std::string_view line, unit_state& out, unit_failure& fail);

} // namespace pdxloc::pegtl_front
