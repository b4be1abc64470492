// localization.hpp - Localisation records produced by the parser
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdxloc {

// One `key:version "value"` entry of a language group.
// `value` is kept verbatim: literal `\n` sequences are not decoded.
// `line` is the 1-based source line and is ignored by equality.
struct LocalizationUnit {
    std::string key;
    std::optional<int32_t> version;
    std::string value;
    int line{-1};
};

// All units that follow one `l_<lang>` header (merged across repeated headers).
struct Localization {
    std::string lang;
    std::vector<LocalizationUnit> units;

    bool empty() const { return units.empty(); }
    size_t size() const { return units.size(); }
    // First unit with the given key, or nullptr.
    const LocalizationUnit* find(std::string_view key) const;
};

bool operator==(const LocalizationUnit& a, const LocalizationUnit& b);
inline bool operator!=(const LocalizationUnit& a, const LocalizationUnit& b){ return !(a == b); }
bool operator==(const Localization& a, const Localization& b);
inline bool operator!=(const Localization& a, const Localization& b){ return !(a == b); }

// Locate a language group by its stripped name (e.g. "english").
const Localization* find_language(const std::vector<Localization>& locs, std::string_view lang);

} // namespace pdxloc
