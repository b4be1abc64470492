#include "pdxloc/localization.hpp"

namespace pdxloc {

const LocalizationUnit* Localization::find(std::string_view key) const {
    for(const auto& u : units){ if(u.key == key) return &u; }
    return nullptr;
}

bool operator==(const LocalizationUnit& a, const LocalizationUnit& b){
    return a.key == b.key && a.version == b.version && a.value == b.value;
}

bool operator==(const Localization& a, const Localization& b){
    return a.lang == b.lang && a.units == b.units;
}

const Localization* find_language(const std::vector<Localization>& locs, std::string_view lang){
    for(const auto& l : locs){ if(l.lang == lang) return &l; }
    return nullptr;
}

} // namespace pdxloc
