#include "pdxloc/env.hpp"

namespace pdxloc {

ParseEnv detect_env(){
    ParseEnv env;
    env.lenient = flag_enabled("PDXLOC_LENIENT");
    env.debugParse = flag_enabled("PDXLOC_DEBUG_PARSE");
    env.diagJson = flag_enabled("PDXLOC_DIAG_JSON");
    return env;
}

} // namespace pdxloc
