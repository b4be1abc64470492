#include <cassert>
#include <iostream>
#include "pdxloc/parser.hpp"
#include "test_env.hpp"

using namespace pdxloc;

static const char* kBroken = "l_english:\n a: \"1\"\n broken\n b: \"2\"\n";

void run_env_tests(){
    {
        ScopedEnv lenient("PDXLOC_LENIENT", "1");
        Parser p;
        assert(p.options().lenient && "PDXLOC_LENIENT=1 should enable lenient mode");
        auto r = p.parse_string(kBroken);
        assert(r.success && r.localizations.size()==1 && r.localizations[0].units.size()==2);
        assert(r.errors.size()==1 && r.errors[0].line==3);
        // explicit options win over the environment
        Parser strict{ParseOptions{}};
        assert(!strict.parse_string(kBroken).success);
        // the throwing entry point stays strict
        bool threw = false;
        try { (void)parse(kBroken); } catch (const malformed_unit_error&) { threw = true; }
        assert(threw);
    }
    {
        ScopedEnv lenient("PDXLOC_LENIENT", "0");
        assert(!Parser().options().lenient);
    }
    {
        ScopedEnv lenient("PDXLOC_LENIENT", "yes");
        ScopedEnv trace("PDXLOC_DEBUG_PARSE", "true");
        auto env = detect_env();
        assert(env.lenient && env.debugParse && !env.diagJson);
        auto o = options_from_env(env);
        assert(o.lenient && o.trace && !o.diagJson);
    }
    {
        ScopedEnv lenient("PDXLOC_LENIENT", nullptr);
        assert(!flag_enabled("PDXLOC_LENIENT"));
    }
    std::cout << "Env tests passed\n";
}
