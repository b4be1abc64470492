#include "pdxloc/parser.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; size_t units; };

static RunResult bench_case(const char* name, const std::string &text){
    pdxloc::Parser parser(pdxloc::ParseOptions{});
    auto t0 = Clock::now();
    auto res = parser.parse_string(text, name);
    auto t1 = Clock::now();
    if(!res.success){
        std::cerr << "[bench] case '" << name << "' failed to parse\n";
        return {0.0, 0};
    }
    size_t units = 0;
    for(const auto& l : res.localizations) units += l.units.size();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return { ms, units };
}

static std::string make_file(const std::vector<std::string>& langs, size_t unitsPerLang){
    std::ostringstream os;
    for(const auto& lang : langs){
        os << "l_" << lang << ":\n";
        for(size_t i=0;i<unitsPerLang;++i){
            if(i % 50 == 0) os << " # block " << i / 50 << "\n";
            os << " bench_events." << i << ".t:" << (i % 3) << " \"Event " << i << " title with [ROOT.GetName] and \\n escapes\"\n";
        }
    }
    return os.str();
}

int main(){
    struct Case { const char* name; std::string text; };
    std::vector<Case> cases;
    cases.push_back({"single-lang-1k", make_file({"english"}, 1000)});
    cases.push_back({"single-lang-50k", make_file({"english"}, 50000)});
    cases.push_back({"five-lang-10k", make_file({"english","french","german","russian","simp_chinese"}, 10000)});

    for(const auto& c : cases){
        auto r = bench_case(c.name, c.text);
        std::cout << c.name << ": " << r.ms_parse << " ms, " << r.units << " units, " << c.text.size() << " bytes\n";
    }
    return 0;
}
