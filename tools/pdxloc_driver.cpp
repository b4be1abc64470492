#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include "pdxloc/parser.hpp"
#include "pdxloc/diagnostics_json.hpp"

using namespace pdxloc;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: pdxloc_driver <localisation.yml> [--json] [--lenient]\n"; return 1; }
    std::string file;
    bool json = false;
    ParseOptions opts = options_from_env(detect_env());
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--json") json = true;
        else if(a=="--lenient") opts.lenient = true;
        else if(file.empty()) file = a;
        else { std::cerr << "unexpected argument: " << a << "\n"; return 1; }
    }
    if(file.empty()){ std::cerr << "missing input file\n"; return 1; }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read file: " << file << "\n"; return 1; }

    Parser parser(opts);
    ParseResult res = parser.parse_string(src, file);
    if(json){
        std::cout << result_to_json(res) << "\n";
        return res.success ? 0 : 2;
    }
    for(const auto& w : res.warnings) std::cerr << format_diagnostic(w, res.source) << "\n";
    for(const auto& e : res.errors) std::cerr << format_diagnostic(e, res.source) << "\n  hint: " << e.hint << "\n";
    if(!res.success){ std::cerr << "Parse failed\n"; return 2; }
    for(const auto& loc : res.localizations){
        std::cout << loc.lang << ": " << loc.units.size() << " units\n";
        for(const auto& u : loc.units){
            std::cout << "  " << u.key;
            if(u.version) std::cout << ':' << *u.version;
            std::cout << " \"" << u.value << "\"\n";
        }
    }
    return 0;
}
