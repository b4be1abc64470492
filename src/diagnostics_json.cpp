#include "pdxloc/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace pdxloc {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

template<typename Diag>
static void append_diag_json(std::ostringstream& os, const std::vector<Diag>& diags){
    os<<"[";
    for(size_t i=0;i<diags.size(); ++i){
        const auto &d=diags[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"lang\":"<<json_escape(d.lang)
            <<",\"text\":"<<json_escape(d.text)
            <<"}";
    }
    os<<"]";
}

static void append_diagnostics_body(std::ostringstream& os, const ParseResult& r){
    os<<"\"success\":"<<(r.success?"true":"false")
      <<",\"source\":"<<json_escape(r.source)
      <<",\"errors\":";
    append_diag_json(os, r.errors);
    os<<",\"warnings\":";
    append_diag_json(os, r.warnings);
}

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{";
    append_diagnostics_body(os, r);
    os<<"}";
    return os.str();
}

std::string localizations_to_json(const std::vector<Localization>& locs){
    std::ostringstream os;
    os<<"[";
    for(size_t i=0;i<locs.size(); ++i){
        const auto &l=locs[i]; if(i) os<<",";
        os<<"{\"lang\":"<<json_escape(l.lang)<<",\"units\":[";
        for(size_t j=0;j<l.units.size(); ++j){
            const auto &u=l.units[j]; if(j) os<<",";
            os<<"{\"key\":"<<json_escape(u.key)<<",\"version\":";
            if(u.version) os<<*u.version; else os<<"null";
            os<<",\"value\":"<<json_escape(u.value)
              <<",\"line\":"<<u.line
              <<"}";
        }
        os<<"]}";
    }
    os<<"]";
    return os.str();
}

std::string result_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{";
    append_diagnostics_body(os, r);
    os<<",\"localizations\":"<<localizations_to_json(r.localizations)<<"}";
    return os.str();
}

void print_json(const ParseResult& r){
    auto js=diagnostics_to_json(r);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace pdxloc
