// parser.cpp - Localisation parser: header scan, line-range grouping, unit extraction
#include "pdxloc/parser.hpp"
#include "pdxloc/diagnostics_json.hpp"
#include "pegtl/prelude.hpp"

#include <charconv>
#include <cstdio>
#include <limits>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace pdxloc {

namespace detail
{
    std::vector<std::string_view> split_lines(std::string_view content)
    {
        std::vector<std::string_view> lines;
        size_t p = 0;
        while (p < content.size())
        {
            size_t nl = content.find('\n', p);
            size_t end = nl == std::string_view::npos ? content.size() : nl;
            std::string_view line = content.substr(p, end - p);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.push_back(line);
            if (nl == std::string_view::npos)
                break;
            p = nl + 1;
        }
        return lines;
    }

    static bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

    std::string_view trim(std::string_view s)
    {
        size_t b = 0, e = s.size();
        while (b < e && is_ws(s[b]))
            ++b;
        while (e > b && is_ws(s[e - 1]))
            --e;
        return s.substr(b, e - b);
    }

    std::string header_lang(std::string_view line)
    {
        std::string_view lang = line.substr(2);
        while (!lang.empty() && is_ws(lang.back()))
            lang.remove_suffix(1);
        if (!lang.empty() && lang.back() == ':')
            lang.remove_suffix(1);
        while (!lang.empty() && is_ws(lang.back()))
            lang.remove_suffix(1);
        return std::string(lang);
    }
} // namespace detail

ParseOptions options_from_env(const ParseEnv& env){
    ParseOptions o;
    o.lenient = env.lenient;
    o.trace = env.debugParse;
    o.diagJson = env.diagJson;
    return o;
}

Parser::Parser() : opts_(options_from_env(detect_env())) {}

namespace {

// One language, merged across repeated headers; headerLine is its first header.
struct group {
    std::string lang;
    int headerLine{0};
};

bool is_skippable(std::string_view trimmed){ return trimmed.empty() || trimmed.front() == '#'; }

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view source) const {
    ParseResult r;
    r.source = std::string(source);
    ErrorReporter rep{&r.errors, &r.warnings};
    const auto lines = detail::split_lines(src);

    std::vector<size_t> headers;
    for(size_t i = 0; i < lines.size(); ++i){ if(detail::is_header_line(lines[i])) headers.push_back(i); }
    if(opts_.trace) std::fprintf(stderr, "[pdxloc][parse] source=%s lines=%zu headers=%zu lenient=%d\n", r.source.c_str(), lines.size(), headers.size(), opts_.lenient ? 1 : 0);

    // Everything before the first header belongs to no language.
    const size_t firstHeader = headers.empty() ? lines.size() : headers.front();
    for(size_t i = 0; i < firstHeader; ++i){
        auto t = detail::trim(lines[i]);
        if(is_skippable(t)) continue;
        rep.emit_warning(rep.make_warning(codes::kTextBeforeHeader, "text before the first language header is ignored",
            "start the file with an l_<language>: header", static_cast<int>(i + 1), 1, "", std::string(lines[i])));
    }

    std::vector<group> groups;
    std::unordered_map<std::string, size_t> byLang;
    // owning group of each line; npos for headers and pre-header text
    std::vector<size_t> owner(lines.size(), std::string::npos);
    for(size_t h = 0; h < headers.size(); ++h){
        const size_t begin = headers[h] + 1;
        const size_t end = h + 1 < headers.size() ? headers[h + 1] : lines.size();
        std::string lang = detail::header_lang(lines[headers[h]]);
        const int headerLine = static_cast<int>(headers[h] + 1);
        auto it = byLang.find(lang);
        if(it == byLang.end()){
            it = byLang.emplace(lang, groups.size()).first;
            groups.push_back(group{lang, headerLine});
        } else {
            rep.emit_warning(rep.make_warning(codes::kRepeatedHeader,
                "language header repeated; units merged into the group from line " + std::to_string(groups[it->second].headerLine),
                "keep one l_" + lang + " header per file", headerLine, 1, lang, std::string(lines[headers[h]])));
        }
        for(size_t i = begin; i < end; ++i) owner[i] = it->second;
        if(opts_.trace) std::fprintf(stderr, "[pdxloc][group] lang=%s header-line=%d owned=%zu\n", lang.c_str(), headerLine, end - begin);
    }

    std::vector<Localization> locs(groups.size());
    for(size_t gi = 0; gi < groups.size(); ++gi) locs[gi].lang = groups[gi].lang;

    // Units are extracted in file order so diagnostics follow line order even across merged groups.
    for(size_t i = firstHeader; i < lines.size(); ++i){
        if(owner[i] == std::string::npos) continue;
        Localization& loc = locs[owner[i]];
        const std::string_view raw = lines[i];
        const std::string_view t = detail::trim(raw);
        if(is_skippable(t)) continue;
        const int lineNo = static_cast<int>(i + 1);
        const int indent = static_cast<int>(t.data() - raw.data());

        pegtl_front::unit_state st;
        pegtl_front::unit_failure fail;
        if(!pegtl_front::match_unit_line(t, st, fail)){
            rep.emit_error(rep.make_error(codes::kMalformedUnit, fail.message, fail.hint, lineNo, indent + fail.col, loc.lang, std::string(raw)));
            if(opts_.trace) std::fprintf(stderr, "[pdxloc][unit][malformed] line=%d col=%d lang=%s\n", lineNo, indent + fail.col, loc.lang.c_str());
            if(!opts_.lenient){
                if(opts_.diagJson) print_json(r);
                return r;
            }
            continue;
        }

        LocalizationUnit u;
        u.key = std::move(st.key);
        u.value = std::move(st.value);
        u.line = lineNo;
        if(st.has_version){
            int32_t v = 0;
            const char* first = st.version.data();
            const char* last = first + st.version.size();
            auto [ptr, ec] = std::from_chars(first, last, v);
            if(ec != std::errc() || ptr != last){
                // version digits follow the key and its ':'
                const int col = indent + static_cast<int>(u.key.size()) + 2;
                rep.emit_error(rep.make_error(codes::kVersionOutOfRange,
                    "version " + st.version + " does not fit in a 32-bit integer",
                    "versions range from 0 to " + std::to_string(std::numeric_limits<int32_t>::max()), lineNo, col, loc.lang, std::string(raw)));
                if(!opts_.lenient){
                    if(opts_.diagJson) print_json(r);
                    return r;
                }
                continue;
            }
            u.version = v;
        }
        loc.units.push_back(std::move(u));
    }
    if(opts_.trace){
        for(const auto& loc : locs) std::fprintf(stderr, "[pdxloc][group] lang=%s units=%zu\n", loc.lang.c_str(), loc.units.size());
    }

    r.localizations = std::move(locs);
    r.success = true;
    if(opts_.diagJson) print_json(r);
    return r;
}

std::vector<Localization> parse(std::string_view content){
    ParseOptions opts = options_from_env(detect_env());
    opts.lenient = false;
    ParseResult r = Parser(opts).parse_string(content);
    if(!r.success) throw malformed_unit_error(r.errors.front(), r.source);
    return std::move(r.localizations);
}

} // namespace pdxloc
