#include "pdxloc/diagnostics.hpp"
#include <sstream>
#include <utility>

namespace pdxloc {

namespace {

template<typename Diag>
std::string format_impl(const Diag& d, std::string_view severity, std::string_view source){
    std::ostringstream os;
    os << source << ':' << d.line << ':' << d.col << ": " << severity << ' ' << d.code << ": " << d.message;
    if(!d.lang.empty()) os << " [l_" << d.lang << ']';
    if(!d.text.empty()) os << ": " << d.text;
    return os.str();
}

} // namespace

std::string format_diagnostic(const ParseError& e, std::string_view source){ return format_impl(e, "error", source); }
std::string format_diagnostic(const ParseWarning& w, std::string_view source){ return format_impl(w, "warning", source); }

malformed_unit_error::malformed_unit_error(ParseError diag, const std::string& source)
    : parse_error(format_diagnostic(diag, source)), diag_(std::move(diag)) {}

} // namespace pdxloc
