#pragma once
#include <tao/pegtl.hpp>

namespace pdxloc::pegtl_front::grammar {
using namespace tao::pegtl;

// Unit line:  <key>:<version>? <ws>+ "<value>"
// The value is closed by the final '"' of the line, so it may itself contain quotes.
struct quote : one<'"'> {};
struct version : plus< digit > {};
// ':' [digits] whitespace+ '"' is the only place a key can end. Since the key has no '"',
// the first match is the one directly before the opening quote.
struct separator : seq< one<':'>, opt< version >, plus< space >, quote > {};
struct key : plus< not_at< separator >, not_one<'"'> > {};
struct closing_quote : seq< quote, eof > {};
struct value : star< not_at< closing_quote >, any > {};

struct unit_line : must< key, separator, value, closing_quote > {};

} // namespace pdxloc::pegtl_front::grammar
