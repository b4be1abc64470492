#include "prelude.hpp"
#include "grammar.hpp"
#include "actions/unit.hpp"
#include <tao/pegtl.hpp>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace pdxloc::pegtl_front {

namespace {

template<typename Rule>
struct error_text {
    static constexpr const char* message = "malformed localisation unit";
    static constexpr const char* hint = "unit lines have the form key:0 \"value\"";
};
template<> struct error_text< grammar::key > {
    static constexpr const char* message = "expected a localisation key";
    static constexpr const char* hint = "a unit line starts with its key, e.g. event.1.t: \"Title\"";
};
template<> struct error_text< grammar::separator > {
    static constexpr const char* message = "expected ':' with an optional numeric version, whitespace and an opening '\"'";
    static constexpr const char* hint = "write key: \"value\" or key:0 \"value\"";
};
template<> struct error_text< grammar::closing_quote > {
    static constexpr const char* message = "value is not closed by a '\"' at the end of the line";
    static constexpr const char* hint = "add the missing closing quote or remove text after it";
};

class unit_syntax_error : public std::runtime_error {
public:
    unit_syntax_error(const char* msg, const char* hint, std::size_t col)
        : std::runtime_error(msg), hint_(hint), col_(col) {}
    const char* hint() const { return hint_; }
    std::size_t column() const { return col_; }
private:
    const char* hint_;
    std::size_t col_;
};

// must<> failures report the rule that could not be matched
template<typename Rule>
struct control : tao::pegtl::normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...){
        throw unit_syntax_error(error_text<Rule>::message, error_text<Rule>::hint, in.position().column);
    }
};

} // namespace

bool match_unit_line(std::string_view line, unit_state& out, unit_failure& fail){
    tao::pegtl::memory_input in(line, "unit");
    unit_state st;
    try {
        const bool ok = tao::pegtl::parse< grammar::unit_line, actions::action, control >(in, st);
        if(!ok){
            fail.message = error_text<grammar::unit_line>::message; fail.hint = error_text<grammar::unit_line>::hint; fail.col = 1;
            return false;
        }
    } catch (const unit_syntax_error& e) {
        fail.message = e.what();
        fail.hint = e.hint();
        fail.col = static_cast<int>(e.column());
        return false;
    }
    out = std::move(st);
    return true;
}

} // namespace pdxloc::pegtl_front
