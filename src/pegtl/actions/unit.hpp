#pragma once
#include "../prelude.hpp"
#include "../grammar.hpp"
#include <tao/pegtl.hpp>

namespace pdxloc::pegtl_front::actions {
using namespace tao::pegtl;
using pdxloc::pegtl_front::unit_state;

template<typename Rule>
struct action : nothing<Rule> {};

// Actions are disabled inside not_at<>, so only the real key/separator fire here.
template<> struct action< grammar::key > {
    template<typename Input>
    static void apply(const Input& in, unit_state& st){ st.key = in.string(); }
};

template<> struct action< grammar::version > {
    template<typename Input>
    static void apply(const Input& in, unit_state& st){ st.version = in.string(); st.has_version = true; }
};

template<> struct action< grammar::value > {
    template<typename Input>
    static void apply(const Input& in, unit_state& st){ st.value = in.string(); }
};

} // namespace pdxloc::pegtl_front::actions
