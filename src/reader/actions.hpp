#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>

namespace lintexpand::reader_front::actions {
using namespace tao::pegtl;
using lintexpand::reader_front::build_state;

template<typename Rule>
struct action : nothing<Rule> {};

// Openers push a frame; the enclosing form's action pops it once the closer matched.
template<frame_kind K>
struct open_frame {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.push(K); }
};
template<typename Head>
struct open_wrap {
    template<typename Input>
    static void apply(const Input&, build_state& st){ st.push(frame_kind::wrap, Head::name); }
};
struct close_frame {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.close(in); }
};

struct quote_head { static constexpr const char* name = "quote"; };
struct var_head { static constexpr const char* name = "var"; };
struct deref_head { static constexpr const char* name = "deref"; };

template<> struct action< grammar::list_open > : open_frame<frame_kind::list> {};
template<> struct action< grammar::vector_open > : open_frame<frame_kind::vector> {};
template<> struct action< grammar::map_open > : open_frame<frame_kind::map> {};
template<> struct action< grammar::set_open > : open_frame<frame_kind::set> {};
template<> struct action< grammar::fn_open > : open_frame<frame_kind::fn_literal> {};
template<> struct action< grammar::quote_open > : open_wrap<quote_head> {};
template<> struct action< grammar::var_open > : open_wrap<var_head> {};
template<> struct action< grammar::deref_open > : open_wrap<deref_head> {};
template<> struct action< grammar::discard_open > : open_frame<frame_kind::discard> {};

template<> struct action< grammar::list_form > : close_frame {};
template<> struct action< grammar::vector_form > : close_frame {};
template<> struct action< grammar::map_form > : close_frame {};
template<> struct action< grammar::set_form > : close_frame {};
template<> struct action< grammar::fn_literal > : close_frame {};
template<> struct action< grammar::quoted > : close_frame {};
template<> struct action< grammar::var_quoted > : close_frame {};
template<> struct action< grammar::dereferenced > : close_frame {};
template<> struct action< grammar::discarded > : close_frame {};

// Regex escapes belong to the pattern, so the text is kept undecoded.
template<> struct action< grammar::regex_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        std::string raw = in.string();
        st.append_leaf(raw.substr(2, raw.size() - 3), in);
    }
};

template<> struct action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.append_leaf(decode_string(in.string()), in); }
};

template<> struct action< grammar::token_rule > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.append_leaf(token{in.string()}, in); }
};
template<> struct action< grammar::char_lit > : action< grammar::token_rule > {};

template<> struct action< grammar::dispatch_unsupported > {
    template<typename Input>
    static void apply(const Input& in, build_state&){
        const auto p = in.position();
        throw lintexpand::parse_error("unsupported reader form '" + in.string() + "'",
                                      static_cast<int>(p.line), static_cast<int>(p.column));
    }
};

} // namespace lintexpand::reader_front::actions
