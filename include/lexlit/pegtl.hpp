// pegtl.hpp - run lexlit literal parsers as leaf rules of a PEGTL grammar
#pragma once
#include "lexlit/literals.hpp"

#include <tao/pegtl.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace lexlit::pegtl {

namespace detail {

inline void deliver_node(const literal_node& n, std::vector<literal_node>& out){ out.push_back(n); }
template<typename S> void deliver_node(const literal_node&, S&) {}

inline void deliver_error(const scan_error& e, std::size_t base, scan_error& sink){
    std::size_t at = base + e.pos;
    if(sink.set && at < sink.pos) return;
    sink.expected = e.expected;
    sink.pos = at;
    sink.set = true;
}
template<typename S> void deliver_error(const scan_error&, std::size_t, S&) {}

// Shift a node scanned over a suffix back to offsets into the whole input.
inline void rebase(literal_node& n, std::size_t base){
    n.start += base;
    n.end += base;
    if(auto *kids = std::get_if<literal_children>(&n.value))
        for(auto& k : *kids) rebase(k, base);
}

// LEXLIT_TRACE is read once, on the first literal matched.
inline bool trace_enabled(){
    static const bool on = detect_env().trace;
    return on;
}

} // namespace detail

// Memory inputs only (memory_input, string_input).
// Spec provides `static const lexlit::literal_parser& parser()`.
// On success the rule consumes the literal and appends the node to every
// std::vector<literal_node> state; on failure it consumes nothing and folds
// the error into every lexlit::scan_error state. Node ranges and error
// positions are both byte offsets into the whole input.
template<typename Spec>
struct literal
{
    using rule_t = literal;
    using subs_t = tao::pegtl::type_list<>;

    template<tao::pegtl::apply_mode A,
             tao::pegtl::rewind_mode M,
             template<typename...> class Action,
             template<typename...> class Control,
             typename ParseInput,
             typename... States>
    static bool match(ParseInput& in, States&... st)
    {
        scan_state ss(std::string_view(in.current(), in.size()), skip_no_ws, detail::trace_enabled());
        const std::size_t base = static_cast<std::size_t>(in.current() - in.begin());
        literal_node node;
        if(Spec::parser().parse(ss, node)){
            in.bump(ss.pos);
            detail::rebase(node, base);
            (detail::deliver_node(node, st), ...);
            return true;
        }
        (detail::deliver_error(ss.error, base, st), ...);
        return false;
    }
};

struct string_spec { static const literal_parser& parser(){ static const literal_parser_ptr p = string_lit("\"'`"); return *p; } };
struct number_spec { static const literal_parser& parser(){ static const literal_parser_ptr p = number_lit(); return *p; } };
struct regexp_match_spec { static const literal_parser& parser(){ static const literal_parser_ptr p = unicode_regexp_match_lit(); return *p; } };
struct regexp_replace_spec { static const literal_parser& parser(){ static const literal_parser_ptr p = unicode_regexp_replace_lit(); return *p; } };

using string_rule = literal<string_spec>;
using number_rule = literal<number_spec>;
using regexp_match_rule = literal<regexp_match_spec>;
using regexp_replace_rule = literal<regexp_replace_spec>;

} // namespace lexlit::pegtl
