#include "lexlit/state.hpp"
#include "lexlit/utf8.hpp"

#include <unicode/uchar.h>

namespace lexlit {

void skip_ascii_ws(scan_state& st){
    while(!st.eof()){
        char c = st.input[st.pos];
        if(c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'){
            ++st.pos;
            continue;
        }
        break;
    }
}

void skip_unicode_ws(scan_state& st){
    while(!st.eof()){
        rune r = decode_rune(st.input, st.pos);
        if(!u_isUWhiteSpace(static_cast<UChar32>(r.cp))) break;
        st.pos += r.size;
    }
}

void skip_no_ws(scan_state&){}

ws_hook ws_for(WsPolicy p){
    switch(p){
        case WsPolicy::Unicode: return skip_unicode_ws;
        case WsPolicy::None: return skip_no_ws;
        case WsPolicy::Ascii: break;
    }
    return skip_ascii_ws;
}

scan_state::scan_state(std::string_view in) : input(in) {
    const LexEnv env = detect_env();
    ws = ws_for(env.ws);
    trace = env.trace;
}

scan_state::scan_state(std::string_view in, ws_hook hook) : scan_state(in, std::move(hook), detect_env().trace) {}

scan_state::scan_state(std::string_view in, ws_hook hook, bool trace_failures)
    : input(in), ws(std::move(hook)), trace(trace_failures) {}

void scan_state::error_at(std::string expected, std::size_t at){
    if(error.set && at < error.pos) return;
    error.expected = std::move(expected);
    error.pos = at;
    error.set = true;
}

line_col locate(std::string_view input, std::size_t pos){
    line_col lc;
    if(pos > input.size()) pos = input.size();
    std::size_t i = 0;
    while(i < pos){
        if(input[i] == '\n'){ ++lc.line; lc.col = 1; ++i; continue; }
        rune r = decode_rune(input, i);
        i += r.size;
        ++lc.col;
    }
    return lc;
}

std::string describe(const scan_state& st){
    if(!st.error.set) return {};
    line_col lc = locate(st.input, st.error.pos);
    return "expected " + st.error.expected + " at " + std::to_string(lc.line) + ":" + std::to_string(lc.col);
}

} // namespace lexlit
