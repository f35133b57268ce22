#include "lexlit/env.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace lexlit {

LexEnv detect_env(){
    LexEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("LEXLIT_TRACE")) e.trace = (std::string(v) == "1");
    if (const char* v = get("LEXLIT_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    if (const char* v = get("LEXLIT_WS")) {
        std::string ws = v;
        std::transform(ws.begin(), ws.end(), ws.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (ws == "ascii") e.ws = WsPolicy::Ascii;
        else if (ws == "unicode") e.ws = WsPolicy::Unicode;
        else if (ws == "none") e.ws = WsPolicy::None;
    }

    if (const char* v = get("LEXLIT_MAX_INPUT")) {
        std::string s = v;
        std::size_t n = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
        if (ec == std::errc() && ptr == s.data() + s.size()) e.maxInput = n;
    }
    return e;
}

const char* to_string(WsPolicy p){
    switch(p){
        case WsPolicy::Ascii: return "ascii";
        case WsPolicy::Unicode: return "unicode";
        case WsPolicy::None: return "none";
    }
    return "ascii";
}

} // namespace lexlit
