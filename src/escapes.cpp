#include "lexlit/escapes.hpp"
#include "lexlit/utf8.hpp"

#include <cstdio>

namespace lexlit {

escape_table::escape_table(std::initializer_list<std::pair<char32_t, char32_t>> entries) : entries_(entries) {}

std::optional<char32_t> escape_table::lookup(char32_t letter) const {
    for(auto &e : entries_) if(e.first == letter) return e.second;
    return std::nullopt;
}

std::optional<char32_t> escape_table::letter_for(char32_t decoded) const {
    for(auto &e : entries_) if(e.second == decoded) return e.first;
    return std::nullopt;
}

const escape_table& default_escapes(){
    static const escape_table table{
        {U'a', U'\a'}, {U'b', U'\b'}, {U'f', U'\f'}, {U'n', U'\n'},
        {U'r', U'\r'}, {U't', U'\t'}, {U'v', U'\v'},
    };
    return table;
}

static void append_hex_escape(std::string& out, char32_t cp){
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(cp));
    out += buf;
}

std::string escape_text(std::string_view decoded, char32_t closer, const escape_table& escapes){
    std::string out;
    out.reserve(decoded.size());
    for(std::size_t i = 0; i < decoded.size();){
        rune r = decode_rune(decoded, i);
        std::string_view raw = decoded.substr(i, r.size);
        i += r.size;
        if(r.cp == closer && r.cp != U'\\'){
            out += '\\';
            out += raw;
        } else if(auto letter = escapes.letter_for(r.cp); letter && *letter != closer && *letter != U'u'){
            out += '\\';
            append_rune(out, *letter);
        } else if(r.cp == U'\\' || r.cp < 0x20 || r.cp == 0x7F){
            append_hex_escape(out, r.cp);
        } else {
            out += raw;
        }
    }
    return out;
}

} // namespace lexlit
