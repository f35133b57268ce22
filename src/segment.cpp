#include "lexlit/segment.hpp"
#include "lexlit/utf8.hpp"

#include <optional>

namespace lexlit {

static int hex_value(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool scan_segment(scan_state& st, std::size_t start, char32_t closer, const escape_table& escapes, literal_node& out){
    const std::string_view in = st.input;
    std::size_t end = start;
    std::optional<std::string> buf; // created on the first escape

    while(end < in.size()){
        rune cur = decode_rune(in, end);
        if(cur.cp == U'\\'){
            if(end + cur.size >= in.size()){
                st.error_at(encode_rune(closer), end);
                return false;
            }
            if(!buf) buf.emplace(in.substr(start, end - start));

            rune next = decode_rune(in, end + cur.size);
            if(next.cp == U'u'){
                std::size_t digits = end + cur.size + next.size;
                char32_t cp = 0;
                for(std::size_t i = 0; i < 4; ++i){
                    std::size_t at = digits + i;
                    if(at >= in.size()){
                        st.error_at(hex4_expected, at);
                        return false;
                    }
                    int v = hex_value(in[at]);
                    if(v < 0){
                        st.error_at(hex_expected, at);
                        return false;
                    }
                    cp = (cp << 4) | static_cast<char32_t>(v);
                }
                append_rune(*buf, cp);
                end = digits + 4;
                continue;
            }

            if(next.cp == closer){
                append_rune(*buf, closer);
            } else if(auto mapped = escapes.lookup(next.cp)){
                append_rune(*buf, *mapped);
            } else {
                // unknown escape: keep the backslash and the character
                buf->append(in.substr(end, cur.size + next.size));
            }
            end += cur.size + next.size;
            continue;
        }

        if(cur.cp == closer){
            out.start = start;
            out.end = end;
            out.value = buf ? token_text::own(std::move(*buf)) : token_text::borrow(in.substr(start, end - start));
            st.pos = end + cur.size;
            return true;
        }

        if(buf) buf->append(in.substr(end, cur.size));
        end += cur.size;
    }

    st.error_at(encode_rune(closer), in.size());
    return false;
}

} // namespace lexlit
