#include "lexlit/utf8.hpp"

#include <llvm/Support/ConvertUTF.h>

namespace lexlit {

rune decode_rune(std::string_view s, std::size_t at){
    if(at >= s.size()) return {};
    unsigned char lead = static_cast<unsigned char>(s[at]);
    if(lead < 0x80) return { lead, 1 };
    const auto *begin = reinterpret_cast<const llvm::UTF8*>(s.data() + at);
    const auto *end = reinterpret_cast<const llvm::UTF8*>(s.data() + s.size());
    const llvm::UTF8 *cur = begin;
    llvm::UTF32 cp = 0;
    if(llvm::convertUTF8Sequence(&cur, end, &cp, llvm::strictConversion) != llvm::conversionOK || cur == begin)
        return { replacement_char, 1 };
    return { static_cast<char32_t>(cp), static_cast<std::size_t>(cur - begin) };
}

void append_rune(std::string& out, char32_t cp){
    if(cp < 0x80){ out += static_cast<char>(cp); return; }
    char buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
    char *p = buf;
    if(!llvm::ConvertCodePointToUTF8(static_cast<unsigned>(cp), p)){
        p = buf;
        llvm::ConvertCodePointToUTF8(static_cast<unsigned>(replacement_char), p);
    }
    out.append(buf, static_cast<std::size_t>(p - buf));
}

std::string encode_rune(char32_t cp){ std::string s; append_rune(s, cp); return s; }

std::size_t rune_count(std::string_view s){
    std::size_t n = 0;
    for(std::size_t i = 0; i < s.size(); ++n) i += decode_rune(s, i).size;
    return n;
}

} // namespace lexlit
