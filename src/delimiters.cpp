#include "lexlit/delimiters.hpp"
#include "lexlit/utf8.hpp"

#include <unicode/uchar.h>

#include <stdexcept>
#include <utility>

namespace lexlit {

namespace {

using pair_t = std::pair<char32_t, char32_t>;

// Pi -> Pf
constexpr pair_t initial_final_quotes[] = {
    {0x00AB, 0x00BB}, {0x2018, 0x2019}, {0x201C, 0x201D}, {0x2039, 0x203A},
    {0x2E02, 0x2E03}, {0x2E04, 0x2E05}, {0x2E09, 0x2E0A}, {0x2E0C, 0x2E0D},
    {0x2E1C, 0x2E1D}, {0x2E20, 0x2E21},
};

// Ps -> Pf (low-9 quotation marks)
constexpr pair_t low_quotes[] = {
    {0x201A, 0x2019}, {0x201E, 0x201D},
};

// Ps -> Pe
constexpr pair_t open_close[] = {
    {U'(', U')'}, {U'[', U']'}, {U'{', U'}'},
    {0x0F3A, 0x0F3B}, {0x0F3C, 0x0F3D}, {0x169B, 0x169C}, {0x2045, 0x2046},
    {0x207D, 0x207E}, {0x208D, 0x208E}, {0x2768, 0x2769}, {0x276A, 0x276B},
    {0x276C, 0x276D}, {0x276E, 0x276F}, {0x2770, 0x2771}, {0x2772, 0x2773},
    {0x2774, 0x2775}, {0x27C5, 0x27C6}, {0x27E6, 0x27E7}, {0x27E8, 0x27E9},
    {0x27EA, 0x27EB}, {0x2983, 0x2984}, {0x2985, 0x2986}, {0x2987, 0x2988},
    {0x2989, 0x298A}, {0x298B, 0x298C}, {0x2991, 0x2992}, {0x2993, 0x2994},
    {0x2995, 0x2996}, {0x2997, 0x2998}, {0x29D8, 0x29D9}, {0x29DA, 0x29DB},
    {0x29FC, 0x29FD}, {0x3008, 0x3009}, {0x300A, 0x300B}, {0x300C, 0x300D},
    {0x300E, 0x300F}, {0x3010, 0x3011}, {0x3014, 0x3015}, {0x3016, 0x3017},
    {0x3018, 0x3019}, {0x301A, 0x301B}, {0x301D, 0x301E}, {0xFE17, 0xFE18},
    {0xFE35, 0xFE36}, {0xFE37, 0xFE38}, {0xFE39, 0xFE3A}, {0xFE3B, 0xFE3C},
    {0xFE3D, 0xFE3E}, {0xFE3F, 0xFE40}, {0xFE41, 0xFE42}, {0xFE43, 0xFE44},
    {0xFE47, 0xFE48}, {0xFE59, 0xFE5A}, {0xFE5B, 0xFE5C}, {0xFE5D, 0xFE5E},
    {0xFF08, 0xFF09}, {0xFF3B, 0xFF3D}, {0xFF5B, 0xFF5D}, {0xFF5F, 0xFF60},
    {0xFF62, 0xFF63}, {0x2E28, 0x2E29},
};

// Sm -> Sm
constexpr pair_t math_brackets[] = {
    {U'<', U'>'},
};

template<std::size_t N>
bool find_closer(const pair_t (&table)[N], char32_t opener, char32_t& closer){
    for(const auto &p : table){
        if(p.first == opener){ closer = p.second; return true; }
    }
    return false;
}

} // namespace

bool is_punct(char32_t cp){
    return u_ispunct(static_cast<UChar32>(cp)) != 0;
}

delimiter_match regexp_delimiter(char32_t opener){
    char32_t closer = 0;
    if(find_closer(initial_final_quotes, opener, closer) ||
       find_closer(low_quotes, opener, closer) ||
       find_closer(open_close, opener, closer) ||
       find_closer(math_brackets, opener, closer))
        return { true, closer };
    if(is_punct(opener) || opener == U'>')
        return { true, opener };
    return { false, 0 };
}

delimiter_match quote_set_policy::match(char32_t opener) const {
    for(std::size_t i = 0; i < allowed_.size();){
        rune r = decode_rune(allowed_, i);
        if(r.cp == opener) return { true, opener };
        i += r.size;
    }
    return { false, 0 };
}

predicate_policy::predicate_policy(delimiter_fn fn, std::string label) : fn_(std::move(fn)), label_(std::move(label)) {
    if(!fn_) throw std::invalid_argument("predicate_policy: null delimiter function");
}

} // namespace lexlit
