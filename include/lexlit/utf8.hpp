// utf8.hpp - code point decoding/encoding over UTF-8 source text (LLVM ConvertUTF)
#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace lexlit {

// Substituted for malformed input and for code points UTF-8 cannot carry.
inline constexpr char32_t replacement_char = 0xFFFD;

struct rune { char32_t cp = 0; std::size_t size = 0; };

// Decode the code point starting at byte offset `at`.
// Returns size 0 at (or past) end of input; a malformed sequence decodes as
// U+FFFD with size 1 so scanning always makes progress.
rune decode_rune(std::string_view s, std::size_t at);

// Append the UTF-8 encoding of `cp` (U+FFFD for surrogates / out of range).
void append_rune(std::string& out, char32_t cp);

std::string encode_rune(char32_t cp);

// Number of code points in `s` (malformed bytes count one each).
std::size_t rune_count(std::string_view s);

} // namespace lexlit
