// segment.hpp - shared scanning primitive for delimiter-bounded literal content
#pragma once
#include "lexlit/escapes.hpp"
#include "lexlit/node.hpp"
#include "lexlit/state.hpp"

#include <cstddef>

namespace lexlit {

inline constexpr const char* hex4_expected = "[a-f0-9]{4}";
inline constexpr const char* hex_expected = "[a-f0-9]";

// Scan from byte offset `start` up to the first unescaped `closer`.
//
// On success `out` receives token text and the range [start, closer offset),
// st.pos moves past the closer and true is returned. The token borrows the
// source slice until an escape is met; from then on it is decoded into an
// owned buffer:
//   \uXXXX          the code point XXXX (exactly four hex digits)
//   \<closer>       the closer itself
//   \<letter>       escapes.lookup(letter)
//   \<other>        both characters, unchanged
//
// On failure the error is recorded through st.error_at(), st.pos and `out`
// are left untouched and false is returned.
bool scan_segment(scan_state& st, std::size_t start, char32_t closer, const escape_table& escapes, literal_node& out);

} // namespace lexlit
