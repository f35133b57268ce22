// escapes.hpp - single-letter escape codes (\n, \t, ...) and re-escaping of decoded text
#pragma once
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lexlit {

class escape_table {
public:
    escape_table() = default;
    escape_table(std::initializer_list<std::pair<char32_t, char32_t>> entries);

    // Control character produced by `\<letter>`, if `letter` is an escape code.
    std::optional<char32_t> lookup(char32_t letter) const;
    // Escape letter that produces `decoded`, if any.
    std::optional<char32_t> letter_for(char32_t decoded) const;

    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }

private:
    std::vector<std::pair<char32_t, char32_t>> entries_;
};

// a b f n r t v -> BEL BS FF LF CR HT VT
const escape_table& default_escapes();

// Inverse of segment scanning: produce literal content that scans back to
// `decoded` when closed by `closer` under `escapes`. The closer is escaped
// with a backslash; backslashes and unmapped control characters are written
// as \uXXXX.
std::string escape_text(std::string_view decoded, char32_t closer, const escape_table& escapes = default_escapes());

} // namespace lexlit
