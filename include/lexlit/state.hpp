// state.hpp - shared scan cursor, whitespace hook and furthest-error sink
#pragma once
#include "lexlit/env.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace lexlit {

// Furthest failure seen during one parse attempt.
struct scan_error {
    std::string expected;  // human readable expectation ("number", "\"", ...)
    std::size_t pos = 0;   // byte offset into the input
    bool set = false;
};

class scan_state;
using ws_hook = std::function<void(scan_state&)>;

void skip_ascii_ws(scan_state& st);
void skip_unicode_ws(scan_state& st);
void skip_no_ws(scan_state& st);
ws_hook ws_for(WsPolicy p);

class scan_state {
public:
    // Whitespace policy and tracing come from detect_env().
    explicit scan_state(std::string_view input);
    scan_state(std::string_view input, ws_hook ws);
    // No environment lookup.
    scan_state(std::string_view input, ws_hook ws, bool trace);

    std::string_view input;
    std::size_t pos = 0;
    scan_error error;
    ws_hook ws;
    bool trace = false;

    bool eof() const { return pos >= input.size(); }
    std::string_view rest() const { return eof() ? std::string_view{} : input.substr(pos); }
    void skip_ws() { if(ws) ws(*this); }

    // Record `expected` at `at` unless an error further along is already held.
    // Equal positions overwrite.
    void error_at(std::string expected, std::size_t at);
    void error_here(std::string expected) { error_at(std::move(expected), pos); }
    bool has_error() const { return error.set; }
    void clear_error() { error = scan_error{}; }
};

struct line_col { int line = 1; int col = 1; };

// 1-based line and column (in code points) of byte offset `pos`.
line_col locate(std::string_view input, std::size_t pos);

// "expected <label> at <line>:<col>" for the recorded error, empty if none.
std::string describe(const scan_state& st);

} // namespace lexlit
