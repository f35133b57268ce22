// env.hpp - process-environment switches for the literal scanner and its tools
#pragma once
#include <cstddef>
#include <string>

namespace lexlit {

enum class WsPolicy { Ascii, Unicode, None };

struct LexEnv {
    bool trace = false;        // LEXLIT_TRACE=1
    bool diagJson = false;     // LEXLIT_DIAG_JSON=1
    WsPolicy ws = WsPolicy::Ascii; // LEXLIT_WS=ascii|unicode|none
    std::size_t maxInput = 0;  // LEXLIT_MAX_INPUT=<bytes>, 0 = unlimited
};

// Detect scanner configuration from process env vars.
// Unknown or malformed values leave the corresponding default in place.
LexEnv detect_env();

const char* to_string(WsPolicy p);

} // namespace lexlit
