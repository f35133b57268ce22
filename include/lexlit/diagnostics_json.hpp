// diagnostics_json.hpp - JSON serialization for scan errors and literal nodes
#pragma once
#include "lexlit/node.hpp"
#include "lexlit/state.hpp"
#include <string>
#include <string_view>

namespace lexlit {

// Escape a string for safe JSON output.
std::string json_escape(std::string_view s);

// {"success":false,"expected":...,"pos":N,"line":L,"col":C} (or {"success":true}).
std::string error_to_json(const scan_state& st);

// Serialize a literal node (kind, range and payload).
std::string node_to_json(const literal_node& n);

// If LEXLIT_DIAG_JSON=1 in the environment, print error_to_json to stderr.
void maybe_print_json(const scan_state& st);

} // namespace lexlit
