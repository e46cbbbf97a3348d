// diagnostics_json.hpp - JSON serialization for pipeline diagnostics
#pragma once
#include "ipparse/diagnostics.hpp"
#include <string>

namespace ipparse {

// Quoted JSON string; malformed UTF-8 is replaced rather than copied.
std::string json_escape(const std::string& s);

// Serialize one diagnostic to a compact JSON object.
std::string diagnostic_to_json(const diagnostic& d);

// When IPPARSE_DIAG_JSON is switched on, print the diagnostic JSON to stderr.
void maybe_print_json(const diagnostic& d);

} // namespace ipparse
