// diagnostics_json.hpp - JSON serialization for parse diagnostics
#pragma once
#include "cook/diagnostics.hpp"
#include <string>
#include <string_view>

namespace cook {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string. Line/col are resolved against `src`.
std::string diagnostics_to_json(const DiagnosticReport& r, std::string_view src);

// If COOK_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const DiagnosticReport& r, std::string_view src);

} // namespace cook
