// diagnostics_json.hpp - JSON serialization for expansion diagnostics
#pragma once
#include "lintexpand/diagnostics.hpp"
#include <string>
#include <vector>

namespace lintexpand {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const std::vector<Diagnostic>& diags);

} // namespace lintexpand
