#pragma once
#include "lintexpand/node.hpp"
#include <string_view>
#include <vector>

namespace lintexpand {

// Read source text into node trees. Every node carries line/col/end-line/end-col
// metadata (1-based, end inclusive) and, when filename is non-empty, a shared "file" entry.
// Throws parse_error on malformed input.
std::vector<node_ptr> read_all(std::string_view src, std::string_view filename = {});

// Exactly one form, e.g. for tests and single-expression hosts.
node_ptr read_one(std::string_view src, std::string_view filename = {});

} // namespace lintexpand
