#pragma once
#include <string>

namespace lintexpand {

// Expansion settings, normally sourced from the process environment:
//   LINTEXPAND_TRACE=1      log each rewrite and violation to stderr
//   LINTEXPAND_DIAG_JSON=1  print diagnostics JSON to stderr
//   LINTEXPAND_PRETTY=1     driver prints rewritten forms with the pretty printer
//   LINTEXPAND_MAX_DEPTH=N  bound on nested re-expansion (default 64)
struct ExpandEnv {
    bool trace = false;
    bool diagJson = false;
    bool pretty = false;
    int maxDepth = 64;
};

// True for values starting with 1, t/T or y/Y.
bool flag_enabled(const char* name);
// Integer setting; returns def when unset, malformed or not positive.
int int_setting(const char* name, int def);

ExpandEnv detect_env();

} // namespace lintexpand
