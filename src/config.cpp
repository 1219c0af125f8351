#include "lintexpand/config.hpp"
#include <cstdlib>
#include <cstdio>

namespace lintexpand {

bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

int int_setting(const char* name, int def){
    const char* v = std::getenv(name);
    if(!v || !*v) return def;
    char* end = nullptr;
    long parsed = std::strtol(v, &end, 10);
    if(*end != '\0' || parsed <= 0 || parsed > 100000){
        std::fprintf(stderr, "[lintexpand][config] ignoring %s=%s, using %d\n", name, v, def);
        return def;
    }
    return static_cast<int>(parsed);
}

ExpandEnv detect_env(){
    ExpandEnv e;
    e.trace = flag_enabled("LINTEXPAND_TRACE");
    e.diagJson = flag_enabled("LINTEXPAND_DIAG_JSON");
    e.pretty = flag_enabled("LINTEXPAND_PRETTY");
    e.maxDepth = int_setting("LINTEXPAND_MAX_DEPTH", e.maxDepth);
    return e;
}

} // namespace lintexpand
