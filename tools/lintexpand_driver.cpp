// Reads a source file, rewrites every registered macro invocation and prints the result.
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstring>
#include <cstdio>
#include "lintexpand/reader.hpp"
#include "lintexpand/expand.hpp"
#include "lintexpand/diagnostics_json.hpp"

using namespace lintexpand;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str();
    return true;
}

static void print_text(const std::string& file, const std::vector<Diagnostic>& diags){
    for(auto& d : diags){
        std::cerr << file << ":" << d.line << ":" << d.col << ": " << to_string(d.category)
                  << " " << d.code << ": " << d.message << "\n";
        for(auto& n : d.notes) std::cerr << "    " << n.message << "\n";
    }
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: lintexpand_driver <file> [--json] [--pretty]\n"; return 1; }
    std::string file = argv[1];
    ExpandEnv env = detect_env();
    bool json = env.diagJson;
    for(int i=2;i<argc;++i){
        if(std::strcmp(argv[i], "--json")==0) json = true;
        else if(std::strcmp(argv[i], "--pretty")==0) env.pretty = true;
        else { std::cerr << "unknown option: " << argv[i] << "\n"; return 1; }
    }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }

    std::vector<node_ptr> forms;
    try {
        forms = read_all(src, file);
    } catch(const parse_error& e){
        Diagnostic d{DiagnosticCategory::syntax, "S0001", e.what(), "", e.line, e.col, {}};
        if(json) std::cerr << diagnostics_to_json({d}) << "\n"; else print_text(file, {d});
        return 1;
    }

    Expander ex(default_registry(), env);
    auto mod = ex.expand_all(forms);
    for(auto& f : mod.forms) std::cout << (env.pretty ? to_pretty_string(f) : to_string(f)) << "\n";
    if(env.trace) std::fprintf(stderr, "[lintexpand][driver] %zu forms, %zu rewrites, %zu diagnostics\n",
                               mod.forms.size(), mod.rewrites, mod.diagnostics.size());
    if(json) std::cerr << diagnostics_to_json(mod.diagnostics) << "\n";
    else print_text(file, mod.diagnostics);
    return mod.success() ? 0 : 2;
}
