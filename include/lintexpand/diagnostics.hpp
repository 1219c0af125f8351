// Diagnostics surfaced to the host analyzer.
#pragma once
#include "lintexpand/shape.hpp"
#include <string>
#include <vector>

namespace lintexpand {

// config: a macro invocation the rewrite layer could not handle (tool/configuration problem,
//         never an ordinary lint finding).
// syntax: source text the reader could not parse.
enum class DiagnosticCategory { config, syntax };

inline const char* to_string(DiagnosticCategory c){
    switch(c){
        case DiagnosticCategory::config: return "config";
        case DiagnosticCategory::syntax: return "syntax";
    }
    return "unknown";
}

// Codes
//   C0100  macro arguments do not match the rule's shape
//   C0101  nested expansion exceeded LINTEXPAND_MAX_DEPTH
//   S0001  reader error
struct Note { std::string message; int line=-1; int col=-1; };
struct Diagnostic {
    DiagnosticCategory category = DiagnosticCategory::config;
    std::string code;
    std::string message;
    std::string hint;
    int line=-1;
    int col=-1;
    std::vector<Note> notes;
};

// Lightweight wrapper so the expander and the driver share formatting.
struct DiagnosticReporter {
    std::vector<Diagnostic>* out=nullptr;
    void emit(const Diagnostic& d){ if(out) out->push_back(d); }
    Diagnostic make_config_error(std::string code, std::string message, std::string hint, int line, int col){
        return Diagnostic{DiagnosticCategory::config, std::move(code), std::move(message), std::move(hint), line, col, {}};
    }
};

// C0100 diagnostic carrying expected/received notes.
Diagnostic from_violation(const ShapeViolation& v);

} // namespace lintexpand
