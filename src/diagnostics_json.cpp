#include "lintexpand/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace lintexpand {

Diagnostic from_violation(const ShapeViolation& v){
    DiagnosticReporter rep;
    std::string name = v.macro.empty() ? std::string("macro") : v.macro;
    auto d = rep.make_config_error("C0100", "invalid arguments to " + name,
                                   "expected " + v.expected, v.line, v.col);
    d.notes.push_back(Note{"expected: " + v.expected, v.line, v.col});
    d.notes.push_back(Note{"received: " + v.received, v.line, v.col});
    return d;
}

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_notes_json(std::ostringstream& os, const std::vector<Note>& notes){
    os<<"[";
    for(size_t i=0;i<notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(notes[i].message)
          <<",\"line\":"<<notes[i].line
          <<",\"col\":"<<notes[i].col
          <<"}";
    }
    os<<"]";
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& diags){
    std::ostringstream os;
    os<<"{\"success\":"<<(diags.empty()?"true":"false")<<",\"diagnostics\":[";
    for(size_t i=0;i<diags.size(); ++i){
        const auto &d=diags[i]; if(i) os<<",";
        os<<"{"
            "\"category\":"<<json_escape(to_string(d.category))
            <<",\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"notes\":";
        append_notes_json(os,d.notes);
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

} // namespace lintexpand
