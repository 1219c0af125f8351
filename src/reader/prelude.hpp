#pragma once
#include "lintexpand/node.hpp"
#include <string>
#include <vector>

namespace lintexpand::reader_front {

// wrap:       'x  #'x  @x       ->  (quote x) (var x) (deref x)
// fn_literal: #(f %)            ->  (fn* (f %))
// set:        #{a b}            ->  (hash-set a b)
enum class frame_kind { top, list, vector, map, set, fn_literal, wrap, discard };

// Open collections while the grammar walks the input; the top frame collects finished forms.
struct build_state {
    struct frame {
        frame_kind kind;
        const char* head;
        std::vector<node_ptr> elems;
    };

    node_ptr file; // shared "file" metadata entry, null for anonymous input
    std::vector<frame> frames{ frame{frame_kind::top, nullptr, {}} };

    void push(frame_kind k, const char* head = nullptr){ frames.push_back(frame{k, head, {}}); }
    void append(node_ptr n){ frames.back().elems.push_back(std::move(n)); }

    // Metadata for a matched range: start position plus the position of its last character.
    template<typename ActionInput>
    metadata_map span_of(const ActionInput& in) const {
        const auto p = in.position();
        int sl = static_cast<int>(p.line), sc = static_cast<int>(p.column);
        int el = sl, ec = sc;
        const char* b = in.begin();
        const char* e = in.end();
        for(const char* c = b; c + 1 < e; ++c){
            if(*c == '\n'){ ++el; ec = 1; } else { ++ec; }
        }
        metadata_map m;
        detail::attach_pos(m, sl, sc, el, ec);
        if(file) m["file"] = file;
        return m;
    }

    template<typename ActionInput>
    void append_leaf(node_data d, const ActionInput& in){
        append(detail::make_node(std::move(d), span_of(in)));
    }

    // Pop the innermost frame and append the finished form to its parent.
    template<typename ActionInput>
    void close(const ActionInput& in){
        frame f = std::move(frames.back());
        frames.pop_back();
        const auto p = in.position();
        node_data d;
        switch(f.kind){
        case frame_kind::list:
            d = list{std::move(f.elems)};
            break;
        case frame_kind::vector:
            d = vector_t{std::move(f.elems)};
            break;
        case frame_kind::map: {
            if(f.elems.size() % 2)
                throw parse_error("map literal requires an even number of forms", static_cast<int>(p.line), static_cast<int>(p.column));
            map m;
            for(size_t i = 0; i < f.elems.size(); i += 2) m.entries.emplace_back(f.elems[i], f.elems[i + 1]);
            d = std::move(m);
            break;
        }
        case frame_kind::set: {
            list l{{ n_tok("hash-set") }};
            for(auto& e : f.elems) l.elems.push_back(e);
            d = std::move(l);
            break;
        }
        case frame_kind::fn_literal: {
            // The body keeps its own list node so an invocation inside #(...) stays an invocation.
            auto body = detail::make_node(list{std::move(f.elems)}, span_of(in));
            d = list{{ n_tok("fn*"), body }};
            break;
        }
        case frame_kind::wrap:
            if(f.elems.empty())
                throw parse_error(std::string(f.head) + " of a discarded form", static_cast<int>(p.line), static_cast<int>(p.column));
            d = list{{ n_tok(f.head), f.elems.front() }};
            break;
        case frame_kind::discard:
            return;
        case frame_kind::top:
            throw parse_error("reader frame underflow", static_cast<int>(p.line), static_cast<int>(p.column));
        }
        append_leaf(std::move(d), in);
    }
};

inline void append_utf8(std::string& out, unsigned long cp){
    if(cp < 0x80){ out += static_cast<char>(cp); }
    else if(cp < 0x800){
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if(cp < 0x10000){
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Four hex digits at raw[i..i+3], or -1.
inline long hex4(const std::string& raw, size_t i){
    if(i + 4 > raw.size()) return -1;
    long v = 0;
    for(size_t k = i; k < i + 4; ++k){
        char c = raw[k];
        int h = (c >= '0' && c <= '9') ? c - '0'
              : (c >= 'a' && c <= 'f') ? c - 'a' + 10
              : (c >= 'A' && c <= 'F') ? c - 'A' + 10 : -1;
        if(h < 0) return -1;
        v = v * 16 + h;
    }
    return v;
}

// Decode the escapes of a matched string literal, quotes included.
// \uXXXX (surrogate pairs joined) is emitted as UTF-8, \ooo octal as a single byte.
inline std::string decode_string(const std::string& raw){
    std::string out;
    out.reserve(raw.size());
    const size_t end = raw.size() - 1; // closing quote
    for(size_t i = 1; i < end; ++i){
        char c = raw[i];
        if(c != '\\' || i + 1 >= end){ out += c; continue; }
        char e = raw[++i];
        switch(e){
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'u': {
            long cp = i + 4 < end ? hex4(raw, i + 1) : -1;
            if(cp < 0){ out += "\\u"; break; }
            i += 4;
            if(cp >= 0xD800 && cp < 0xDC00 && i + 6 < end && raw[i + 1] == '\\' && raw[i + 2] == 'u'){
                long lo = hex4(raw, i + 3);
                if(lo >= 0xDC00 && lo < 0xE000){
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    i += 6;
                }
            }
            append_utf8(out, static_cast<unsigned long>(cp));
            break;
        }
        default:
            if(e >= '0' && e <= '7'){
                unsigned v = static_cast<unsigned>(e - '0');
                for(int n = 0; n < 2 && i + 1 < end && raw[i + 1] >= '0' && raw[i + 1] <= '7' && v * 8 + (raw[i + 1] - '0') <= 0377; ++n)
                    v = v * 8 + static_cast<unsigned>(raw[++i] - '0');
                out += static_cast<char>(v);
            } else {
                out += e;
            }
            break;
        }
    }
    return out;
}

} // namespace lintexpand::reader_front
