// Immutable node tree with metadata & source positions
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <map>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <initializer_list>

namespace lintexpand
{

    // Raised by the reader for malformed source text. Position is 1-based; -1 when unknown.
    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line = -1, int col = -1)
            : std::runtime_error(msg), line(line), col(col) {}
        int line;
        int col;
    };

    // Plain token: symbols, keywords, numbers, nil, booleans, characters.
    // The lexeme is kept verbatim; the rewrite layer never interprets it.
    struct token
    {
        std::string value;
    };
    struct list;
    struct vector_t;
    struct map;
    struct node; // forward declarations

    using node_ptr = std::shared_ptr<const node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    // std::string is a string literal (decoded text).
    using node_data = std::variant<token, std::string, list, vector_t, map>;
    using metadata_map = std::map<std::string, node_ptr>;

    // Nodes are never modified once shared. Rewrites build new containers that
    // point at existing children; metadata entries are shared the same way.
    struct node
    {
        node_data data;
        metadata_map metadata;
    };

    // Structural deep equality of two nodes. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<const node>(node{std::move(d), {}}); }
        inline node_ptr make_node(node_data d, metadata_map meta) { return std::make_shared<const node>(node{std::move(d), std::move(meta)}); }
        inline node_ptr make_int(int64_t v) { return make_node(token{std::to_string(v)}); }
        inline void attach_pos(metadata_map &m, int sl, int sc, int el, int ec)
        {
            m["line"] = make_int(sl);
            m["col"] = make_int(sc);
            m["end-line"] = make_int(el);
            m["end-col"] = make_int(ec);
        }
        inline std::string escape_string(const std::string &s)
        {
            std::string out;
            out.reserve(s.size() + 2);
            out += '"';
            for (char c : s)
            {
                switch (c)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\b':
                    out += "\\b";
                    break;
                case '\f':
                    out += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
                    {
                        static const char hex[] = "0123456789ABCDEF";
                        unsigned char u = static_cast<unsigned char>(c);
                        out += "\\u00";
                        out += hex[u >> 4];
                        out += hex[u & 0xF];
                    }
                    else
                        out += c;
                    break;
                }
            }
            out += '"';
            return out;
        }
    }

    // Same data, original metadata map (entries shared, not copied).
    inline node_ptr rebuild(const node &original, node_data d) { return detail::make_node(std::move(d), original.metadata); }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }
    // Pretty printer with newlines and indentation for readability
    inline std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return p ? to_pretty_string(*p, indentWidth) : std::string("<null>"); }
    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string operator()(const token &t) const { return t.value; }
            std::string operator()(const std::string &s) const { return detail::escape_string(s); }
            std::string operator()(const list &l) const { return join(l.elems, '(', ')'); }
            std::string operator()(const vector_t &v) const { return join(v.elems, '[', ']'); }
            std::string operator()(const map &m) const
            {
                std::string out = "{";
                bool first = true;
                for (auto &kv : m.entries)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(kv.first) + ' ' + to_string(kv.second);
                }
                out += '}';
                return out;
            }
            static std::string join(const std::vector<node_ptr> &elems, char openC, char closeC)
            {
                std::string out(1, openC);
                bool first = true;
                for (auto &ch : elems)
                {
                    if (!first)
                        out += ' ';
                    first = false;
                    out += to_string(ch);
                }
                out += closeC;
                return out;
            }
        };
        return std::visit(V{}, n.data);
    }

    inline std::string to_pretty_string(const node &n, int indentWidth)
    {
        // Compact single-line forms for short collections of atoms; binding and
        // sequencing forms always break so rewritten output stays readable.
        auto indentStr = [](int spaces) -> std::string {
            if (spaces < 0) spaces = 0;
            return std::string(static_cast<size_t>(spaces), ' ');
        };

        auto is_atomic = [](const node &x) -> bool {
            return std::holds_alternative<token>(x.data) || std::holds_alternative<std::string>(x.data);
        };

        const size_t MAX_INLINE_LEN = 90; // heuristic

        std::function<std::string(const node&, int)> pp = [&](const node &x, int indent) -> std::string {
            if (is_atomic(x)) return to_string(x);

            auto join_inline_list = [&](const std::vector<node_ptr>& elems, char openC, char closeC)->std::string {
                std::string out; out+=openC; bool first=true; for(auto &e: elems){ if(!first) out+=' '; first=false; out+=pp(*e, indent); if(out.size()>MAX_INLINE_LEN) return std::string(); } out+=closeC; return out; };

            // list
            if (std::holds_alternative<list>(x.data)) {
                const auto &elems = std::get<list>(x.data).elems;
                if (elems.empty()) return "()";
                bool allAtomic = true; for(auto &e: elems){ if(!is_atomic(*e)){ allAtomic=false; break;} }
                bool forceMulti = false;
                if(std::holds_alternative<token>(elems[0]->data)){
                    static const char* blockHeads[] = {"let","do","fn","ns"};
                    const std::string &head = std::get<token>(elems[0]->data).value;
                    for(auto s: blockHeads){ if(head==s){ forceMulti = elems.size() > 2; break; } }
                }
                if(allAtomic && !forceMulti){
                    auto inlineForm = join_inline_list(elems,'(',')');
                    if(!inlineForm.empty()) return inlineForm; // fits single line
                }
                // Head stays on the opening line, everything else one per line
                std::string out="(" + pp(*elems[0], indent + 1);
                for(size_t i=1;i<elems.size();++i){
                    out += '\n' + indentStr(indent + indentWidth) + pp(*elems[i], indent + indentWidth);
                }
                out += ')';
                return out;
            }
            // vector
            if (std::holds_alternative<vector_t>(x.data)) {
                const auto &elems = std::get<vector_t>(x.data).elems;
                if (elems.empty()) return "[]";
                auto inlineForm = join_inline_list(elems,'[',']'); if(!inlineForm.empty()) return inlineForm;
                std::string out="["; size_t i=0; for(auto &e: elems){ if(i) out += '\n'+indentStr(indent+1); out += pp(*e, indent+1); ++i; }
                out += ']'; return out;
            }
            // map
            const auto &entries = std::get<map>(x.data).entries; if(entries.empty()) return "{}";
            bool allAtomic=true; for(auto &kv: entries){ if(!is_atomic(*kv.first) || !is_atomic(*kv.second)){ allAtomic=false; break;} }
            if(allAtomic){
                std::string inlineOut = "{"; bool first=true; for(auto &kv: entries){ if(!first) inlineOut+=' '; first=false; inlineOut+=pp(*kv.first, indent)+' '+pp(*kv.second, indent); if(inlineOut.size()>MAX_INLINE_LEN) { inlineOut.clear(); break; } }
                if(!inlineOut.empty()){ inlineOut+='}'; return inlineOut; }
            }
            std::string out="{"; size_t i=0; for(auto &kv: entries){ if(i) out += '\n'+indentStr(indent+1); out += pp(*kv.first, indent+1)+' '+pp(*kv.second, indent+1); ++i; }
            out += '}'; return out;
        };
        return pp(n, 0);
    }

    inline bool is_token(const node &n) { return std::holds_alternative<token>(n.data); }
    inline bool is_string(const node &n) { return std::holds_alternative<std::string>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline const token *as_token(const node &n) { return is_token(n) ? &std::get<token>(n.data) : nullptr; }
    inline const std::string *as_string(const node &n) { return is_string(n) ? &std::get<std::string>(n.data) : nullptr; }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const map *as_map(const node &n) { return is_map(n) ? &std::get<map>(n.data) : nullptr; }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end() || !it->second)
            return def;
        auto t = as_token(*it->second);
        if (!t || t->value.empty())
            return def;
        char *end = nullptr;
        long v = std::strtol(t->value.c_str(), &end, 10);
        if (*end != '\0')
            return def;
        return (int)v;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }
    inline int end_line(const node &n) { return meta_int(n, "end-line"); }
    inline int end_col(const node &n) { return meta_int(n, "end-col"); }
    inline std::string source_file(const node &n)
    {
        auto it = n.metadata.find("file");
        if (it == n.metadata.end() || !it->second || !is_string(*it->second))
            return std::string();
        return std::get<std::string>(it->second->data);
    }

    // ------ Ergonomic helpers and insertion operators ------

    inline node_ptr n_tok(std::string value) { return detail::make_node(token{std::move(value)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }

    inline node_ptr node_list() { return detail::make_node(list{}); }
    inline node_ptr node_vec() { return detail::make_node(vector_t{}); }
    inline node_ptr node_map() { return detail::make_node(map{}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_list(std::vector<node_ptr> xs) { return detail::make_node(list{std::move(xs)}); }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_vec(std::vector<node_ptr> xs) { return detail::make_node(vector_t{std::move(xs)}); }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs)
    {
        map m;
        m.entries.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(m));
    }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

    // Append operators for collection payloads under construction
    inline list &operator<<(list &l, const node_ptr &n)
    {
        if (!n)
            throw std::invalid_argument("operator<<: null child node");
        l.elems.push_back(n);
        return l;
    }
    inline vector_t &operator<<(vector_t &v, const node_ptr &n)
    {
        if (!n)
            throw std::invalid_argument("operator<<: null child node");
        v.elems.push_back(n);
        return v;
    }
    inline map &operator<<(map &m, const std::pair<node_ptr, node_ptr> &kv)
    {
        if (!kv.first || !kv.second)
            throw std::invalid_argument("operator<<: null map entry");
        m.entries.push_back(kv);
        return m;
    }

} // namespace lintexpand
