#include "lintexpand/expand.hpp"
#include <cstdio>

namespace lintexpand {

ExpandResult Expander::expand(const node_ptr& n){
    ExpandResult out;
    out.node = expand_impl(n, 0, out);
    return out;
}

ModuleResult Expander::expand_all(const std::vector<node_ptr>& forms){
    ModuleResult mod;
    mod.forms.reserve(forms.size());
    for(auto& f : forms){
        if(ns_.scan_ns_form(f)){
            if(env_.trace) std::fprintf(stderr, "[lintexpand][ns] %s\n", ns_.current().c_str());
            mod.forms.push_back(f);
            continue;
        }
        auto r = expand(f);
        mod.forms.push_back(r.node);
        mod.rewrites += r.rewrites;
        for(auto& d : r.diagnostics) mod.diagnostics.push_back(std::move(d));
    }
    return mod;
}

node_ptr Expander::expand_impl(const node_ptr& n, int depth, ExpandResult& out){
    if(!n || !is_list(*n)) return expand_children(n, depth, out);
    auto head = invocation_name(*n);
    if(!head) return expand_children(n, depth, out);
    std::string name = ns_.qualify(*head);
    if(!registry_.contains(name)) return expand_children(n, depth, out);

    DiagnosticReporter rep{&out.diagnostics};
    if(depth >= env_.maxDepth){
        // depth counts every rewrite on the path from the top-level form: enclosing
        // invocations in the source and re-expansions of a rule's own output alike.
        auto d = rep.make_config_error("C0101",
                                       name + " is nested inside " + std::to_string(depth) + " expanded macro invocations",
                                       "left unexpanded; raise LINTEXPAND_MAX_DEPTH (currently " + std::to_string(env_.maxDepth)
                                           + ") if the source nests this deeply",
                                       line(*n), col(*n));
        d.notes.push_back(Note{"depth limit: " + std::to_string(env_.maxDepth), line(*n), col(*n)});
        d.notes.push_back(Note{"a rule whose output contains its own invocation also reaches this limit", line(*n), col(*n)});
        rep.emit(d);
        if(env_.trace) std::fprintf(stderr, "[lintexpand][depth] %s at %d:%d\n", name.c_str(), line(*n), col(*n));
        return expand_children(n, depth, out);
    }

    auto r = registry_.dispatch_as(name, n);
    if(!r){
        const auto& v = r.violation();
        if(env_.trace) std::fprintf(stderr, "[lintexpand][violation] %s at %d:%d expected %s, got %s\n",
                                    name.c_str(), v.line, v.col, v.expected.c_str(), v.received.c_str());
        rep.emit(from_violation(v));
        return expand_children(n, depth, out);
    }
    ++out.rewrites;
    if(env_.trace) std::fprintf(stderr, "[lintexpand][rewrite] %s at %d:%d\n", name.c_str(), line(*n), col(*n));
    return expand_impl(r.value(), depth + 1, out);
}

node_ptr Expander::expand_children(const node_ptr& n, int depth, ExpandResult& out){
    if(!n) return n;
    bool changed = false;
    auto walk = [&](const node_ptr& c){
        auto e = expand_impl(c, depth, out);
        if(e != c) changed = true;
        return e;
    };
    if(auto l = as_list(*n)){
        list copy; copy.elems.reserve(l->elems.size());
        for(auto& c : l->elems) copy.elems.push_back(walk(c));
        return changed ? rebuild(*n, std::move(copy)) : n;
    }
    if(auto v = as_vector(*n)){
        vector_t copy; copy.elems.reserve(v->elems.size());
        for(auto& c : v->elems) copy.elems.push_back(walk(c));
        return changed ? rebuild(*n, std::move(copy)) : n;
    }
    if(auto m = as_map(*n)){
        map copy; copy.entries.reserve(m->entries.size());
        for(auto& kv : m->entries){
            auto k = walk(kv.first);
            copy.entries.emplace_back(k, walk(kv.second));
        }
        return changed ? rebuild(*n, std::move(copy)) : n;
    }
    return n; // atom
}

} // namespace lintexpand
