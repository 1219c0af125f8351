#include "lintexpand/resolve.hpp"

namespace lintexpand {

std::string NamespaceContext::qualify(const std::string& head) const {
    auto slash = head.find('/');
    if(slash != std::string::npos && slash > 0 && slash + 1 < head.size()){
        auto it = aliases_.find(head.substr(0, slash));
        if(it == aliases_.end()) return head;
        return it->second + head.substr(slash);
    }
    auto it = refers_.find(head);
    if(it == refers_.end()) return head;
    return it->second + "/" + head;
}

static const std::string* token_value(const node_ptr& n){
    if(!n) return nullptr;
    auto t = as_token(*n);
    return t ? &t->value : nullptr;
}

void NamespaceContext::scan_libspec(const node_ptr& spec){
    // Bare lib symbol: nothing to record, qualified calls already match.
    auto v = spec ? as_vector(*spec) : nullptr;
    if(!v || v->elems.empty()) return;
    auto lib = token_value(v->elems[0]);
    if(!lib) return;
    for(size_t i = 1; i + 1 < v->elems.size(); i += 2){
        auto opt = token_value(v->elems[i]);
        if(!opt) continue;
        const auto& arg = v->elems[i + 1];
        if(*opt == ":as" || *opt == ":as-alias"){
            if(auto alias = token_value(arg)) add_alias(*alias, *lib);
        } else if(*opt == ":refer"){
            // :refer :all cannot be resolved without the library's source
            auto names = arg ? as_vector(*arg) : nullptr;
            if(!names) continue;
            for(auto& n : names->elems)
                if(auto name = token_value(n)) add_refer(*name, *lib);
        }
    }
}

bool NamespaceContext::scan_ns_form(const node_ptr& form){
    auto l = form ? as_list(*form) : nullptr;
    if(!l || l->elems.size() < 2) return false;
    auto head = token_value(l->elems[0]);
    if(!head || *head != "ns") return false;
    if(auto name = token_value(l->elems[1])) current_ = *name;
    for(size_t i = 2; i < l->elems.size(); ++i){
        auto clause = l->elems[i] ? as_list(*l->elems[i]) : nullptr;
        if(!clause || clause->elems.empty()) continue;
        auto kind = token_value(clause->elems[0]);
        if(!kind || *kind != ":require") continue;
        for(size_t j = 1; j < clause->elems.size(); ++j) scan_libspec(clause->elems[j]);
    }
    return true;
}

} // namespace lintexpand
