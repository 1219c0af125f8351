#include "lintexpand/registry.hpp"
#include <algorithm>

namespace lintexpand {

std::optional<std::string> invocation_name(const node& n){
    auto l = as_list(n);
    if(!l || l->elems.empty() || !l->elems.front()) return std::nullopt;
    auto head = as_token(*l->elems.front());
    if(!head) return std::nullopt;
    return head->value;
}

Registry& Registry::add(std::string name, RuleFn fn){
    rules_[std::move(name)] = std::move(fn);
    return *this;
}

const RuleFn* Registry::lookup(const std::string& name) const {
    auto it = rules_.find(name);
    return it == rules_.end() ? nullptr : &it->second;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for(auto& kv : rules_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

shape_result<node_ptr> Registry::dispatch(const node_ptr& invocation) const {
    if(!invocation) return invocation;
    auto name = invocation_name(*invocation);
    if(!name) return invocation;
    return dispatch_as(*name, invocation);
}

shape_result<node_ptr> Registry::dispatch_as(const std::string& name, const node_ptr& invocation) const {
    auto rule = lookup(name);
    if(!rule || !invocation || !is_list(*invocation)) return invocation;
    auto result = (*rule)(std::get<list>(invocation->data));
    if(!result){
        auto v = result.violation();
        v.macro = name;
        if(v.line < 0){ v.line = line(*invocation); v.col = col(*invocation); }
        return v;
    }
    // The replacement stands in for the invocation: same span, same metadata entries.
    return rebuild(*invocation, result.value()->data);
}

Registry make_default_registry(){
    Registry r;
    register_lifecycle_rules(r);
    register_allure_rules(r);
    return r;
}

const Registry& default_registry(){
    static const Registry instance = make_default_registry();
    return instance;
}

} // namespace lintexpand
