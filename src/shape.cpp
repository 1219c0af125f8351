#include "lintexpand/shape.hpp"

namespace lintexpand {

node_ptr nil_placeholder() { return n_tok("nil"); }
node_ptr anonymous_placeholder() { return n_tok("_"); }
node_ptr empty_map_placeholder() { return node_map(); }

bool is_vector_shaped(const node_ptr& n) { return n && is_vector(*n); }
bool is_string_literal(const node_ptr& n) { return n && is_string(*n); }

static std::string plural(size_t n, const char* word){
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

std::string describe_shape(const node_ptr& n){
    if(!n) return "nothing";
    if(auto t = as_token(*n)) return "token `" + t->value + "`";
    if(is_string(*n)) return "string literal";
    if(auto l = as_list(*n)) return "list of " + plural(l->elems.size(), "element");
    if(auto v = as_vector(*n)) return "vector of " + plural(v->elems.size(), "element");
    return "map of " + plural(as_map(*n)->entries.size(), "entry");
}

static std::string arity_text(size_t min_arity, size_t max_arity){
    if(min_arity == max_arity) return "binding vector of exactly " + plural(min_arity, "element");
    if(max_arity == unbounded_arity) return "binding vector of at least " + plural(min_arity, "element");
    return "binding vector of " + std::to_string(min_arity) + " to " + plural(max_arity, "element");
}

shape_result<BindingSpec> match_binding_vector(const node_ptr& n, size_t min_arity, size_t max_arity){
    if(!is_vector_shaped(n)){
        return ShapeViolation{ "", arity_text(min_arity, max_arity), describe_shape(n), n ? line(*n) : -1, n ? col(*n) : -1 };
    }
    const auto& elems = as_vector(*n)->elems;
    if(elems.size() < min_arity || elems.size() > max_arity){
        return ShapeViolation{ "", arity_text(min_arity, max_arity), describe_shape(n), line(*n), col(*n) };
    }
    BindingSpec spec;
    spec.reserve((elems.size() + 1) / 2);
    for(size_t i = 0; i < elems.size(); i += 2){
        spec.push_back(binding_pair{ elems[i], i + 1 < elems.size() ? elems[i + 1] : nil_placeholder() });
    }
    return spec;
}

std::vector<node_ptr> arguments(const list& form){
    if(form.elems.empty()) return {};
    return std::vector<node_ptr>(form.elems.begin() + 1, form.elems.end());
}

std::vector<node_ptr> tail(const std::vector<node_ptr>& args, size_t from){
    if(from >= args.size()) return {};
    return std::vector<node_ptr>(args.begin() + static_cast<std::ptrdiff_t>(from), args.end());
}

node_ptr synthesize_binding(const BindingSpec& pairs, const std::vector<node_ptr>& body){
    vector_t bindings;
    for(auto& p : pairs) bindings << p.symbol << p.expr;
    return synthesize_binding(detail::make_node(std::move(bindings)), body);
}

node_ptr synthesize_binding(const node_ptr& bindings, const std::vector<node_ptr>& body){
    list form;
    form << n_tok("let") << bindings;
    for(auto& b : body) form << b;
    return detail::make_node(std::move(form));
}

node_ptr synthesize_sequence(const std::vector<node_ptr>& children){
    list form;
    form << n_tok("do");
    for(auto& c : children) form << c;
    return detail::make_node(std::move(form));
}

node_ptr synthesize_function_literal(const node_ptr& params, const std::vector<node_ptr>& body){
    list form;
    form << n_tok("fn") << params;
    for(auto& b : body) form << b;
    return detail::make_node(std::move(form));
}

node_ptr synthesize_declaration(const node_ptr& name, const node_ptr& init){
    list form;
    form << n_tok("def") << name << (init ? init : nil_placeholder());
    return detail::make_node(std::move(form));
}

} // namespace lintexpand
