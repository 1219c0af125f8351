// Rewrite rules for macros that introduce bindings (families 1-6 of the catalog).
#include "lintexpand/rules.hpp"

namespace lintexpand::rules {

static ShapeViolation arity_violation(const list& form, const std::string& expected, size_t got){
    std::string received = std::to_string(got) + (got == 1 ? " argument" : " arguments");
    ShapeViolation v{ "", expected, received };
    if(!form.elems.empty()){ v.line = line(*form.elems.front()); v.col = col(*form.elems.front()); }
    return v;
}

shape_result<node_ptr> single_resource_binding(const list& form){
    auto args = arguments(form);
    auto spec = match_binding_vector(nth_arg(args, 0), 1, 2);
    if(!spec){
        auto v = spec.violation();
        v.expected = "binding vector [sym] or [sym expr]";
        return v;
    }
    return synthesize_binding(spec.value(), tail(args, 1));
}

shape_result<node_ptr> flat_pair_bindings(const list& form){
    auto args = arguments(form);
    auto bindings = nth_arg(args, 0);
    auto spec = match_binding_vector(bindings, 0, unbounded_arity);
    if(!spec || as_vector(*bindings)->elems.size() % 2 != 0){
        return ShapeViolation{ "", "binding vector with an even number of forms", describe_shape(bindings),
                               bindings ? line(*bindings) : -1, bindings ? col(*bindings) : -1 };
    }
    // Pairs pass through untouched: the original vector node is the binding vector.
    return synthesize_binding(bindings, tail(args, 1));
}

shape_result<node_ptr> config_map_binding(const list& form){
    auto args = arguments(form);
    if(args.empty()) return arity_violation(form, "configuration expression followed by a body", 0);
    return synthesize_binding(BindingSpec{ { anonymous_placeholder(), args[0] } }, tail(args, 1));
}

shape_result<node_ptr> optional_config(const list& form){
    auto args = arguments(form);
    if(args.size() > 1){
        return synthesize_binding(BindingSpec{ { anonymous_placeholder(), args[0] } }, tail(args, 1));
    }
    return synthesize_sequence(args);
}

shape_result<node_ptr> optional_config_symbol(const list& form){
    auto args = arguments(form);
    auto first = nth_arg(args, 0);
    // A vector in first position means the configuration was omitted.
    bool omitted = is_vector_shaped(first);
    auto binding_vec = omitted ? first : nth_arg(args, 1);
    auto spec = match_binding_vector(binding_vec, 1, 1);
    if(!spec) return spec.violation();
    BindingSpec pairs{
        { anonymous_placeholder(), omitted ? empty_map_placeholder() : first },
        spec.value().front()
    };
    return synthesize_binding(pairs, tail(args, omitted ? 1 : 2));
}

shape_result<node_ptr> fixed_three_argument(const list& form){
    auto args = arguments(form);
    if(args.size() < 3) return arity_violation(form, "two expressions and a binding vector", args.size());
    auto spec = match_binding_vector(args[2], 1, 1);
    if(!spec) return spec.violation();
    // Self-bound pairs force analysis of both expressions without renaming them.
    BindingSpec pairs{
        { args[0], args[0] },
        { args[1], args[1] },
        spec.value().front()
    };
    return synthesize_binding(pairs, tail(args, 3));
}

} // namespace lintexpand::rules
