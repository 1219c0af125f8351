// Rewrite rules for step and test-definition macros (families 7-11 of the catalog).
// None of these introduce bindings except parameter_capture.
#include "lintexpand/rules.hpp"

namespace lintexpand::rules {

shape_result<node_ptr> label_stripping(const list& form){
    auto args = arguments(form);
    // A lone label may be any expression and is analyzed; with a body it is dropped whatever its shape.
    if(args.size() == 1) return synthesize_sequence(args);
    return synthesize_sequence(tail(args, 1));
}

shape_result<node_ptr> doc_skipping_definition(const list& form){
    auto args = arguments(form);
    auto name = nth_arg(args, 0);
    if(!name || !is_token(*name)){
        ShapeViolation v{ "", "name symbol", describe_shape(name) };
        if(name){ v.line = line(*name); v.col = col(*name); }
        return v;
    }
    size_t first_child = is_string_literal(nth_arg(args, 1)) ? 2 : 1;
    std::vector<node_ptr> children{ synthesize_declaration(name) };
    for(auto& c : tail(args, first_child)) children.push_back(c);
    return synthesize_sequence(children);
}

shape_result<node_ptr> doc_skipping_body(const list& form){
    return synthesize_sequence(tail(arguments(form), 1));
}

shape_result<node_ptr> body_only(const list& form){
    return synthesize_sequence(arguments(form));
}

shape_result<node_ptr> parameter_capture(const list& form){
    auto args = arguments(form);
    auto params = nth_arg(args, 0);
    if(!is_vector_shaped(params)){
        return ShapeViolation{ "", "parameter vector", describe_shape(params),
                               params ? line(*params) : -1, params ? col(*params) : -1 };
    }
    return synthesize_function_literal(params, tail(args, 1));
}

} // namespace lintexpand::rules
