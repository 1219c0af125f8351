// Argument shape matching and canonical form synthesis for rewrite rules.
#pragma once
#include "lintexpand/node.hpp"
#include <cstddef>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace lintexpand {

// An invocation's arguments do not have the shape its rule requires.
// `macro` is filled in by the dispatcher; rules leave it empty.
struct ShapeViolation {
    std::string macro;
    std::string expected;
    std::string received;
    int line = -1;
    int col = -1;
};

// Value-or-violation return used throughout the rewrite core (which never throws).
template <typename T>
class shape_result {
public:
    shape_result(T value) : data_(std::move(value)) {}
    shape_result(ShapeViolation violation) : data_(std::move(violation)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    const ShapeViolation& violation() const { return std::get<ShapeViolation>(data_); }
    ShapeViolation& violation() { return std::get<ShapeViolation>(data_); }

private:
    std::variant<T, ShapeViolation> data_;
};

struct binding_pair {
    node_ptr symbol;
    node_ptr expr;
};
using BindingSpec = std::vector<binding_pair>;

constexpr std::size_t unbounded_arity = std::numeric_limits<std::size_t>::max();

// Placeholders. Each call allocates a fresh node without source position.
node_ptr nil_placeholder();        // nil
node_ptr anonymous_placeholder();  // _
node_ptr empty_map_placeholder();  // {}

bool is_vector_shaped(const node_ptr& n);
bool is_string_literal(const node_ptr& n);

// Short human description of a node's shape, used in violation messages ("vector of 3 elements").
std::string describe_shape(const node_ptr& n);

// Split a vector node into (symbol, expression) pairs.
// Fails if n is null, not a vector, or has fewer than min_arity / more than max_arity children.
// A trailing unpaired symbol is bound to nil_placeholder().
shape_result<BindingSpec> match_binding_vector(const node_ptr& n, std::size_t min_arity, std::size_t max_arity);

// Argument access on raw invocations: (head arg0 arg1 ...)
std::vector<node_ptr> arguments(const list& form);
std::vector<node_ptr> tail(const std::vector<node_ptr>& args, std::size_t from);
inline node_ptr nth_arg(const std::vector<node_ptr>& args, std::size_t i) { return i < args.size() ? args[i] : nullptr; }

// Canonical constructs. Children are referenced, never copied.
node_ptr synthesize_binding(const BindingSpec& pairs, const std::vector<node_ptr>& body);     // (let [s e ...] body...)
node_ptr synthesize_binding(const node_ptr& bindings, const std::vector<node_ptr>& body);    // (let bindings body...) reusing the vector node
node_ptr synthesize_sequence(const std::vector<node_ptr>& children);                          // (do children...)
node_ptr synthesize_function_literal(const node_ptr& params, const std::vector<node_ptr>& body); // (fn params body...)
node_ptr synthesize_declaration(const node_ptr& name, const node_ptr& init = nullptr);       // (def name init|nil)

} // namespace lintexpand
