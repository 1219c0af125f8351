#pragma once
#include "lintexpand/config.hpp"
#include "lintexpand/diagnostics.hpp"
#include "lintexpand/registry.hpp"
#include "lintexpand/resolve.hpp"
#include <vector>

namespace lintexpand {

struct ExpandResult {
    node_ptr node;
    std::vector<Diagnostic> diagnostics;
    size_t rewrites = 0;
    bool success() const { return diagnostics.empty(); }
};

struct ModuleResult {
    std::vector<node_ptr> forms;
    std::vector<Diagnostic> diagnostics;
    size_t rewrites = 0;
    bool success() const { return diagnostics.empty(); }
};

// Host-side adapter around a Registry.
// Walks a tree and substitutes every registered invocation with its rewrite,
// then expands the rewrite again so invocations nested in bodies are handled too.
// Shape violations become config diagnostics; the offending invocation is kept
// as written and the walk carries on into its arguments and siblings.
// Untouched subtrees are returned as the same pointers.
class Expander {
public:
    explicit Expander(const Registry& registry, ExpandEnv env = detect_env())
        : registry_(registry), env_(env) {}

    NamespaceContext& namespaces(){ return ns_; }
    const NamespaceContext& namespaces() const { return ns_; }
    const ExpandEnv& env() const { return env_; }

    // Expand a single tree using the current namespace context.
    ExpandResult expand(const node_ptr& n);

    // Expand a sequence of top-level forms. (ns ...) forms update the namespace
    // context for the forms that follow them and are passed through unchanged.
    ModuleResult expand_all(const std::vector<node_ptr>& forms);

private:
    node_ptr expand_impl(const node_ptr& n, int depth, ExpandResult& out);
    node_ptr expand_children(const node_ptr& n, int depth, ExpandResult& out);

    const Registry& registry_;
    ExpandEnv env_;
    NamespaceContext ns_;
};

} // namespace lintexpand
