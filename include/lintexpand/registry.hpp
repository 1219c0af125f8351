#pragma once
#include "lintexpand/rules.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lintexpand {

// Name of the macro an invocation calls: the value of its head token.
// std::nullopt when n is not a list or its first child is not a token.
std::optional<std::string> invocation_name(const node& n);

// Table from fully-qualified macro name to rewrite rule.
// Built once, then only read: lookup and dispatch are const and safe to call
// from any number of threads.
class Registry {
public:
    // Register a rule for a macro name. Re-registering a name replaces the rule.
    Registry& add(std::string name, RuleFn fn);

    const RuleFn* lookup(const std::string& name) const;
    bool contains(const std::string& name) const { return lookup(name) != nullptr; }
    size_t size() const { return rules_.size(); }
    std::vector<std::string> names() const; // sorted

    // Rewrite one invocation, keyed by its head token.
    // Unregistered heads and non-invocations come back unchanged (same pointer).
    shape_result<node_ptr> dispatch(const node_ptr& invocation) const;
    // Same, with the name already resolved by the caller (e.g. alias-qualified).
    shape_result<node_ptr> dispatch_as(const std::string& name, const node_ptr& invocation) const;

private:
    std::unordered_map<std::string, RuleFn> rules_;
};

// Fresh registry holding the built-in catalog; hosts may add their own rules to it.
Registry make_default_registry();
// Process-wide built-in catalog, built on first use.
const Registry& default_registry();

} // namespace lintexpand
