#pragma once
#include "lintexpand/shape.hpp"
#include <functional>

namespace lintexpand {

class Registry;

// A rewrite rule receives the whole invocation (head token included) and returns
// the replacement tree or a violation. Rules are pure and hold no state.
using RuleFn = std::function<shape_result<node_ptr>(const list& form)>;

namespace rules {

// (m [sym] body...) / (m [sym expr] body...)  ->  (let [sym nil|expr] body...)
shape_result<node_ptr> single_resource_binding(const list& form);
// (m [a ea b eb ...] body...)  ->  (let [a ea b eb ...] body...)
shape_result<node_ptr> flat_pair_bindings(const list& form);
// (m cfg body...)  ->  (let [_ cfg] body...)
shape_result<node_ptr> config_map_binding(const list& form);
// (m x)  ->  (do x);  (m cfg body...)  ->  (let [_ cfg] body...)
shape_result<node_ptr> optional_config(const list& form);
// (m [sym] body...) / (m cfg [sym] body...)  ->  (let [_ cfg|{} sym nil] body...)
shape_result<node_ptr> optional_config_symbol(const list& form);
// (m a b [sym] body...)  ->  (let [a a b b sym nil] body...)
shape_result<node_ptr> fixed_three_argument(const list& form);

// (m label)  ->  (do label);  (m label body...)  ->  (do body...)
shape_result<node_ptr> label_stripping(const list& form);
// (m name "doc"? attrs? children...)  ->  (do (def name nil) attrs? children...)
shape_result<node_ptr> doc_skipping_definition(const list& form);
// (m doc rest...)  ->  (do rest...)
shape_result<node_ptr> doc_skipping_body(const list& form);
// (m body...)  ->  (do body...)
shape_result<node_ptr> body_only(const list& form);
// (m [params] body...)  ->  (fn [params] body...)
shape_result<node_ptr> parameter_capture(const list& form);

} // namespace rules

// Namespaces of the built-in catalog.
inline constexpr const char* core_ns = "com.blockether.spel.core";
inline constexpr const char* api_ns = "com.blockether.spel.api";
inline constexpr const char* allure_ns = "com.blockether.spel.allure";

// Grouped registration functions. Each installs a related set of rules.
void register_lifecycle_rules(Registry&);  // core/ and api/ resource macros
void register_allure_rules(Registry&);     // allure/ steps and test-definition macros

} // namespace lintexpand
