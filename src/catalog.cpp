// Built-in catalog: which macro uses which rewrite rule.
#include "lintexpand/registry.hpp"

namespace lintexpand {

static std::string qualified(const char* ns, const char* name){
    return std::string(ns) + "/" + name;
}

void register_lifecycle_rules(Registry& r){
    for(auto name : { "with-playwright", "with-browser", "with-context", "with-page" })
        r.add(qualified(core_ns, name), rules::single_resource_binding);
    r.add(qualified(api_ns, "with-api-context"), rules::single_resource_binding);
    r.add(qualified(api_ns, "with-api-contexts"), rules::flat_pair_bindings);
    r.add(qualified(api_ns, "with-hooks"), rules::config_map_binding);
    r.add(qualified(api_ns, "with-retry"), rules::optional_config);
    r.add(qualified(api_ns, "with-testing-api"), rules::optional_config_symbol);
    r.add(qualified(core_ns, "with-testing-page"), rules::optional_config_symbol);
    r.add(qualified(api_ns, "with-page-api"), rules::fixed_three_argument);
}

void register_allure_rules(Registry& r){
    r.add(qualified(allure_ns, "step"), rules::label_stripping);
    // ui-step and api-step always carry a body; their label is dropped like a doc string.
    for(auto name : { "ui-step", "api-step" })
        r.add(qualified(allure_ns, name), rules::doc_skipping_body);

    r.add(qualified(allure_ns, "defdescribe"), rules::doc_skipping_definition);
    for(auto name : { "describe", "context", "it", "specify", "expect-it" })
        r.add(qualified(allure_ns, name), rules::doc_skipping_body);
    for(auto name : { "expect", "should", "before", "after", "before-each", "after-each" })
        r.add(qualified(allure_ns, name), rules::body_only);
    r.add(qualified(allure_ns, "around"), rules::parameter_capture);
}

} // namespace lintexpand
