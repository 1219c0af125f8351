#include <gtest/gtest.h>
#include "lintexpand/registry.hpp"
#include "test_support.hpp"
#include <thread>
#include <atomic>
#include <algorithm>
#include <vector>

using namespace lintexpand;
using lintexpand::test::elems_of;
using lintexpand::test::form;
using lintexpand::test::same_tree;

static Registry small_registry(){
    Registry r;
    r.add("with-thing", rules::single_resource_binding)
     .add("step", rules::label_stripping);
    return r;
}

TEST(Registry, InvocationName){
    EXPECT_EQ(invocation_name(*form("(step \"a\")")), std::optional<std::string>("step"));
    EXPECT_FALSE(invocation_name(*form("[step]")));
    EXPECT_FALSE(invocation_name(*form("()")));
    EXPECT_FALSE(invocation_name(*form("((f) x)")));
}

TEST(Registry, LookupAndReplace){
    auto r = small_registry();
    EXPECT_EQ(r.size(), 2u);
    EXPECT_TRUE(r.contains("step"));
    EXPECT_EQ(r.lookup("missing"), nullptr);
    r.add("step", rules::body_only);
    EXPECT_EQ(r.size(), 2u);
    auto out = r.dispatch(form("(step \"a\" (x))"));
    ASSERT_TRUE(out);
    EXPECT_TRUE(same_tree("(do \"a\" (x))", out.value()));
}

TEST(Registry, UnregisteredIsIdentity){
    auto r = small_registry();
    auto inv = form("(other [x] y)");
    auto out = r.dispatch(inv);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value().get(), inv.get());
    auto vec = form("[with-thing [x]]");
    EXPECT_EQ(r.dispatch(vec).value().get(), vec.get());
    auto atom = form("with-thing");
    EXPECT_EQ(r.dispatch(atom).value().get(), atom.get());
}

TEST(Registry, ViolationNamesTheMacro){
    auto r = small_registry();
    auto out = r.dispatch(form("(with-thing [] x)"));
    ASSERT_FALSE(out);
    EXPECT_EQ(out.violation().macro, "with-thing");
    EXPECT_EQ(out.violation().line, 1);
    EXPECT_EQ(out.violation().col, 13);
}

TEST(Registry, ViolationFallsBackToInvocationPosition){
    Registry r;
    r.add("bad", [](const list&) -> shape_result<node_ptr> { return ShapeViolation{ "", "anything", "something" }; });
    auto out = r.dispatch(read_one("\n  (bad)"));
    ASSERT_FALSE(out);
    EXPECT_EQ(out.violation().macro, "bad");
    EXPECT_EQ(out.violation().line, 2);
    EXPECT_EQ(out.violation().col, 3);
}

TEST(Registry, ReplacementInheritsInvocationMetadata){
    auto r = small_registry();
    auto inv = read_one("(with-thing [x (open)] (use x))", "a_test.clj");
    auto out = r.dispatch(inv);
    ASSERT_TRUE(out);
    ASSERT_NE(out.value().get(), inv.get());
    for(auto key : { "line", "col", "end-line", "end-col", "file" })
        EXPECT_EQ(out.value()->metadata.at(key).get(), inv->metadata.at(key).get()) << key;
    // Reused children keep their own positions.
    auto body = elems_of(out.value())[2];
    EXPECT_EQ(col(*body), 24);
}

TEST(Registry, DispatchAsUsesTheGivenName){
    auto r = small_registry();
    auto inv = form("(t/step \"a\" (x))");
    auto out = r.dispatch(inv);
    EXPECT_EQ(out.value().get(), inv.get());
    auto named = r.dispatch_as("step", inv);
    ASSERT_TRUE(named);
    EXPECT_TRUE(same_tree("(do (x))", named.value()));
}

TEST(DefaultRegistry, CatalogNames){
    const auto& r = default_registry();
    EXPECT_EQ(r.size(), 27u);
    for(auto name : { "com.blockether.spel.core/with-playwright", "com.blockether.spel.core/with-browser",
                      "com.blockether.spel.core/with-context", "com.blockether.spel.core/with-page",
                      "com.blockether.spel.core/with-testing-page", "com.blockether.spel.api/with-api-context",
                      "com.blockether.spel.api/with-api-contexts", "com.blockether.spel.api/with-hooks",
                      "com.blockether.spel.api/with-retry", "com.blockether.spel.api/with-testing-api",
                      "com.blockether.spel.api/with-page-api", "com.blockether.spel.allure/step",
                      "com.blockether.spel.allure/ui-step", "com.blockether.spel.allure/api-step",
                      "com.blockether.spel.allure/defdescribe", "com.blockether.spel.allure/describe",
                      "com.blockether.spel.allure/context", "com.blockether.spel.allure/it",
                      "com.blockether.spel.allure/specify", "com.blockether.spel.allure/expect-it",
                      "com.blockether.spel.allure/expect", "com.blockether.spel.allure/should",
                      "com.blockether.spel.allure/before", "com.blockether.spel.allure/after",
                      "com.blockether.spel.allure/before-each", "com.blockether.spel.allure/after-each",
                      "com.blockether.spel.allure/around" })
        EXPECT_TRUE(r.contains(name)) << name;
    auto names = r.names();
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

TEST(DefaultRegistry, SingleInstance){
    EXPECT_EQ(&default_registry(), &default_registry());
}

TEST(DefaultRegistry, HostsCanExtendAFreshCopy){
    auto r = make_default_registry();
    r.add("my.ns/with-session", rules::single_resource_binding);
    EXPECT_EQ(r.size(), 28u);
    EXPECT_FALSE(default_registry().contains("my.ns/with-session"));
}

TEST(DefaultRegistry, UiStepDropsItsLabel){
    auto out = default_registry().dispatch(form("(com.blockether.spel.allure/ui-step \"Click\" (click b))"));
    ASSERT_TRUE(out);
    EXPECT_TRUE(same_tree("(do (click b))", out.value()));
}

TEST(DefaultRegistry, ConcurrentDispatch){
    auto inv = form("(com.blockether.spel.core/with-page [pg (new-page ctx)] (navigate pg))");
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for(int t = 0; t < 4; ++t){
        workers.emplace_back([&]{
            for(int i = 0; i < 200; ++i){
                auto out = default_registry().dispatch(inv);
                if(!out || !equal(out.value(), read_one("(let [pg (new-page ctx)] (navigate pg))"))) ++failures;
            }
        });
    }
    for(auto& w : workers) w.join();
    EXPECT_EQ(failures.load(), 0);
}
