#include <gtest/gtest.h>
#include "lintexpand/expand.hpp"
#include "test_support.hpp"

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

TEST(Expander, NestedInvocationsAreRewritten){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto res = ex.expand(form("(with-thing [x (foo)] (step \"s\" (bar x)))"));
    EXPECT_TRUE(res.success());
    EXPECT_EQ(res.rewrites, 2u);
    EXPECT_TRUE(same_tree("(let [x (foo)] (do (bar x)))", res.node));
}

TEST(Expander, UntouchedTreeKeepsIdentity){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto in = form("(defn f [a] {:k [a (g a)]})");
    auto res = ex.expand(in);
    EXPECT_EQ(res.node.get(), in.get());
    EXPECT_EQ(res.rewrites, 0u);
}

TEST(Expander, UnchangedSiblingsAreShared){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto in = form("(do (a) (with-thing [x] x))");
    auto res = ex.expand(in);
    ASSERT_NE(res.node.get(), in.get());
    EXPECT_EQ(elems_of(res.node)[1].get(), elems_of(in)[1].get());
    EXPECT_EQ(res.node->metadata.at("line").get(), in->metadata.at("line").get());
    EXPECT_TRUE(same_tree("(do (a) (let [x nil] x))", res.node));
}

TEST(Expander, WalksVectorsAndMaps){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto res = ex.expand(form("[{:k (with-thing [y] y) (step \"key\") 1}]"));
    EXPECT_TRUE(same_tree("[{:k (let [y nil] y) (do \"key\") 1}]", res.node));
    EXPECT_EQ(res.rewrites, 2u);
}

TEST(Expander, ViolationKeepsFormAndContinues){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto in = form("(do (with-thing [] (step \"s\" (a))) (step \"t\"))");
    auto res = ex.expand(in);
    ASSERT_EQ(res.diagnostics.size(), 1u);
    const auto& d = res.diagnostics.front();
    EXPECT_EQ(d.category, DiagnosticCategory::config);
    EXPECT_EQ(d.code, "C0100");
    EXPECT_EQ(d.message, "invalid arguments to with-thing");
    EXPECT_EQ(d.line, 1);
    EXPECT_EQ(d.col, 17);
    EXPECT_TRUE(same_tree("(do (with-thing [] (do (a))) (do \"t\"))", res.node));
    EXPECT_EQ(res.rewrites, 2u);
    EXPECT_FALSE(res.success());
}

TEST(Expander, DepthLimitStopsSelfRewritingRules){
    Registry reg;
    reg.add("again", [](const list& f) -> shape_result<node_ptr> { return node_list(f.elems); });
    ExpandEnv env;
    env.maxDepth = 8;
    Expander ex(reg, env);
    auto res = ex.expand(form("(again x)"));
    ASSERT_EQ(res.diagnostics.size(), 1u);
    EXPECT_EQ(res.diagnostics.front().code, "C0101");
    EXPECT_EQ(res.rewrites, 8u);
    EXPECT_TRUE(same_tree("(again x)", res.node));
}

TEST(Expander, DepthCountsNestedRewrites){
    auto reg = small_registry();
    ExpandEnv env;
    env.maxDepth = 1;
    Expander ex(reg, env);
    auto res = ex.expand(form("(with-thing [a] (with-thing [b] b))"));
    ASSERT_EQ(res.diagnostics.size(), 1u);
    EXPECT_EQ(res.diagnostics.front().code, "C0101");
    EXPECT_TRUE(same_tree("(let [a nil] (with-thing [b] b))", res.node));
}

TEST(Expander, ExpandAllTracksNamespaceAliases){
    Expander ex(default_registry(), ExpandEnv{});
    auto forms = read_all(
        "(ns my.login-test (:require [com.blockether.spel.core :as core]"
        "                            [com.blockether.spel.allure :refer [step]]))\n"
        "(core/with-page [pg] (step \"open\" (navigate pg)))\n"
        "(with-page [pg] (f pg))");
    auto mod = ex.expand_all(forms);
    ASSERT_EQ(mod.forms.size(), 3u);
    EXPECT_EQ(mod.forms[0].get(), forms[0].get());
    EXPECT_TRUE(same_tree("(let [pg nil] (do (navigate pg)))", mod.forms[1]));
    // with-page was not referred, so it stays as written.
    EXPECT_EQ(mod.forms[2].get(), forms[2].get());
    EXPECT_EQ(mod.rewrites, 2u);
    EXPECT_TRUE(mod.success());
    EXPECT_EQ(ex.namespaces().current(), "my.login-test");
}

TEST(Expander, ExpandAllCollectsDiagnostics){
    Expander ex(default_registry(), ExpandEnv{});
    auto mod = ex.expand_all(read_all(
        "(com.blockether.spel.api/with-hooks)\n"
        "(com.blockether.spel.allure/around run (run))"));
    ASSERT_EQ(mod.diagnostics.size(), 2u);
    EXPECT_EQ(mod.diagnostics[0].message, "invalid arguments to com.blockether.spel.api/with-hooks");
    EXPECT_EQ(mod.diagnostics[1].line, 2);
    EXPECT_FALSE(mod.success());
}

TEST(Expander, InvocationsBesideAndInsideFunctionLiterals){
    auto reg = small_registry();
    Expander ex(reg, ExpandEnv{});
    auto res = ex.expand(form("(do #(step \"s\" (click %)) (with-thing [x] x))"));
    EXPECT_TRUE(res.success());
    EXPECT_EQ(res.rewrites, 2u);
    EXPECT_TRUE(same_tree("(do (fn* (do (click %))) (let [x nil] x))", res.node));
}

TEST(Expander, FileWithRegexAndVarQuotesStillExpands){
    Expander ex(default_registry(), ExpandEnv{});
    auto mod = ex.expand_all(read_all(
        "(ns t (:require [com.blockether.spel.allure :as allure]))\n"
        "(def pattern #\"^/api/\\d+\")\n"
        "(allure/it \"matches\" (is (re-find pattern (path #'handler))))"));
    ASSERT_EQ(mod.forms.size(), 3u);
    EXPECT_TRUE(mod.success());
    EXPECT_TRUE(same_tree("(do (is (re-find pattern (path (var handler)))))", mod.forms[2]));
}

TEST(Expander, DeepSourceNestingReportsTheLimit){
    auto reg = small_registry();
    const char* src = "(step \"a\" (step \"b\" (step \"c\" (step \"d\" (click)))))";
    ExpandEnv env;
    env.maxDepth = 3;
    auto res = Expander(reg, env).expand(form(src));
    ASSERT_EQ(res.diagnostics.size(), 1u);
    const auto& d = res.diagnostics.front();
    EXPECT_EQ(d.code, "C0101");
    EXPECT_EQ(d.message, "step is nested inside 3 expanded macro invocations");
    EXPECT_NE(d.hint.find("LINTEXPAND_MAX_DEPTH (currently 3)"), std::string::npos);
    EXPECT_EQ(d.hint.find("rewrite into themselves"), std::string::npos);
    EXPECT_TRUE(same_tree("(do (do (do (step \"d\" (click)))))", res.node));

    auto full = Expander(reg, ExpandEnv{}).expand(form(src));
    EXPECT_TRUE(full.success());
    EXPECT_TRUE(same_tree("(do (do (do (do (click)))))", full.node));
}
