#include <gtest/gtest.h>
#include "lintexpand/resolve.hpp"
#include "test_support.hpp"

using namespace lintexpand;
using lintexpand::test::form;

TEST(NamespaceContext, QualifiesAliasesAndReferrals){
    NamespaceContext ns;
    ns.add_alias("core", "com.blockether.spel.core").add_refer("step", "com.blockether.spel.allure");
    EXPECT_EQ(ns.qualify("core/with-page"), "com.blockether.spel.core/with-page");
    EXPECT_EQ(ns.qualify("step"), "com.blockether.spel.allure/step");
    EXPECT_EQ(ns.qualify("other/with-page"), "other/with-page");
    EXPECT_EQ(ns.qualify("with-page"), "with-page");
    EXPECT_EQ(ns.qualify("/"), "/");
}

TEST(NamespaceContext, ScansRequireClauses){
    NamespaceContext ns;
    ASSERT_TRUE(ns.scan_ns_form(form(
        "(ns my.app.login-test"
        "  (:require [clojure.test :refer :all]"
        "            [com.blockether.spel.core :as core :refer [with-page]]"
        "            [com.blockether.spel.allure :as-alias allure]"
        "            com.blockether.spel.api)"
        "  (:import (java.util UUID)))")));
    EXPECT_EQ(ns.current(), "my.app.login-test");
    EXPECT_EQ(ns.qualify("core/with-browser"), "com.blockether.spel.core/with-browser");
    EXPECT_EQ(ns.qualify("with-page"), "com.blockether.spel.core/with-page");
    EXPECT_EQ(ns.qualify("allure/step"), "com.blockether.spel.allure/step");
    EXPECT_EQ(ns.qualify("deftest"), "deftest");
}

TEST(NamespaceContext, IgnoresOtherForms){
    NamespaceContext ns;
    EXPECT_FALSE(ns.scan_ns_form(form("(def x 1)")));
    EXPECT_FALSE(ns.scan_ns_form(form("[ns x]")));
    EXPECT_FALSE(ns.scan_ns_form(nullptr));
    EXPECT_TRUE(ns.current().empty());
}

TEST(NamespaceContext, Clear){
    NamespaceContext ns;
    ns.scan_ns_form(form("(ns a (:require [com.blockether.spel.core :as c]))"));
    ns.clear();
    EXPECT_EQ(ns.qualify("c/with-page"), "c/with-page");
    EXPECT_TRUE(ns.current().empty());
}
