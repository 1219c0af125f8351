#pragma once
#include "lintexpand/node.hpp"
#include <string>
#include <unordered_map>

namespace lintexpand {

// Maps the names written at a call site to the fully-qualified names the registry is keyed by.
//   (ns my.test (:require [com.blockether.spel.core :as core :refer [with-page]]))
//   core/with-browser -> com.blockether.spel.core/with-browser
//   with-page         -> com.blockether.spel.core/with-page
class NamespaceContext {
public:
    NamespaceContext& add_alias(std::string alias, std::string ns){ aliases_[std::move(alias)] = std::move(ns); return *this; }
    NamespaceContext& add_refer(std::string name, std::string ns){ refers_[std::move(name)] = std::move(ns); return *this; }

    const std::string& current() const { return current_; }

    // Qualified name for a head token. Unknown aliases and unreferred bare names come back as written.
    std::string qualify(const std::string& head) const;

    // Record aliases and referrals from an (ns ...) form. Returns false, recording nothing, for any other form.
    bool scan_ns_form(const node_ptr& form);

    void clear(){ aliases_.clear(); refers_.clear(); current_.clear(); }

private:
    void scan_libspec(const node_ptr& spec);

    std::string current_;
    std::unordered_map<std::string, std::string> aliases_;
    std::unordered_map<std::string, std::string> refers_;
};

} // namespace lintexpand
