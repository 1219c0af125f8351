#include "lintexpand/reader.hpp"
#include "prelude.hpp"
#include "grammar.hpp"
#include "actions.hpp"
#include <tao/pegtl.hpp>

namespace lintexpand {
using namespace lintexpand::reader_front;

std::vector<node_ptr> read_all(std::string_view src, std::string_view filename){
    std::string source = filename.empty() ? std::string("<memory>") : std::string(filename);
    tao::pegtl::memory_input in(src.data(), src.size(), source);
    build_state st;
    if(!filename.empty()) st.file = n_str(source);
    try {
        tao::pegtl::parse< grammar::file_rule, actions::action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        throw parse_error(e.what(), static_cast<int>(p.line), static_cast<int>(p.column));
    }
    return std::move(st.frames.front().elems);
}

node_ptr read_one(std::string_view src, std::string_view filename){
    auto forms = read_all(src, filename);
    if(forms.size() != 1)
        throw parse_error("expected exactly one form, found " + std::to_string(forms.size()));
    return forms.front();
}

} // namespace lintexpand
