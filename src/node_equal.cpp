// Structural equality over node trees.
#include "lintexpand/node.hpp"
#include <vector>

namespace lintexpand {

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	if (!ignore_meta) {
		if (a->metadata.size() != b->metadata.size()) return false;
		for (const auto& kv : a->metadata) {
			auto it = b->metadata.find(kv.first);
			if (it == b->metadata.end()) return false;
			if (!equal_impl(kv.second, it->second, ignore_meta)) return false;
		}
	}

	struct Visitor {
		const node_ptr& a; const node_ptr& b; bool ignore_meta;
		static bool cmp(const node_ptr& x, const node_ptr& y, bool ig) { return equal_impl(x, y, ig); }
		static bool cmp_seq(const std::vector<node_ptr>& le, const std::vector<node_ptr>& re, bool ig) {
			if (le.size() != re.size()) return false;
			for (size_t i = 0; i < le.size(); ++i) if (!cmp(le[i], re[i], ig)) return false;
			return true;
		}
		bool operator()(const token&) const { return std::get<token>(a->data).value == std::get<token>(b->data).value; }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const list&) const { return cmp_seq(std::get<list>(a->data).elems, std::get<list>(b->data).elems, ignore_meta); }
		bool operator()(const vector_t&) const { return cmp_seq(std::get<vector_t>(a->data).elems, std::get<vector_t>(b->data).elems, ignore_meta); }
		// Maps compare entry by entry, in source order.
		bool operator()(const map&) const {
			const auto& lm = std::get<map>(a->data).entries;
			const auto& rm = std::get<map>(b->data).entries;
			if (lm.size() != rm.size()) return false;
			for (size_t i = 0; i < lm.size(); ++i) {
				if (!cmp(lm[i].first, rm[i].first, ignore_meta) || !cmp(lm[i].second, rm[i].second, ignore_meta)) return false;
			}
			return true;
		}
	};

	return std::visit(Visitor{a, b, ignore_meta}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata) { return equal_impl(a, b, ignore_metadata); }

} // namespace lintexpand
