// LICENSE
// This software is free for use and redistribution while including this
// license notice, unless:
// 1. is used for commercial or non-personal purposes, or
// 2. used for a product which includes or associated with a blockchain or other
// decentralized database technology, or
// 3. used for a product which includes or associated with the issuance or use
// of cryptographic or electronic currencies/coins/tokens.
// On all of the mentioned cases, an explicit and written permission is required
// from the Author (Ohad Asor).
// Contact ohad@idni.org for requesting a permission. This license may be
// modified over time by the Author.
#include <set>
#include "printer.h"

using namespace std;

namespace robdd {

ostream_t& print_ordering(ostream_t& os, const strings& order) {
	os << '[';
	for (size_t n = 0; n != order.size(); ++n)
		os << (n ? ", " : "") << order[n];
	return os << ']';
}

ostream_t& print_listing(ostream_t& os, const bdd_manager& m, size_t root) {
	const string eq(50, '='), dash(40, '-');
	os << eq << "\nROBDD Output\n" << eq << "\n\n";
	print_ordering(os << "Variable ordering: ", m.variable_ordering())
		<< "\nRoot node index: " << root
		<< "\nTotal nodes: " << m.node_count() << "\n\n";
	if (m.is_true(root)) os << "Result: TAUTOLOGY (always TRUE)\n\n";
	else if (m.is_false(root))
		os << "Result: CONTRADICTION (always FALSE)\n\n";
	os << "Node listing:\n" << dash << '\n';
	for (size_t n = 0; n != m.node_count(); ++n) {
		node_info i = m.node_at(n);
		if (i.terminal) os << "  [" << n << "] Terminal: "
			<< (i.value ? "1 (TRUE)" : "0 (FALSE)") << '\n';
		else os << "  [" << n << "] Variable: " << i.var << '\n'
			<< "        Low (0) -> " << i.low << '\n'
			<< "        High (1) -> " << i.high << '\n';
	}
	return os;
}

namespace {

void dot_node(ostream_t& os, const bdd_manager& m, size_t x, set<size_t>& s) {
	if (!s.insert(x).second) return;
	node_info i = m.node_at(x);
	if (i.terminal) return;
	os << "    " << x << " [label=\"" << i.var << "\"];\n"
		<< "    " << x << " -> " << i.low
		<< " [style=dashed, color=red, label=\"0\"];\n"
		<< "    " << x << " -> " << i.high
		<< " [style=solid, color=blue, label=\"1\"];\n";
	dot_node(os, m, i.low, s), dot_node(os, m, i.high, s);
}

} // anonymous namespace

ostream_t& print_dot(ostream_t& os, const bdd_manager& m, size_t root) {
	set<size_t> s;
	os << "digraph BDD {\n    rankdir=TB;\n    node [shape=circle];\n\n"
		"    // Terminal nodes\n"
		"    0 [label=\"0\", shape=box, style=filled, fillcolor=\"#ffcccc\"];\n"
		"    1 [label=\"1\", shape=box, style=filled, fillcolor=\"#ccffcc\"];\n\n"
		"    // Decision nodes and edges\n";
	dot_node(os, m, root, s);
	return os << "}\n";
}

} // robdd namespace
