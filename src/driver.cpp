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
#include <limits>
#include "driver.h"
#include "printer.h"
#include "err.h"

using namespace std;

namespace robdd {

namespace {

string trim(const string& s) {
	size_t b = 0, e = s.size();
	while (b < e && input::is_space(s[b])) ++b;
	while (e > b && input::is_space(s[e - 1])) --e;
	return s.substr(b, e - b);
}

} // anonymous namespace

driver::driver(const options& o) : opts(o),
	order(split_names(o.get_string("order")))
{
	DBG(o::dbg() << "driver: " << opts << endl;)
}

bool driver::run() {
	for (const string& f : opts.formulas()) formula(f, order);
	if (inputs* ii = opts.get_inputs())
		for (size_t n = 0; n != ii->size(); ++n) read(*ii->at(n));
	if (rs.empty()) report_runtime_error(err_no_formula), error = true;
	return !error;
}

bool driver::read(const input& in) {
	strings ord = order;
	istringstream_t is(in.source());
	string line;
	bool ok = true;
	while (getline(is, line)) {
		line = trim(line);
		if (line.empty() || line[0] == '#') continue;
		if (line.rfind("@order", 0) == 0) {
			strings names = split_names(line.substr(6));
			if (names.empty()) {
				report_runtime_error(err_order_dir, line);
				ok = false, error = true;
				continue;
			}
			ord = names;
			DBG(print_ordering(o::dbg() << "@order ", ord) << endl;)
			continue;
		}
		ok = formula(line, ord) && ok;
	}
	return ok;
}

bool driver::formula(const string& f, const strings& ordering) {
	result r;
	r.formula = f;
	try {
		r.ordering = ordering.size() ? ordering
			: input(f, opts.enabled("strict")).variables();
		bdd_manager m(r.ordering, opts.enabled("memo"));
		clock_t start, end;
		measure_time_start();
		r.root = m.parse(f, opts.enabled("strict"));
		o::ms() << "# " << f << ": ", measure_time_end();
		r.nodes = m.node_count();
		r.sat_fits = m.satcount(r.root, r.sat);
		r.ok = true;
		report(o::out(), r);
		if (o::enabled("listing"))
			print_listing(o::listing(), m, r.root) << endl;
		if (o::enabled("dot")) print_dot(o::dot(), m, r.root);
		if (opts.enabled("stats"))
			m.stats(o::inf() << "# " << f << ": ") << endl;
	} catch (const runtime_error& e) {
		// already reported into the error output
		r.error = e.what(), error = true;
	}
	rs.push_back(r);
	return r.ok;
}

void driver::report(ostream_t& os, const result& r) const {
	os << "formula: " << r.formula << '\n';
	print_ordering(os << "ordering: ", r.ordering) << '\n';
	os << "root: " << r.root << '\n' << "nodes: " << r.nodes << '\n'
		<< "result: ";
	if (r.root == T) os << "TAUTOLOGY";
	else if (r.root == F) os << "CONTRADICTION";
	else if (!r.sat_fits) os << "satisfiable (at least 2^"
		<< numeric_limits<size_t>::digits << " assignments)";
	else os << "satisfiable (" << r.sat << " assignment"
		<< (r.sat == 1 ? "" : "s") << ')';
	os << '\n' << endl;
}

} // robdd namespace
