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
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include "bdd.h"
#include "output.h"

using namespace std;

size_t std::hash<robdd::node>::operator()(const robdd::node& n) const {
	return n.v + (n.h << 12) + (n.l << 24) + (n.h >> 20) + (n.l >> 8);
}

namespace robdd {

size_t memo_hash::operator()(const memo& m) const {
	return m[0] ^ (m[1] + 0x9e3779b9 + (m[0] << 6) + (m[0] >> 2));
}

#define apply_ret(r, m) { size_t res = (r); \
	if (memo_on) m.emplace(t, res); return res; }

bdd_manager::bdd_manager(const strings& ordering, bool memo) :
	order(ordering), memo_on(memo)
{
	for (size_t n = 0; n != order.size(); ++n)
		if (!lvl.emplace(order[n], n + 1).second)
			throw_runtime_error(err_order_dup, order[n]);
	add_nocheck({ 0, F, F }), add_nocheck({ 0, T, T });
	DBG(o::dbg() << "bdd_manager: " << order.size() << " variables, memo "
		<< (memo_on ? "on" : "off") << endl;)
}

size_t bdd_manager::add_nocheck(const node& n) {
	size_t r;
	return M.emplace(n, r = V.size()), V.emplace_back(n), r;
}

size_t bdd_manager::add(const node& n) {
	auto it = M.find(n);
	return it == M.end() ? add_nocheck(n) : it->second;
}

const node& bdd_manager::get(size_t x) const {
	if (x >= V.size()) throw_out_of_range(err_ref, x, V.size());
	return V[x];
}

size_t bdd_manager::make(uint_t v, size_t low, size_t high) {
	if (low == high) return low;
	DBG(assert(v && v <= nvars());)
	DBG(assert(get(high).leaf() || v < get(high).v);)
	DBG(assert(get(low).leaf()  || v < get(low).v);)
	return add({ v, high, low });
}

size_t bdd_manager::make(const string& var, size_t low, size_t high) {
	return make((uint_t) level(var) + 1, low, high);
}

size_t bdd_manager::level(const string& name) const {
	auto it = lvl.find(name);
	if (it == lvl.end()) {
		ostringstream ss;
		for (size_t n = 0; n != order.size(); ++n)
			ss << (n ? ", " : "") << order[n];
		throw_unknown_variable(name, ss.str());
	}
	return it->second - 1;
}

size_t bdd_manager::var(const string& name) { return make(name, F, T); }

size_t bdd_manager::bdd_not(size_t x) {
	if (x == F) return T;
	if (x == T) return F;
	const size_t t = x;
	if (memo_on) {
		auto it = memo_not.find(t);
		if (it != memo_not.end()) return it->second;
	}
	const node n = get(x);
	const size_t l = bdd_not(n.l), h = bdd_not(n.h);
	apply_ret(make(n.v, l, h), memo_not);
}

size_t bdd_manager::bdd_and(size_t x, size_t y) {
	if (x == F || y == F) return F;
	if (x == T) return y;
	if (y == T) return x;
	if (x == y) return x;
	const memo t = {{ min(x, y), max(x, y) }};
	if (memo_on) {
		auto it = memo_and.find(t);
		if (it != memo_and.end()) return it->second;
	}
	const node a = get(x), b = get(y);
	uint_t v;
	size_t l, h;
	if (a.v == b.v)
		v = a.v, l = bdd_and(a.l, b.l), h = bdd_and(a.h, b.h);
	else if (a.v < b.v)
		v = a.v, l = bdd_and(a.l, y), h = bdd_and(a.h, y);
	else	v = b.v, l = bdd_and(x, b.l), h = bdd_and(x, b.h);
	apply_ret(make(v, l, h), memo_and);
}

size_t bdd_manager::bdd_or(size_t x, size_t y) {
	const size_t nx = bdd_not(x), ny = bdd_not(y);
	return bdd_not(bdd_and(nx, ny));
}

size_t bdd_manager::bdd_xor(size_t x, size_t y) {
	const size_t ny = bdd_not(y), a = bdd_and(x, ny);
	const size_t nx = bdd_not(x), b = bdd_and(nx, y);
	return bdd_or(a, b);
}

size_t bdd_manager::bdd_impl(size_t x, size_t y) {
	return bdd_or(bdd_not(x), y);
}

size_t bdd_manager::bdd_iff(size_t x, size_t y) {
	const size_t a = bdd_impl(x, y), b = bdd_impl(y, x);
	return bdd_and(a, b);
}

#undef apply_ret

node_info bdd_manager::node_at(size_t x) const {
	const node& n = get(x);
	if (n.leaf()) return { true, n.trueleaf(), "", x, x };
	return { false, false, order[n.v - 1], n.l, n.h };
}

// number of assignments to the variables v..nvars satisfying x into r,
// false if it doesn't fit into size_t
bool bdd_manager::count(size_t x, uint_t v, unordered_map<size_t, size_t>& m,
	size_t& r) const
{
	const node& n = get(x);
	if (n.leaf() && !n.trueleaf()) return r = 0, true;
	// variables skipped above n are free
	const uint_t s = n.leaf() ? nvars() + 1 - v : n.v - v;
	size_t c = 1, h, l;
	if (!n.leaf()) {
		auto it = m.find(x);
		if (it != m.end()) c = it->second;
		else if (!count(n.h, n.v + 1, m, h) || !count(n.l, n.v + 1, m, l)
			|| h > SIZE_MAX - l) return false;
		else	m.emplace(x, c = h + l);
	}
	if (s >= (uint_t) numeric_limits<size_t>::digits || c > SIZE_MAX >> s)
		return false;
	return r = c << s, true;
}

bool bdd_manager::satcount(size_t x, size_t& r) const {
	unordered_map<size_t, size_t> m;
	return count(x, 1, m, r);
}

size_t bdd_manager::satcount(size_t x) const {
	size_t r;
	if (!satcount(x, r)) {
		ostringstream ss;
		ss << "root " << x << " over " << nvars() << " variables";
		throw_out_of_range(err_satcount, ss.str());
	}
	return r;
}

bool bdd_manager::onesat_rec(size_t x, bools& r) const {
	const node& n = get(x);
	if (n.leaf()) return n.trueleaf();
	return	n.l == F
		? r[n.v-1] = true,  onesat_rec(n.h, r)
		:(r[n.v-1] = false, onesat_rec(n.l, r));
}

bool bdd_manager::onesat(size_t x, bools& r) const {
	return r.assign(nvars(), false), onesat_rec(x, r);
}

void bdd_manager::sat(uint_t v, const node& n, bools& p, vbools& r) const {
	if (n.leaf() && !n.trueleaf()) return;
	if (v == nvars() + 1) r.push_back(p);
	else if (v < n.v)
		p[v-1] = true,  sat(v + 1, n, p, r),
		p[v-1] = false, sat(v + 1, n, p, r);
	else	p[v-1] = true,  sat(v + 1, get(n.h), p, r),
		p[v-1] = false, sat(v + 1, get(n.l), p, r);
}

vbools bdd_manager::allsat(size_t x) const {
	bools p(nvars());
	vbools r;
	return sat(1, get(x), p, r), r;
}

void allsat_cb::sat(uint_t v, const node& n) {
	if (n.leaf() && !n.trueleaf()) return;
	if (v == nvars + 1) f(p);
	else if (v < n.v)
		p[v-1] = true,  sat(v + 1, n),
		p[v-1] = false, sat(v + 1, n);
	else	p[v-1] = true,  sat(v + 1, m.get(n.h)),
		p[v-1] = false, sat(v + 1, m.get(n.l));
}

bool bdd_manager::eval(size_t x, const bools& a) const {
	if (a.size() < nvars()) throw_out_of_range(err_assignment, a.size(),
		nvars());
	const node* n = &get(x);
	while (!n->leaf()) n = &get(a[n->v - 1] ? n->h : n->l);
	return n->trueleaf();
}

void bdd_manager::bdd_sz(size_t x, set<size_t>& s) const {
	if (!s.emplace(x).second) return;
	const node& n = get(x);
	if (!n.leaf()) bdd_sz(n.h, s), bdd_sz(n.l, s);
}

size_t bdd_manager::size(size_t x) const {
	set<size_t> s;
	return bdd_sz(x, s), s.size();
}

ostream_t& bdd_manager::out(ostream_t& os, size_t x) const {
	const node& n = get(x);
	if (n.leaf()) return os << (n.trueleaf() ? 'T' : 'F');
	os << order[n.v - 1] << " ? (";
	out(os, n.h) << ") : (";
	return out(os, n.l) << ")";
}

ostream_t& bdd_manager::stats(ostream_t& os) const {
	return os << "V: " << V.size() << " M: " << M.size()
		<< " memo_not: " << memo_not.size()
		<< " memo_and: " << memo_and.size();
}

ostream_t& operator<<(ostream_t& os, const bools& x) {
	for (auto y : x) os << (y ? '1' : '0');
	return os;
}

ostream_t& operator<<(ostream_t& os, const vbools& x) {
	for (auto y : x) os << y << endl;
	return os;
}

} // robdd namespace
