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
#ifndef __ROBDD__BDD_H__
#define __ROBDD__BDD_H__
#include <vector>
#include <unordered_map>
#include <map>
#include <set>
#include <array>
#include <functional>
#include "defs.h"
#include "err.h"

namespace robdd {

// references of the two leaves, fixed for the lifetime of a manager
const size_t F = 0, T = 1;

// bdd node is a triple: varid, 1-node-id, 0-node-id
// varid is the variable's level + 1, 0 is reserved for leaves which carry
// their value in both children: F = {0, 0, 0}, T = {0, 1, 1}
struct node {
	uint_t v;
	size_t h, l;
	bool leaf() const { return !v; }
	bool trueleaf() const { return !v && h == T; }
	bool operator==(const node& n) const {
		return v == n.v && h == n.h && l == n.l;
	}
};

// read-only view of a node for exporters
struct node_info {
	bool terminal;
	bool value;       // leaf value, false for decision nodes
	std::string var;  // tested variable, empty for leaves
	size_t low, high; // leaves point to themselves
};

typedef std::array<size_t, 2> memo;
struct memo_hash { size_t operator()(const memo& m) const; };

} // robdd namespace

template<> struct std::hash<robdd::node> {
	size_t operator()(const robdd::node& n) const;
};

namespace robdd {

/**
 * bdd_manager owns the variable ordering, the append-only node table and the
 * unique table deduplicating it. Every diagram built by a manager is a
 * reference (index) into its node table and two references are equal iff
 * they represent the same boolean function.
 */
class bdd_manager {
public:
	/**
	 * @param ordering - distinct variable names, first one is tested first
	 * @param memo - cache results of not/and (doesn't change any result)
	 */
	bdd_manager(const strings& ordering, bool memo = true);
	bdd_manager(const bdd_manager&) = delete;
	bdd_manager& operator=(const bdd_manager&) = delete;

	size_t add(const node& n);
	const node& get(size_t x) const;
	size_t make(const std::string& var, size_t low, size_t high);
	size_t make(uint_t v, size_t low, size_t high);
	size_t var(const std::string& name);
	size_t create_variable(const std::string& name) { return var(name); }

	size_t bdd_not(size_t x);
	size_t bdd_and(size_t x, size_t y);
	size_t bdd_or(size_t x, size_t y);
	size_t bdd_xor(size_t x, size_t y);
	size_t bdd_impl(size_t x, size_t y);
	size_t bdd_iff(size_t x, size_t y);
	// builds formula's bdd, defined in parser.cpp
	size_t parse(const std::string& formula, bool strict = false);

	size_t node_count() const { return V.size(); }
	node_info node_at(size_t x) const;
	bool is_true(size_t x) const { return x == T; }
	bool is_false(size_t x) const { return x == F; }
	const strings& variable_ordering() const { return order; }
	uint_t nvars() const { return (uint_t) order.size(); }
	size_t level(const std::string& name) const;
	bool has_var(const std::string& name) const { return has(lvl, name); }
	bool memo_enabled() const { return memo_on; }

	// throws out_of_range_exception if the count doesn't fit into size_t
	size_t satcount(size_t x) const;
	// @return false if the count doesn't fit into size_t
	bool satcount(size_t x, size_t& r) const;
	bool onesat(size_t x, bools& r) const;
	vbools allsat(size_t x) const;
	bool eval(size_t x, const bools& a) const;
	size_t size(size_t x) const;
	ostream_t& out(ostream_t& os, size_t x) const;
	ostream_t& stats(ostream_t& os) const;
private:
	friend class allsat_cb;
	strings order;
	std::map<std::string, uint_t> lvl;  // variable to its varid
	std::vector<node> V;                // all bdd nodes
	std::unordered_map<node, size_t> M; // node to its index
	bool memo_on;
	std::unordered_map<size_t, size_t> memo_not;
	std::unordered_map<memo, size_t, memo_hash> memo_and;

	size_t add_nocheck(const node& n);
	bool count(size_t x, uint_t v, std::unordered_map<size_t, size_t>& m,
		size_t& r) const;
	bool onesat_rec(size_t x, bools& r) const;
	void sat(uint_t v, const node& n, bools& p, vbools& r) const;
	void bdd_sz(size_t x, std::set<size_t>& s) const;
};

class allsat_cb {
public:
	typedef std::function<void(const bools&)> callback;
	allsat_cb(const bdd_manager& m, size_t r, callback f) :
		m(m), r(r), nvars(m.nvars()), f(f), p(nvars) {}
	void operator()() { sat(1, m.get(r)); }
private:
	const bdd_manager& m;
	size_t r;
	const uint_t nvars;
	callback f;
	bools p;
	void sat(uint_t v, const node& n);
};

ostream_t& operator<<(ostream_t& os, const bools& x);
ostream_t& operator<<(ostream_t& os, const vbools& x);

} // robdd namespace
#endif // __ROBDD__BDD_H__
