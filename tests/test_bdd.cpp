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
#include <limits>
#include "unittest.hpp"
#include "../src/bdd.h"

using namespace std;
using namespace robdd;

// truth table of a bdd, rows are the satisfying assignments
struct tt {
	size_t bits;
	set<bools> table;
	tt(size_t bits) : bits(bits) {}
	// brute force: evaluates x under every assignment
	tt(const bdd_manager& m, size_t x) : bits(m.nvars()) {
		for (size_t n = 0; n != ((size_t) 1 << bits); ++n) {
			bools b(bits);
			for (size_t i = 0; i != bits; ++i)
				b[i] = n & ((size_t) 1 << i);
			if (m.eval(x, b)) table.emplace(b);
		}
	}
	tt operator&(const tt& x) const {
		tt r(bits);
		for (auto& y : table) if (has(x.table, y)) r.table.emplace(y);
		return r;
	}
	tt operator|(const tt& x) const {
		tt r = *this;
		for (auto& y : x.table) r.table.emplace(y);
		return r;
	}
	tt operator!() const {
		tt r(bits);
		for (size_t n = 0; n != ((size_t) 1 << bits); ++n) {
			bools b(bits);
			for (size_t i = 0; i != bits; ++i)
				b[i] = n & ((size_t) 1 << i);
			if (!has(table, b)) r.table.emplace(b);
		}
		return r;
	}
	bool operator==(const tt& x) const { return table == x.table; }
};

TEST_SUITE("node table") {
TEST_CASE("terminals") {
	bdd_manager m({ "a", "b" });
	CHECK(m.node_count() == 2);
	node_info f = m.node_at(F), t = m.node_at(T);
	EXPECT_TRUE(f.terminal && !f.value && f.low == F && f.high == F);
	EXPECT_TRUE(t.terminal && t.value && t.low == T && t.high == T);
	EXPECT_TRUE(m.is_false(F) && m.is_true(T));
	EXPECT_FALSE(m.is_true(F) || m.is_false(T));
}
TEST_CASE("variable") {
	bdd_manager m({ "a", "b" });
	size_t a = m.create_variable("a");
	CHECK(a == 2);
	CHECK(m.node_count() == 3);
	node_info n = m.node_at(a);
	EXPECT_FALSE(n.terminal);
	CHECK(n.var == "a");
	CHECK(n.low == F);
	CHECK(n.high == T);
	CHECK(m.var("a") == a);
	CHECK(m.node_count() == 3);
}
TEST_CASE("reduction") {
	bdd_manager m({ "a", "b" });
	size_t b = m.var("b");
	size_t n = m.node_count();
	CHECK(m.make("a", T, T) == T);
	CHECK(m.make("a", F, F) == F);
	CHECK(m.make("a", b, b) == b);
	CHECK(m.node_count() == n);
	size_t x = m.make("a", F, b);
	CHECK(m.make("a", F, b) == x);
	CHECK(m.node_count() == n + 1);
}
TEST_CASE("levels") {
	bdd_manager m({ "x", "y", "z" });
	CHECK(m.level("x") == 0);
	CHECK(m.level("z") == 2);
	CHECK(m.nvars() == 3);
	EXPECT_TRUE(m.has_var("y"));
	EXPECT_FALSE(m.has_var("w"));
	CHECK((m.variable_ordering() == strings{ "x", "y", "z" }));
}
TEST_CASE("errors") {
	EXPECT_THROW(bdd_manager({ "a", "b", "a" }), runtime_error_exception);
	bdd_manager m({ "a", "b" });
	EXPECT_THROW(m.create_variable("z"), unknown_variable_exception);
	EXPECT_THROW(m.level("z"), unknown_variable_exception);
	EXPECT_THROW(m.node_at(m.node_count()), out_of_range_exception);
	EXPECT_THROW(m.bdd_not(99), out_of_range_exception);
	EXPECT_THROW(m.bdd_and(m.var("a"), 99), out_of_range_exception);
	EXPECT_THROW(m.eval(T, bools(1)), out_of_range_exception);
	CHECK_THROWS_WITH(m.var("z"), "Runtime error: \"Unknown variable.\" "
		"details: \"z not in [a, b]\"");
}
}

TEST_SUITE("apply") {
TEST_CASE("terminal identities") {
	bdd_manager m({ "a", "b" });
	size_t x = m.var("a");
	CHECK(m.bdd_and(T, x) == x);
	CHECK(m.bdd_and(x, T) == x);
	CHECK(m.bdd_and(F, x) == F);
	CHECK(m.bdd_or(T, x) == T);
	CHECK(m.bdd_or(F, x) == x);
	CHECK(m.bdd_not(T) == F);
	CHECK(m.bdd_not(F) == T);
	CHECK(m.bdd_and(x, x) == x);
}
TEST_CASE("double negation") {
	bdd_manager m({ "a", "b" });
	size_t x = m.bdd_and(m.var("a"), m.var("b"));
	size_t nx = m.bdd_not(x);
	CHECK(nx != x);
	CHECK(m.bdd_not(nx) == x);
}
TEST_CASE("de morgan") {
	bdd_manager m({ "a", "b" });
	size_t a = m.var("a"), b = m.var("b");
	size_t na = m.bdd_not(a), nb = m.bdd_not(b);
	CHECK(m.bdd_or(a, b) == m.bdd_not(m.bdd_and(na, nb)));
	CHECK(m.bdd_and(a, b) == m.bdd_not(m.bdd_or(na, nb)));
}
TEST_CASE("canonicity") {
	bdd_manager m({ "a", "b", "c" });
	size_t a = m.var("a"), b = m.var("b"), c = m.var("c");
	CHECK(m.bdd_and(a, b) == m.bdd_and(b, a));
	CHECK(m.bdd_or(a, m.bdd_and(b, c))
		== m.bdd_and(m.bdd_or(a, b), m.bdd_or(a, c)));
	CHECK(m.bdd_impl(a, b) == m.bdd_or(m.bdd_not(a), b));
	CHECK(m.bdd_iff(a, b) == m.bdd_not(m.bdd_xor(a, b)));
	CHECK(m.bdd_xor(a, a) == F);
	CHECK(m.bdd_iff(c, c) == T);
	CHECK(m.bdd_impl(F, c) == T);
}
TEST_CASE("xor structure") {
	bdd_manager m({ "a", "b" });
	size_t r = m.bdd_xor(m.var("a"), m.var("b"));
	EXPECT_FALSE(m.is_true(r) || m.is_false(r));
	node_info n = m.node_at(r);
	CHECK(n.var == "a");
	CHECK(n.low != n.high);
	node_info l = m.node_at(n.low), h = m.node_at(n.high);
	CHECK(l.var == "b");
	CHECK(h.var == "b");
	CHECK(l.low == F);
	CHECK(l.high == T);
	CHECK(h.low == T);
	CHECK(h.high == F);
	CHECK(m.size(r) == 5);
}
TEST_CASE("memo does not change the table") {
	const char* fs[] = { "a ^ b ^ c", "(a -> b) & (b -> c) -> (a -> c)",
		"~(a | b) <-> ~a & ~b", "(a & b) | (b & c) | (~a & c)" };
	for (auto f : fs) {
		bdd_manager m1({ "a", "b", "c" }, true);
		bdd_manager m2({ "a", "b", "c" }, false);
		EXPECT_TRUE(m1.memo_enabled());
		EXPECT_FALSE(m2.memo_enabled());
		CHECK(m1.parse(f) == m2.parse(f));
		CHECK(m1.node_count() == m2.node_count());
		for (size_t n = 0; n != m1.node_count(); ++n) {
			node_info x = m1.node_at(n), y = m2.node_at(n);
			CHECK(x.var == y.var);
			CHECK(x.low == y.low);
			CHECK(x.high == y.high);
		}
	}
}
TEST_CASE("truth tables") {
	bdd_manager m({ "a", "b", "c" });
	size_t a = m.var("a"), b = m.var("b"), c = m.var("c");
	size_t x = m.bdd_or(m.bdd_and(a, m.bdd_not(b)), c);
	size_t y = m.bdd_xor(b, c);
	CHECK((tt(m, x) & tt(m, y)) == tt(m, m.bdd_and(x, y)));
	CHECK((tt(m, x) | tt(m, y)) == tt(m, m.bdd_or(x, y)));
	CHECK(!tt(m, x) == tt(m, m.bdd_not(x)));
	CHECK((!tt(m, x) | tt(m, y)) == tt(m, m.bdd_impl(x, y)));
}
}

TEST_SUITE("satisfiability") {
TEST_CASE("satcount") {
	bdd_manager m({ "a", "b", "c" });
	size_t a = m.var("a"), b = m.var("b"), c = m.var("c");
	CHECK(m.satcount(F) == 0);
	CHECK(m.satcount(T) == 8);
	CHECK(m.satcount(a) == 4);
	CHECK(m.satcount(c) == 4);
	CHECK(m.satcount(m.bdd_and(a, b)) == 2);
	CHECK(m.satcount(m.bdd_and(a, c)) == 2);
	CHECK(m.satcount(m.bdd_or(a, c)) == 6);
	CHECK(m.satcount(m.bdd_xor(m.bdd_xor(a, b), c)) == 4);
	size_t x = m.bdd_impl(m.bdd_and(a, b), c);
	CHECK(m.satcount(x) == tt(m, x).table.size());
}
TEST_CASE("satcount wider than size_t") {
	const size_t w = numeric_limits<size_t>::digits;
	strings names;
	for (size_t i = 0; i <= w; ++i) names.push_back("x" + to_string(i));
	bdd_manager m(names);
	size_t r = 7, x0 = m.var("x0");
	EXPECT_FALSE(m.satcount(x0, r));
	EXPECT_FALSE(m.satcount(T, r));
	EXPECT_THROW(m.satcount(x0), out_of_range_exception);
	EXPECT_THROW(m.satcount(T), out_of_range_exception);
	CHECK(m.satcount(F) == 0);
	size_t all = T;
	for (size_t i = w + 1; i--; ) all = m.bdd_and(m.var(names[i]), all);
	CHECK(m.satcount(all) == 1);
	size_t most = T;
	for (size_t i = w; i--; ) most = m.bdd_and(m.var(names[i]), most);
	CHECK(m.satcount(most) == 2);
	EXPECT_TRUE(m.satcount(m.bdd_and(x0, m.var("x1")), r));
	CHECK(r == (size_t) 1 << (w - 1));
	names.pop_back();
	bdd_manager n(names);
	EXPECT_THROW(n.satcount(T), out_of_range_exception);
	CHECK(n.satcount(n.var("x0")) == (size_t) 1 << (w - 1));
	CHECK(n.satcount(n.bdd_not(n.var("x0"))) == (size_t) 1 << (w - 1));
}
TEST_CASE("allsat") {
	bdd_manager m({ "a", "b" });
	vbools r = m.allsat(T);
	CHECK(r.size() == 4);
	CHECK((r[0] == bools{ true, true }));
	CHECK((r[3] == bools{ false, false }));
	CHECK(m.allsat(F).empty());
	size_t x = m.bdd_xor(m.var("a"), m.var("b"));
	r = m.allsat(x);
	CHECK(r.size() == 2);
	CHECK((r[0] == bools{ true, false }));
	CHECK((r[1] == bools{ false, true }));
	set<bools> s(r.begin(), r.end());
	CHECK(s == tt(m, x).table);
	vbools v;
	allsat_cb(m, x, [&v](const bools& p) { v.push_back(p); })();
	CHECK(v == r);
}
TEST_CASE("onesat and eval") {
	bdd_manager m({ "a", "b" });
	size_t x = m.bdd_and(m.var("a"), m.bdd_not(m.var("b")));
	bools r;
	EXPECT_TRUE(m.onesat(x, r));
	CHECK((r == bools{ true, false }));
	EXPECT_TRUE(m.eval(x, r));
	EXPECT_FALSE((m.eval(x, bools{ true, true })));
	EXPECT_FALSE(m.onesat(F, r));
	EXPECT_TRUE(m.onesat(T, r));
}
TEST_CASE("out") {
	bdd_manager m({ "a", "b" });
	size_t x = m.bdd_and(m.var("a"), m.var("b"));
	std::ostringstream ss;
	m.out(ss, x);
	CHECK(ss.str() == "a ? (b ? (T) : (F)) : (F)");
}
}
