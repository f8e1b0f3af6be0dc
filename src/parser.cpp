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
#include "parser.h"
#include "output.h"
#include "err.h"

using namespace std;

namespace robdd {

size_t parser::parse() {
	size_t r = parse_iff();
	if (pos < l.size()) in.parse_error(at(), err_trailing, l[pos]);
	return r;
}

size_t parser::parse_iff() {
	size_t r = parse_implies();
	while (peek("<->")) ++pos, r = m.bdd_iff(r, parse_implies());
	return r;
}

size_t parser::parse_implies() {
	size_t r = parse_xor();
	while (peek("->")) ++pos, r = m.bdd_impl(r, parse_xor());
	return r;
}

size_t parser::parse_xor() {
	size_t r = parse_or();
	while (peek("^")) ++pos, r = m.bdd_xor(r, parse_or());
	return r;
}

size_t parser::parse_or() {
	size_t r = parse_and();
	while (peek("|")) ++pos, r = m.bdd_or(r, parse_and());
	return r;
}

size_t parser::parse_and() {
	size_t r = parse_not();
	while (peek("&")) ++pos, r = m.bdd_and(r, parse_not());
	return r;
}

size_t parser::parse_not() {
	if (peek("~")) return ++pos, m.bdd_not(parse_not());
	return parse_primary();
}

size_t parser::parse_primary() {
	if (pos == l.size()) in.parse_error(in.end(), err_eof);
	if (peek("(")) {
		++pos;
		size_t r = parse_iff();
		if (!peek(")")) in.parse_error(at(), err_paren, at());
		return ++pos, r;
	}
	const lexeme& t = l[pos];
	if (!input::is_ident(*t[0])) in.parse_error(t[0], err_token, t);
	return ++pos, m.var(lexeme2str(t));
}

size_t bdd_manager::parse(const string& formula, bool strict) {
	input in(formula, strict);
	size_t r = parser(*this, in).parse();
	DBG(o::dbg() << "parsed \"" << formula << "\" into " << r << endl;)
	return r;
}

} // robdd namespace
