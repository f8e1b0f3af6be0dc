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
#ifndef __ROBDD__PARSER_H__
#define __ROBDD__PARSER_H__
#include "bdd.h"
#include "input.h"

namespace robdd {

/**
 * Recursive descent parser building a bdd while it reads the formula.
 * Precedence from the lowest: <->, ->, ^, |, &, ~. Binary operators are
 * left associative, ~ is a right associative prefix.
 *
 *	iff     := implies ( "<->" implies )*
 *	implies := xor ( "->" xor )*
 *	xor     := or ( "^" or )*
 *	or      := and ( "|" and )*
 *	and     := not ( "&" not )*
 *	not     := "~" not | primary
 *	primary := "(" iff ")" | IDENTIFIER
 */
class parser {
public:
	parser(bdd_manager& m, input& in) : m(m), in(in), l(in.prog_lex()),
		pos(in.pos) {}
	// @return reference to the formula's bdd
	size_t parse();
private:
	bdd_manager& m;
	input& in;
	const lexemes& l;
	size_t& pos;
	bool peek(const char* t) const { return pos < l.size() && l[pos] == t; }
	ccs at() const { return pos < l.size() ? l[pos][0] : in.end(); }
	size_t parse_iff();
	size_t parse_implies();
	size_t parse_xor();
	size_t parse_or();
	size_t parse_and();
	size_t parse_not();
	size_t parse_primary();
};

} // robdd namespace
#endif // __ROBDD__PARSER_H__
