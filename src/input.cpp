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
#include <cstring>
#include <set>
#include "input.h"
#include "output.h"
#include "err.h"

using namespace std;

namespace robdd {

bool operator==(const lexeme& l, const string& s) {
	return (size_t) (l[1] - l[0]) == s.size() &&
		!strncmp(l[0], s.c_str(), s.size());
}

bool operator==(const lexeme& l, const char* s) {
	size_t n = strlen(s);
	return (size_t) (l[1] - l[0]) == n && !strncmp(l[0], s, n);
}

input::input(type t, string s) : type_(t) {
	switch (t) {
		case STDIN: {
			ostringstream_t ss; ss << CIN.rdbuf();
			src_ = ss.str();
			break;
		}
		case FILE:   src_ = file_read_text(s); break;
		case STRING: src_ = move(s); break;
	}
	strip();
}

void input::strip() {
	data_.clear(), map_.clear();
	for (size_t n = 0; n != src_.size(); ++n)
		if (!is_space(src_[n]))
			data_ += src_[n], map_.push_back(n);
	map_.push_back(src_.size());
}

// ascii letters, digits, '_' and any byte of a multibyte utf-8 sequence
bool input::is_ident(char c) {
	unsigned char u = c;
	return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') ||
		(u >= '0' && u <= '9') || u == '_' || u >= 0x80;
}

bool input::is_space(char c) { return c && strchr(" \t\n\v\f\r", c); }

lexeme input::lex(pccs s) {
	while (**s) {
		ccs t = *s;
		if (**s == '<' && *(*s + 1) == '-' && *(*s + 2) == '>')
			return *s += 3, lexeme{ t, *s };
		if (**s == '-' && *(*s + 1) == '>')
			return *s += 2, lexeme{ t, *s };
		if (strchr("()&|~^", **s)) return ++*s, lexeme{ t, *s };
		if (is_ident(**s)) {
			while (**s && is_ident(**s)) ++*s;
			return { t, *s };
		}
		if (strict) parse_error(*s, err_chr);
		DBG(o::dbg() << "skipping '" << **s << "'" << endl;)
		++*s;
	}
	return null_lexeme;
}

lexemes& input::prog_lex() {
	lexeme e;
	ccs s = begin();
	l.clear(), pos = 0;
	while ((e = lex(&s)) != null_lexeme) l.push_back(e);
	return l;
}

strings input::variables() {
	strings r;
	set<string> seen;
	if (l.empty()) prog_lex();
	for (const lexeme& x : l)
		if (is_ident(*x[0]) && seen.insert(lexeme2str(x)).second)
			r.push_back(lexeme2str(x));
	return r;
}

size_t input::src_offset(ccs o) const {
	size_t n = o < begin() ? 0 : o - begin();
	return map_[n < map_.size() ? n : map_.size() - 1];
}

void input::count_pos(ccs o, long& l, long& ch) const {
	size_t off = src_offset(o), nl = 0;
	l = 1;
	for (size_t n = 0; n != off; ++n)
		if (src_[n] == '\n') nl = n + 1, ++l;
	ch = off - nl + 1;
}

void input::parse_error(ccs offset, const char* err, lexeme close_to) {
	parse_error(offset, err, close_to[0]);
}

// Display an error with the given location, message and erronous text

void input::parse_error(ccs offset, const char* err, ccs close_to) {
	ostringstream msg; msg << "Parse error: \"" << err << '"';
	if (offset) {
		long l, ch; count_pos(offset, l, ch);
		msg << " at " << l << ':' << ch;
	}
	if (close_to && close_to < end()) {
		size_t p = src_offset(close_to), q = p;
		while (q < src_.size() && src_[q] != '\n') ++q;
		msg << " close to \"" << src_.substr(p, q - p) << '"';
	}
	o::err() << msg.str() << endl;
	throw parse_error_exception(msg.str());
}

string input::file_read_text(string fname) {
	ifstream f(fname, ios::binary);
	if (!f) throw_runtime_error(err_fnf, fname);
	ostringstream ss; ss << f.rdbuf();
	return ss.str();
}

strings split_names(const string& s) {
	strings r;
	string t;
	for (char c : s)
		if (input::is_space(c) || c == ',') {
			if (t.size()) r.push_back(t), t.clear();
		} else t += c;
	if (t.size()) r.push_back(t);
	return r;
}

} // robdd namespace
