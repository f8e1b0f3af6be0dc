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
#ifndef __ROBDD__INPUT_H__
#define __ROBDD__INPUT_H__

#include <vector>
#include <string>
#include <memory>
#include "defs.h"

namespace robdd {

/**
 * input class contains input data. input can be one of three types: STDIN,
 * FILE or STRING. STDIN works as a STRING which is read from the standard
 * input. FILE is read whole when the input is constructed.
 * Whitespace is removed from a copy of the data before lexing, so an
 * identifier may span it ("x 1" lexes as "x1"). Positions of lexemes are
 * mapped back to the original data when an error is reported.
 * Lexing doesn't depend on the locale. Bytes of non-ascii utf-8 characters
 * are identifier characters.
 */
struct input {
	enum type { STDIN, FILE, STRING } type_; // input type
	size_t pos = 0;      // position of the currently parsed lexeme
	lexemes l = {};      // lexemes scanned from the input data
	bool strict = false; // unknown characters are errors instead of skipped
	/**
	 * STRING input constructor
	 * @param s - input data
	 * @param strict - report unknown characters instead of skipping them
	 */
	input(std::string s, bool strict = false) : type_(STRING),
		strict(strict), src_(std::move(s)) { strip(); }
	/**
	 * STDIN or FILE input constructor
	 * @param t - STDIN, FILE or STRING
	 * @param s - file name for FILE, data for STRING, ignored for STDIN
	 */
	input(type t, std::string s = "");
	input(const input&) = delete;
	input& operator=(const input&) = delete;
	/**
	 * lex scans a lexeme in a data pointer s and iterates it
	 * @param s - pointer to the input data
	 * @return scanned lexeme or null_lexeme at the end of data
	 */
	lexeme lex(pccs s);
	/**
	 * scans input's data for lexemes
	 * @return scanned lexemes
	 */
	lexemes& prog_lex();
	/**
	 * @return identifiers in order of their first appearance
	 */
	strings variables();
	/**
	 * @return the data as given (whitespace included)
	 **/
	const std::string& source() const { return src_; }
	/**
	 * @return pointer to the beginning of the stripped data
	 **/
	ccs begin() const { return data_.c_str(); }
	/**
	 * @return pointer past the end of the stripped data
	 **/
	ccs end() const { return data_.c_str() + data_.size(); }
	size_t size() const { return data_.size(); }
	void count_pos(ccs o, long& l, long& ch) const;
	[[noreturn]] void parse_error(ccs offset, const char* err) {
		parse_error(offset, err, offset);
	}
	[[noreturn]] void parse_error(ccs offset, const char* err, lexeme close_to);
	[[noreturn]] void parse_error(ccs offset, const char* err, ccs close_to);

	static std::string file_read_text(std::string fname);
	static bool is_ident(char c);
	static bool is_space(char c);
private:
	std::string src_;  // data as given
	std::string data_; // data without whitespace
	sizes map_;        // offset in data_ to offset in src_
	void strip();
	size_t src_offset(ccs o) const;
};

/**
 * inputs is a list of inputs fed to the driver
 */
class inputs {
	std::vector<std::unique_ptr<input>> v_;
public:
	input* add(std::unique_ptr<input> in) {
		return v_.push_back(std::move(in)), v_.back().get();
	}
	input* add_stdin() {
		return add(std::make_unique<input>(input::STDIN));
	}
	input* add_file(std::string filename) {
		return add(std::make_unique<input>(input::FILE, filename));
	}
	input* add_string(const std::string& str) {
		return add(std::make_unique<input>(input::STRING, str));
	}
	size_t size() const { return v_.size(); }
	input* at(size_t n) const { return v_.at(n).get(); }
};

// splits a variable ordering given as names separated by spaces or commas
strings split_names(const std::string& s);

} // robdd namespace
#endif // __ROBDD__INPUT_H__
