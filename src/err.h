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
#ifndef __ROBDD__ERR_H__
#define __ROBDD__ERR_H__

#include <stdexcept>
#include <string>

namespace robdd {

// malformed formula (unexpected token, missing operand, trailing input)
struct parse_error_exception : public virtual std::runtime_error {
	using std::runtime_error::runtime_error;
};

// identifier not present in the manager's variable ordering
struct unknown_variable_exception : public virtual std::runtime_error {
	using std::runtime_error::runtime_error;
};

// reference (or assignment) outside of what the manager has issued
struct out_of_range_exception : public virtual std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct runtime_error_exception : public virtual std::runtime_error {
	using std::runtime_error::runtime_error;
};

const char err_eof[] = "Unexpected end of formula.";
const char err_paren[] = "Missing closing parenthesis.";
const char err_token[] = "Unexpected token.";
const char err_trailing[] = "Unexpected tokens at end of formula.";
const char err_chr[] = "Unexpected character.";
const char err_unknown_var[] = "Unknown variable.";
const char err_ref[] = "Node reference out of range.";
const char err_assignment[] = "Assignment shorter than the variable ordering.";
const char err_satcount[] = "Assignment count is too large.";
const char err_order_dup[] = "Duplicate variable in ordering.";
const char err_order_dir[] = "Expected variable names after @order.";
const char err_fnf[] = "File not found.";
const char err_no_formula[] = "No formula given.";

// logs the error into the error output, @return the message
std::string report_runtime_error(std::string err, std::string details="");
// Each helper writes the message to the error output before throwing.
[[noreturn]] void throw_runtime_error(std::string err, std::string details="");
[[noreturn]] void throw_unknown_variable(const std::string& name,
	const std::string& ordering);
[[noreturn]] void throw_out_of_range(const char* err, size_t value,
	size_t size);
[[noreturn]] void throw_out_of_range(const char* err,
	const std::string& details);

} // robdd namespace
#endif // __ROBDD__ERR_H__
