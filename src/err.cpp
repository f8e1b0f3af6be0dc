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
#include <sstream>
#include "err.h"
#include "output.h"

using namespace std;

namespace robdd {

string report_runtime_error(string err, string details) {
	ostringstream msg; msg << "Runtime error: \"" << err << "\"";
	if (details.size()) msg << " details: \"" << details << "\"";
	o::err() << msg.str() << endl;
	return msg.str();
}

void throw_runtime_error(string err, string details) {
	throw runtime_error_exception(report_runtime_error(err, details));
}

void throw_unknown_variable(const string& name, const string& ordering) {
	ostringstream msg; msg << "Runtime error: \"" << err_unknown_var
		<< "\" details: \"" << name << " not in [" << ordering << "]\"";
	o::err() << msg.str() << endl;
	throw unknown_variable_exception(msg.str());
}

void throw_out_of_range(const char* err, size_t value, size_t size) {
	ostringstream msg; msg << "Runtime error: \"" << err
		<< "\" details: \"" << value << " >= " << size << '"';
	o::err() << msg.str() << endl;
	throw out_of_range_exception(msg.str());
}

void throw_out_of_range(const char* err, const string& details) {
	ostringstream msg; msg << "Runtime error: \"" << err
		<< "\" details: \"" << details << '"';
	o::err() << msg.str() << endl;
	throw out_of_range_exception(msg.str());
}

} // robdd namespace
