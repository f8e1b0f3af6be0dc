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
#ifndef __ROBDD__OPTIONS_H__
#define __ROBDD__OPTIONS_H__
#include <functional>
#include <optional>
#include <map>
#include "defs.h"
#include "input.h"
#include "output.h"

namespace robdd {

struct option {
	enum type { UNDEFINED, BOOL, STRING };
	struct value {
		value()              : t(UNDEFINED)         {}
		value(bool b)        : t(BOOL),     v_b(b)  {}
		value(std::string s) : t(STRING),   v_s(s)  {}
		void set(bool b)        { t=BOOL;   v_b = b; }
		void set(std::string s) { t=STRING; v_s = s; }
		void null() {
			switch (t) {
				case BOOL:   v_b = false; break;
				case STRING: v_s = "";    break;
				default: ;
			}
		}
		type get_type() const { return t; }
		bool               get_bool()   const { return v_b; }
		const std::string& get_string() const { return v_s; }
		bool is_undefined() const { return t == UNDEFINED; }
		bool operator ==(const value& ov) const {
			if (t != ov.get_type()) return false;
			switch (t) {
				case BOOL:   return v_b == ov.get_bool();
				case STRING: return v_s == ov.get_string();
				default:     return true;
			}
		}
	private:
		type        t;
		bool        v_b = false;
		std::string v_s = "";
	} v;
	typedef std::function<void(const value&)> callback;
	option() {}
	option(type t, strings n, callback e, option::value v={})
		: v(v), t(t), n(n), e(e) {}
	option(type t, strings n, option::value v={})
		: v(v), t(t), n(n), e(0) {}
	const std::string& name() const { return n[0]; }
	const strings& names() const { return n; }
	type get_type() const { return t; }
	value get() const { return v; }
	bool is_output() const { return outputs::exists(name()); }
	bool is_input () const { return n[0] == "input"; }
	bool        get_bool  () const { return v.get_bool(); }
	std::string get_string() const { return v.get_string(); }
	bool operator ==(const value& ov) const { return v == ov; }
	// @return false if the value could not be parsed
	bool parse_value(const std::string& s);
	bool parse_bool(const std::string& s);
	static bool is_bool(const std::string& s);
	void disable() {
		if (STRING == get_type() && is_output()) parse_value("@null");
		else {
			if (t == BOOL) v.set(false); else v.null();
			if (e) e(v);
		}
	}
	bool is_undefined() const { return v.is_undefined(); }
	option &description(const std::string& d) { return desc = d, *this; }
	ostream_t& help(ostream_t& os) const;
private:
	type t = UNDEFINED;
	strings n;  // vector of name and alternative names (shortcuts)
	callback e; // callback with value as argument, fired when option parsed
	std::string desc = "";
};

/**
 * options parses command line arguments into typed option values. Option
 * callbacks add inputs and retarget outputs as they are parsed.
 */
class options {
public:
	options() : options(0, 0) {}
	options(inputs *ii, outputs *oo) : ii(ii), oo(oo) { setup(); }
	options(int argc, char** argv, inputs *ii = 0, outputs *oo = 0) :
		ii(ii), oo(oo) { setup(); error |= !parse(argc, argv); }
	options(strings args, inputs *ii = 0, outputs *oo = 0) :
		ii(ii), oo(oo) { setup(); error |= !parse(args); }
	int argc() const { return args.size(); }
	std::string argv(int n) const { return n < argc() ? args[n] : ""; }
	void add(option o);
	std::optional<option> get(const std::string& name) const;
	void set(const std::string& name, const option& o) {
		opts.insert_or_assign(name, o);
	}
	template <typename T>
	void set(const std::string& name, T val);
	bool parse(int argc, char** argv, bool internal = false);
	bool parse(strings sargs, bool internal = false);
	void enable (const std::string& name) { set(name, true);  }
	void disable(const std::string& name) { set(name, false); }
	bool enabled (const std::string& name) const;
	bool disabled(const std::string& name) const { return !enabled(name); }
	bool        get_bool  (const std::string& name) const;
	std::string get_string(const std::string& name) const;
	const strings& formulas() const { return fs; }
	bool has_inputs() const { return ii && ii->size(); }
	ostream_t& help(ostream_t& os) const;
	ostream_t& print(ostream_t& os) const;
	inputs* get_inputs() const { return ii; }
	bool error = false; // an argument was unknown or had a wrong value
private:
	inputs*  ii;
	outputs* oo;
	std::map<std::string, option> opts = {};
	std::map<std::string, std::string> alts = {};
	strings args;
	strings fs; // formulas given by --formula
	bool parse_option(const strings& sargs, size_t i, bool& skip_next);
	bool is_value(const strings& sargs, size_t i) const;
	void setup();
	void init_defaults();
};

ostream_t& operator<<(ostream_t& os, const option& o);
ostream_t& operator<<(ostream_t& os, const options& o);

} // robdd namespace
#endif // __ROBDD__OPTIONS_H__
