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
#include "options.h"

using namespace std;

namespace robdd {

bool option::parse_value(const string& s) {
	bool ok = true;
	switch (t) {
		case BOOL: ok = parse_bool(s); break;
		case STRING: if (s != "") v.set(s);
			else if (is_output()) v.set(string("@stdout"));
			break;
		default: DBGFAIL;
	}
	if (ok && e) e(v);
	return ok;
}

bool option::is_bool(const string& s) {
	for (auto b : { "true", "t", "1", "on", "enabled", "yes",
			"false", "f", "0", "off", "disabled", "no" })
		if (s == b) return true;
	return false;
}

bool option::parse_bool(const string& s) {
	if (s=="" || s=="true" || s=="t" || s=="1" || s=="on" ||
					s=="enabled" || s=="yes")
		return v.set(true), true;
	v.set(false);
	if (!(s=="false" || s=="f" || s=="0" || s=="off" ||
					s=="disabled" || s=="no"))
		return o::err() << "Wrong bool argument: " << s << endl, false;
	return true;
}

ostream_t& option::help(ostream_t& os) const {
	ostringstream_t ss;
	ss << "\t";
	for (size_t i = 0; i != n.size(); ++i)
		ss << (i ? ", " : "-") << "-" << n[i];
	ss << " [";
	switch (t) {
		case BOOL: ss << "bool"; break;
		case STRING:
			if (is_output()) ss << "output";
			else if (is_input()) ss << "input";
			else ss << "string";
			break;
		default: DBGFAIL;
	}
	ss << "]";
	if (desc.size() > 0) {
		const long indent = 28;
		long to_write = indent - (long) ss.str().size();
		while (to_write-- > 0) ss << " ";
		ss << ' ' << desc;
	}
	return os << ss.str();
}

void options::add(option o) {
	set(o.name(), o);
	for (auto& n : o.names()) alts[n] = o.name();
}

optional<option> options::get(const string& name) const {
	if (auto ait = alts.find(name); ait == alts.end()) return nullopt;
	else if (auto oit = opts.find(ait->second); oit == opts.end())
		return nullopt;
	else return oit->second;
}

bool options::get_bool(const string& name) const {
	if (auto o = get(name)) return o->get_bool(); else return false;
}

string options::get_string(const string& name) const {
	if (auto o = get(name)) return o->get_string(); else return "";
}

template <typename T>
void options::set(const string& name, T val) {
	if (auto o = get(name)) o->v.set(val), set(o->name(), *o);
}
template void options::set<bool>(const string&, bool);
template void options::set<string>(const string&, string);

bool options::enabled(const string& name) const {
	if (auto o = get(name)) {
		switch (o->get_type()) {
			case option::BOOL:   return o->get_bool();
			case option::STRING: {
				output* t = outputs::get(o->name());
				return t ? !t->is_null() : o->get_string() != "";
			}
			default: ;
		}
	}
	return false;
}

bool options::parse(int c, char** v, bool internal) {
	strings sargs;
	for (int i = 0; i < c; ++i) sargs.push_back(string(v[i]));
	return parse(sargs, internal);
}

bool options::parse(strings sargs, bool internal) {
	bool skip_next = false, ok = true;
	for (size_t i = 0; i < sargs.size(); ++i) {
		if (!internal) args.push_back(sargs[i]);
		if (skip_next) skip_next = false;
		else if (!parse_option(sargs, i, skip_next)) ok = false;
	}
	return ok;
}

bool options::is_value(const strings& sargs, size_t i) const {
	if (i >= sargs.size()) return false;
	return sargs[i] == "-" || sargs[i].empty() || sargs[i][0] != '-';
}

bool options::parse_option(const strings& sargs, size_t i, bool& skip_next) {
	bool disabled = false;
	skip_next = false;
	size_t pos = 0;
	const string& arg = sargs[i];
	// skip hyphens
	while (pos < arg.length() && arg[pos] == '-' && pos < 2) ++pos;
	string a = arg.substr(pos);
	// is option disabled?
	if (a.rfind("disable-",   0) == 0) disabled = true, a = a.substr(8);
	else if (a.rfind("dont-", 0) == 0) disabled = true, a = a.substr(5);
	else if (a.rfind("no-",   0) == 0) disabled = true, a = a.substr(3);
	if (auto o = get(a)) {
		bool ok = true;
		if (disabled) o->disable();
		// bool options take a value only when it looks like a bool
		else if (is_value(sargs, i+1) && (o->get_type() != option::BOOL
			|| option::is_bool(sargs[i+1])))
			ok = o->parse_value(sargs[i+1]), skip_next = true;
		else ok = o->parse_value("");
		set(o->name(), *o);
		return ok;
	}
	if (!i) return true; // arg[0] is not expected to be an argument
	o::err() << "Unknown argument: " << sargs[i] << endl;
	skip_next = is_value(sargs, i+1);
	return false;
}

#define add_bool(n,desc) add(option(option::BOOL, {n}).description(desc))
#define add_output(n,desc) add(option(option::STRING, {n}, \
		[this](const option::value& v) { \
			if (oo) oo->target(n, v.get_string()); \
		}).description((desc)))
#define add_output_alt(n,alt,desc) add(option(option::STRING, {n, alt}, \
		[this](const option::value& v) { \
			if (oo) oo->target(n, v.get_string()); \
		}).description((desc)))

void options::setup() {
	add(option(option::BOOL, { "help", "h", "?" },
		[this](const option::value& v) {
			if (v.get_bool()) help(o::out());
		})
		.description("this help"));
	add(option(option::BOOL, { "version", "v" },
		[](const option::value& v) {
			if (v.get_bool()) o::out() << "robdd: "
				<< GIT_DESCRIBED << endl;
			DBG(if (v.get_bool()) o::out()
				<< "commit: " << GIT_COMMIT_HASH << " ("
				<< GIT_BRANCH << ')' << endl;)
		})
		.description("print version"));
	add(option(option::STRING, { "input", "i" },
		[this](const option::value& v) {
			if (!ii) return;
			if (v.get_string() == "@stdin" || v.get_string() == "-")
				ii->add_stdin();
			else ii->add_file(v.get_string());
		}).description("input           (one formula per line)"));
	add(option(option::STRING, { "formula", "f" },
		[this](const option::value& v) {
			if (v.get_string().size()) fs.push_back(v.get_string());
		}).description("formula to build (can be repeated)"));
	add(option(option::STRING, { "order", "vo" })
		.description("variable ordering (names separated by spaces"
			" or commas)"));
	add_bool("memo",   "memoize apply (enabled by default)");
	add_bool("strict", "unknown characters in formulas are errors");
	add_bool("stats",  "print table statistics into info output");
	add(option(option::STRING, { "name", "n" },
		[](const option::value& v) {
			outputs::name(v.get_string());
		}).description("name used for @name output"));
	add_output_alt("output", "o", "standard output (@stdout by default)");
	add_output    ("error",       "errors          (@stderr by default)");
	add_output    ("info",        "info            (@null by default)");
	add_output    ("debug",       "debug output");
	add_output    ("benchmarks",  "benchmarking results (@null by default)");
	add_output_alt("listing", "l", "node listing of each formula");
	add_output_alt("dot", "d",     "graphviz digraph of each formula");
	init_defaults();
}

#undef add_bool
#undef add_output
#undef add_output_alt

void options::init_defaults() {
	error |= !parse(strings{ "--memo" }, true);
	DBG(if (oo) error |= !parse(strings{ "--debug", "@stderr" }, true);)
}

ostream_t& options::help(ostream_t& os) const {
	os << "Usage:\n";
	os << "\trobdd [options]\n";
	os << "\n";
	os << "options:\n";
	os << "\tOptions are preceded by one or two hyphens (--memo/-memo).\n";
	os << "\tDisable option by prefixing it with disable-, no- or dont-\n";
	os << "\t\t(--disable-memo/--no-memo/--dont-memo).\n";
	os << "\n";
	for (auto& oit : opts) oit.second.help(os) << "\n";
	os << "\n";
	os << "bool:\n";
	os << "\tEnabled if 'true', 't', '1', 'yes', 'on', 'enabled' or "
		<< "if no argument.\n";
	os << "\n";
	os << "input:\n";
	os << "\t[FILENAME | @stdin | - ]\n";
	os << "\n";
	os << "\tOne formula per line. Empty lines and lines starting with #\n";
	os << "\tare skipped. '@order a b c' sets the ordering for the\n";
	os << "\tformulas which follow it.\n";
	os << "\n";
	os << "output:\n";
	os << "\t[FILENAME | @stdout | @stderr | @name | @null | @buffer]\n";
	os << "\n";
	os << "\t@null\tdisable output\n";
	os << "\t@stdout\tredirect to stdout\n";
	os << "\t@stderr\tredirect to stderr\n";
	os << "\t@buffer\tredirect to buffer to be read through API later\n";
	os << "\t@name\tredirect to a file named by --name (ext predefined)\n";
	return os;
}

ostream_t& operator<<(ostream_t& os, const option& o) {
	os << o.name() << ": ";
	switch (o.get_type()) {
		case option::BOOL:   return os << (o.get_bool() ? "true":"false");
		case option::STRING: return os << '"' << o.get_string() << '"';
		default:             return os << "undefined";
	}
}

ostream_t& options::print(ostream_t& os) const {
	size_t n = 0;
	for (auto& it : opts) if (!it.second.is_undefined())
		os << (n++ ? ", " : "") << it.second;
	return os;
}

ostream_t& operator<<(ostream_t& os, const options& o) { return o.print(os); }

} // robdd namespace
