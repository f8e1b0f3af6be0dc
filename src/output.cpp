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
#include "output.h"

using namespace std;

namespace robdd {

ostream cnull(0);

const map<string, output::type_t> output::types_ = {
	{ "@null",   NONE   },
	{ "@stdout", STDOUT },
	{ "@stderr", STDERR },
	{ "@buffer", BUFFER },
	{ "@name",   NAME   }
};
outputs* outputs::o_ = 0;

namespace o {
	outputs& init_outputs(outputs& oo) {
		oo.create("output",     ".out",       "@stdout");
		oo.create("error",      ".error.log", "@stderr");
		oo.create("info",       ".info.log");
		oo.create("debug",      ".debug.log");
		oo.create("benchmarks", ".bench.log");
		oo.create("listing",    ".txt");
		oo.create("dot",        ".dot");
		return oo;
	}
	ostream_t& out()     { return outputs::to("output"); }
	ostream_t& err()     { return outputs::to("error"); }
	ostream_t& inf()     { return outputs::to("info"); }
	ostream_t& dbg()     { return outputs::to("debug"); }
	ostream_t& ms()      { return outputs::to("benchmarks"); }
	ostream_t& listing() { return outputs::to("listing"); }
	ostream_t& dot()     { return outputs::to("dot"); }
	bool enabled(const string& n) { return outputs::enabled(n); }
}

string output::target() const {
	if (type_ == FILE || type_ == NAME) return path_;
	for (auto& it : types_) if (it.second == type_) return it.first;
	return "@stdout";
}

output::type_t output::target(const string& t) {
	if (file_.is_open()) file_.close();
	null();
	auto it = types_.find(t);
	type_ = t.empty() ? STDOUT : it == types_.end() ? FILE : it->second;
	switch (type_) {
		case NONE:   return type_;
		case STDOUT: os_ = &COUT; return type_;
		case STDERR: os_ = &CERR; return type_;
		case BUFFER: buffer_.str(""), os_ = &buffer_; return type_;
		case NAME:
			if (outputs::named().empty())
				return o::err() << "output '" << name_ << "' "
					"targeting @name without setting name"
					<< endl, null();
			path_ = outputs::named() + ext_;
			break;
		case FILE: path_ = t; break;
	}
	file_.open(path_, ofstream::binary | ofstream::app);
	if (!file_.is_open()) {
		const string p = path_;
		null();
		o::err() << "output '" << name_ << "' cannot open " << p << endl;
		return type_;
	}
	return os_ = &file_, type_;
}

void outputs::add(sp_output o) {
	auto it = m_.find(o->name());
	if (it == m_.end()) m_.emplace(o->name(), o);
	else it->second->target(o->target());
}

output* outputs::get(const string& n) {
	if (!o_) return 0;
	auto it = o_->m_.find(n);
	return it == o_->m_.end() ? 0 : it->second.get();
}

ostream_t& outputs::to(const string& n) {
	output* o = get(n);
	return o ? o->os() : CNULL;
}

void outputs::target(const string& n, const string& t) {
	if (output* o = get(n)) o->target(t);
	else o::err() << "target does not exist: " << n << endl;
}

} // robdd namespace
