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
#ifndef __ROBDD__OUTPUT_H__
#define __ROBDD__OUTPUT_H__
#include <string>
#include <sstream>
#include <map>
#include <fstream>
#include <memory>
#include "defs.h"

namespace robdd {

/**
 * output is a named stream which can be redirected to stdout, stderr, a file,
 * an in-memory buffer, a file named by outputs::name() or discarded (@null).
 */
class output {
public:
	enum type_t { NONE, STDOUT, STDERR, FILE, BUFFER, NAME };
	output(const std::string& n, const std::string& t = "",
		const std::string& e = "") : name_(n), ext_(e) { target(t); }
	output(const output&) = delete;
	output& operator=(const output&) = delete;
	const std::string& name() const { return name_; }
	type_t type() const { return type_; }
	ostream_t& os() { return *os_; }
	// @return path for FILE and NAME, @stdout, @buffer... otherwise
	std::string target() const;
	// redirects the output, "" is @stdout, anything unknown a file path
	type_t target(const std::string& t);
	std::string read() const {
		return type_ == BUFFER ? buffer_.str() : std::string(); }
	void clear() { if (type_ == BUFFER) buffer_.str(""); }
	bool is_null() const { return type_ == NONE; }
	template <typename T>
	output& operator<<(const T& value) { *os_ << value; return *this; }
private:
	ostream_t* os_ = &CNULL;
	ofstream_t file_;
	ostringstream_t buffer_;
	std::string name_;
	std::string ext_;  // extension of a @name file
	std::string path_; // file path for FILE and NAME
	type_t type_ = NONE;
	type_t null() { return os_ = &CNULL, path_.clear(), type_ = NONE; }
	static const std::map<std::string, type_t> types_;
};

typedef std::shared_ptr<output> sp_output;

/**
 * outputs is a set of outputs by name. One of them is global (the first
 * constructed or the last used) and static members and o:: shortcuts
 * write into it.
 */
class outputs {
public:
	outputs() { if (!o_) o_ = this; }
	~outputs() { if (o_ == this) o_ = 0; }
	outputs(const outputs&) = delete;
	outputs& operator=(const outputs&) = delete;
	void use() { o_ = this; }
	// adds output, an existing one of the same name is retargeted instead
	void add(sp_output o);
	void create(const std::string& n, const std::string& e,
		const std::string& t = "@null")
	{
		add(std::make_shared<output>(n, t, e));
	}
	static output* get(const std::string& n);
	static ostream_t& to(const std::string& n);
	static bool exists(const std::string& n) { return get(n) != 0; }
	static std::string read(const std::string& n) {
		output* o = get(n); return o ? o->read() : std::string(); }
	static void clear(const std::string& n) { if (output* o = get(n)) o->clear(); }
	static void target(const std::string& n, const std::string& t);
	static void name(const std::string& n) { if (o_) o_->name_ = n; }
	static std::string named() { return o_ ? o_->name_ : std::string(); }
	static bool enabled(const std::string& n) {
		output* o = get(n); return o && !o->is_null(); }
private:
	std::map<std::string, sp_output> m_;
	std::string name_; // base of @name files
	static outputs* o_;
};

namespace o { // o:: namespace shortcuts
	// creates output, error, info, debug, benchmarks, listing and dot
	outputs& init_outputs(outputs& oo);
	ostream_t& out();
	ostream_t& err();
	ostream_t& inf();
	ostream_t& dbg();
	ostream_t& ms();
	ostream_t& listing();
	ostream_t& dot();
	bool enabled(const std::string& n);
}

} // robdd namespace

#endif // __ROBDD__OUTPUT_H__
