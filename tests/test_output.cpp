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
#include "unittest.hpp"
#include "../src/output.h"

using namespace robdd;

TEST_SUITE("output class") {
TEST_CASE("create") {
	output o1("def");
	output o2("std", "@stdout");
	output oe("err", "@stderr");
	output on("null", "@null");
	output ob("buf", "@buffer");
	output of("file", "output.test.file");
	EXPECT_TRUE(o1.name() == "def" && o1.target() == "@stdout"
		&& !o1.is_null());
	EXPECT_TRUE(o2.name() == "std" && o2.target() == "@stdout"
		&& !o2.is_null());
	EXPECT_TRUE(oe.name() == "err" && oe.target() == "@stderr"
		&& !oe.is_null());
	EXPECT_TRUE(on.name() == "null" && on.target() == "@null"
		&& on.is_null());
	EXPECT_TRUE(ob.name() == "buf" && ob.target() == "@buffer"
		&& !ob.is_null());
	EXPECT_TRUE(of.name() == "file" && of.target() == "output.test.file"
		&& !of.is_null() && of.type() == output::FILE);
}
TEST_CASE("null") {
	output on("null", "@null"); on << "discarded";
	EXPECT_TRUE(on.is_null());
	CHECK(on.read() == "");
}
TEST_CASE("buffer") {
	output ob("b", "@buffer"); ob << "buffer " << 42;
	CHECK(ob.read() == "buffer 42");
	ob.clear();
	CHECK(ob.read() == "");
}
TEST_CASE("retarget") {
	output o("o", "@buffer"); o << "first";
	o.target("@null"); o << "second";
	EXPECT_TRUE(o.is_null());
	o.target("@buffer"); o << "third";
	CHECK(o.read() == "third");
}
TEST_CASE("file") {
	{
		output of("f", "output.test.file2"); of << "file test";
		EXPECT_TRUE(of.target() == "output.test.file2");
	}
	std::ifstream f("output.test.file2");
	std::string s; std::getline(f, s);
	CHECK(s.find("file test") != std::string::npos);
}
}
TEST_SUITE("outputs class") {
TEST_CASE("create") {
	outputs oo; oo.use();
	oo.add(std::make_shared<output>("stdout", "@stdout"));
	EXPECT_TRUE(oo.exists("stdout"));
	EXPECT_FALSE(oo.exists("nonexistent"));
	CHECK(&outputs::to("nonexistent") == &CNULL);
}
TEST_CASE("multiple") {
	outputs oo1; oo1.use();
	oo1.add(std::make_shared<output>("output_name", "@buffer"));
	output* o = outputs::get("output_name");
	outputs::to("output_name") << "test1";
	*o << "test2";
	CHECK(o->read() == "test1test2");

	outputs oo2; oo2.use();
	oo2.add(std::make_shared<output>("output_name", "@buffer"));
	outputs::to("output_name") << "test3";
	o = outputs::get("output_name");
	*o << "test4";
	CHECK(o->read() == "test3test4");

	oo1.use();
	outputs::to("output_name") << "test5";
	o = outputs::get("output_name");
	*o << "test6";
	CHECK(o->read() == "test1test2test5test6");
}
TEST_CASE("defaults") {
	outputs oo; oo.use();
	o::init_outputs(oo);
	CHECK(outputs::get("output")->target() == "@stdout");
	CHECK(outputs::get("error")->target() == "@stderr");
	for (auto n : { "info", "debug", "benchmarks", "listing", "dot" })
		EXPECT_TRUE(outputs::get(n)->is_null());
	EXPECT_FALSE(o::enabled("listing"));
	oo.target("listing", "@buffer");
	EXPECT_TRUE(o::enabled("listing"));
	o::listing() << "listed";
	CHECK(outputs::read("listing") == "listed");
}
TEST_CASE("name") {
	outputs oo; oo.use();
	o::init_outputs(oo);
	oo.target("error", "@buffer");
	oo.create("noname", ".noname", "@name");
	CHECK(oo.read("error") ==
		"output 'noname' targeting @name without setting name\n");
	EXPECT_TRUE(outputs::get("noname")->is_null());
	outputs::name("named");
	oo.create("name1", ".name1", "@name");
	CHECK(outputs::get("name1")->target() == "named.name1");
	outputs::to("name1") << "named1 test\n";
}
TEST_CASE("unwritable file") {
	outputs oo; oo.use();
	o::init_outputs(oo);
	oo.target("error", "@buffer");
	oo.target("dot", "nonexistent.dir/out.dot");
	CHECK(oo.read("error") ==
		"output 'dot' cannot open nonexistent.dir/out.dot\n");
	EXPECT_TRUE(outputs::get("dot")->is_null());
	EXPECT_FALSE(o::enabled("dot"));
}
TEST_CASE("add retargets an existing output") {
	outputs oo; oo.use();
	oo.create("log", ".log", "@buffer");
	outputs::to("log") << "lost";
	oo.add(std::make_shared<output>("log", "@null"));
	EXPECT_TRUE(outputs::get("log")->is_null());
	oo.target("unknown", "@buffer");
	EXPECT_FALSE(oo.exists("unknown"));
}
}
