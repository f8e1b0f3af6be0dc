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
#include "driver.h"
#include "err.h"

using namespace std;
using namespace robdd;

int main(int argc, char** argv) {
	inputs ii;
	outputs oo;
	o::init_outputs(oo);
	try {
		options o(argc, argv, &ii, &oo);
		if (o.error) return 1;
		if (o.enabled("h") || o.enabled("v")) return 0;
		// read from stdin by default if no -i, -f, -h and -v
		if (!o.has_inputs() && o.formulas().empty()
			&& !o.parse(strings{ "-i", "@stdin" }, true)) return 1;
		driver d(o);
		return d.run() ? 0 : 1;
	} catch (const runtime_error_exception&) {
		return 1; // input file not found, already reported
	}
}
