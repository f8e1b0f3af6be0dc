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
#ifndef __ROBDD__DRIVER_H__
#define __ROBDD__DRIVER_H__
#include <vector>
#include "bdd.h"
#include "input.h"
#include "output.h"
#include "options.h"

namespace robdd {

// outcome of building one formula
struct result {
	std::string formula;
	strings ordering;
	size_t root = F;
	size_t nodes = 0;
	size_t sat = 0; // number of satisfying assignments
	bool sat_fits = true; // sat is exact, it didn't overflow size_t
	bool ok = false;
	std::string error; // message of the error if failed
};

/**
 * driver builds every formula given by --formula and by inputs, each one in
 * its own bdd_manager, and reports them into the output, listing and dot
 * streams. A failing formula sets error and the driver goes on.
 */
class driver {
public:
	driver(const options& o);
	// @return true if no formula failed
	bool run();
	/**
	 * builds and reports a single formula
	 * @param f - formula
	 * @param ordering - variable ordering, empty for order of appearance
	 * @return true on success
	 */
	bool formula(const std::string& f, const strings& ordering);
	// processes input data: one formula or @order directive per line
	bool read(const input& in);
	const std::vector<result>& results() const { return rs; }
	bool error = false;
private:
	const options& opts;
	strings order; // ordering given by --order
	std::vector<result> rs;
	void report(ostream_t& os, const result& r) const;
};

} // robdd namespace
#endif // __ROBDD__DRIVER_H__
