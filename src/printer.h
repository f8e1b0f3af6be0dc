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
#ifndef __ROBDD__PRINTER_H__
#define __ROBDD__PRINTER_H__
#include "bdd.h"

namespace robdd {

// writes header, ordering, root, table size and every node of the table
ostream_t& print_listing(ostream_t& os, const bdd_manager& m, size_t root);

// writes graphviz digraph of nodes reachable from root
ostream_t& print_dot(ostream_t& os, const bdd_manager& m, size_t root);

ostream_t& print_ordering(ostream_t& os, const strings& order);

} // robdd namespace
#endif // __ROBDD__PRINTER_H__
