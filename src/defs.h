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
#ifndef __ROBDD__DEFS_H__
#define __ROBDD__DEFS_H__

#include <cassert>
#include <cstdint>
#include <ctime>
#include <vector>
#include <set>
#include <map>
#include <array>
#include <string>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>

namespace robdd {

#ifdef DEBUG
#define DBG(x) x
#define DBGFAIL assert(0)
#else
#define DBG(x)
#define DBGFAIL
#endif

typedef int32_t int_t;
typedef uint32_t uint_t;
typedef std::vector<size_t> sizes;
typedef std::vector<bool> bools;
typedef std::vector<bools> vbools;
typedef std::vector<std::string> strings;

extern std::ostream cnull;

typedef char syschar_t;
#define CIN   std::cin
#define COUT  std::cout
#define CERR  std::cerr
#define CNULL robdd::cnull
#define EMPTY_STRING ""

typedef std::basic_string<syschar_t>        sysstring_t;
typedef std::basic_istream<syschar_t>       istream_t;
typedef std::basic_ostream<syschar_t>       ostream_t;
typedef std::basic_ofstream<syschar_t>      ofstream_t;
typedef std::basic_ostringstream<syschar_t> ostringstream_t;
typedef std::basic_istringstream<syschar_t> istringstream_t;

typedef const char* ccs;
typedef ccs* pccs;
typedef std::array<ccs, 2> lexeme;
const lexeme null_lexeme{ 0, 0 };
typedef std::vector<lexeme> lexemes;

bool operator==(const lexeme& l, const std::string& s);
bool operator==(const lexeme& l, const char* s);
inline bool operator!=(const lexeme& l, const char* s) { return !(l == s); }
#define lexeme2str(l) std::string((l)[0], (l)[1]-(l)[0])

#define has(x, y) ((x).find(y) != (x).end())
#define measure_time_start() start = clock()
#define measure_time_end() end = clock(), \
		o::ms() << std::fixed << std::setprecision(2) << \
		(double(end - start) / CLOCKS_PER_SEC) * 1000 \
		<< " ms" << std::endl

//-----------------------------------------------------------------------------
// GIT_* macros are populated at compile time by -D or they're set to "n/a"
#ifndef GIT_DESCRIBED
#define GIT_DESCRIBED   "n/a"
#endif
#ifndef GIT_COMMIT_HASH
#define GIT_COMMIT_HASH "n/a"
#endif
#ifndef GIT_BRANCH
#define GIT_BRANCH      "n/a"
#endif

} // robdd namespace

#endif // __ROBDD__DEFS_H__
