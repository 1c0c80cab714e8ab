#if !defined CLADENAMER_BASE_INCLUDES_H
#define CLADENAMER_BASE_INCLUDES_H
#include "cln/assert.hh"
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#ifdef __clang__
#pragma clang diagnostic ignored "-Wpadded"
#pragma clang diagnostic ignored  "-Wweak-vtables"
#endif
#define ELPP_CUSTOM_COUT std::cerr
#define ELPP_THREAD_SAFE 1
#define ELPP_STACKTRACE_ON_CRASH 1

#include "easylogging++.h"

#define CLN_UNREACHABLE {LOG(ERROR)<<"Unreachable code reached!"; std::abort();}

namespace cln {
// Node ids of the input tree table. The tree tables produced by the
//  upstream pipeline number nodes well past the range of an int.
using NodeId = long;

} // namespace cln
#endif
