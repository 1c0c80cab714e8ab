#ifndef CLADENAMER_ASSERT_H
#define CLADENAMER_ASSERT_H
// BOOST_ENABLE_ASSERT_HANDLER is defined for every target (see CMakeLists.txt),
//  so a failed BOOST_ASSERT calls the handlers in cln/assert.cpp.
#include <boost/assert.hpp>
#include "cln/error.h"

namespace cln {

// A violated internal invariant, as opposed to bad input.
class AssertionError : public CLNError {
    public:
    AssertionError(const char * expr, const char * msg, const char * function, const char * file, long line)
        :CLNError() {
        *this << "Internal error at " << file << ":" << line << " in " << function
              << ": (" << expr << ") does not hold";
        if (msg != nullptr) {
            *this << ". " << msg;
        }
    }
};

} // namespace cln
#endif
