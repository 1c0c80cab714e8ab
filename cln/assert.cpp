#include "cln/assert.hh"

namespace boost {

void assertion_failed_msg(char const * expr, char const * msg, char const * function, char const * file, long line) {
    throw ::cln::AssertionError(expr, msg, function, file, line);
}

void assertion_failed(char const * expr, char const * function, char const * file, long line) {
    throw ::cln::AssertionError(expr, nullptr, function, file, line);
}

} // namespace boost
