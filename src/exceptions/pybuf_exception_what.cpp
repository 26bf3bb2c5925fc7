/***
 * Name: pybuf::exceptions::PybufException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pybuf/exceptions/pybuf_exception.h"

namespace pybuf::exceptions {

const char* PybufException::what() const noexcept { return message_.c_str(); }

}  // namespace pybuf::exceptions
