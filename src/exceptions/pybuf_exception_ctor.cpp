/***
 * Name: pybuf::exceptions::PybufException::PybufException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pybuf/exceptions/pybuf_exception.h"

#include <utility>

namespace pybuf {
namespace exceptions {

PybufException::PybufException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pybuf
