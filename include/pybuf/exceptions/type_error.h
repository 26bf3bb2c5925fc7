/***
 * Name: pybuf::exceptions::TypeError
 * Purpose: Exception for objects that do not provide the buffer protocol.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PybufException.
 */
#pragma once

#include <string>
#include <utility>

#include "pybuf/exceptions/pybuf_exception.h"

namespace pybuf {
namespace exceptions {

class TypeError : public PybufException {
 public:
  explicit TypeError(std::string msg) noexcept : PybufException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybuf
