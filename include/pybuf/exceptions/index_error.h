/***
 * Name: pybuf::exceptions::IndexError
 * Purpose: Exception for indices out of range on a buffer dimension.
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

class IndexError : public PybufException {
 public:
  explicit IndexError(std::string msg) noexcept : PybufException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybuf
