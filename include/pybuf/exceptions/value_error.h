/***
 * Name: pybuf::exceptions::ValueError
 * Purpose: Exception for structurally incompatible buffers and bad provider arguments.
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

class ValueError : public PybufException {
 public:
  explicit ValueError(std::string msg) noexcept : PybufException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybuf
