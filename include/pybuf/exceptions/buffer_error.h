/***
 * Name: pybuf::exceptions::BufferError
 * Purpose: Exception for buffer export conflicts and writes into read-only views.
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

class BufferError : public PybufException {
 public:
  explicit BufferError(std::string msg) noexcept : PybufException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybuf
