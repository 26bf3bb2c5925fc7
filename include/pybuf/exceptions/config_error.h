/***
 * Name: pybuf::exceptions::ConfigError
 * Purpose: Exception for malformed runtime configuration values.
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

class ConfigError : public PybufException {
 public:
  explicit ConfigError(std::string msg) noexcept : PybufException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pybuf
