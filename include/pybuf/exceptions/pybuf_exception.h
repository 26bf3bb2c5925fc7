/***
 * Name: pybuf::exceptions::PybufException
 * Purpose: Common base of the recoverable errors raised by the buffer protocol
 *   and its providers.
 * Inputs: Message string; the exact texts are part of the runtime's observable
 *   behavior (e.g. "a bytes-like object is required, not 'object'").
 * Outputs: Exception object providing `what()` text
 * Theory of Operation:
 *   Each subclass corresponds to one runtime-level error kind:
 *   - BufferError: resize while exported, write through a read-only view, a
 *     view reaching past its provider's storage.
 *   - IndexError: element index outside its dimension after wraparound.
 *   - TypeError: object whose type chain registers no buffer slot.
 *   - ValueError: mismatched buffer structures, bad array typecodes and item
 *     sizes, out-of-range byte values.
 *   - ConfigError: malformed PYBUF_* environment settings.
 *   Descriptor invariant violations are not exceptions: they abort in
 *   BufferDescriptor::validate(). Catch sites that do not care about the kind
 *   catch this base; it derives from std::exception for foreign handlers.
 */
#pragma once

#include <exception>
#include <string>

namespace pybuf {
namespace exceptions {

class PybufException : public std::exception {
 public:
  virtual ~PybufException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PybufException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pybuf
