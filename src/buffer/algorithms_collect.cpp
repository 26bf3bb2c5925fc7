/***
 * Name: pybuf::buffer::toBytes, concat, writeTo
 * Purpose: Move logical buffer contents into vectors, Bytes objects and streams.
 * Theory of Operation: concat accumulates into a VecBuffer and hands its storage
 *   to the resulting Bytes with VecBuffer::take(), so the joined bytes are copied
 *   exactly once.
 */
#include "buffer/Algorithms.h"
#include "runtime/Bytes.h"
#include "runtime/VecBuffer.h"

#include <span>

namespace pybuf::buffer {

std::vector<unsigned char> toBytes(const ManagedBuffer& buf) {
  std::vector<unsigned char> out;
  out.reserve(buf.desc().len());
  buf.appendTo(out);
  return out;
}

std::shared_ptr<rt::Bytes> concat(const ManagedBuffer& a, const ManagedBuffer& b) {
  rt::VecBuffer acc;
  a.contiguousOrCollect([&](std::span<const unsigned char> bytes) { acc.append(bytes); });
  b.contiguousOrCollect([&](std::span<const unsigned char> bytes) { acc.append(bytes); });
  return rt::Bytes::fromVecBuffer(acc);
}

std::size_t writeTo(std::ostream& out, const ManagedBuffer& buf) {
  return buf.contiguousOrCollect([&](std::span<const unsigned char> bytes) {
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return bytes.size();
  });
}

}  // namespace pybuf::buffer
