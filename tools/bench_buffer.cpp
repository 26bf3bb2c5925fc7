/**
 * Buffer traversal benchmark: contiguous, strided and reversed views of the same bytes.
 * Usage: bench_buffer [iters] [size]
 */
#include "runtime/All.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

using namespace pybuf::buffer;
using namespace pybuf::rt;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 20000;
  std::size_t size  = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 4096;
  if (size < 2) { size = 2; }

  auto storage = std::make_shared<VecBuffer>(std::vector<unsigned char>(size * 2, 0x5A));
  const auto half = size / 2;

  auto run = [&](const char* label, const ManagedBuffer& view) {
    buffer_stats_reset_for_tests();
    std::uint64_t sink = 0;
    const auto t0 = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) {
      sink += view.contiguousOrCollect([](std::span<const unsigned char> bytes) { return bytes.size(); });
    }
    const auto t1 = std::chrono::steady_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
    auto st = buffer_stats();
    std::cout << "[" << label << "]"
              << " iters=" << iters
              << " len=" << view.desc().len()
              << " time_us=" << us
              << " contiguous_hits=" << st.contiguousHits
              << " fallbacks=" << st.collectFallbacks
              << " bytes_collected=" << st.bytesCollected
              << " checksum=" << sink
              << "\n";
  };

  const auto n = static_cast<std::ptrdiff_t>(size);
  run("contiguous", VecBuffer::intoBufferWithDescriptor(storage, BufferDescriptor::simple(size, true)));
  run("strided", VecBuffer::intoBufferWithDescriptor(storage, BufferDescriptor(size, true, 1, "B", {{size, 2, 0}})));
  run("reversed", VecBuffer::intoBufferWithDescriptor(storage, BufferDescriptor(size, true, 1, "B", {{size, -1, n - 1}})));
  run("rows", VecBuffer::intoBufferWithDescriptor(
                  storage, BufferDescriptor(half * 2, true, 1, "B", {{2, n, 0}, {half, 1, 0}})));
  return 0;
}
