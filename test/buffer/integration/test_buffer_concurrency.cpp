/***
 * Name: test_buffer_concurrency
 * Purpose: Exports, borrows and resizes racing across threads keep the counts balanced.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>
#include "runtime/All.h"
#include "pybuf/exceptions/buffer_error.h"

using namespace pybuf::buffer;
using namespace pybuf::rt;

TEST(BufferConcurrency, ExportsFromManyThreadsBalance) {
  buffer_stats_reset_for_tests();
  auto arr = ByteArray::create(std::vector<unsigned char>(64, 1));
  constexpr int kThreads = 8;
  constexpr int kIters = 500;
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&arr]() {
      for (int i = 0; i < kIters; ++i) {
        ManagedBuffer view = ManagedBuffer::fromObject(arr);
        ManagedBuffer copy = view;
        ManagedBuffer moved = std::move(copy);
        (void)toBytes(moved);
      }
    });
  }
  for (auto& w : workers) { w.join(); }
  EXPECT_EQ(arr->exports(), 0u);
  const BufferStats st = buffer_stats();
  EXPECT_EQ(st.exportsCreated, static_cast<uint64_t>(kThreads) * kIters * 2);
  EXPECT_EQ(st.liveExports(), 0u);
  arr->append(2);
  EXPECT_EQ(arr->size(), 65u);
}

TEST(BufferConcurrency, ReadersNeverSeeTornWrites) {
  auto vec = std::make_shared<VecBuffer>(std::vector<unsigned char>(256, 0));
  ManagedBuffer writerView = VecBuffer::intoBuffer(vec, false);
  ManagedBuffer readerView = VecBuffer::intoBuffer(vec, true);
  std::atomic<bool> torn{false};
  std::atomic<bool> done{false};

  std::thread writer([&]() {
    for (int round = 1; round <= 200; ++round) {
      const BorrowedBytesMut out = writerView.objBytesMut();
      for (std::size_t i = 0; i < out.size(); ++i) { out[i] = static_cast<unsigned char>(round); }
    }
    done.store(true, std::memory_order_release);
  });
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&]() {
      while (!done.load(std::memory_order_acquire)) {
        readerView.contiguousOrCollect([&](std::span<const unsigned char> bytes) {
          for (unsigned char b : bytes) {
            if (b != bytes[0]) { torn.store(true, std::memory_order_relaxed); }
          }
        });
      }
    });
  }
  writer.join();
  for (auto& r : readers) { r.join(); }
  EXPECT_FALSE(torn.load());
  EXPECT_EQ(toBytes(readerView)[255], 200);
}

TEST(BufferConcurrency, ResizeRacesWithExportsNeverCorrupt) {
  auto arr = ByteArray::create({0});
  std::atomic<int> refused{0};
  std::atomic<int> grown{0};
  std::thread exporter([&]() {
    for (int i = 0; i < 2000; ++i) {
      ManagedBuffer view = ManagedBuffer::fromObject(arr);
      (void)view.asContiguous();
    }
  });
  std::thread resizer([&]() {
    for (int i = 0; i < 2000; ++i) {
      try {
        arr->append(1);
        grown.fetch_add(1, std::memory_order_relaxed);
      } catch (const pybuf::exceptions::BufferError&) {
        refused.fetch_add(1, std::memory_order_relaxed);
      }
    }
  });
  exporter.join();
  resizer.join();
  EXPECT_EQ(grown.load() + refused.load(), 2000);
  EXPECT_EQ(arr->size(), 1u + static_cast<std::size_t>(grown.load()));
  EXPECT_EQ(arr->exports(), 0u);
}

// Every export must describe the storage it was created over, even while another
// thread keeps shrinking and regrowing the provider.
template <typename Provider, typename Export, typename Shrink, typename Grow>
static int stale_exports_under_resize_churn(const std::shared_ptr<Provider>& obj, Export makeExport, Shrink shrink,
                                            Grow grow, int iters) {
  std::atomic<bool> done{false};
  std::thread churn([&]() {
    while (!done.load(std::memory_order_acquire)) {
      try {
        shrink(*obj);
        grow(*obj);
      } catch (const pybuf::exceptions::BufferError&) {
        // an export is alive; try again
      }
    }
  });
  int stale = 0;
  for (int i = 0; i < iters; ++i) {
    ManagedBuffer view = makeExport(obj);
    try {
      (void)view.asContiguous();
      if (view.desc().len() != obj->byteLen()) { ++stale; }
    } catch (const pybuf::exceptions::BufferError&) {
      ++stale;
    }
  }
  done.store(true, std::memory_order_release);
  churn.join();
  return stale;
}

TEST(BufferConcurrency, ByteArrayExportsNeverOutliveAConcurrentResize) {
  auto arr = ByteArray::create(std::vector<unsigned char>(64, 7));
  auto shrink = [](ByteArray& a) { a.clear(); };
  auto grow = [](ByteArray& a) { a.resize(64); };
  EXPECT_EQ(stale_exports_under_resize_churn<ByteArray>(
                arr, [](const std::shared_ptr<ByteArray>& a) { return ManagedBuffer::fromObject(a); }, shrink, grow,
                50000),
            0);
  EXPECT_EQ(stale_exports_under_resize_churn<ByteArray>(
                arr, [](const std::shared_ptr<ByteArray>& a) { return ByteArray::exportReadonly(a); }, shrink, grow,
                50000),
            0);
  EXPECT_EQ(arr->exports(), 0u);
}

TEST(BufferConcurrency, ArrayExportsNeverOutliveAConcurrentResize) {
  auto arr = Array::create('i');
  auto shrink = [](Array& a) {
    auto permit = a.tryResizable();
    permit->clear();
  };
  auto grow = [](Array& a) {
    const int32_t v = 42;
    a.appendRaw(&v);
    a.appendRaw(&v);
  };
  EXPECT_EQ(stale_exports_under_resize_churn<Array>(
                arr, [](const std::shared_ptr<Array>& a) { return ManagedBuffer::fromObject(a); }, shrink, grow,
                50000),
            0);
  EXPECT_EQ(arr->exports(), 0u);
}

TEST(BufferConcurrency, ConfigOverridesRaceWithValidationChecks) {
  const RuntimeConfig saved = runtime_config();
  std::atomic<bool> done{false};
  std::thread writer([&]() {
    for (int i = 0; i < 20000; ++i) {
      set_runtime_config(RuntimeConfig{i % 3, (i % 2) == 0 ? ValidationMode::Always : ValidationMode::Never});
    }
    done.store(true, std::memory_order_release);
  });
  while (!done.load(std::memory_order_acquire)) {
    (void)validation_enabled();
    const RuntimeConfig snapshot = runtime_config();
    EXPECT_LE(snapshot.debugLevel, 2);
  }
  writer.join();
  set_runtime_config(RuntimeConfig{0, ValidationMode::Always});
  EXPECT_TRUE(validation_enabled());
  set_runtime_config(saved);
}
