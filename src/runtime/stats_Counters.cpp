/***
 * Name: pybuf::rt (buffer stats)
 * Purpose: Lock-free counters behind buffer_stats().
 */
#include "runtime/BufferStats.h"

#include <atomic>

namespace pybuf::rt {

static std::atomic<uint64_t> g_exports_created{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_exports_released{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_exports_detached{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_contiguous_hits{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_collect_fallbacks{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
static std::atomic<uint64_t> g_bytes_collected{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

BufferStats buffer_stats() {
  BufferStats st;
  st.exportsCreated = g_exports_created.load(std::memory_order_relaxed);
  st.exportsReleased = g_exports_released.load(std::memory_order_relaxed);
  st.exportsDetached = g_exports_detached.load(std::memory_order_relaxed);
  st.contiguousHits = g_contiguous_hits.load(std::memory_order_relaxed);
  st.collectFallbacks = g_collect_fallbacks.load(std::memory_order_relaxed);
  st.bytesCollected = g_bytes_collected.load(std::memory_order_relaxed);
  return st;
}

void buffer_stats_reset_for_tests() {
  g_exports_created.store(0, std::memory_order_relaxed);
  g_exports_released.store(0, std::memory_order_relaxed);
  g_exports_detached.store(0, std::memory_order_relaxed);
  g_contiguous_hits.store(0, std::memory_order_relaxed);
  g_collect_fallbacks.store(0, std::memory_order_relaxed);
  g_bytes_collected.store(0, std::memory_order_relaxed);
}

void stats_note_export_created() { g_exports_created.fetch_add(1, std::memory_order_relaxed); }
void stats_note_export_released() { g_exports_released.fetch_add(1, std::memory_order_relaxed); }
void stats_note_export_detached() { g_exports_detached.fetch_add(1, std::memory_order_relaxed); }
void stats_note_contiguous_hit() { g_contiguous_hits.fetch_add(1, std::memory_order_relaxed); }

void stats_note_collect_fallback(uint64_t bytes) {
  g_collect_fallbacks.fetch_add(1, std::memory_order_relaxed);
  g_bytes_collected.fetch_add(bytes, std::memory_order_relaxed);
}

} // namespace pybuf::rt
