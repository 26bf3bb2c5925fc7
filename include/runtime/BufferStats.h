/***
 * Name: pybuf::rt::BufferStats
 * Purpose: Expose buffer export and collection counters to tests and tooling.
 */
#pragma once

#include <cstdint>

namespace pybuf::rt {
    struct BufferStats {
        uint64_t exportsCreated{0};
        uint64_t exportsReleased{0};
        uint64_t exportsDetached{0}; // informational; a detached export is still live until released
        uint64_t contiguousHits{0}; // contiguousOrCollect served zero-copy
        uint64_t collectFallbacks{0}; // contiguousOrCollect had to materialize
        uint64_t bytesCollected{0}; // bytes materialized by those fallbacks

        uint64_t liveExports() const { return exportsCreated - exportsReleased; }
    };

    BufferStats buffer_stats();

    void buffer_stats_reset_for_tests();

    // Recording hooks used by ManagedBuffer; lock-free.
    void stats_note_export_created();

    void stats_note_export_released();

    void stats_note_export_detached();

    void stats_note_contiguous_hit();

    void stats_note_collect_fallback(uint64_t bytes);
} // namespace pybuf::rt
