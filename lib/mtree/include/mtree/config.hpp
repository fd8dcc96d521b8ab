#pragma once

#include <cstddef>

namespace Mtree {

/// Tuning knobs for tree construction. None of them affect the resulting digests.
struct BuildConfig {
    size_t worker_threads = 0; ///< 0: hardware_concurrency(), 1: sequential
    size_t parallel_threshold = 256; ///< minimum pairs in a level before it is split across workers
};

} // namespace Mtree
