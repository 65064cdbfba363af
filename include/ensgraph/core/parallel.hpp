/* Explicit parallelism configuration threaded through constructors and
 * algorithms instead of a process-wide thread count. */
#pragma once

#include <omp.h>

namespace ensgraph::core {

struct ParallelContext {
  // 0 selects the OpenMP default (omp_get_max_threads()).
  int num_threads {0};

  [[nodiscard]] int threads() const noexcept {
    return num_threads > 0 ? num_threads : omp_get_max_threads();
  }
};

} // namespace ensgraph::core
