#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf

#ifdef    HAS_NO_OMP
  inline int  omp_get_max_threads() { return 1; }
  inline int  omp_get_num_threads() { return 1; }
  inline int  omp_get_thread_num()  { return 0; }
  inline bool omp_in_parallel()     { return 0; }

  bool constexpr omp_replacement = true;
#else  // HAS_NO_OMP
  bool constexpr omp_replacement = false;
  #include <omp.h> // omp_get_max_threads, ...
#endif // HAS_NO_OMP

#include "status.hxx" // status_t

namespace omp_parallel {

  inline status_t all_tests(int const echo=0) {
      // the ring loop distributes latitude pairs over threads like this
      auto const max_threads = omp_get_max_threads(); // can be controlled by shell environment variable OMP_NUM_THREADS
      if (echo > 2) std::printf("# %sOpenMP with max %d threads\n", omp_replacement?"fake ":"", max_threads);
      status_t stat(0);
      stat += (1 != omp_get_num_threads()); // outside a parallel region, only 1 thread should be running
      int const nrings = 37;
      int sum{0};
      #pragma omp parallel for reduction(+:sum) schedule(dynamic)
      for (int iring = 0; iring < nrings; ++iring) {
          if (echo > 6) std::printf("# OpenMP thread#%i of %d works on ring#%i\n", omp_get_thread_num(), omp_get_num_threads(), iring);
          sum += iring;
      } // iring
      stat += (nrings*(nrings - 1)/2 != sum);
      return stat;
  } // all_tests

} // namespace omp_parallel
