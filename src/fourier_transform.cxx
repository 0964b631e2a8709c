// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::cos, ::sin, ::abs
#include <complex> // std::complex<double>, ::exp
#include <algorithm> // std::max
#include <mutex> // std::mutex, ::lock_guard
#include <thread> // std::thread
#include <vector> // std::vector<T>

#include "fourier_transform.hxx"

#include "recorded_warnings.hxx" // warn
#include "constants.hxx" // ::pi

namespace fourier_transform {

  inline std::mutex & planner_mutex() {
      // the FFTW planner keeps global state, only fftw_execute* may run concurrently
      static std::mutex m;
      return m;
  } // planner_mutex

  aligned_buffer_t::aligned_buffer_t(size_t const n) : _data(nullptr), _size(n) {
      if (n > 0) _data = fftw_alloc_complex(n); // nullptr on failure
      if (allocated()) zero();
  } // constructor

  aligned_buffer_t::~aligned_buffer_t() {
      if (nullptr != _data) fftw_free(_data);
  } // destructor

  aligned_buffer_t::aligned_buffer_t(aligned_buffer_t && rhs) : _data(rhs._data), _size(rhs._size) {
      rhs._data = nullptr; rhs._size = 0; // steal ownership
  } // move constructor

  void aligned_buffer_t::zero() {
      for (size_t i = 0; i < _size; ++i) {
          _data[i][0] = 0;
          _data[i][1] = 0;
      } // i
  } // zero


  plan_t::plan_t(int const length, bool const forward, int const echo) : _plan(nullptr), _length(length) {
      if (length < 1) {
          warn("cannot plan a Fourier transform of length %d", length);
          return;
      } // length
      // FFTW_ESTIMATE does not touch the arrays, so temporary aligned arrays serve for planning
      aligned_buffer_t in(length), out(length);
      if (!in.allocated() || !out.allocated()) {
          warn("failed to allocate %d complex numbers for planning", length);
          return;
      } // allocated
      std::lock_guard<std::mutex> lock(planner_mutex());
      _plan = fftw_plan_dft_1d(length, reinterpret_cast<fftw_complex*>(in.data()),
                                       reinterpret_cast<fftw_complex*>(out.data()),
                               forward ? FFTW_FORWARD : FFTW_BACKWARD, FFTW_ESTIMATE);
      if (nullptr == _plan) {
          warn("FFTW failed to create a %s plan of length %d", forward?"forward":"backward", length);
      } else if (echo > 5) {
          std::printf("# %s plan of length %d created\n", forward?"forward":"backward", length);
      }
  } // constructor

  plan_t::~plan_t() {
      if (nullptr == _plan) return;
      std::lock_guard<std::mutex> lock(planner_mutex());
      fftw_destroy_plan(_plan);
  } // destructor

  status_t plan_t::execute(aligned_buffer_t & in, aligned_buffer_t & out) const {
      if (nullptr == _plan) return __LINE__; // error, no valid plan
      if (in.size() < size_t(_length) || out.size() < size_t(_length)) return __LINE__; // error, too short
      if (in.data() == out.data()) return __LINE__; // error, the plan is out-of-place
      fftw_execute_dft(_plan, reinterpret_cast<fftw_complex*>(in.data()),
                              reinterpret_cast<fftw_complex*>(out.data()));
      return 0; // success
  } // execute


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_single_bin(int const echo=3) {
      // a single Fourier bin transforms into a pure exponential along the ring
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const nlong = 24;
      plan_t const backward(nlong, false, echo);
      stat += !backward.valid();
      aligned_buffer_t coef(nlong), ring(nlong);
      for (int bin = 0; bin < nlong; bin += 5) {
          coef.zero();
          coef[bin] = std::complex<double>(0.5, -1.5);
          stat += backward.execute(coef, ring);
          double maxdev{0};
          for (int k = 0; k < nlong; ++k) {
              double const phi = 2*constants::pi*k/double(nlong);
              auto const expected = coef[bin]*std::exp(std::complex<double>(0, bin*phi));
              maxdev = std::max(maxdev, std::abs(ring[k] - expected));
          } // k
          if (echo > 3) std::printf("# %s: bin %d largest deviation %.1e\n", __func__, bin, maxdev);
          stat += (maxdev > 1e-13);
      } // bin
      return stat;
  } // test_single_bin

  status_t test_forward_backward(int const echo=3) {
      // the forward transform of the backward transform gives length times the input
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const n = 18;
      plan_t const backward(n), forward(n, true);
      aligned_buffer_t a(n), b(n), c(n);
      for (int k = 0; k < n; ++k) {
          a[k] = std::complex<double>(std::cos(k*1.1), std::sin(k*k*0.3));
      } // k
      stat += backward.execute(a, b);
      stat += forward.execute(b, c);
      double maxdev{0};
      for (int k = 0; k < n; ++k) {
          maxdev = std::max(maxdev, std::abs(c[k]/double(n) - a[k]));
      } // k
      if (echo > 2) std::printf("# %s: largest deviation %.1e\n", __func__, maxdev);
      stat += (maxdev > 1e-14);
      stat += (0 == backward.execute(a, a)); // in-place execution must be rejected
      return stat;
  } // test_forward_backward

  status_t test_concurrent_planning(int const echo=3) {
      // threads create, execute and destroy plans of different lengths at the same time
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      int const nthreads = 4, repeat = 50;
      std::vector<status_t> results(nthreads, 0);
      std::vector<std::thread> threads;
      for (int it = 0; it < nthreads; ++it) {
          threads.emplace_back([it, &results]() {
              status_t stat(0);
              for (int r = 0; r < repeat; ++r) {
                  int const n = 8 + 2*it + (r % 3); // lengths differ between threads
                  plan_t const backward(n);
                  stat += !backward.valid();
                  aligned_buffer_t coef(n), ring(n);
                  coef[1] = 1;
                  stat += backward.execute(coef, ring);
                  for (int k = 0; k < n; ++k) {
                      auto const expected = std::exp(std::complex<double>(0, 2*constants::pi*k/double(n)));
                      stat += (std::abs(ring[k] - expected) > 1e-13);
                  } // k
              } // r
              results[it] = stat;
          });
      } // it
      status_t stat(0);
      for (int it = 0; it < nthreads; ++it) {
          threads[it].join();
          if (echo > 3) std::printf("# %s: thread %d status %d\n", __func__, it, int(results[it]));
          stat += results[it];
      } // it
      return stat;
  } // test_concurrent_planning

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_single_bin(echo);
      stat += test_forward_backward(echo);
      stat += test_concurrent_planning(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace fourier_transform
