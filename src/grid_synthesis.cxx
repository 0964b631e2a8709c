// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::cos, ::sqrt, ::abs, ::isfinite
#include <complex> // std::complex<double>, ::conj, ::polar
#include <vector> // std::vector<T>
#include <algorithm> // std::max
#include <initializer_list> // std::initializer_list<T>
#include <thread> // std::thread
#include <unistd.h> // ::fork, ::_exit
#include <sys/wait.h> // ::waitpid, WIFEXITED, WEXITSTATUS

#include "grid_synthesis.hxx"

#include "recorded_warnings.hxx" // warn, error
#include "ring_synthesis.hxx" // ::synthesize_ring_pair, ::synthesize_equator, ::degree_zero_value
#include "fourier_transform.hxx" // plan_t, aligned_buffer_t
#include "complex_tools.hxx" // to_complex_t
#include "constants.hxx" // ::pi
#include "omp_parallel.hxx" // omp_get_max_threads, omp_get_thread_num
#include "simple_timer.hxx" // SimpleTimer
#include "print_tools.hxx" // print_stats
#include "inline_math.hxx" // minus_one_to_the

namespace grid_synthesis {

  typedef std::complex<double> complex_t;

  inline status_t report(status_t const stat, int *exitstatus) {
      if (nullptr != exitstatus) {
          *exitstatus = stat;
      } else if (0 != stat) {
          error("grid synthesis failed with status %d: %s", stat, exit_status::message(stat));
      }
      return stat;
  } // report

  template <typename grid_t>
  inline void store_row(view2D<grid_t> & griddh, int const row, complex_t const ring[], int const nlong) {
      auto const out = griddh[row];
      for (int k = 0; k < nlong; ++k) {
          out[k] = to_complex_t<grid_t>(ring[k]);
      } // k
  } // store_row

  template <typename grid_t>
  status_t make_grid(view2D<grid_t> & griddh
                   , int & n
                   , view3D<complex_t> const & cilm
                   , int const lmax
                   , grid_options::grid_options_t const & options
                   , int *exitstatus
                   , legendre_recursion::legendre_recursion_t & cache
                   , int const echo) {
      SimpleTimer timer(__FILE__, __LINE__, __func__, echo/2);
      n = 2*(lmax + 1);

      grid_options::grid_config_t config;
      status_t stat = grid_options::resolve(config, options, lmax,
                          cilm.dim2(), cilm.dim1(), cilm.stride(), griddh.dim1(), griddh.stride(), echo);
      if (stat) return report(stat, exitstatus);

      stat = cache.rebuild_if_stale(config.lmax_comp, config.normalization, echo);
      if (stat) return report(stat, exitstatus);

      int const nlong = config.nlong;
      if (echo > 2) std::printf("# %s %s grid %d x %d up to degree %d, %s normalization\n", __func__,
              grid_type_name<grid_t>(), config.nlat_out, config.nlong_out, config.lmax_comp,
              grid_options::normalization_name(config.normalization));

      if (0 == config.lmax_comp) {
          auto const value = to_complex_t<grid_t>(cilm(0,0,0)*ring_synthesis::degree_zero_value(config.normalization));
          for (int i = 0; i < config.nlat_out; ++i) {
              for (int k = 0; k < config.nlong_out; ++k) {
                  griddh(i,k) = value;
              } // k
          } // i
          return report(0, exitstatus);
      } // degree zero

      fourier_transform::plan_t const plan(nlong, false, echo);
      if (!plan.valid()) return report(exit_status::allocation_failed, exitstatus);

      // four FFTW-aligned arrays for each thread: north and south coefficients, north and south ring
      int const nthreads = omp_get_max_threads();
      std::vector<fourier_transform::aligned_buffer_t> scratch;
      scratch.reserve(4*nthreads);
      for (int ia = 0; ia < 4*nthreads; ++ia) {
          scratch.emplace_back(nlong);
          if (!scratch.back().allocated()) {
              warn("failed to allocate scratch arrays for %d threads with %d longitudes", nthreads, nlong);
              return report(exit_status::allocation_failed, exitstatus);
          } // failed
      } // ia

      int const i_eq = n/2; // row index of the equator
      ring_synthesis::synthesize_equator(scratch[0].data(), cilm, cache, config);
      stat += plan.execute(scratch[0], scratch[2]);
      store_row(griddh, i_eq, scratch[2].data(), nlong);

      #pragma omp parallel for schedule(dynamic) reduction(+:stat)
      for (int i = 0; i < i_eq; ++i) {
          int const ithread = omp_get_thread_num();
          auto & coef  = scratch[4*ithread + 0];
          auto & coefs = scratch[4*ithread + 1];
          auto & ring  = scratch[4*ithread + 2];
          auto & rings = scratch[4*ithread + 3];

          double const theta = constants::pi*i/double(n);
          ring_synthesis::synthesize_ring_pair(coef.data(), coefs.data(), std::cos(theta), cilm, cache, config);

          stat += plan.execute(coef, ring);
          store_row(griddh, i, ring.data(), nlong);

          if (i > 0 || 1 == config.extend) { // the mirror of the north pole is the 90 deg S row
              stat += plan.execute(coefs, rings);
              store_row(griddh, n - i, rings.data(), nlong);
          } // south
      } // i

      if (1 == config.extend) {
          for (int i = 0; i < config.nlat_out; ++i) {
              griddh(i,nlong) = griddh(i,0); // 360 deg E equals 0 deg E
          } // i
      } // extend

      if (echo > 3) {
          for (int i = 0; i < config.nlat_out; i += std::max(1, config.nlat_out/4)) {
              char prefix[32]; std::snprintf(prefix, 32, "# row %d", i);
              print_stats(griddh[i], config.nlong_out, prefix);
          } // i
      } // echo

      if (stat) warn("%d Fourier transforms failed", int(stat));
      return report(stat ? exit_status::allocation_failed : 0, exitstatus);
  } // make_grid

  template <typename grid_t>
  status_t make_grid(view2D<grid_t> & griddh
                   , int & n
                   , view3D<complex_t> const & cilm
                   , int const lmax
                   , grid_options::grid_options_t const & options
                   , int *exitstatus
                   , int const echo) {
      static thread_local legendre_recursion::legendre_recursion_t cache;
      return make_grid(griddh, n, cilm, lmax, options, exitstatus, cache, echo);
  } // make_grid

  // explicit template instantiations
  template status_t make_grid(view2D<complex_t> &, int &, view3D<complex_t> const &, int const
                  , grid_options::grid_options_t const &, int *, legendre_recursion::legendre_recursion_t &, int const);
  template status_t make_grid(view2D<double> &, int &, view3D<complex_t> const &, int const
                  , grid_options::grid_options_t const &, int *, legendre_recursion::legendre_recursion_t &, int const);
  template status_t make_grid(view2D<complex_t> &, int &, view3D<complex_t> const &, int const
                  , grid_options::grid_options_t const &, int *, int const);
  template status_t make_grid(view2D<double> &, int &, view3D<complex_t> const &, int const
                  , grid_options::grid_options_t const &, int *, int const);


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  inline double y_norm_scale(int const ell, int const emm, int const normalization) {
      // sqrt of the integral of |Y(l,m)|^2 over the sphere divided by 4 pi
      switch (normalization) {
          case grid_options::Schmidt:         return std::sqrt(1./(2*ell + 1));
          case grid_options::Unnormalized:    return std::sqrt(factorial(ell + emm)/(factorial(ell - emm)*(2*ell + 1)));
          case grid_options::Orthonormalized: return 1/constants::sqrt4pi;
      } // normalization
      return 1; // geodesy
  } // y_norm_scale

  inline void set_random_field(view3D<complex_t> & cilm, int const lmax, int const normalization, bool const real_field=false) {
      // coefficients of a field with values of order 1 for every normalization
      for (int l = 0; l <= lmax; ++l) {
          for (int m = 0; m <= l; ++m) {
              double const s = 1/((1. + l)*y_norm_scale(l, m, normalization));
              cilm(0,l,m) = s*complex_t(std::cos(2.3*l + 0.7*m + 0.1), (m > 0)*std::sin(1.1*l - 0.6*m + 0.2));
              if (real_field) {
                  cilm(1,l,m) = (m > 0) ? std::conj(cilm(0,l,m))*double(minus_one_to_the(m)) : complex_t(0);
              } else {
                  cilm(1,l,m) = (m > 0) ? s*complex_t(std::sin(0.5*l + 1.9*m), std::cos(l - 0.3*m)) : complex_t(0);
              }
          } // m
      } // l
  } // set_random_field

  inline std::vector<double> driscoll_healy_weights(int const n) {
      // quadrature weights for the colatitudes pi*j/n, the sum of all weights is 2
      std::vector<double> w(n, 0.0);
      for (int j = 0; j < n; ++j) {
          double const theta = constants::pi*j/double(n);
          double sum{0};
          for (int l = 0; l < n/2; ++l) {
              sum += std::sin((2*l + 1)*theta)/(2*l + 1);
          } // l
          w[j] = (4./n)*std::sin(theta)*sum;
      } // j
      return w;
  } // driscoll_healy_weights

  template <typename grid_t>
  double round_trip_deviation(view2D<grid_t> const & griddh, int const n, int const nlong
                            , view3D<complex_t> const & cilm, int const lmax, int const normalization, int const csphase) {
      // project the grid onto each Y(l,+-m) with the Driscoll-Healy quadrature,
      // return the largest deviation from cilm measured in units of the norm of Y
      auto const w = driscoll_healy_weights(n);
      view3D<complex_t> gm(n, 2, lmax + 1, complex_t(0)); // (ring, sign, m): sum_k f e^(-+i m phi) 2pi/nlong
      for (int j = 0; j < n; ++j) {
          for (int k = 0; k < nlong; ++k) {
              double const phi = 2*constants::pi*k/double(nlong);
              complex_t const f = griddh(j,k);
              for (int m = 0; m <= lmax; ++m) {
                  gm(j,0,m) += f*std::polar(2*constants::pi/nlong, -m*phi);
                  gm(j,1,m) += f*std::polar(2*constants::pi/nlong,  m*phi);
              } // m
          } // k
      } // j
      double maxdev{0};
      for (int l = 0; l <= lmax; ++l) {
          for (int m = 0; m <= l; ++m) {
              double const phase = (-1 == csphase) ? minus_one_to_the(m) : 1;
              complex_t c_pos(0), c_neg(0);
              for (int j = 0; j < n; ++j) {
                  double const plm = phase*legendre_recursion::normalization_factor(l, m, normalization)
                                          *legendre_recursion::associated_legendre(l, m, std::cos(constants::pi*j/double(n)));
                  c_pos += w[j]*plm*gm(j,0,m);
                  c_neg += w[j]*plm*minus_one_to_the(m)*gm(j,1,m);
              } // j
              double const norm2 = 4*constants::pi*pow2(y_norm_scale(l, m, normalization)); // integral of |Y|^2
              double const scale = y_norm_scale(l, m, normalization);
              maxdev = std::max(maxdev, std::abs(c_pos/norm2 - cilm(0,l,m))*scale);
              if (m > 0) maxdev = std::max(maxdev, std::abs(c_neg/norm2 - cilm(1,l,m))*scale);
          } // m
      } // l
      return maxdev;
  } // round_trip_deviation

  status_t test_degree_zero(int const echo=3) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      complex_t const c00(2, -1);
      for (int norm = 1; norm <= 4; ++norm) {
          view3D<complex_t> cilm(2, 1, 1, c00);
          grid_options::grid_options_t options;
          options.normalization = norm;
          options.sampling = 2;
          options.extend = 1;
          view2D<complex_t> griddh(3, 5, complex_t(0));
          int n{0}, status{-1};
          stat += make_grid(griddh, n, cilm, 0, options, &status, echo);
          double const expected_factor = (grid_options::Orthonormalized == norm) ? 1/constants::sqrt4pi : 1;
          double maxdev{0};
          for (int i = 0; i < 3; ++i) {
              for (int k = 0; k < 5; ++k) {
                  maxdev = std::max(maxdev, std::abs(griddh(i,k) - c00*expected_factor));
              } // k
          } // i
          stat += (2 != n) + (0 != status) + (maxdev > 1e-15);
      } // norm

      // a larger coefficient set truncated to degree 0
      int const lmax = 3;
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0.5, 0.25));
      grid_options::grid_options_t options;
      options.lmax_calc = 0;
      view2D<double> griddh(8, 8, 0.0);
      int n{0};
      stat += make_grid(griddh, n, cilm, lmax, options, nullptr, echo);
      for (int i = 0; i < 8; ++i) {
          for (int k = 0; k < 8; ++k) {
              stat += (0.5 != griddh(i,k));
          } // k
      } // i
      stat += (8 != n);
      return stat;
  } // test_degree_zero

  status_t test_extension(int const echo=3) {
      // the extended grid has the same interior, a 90 deg S row and a periodic column
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 6, n = 2*(lmax + 1);
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
      set_random_field(cilm, lmax, grid_options::Geodesy);
      legendre_recursion::legendre_recursion_t cache;
      for (int sampling = 1; sampling <= 2; ++sampling) {
          int const nlong = sampling*n;
          grid_options::grid_options_t options;
          options.sampling = sampling;
          view2D<complex_t> plain(n, nlong, complex_t(0));
          int n_out{0};
          stat += make_grid(plain, n_out, cilm, lmax, options, nullptr, cache, echo);
          options.extend = 1;
          view2D<complex_t> extended(n + 1, nlong + 1, complex_t(0));
          stat += make_grid(extended, n_out, cilm, lmax, options, nullptr, cache, echo);
          double maxdev{0};
          for (int i = 0; i < n; ++i) {
              for (int k = 0; k < nlong; ++k) {
                  maxdev = std::max(maxdev, std::abs(extended(i,k) - plain(i,k)));
              } // k
          } // i
          for (int i = 0; i <= n; ++i) {
              stat += (extended(i,nlong) != extended(i,0)); // exact copy
          } // i
          for (int k = 0; k <= nlong; ++k) {
              double const phi = 2*constants::pi*k/double(nlong);
              maxdev = std::max(maxdev, std::abs(extended(n,k) - ring_synthesis::reference_value(cilm, lmax, 1, 1, constants::pi, phi)));
              maxdev = std::max(maxdev, std::abs(plain(0,k % nlong) - ring_synthesis::reference_value(cilm, lmax, 1, 1, 0, phi)));
          } // k
          if (echo > 3) std::printf("# %s: sampling= %d largest deviation %.1e\n", __func__, sampling, maxdev);
          stat += (maxdev > 1e-12);
      } // sampling
      stat += (1 != cache.rebuilds()); // same degree and normalization for all four grids
      return stat;
  } // test_extension

  status_t test_round_trip(int const echo=3) {
      // synthesize a band-limited field and recover its coefficients by quadrature
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmaxs[] = {20, 13};
      for (int sampling = 1; sampling <= 2; ++sampling) {
          int const lmax = lmaxs[sampling - 1];
          int const n = 2*(lmax + 1), nlong = sampling*n;
          view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
          view2D<complex_t> griddh(n, nlong, complex_t(0));
          for (int norm = 1; norm <= 4; ++norm) {
              for (int csphase = -1; csphase <= 1; csphase += 2) {
                  set_random_field(cilm, lmax, norm);
                  grid_options::grid_options_t options;
                  options.normalization = norm;
                  options.sampling = sampling;
                  options.csphase = csphase;
                  int n_out{0}, status{-1};
                  stat += make_grid(griddh, n_out, cilm, lmax, options, &status, echo);
                  auto const maxdev = round_trip_deviation(griddh, n, nlong, cilm, lmax, norm, csphase);
                  if (echo > 2) std::printf("# %s: lmax= %d sampling= %d %s normalization csphase= %d, largest deviation %.1e\n",
                                  __func__, lmax, sampling, grid_options::normalization_name(norm), csphase, maxdev);
                  stat += (maxdev > 1e-11) + (0 != status) + (n != n_out);
              } // csphase
          } // norm
      } // sampling
      return stat;
  } // test_round_trip

  status_t test_real_output(int const echo=3) {
      // conjugate-symmetric coefficients describe a real field
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 9, n = 2*(lmax + 1);
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
      set_random_field(cilm, lmax, grid_options::Schmidt, true);
      grid_options::grid_options_t options;
      options.normalization = grid_options::Schmidt;
      options.extend = 1;
      view2D<complex_t> cgrid(n + 1, n + 1, complex_t(0));
      view2D<double>    rgrid(n + 1, n + 1, 0.0);
      int n_out{0};
      stat += make_grid(cgrid, n_out, cilm, lmax, options, nullptr, echo);
      stat += make_grid(rgrid, n_out, cilm, lmax, options, nullptr, echo);
      double maximag{0}, maxdev{0};
      for (int i = 0; i <= n; ++i) {
          for (int k = 0; k <= n; ++k) {
              maximag = std::max(maximag, std::abs(cgrid(i,k).imag()));
              maxdev  = std::max(maxdev,  std::abs(cgrid(i,k).real() - rgrid(i,k)));
          } // k
      } // i
      if (echo > 2) std::printf("# %s: largest imaginary part %.1e, largest deviation %.1e\n", __func__, maximag, maxdev);
      stat += (maximag > 1e-13) + (maxdev > 1e-14);
      return stat;
  } // test_real_output

  status_t test_invalid_input(int const echo=3) {
      // each failure returns its code and leaves the grid untouched
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 4, n = 2*(lmax + 1);
      complex_t const untouched(7, -7);
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(1));
      view3D<complex_t> one_plane(1, lmax + 1, lmax + 1, complex_t(1));
      view2D<complex_t> griddh(n + 1, 2*n + 1, untouched);

      grid_options::grid_options_t o[6];
      o[0].sampling = 3;
      o[1].normalization = 5;
      o[2].extend = 2;
      o[3].csphase = 0;
      o[4].lmax_calc = lmax + 1;
      o[5].sampling = 2; o[5].extend = 1; // valid
      int const expected[] = {2, 2, 2, 2, 2, 0};
      for (int io = 0; io < 5; ++io) {
          int n_out{0}, status{-1};
          auto const ret = make_grid(griddh, n_out, cilm, lmax, o[io], &status, echo);
          stat += (expected[io] != ret) + (expected[io] != status);
      } // io

      view2D<complex_t> small(n, n - 1, untouched);
      int n_out{0}, status{-1};
      stat += (1 != make_grid(small, n_out, cilm, lmax, o[5], &status, echo)) + (1 != status);
      stat += (1 != make_grid(griddh, n_out, one_plane, lmax, o[5], &status, echo)) + (1 != status);

      for (int i = 0; i <= n; ++i) {
          for (int k = 0; k <= 2*n; ++k) {
              stat += (untouched != griddh(i,k));
          } // k
      } // i
      stat += make_grid(griddh, n_out, cilm, lmax, o[5], &status, echo);
      stat += (untouched == griddh(n,2*n)); // now written
      recorded_warnings::clear_warnings(echo/2); // the expected diagnostics should not show in the summary
      return stat;
  } // test_invalid_input

  status_t test_unnormalized_overflow(int const echo=3) {
      // plain Legendre functions exceed the double range for high orders,
      // the synthesis completes with non-finite values
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 400, n = 2*(lmax + 1);
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(1));
      grid_options::grid_options_t options;
      options.normalization = grid_options::Unnormalized;
      view2D<complex_t> griddh(n, n, complex_t(0));
      int n_out{0}, status{-1};
      stat += make_grid(griddh, n_out, cilm, lmax, options, &status, echo);
      size_t nonfinite{0};
      for (int i = 0; i < n; ++i) {
          for (int k = 0; k < n; ++k) {
              nonfinite += !std::isfinite(std::abs(griddh(i,k)));
          } // k
      } // i
      if (echo > 2) std::printf("# %s: %ld of %d values are not finite\n", __func__, nonfinite, n*n);
      stat += (0 != status) + (0 == nonfinite);
      return stat;
  } // test_unnormalized_overflow

  status_t test_terminate_without_exitstatus(int const echo=3) {
      // without an exitstatus pointer an invalid call ends the process with a nonzero exit code,
      // the child process fails in the option check and never enters a parallel region
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      std::fflush(stdout); std::fflush(stderr);
      auto const pid = fork();
      if (pid < 0) {
          warn("fork failed, cannot test the termination of %s", __func__);
          return 1;
      } // failed
      if (0 == pid) { // child process
          if (echo < 7) { // hide the expected error message
              if (nullptr == std::freopen("/dev/null", "w", stdout)) _exit(0);
              if (nullptr == std::freopen("/dev/null", "w", stderr)) _exit(0);
          } // echo
          int const lmax = 3;
          view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(1));
          view2D<complex_t> griddh(2*(lmax + 1), 2*(lmax + 1), complex_t(0));
          grid_options::grid_options_t options;
          options.sampling = 3;
          int n{0};
          make_grid(griddh, n, cilm, lmax, options, nullptr, 0);
          _exit(0); // not reached if the call terminates
      } // child process
      int wstatus{0};
      if (waitpid(pid, &wstatus, 0) != pid) return 1;
      bool const terminated = WIFEXITED(wstatus) && (0 != WEXITSTATUS(wstatus));
      if (echo > 2) std::printf("# %s: child process %s with exit code %d\n", __func__,
                                  terminated ? "terminated" : "returned", WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1);
      return terminated ? 0 : 1;
  } // test_terminate_without_exitstatus

  status_t test_concurrent_calls(int const echo=3) {
      // two threads synthesize different expansions at the same time
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      int const lmaxs[] = {10, 7}, norms[] = {grid_options::Geodesy, grid_options::Orthonormalized};
      int const samplings[] = {1, 2}, csphases[] = {1, -1};
      double maxdevs[] = {9e9, 9e9};
      int statuses[] = {0, 0};
      std::vector<std::thread> threads;
      for (int it = 0; it < 2; ++it) {
          threads.emplace_back([it, &lmaxs, &norms, &samplings, &csphases, &maxdevs, &statuses]() {
              int const lmax = lmaxs[it], n = 2*(lmax + 1), nlong = samplings[it]*n;
              view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
              set_random_field(cilm, lmax, norms[it]);
              grid_options::grid_options_t options;
              options.normalization = norms[it];
              options.sampling = samplings[it];
              options.csphase = csphases[it];
              double maxdev{0};
              for (int repeat = 0; repeat < 8; ++repeat) {
                  view2D<complex_t> griddh(n, nlong, complex_t(0));
                  int n_out{0}, status{-1};
                  auto const ret = make_grid(griddh, n_out, cilm, lmax, options, &status, 0);
                  statuses[it] += (0 != ret) + (0 != status) + (n != n_out);
                  for (int i = 0; i < n; ++i) {
                      double const theta = constants::pi*i/double(n);
                      for (int k = 0; k < nlong; ++k) {
                          double const phi = 2*constants::pi*k/double(nlong);
                          auto const ref = ring_synthesis::reference_value(cilm, lmax, norms[it], csphases[it], theta, phi);
                          maxdev = std::max(maxdev, std::abs(griddh(i,k) - ref));
                      } // k
                  } // i
              } // repeat
              maxdevs[it] = maxdev;
          });
      } // it
      status_t stat(0);
      for (int it = 0; it < 2; ++it) {
          threads[it].join();
          if (echo > 2) std::printf("# %s: thread %d lmax= %d %s normalization, status %d, largest deviation %.1e\n", __func__,
                          it, lmaxs[it], grid_options::normalization_name(norms[it]), statuses[it], maxdevs[it]);
          stat += (0 != statuses[it]) + (maxdevs[it] > 1e-12);
      } // it
      return stat;
  } // test_concurrent_calls

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_terminate_without_exitstatus(echo);
      stat += test_concurrent_calls(echo);
      stat += test_degree_zero(echo);
      stat += test_extension(echo);
      stat += test_round_trip(echo);
      stat += test_real_output(echo);
      stat += test_invalid_input(echo);
      stat += test_unnormalized_overflow(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace grid_synthesis
