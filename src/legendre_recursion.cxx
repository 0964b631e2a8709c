// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sqrt, ::cos, ::abs
#include <new> // std::bad_alloc
#include <stdexcept> // std::length_error
#include <algorithm> // std::max
#include <initializer_list> // std::initializer_list<T>

#include "legendre_recursion.hxx"

#include "recorded_warnings.hxx" // warn
#include "grid_options.hxx" // ::Geodesy, ::Schmidt, ::Unnormalized, ::Orthonormalized

namespace legendre_recursion {

  status_t legendre_recursion_t::rebuild_if_stale(int const lmax, int const normalization, int const echo) {
      if (lmax == _lmax && normalization == _normalization) return 0; // tables are up to date

      if (echo > 5) std::printf("# %s for lmax= %d and %s normalization, was lmax= %d\n", __func__,
                                  lmax, grid_options::normalization_name(normalization), _lmax);
      _lmax = -1; _normalization = 0; // invalid until complete
      int const L1 = lmax + 1;
      size_t const nlm = size_t(L1)*size_t(L1);
      try {
          std::vector<double>(nlm, 0.0).swap(_f1);
          std::vector<double>(nlm, 0.0).swap(_f2);
          std::vector<double>(nlm, 0.0).swap(_symsign);
          std::vector<double>(2*size_t(L1), 0.0).swap(_sqr);
      } catch (std::exception const & e) { // std::bad_alloc or std::length_error
          std::vector<double>().swap(_sqr);
          std::vector<double>().swap(_f1);
          std::vector<double>().swap(_f2);
          std::vector<double>().swap(_symsign);
          warn("problem allocating recursion tables for lmax= %d: %s", lmax, e.what());
          return exit_status::allocation_failed;
      } // try

      for (int ell = 0; ell <= lmax; ++ell) {
          for (int emm = 0; emm <= ell; ++emm) {
              _symsign[ell*L1 + emm] = ((ell - emm) & 1) ? -1 : 1;
          } // emm
      } // ell

      for (int k = 1; k <= 2*lmax + 1; ++k) {
          _sqr[k] = std::sqrt(double(k));
      } // k
      auto const & sq = _sqr;

      // prefactors for m == l are not needed, for m == l-1 the term P(l-2,m) vanishes
      if (grid_options::Geodesy == normalization || grid_options::Orthonormalized == normalization) {
          if (lmax > 0) { _f1[1*L1 + 0] = sq[3]; _f2[1*L1 + 0] = 0; }
          for (int l = 2; l <= lmax; ++l) {
              _f1[l*L1 + 0] = sq[2*l - 1]*sq[2*l + 1]/double(l);
              _f2[l*L1 + 0] = double(l - 1)*sq[2*l + 1]/(sq[2*l - 3]*double(l));
              for (int m = 1; m <= l - 2; ++m) {
                  _f1[l*L1 + m] = sq[2*l + 1]*sq[2*l - 1]/(sq[l + m]*sq[l - m]);
                  _f2[l*L1 + m] = sq[2*l + 1]*sq[l - m - 1]*sq[l + m - 1]/(sq[2*l - 3]*sq[l + m]*sq[l - m]);
              } // m
              _f1[l*L1 + l - 1] = sq[2*l + 1];
              _f2[l*L1 + l - 1] = 0;
          } // l
      } else
      if (grid_options::Schmidt == normalization) {
          if (lmax > 0) { _f1[1*L1 + 0] = 1; _f2[1*L1 + 0] = 0; }
          for (int l = 2; l <= lmax; ++l) {
              _f1[l*L1 + 0] = double(2*l - 1)/double(l);
              _f2[l*L1 + 0] = double(l - 1)/double(l);
              for (int m = 1; m <= l - 2; ++m) {
                  _f1[l*L1 + m] = double(2*l - 1)/(sq[l + m]*sq[l - m]);
                  _f2[l*L1 + m] = sq[l - m - 1]*sq[l + m - 1]/(sq[l + m]*sq[l - m]);
              } // m
              _f1[l*L1 + l - 1] = sq[2*l - 1];
              _f2[l*L1 + l - 1] = 0;
          } // l
      } else
      if (grid_options::Unnormalized == normalization) {
          for (int l = 1; l <= lmax; ++l) {
              _f1[l*L1 + 0] = double(2*l - 1)/double(l);
              _f2[l*L1 + 0] = double(l - 1)/double(l);
              for (int m = 1; m <= l - 1; ++m) {
                  _f1[l*L1 + m] = double(2*l - 1)/double(l - m);
                  _f2[l*L1 + m] = double(l + m - 1)/double(l - m);
              } // m
          } // l
      } else {
          warn("normalization= %d is not in [1, 4]", normalization);
          return exit_status::bad_option;
      } // normalization

      _lmax = lmax;
      _normalization = normalization;
      ++_rebuilds;
      return 0;
  } // rebuild_if_stale


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_closed_forms(int const echo=3) {
      // run the recursion for degrees above the sectorial term and compare with directly evaluated
      // normalized Legendre functions, the sectorial values are taken from the direct evaluation
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 12;
      legendre_recursion_t rec;
      for (int norm = 1; norm <= 4; ++norm) {
          stat += rec.rebuild_if_stale(lmax, norm, echo);
          double maxdev{0};
          for (double const z : {-0.83, 0.1, 0.5, 0.97}) {
              for (int m = 0; m < lmax; ++m) {
                  double pm2 = normalization_factor(m, m, norm)*associated_legendre(m, m, z);
                  double pm1 = z*rec.f1(m + 1, m)*pm2;
                  for (int l = m + 2; l <= lmax; ++l) {
                      double const p = z*rec.f1(l, m)*pm1 - rec.f2(l, m)*pm2;
                      pm2 = pm1; pm1 = p;
                      double const ref = normalization_factor(l, m, norm)*associated_legendre(l, m, z);
                      maxdev = std::max(maxdev, std::abs(p - ref)/std::max(1., std::abs(ref)));
                  } // l
              } // m
          } // z
          if (echo > 2) std::printf("# %s: %s normalization, largest relative deviation %.1e\n",
                                      __func__, grid_options::normalization_name(norm), maxdev);
          stat += (maxdev > 1e-11);
      } // norm
      return stat;
  } // test_closed_forms

  status_t test_rebuild_on_key_change(int const echo=3) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      legendre_recursion_t rec;
      stat += rec.rebuild_if_stale(8, 1, echo);
      stat += rec.rebuild_if_stale(8, 1, echo); // same key, no work
      stat += (1 != rec.rebuilds());
      stat += rec.rebuild_if_stale(8, 2, echo);
      stat += rec.rebuild_if_stale(5, 2, echo);
      stat += (3 != rec.rebuilds()) + (5 != rec.lmax()) + (2 != rec.normalization());
      stat += rec.rebuild_if_stale(0, 4, echo); // degree zero needs no prefactors
      stat += (4 != rec.rebuilds());
      stat += (exit_status::bad_option != rec.rebuild_if_stale(5, 7, echo));
      stat += (-1 != rec.lmax()); // invalidated
      stat += rec.rebuild_if_stale(5, 2, echo);
      stat += (std::abs(rec.sqr(11) - std::sqrt(11.)) > 1e-15);
      stat += (-1 != rec.symsign(5, 2)) + (1 != rec.symsign(4, 2));
      stat += (std::abs(rec.f1(4, 3) - std::sqrt(7.)) > 1e-14); // sqrt(2l-1) for m = l-1
      return stat;
  } // test_rebuild_on_key_change

  status_t test_allocation_failure(int const echo=3) {
      // tables for an absurd degree cannot be allocated, the object stays usable
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      legendre_recursion_t rec;
      stat += rec.rebuild_if_stale(6, 2, echo);
      int const lmax_huge = (1 << 30) - 1; // (lmax + 1)^2 doubles exceed any address space
      stat += (exit_status::allocation_failed != rec.rebuild_if_stale(lmax_huge, 2, echo));
      stat += (-1 != rec.lmax()) + (1 != rec.rebuilds());
      stat += rec.rebuild_if_stale(6, 2, echo); // the same key as before must be recomputed
      stat += (6 != rec.lmax()) + (2 != rec.rebuilds());
      stat += (std::abs(rec.sqr(13) - std::sqrt(13.)) > 1e-15);
      recorded_warnings::clear_warnings(echo/2); // the expected allocation warning should not show in the summary
      return stat;
  } // test_allocation_failure

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_closed_forms(echo);
      stat += test_rebuild_on_key_change(echo);
      stat += test_allocation_failure(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace legendre_recursion
