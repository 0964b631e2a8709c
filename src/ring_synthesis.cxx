// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cmath> // std::sqrt, ::cos, ::acos, ::abs, ::isfinite
#include <complex> // std::complex<double>, ::polar
#include <algorithm> // std::fill, ::max
#include <vector> // std::vector<T>
#include <initializer_list> // std::initializer_list<T>

#include "ring_synthesis.hxx"

#include "constants.hxx" // ::pi, ::sqrt4pi
#include "inline_math.hxx" // minus_one_to_the
#include "fourier_transform.hxx" // plan_t, aligned_buffer_t
#include "simple_timer.hxx" // SimpleTimer

namespace ring_synthesis {

  typedef std::complex<double> complex_t;

  double degree_zero_value(int const normalization) {
      return (grid_options::Orthonormalized == normalization) ? 1/constants::sqrt4pi : 1.0;
  } // degree_zero_value

  scaled_seed_t::scaled_seed_t(int const normalization, int const csphase)
    : _pmm(ScaleFactor*degree_zero_value(normalization))
    , _rescale(1/ScaleFactor)
    , _phase(csphase)
    , _normalization(normalization)
  {} // constructor

  double scaled_seed_t::advance(legendre_recursion::legendre_recursion_t const & rec, int const emm) {
      auto const m = emm;
      if (grid_options::Unnormalized == _normalization) {
          _pmm = _phase*_pmm*double(2*m - 1);
          return _pmm;
      } // unnormalized
      _pmm = _phase*_pmm*rec.sqr(2*m + 1)/rec.sqr(2*m);
      return (grid_options::Schmidt == _normalization) ? _pmm/rec.sqr(2*m + 1) : _pmm;
  } // advance

  double scaled_seed_t::last_sectorial(legendre_recursion::legendre_recursion_t const & rec, int const emm) const {
      auto const m = emm;
      switch (_normalization) {
          case grid_options::Schmidt:      return _phase*_pmm/rec.sqr(2*m)*_rescale;
          case grid_options::Unnormalized: return _phase*_pmm*double(2*m - 1)*_rescale;
      } // normalization
      return _phase*_pmm*rec.sqr(2*m + 1)/rec.sqr(2*m)*_rescale; // geodesy and orthonormalized
  } // last_sectorial


  void synthesize_ring_pair(complex_t north[]
                          , complex_t south[]
                          , double const z
                          , view3D<complex_t> const & cilm
                          , legendre_recursion::legendre_recursion_t const & rec
                          , grid_options::grid_config_t const & config) {
      int const nlong = config.nlong;
      int const lmax = config.lmax_comp;
      std::fill(north, north + nlong, complex_t(0));
      std::fill(south, south + nlong, complex_t(0));

      double const u = std::sqrt((1 - z)*(1 + z));

      // order 0, no scaling needed
      double pm2 = degree_zero_value(config.normalization);
      complex_t c = cilm(0,0,0)*pm2;
      north[0] += c;
      south[0] += c;
      if (lmax < 1) return;

      double pm1 = rec.f1(1,0)*z*pm2;
      c = cilm(0,1,0)*pm1;
      north[0] += c;
      south[0] -= c;
      for (int l = 2; l <= lmax; ++l) {
          double const p = rec.f1(l,0)*z*pm1 - rec.f2(l,0)*pm2;
          c = cilm(0,l,0)*p;
          north[0] += c;
          south[0] += c*rec.symsign(l,0);
          pm2 = pm1;
          pm1 = p;
      } // l

      scaled_seed_t seed(config.normalization, config.csphase);

      for (int m = 1; m < lmax; ++m) {
          seed.shrink(u);
          auto & n_pos = north[m];
          auto & s_pos = south[m];
          auto & n_neg = north[nlong - m];
          auto & s_neg = south[nlong - m];

          double q2 = seed.advance(rec, m);
          c = cilm(0,m,m)*q2;
          n_pos += c;
          s_pos += c;
          c = cilm(1,m,m)*q2;
          n_neg += c;
          s_neg += c;

          double q1 = z*rec.f1(m + 1,m)*q2;
          c = cilm(0,m + 1,m)*q1;
          n_pos += c;
          s_pos -= c;
          c = cilm(1,m + 1,m)*q1;
          n_neg += c;
          s_neg -= c;

          for (int l = m + 2; l <= lmax; ++l) {
              double const p = z*rec.f1(l,m)*q1 - rec.f2(l,m)*q2;
              q2 = q1;
              q1 = p;
              double const sign = rec.symsign(l,m);
              c = cilm(0,l,m)*p;
              n_pos += c;
              s_pos += c*sign;
              c = cilm(1,l,m)*p;
              n_neg += c;
              s_neg += c*sign;
          } // l

          double const rescale = seed.rescale();
          double const rescale_neg = rescale*minus_one_to_the(m); // Y(l,-m) = (-1)^m conj(Y(l,m))
          n_pos *= rescale;
          s_pos *= rescale;
          n_neg *= rescale_neg;
          s_neg *= rescale_neg;
      } // m

      // sectorial term of the highest order
      seed.shrink(u);
      double const pll = seed.last_sectorial(rec, lmax);
      c = cilm(0,lmax,lmax)*pll;
      north[lmax] += c;
      south[lmax] += c;
      c = cilm(1,lmax,lmax)*(pll*minus_one_to_the(lmax));
      north[nlong - lmax] += c;
      south[nlong - lmax] += c;
  } // synthesize_ring_pair


  void synthesize_equator(complex_t coef[]
                        , view3D<complex_t> const & cilm
                        , legendre_recursion::legendre_recursion_t const & rec
                        , grid_options::grid_config_t const & config) {
      int const nlong = config.nlong;
      int const lmax = config.lmax_comp;
      std::fill(coef, coef + nlong, complex_t(0));

      double pm2 = degree_zero_value(config.normalization);
      coef[0] += cilm(0,0,0)*pm2;
      if (lmax < 1) return;

      for (int l = 2; l <= lmax; l += 2) {
          double const p = -rec.f2(l,0)*pm2;
          pm2 = p;
          coef[0] += cilm(0,l,0)*p;
      } // l

      scaled_seed_t seed(config.normalization, config.csphase); // sin(theta) = 1

      for (int m = 1; m < lmax; ++m) {
          double q2 = seed.advance(rec, m);
          coef[m]         += cilm(0,m,m)*q2;
          coef[nlong - m] += cilm(1,m,m)*q2;
          for (int l = m + 2; l <= lmax; l += 2) {
              double const p = -rec.f2(l,m)*q2;
              coef[m]         += cilm(0,l,m)*p;
              coef[nlong - m] += cilm(1,l,m)*p;
              q2 = p;
          } // l
          coef[m]         *= seed.rescale();
          coef[nlong - m] *= seed.rescale()*minus_one_to_the(m);
      } // m

      double const pll = seed.last_sectorial(rec, lmax);
      coef[lmax]         += cilm(0,lmax,lmax)*pll;
      coef[nlong - lmax] += cilm(1,lmax,lmax)*(pll*minus_one_to_the(lmax));
  } // synthesize_equator


  complex_t reference_value(view3D<complex_t> const & cilm
                          , int const lmax
                          , int const normalization
                          , int const csphase
                          , double const theta
                          , double const phi) {
      double const z = std::cos(theta);
      complex_t sum(0);
      for (int l = 0; l <= lmax; ++l) {
          for (int m = 0; m <= l; ++m) {
              double const phase = (-1 == csphase) ? minus_one_to_the(m) : 1;
              double const plm = phase*legendre_recursion::normalization_factor(l, m, normalization)
                                      *legendre_recursion::associated_legendre(l, m, z);
              sum += cilm(0,l,m)*plm*std::polar(1.0, m*phi);
              if (m > 0) sum += cilm(1,l,m)*(plm*minus_one_to_the(m))*std::polar(1.0, -m*phi);
          } // m
      } // l
      return sum;
  } // reference_value


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  inline void set_test_coefficients(view3D<complex_t> & cilm, int const lmax) {
      for (int l = 0; l <= lmax; ++l) {
          for (int m = 0; m <= l; ++m) {
              cilm(0,l,m) = complex_t(std::cos(1.7*l + 0.3*m), std::sin(0.9*l*m + 0.2))/(1. + l);
              cilm(1,l,m) = (m > 0) ? complex_t(std::sin(0.4*l - 1.3*m), std::cos(l + 2.1*m))/(1. + l) : complex_t(0);
          } // m
      } // l
  } // set_test_coefficients

  status_t test_symmetry_vs_direct(int const echo=3) {
      // the north/south split must agree with an unsplit direct summation for each ring
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 11;
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
      set_test_coefficients(cilm, lmax);
      legendre_recursion::legendre_recursion_t rec;
      for (int sampling = 1; sampling <= 2; ++sampling) {
          grid_options::grid_options_t options;
          options.sampling = sampling;
          int nlat{0}, nlong{0};
          stat += grid_options::get_grid_shape(nlat, nlong, lmax, sampling);
          fourier_transform::plan_t const plan(nlong);
          fourier_transform::aligned_buffer_t coef(nlong), coefs(nlong), ring(nlong), rings(nlong);
          for (int norm = 1; norm <= 4; ++norm) {
              for (int csphase = -1; csphase <= 1; csphase += 2) {
                  options.normalization = norm;
                  options.csphase = csphase;
                  grid_options::grid_config_t config;
                  stat += grid_options::resolve(config, options, lmax, 2, lmax + 1, lmax + 1, nlat, nlong);
                  stat += rec.rebuild_if_stale(config.lmax_comp, norm);
                  double maxdev{0}, maxval{0};
                  for (int i = 0; i < nlat/2; i += 3) {
                      double const theta = constants::pi*i/double(nlat);
                      synthesize_ring_pair(coef.data(), coefs.data(), std::cos(theta), cilm, rec, config);
                      stat += plan.execute(coef, ring);
                      stat += plan.execute(coefs, rings);
                      for (int k = 0; k < nlong; k += 5) {
                          double const phi = 2*constants::pi*k/double(nlong);
                          auto const fn = reference_value(cilm, lmax, norm, csphase, theta, phi);
                          auto const fs = reference_value(cilm, lmax, norm, csphase, constants::pi - theta, phi);
                          maxdev = std::max(maxdev, std::max(std::abs(ring[k] - fn), std::abs(rings[k] - fs)));
                          maxval = std::max(maxval, std::max(std::abs(fn), std::abs(fs)));
                      } // k
                  } // i
                  synthesize_equator(coef.data(), cilm, rec, config);
                  stat += plan.execute(coef, ring);
                  for (int k = 0; k < nlong; ++k) {
                      auto const f = reference_value(cilm, lmax, norm, csphase, 0.5*constants::pi, 2*constants::pi*k/double(nlong));
                      maxdev = std::max(maxdev, std::abs(ring[k] - f));
                  } // k
                  if (echo > 3) std::printf("# %s normalization, csphase= %d, sampling= %d: largest deviation %.1e of %.1e\n",
                                  grid_options::normalization_name(norm), csphase, sampling, maxdev, maxval);
                  stat += (maxdev > 1e-12*std::max(1., maxval));
              } // csphase
          } // norm
      } // sampling
      return stat;
  } // test_symmetry_vs_direct

  status_t test_low_degrees(int const echo=3) {
      // degrees 0 and 1 skip the loop over intermediate orders
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      legendre_recursion::legendre_recursion_t rec;
      for (int lmax = 0; lmax <= 2; ++lmax) {
          view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
          set_test_coefficients(cilm, lmax);
          grid_options::grid_options_t options;
          options.normalization = grid_options::Orthonormalized;
          grid_options::grid_config_t config;
          int const n = 2*(lmax + 1);
          stat += grid_options::resolve(config, options, lmax, 2, lmax + 1, lmax + 1, n, n);
          stat += rec.rebuild_if_stale(config.lmax_comp, config.normalization);
          fourier_transform::plan_t const plan(n);
          fourier_transform::aligned_buffer_t coef(n), coefs(n), ring(n), rings(n);
          double const theta = 0.3;
          synthesize_ring_pair(coef.data(), coefs.data(), std::cos(theta), cilm, rec, config);
          stat += plan.execute(coef, ring);
          stat += plan.execute(coefs, rings);
          double maxdev{0};
          for (int k = 0; k < n; ++k) {
              double const phi = 2*constants::pi*k/double(n);
              maxdev = std::max(maxdev, std::abs(ring[k]  - reference_value(cilm, lmax, config.normalization, 1, theta, phi)));
              maxdev = std::max(maxdev, std::abs(rings[k] - reference_value(cilm, lmax, config.normalization, 1, constants::pi - theta, phi)));
          } // k
          if (echo > 3) std::printf("# %s: lmax= %d largest deviation %.1e\n", __func__, lmax, maxdev);
          stat += (maxdev > 1e-14);
      } // lmax
      return stat;
  } // test_low_degrees

  status_t test_high_degree_stability(int const echo=3, int const lmax=2700) {
      // rings near the poles and at the equator stay finite for very high degrees
      if (echo > 1) std::printf("\n# %s: %s for lmax= %d\n", __FILE__, __func__, lmax);
      SimpleTimer timer(__FILE__, __LINE__, __func__, echo);
      status_t stat(0);
      view3D<complex_t> cilm(2, lmax + 1, lmax + 1, complex_t(0));
      for (int l = 0; l <= lmax; ++l) {
          for (int m = 0; m <= l; ++m) {
              cilm(0,l,m) = complex_t(1, 0.5)/(1. + l);
              cilm(1,l,m) = complex_t(-0.5, 1)/(1. + l);
          } // m
      } // l
      int const n = 2*(lmax + 1);
      fourier_transform::plan_t const plan(n);
      fourier_transform::aligned_buffer_t coef(n), coefs(n), ring(n), rings(n);
      legendre_recursion::legendre_recursion_t rec;
      int const rings_to_test[] = {0, 1, 2, n/8, n/4 - 1};
      for (int const norm : {grid_options::Geodesy, grid_options::Schmidt, grid_options::Orthonormalized}) {
          grid_options::grid_options_t options;
          options.normalization = norm;
          grid_options::grid_config_t config;
          stat += grid_options::resolve(config, options, lmax, 2, lmax + 1, lmax + 1, n, n);
          stat += rec.rebuild_if_stale(config.lmax_comp, norm);
          size_t nonfinite{0};
          double maxval{0};
          for (int const i : rings_to_test) {
              synthesize_ring_pair(coef.data(), coefs.data(), std::cos(constants::pi*i/double(n)), cilm, rec, config);
              stat += plan.execute(coef, ring);
              stat += plan.execute(coefs, rings);
              for (int k = 0; k < n; ++k) {
                  nonfinite += !std::isfinite(std::abs(ring[k])) + !std::isfinite(std::abs(rings[k]));
                  maxval = std::max(maxval, std::max(std::abs(ring[k]), std::abs(rings[k])));
              } // k
          } // i
          synthesize_equator(coef.data(), cilm, rec, config);
          stat += plan.execute(coef, ring);
          for (int k = 0; k < n; ++k) {
              nonfinite += !std::isfinite(std::abs(ring[k]));
          } // k
          if (echo > 2) std::printf("# %s normalization: %ld non-finite values, largest modulus %g\n",
                                      grid_options::normalization_name(norm), nonfinite, maxval);
          stat += (nonfinite > 0);
      } // norm
      return stat;
  } // test_high_degree_stability

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_low_degrees(echo);
      stat += test_symmetry_vs_direct(echo);
      stat += test_high_degree_stability(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace ring_synthesis
