#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstdint> // size_t
#include <vector> // std::vector<T>
#include <cmath> // std::sqrt

#include "status.hxx" // status_t
#include "inline_math.hxx" // factorial
#include "constants.hxx" // ::pi

namespace legendre_recursion {

  class legendre_recursion_t {
    // Prefactors of the three-term recursion of the associated Legendre functions
    //     P(l,m) = z*f1(l,m)*P(l-1,m) - f2(l,m)*P(l-2,m)
    // for 0 <= m < l <= lmax in one of the four normalizations,
    // square roots of integers 1..2*lmax+1 and the equatorial symmetry signs (-1)^(l-m).
    // The tables depend on (lmax, normalization) only.
  public:

      legendre_recursion_t() : _lmax(-1), _normalization(0), _rebuilds(0) {}

      // recompute the tables unless they were computed for the same key,
      // returns exit_status::allocation_failed if the tables cannot be allocated
      status_t rebuild_if_stale(int const lmax, int const normalization, int const echo=0);

      double f1(int const ell, int const emm) const { return _f1[ell*(_lmax + 1) + emm]; }
      double f2(int const ell, int const emm) const { return _f2[ell*(_lmax + 1) + emm]; }
      double sqr(int const k) const { return _sqr[k]; } // sqrt(k)
      double symsign(int const ell, int const emm) const { return _symsign[ell*(_lmax + 1) + emm]; }

      int lmax() const { return _lmax; }
      int normalization() const { return _normalization; }
      size_t rebuilds() const { return _rebuilds; } // how many times the tables were computed

  private:
      std::vector<double> _sqr;     // sqrt(k) for k = 0..2*lmax+1
      std::vector<double> _f1, _f2; // (lmax+1)^2, index ell*(lmax + 1) + emm
      std::vector<double> _symsign; // (lmax+1)^2, (-1)^(ell - emm)
      int _lmax;
      int _normalization;
      size_t _rebuilds;
  }; // class legendre_recursion_t

  inline double associated_legendre(int const ell, int const emm, double const z) {
      // P(l,m)(z) without Condon-Shortley phase by upward recursion in ell from P(m,m),
      // direct evaluation for low degrees, overflows for large emm
      double const u = std::sqrt((1 - z)*(1 + z));
      double pmm{1};
      for (int i = 1; i <= emm; ++i) pmm *= (2*i - 1)*u;
      if (ell == emm) return pmm;
      double pm1 = z*(2*emm + 1)*pmm;
      for (int l = emm + 2; l <= ell; ++l) {
          double const p = (z*(2*l - 1)*pm1 - (l + emm - 1)*pmm)/double(l - emm);
          pmm = pm1; pm1 = p;
      } // l
      return pm1;
  } // associated_legendre

  inline double normalization_factor(int const ell, int const emm, int const normalization) {
      // 1:geodesy, 2:Schmidt, 3:unnormalized, 4:orthonormalized
      double const ratio = factorial(ell - emm)/factorial(ell + emm);
      switch (normalization) {
          case 1: return std::sqrt((2*ell + 1)*ratio);
          case 2: return std::sqrt(ratio);
          case 4: return std::sqrt((2*ell + 1)*ratio/(4*constants::pi));
      } // normalization
      return 1; // unnormalized
  } // normalization_factor

  status_t all_tests(int const echo=0); // declaration only

} // namespace legendre_recursion
