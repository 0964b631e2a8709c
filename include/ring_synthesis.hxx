#pragma once
// This file is part of HarmonicGrid under MIT License

#include <complex> // std::complex<double>

#include "status.hxx" // status_t
#include "data_view.hxx" // view3D<T>
#include "grid_options.hxx" // grid_config_t
#include "legendre_recursion.hxx" // legendre_recursion_t

namespace ring_synthesis {
  /*
   *    Fourier coefficients of one latitude ring from spherical harmonic coefficients.
   *    Order m goes into bin m, order -m into bin nlong - m, so that a backward
   *    (unnormalized) FFT of length nlong yields the field at longitudes 2 pi k / nlong.
   *    The sectorial seeds P(m,m) are carried scaled by 1e-280 and the factor sin(theta)^m
   *    is applied only after each order is summed up (Holmes and Featherston, 2002).
   */

  double constexpr ScaleFactor = 1e-280;

  double degree_zero_value(int const normalization); // P(0,0)

  class scaled_seed_t {
    // running sectorial value P(m,m)/sin(theta)^m scaled by ScaleFactor together with
    // the multiplier sin(theta)^m/ScaleFactor that undoes the scaling
  public:
      scaled_seed_t(int const normalization, int const csphase);

      // advance from order m-1 to m, returns the start value of the order-m recursion
      double advance(legendre_recursion::legendre_recursion_t const & rec, int const emm);

      // start value for the highest order emm with the multiplier already applied
      double last_sectorial(legendre_recursion::legendre_recursion_t const & rec, int const emm) const;

      void shrink(double const u) { _rescale *= u; }
      double rescale() const { return _rescale; }

  private:
      double _pmm;
      double _rescale;
      double _phase;
      int _normalization;
  }; // class scaled_seed_t

  // fill the nlong Fourier coefficients of the ring at z = cos(theta) (north)
  // and those of the mirror ring at -z (south) in one pass over the recursion
  void synthesize_ring_pair(std::complex<double> north[]
                          , std::complex<double> south[]
                          , double const z
                          , view3D<std::complex<double>> const & cilm
                          , legendre_recursion::legendre_recursion_t const & rec
                          , grid_options::grid_config_t const & config);

  // fill the nlong Fourier coefficients of the equator ring, only even l - m contribute
  void synthesize_equator(std::complex<double> coef[]
                        , view3D<std::complex<double>> const & cilm
                        , legendre_recursion::legendre_recursion_t const & rec
                        , grid_options::grid_config_t const & config);

  // value of the expansion at (theta, phi) by direct summation, slow and only stable for low degrees
  std::complex<double> reference_value(view3D<std::complex<double>> const & cilm
                                     , int const lmax
                                     , int const normalization
                                     , int const csphase
                                     , double const theta
                                     , double const phi);

  status_t all_tests(int const echo=0); // declaration only

} // namespace ring_synthesis
