#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstddef> // size_t

#include "status.hxx" // status_t

  int constexpr CSPHASE_DEFAULT = 1; // exclude the Condon-Shortley phase factor (-1)^m

namespace grid_options {

  // normalization conventions of the spherical harmonics
  int constexpr Geodesy         = 1; // 4 pi normalized
  int constexpr Schmidt         = 2; // Schmidt semi-normalized
  int constexpr Unnormalized    = 3; // plain associated Legendre functions
  int constexpr Orthonormalized = 4; // unit norm on the sphere

  char const * normalization_name(int const normalization);

  struct grid_options_t {
      int normalization = Geodesy; // 1..4
      int sampling      = 1;   // 1: N by N, 2: N by 2N samples
      int csphase       = CSPHASE_DEFAULT; // +1 or -1
      int lmax_calc     = -1;  // negative: not given
      int extend        = 0;   // 1: include the 90 deg S row and the 360 deg E column
  }; // grid_options_t

  struct grid_config_t {
      int normalization;
      int sampling;
      int csphase;
      int extend;
      int lmax;      // degree the grid resolves
      int lmax_comp; // highest degree used in the synthesis
      int n;         // number of latitudes, N = 2*(lmax + 1)
      int nlong;     // number of longitudes, N or 2N
      int nlat_out;  // rows written, N + extend
      int nlong_out; // columns written, nlong + extend
  }; // grid_config_t

  // shape of the output grid
  status_t get_grid_shape(int & nlat_out, int & nlong_out
                        , int const lmax, int const sampling=1, int const extend=0);

  // check the call parameters in a fixed order and derive the grid configuration,
  // returns exit_status::bad_dimension or exit_status::bad_option for the first violation found
  status_t resolve(grid_config_t & config
                 , grid_options_t const & options
                 , int const lmax
                 , size_t const cilm_planes  // number of sign planes of the coefficients
                 , size_t const cilm_degrees // number of degrees of the coefficients
                 , size_t const cilm_orders  // number of orders of the coefficients
                 , size_t const grid_rows    // number of rows of the output grid
                 , size_t const grid_columns // number of columns of the output grid
                 , int const echo=0);

  // read grid.normalization, grid.sampling, grid.csphase, grid.lmax_calc and grid.extend
  grid_options_t from_control(int const echo=0);

  status_t all_tests(int const echo=0); // declaration only

} // namespace grid_options
