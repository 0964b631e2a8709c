#pragma once
// This file is part of HarmonicGrid under MIT License

#include <complex> // std::complex<double>

#include "status.hxx" // status_t
#include "data_view.hxx" // view2D<T>, view3D<T>
#include "grid_options.hxx" // grid_options_t
#include "legendre_recursion.hxx" // legendre_recursion_t

namespace grid_synthesis {
  /*
   *    Inverse spherical harmonic transform onto an equiangular grid
   *    of Driscoll and Healy (1994).
   *
   *    The coefficients cilm(0,l,m) multiply Y(l,m) and cilm(1,l,m) multiply Y(l,-m).
   *    Row i of the grid is at colatitude pi*i/n, column k at longitude 2*pi*k/nlong.
   *    The grid has n = 2*(lmax + 1) rows and nlong = n or 2*n columns (sampling 1 or 2),
   *    with options.extend = 1 an additional row at 90 deg S and a column at 360 deg E.
   *
   *    The grid element type is std::complex<double> or double;
   *    a real-valued grid stores the real part of each synthesized sample.
   *
   *    On failure, the status is stored in *exitstatus and returned,
   *    or the program terminates with an error message if exitstatus is nullptr.
   *    The grid is not modified on failure.
   */

  template <typename grid_t>
  status_t make_grid(view2D<grid_t> & griddh // output grid
                   , int & n // output number of latitudes
                   , view3D<std::complex<double>> const & cilm // coefficients (2, lmax+1, lmax+1)
                   , int const lmax // degree the grid resolves
                   , grid_options::grid_options_t const & options
                   , int *exitstatus // nullptr: terminate on failure
                   , legendre_recursion::legendre_recursion_t & cache // caller-owned recursion tables
                   , int const echo=0); // log level

  // same but with recursion tables held per thread
  template <typename grid_t>
  status_t make_grid(view2D<grid_t> & griddh
                   , int & n
                   , view3D<std::complex<double>> const & cilm
                   , int const lmax
                   , grid_options::grid_options_t const & options=grid_options::grid_options_t()
                   , int *exitstatus=nullptr
                   , int const echo=0);

  status_t all_tests(int const echo=0); // declaration only

} // namespace grid_synthesis
