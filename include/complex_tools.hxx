#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <complex> // std::complex<T>
#include <type_traits> // std::true_type, ::false_type

#include "status.hxx" // status_t

  template <typename T> struct is_complex_t                  : public std::false_type {};
  template <typename T> struct is_complex_t<std::complex<T>> : public std::true_type  {};
  template <typename T> constexpr bool is_complex(T const x=0) { return is_complex_t<T>::value; }

  template <typename grid_t> char const * grid_type_name(grid_t const x=0);
  template <> inline char const * grid_type_name<double>(double const x) { return "real"; }
  template <> inline char const * grid_type_name<std::complex<double>>(std::complex<double> const x) { return "complex"; }

  // convert a synthesized complex value into the element type of the output grid,
  // a real output grid keeps the real part only
  template <typename grid_t>
  grid_t to_complex_t(std::complex<double> const x); // no generic implementation given
  template <> inline std::complex<double> to_complex_t(std::complex<double> const x) { return x; }
  template <> inline double               to_complex_t(std::complex<double> const x) { return x.real(); }

namespace complex_tools {

#ifdef  NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  template <typename grid_t>
  inline status_t test_conversion(int const echo=0, bool const expect_complex=true) {
      bool const is = is_complex<grid_t>();
      std::complex<double> const z(0.25, -0.5);
      auto const y = to_complex_t<grid_t>(z);
      if (echo > 0) std::printf("# %s %s grid, is_complex = %s, (%g,%g) --> (%g,%g)\n", __func__,
              grid_type_name<grid_t>(), is?"true":"false", z.real(), z.imag(), std::real(y), std::imag(y));
      return (expect_complex != is) + (std::real(y) != z.real()) + (std::imag(y) != (is ? z.imag() : 0.0));
  } // test_conversion

  inline status_t all_tests(int const echo=0) {
      if (echo > 0) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      stat += test_conversion<std::complex<double>>(echo, true);
      stat += test_conversion<double>(echo, false);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace complex_tools
