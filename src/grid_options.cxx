// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <algorithm> // std::min

#include "grid_options.hxx"

#include "recorded_warnings.hxx" // warn
#include "control.hxx" // ::get_integer

namespace grid_options {

  char const * normalization_name(int const normalization) {
      switch (normalization) {
          case Geodesy:         return "geodesy";
          case Schmidt:         return "Schmidt";
          case Unnormalized:    return "unnormalized";
          case Orthonormalized: return "orthonormalized";
      } // normalization
      return "invalid";
  } // normalization_name

  status_t get_grid_shape(int & nlat_out, int & nlong_out
                        , int const lmax, int const sampling, int const extend) {
      if (lmax < 0 || sampling < 1 || sampling > 2 || extend < 0 || extend > 1) return exit_status::bad_option;
      int const n = 2*(lmax + 1);
      nlat_out  = n + extend;
      nlong_out = sampling*n + extend;
      return exit_status::success;
  } // get_grid_shape

  status_t resolve(grid_config_t & config
                 , grid_options_t const & options
                 , int const lmax
                 , size_t const cilm_planes
                 , size_t const cilm_degrees
                 , size_t const cilm_orders
                 , size_t const grid_rows
                 , size_t const grid_columns
                 , int const echo) {

      if (lmax < 0) {
          warn("LMAX must be non-negative, input value is %d", lmax);
          return exit_status::bad_option;
      } // lmax

      if (1 != options.sampling && 2 != options.sampling) {
          warn("optional parameter SAMPLING must be 1 (N by N) or 2 (N by 2N), input value is %d", options.sampling);
          return exit_status::bad_option;
      } // sampling

      if (0 != options.extend && 1 != options.extend) {
          warn("optional parameter EXTEND must be 0 or 1, input value is %d", options.extend);
          return exit_status::bad_option;
      } // extend

      int nlat_out{0}, nlong_out{0};
      get_grid_shape(nlat_out, nlong_out, lmax, options.sampling, options.extend);

      if (cilm_planes < 2 || cilm_degrees < 1 || cilm_orders < 1) {
          warn("CILM must be dimensioned as (2, *, *), input dimension is (%ld, %ld, %ld)",
                cilm_planes, cilm_degrees, cilm_orders);
          return exit_status::bad_dimension;
      } // cilm dimensions

      if (grid_rows < size_t(nlat_out) || grid_columns < size_t(nlong_out)) {
          warn("GRIDDH must be dimensioned as (%d, %d), input dimension is (%ld, %ld)",
                nlat_out, nlong_out, grid_rows, grid_columns);
          return exit_status::bad_dimension;
      } // griddh dimensions

      if (options.normalization < Geodesy || options.normalization > Orthonormalized) {
          warn("parameter NORM must be 1 (geodesy), 2 (Schmidt), 3 (unnormalized), or 4 (orthonormalized), input value is %d",
                options.normalization);
          return exit_status::bad_option;
      } // normalization

      if (-1 != options.csphase && 1 != options.csphase) {
          warn("CSPHASE must be 1 (exclude) or -1 (include), input value is %d", options.csphase);
          return exit_status::bad_option;
      } // csphase

      int lmax_comp = std::min(lmax, int(std::min(cilm_degrees, cilm_orders)) - 1);
      if (options.lmax_calc >= 0) {
          if (options.lmax_calc > lmax) {
              warn("LMAX_CALC must be less than or equal to LMAX, LMAX= %d, LMAX_CALC= %d", lmax, options.lmax_calc);
              return exit_status::bad_option;
          } // lmax_calc > lmax
          lmax_comp = std::min(lmax_comp, options.lmax_calc);
      } // lmax_calc given

      config.normalization = options.normalization;
      config.sampling      = options.sampling;
      config.csphase       = options.csphase;
      config.extend        = options.extend;
      config.lmax          = lmax;
      config.lmax_comp     = lmax_comp;
      config.n             = 2*(lmax + 1);
      config.nlong         = options.sampling*config.n;
      config.nlat_out      = nlat_out;
      config.nlong_out     = nlong_out;

      if (echo > 3) std::printf("# %s grid %d x %d for lmax= %d, synthesized up to degree %d, %s normalization, csphase= %d\n",
                          __func__, nlat_out, nlong_out, lmax, lmax_comp, normalization_name(config.normalization), config.csphase);
      return exit_status::success;
  } // resolve

  grid_options_t from_control(int const echo) {
      grid_options_t options;
      options.normalization = control::get_integer("grid.normalization", options.normalization);
      options.sampling      = control::get_integer("grid.sampling",      options.sampling);
      options.csphase       = control::get_integer("grid.csphase",       options.csphase);
      options.lmax_calc     = control::get_integer("grid.lmax_calc",     options.lmax_calc);
      options.extend        = control::get_integer("grid.extend",        options.extend);
      if (echo > 2) std::printf("# grid options: normalization=%d sampling=%d csphase=%d lmax_calc=%d extend=%d\n",
              options.normalization, options.sampling, options.csphase, options.lmax_calc, options.extend);
      return options;
  } // from_control


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_grid_shapes(int const echo=3) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 7;
      for (int sampling = 1; sampling <= 2; ++sampling) {
          for (int extend = 0; extend <= 1; ++extend) {
              int nlat{0}, nlong{0};
              stat += get_grid_shape(nlat, nlong, lmax, sampling, extend);
              if (echo > 3) std::printf("# lmax= %d sampling= %d extend= %d --> %d x %d\n", lmax, sampling, extend, nlat, nlong);
              stat += (16 + extend != nlat) + (16*sampling + extend != nlong);
          } // extend
      } // sampling
      int nlat{0}, nlong{0};
      stat += (exit_status::bad_option != get_grid_shape(nlat, nlong, lmax, 3, 0));
      return stat;
  } // test_grid_shapes

  status_t test_validation_order(int const echo=3) {
      // the first violation found decides the status
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      int const lmax = 3; // N = 8
      grid_config_t config;
      grid_options_t ok;
      stat += resolve(config, ok, lmax, 2, 4, 4, 8, 8, echo);
      stat += (8 != config.n) + (8 != config.nlong) + (3 != config.lmax_comp);

      grid_options_t bad;
      bad.sampling = 3;
      bad.normalization = 5; // would give the same status, but sampling is checked first
      stat += (exit_status::bad_option != resolve(config, bad, lmax, 1, 4, 4, 8, 8)); // before the cilm shape check

      grid_options_t o;
      o.extend = 2;
      stat += (exit_status::bad_option    != resolve(config, o, lmax, 2, 4, 4, 9, 9));
      o.extend = 1;
      stat += (exit_status::bad_dimension != resolve(config, o, lmax, 2, 4, 4, 8, 8)); // needs 9 x 9
      stat += (exit_status::bad_dimension != resolve(config, ok, lmax, 1, 4, 4, 8, 8)); // only one sign plane
      o.normalization = 5;
      stat += (exit_status::bad_dimension != resolve(config, o, lmax, 1, 4, 4, 9, 9)); // shape before normalization
      stat += (exit_status::bad_option    != resolve(config, o, lmax, 2, 4, 4, 9, 9));
      o.normalization = 0;
      stat += (exit_status::bad_option    != resolve(config, o, lmax, 2, 4, 4, 9, 9));
      o.normalization = 4;
      o.csphase = 0;
      stat += (exit_status::bad_option    != resolve(config, o, lmax, 2, 4, 4, 9, 9));
      o.csphase = -1;
      o.lmax_calc = 4;
      stat += (exit_status::bad_option    != resolve(config, o, lmax, 2, 4, 4, 9, 9));
      o.lmax_calc = 2;
      stat += resolve(config, o, lmax, 2, 4, 4, 9, 9, echo);
      stat += (2 != config.lmax_comp) + (9 != config.nlat_out) + (9 != config.nlong_out) + (-1 != config.csphase);
      stat += (exit_status::bad_option != resolve(config, ok, -1, 2, 4, 4, 8, 8));
      return stat;
  } // test_validation_order

  status_t test_effective_degree(int const echo=3) {
      // the coefficient array may hold fewer or more degrees than the grid resolves
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      grid_config_t config;
      grid_options_t o;
      o.sampling = 2;
      stat += resolve(config, o, 5, 2, 3, 3, 12, 24);
      stat += (2 != config.lmax_comp) + (24 != config.nlong);
      stat += resolve(config, o, 5, 2, 9, 9, 20, 30); // larger grid views are accepted
      stat += (5 != config.lmax_comp);
      return stat;
  } // test_effective_degree

  status_t test_from_control(int const echo=3) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      control::set("grid.normalization", "4", echo/2);
      control::set("grid.extend", "1", echo/2);
      auto const o = from_control(echo);
      control::set("grid.normalization", "1", echo/2); // restore the default
      control::set("grid.extend", "0", echo/2);
      return (Orthonormalized != o.normalization) + (1 != o.extend) + (1 != o.sampling) + (CSPHASE_DEFAULT != o.csphase);
  } // test_from_control

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_grid_shapes(echo);
      stat += test_validation_order(echo);
      stat += test_effective_degree(echo);
      stat += test_from_control(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace grid_options
