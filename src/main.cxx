// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cassert> // assert
#include <cstdlib> // std::abs
#include <vector> // std::vector
#include <string> // std::string
#include <tuple> // std::tuple, ::make_tuple, ::get
#include <complex> // std::complex<double>

#include "recorded_warnings.hxx" // warn, ::show_warnings, ::clear_warnings
#include "simple_timer.hxx" // SimpleTimer
#include "control.hxx" // ::command_line_interface, ::get, ::get_integer, ::read_control_file
#include "grid_options.hxx" // ::from_control, ::get_grid_shape
#include "grid_synthesis.hxx" // ::make_grid
#include "data_view.hxx" // view2D<T>, view3D<T>
#include "print_tools.hxx" // print_stats

#include "status.hxx" // status_t

#ifndef NO_UNIT_TESTS
  #include "recorded_warnings.hxx" // ::all_tests
  #include "legendre_recursion.hxx" // ::all_tests
  #include "fourier_transform.hxx" // ::all_tests
  #include "ring_synthesis.hxx" // ::all_tests
  #include "grid_synthesis.hxx" // ::all_tests
  #include "complex_tools.hxx" // ::all_tests
  #include "grid_options.hxx" // ::all_tests
  #include "omp_parallel.hxx" // ::all_tests
  #include "simple_timer.hxx" // ::all_tests
  #include "data_view.hxx" // ::all_tests
  #include "control.hxx" // ::all_tests
#endif // NO_UNIT_TESTS

#ifndef HARMONIC_GRID_VERSION
  #define HARMONIC_GRID_VERSION "unknown"
#endif // HARMONIC_GRID_VERSION

  status_t run_unit_tests(char const *module=nullptr, int const echo=0) {
      status_t status(0);
#ifdef  NO_UNIT_TESTS
      error("version was compiled with -D NO_UNIT_TESTS, cannot run tests for %s", module ? module : "all modules");
      status = STATUS_TEST_NOT_INCLUDED;
#else // NO_UNIT_TESTS
      std::string const input_name(module ? module : "");
      bool const show = ('?' == input_name[0]);
      bool const all  = input_name.empty() || show;
      if (echo > 0) {
          if (show) { std::printf("\n# show available module tests:\n"); } else
          if (all)  { std::printf("\n# run all tests!\n\n"); }
          else      { std::printf("\n# run unit tests for module '%s'\n\n", input_name.c_str()); }
      } // echo

      std::vector<std::tuple<char const*, double, status_t>> results;
      { // testing scope

#define   add_module_test(MODULE_NAME) {                                            \
              auto const module_name = #MODULE_NAME;                                \
              if (all || (input_name == module_name)) {                             \
                  SimpleTimer timer(module_name, 0, "", 0);                         \
                  if (echo > 2) std::printf("\n\n\n# ============= Module test"     \
                     " for %s ==================\n\n", module_name);                \
                  auto const stat = show ? 0 : MODULE_NAME::all_tests(echo);        \
                  results.push_back(std::make_tuple(module_name, timer.stop(), stat)); \
              }                                                                     \
          } // add_module_test

          add_module_test(recorded_warnings);
          add_module_test(legendre_recursion);
          add_module_test(fourier_transform);
          add_module_test(ring_synthesis);
          add_module_test(grid_synthesis);
          add_module_test(complex_tools);
          add_module_test(grid_options);
          add_module_test(omp_parallel);
          add_module_test(simple_timer);
          add_module_test(data_view);
          add_module_test(control);
#undef    add_module_test
      } // testing scope

      int const nmodules = results.size();
      if (nmodules < 1) { // nothing has been tested
          if (echo > 0) std::printf("# ERROR: test for '%s' not found, use --test '?' to see available modules!\n", module);
          status = -1;
      } else {
          if (echo > 0) std::printf("\n\n#%3d modules %s tested:\n", nmodules, show?"can be":"have been");
          int nonzero_status{0};
          double total_time{0};
          for (auto const & result : results) {
              auto const name = std::get<0>(result);
              auto const time = std::get<1>(result);
              auto const stat = std::get<2>(result);
              if (echo > 0) {
                  if (show) { std::printf("#    module= %s\n", name); }
                  else      { std::printf("#    module= %-24s status= %i \ttime=%9.3f sec\n", name, int(stat), time); }
              } // echo
              status += std::abs(int(stat));
              nonzero_status += (0 != stat);
              total_time += time;
          } // result
          if (show) {
              if (echo > 0) std::printf("\n");
              warn("Display only, none of %d modules has been tested", nmodules);
          } else { // show
              if (nmodules > 1 && echo > 0) {
                  std::printf("\n#%3d modules have been tested,  total status= %d, total time %.3f sec\n\n", nmodules, int(status), total_time);
              } // show total status if many modules have been tested
              if (status > 0) warn("Tests for %d module%s failed!", nonzero_status, (nonzero_status - 1)?"s":"");
          } // show
      } // something has been tested
#endif // NO_UNIT_TESTS
      return status;
  } // run_unit_tests

  status_t run_synthesis(int const echo=0) {
      // synthesize a single spherical harmonic Y(l,m) with unit coefficient
      int const lmax   = control::get_integer("synthesis.lmax", 16);
      int const degree = control::get_integer("synthesis.degree", 3);
      int const order  = control::get_integer("synthesis.order", 2);
      bool const real_grid = (0 != control::get_integer("synthesis.real", 0));
      auto const options = grid_options::from_control(echo);

      if (degree < 0 || degree > lmax || std::abs(order) > degree) {
          warn("synthesis.degree= %d and synthesis.order= %d do not fit into lmax= %d", degree, order, lmax);
          return exit_status::bad_option;
      } // degree and order

      int nlat{0}, nlong{0};
      status_t stat = grid_options::get_grid_shape(nlat, nlong, lmax, options.sampling, options.extend);
      if (stat) {
          warn("cannot derive a grid shape for lmax= %d, sampling= %d, extend= %d", lmax, options.sampling, options.extend);
          return stat;
      } // stat

      view3D<std::complex<double>> cilm(2, lmax + 1, lmax + 1, std::complex<double>(0));
      cilm((order < 0), degree, std::abs(order)) = 1;

      if (echo > 0) std::printf("\n# synthesize Y(%d,%d) on a %s grid of %d x %d for lmax= %d\n",
                                  degree, order, real_grid?"real":"complex", nlat, nlong, lmax);
      SimpleTimer timer(__FILE__, __LINE__, __func__, echo);
      int n{0}, exitstatus{0};
      if (real_grid) {
          view2D<double> griddh(nlat, nlong, 0.0);
          stat += grid_synthesis::make_grid(griddh, n, cilm, lmax, options, &exitstatus, echo);
          if (echo > 0) print_stats(griddh.data(), size_t(nlat)*nlong, "#");
      } else {
          view2D<std::complex<double>> griddh(nlat, nlong, std::complex<double>(0));
          stat += grid_synthesis::make_grid(griddh, n, cilm, lmax, options, &exitstatus, echo);
          if (echo > 0) print_stats(griddh.data(), size_t(nlat)*nlong, "#");
      } // real_grid
      if (exitstatus) warn("synthesis ended with status %d: %s", exitstatus, exit_status::message(exitstatus));
      if (echo > 0) std::printf("# N= %d latitudes, exit status %d\n", n, exitstatus);
      return stat;
  } // run_synthesis

  int show_help(char const *executable) {
      std::printf("Usage %s [OPTION]\n"
        "   --help           [-h]\tThis help message\n"
        "   --version            \tShow version number\n"
#ifndef  NO_UNIT_TESTS
        "   --test <module>  [-t]\tRun module unit test\n"
#endif // NO_UNIT_TESTS
        "   --synthesize     [-s]\tSynthesize Y(l,m) on a grid, see +synthesis.degree=, +synthesis.order=, +synthesis.lmax=\n"
        "   --verbose        [-V]\tIncrement verbosity level\n"
        "   +<name>=<value>      \tModify variable environment, e.g. +grid.normalization=4\n"
        "   +control.file=<file> \tRead variables from a control file\n"
        "\n", executable);
      return 0;
  } // show_help

  int show_version(char const *executable="#", int const echo=0) {
      if (echo > 0) std::printf("%s version " HARMONIC_GRID_VERSION "\n\n", executable);
      control::set("harmonic_grid.version", HARMONIC_GRID_VERSION, 0);
      return 0;
  } // show_version

  int main(int const argc, char const *argv[]) {
      status_t stat(0);
      char const *test_unit{nullptr}; // the name of the unit to be tested
      int run_tests{0}, run_synthesize{0};
      int verbosity{3}; // set default verbosity low
      if (argc < 2) {
          std::printf("%s: no arguments passed!\n", (argc < 1)?__FILE__:argv[0]);
          return -1;
      } // no argument passed to executable
      for (int iarg = 1; iarg < argc; ++iarg) {
          assert(nullptr != argv[iarg]);
          char const ci0 = *argv[iarg]; // char #0 of command line argument #i
          if ('-' == ci0) {

              // options (short or long)
              char const ci1 = *(argv[iarg] + 1); // char #1 of command line argument #i
              char const IgnoreCase = 32; // use with | to convert upper case chars into lower case chars
              if ('-' == ci1) {

                  // long options with "--"
                  std::string option(argv[iarg] + 2); // + 2 to remove "--" in front
                  if ("help" == option) {
                      return show_help(argv[0]);
                  } else
                  if ("version" == option) {
                      return show_version(argv[0], 1);
                  } else
                  if ("verbose" == option) {
                      verbosity = 6; // set verbosity high
                  } else
                  if ("test" == option) {
                      ++run_tests; if (iarg + 1 < argc) test_unit = argv[iarg + 1];
                  } else
                  if ("synthesize" == option) {
                      ++run_synthesize;
                  } else {
                      ++stat; warn("# ignored unknown command line option --%s", option.c_str());
                  } // option

              } else { // ci1

                  // short options with "-"
                  if ('h' == (ci1 | IgnoreCase)) {
                      return show_help(argv[0]);
                  } else
                  if ('v' == (ci1 | IgnoreCase)) {
                      verbosity += 1 + 3*('V' == ci1); // increment by 'V':4, 'v':1
                  } else
                  if ('t' == (ci1 | IgnoreCase)) {
                      ++run_tests; if (iarg + 1 < argc) test_unit = argv[iarg + 1];
                  } else
                  if ('s' == (ci1 | IgnoreCase)) {
                      ++run_synthesize;
                  } else {
                      ++stat; warn("# ignored unknown command line option -%c", ci1);
                  } // ci1

              } // ci1

          } else // ci0
          if ('+' == ci0) {
              stat += control::command_line_interface(argv[iarg] + 1, iarg); // start after the '+' char
          } else
          if (argv[iarg] != test_unit) {
              ++stat; warn("# ignored command line argument \'%s\'", argv[iarg]);
          } // ci0

      } // iarg
      //
      int echo = control::get_integer("verbosity", verbosity); // define verbosity for repeating arguments and control file entries
      if (echo > 0) {
          std::printf("\n#");
          for (int iarg = 0; iarg < argc; ++iarg) {
              std::printf(" %s", argv[iarg]); // repeat all command line arguments for completeness of the log file
          } // iarg
          std::printf("\n");
      } // echo
      //
      // in addition to command_line_interface, we can modify the control environment by a file
      stat += control::read_control_file(control::get("control.file", ""), echo);
      //
      echo = control::get_integer("verbosity", echo); // verbosity may have been redefined in the control file
      //
      show_version(argv[0], echo);
      //
      if (echo > 0) std::printf("\n# verbosity = %d\n", echo);
      //
      if (run_tests) stat += run_unit_tests(test_unit, echo);
      if (run_synthesize) stat += run_synthesis(echo);
      //
      control::show_variables(control::get_integer("control.show", 0));
      if (echo > 0) recorded_warnings::show_warnings(3);
      recorded_warnings::clear_warnings(1);
      return int(stat);
  } // main
