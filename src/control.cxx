// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf, ::snprintf
#include <cassert> // assert
#include <cstdint> // int32_t, uint32_t
#include <string> // std::string
#include <cstdlib> // std::atof, ::abs
#include <map> // std::map<T1,T2>
#include <cstring> // std::strchr, ::strncpy
#include <cmath> // std::sqrt, ::round
#include <algorithm> // std::min
#include <fstream> // std::ifstream

#include "control.hxx" // ::default_echo_level, ::set, ::get, ::command_line_interface, ::read_control_file

#include "recorded_warnings.hxx" // warn

namespace control {

  int constexpr MaxNameLength = 64; // max variable name length

  // convert numeric values to strings without precision loss
  inline void double2string(char buffer[32], double const number) {
      std::snprintf(buffer, 32, "%.16e", number);
  } // double2string

  inline double string2double(char const *const string) {
      return std::atof(string);
  } // string2double

  int32_t constexpr default_value_tag = 2e9; // origin tag for values set by a default

  struct variable_t {
      std::string value;
      uint32_t times_used = 0; // how many times the value was read
      int32_t origin = 0; // > 0: command line argument number, < 0: control file line, default_value_tag: default
  }; // variable_t

  std::map<std::string, variable_t> & _environment() {
      static std::map<std::string, variable_t> _map; // sorted by name
      return _map;
  } // _environment

  char const* _define(char const *const name, char const *const value, int const origin, int const echo) {
      assert(nullptr != name);
      assert(nullptr == std::strchr(name, '=')); // no '=' sign in the name
      auto & var = _environment()[std::string(name)];
      bool const redefined = !var.value.empty();
      if (echo > 7) {
          std::printf("# control sets \"%s\"", name);
          if (redefined) std::printf(" from \"%s\"", var.value.c_str());
          std::printf(" to \"%s\"\n", value);
      } // echo
      if (redefined) {
          warn("variable \"%s\" was redefined from \"%s\" to \"%s\"", name, var.value.c_str(), value);
      } // redefined
      var.value = value;
      var.times_used = (default_value_tag == origin); // defaults count as used once
      var.origin = origin;
      return var.value.c_str();
  } // _define

  void set(char const *const name, char const *const value, int const echo) {
      if (echo > 5) std::printf("# control::set(\"%s\", \"%s\")\n", name, value);
      assert(nullptr != name  && "control::set(name, value) needs a valid string as name!");
      assert(nullptr != value && "control::set(name, value) needs a valid string as value!");
      _define(name, value, 0, echo);
  } // set<string>

  char const* get(char const *const name, char const *const default_value) {
      assert(nullptr != name && "control::get(name, default_value) needs a valid string as name!");
      int const echo = default_echo_level;
      auto & map_ = _environment();
      auto const it = map_.find(std::string(name));
      if (map_.end() != it && !it->second.value.empty()) {
          ++it->second.times_used;
          if (echo > 5) std::printf("# control::get(\"%s\", default=\"%s\") = \"%s\"\n", name, default_value, it->second.value.c_str());
          return it->second.value.c_str();
      } else {
          if (echo > 5) std::printf("# control::get(\"%s\") defaults to \"%s\"\n", name, default_value);
          return _define(name, default_value, default_value_tag, 0);
      }
  } // get<string>

  void set(char const *const name, double const value, int const echo) {
      char buffer[32]; double2string(buffer, value);
      set(name, buffer, echo);
  } // set<double>

  double get(char const *const name, double const default_value) {
      char buffer[32]; double2string(buffer, default_value);
      return string2double(get(name, buffer));
  } // get<double>

  int get_integer(char const *const name, int const default_value) {
      double const value = get(name, double(default_value));
      int const integer = int(std::round(value));
      if (double(integer) != value) {
          warn("variable \"%s\" expects an integer value, found %g, use %d", name, value, integer);
      } // has fractional part
      return integer;
  } // get_integer

  status_t show_variables(int const echo) {
      if (echo < 1) return 0;
      int const show = echo;
      std::printf("\n# control.show=%d (0:none, 1:minimal, 2:unused, 4:defaults, negative for details)\n", show);
      bool const show_unused  = std::abs(show) & 0x2;
      bool const show_default = std::abs(show) & 0x4;
      bool const show_details = (show < 0);
      std::printf("# control has the following variables defined:\n#\n");
      int listed{0};
      for (auto const & pair : _environment()) {
          auto const & var = pair.second;
          if (!show_unused && var.times_used < 1) continue;
          bool const is_default = (default_value_tag == var.origin);
          if (is_default && !show_default) continue;
          if (show_details) {
              std::printf("# used %dx, %s %3d\t", var.times_used,
                  is_default?"def ":((var.origin > 0)?"argv":(var.origin?"line":"set ")),
                  is_default?0:std::abs(var.origin));
          } // show_details
          double const numeric = string2double(var.value.c_str());
          char buffer[32]; double2string(buffer, numeric);
          if (var.value == buffer) {
              std::printf("# %s=%g\n", pair.first.c_str(), numeric); // numeric value
          } else {
              std::printf("# %s=%s\n", pair.first.c_str(), var.value.c_str());
          }
          ++listed;
      } // pair
      std::printf("#\n# %d variables listed for control.show=%d\n", listed, show);
      return 0;
  } // show_variables

  status_t command_line_interface(char const *const statement, int const iarg, int const echo) {
      auto const equal = std::strchr(statement, '=');
      if (nullptr == equal) {
          warn("ignored statement \"%s\", maybe missing \'=\'", statement);
          return 1; // error, no '=' sign given
      } // no '='-sign in statement
      int const name_length = std::min(MaxNameLength - 1, int(equal - statement));
      char name[MaxNameLength];
      std::strncpy(name, statement, name_length);
      name[name_length] = '\0';
      char const *const value = equal + 1; // everything after the '=' sign
      if (echo > 7) std::printf("# control::set(statement=\"%s\") found name=\"%s\", value=\"%s\"\n", statement, name, value);
      _define(name, value, iarg, echo);
      return 0;
  } // command_line_interface

  std::string left_trim(std::string const & s) {
      auto const start = s.find_first_not_of(" \n\r\t\f\v");
      return (start == std::string::npos) ? "" : s.substr(start);
  } // left_trim

  status_t read_control_file(char const *const filename, int const echo) {
      status_t stat(0);
      char const CommentChar = '#';
      char const EchoComment = '!'; // lines starting with "#!" appear in the log

      assert(nullptr != filename);
      if ('\0' == *filename) {
          if (echo > 1) std::printf("# no control file given\n");
          return stat;
      } // filename == ""

      std::ifstream infile(filename, std::ifstream::in);
      if (infile.fail()) {
          warn("Unable to open file '%s' for reading controls", filename);
          return exit_status::file_io;
      } // failed

      if (echo > 1) std::printf("\n# reading '%s' ...\n\n", filename);
      int linenumber{0}, ncomments{0};
      std::string line;
      while (std::getline(infile, line)) {
          ++linenumber;
          auto const tlin = left_trim(line);
          if (tlin.empty()) continue;
          if (CommentChar == tlin[0]) {
              ++ncomments;
              if (tlin.size() > 1 && EchoComment == tlin[1] && echo > 0) std::printf("%s\n", tlin.c_str());
          } else {
              auto const line_stat = command_line_interface(tlin.c_str(), -linenumber, echo);
              if (line_stat) {
                  warn("failure parsing %s:%d \'%s\'", filename, linenumber, line.c_str());
              } else if (echo > 0) {
                  std::printf("# %s\n", tlin.c_str()); // show the valid commands
              }
              stat += line_stat;
          }
      } // parse file line by line
      if (echo > 3) std::printf("# %s found %d comments in file '%s', status=%i\n\n",
                                   __func__, ncomments, filename, int(stat));
      return stat;
  } // read_control_file


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_set_and_get(int const echo=9) {
      if (echo > 1) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);

      set("test.grid.sampling", "2", echo);
      stat += (2 != get_integer("test.grid.sampling", 1));

      set("test.grid.normalization", 4., echo);
      stat += (4 != get_integer("test.grid.normalization", 1));

      stat += command_line_interface("test.grid.sampling=1", 99, echo); // warns about redefinition
      stat += (1 != get_integer("test.grid.sampling", 2));

      auto const extend = get("test.grid.extend", "0"); // not defined, takes the default
      if (echo > 1) std::printf("# test.grid.extend = %s\n", extend);
      stat += ('0' != extend[0]);

      stat += (0 == command_line_interface("test.grid.lmax 20", 98, echo)); // missing '=' must fail
      return stat;
  } // test_set_and_get

  status_t test_precision(int const echo=3, int const nmax=106) {
      // check that no rounding errors arise from the ASCII representation of doubles
      if (echo > 2) std::printf("\n# %s: %s\n", __FILE__, __func__);
      status_t stat(0);
      double d{0.2}; // 1/5 is not exactly representable in binary
      for (int i = 0; i < nmax; ++i) {
          set("test.scalef", d, echo/2);
          stat += (get("test.scalef", 1.) != d);
          d *= std::sqrt(33/32.);
      } // i
      if (echo > 1) std::printf("# %s: for %i of %i cases double precision numbers are not retrieved\n", __func__, int(stat), nmax);
      return stat;
  } // test_precision

  status_t test_control_file(int const echo=3) {
      if (echo > 2) std::printf("\n# %s: %s\n", __FILE__, __func__);
      return (exit_status::file_io != read_control_file("this/file/does/not/exist.ctrl", echo));
  } // test_control_file

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_set_and_get(echo);
      stat += test_precision(echo);
      stat += test_control_file(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace control
