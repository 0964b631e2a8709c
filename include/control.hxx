#pragma once
// This file is part of HarmonicGrid under MIT License

#include "status.hxx" // status_t

namespace control {
  /*
   *    Internal variable environment for run-time options.
   *    Variables can be defined in a control file, on the command line
   *    (as +name=value) or in the code and they can be read anywhere.
   *    Internally, variables are stored as pairs of two strings, name and value.
   */

  int constexpr default_echo_level = 2;

  status_t command_line_interface(char const *statement, int const iarg // define a (name, value) pair
                                  , int const echo=default_echo_level); // by "name=value" syntax

  void   set(char const *name, char const  *value, int const echo=default_echo_level); // define a (name, value) pair
  void   set(char const *name, double const value, int const echo=default_echo_level);

  char const* get(char const *name, char const * default_value); // read a string  value from the variable environment
  double      get(char const *name, double const default_value); // read a numeric value from the variable environment
  int get_integer(char const *name, int const default_value); // read an integer, warn if the value has a fractional part

  status_t read_control_file(char const *filename, int const echo=0); // read definitions given in an input file

  status_t show_variables(int const echo=default_echo_level); // show which variables were defined

  status_t all_tests(int const echo=0); // declaration only

} // namespace control
