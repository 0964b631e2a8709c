// g++ -std=c++11 -O0 -g -pedantic -Wall -I../include test_MODULE.cxx ../src/MODULE.cxx ../src/control.cxx ../src/recorded_warnings.cxx -lfftw3 && ./a.out
// template for a stand-alone test of a single module, replace MODULE by the module name
#include <cstdio> // std::printf
#include <cassert> // assert
#include "status.hxx" // status_t
#include "control.hxx" // ::command_line_interface, ::get
#include "recorded_warnings.hxx" // ::show_warnings
#include "MODULE.hxx" // ::all_tests
int main(int const argc, char const *argv[]) {
    status_t stat(0);
    for (int iarg = 1; iarg < argc; ++iarg) {
        assert(nullptr != argv[iarg]);
        if ('+' == *argv[iarg]) { // char #0 of command line argument #iarg
            stat += control::command_line_interface(argv[iarg] + 1, iarg); // start after the '+' char
        } // '+'
    } // iarg
    stat += MODULE::all_tests(control::get_integer("verbosity", 5));
    recorded_warnings::show_warnings(1);
    if (0 != int(stat)) std::printf("\n# %s: all_tests = %i\n", __FILE__, int(stat));
    return int(stat);
} // main
