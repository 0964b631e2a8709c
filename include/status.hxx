#pragma once
// This file is part of HarmonicGrid under MIT License

  int constexpr STATUS_TEST_NOT_INCLUDED = -1;

  typedef int status_t;

namespace exit_status {
  // codes reported by the grid synthesis, also used as exitstatus values

  int constexpr success           = 0;
  int constexpr bad_dimension     = 1; // improper dimensions of input or output array
  int constexpr bad_option        = 2; // improper bounds for an input variable
  int constexpr allocation_failed = 3; // error allocating memory or an FFT plan
  int constexpr file_io           = 4; // reserved for file I/O errors

  inline char const * message(int const code) {
      switch (code) {
          case success:           return "no errors";
          case bad_dimension:     return "improper dimensions of input array";
          case bad_option:        return "improper bounds for input variable";
          case allocation_failed: return "error allocating memory";
          case file_io:           return "file IO error";
      } // code
      return "unknown status";
  } // message

} // namespace exit_status
