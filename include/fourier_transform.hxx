#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstddef> // size_t
#include <complex> // std::complex<double>

extern "C" {
  #include <fftw3.h> // fftw_plan, fftw_complex
} // extern "C"

#include "status.hxx" // status_t

namespace fourier_transform {
  /*
   *    Scoped resources around the FFTW3 library:
   *    a one-dimensional complex-to-complex plan of fixed length and direction
   *    and FFTW-aligned scratch arrays on which such a plan can be executed.
   *    The backward transform is unnormalized, out[k] = sum_m in[m] exp(+2 pi i m k / n).
   */

  class aligned_buffer_t {
  public:
      explicit aligned_buffer_t(size_t const n=0);
      ~aligned_buffer_t();
      aligned_buffer_t(aligned_buffer_t && rhs);
      aligned_buffer_t(aligned_buffer_t const & rhs) = delete;
      aligned_buffer_t& operator= (aligned_buffer_t const & rhs) = delete;

      std::complex<double>* data() const { return reinterpret_cast<std::complex<double>*>(_data); }
      std::complex<double> & operator[] (size_t const i) { return data()[i]; }
      size_t size() const { return _size; }
      bool allocated() const { return (nullptr != _data) || (0 == _size); }
      void zero(); // set all elements to (0,0)

  private:
      fftw_complex* _data;
      size_t _size;
  }; // class aligned_buffer_t


  class plan_t {
  public:
      // construction and destruction are serialized on one process-wide lock
      explicit plan_t(int const length, bool const forward=false, int const echo=0);
      ~plan_t();
      plan_t(plan_t const & rhs) = delete;
      plan_t& operator= (plan_t const & rhs) = delete;

      bool valid() const { return nullptr != _plan; }
      int length() const { return _length; }

      // thread-safe, in and out must be distinct aligned arrays of length()
      status_t execute(aligned_buffer_t & in, aligned_buffer_t & out) const;

  private:
      fftw_plan _plan;
      int _length;
  }; // class plan_t

  status_t all_tests(int const echo=0); // declaration only

} // namespace fourier_transform
