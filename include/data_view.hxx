#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cstdint> // size_t
#include <algorithm> // std::fill
#include <utility> // std::move
#include <complex> // std::complex<real_t>

#include "status.hxx" // status_t
#include "recorded_warnings.hxx" // error

// #define debug_printf(...) std::printf(__VA_ARGS__)
#define debug_printf(...)

#define DimUnknown 0

namespace data_view {
    inline void _check_index(int const srcline, size_t const n, size_t const i, char const d) {
        if (i >= n) error("# data_view.hxx:%d i%c=%ld >= n%c=%ld\n", srcline, '0'+d, i, '0'+d, n);
    } // _check_index
} // namespace data_view

#ifdef  DEBUG
  #define CHECK_INDEX(n,i,d) data_view::_check_index(__LINE__, n, i, d);
#else
  #define CHECK_INDEX(n,i,d)
#endif // DEBUG

template <typename T>
class view2D {
  // row-major matrix view, element (i1,i0) at _data[i1*_n0 + i0],
  // a grid with nlat rows and nlong columns is view2D<T>(nlat, nlong)
public:

  view2D() : _data(nullptr), _n0(DimUnknown), _n1(DimUnknown), _mem(0) {} // default constructor

  view2D(T* const ptr, size_t const stride, size_t const n1=DimUnknown)
    : _data(ptr), _n0(stride), _n1(n1), _mem(0) {} // non-owning view

  view2D(size_t const n1, size_t const stride, T const init_value={0})
    : _data(new T[n1*stride]), _n0(stride), _n1(n1), _mem(n1*stride*sizeof(T)) {
      debug_printf("# view2D(n1=%ld, stride=%ld [, init_value]) constructor allocates %g kByte\n", n1, stride, _mem*.001);
      std::fill(_data, _data + n1*stride, init_value);
  } // memory owning constructor

  ~view2D() {
      if (_data && (_mem > 0)) {
          debug_printf("# ~view2D() destructor frees %g kByte\n", _mem*.001);
          delete[] _data;
      } // is memory owner
  } // destructor

  view2D(view2D<T> && rhs) : _data(nullptr), _n0(DimUnknown), _n1(DimUnknown), _mem(0) {
      *this = std::move(rhs);
  } // move constructor

  view2D(view2D<T> const & rhs) = delete;

  view2D& operator= (view2D<T> && rhs) {
      if (_data && (_mem > 0)) delete[] _data;
      _data = rhs._data;
      _n0   = rhs._n0;
      _n1   = rhs._n1;
      _mem  = rhs._mem; rhs._mem = 0; // steal ownership
      return *this;
  } // move assignment

  view2D& operator= (view2D<T> const & rhs) = delete;

  T const & operator () (size_t const i1, size_t const i0) const {
      if (_n1 > DimUnknown)
      CHECK_INDEX(_n1, i1, 1);
      CHECK_INDEX(_n0, i0, 0);
      return _data[i1*_n0 + i0]; } // (i,j)

  T       & operator () (size_t const i1, size_t const i0)       {
      if (_n1 > DimUnknown)
      CHECK_INDEX(_n1, i1, 1);
      CHECK_INDEX(_n0, i0, 0);
      return _data[i1*_n0 + i0]; } // (i,j)

  T* operator[] (size_t const i1) const {
      if (_n1 > DimUnknown)
      CHECK_INDEX(_n1, i1, 1);
      return &_data[i1*_n0]; } // [] returns a row

  T* data() const { return _data; }
  size_t stride() const { return _n0; }
  size_t dim1()   const { return _n1; } // number of rows, DimUnknown if not known
  bool is_memory_owner() const { return (_mem > 0); }

private:
  T * _data;
  size_t _n0, _n1; // _n1==0 --> unknown
  size_t _mem; // only > 0 if memory owner

}; // view2D

template <typename T>
class view3D {
  // element (i2,i1,i0) at _data[(i2*_n1 + i1)*_n0 + i0],
  // spherical harmonic coefficients are view3D<T>(2, 1 + lmax, 1 + lmax) indexed (sign, ell, emm)
public:

  view3D() : _data(nullptr), _n0(0), _n1(0), _n2(DimUnknown), _mem(0) {} // default constructor

  view3D(T* const ptr, size_t const n2, size_t const n1, size_t const stride)
    : _data(ptr), _n0(stride), _n1(n1), _n2(n2), _mem(0) {} // non-owning view with known shape

  view3D(size_t const n2, size_t const n1, size_t const stride, T const init_value={0})
    : _data(new T[n2*n1*stride]), _n0(stride), _n1(n1), _n2(n2), _mem(n2*n1*stride*sizeof(T)) {
      debug_printf("# view3D(n2=%ld, n1=%ld, stride=%ld [, init_value]) constructor allocates %g kByte\n", n2, n1, stride, _mem*.001);
      std::fill(_data, _data + n2*n1*stride, init_value);
  } // memory owning constructor

  ~view3D() {
      if (_data && (_mem > 0)) {
          debug_printf("# ~view3D() destructor frees %g kByte\n", _mem*.001);
          delete[] _data;
      } // is memory owner
  } // destructor

  view3D(view3D<T> && rhs) : _data(nullptr), _n0(0), _n1(0), _n2(DimUnknown), _mem(0) {
      *this = std::move(rhs);
  } // move constructor

  view3D(view3D<T> const & rhs) = delete;

  view3D& operator= (view3D<T> && rhs) {
      if (_data && (_mem > 0)) delete[] _data;
      _data = rhs._data;
      _n0   = rhs._n0;
      _n1   = rhs._n1;
      _n2   = rhs._n2;
      _mem  = rhs._mem; rhs._mem = 0; // steal ownership
      return *this;
  } // move assignment

  view3D& operator= (view3D<T> const & rhs) = delete;

#define _access return _data[(i2*_n1 + i1)*_n0 + i0]
  T const & operator () (size_t const i2, size_t const i1, size_t const i0) const {
      if (_n2 > DimUnknown)
      CHECK_INDEX(_n2, i2, 2);
      CHECK_INDEX(_n1, i1, 1);
      CHECK_INDEX(_n0, i0, 0);
      _access; }

  T       & operator () (size_t const i2, size_t const i1, size_t const i0)       {
      if (_n2 > DimUnknown)
      CHECK_INDEX(_n2, i2, 2);
      CHECK_INDEX(_n1, i1, 1);
      CHECK_INDEX(_n0, i0, 0);
      _access; }
#undef _access

  view2D<T> operator[] (size_t const i2) const {
      if (_n2 > DimUnknown)
      CHECK_INDEX(_n2, i2, 2);
      return view2D<T>(_data + i2*_n1*_n0, _n0, _n1); } // [] returns a sub-array

  T* data() const { return _data; }
  size_t stride() const { return _n0; }
  size_t dim1()   const { return _n1; }
  size_t dim2()   const { return _n2; }
  bool is_memory_owner() const { return (_mem > 0); }

private:
  T* _data;
  size_t _n0, _n1, _n2; // _n2==0 --> unknown
  size_t _mem; // only > 0 if memory owner

}; // view3D

namespace data_view {

#ifdef  NO_UNIT_TESTS
  inline status_t all_tests(int const echo=0) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  inline status_t test_grid_rows(int const echo=0) {
      if (echo > 3) std::printf("\n# %s\n", __func__);
      int const nlat = 6, nlong = 12;
      view2D<double> grid(nlat, nlong, 0.0);
      for (int i = 0; i < nlat; ++i) {
          for (int k = 0; k < nlong; ++k) {
              grid(i,k) = i*100 + k;
          } // k
      } // i
      status_t stat(0);
      stat += (nlat != grid.dim1()) + (nlong != grid.stride());
      stat += (503 != grid[5][3]);
      auto const moved = std::move(grid);
      stat += (!moved.is_memory_owner()) + grid.is_memory_owner();
      stat += (211 != moved(2,11));
      return stat;
  } // test_grid_rows

  inline status_t test_coefficient_planes(int const echo=0) {
      if (echo > 3) std::printf("\n# %s\n", __func__);
      int const lmax = 4;
      view3D<std::complex<double>> cilm(2, lmax + 1, lmax + 1, std::complex<double>(0));
      cilm(1,3,2) = std::complex<double>(1, -1);
      status_t stat(0);
      stat += (2 != cilm.dim2()) + (lmax + 1 != cilm.dim1()) + (lmax + 1 != cilm.stride());
      auto const minus = cilm[1]; // sign plane for negative orders
      stat += (std::complex<double>(1, -1) != minus(3,2));
      stat += (std::complex<double>(0) != cilm(0,3,2));
      return stat;
  } // test_coefficient_planes

  inline status_t all_tests(int const echo=0) {
      if (echo > 0) std::printf("\n# %s %s\n", __FILE__, __func__);
      status_t stat(0);
      stat += test_grid_rows(echo);
      stat += test_coefficient_planes(echo);
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace data_view
