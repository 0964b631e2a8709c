#pragma once
// This file is part of HarmonicGrid under MIT License

#include <cstdio> // std::printf
#include <cstdint> // size_t
#include <cmath> // std::sqrt, ::isfinite
#include <complex> // std::abs, ::real
#include <algorithm> // std::min, ::max

  template <typename grid_t>
  double print_stats(
        grid_t const values[] // input values
      , size_t const all // how many
      , char const *prefix="" // leading printf messages
      , char const *_unit="" // unit indicator
  ) {
      // statistics of the real parts and the largest modulus of a grid, non-finite values are counted
      double gmin{9e307}, gmax{-gmin}, gsum{0}, gsum2{0}, amax{0};
      size_t nonfinite{0};
      for (size_t i = 0; i < all; ++i) {
          double const re = std::real(values[i]);
          double const ab = std::abs(values[i]);
          if (!std::isfinite(ab)) { ++nonfinite; continue; }
          gmin = std::min(gmin, re);
          gmax = std::max(gmax, re);
          amax = std::max(amax, ab);
          gsum  += re;
          gsum2 += re*re;
      } // i
      size_t const n = std::max(size_t(1), all - nonfinite);
      std::printf("%s grid stats min %g max %g avg %g rms %g max|f| %g %s", prefix, gmin, gmax, gsum/n, std::sqrt(gsum2/n), amax, _unit);
      if (nonfinite > 0) std::printf(" (%ld non-finite values)", nonfinite);
      std::printf("\n");
      return amax;
  } // print_stats
