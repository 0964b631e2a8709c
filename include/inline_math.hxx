#pragma once
// This file is part of HarmonicGrid under MIT License

template <typename T> inline T constexpr pow2(T const x) { return x*x; }

inline int constexpr minus_one_to_the(int const m) { return (m & 1) ? -1 : 1; } // (-1)^m

inline double factorial(unsigned const n) { return (n > 1) ? factorial(n - 1)*double(n) : 1; }
