#pragma once
// This file is part of HarmonicGrid under MIT License

namespace constants {

    // all members of this namespace must be constant

    double constexpr pi = 3.14159265358979323846; // pi
    double constexpr sqrt2 = 1.4142135623730950488; // sqrt(2)
    double constexpr sqrt4pi = 3.54490770181103205459633496668229; // sqrt(4*pi)

} // namespace constants
