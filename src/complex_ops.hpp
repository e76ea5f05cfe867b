#pragma once

#include <complex>
#include <string>

using Amplitude = std::complex<double>;

// Helpers over `Amplitude`. Parameters are taken as `const Amplitude&`, so a
// plain double converts implicitly to a value with zero imaginary part.
namespace circuit_sim::complex_ops {

Amplitude add(const Amplitude& a, const Amplitude& b);
Amplitude multiply(const Amplitude& a, const Amplitude& b);
Amplitude conjugate(const Amplitude& a);
double magnitude(const Amplitude& a);
double phase(const Amplitude& a);

// Fixed-point rendering used by the state summary: "0.707", "-1.000i",
// "0.500+0.500i". Components below 1e-4 in magnitude are left out.
std::string to_display_string(const Amplitude& a, int precision = 3);

}  // namespace circuit_sim::complex_ops
