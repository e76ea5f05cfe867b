#include "complex_ops.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace circuit_sim::complex_ops {

namespace {

constexpr double kDisplayEpsilon = 1e-4;

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

}  // namespace

Amplitude add(const Amplitude& a, const Amplitude& b) {
    return {a.real() + b.real(), a.imag() + b.imag()};
}

Amplitude multiply(const Amplitude& a, const Amplitude& b) {
    return {
        a.real() * b.real() - a.imag() * b.imag(),
        a.real() * b.imag() + a.imag() * b.real(),
    };
}

Amplitude conjugate(const Amplitude& a) {
    return {a.real(), -a.imag()};
}

double magnitude(const Amplitude& a) {
    return std::sqrt(a.real() * a.real() + a.imag() * a.imag());
}

double phase(const Amplitude& a) {
    return std::atan2(a.imag(), a.real());
}

std::string to_display_string(const Amplitude& a, int precision) {
    const std::string re = fixed(a.real(), precision);
    const std::string im = fixed(a.imag(), precision);
    if (std::abs(a.imag()) < kDisplayEpsilon) {
        return re;
    }
    if (std::abs(a.real()) < kDisplayEpsilon) {
        return im + "i";
    }
    const std::string sign = a.imag() >= 0.0 ? "+" : "";
    return re + sign + im + "i";
}

}  // namespace circuit_sim::complex_ops
