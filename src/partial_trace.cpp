#include "partial_trace.hpp"

#include "state_backend.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

using namespace circuit_sim::complex_ops;

ReducedQubitState reduce_qubit(
    const std::vector<Amplitude>& state,
    int num_qubits,
    int qubit
) {
    if (qubit < 0 || qubit >= num_qubits) {
        throw std::out_of_range("Invalid qubit index " + std::to_string(qubit));
    }
    const std::size_t dim = state_dimension(num_qubits);
    if (state.size() != dim) {
        throw std::invalid_argument("State vector length does not match qubit count");
    }

    const std::size_t mask = qubit_mask(num_qubits, qubit);
    const std::size_t low_bits = mask - 1;
    Amplitude rho00{0.0, 0.0};
    Amplitude rho01{0.0, 0.0};
    Amplitude rho10{0.0, 0.0};
    Amplitude rho11{0.0, 0.0};

    // `rest` enumerates the other qubits; the target bit is spliced in at
    // `mask` to get the |..0..> and |..1..> partners.
    const std::size_t rest_count = dim >> 1;
    for (std::size_t rest = 0; rest < rest_count; ++rest) {
        const std::size_t i0 = ((rest & ~low_bits) << 1) | (rest & low_bits);
        const std::size_t i1 = i0 | mask;
        const Amplitude& a0 = state[i0];
        const Amplitude& a1 = state[i1];
        rho00 = add(rho00, multiply(a0, conjugate(a0)));
        rho01 = add(rho01, multiply(a0, conjugate(a1)));
        rho10 = add(rho10, multiply(a1, conjugate(a0)));
        rho11 = add(rho11, multiply(a1, conjugate(a1)));
    }

    ReducedQubitState out;
    out.rho00 = rho00;
    out.rho01 = rho01;
    out.rho10 = rho10;
    out.rho11 = rho11;
    out.x = 2.0 * rho01.real();
    out.y = 2.0 * rho01.imag();
    out.z = rho00.real() - rho11.real();
    out.purity = rho00.real() * rho00.real() + rho11.real() * rho11.real() +
                 2.0 * (rho01.real() * rho01.real() + rho01.imag() * rho01.imag());
    return out;
}

double bloch_vector_length(const ReducedQubitState& reduced) {
    return std::sqrt(reduced.x * reduced.x + reduced.y * reduced.y + reduced.z * reduced.z);
}
