#pragma once

#include <vector>

#include "complex_ops.hpp"

// Single-qubit view of a multi-qubit state: Bloch coordinates, purity and
// the 2x2 reduced density matrix they are derived from.
struct ReducedQubitState {
    double x = 0.0;
    double y = 0.0;
    double z = 1.0;
    double purity = 1.0;
    Amplitude rho00{1.0, 0.0};
    Amplitude rho01{0.0, 0.0};
    Amplitude rho10{0.0, 0.0};
    Amplitude rho11{0.0, 0.0};
};

// Traces out every qubit but `qubit`. Throws std::out_of_range for a qubit
// outside [0, num_qubits) and std::invalid_argument when the vector length
// is not 2^num_qubits.
ReducedQubitState reduce_qubit(
    const std::vector<Amplitude>& state,
    int num_qubits,
    int qubit
);

// |(x, y, z)|; 1 for a pure unentangled qubit, below 1 when entangled.
double bloch_vector_length(const ReducedQubitState& reduced);
