#pragma once

#include <string>
#include <vector>

#include "complex_ops.hpp"

struct BasisStateEntry {
    std::string basis;      // "|01⟩" style ket, qubit 0 first
    std::string amplitude;  // complex_ops::to_display_string, precision 3
    double probability = 0.0;
    double phase = 0.0;     // radians
};

// Basis states whose probability exceeds `threshold`, in index order.
std::vector<BasisStateEntry> summarize_state(
    const std::vector<Amplitude>& state,
    int num_qubits,
    double threshold = 1e-4
);

std::string format_state(const std::vector<BasisStateEntry>& entries);
