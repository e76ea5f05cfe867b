#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "complex_ops.hpp"
#include "random_stream.hpp"

// |amplitude|^2 per basis index.
std::vector<double> probabilities(const std::vector<Amplitude>& state);

double total_probability(const std::vector<Amplitude>& state);

// True when the squared norm is within `tolerance` of 1.
bool norm_within_tolerance(const std::vector<Amplitude>& state, double tolerance = 1e-6);

// Fixed-width bit string of `index`, qubit 0 first.
std::string basis_label(std::size_t index, int num_qubits);

// Cumulative-probability selection for a draw `r` in [0, 1). Returns the
// last index with non-zero mass when rounding leaves the total below `r`.
std::size_t sample_index(const std::vector<double>& probs, double r);

// sample_one and sample_counts throw std::invalid_argument unless
// state.size() == 2^num_qubits.
std::string sample_one(const std::vector<Amplitude>& state, int num_qubits, RandomStream& rng);

// Throws std::invalid_argument for negative `shots`.
std::map<std::string, int> sample_counts(
    const std::vector<Amplitude>& state,
    int num_qubits,
    int shots,
    RandomStream& rng
);
