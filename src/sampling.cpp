#include "sampling.hpp"

#include "state_backend.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

std::vector<double> probabilities(const std::vector<Amplitude>& state) {
    std::vector<double> probs;
    probs.reserve(state.size());
    for (const auto& amp : state) {
        probs.push_back(std::norm(amp));
    }
    return probs;
}

double total_probability(const std::vector<Amplitude>& state) {
    double total = 0.0;
    for (const auto& amp : state) {
        total += std::norm(amp);
    }
    return total;
}

bool norm_within_tolerance(const std::vector<Amplitude>& state, double tolerance) {
    return std::abs(total_probability(state) - 1.0) <= tolerance;
}

namespace {

void check_state_length(const std::vector<Amplitude>& state, int num_qubits) {
    if (state.size() != state_dimension(num_qubits)) {
        throw std::invalid_argument("State vector length does not match qubit count");
    }
}

}  // namespace

std::string basis_label(std::size_t index, int num_qubits) {
    if (num_qubits < 0 || num_qubits > static_cast<int>(sizeof(std::size_t) * 8)) {
        throw std::invalid_argument("Unsupported qubit count " + std::to_string(num_qubits));
    }
    std::string label(static_cast<std::size_t>(num_qubits), '0');
    for (int q = 0; q < num_qubits; ++q) {
        const std::size_t mask = static_cast<std::size_t>(1) << (num_qubits - 1 - q);
        if (index & mask) {
            label[static_cast<std::size_t>(q)] = '1';
        }
    }
    return label;
}

std::size_t sample_index(const std::vector<double>& probs, double r) {
    if (probs.empty()) {
        throw std::invalid_argument("Cannot sample from an empty distribution");
    }
    double cumulative = 0.0;
    std::size_t last_nonzero = probs.size() - 1;
    bool seen_nonzero = false;
    for (std::size_t i = 0; i < probs.size(); ++i) {
        cumulative += probs[i];
        if (probs[i] <= 0.0) {
            continue;
        }
        // Zero-mass outcomes are never selected, even for r == 0.
        if (cumulative >= r) {
            return i;
        }
        last_nonzero = i;
        seen_nonzero = true;
    }
    return seen_nonzero ? last_nonzero : probs.size() - 1;
}

std::string sample_one(const std::vector<Amplitude>& state, int num_qubits, RandomStream& rng) {
    check_state_length(state, num_qubits);
    const auto probs = probabilities(state);
    return basis_label(sample_index(probs, rng.uniform(0.0, 1.0)), num_qubits);
}

std::map<std::string, int> sample_counts(
    const std::vector<Amplitude>& state,
    int num_qubits,
    int shots,
    RandomStream& rng
) {
    if (shots < 0) {
        throw std::invalid_argument("Shot count must be non-negative");
    }
    check_state_length(state, num_qubits);
    const auto probs = probabilities(state);
    std::map<std::string, int> counts;
    for (int shot = 0; shot < shots; ++shot) {
        const std::size_t index = sample_index(probs, rng.uniform(0.0, 1.0));
        ++counts[basis_label(index, num_qubits)];
    }
    return counts;
}
