#include "state_summary.hpp"

#include "sampling.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

std::vector<BasisStateEntry> summarize_state(
    const std::vector<Amplitude>& state,
    int num_qubits,
    double threshold
) {
    std::vector<BasisStateEntry> entries;
    for (std::size_t i = 0; i < state.size(); ++i) {
        const double p = std::norm(state[i]);
        if (p <= threshold) {
            continue;
        }
        BasisStateEntry entry;
        entry.basis = "|" + basis_label(i, num_qubits) + "⟩";
        entry.amplitude = circuit_sim::complex_ops::to_display_string(state[i], 3);
        entry.probability = p;
        entry.phase = circuit_sim::complex_ops::phase(state[i]);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::string format_state(const std::vector<BasisStateEntry>& entries) {
    std::ostringstream oss;
    for (const auto& entry : entries) {
        oss << entry.basis << "  " << entry.amplitude << "  p=" << std::fixed
            << std::setprecision(4) << entry.probability << "\n";
    }
    return oss.str();
}
