#include "engine_statevector.hpp"
#include "state_summary.hpp"

#include <iomanip>
#include <iostream>
#include <random>

int main() {
    StatevectorEngine engine(engine_config_from_env());

    Circuit circuit;
    circuit.num_qubits = 2;
    GateOperation h;
    h.kind = GateKind::H;
    h.qubit = 0;
    GateOperation cnot;
    cnot.kind = GateKind::CNOT;
    cnot.qubit = 0;
    cnot.target_qubit = 1;
    circuit = circuit.add(h).add(cnot);

    const SimulationResult result = engine.simulate(circuit);

    std::cout << "Final state:\n"
              << format_state(summarize_state(result.state_vector, circuit.num_qubits));

    std::cout << "Bloch coordinates:\n";
    const auto bloch = engine.bloch_states();
    for (std::size_t q = 0; q < bloch.size(); ++q) {
        std::cout << "  q" << q << ": x=" << std::fixed << std::setprecision(3) << bloch[q].x
                  << " y=" << bloch[q].y << " z=" << bloch[q].z
                  << " purity=" << bloch[q].purity << '\n';
    }

    std::mt19937_64 rng(std::random_device{}());
    StdRandomStream stream(rng);
    std::cout << "Counts (1024 shots):\n";
    for (const auto& [outcome, count] : engine.sample_counts(1024, stream)) {
        std::cout << "  " << outcome << ": " << count << '\n';
    }

    return 0;
}
