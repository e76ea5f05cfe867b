#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "circuit.hpp"
#include "complex_ops.hpp"
#include "cpu_state_backend.hpp"
#include "engine_config.hpp"
#include "gate_library.hpp"
#include "partial_trace.hpp"
#include "random_stream.hpp"
#include "vm/execution_log.types.hpp"
#include "vm/gate_ops.hpp"

namespace circuit_sim {
class ProgressReporter;
}

// Exact state-vector simulator. Owns one amplitude vector through a
// StateBackend; every replay starts from |0...0>.

struct SimulationResult {
    std::vector<Amplitude> state_vector;
    std::vector<double> probabilities;
};

class StatevectorEngine {
  public:
    explicit StatevectorEngine(
        EngineConfig cfg = EngineConfig{},
        std::unique_ptr<StateBackend> backend = nullptr
    );

    void set_progress_reporter(circuit_sim::ProgressReporter* reporter);

    // Reinitializes to |0...0> over `num_qubits` qubits. Throws
    // std::invalid_argument for a negative count or one above the budget.
    void reset(int num_qubits);

    void apply_single_qubit_gate(GateKind kind, int qubit, const GateParams& params = {});
    void apply_controlled_not(int control, int target);
    void apply_controlled_z(int control, int target);
    void apply_swap(int qubit_a, int qubit_b);

    // Dispatches one record to the primitives above. Measurement markers are
    // logged and leave the state untouched.
    void apply_gate_operation(const GateOperation& op);

    // Validates every operation, resets, then applies them in stable
    // ascending `position` order. A rejected list leaves the state as it was.
    // A final norm outside config().norm_tolerance is logged as "NormDrift".
    SimulationResult simulate(const std::vector<GateOperation>& operations);
    SimulationResult simulate(const Circuit& circuit);

    int num_qubits() const;
    const std::vector<Amplitude>& state_vector() const;
    std::vector<double> probabilities() const;
    ReducedQubitState reduce_qubit(int qubit) const;
    std::vector<ReducedQubitState> bloch_states() const;
    std::string sample_one(RandomStream& rng) const;
    std::map<std::string, int> sample_counts(int shots, RandomStream& rng) const;

    const std::vector<ExecutionLog>& logs() const { return logs_; }
    const EngineConfig& config() const { return config_; }

  private:
    EngineConfig config_;
    std::unique_ptr<StateBackend> backend_;
    std::vector<ExecutionLog> logs_;
    int step_ = 0;
    circuit_sim::ProgressReporter* progress_reporter_ = nullptr;

    void log_event(const std::string& category, const std::string& message, int position = -1);
    void check_qubit_count(int num_qubits) const;
    void check_operation(const GateOperation& op, int num_qubits) const;
    void dispatch(const GateOperation& op);
    SimulationResult replay(int num_qubits, const std::vector<GateOperation>& operations);
};
