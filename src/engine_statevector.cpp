#include "engine_statevector.hpp"

#include "progress_reporter.hpp"
#include "sampling.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace {

std::string format_qubits(const std::vector<int>& qubits) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < qubits.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << qubits[i];
    }
    oss << "]";
    return oss.str();
}

std::string describe(const GateOperation& op) {
    std::ostringstream oss;
    oss << gate_kind_name(op.kind) << " qubits=" << format_qubits(operands_of(op));
    if (op.params.theta) {
        oss << " theta=" << *op.params.theta;
    }
    return oss.str();
}

void check_qubit_index(int qubit, int num_qubits) {
    if (qubit < 0 || qubit >= num_qubits) {
        throw std::out_of_range("Invalid qubit index " + std::to_string(qubit));
    }
}

}  // namespace

StatevectorEngine::StatevectorEngine(EngineConfig cfg, std::unique_ptr<StateBackend> backend)
    : config_(cfg),
      backend_(backend ? std::move(backend) : std::make_unique<CpuStateBackend>()) {
    backend_->alloc_array(0);
}

void StatevectorEngine::set_progress_reporter(circuit_sim::ProgressReporter* reporter) {
    progress_reporter_ = reporter;
}

void StatevectorEngine::log_event(
    const std::string& category,
    const std::string& message,
    int position
) {
    if (!config_.emit_logs) {
        return;
    }
    logs_.push_back(ExecutionLog{step_, position, category, message});
    if (progress_reporter_) {
        progress_reporter_->record_log(logs_.back());
    }
}

void StatevectorEngine::check_qubit_count(int num_qubits) const {
    if (num_qubits < 0) {
        throw std::invalid_argument("Qubit count must be non-negative");
    }
    if (config_.max_qubits > 0 && num_qubits > config_.max_qubits) {
        throw std::invalid_argument(
            "Qubit count " + std::to_string(num_qubits) + " exceeds budget of " +
            std::to_string(config_.max_qubits));
    }
}

void StatevectorEngine::check_operation(const GateOperation& op, int num_qubits) const {
    if (gate_arity(op.kind) == 2) {
        if (!op.target_qubit) {
            throw std::invalid_argument(gate_kind_name(op.kind) + " requires a target qubit");
        }
        check_qubit_index(op.qubit, num_qubits);
        check_qubit_index(*op.target_qubit, num_qubits);
        if (op.qubit == *op.target_qubit) {
            throw std::invalid_argument(gate_kind_name(op.kind) + " requires distinct qubits");
        }
        return;
    }
    check_qubit_index(op.qubit, num_qubits);
    if (is_rotation(op.kind) && !op.params.theta) {
        throw std::invalid_argument(gate_kind_name(op.kind) + " requires parameter theta");
    }
}

void StatevectorEngine::reset(int num_qubits) {
    check_qubit_count(num_qubits);
    backend_->alloc_array(num_qubits);
    logs_.clear();
    step_ = 0;
    log_event("Reset", "num_qubits=" + std::to_string(num_qubits));
}

void StatevectorEngine::apply_single_qubit_gate(GateKind kind, int qubit, const GateParams& params) {
    GateOperation op;
    op.kind = kind;
    op.qubit = qubit;
    op.params = params;
    if (gate_arity(kind) != 1 || kind == GateKind::MEASURE) {
        throw std::invalid_argument("Gate " + gate_kind_name(kind) + " is not a single-qubit unitary");
    }
    check_operation(op, backend_->num_qubits());
    dispatch(op);
}

void StatevectorEngine::apply_controlled_not(int control, int target) {
    GateOperation op;
    op.kind = GateKind::CNOT;
    op.qubit = control;
    op.target_qubit = target;
    apply_gate_operation(op);
}

void StatevectorEngine::apply_controlled_z(int control, int target) {
    GateOperation op;
    op.kind = GateKind::CZ;
    op.qubit = control;
    op.target_qubit = target;
    apply_gate_operation(op);
}

void StatevectorEngine::apply_swap(int qubit_a, int qubit_b) {
    GateOperation op;
    op.kind = GateKind::SWAP;
    op.qubit = qubit_a;
    op.target_qubit = qubit_b;
    apply_gate_operation(op);
}

void StatevectorEngine::apply_gate_operation(const GateOperation& op) {
    check_operation(op, backend_->num_qubits());
    dispatch(op);
}

// Callers have already run check_operation.
void StatevectorEngine::dispatch(const GateOperation& op) {
    const GateAction action = gate_action(op.kind, op.params);
    ++step_;
    if (const auto* matrix = std::get_if<Matrix2>(&action)) {
        backend_->apply_single_qubit_unitary(op.qubit, *matrix);
        log_event("ApplyGate", describe(op), op.position);
        return;
    }
    if (const auto* rule = std::get_if<StructuralRule>(&action)) {
        const int target = *op.target_qubit;
        switch (*rule) {
            case StructuralRule::ControlledNot:
                backend_->apply_controlled_not(op.qubit, target);
                break;
            case StructuralRule::ControlledZ:
                backend_->apply_controlled_z(op.qubit, target);
                break;
            case StructuralRule::Swap:
                backend_->apply_swap(op.qubit, target);
                break;
        }
        log_event("ApplyGate", describe(op), op.position);
        return;
    }
    log_event("MeasureMarker", describe(op), op.position);
}

SimulationResult StatevectorEngine::replay(
    int num_qubits,
    const std::vector<GateOperation>& operations
) {
    check_qubit_count(num_qubits);
    for (const auto& op : operations) {
        check_operation(op, num_qubits);
        static_cast<void>(gate_action(op.kind, op.params));
    }

    std::vector<GateOperation> ordered = operations;
    std::stable_sort(ordered.begin(), ordered.end(), [](const GateOperation& a, const GateOperation& b) {
        return a.position < b.position;
    });

    reset(num_qubits);
    if (progress_reporter_) {
        progress_reporter_->begin_replay(ordered.size());
    }
    for (const auto& op : ordered) {
        dispatch(op);
        if (progress_reporter_) {
            progress_reporter_->operation_applied(op.position);
        }
    }
    if (!norm_within_tolerance(backend_->state(), config_.norm_tolerance)) {
        std::ostringstream oss;
        oss << "total_probability=" << total_probability(backend_->state())
            << " tolerance=" << config_.norm_tolerance;
        log_event("NormDrift", oss.str());
    }
    log_event("Simulate", "operations=" + std::to_string(ordered.size()));

    SimulationResult result;
    result.state_vector = backend_->state();
    result.probabilities = ::probabilities(result.state_vector);
    return result;
}

SimulationResult StatevectorEngine::simulate(const std::vector<GateOperation>& operations) {
    return replay(backend_->num_qubits(), operations);
}

SimulationResult StatevectorEngine::simulate(const Circuit& circuit) {
    return replay(circuit.num_qubits, circuit.operations);
}

int StatevectorEngine::num_qubits() const {
    return backend_->num_qubits();
}

const std::vector<Amplitude>& StatevectorEngine::state_vector() const {
    return backend_->state();
}

std::vector<double> StatevectorEngine::probabilities() const {
    return ::probabilities(backend_->state());
}

ReducedQubitState StatevectorEngine::reduce_qubit(int qubit) const {
    return ::reduce_qubit(backend_->state(), backend_->num_qubits(), qubit);
}

std::vector<ReducedQubitState> StatevectorEngine::bloch_states() const {
    std::vector<ReducedQubitState> out;
    const int n = backend_->num_qubits();
    out.reserve(static_cast<std::size_t>(n));
    for (int q = 0; q < n; ++q) {
        out.push_back(reduce_qubit(q));
    }
    return out;
}

std::string StatevectorEngine::sample_one(RandomStream& rng) const {
    return ::sample_one(backend_->state(), backend_->num_qubits(), rng);
}

std::map<std::string, int> StatevectorEngine::sample_counts(int shots, RandomStream& rng) const {
    return ::sample_counts(backend_->state(), backend_->num_qubits(), shots, rng);
}
