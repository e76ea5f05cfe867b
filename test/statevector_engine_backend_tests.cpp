#include "engine_statevector.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TrackingBackend : StateBackend {
  public:
    std::vector<std::string> calls;

    void alloc_array(int n) override {
        calls.push_back("alloc:" + std::to_string(n));
        n_qubits_ = n;
        const std::size_t dim = static_cast<std::size_t>(1) << n;
        host_state_.assign(dim, Amplitude{0.0, 0.0});
        host_state_[0] = Amplitude{1.0, 0.0};
    }

    int num_qubits() const override {
        return n_qubits_;
    }

    std::vector<Amplitude>& state() override {
        return host_state_;
    }

    const std::vector<Amplitude>& state() const override {
        return host_state_;
    }

    void apply_single_qubit_unitary(int q, const Matrix2&) override {
        calls.push_back("single:" + std::to_string(q));
    }

    void apply_two_qubit_unitary(int q0, int q1, const Matrix4&) override {
        calls.push_back("dense:" + std::to_string(q0) + "," + std::to_string(q1));
    }

    void apply_controlled_not(int control, int target) override {
        calls.push_back("cnot:" + std::to_string(control) + "," + std::to_string(target));
    }

    void apply_controlled_z(int control, int target) override {
        calls.push_back("cz:" + std::to_string(control) + "," + std::to_string(target));
    }

    void apply_swap(int q0, int q1) override {
        calls.push_back("swap:" + std::to_string(q0) + "," + std::to_string(q1));
    }

  private:
    std::vector<Amplitude> host_state_;
    int n_qubits_ = 0;
};

GateOperation op(GateKind kind, int qubit, int position) {
    GateOperation out;
    out.kind = kind;
    out.qubit = qubit;
    out.position = position;
    return out;
}

GateOperation two_qubit(GateKind kind, int qubit, int target, int position) {
    GateOperation out = op(kind, qubit, position);
    out.target_qubit = target;
    return out;
}

}  // namespace

TEST(StatevectorEngineBackend, StructuralGatesBypassDensePath) {
    auto backend = std::make_unique<TrackingBackend>();
    auto* tracker = backend.get();
    StatevectorEngine engine(EngineConfig{}, std::move(backend));

    engine.reset(3);
    const std::vector<GateOperation> ops = {
        two_qubit(GateKind::CNOT, 0, 1, 1),
        two_qubit(GateKind::CZ, 1, 2, 2),
        two_qubit(GateKind::SWAP, 0, 2, 3),
        op(GateKind::H, 0, 0),
    };
    engine.simulate(ops);

    const std::vector<std::string> expected = {
        "alloc:0",
        "alloc:3",
        "alloc:3",
        "single:0",
        "cnot:0,1",
        "cz:1,2",
        "swap:0,2",
    };
    EXPECT_EQ(tracker->calls, expected);
}

TEST(StatevectorEngineBackend, MeasurementMarkerNeverReachesBackend) {
    auto backend = std::make_unique<TrackingBackend>();
    auto* tracker = backend.get();
    StatevectorEngine engine(EngineConfig{}, std::move(backend));
    engine.reset(2);
    tracker->calls.clear();

    engine.apply_gate_operation(op(GateKind::MEASURE, 1, 0));

    EXPECT_TRUE(tracker->calls.empty());
    ASSERT_FALSE(engine.logs().empty());
    EXPECT_EQ(engine.logs().back().category, "MeasureMarker");
}

TEST(StatevectorEngineBackend, RejectedCircuitDoesNotResetBackend) {
    auto backend = std::make_unique<TrackingBackend>();
    auto* tracker = backend.get();
    StatevectorEngine engine(EngineConfig{}, std::move(backend));
    engine.reset(2);
    tracker->calls.clear();

    const std::vector<GateOperation> ops = {op(GateKind::H, 0, 0), op(GateKind::X, 2, 1)};
    EXPECT_THROW(engine.simulate(ops), std::out_of_range);
    EXPECT_TRUE(tracker->calls.empty());
}
