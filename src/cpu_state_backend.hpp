#pragma once

#include <cstddef>
#include <vector>

#include "state_backend.hpp"

class CpuStateBackend : public StateBackend {
  public:
    CpuStateBackend() = default;

    void alloc_array(int n) override;
    int num_qubits() const override;

    std::vector<Amplitude>& state() override;
    const std::vector<Amplitude>& state() const override;

    void apply_single_qubit_unitary(int q, const Matrix2& U) override;

    void apply_two_qubit_unitary(int q0, int q1, const Matrix4& U) override;

    void apply_controlled_not(int control, int target) override;
    void apply_controlled_z(int control, int target) override;
    void apply_swap(int q0, int q1) override;

  private:
    void check_qubit(int q) const;
    void check_pair(int q0, int q1) const;

    int n_qubits_{0};
    std::vector<Amplitude> state_{Amplitude{1.0, 0.0}};
};
