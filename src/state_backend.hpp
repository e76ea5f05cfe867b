#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "complex_ops.hpp"
#include "gate_library.hpp"

// Bit of `qubit` inside a basis index. Qubit 0 is the most-significant bit.
inline std::size_t qubit_mask(int num_qubits, int qubit) {
    return static_cast<std::size_t>(1) << (num_qubits - 1 - qubit);
}

// 2^num_qubits. Throws std::invalid_argument when the count is negative or
// the dimension does not fit in std::size_t.
inline std::size_t state_dimension(int num_qubits) {
    if (num_qubits < 0 || num_qubits >= static_cast<int>(sizeof(std::size_t) * 8)) {
        throw std::invalid_argument("Unsupported qubit count " + std::to_string(num_qubits));
    }
    return static_cast<std::size_t>(1) << num_qubits;
}

class StateBackend {
  public:
    virtual ~StateBackend() = default;

    // Replace the amplitudes with |0...0> over `n` qubits.
    virtual void alloc_array(int n) = 0;
    virtual int num_qubits() const = 0;

    virtual std::vector<Amplitude>& state() = 0;
    virtual const std::vector<Amplitude>& state() const = 0;

    virtual void apply_single_qubit_unitary(int q, const Matrix2& U) = 0;

    virtual void apply_two_qubit_unitary(int q0, int q1, const Matrix4& U) = 0;

    virtual void apply_controlled_not(int control, int target) = 0;
    virtual void apply_controlled_z(int control, int target) = 0;
    virtual void apply_swap(int q0, int q1) = 0;
};
