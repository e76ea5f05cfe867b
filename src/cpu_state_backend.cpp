#include "cpu_state_backend.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

void CpuStateBackend::alloc_array(int n) {
    if (n < 0) {
        throw std::invalid_argument("Qubit count must be non-negative");
    }
    if (n >= static_cast<int>(sizeof(std::size_t) * 8)) {
        throw std::runtime_error("Requested qubit count exceeds addressable space");
    }
    n_qubits_ = n;
    const std::size_t dim = static_cast<std::size_t>(1) << n;
    state_.assign(dim, Amplitude{0.0, 0.0});
    state_[0] = Amplitude{1.0, 0.0};
}

int CpuStateBackend::num_qubits() const {
    return n_qubits_;
}

std::vector<Amplitude>& CpuStateBackend::state() {
    return state_;
}

const std::vector<Amplitude>& CpuStateBackend::state() const {
    return state_;
}

void CpuStateBackend::check_qubit(int q) const {
    if (q < 0 || q >= n_qubits_) {
        throw std::out_of_range("Invalid qubit index " + std::to_string(q));
    }
}

void CpuStateBackend::check_pair(int q0, int q1) const {
    check_qubit(q0);
    check_qubit(q1);
    if (q0 == q1) {
        throw std::invalid_argument("Two-qubit gate requires distinct qubits");
    }
}

// Scatter form: every input amplitude contributes to both values of the
// target bit, accumulated into a fresh vector.
void CpuStateBackend::apply_single_qubit_unitary(int q, const Matrix2& U) {
    check_qubit(q);
    const std::size_t dim = state_.size();
    const std::size_t mask = qubit_mask(n_qubits_, q);
    std::vector<Amplitude> next(dim, Amplitude{0.0, 0.0});
    for (std::size_t i = 0; i < dim; ++i) {
        const std::size_t bit = (i & mask) ? 1 : 0;
        const std::size_t cleared = i & ~mask;
        next[cleared] += U[bit] * state_[i];
        next[cleared | mask] += U[2 + bit] * state_[i];
    }
    state_.swap(next);
}

void CpuStateBackend::apply_two_qubit_unitary(int q0, int q1, const Matrix4& U) {
    check_pair(q0, q1);
    const std::size_t dim = state_.size();
    const std::size_t b0 = qubit_mask(n_qubits_, q0);
    const std::size_t b1 = qubit_mask(n_qubits_, q1);

    for (std::size_t i = 0; i < dim; ++i) {
        if (((i & b0) == 0) && ((i & b1) == 0)) {
            const std::size_t i01 = i | b1;
            const std::size_t i10 = i | b0;
            const std::size_t i11 = i | b0 | b1;

            const std::array<Amplitude, 4> in = {state_[i], state_[i01], state_[i10], state_[i11]};
            std::array<Amplitude, 4> out{};

            for (int row = 0; row < 4; ++row) {
                out[row] = Amplitude{0.0, 0.0};
                for (int col = 0; col < 4; ++col) {
                    out[row] += U[4 * row + col] * in[col];
                }
            }

            state_[i] = out[0];
            state_[i01] = out[1];
            state_[i10] = out[2];
            state_[i11] = out[3];
        }
    }
}

void CpuStateBackend::apply_controlled_not(int control, int target) {
    check_pair(control, target);
    const std::size_t dim = state_.size();
    const std::size_t cm = qubit_mask(n_qubits_, control);
    const std::size_t tm = qubit_mask(n_qubits_, target);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & cm) && !(i & tm)) {
            std::swap(state_[i], state_[i | tm]);
        }
    }
}

void CpuStateBackend::apply_controlled_z(int control, int target) {
    check_pair(control, target);
    const std::size_t dim = state_.size();
    const std::size_t cm = qubit_mask(n_qubits_, control);
    const std::size_t tm = qubit_mask(n_qubits_, target);
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & cm) && (i & tm)) {
            state_[i] = -state_[i];
        }
    }
}

void CpuStateBackend::apply_swap(int q0, int q1) {
    check_pair(q0, q1);
    const std::size_t dim = state_.size();
    const std::size_t m0 = qubit_mask(n_qubits_, q0);
    const std::size_t m1 = qubit_mask(n_qubits_, q1);
    // Each index with bits (1, 0) trades places with its (0, 1) partner.
    for (std::size_t i = 0; i < dim; ++i) {
        if ((i & m0) && !(i & m1)) {
            std::swap(state_[i], state_[(i & ~m0) | m1]);
        }
    }
}
