#pragma once

#include <optional>
#include <vector>

#include "vm/gate_ops.hpp"

// Value-type circuit: a qubit count plus the operations placed on it.
// Mutating helpers return a new Circuit.
struct Circuit {
    int num_qubits = 0;
    std::vector<GateOperation> operations;

    // Appends `op`. When `position` is empty the operation is placed at the
    // first free position on every qubit it touches.
    Circuit add(GateOperation op, std::optional<int> position = std::nullopt) const;

    // Drops operations referencing qubits >= n.
    Circuit with_num_qubits(int n) const;

    int depth() const;
    std::vector<GateOperation> operations_at(int position) const;
    std::vector<GateOperation> operations_on(int qubit) const;
    int next_position_for(int qubit) const;
};
