#include "circuit.hpp"

#include <algorithm>
#include <utility>

namespace {

bool touches(const GateOperation& op, int qubit) {
    return op.qubit == qubit || (op.target_qubit && *op.target_qubit == qubit);
}

}  // namespace

Circuit Circuit::add(GateOperation op, std::optional<int> position) const {
    if (position) {
        op.position = *position;
    } else {
        int next = 0;
        for (int q : operands_of(op)) {
            next = std::max(next, next_position_for(q));
        }
        op.position = next;
    }
    Circuit out = *this;
    out.operations.push_back(std::move(op));
    return out;
}

Circuit Circuit::with_num_qubits(int n) const {
    Circuit out;
    out.num_qubits = n;
    for (const auto& op : operations) {
        const auto qubits = operands_of(op);
        const bool fits = std::all_of(qubits.begin(), qubits.end(), [n](int q) { return q < n; });
        if (fits) {
            out.operations.push_back(op);
        }
    }
    return out;
}

int Circuit::depth() const {
    int depth = 0;
    for (const auto& op : operations) {
        depth = std::max(depth, op.position + 1);
    }
    return depth;
}

std::vector<GateOperation> Circuit::operations_at(int position) const {
    std::vector<GateOperation> out;
    for (const auto& op : operations) {
        if (op.position == position) {
            out.push_back(op);
        }
    }
    return out;
}

std::vector<GateOperation> Circuit::operations_on(int qubit) const {
    std::vector<GateOperation> out;
    for (const auto& op : operations) {
        if (touches(op, qubit)) {
            out.push_back(op);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const GateOperation& a, const GateOperation& b) {
        return a.position < b.position;
    });
    return out;
}

int Circuit::next_position_for(int qubit) const {
    int next = 0;
    for (const auto& op : operations) {
        if (touches(op, qubit)) {
            next = std::max(next, op.position + 1);
        }
    }
    return next;
}
