#include "service/scheduler.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace service {
namespace {

std::string describe_operands(const GateOperation& op) {
    std::ostringstream oss;
    switch (op.kind) {
        case GateKind::CNOT:
        case GateKind::CZ:
            oss << "control=" << op.qubit << " target=" << *op.target_qubit;
            break;
        case GateKind::SWAP:
            oss << "qubits=" << op.qubit << "," << *op.target_qubit;
            break;
        default:
            oss << "qubit=" << op.qubit;
            break;
    }
    if (op.params.theta) {
        oss << " theta=" << *op.params.theta;
    }
    return oss.str();
}

}  // namespace

SchedulerResult schedule_operations(const std::vector<GateOperation>& operations) {
    SchedulerResult result;
    result.operations = operations;
    std::stable_sort(
        result.operations.begin(),
        result.operations.end(),
        [](const GateOperation& a, const GateOperation& b) { return a.position < b.position; });

    result.timeline.reserve(result.operations.size());
    for (const auto& op : result.operations) {
        TimelineEntry entry;
        entry.start_time = static_cast<double>(op.position);
        entry.duration = 1.0;
        entry.op = gate_kind_name(op.kind);
        entry.detail = op.target_qubit || gate_arity(op.kind) == 1 ? describe_operands(op) : "";
        entry.qubits = operands_of(op);
        result.timeline.push_back(std::move(entry));
    }
    return result;
}

}  // namespace service
