#pragma once

#include <vector>

#include "service/timeline.hpp"
#include "vm/gate_ops.hpp"

namespace service {

struct SchedulerResult {
    std::vector<GateOperation> operations;  // application order
    std::vector<TimelineEntry> timeline;
};

// Stable sort by position. Operations sharing a position keep their input
// order; overlapping qubits at one position are not diagnosed.
SchedulerResult schedule_operations(const std::vector<GateOperation>& operations);

}  // namespace service
