#pragma once

#include <string>
#include <vector>

namespace service {

// One scheduled operation. Times are in position steps: an operation at
// position p occupies [p, p + 1).
struct TimelineEntry {
    double start_time = 0.0;
    double duration = 0.0;
    std::string op;
    std::string detail;
    std::vector<int> qubits;
};

inline bool operator==(const TimelineEntry& lhs, const TimelineEntry& rhs) {
    return lhs.start_time == rhs.start_time &&
           lhs.duration == rhs.duration &&
           lhs.op == rhs.op &&
           lhs.detail == rhs.detail &&
           lhs.qubits == rhs.qubits;
}

}  // namespace service
