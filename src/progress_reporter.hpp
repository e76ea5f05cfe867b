#pragma once

#include "vm/execution_log.types.hpp"

#include <cstddef>

namespace circuit_sim {

// Observer for a circuit replay. The engine calls begin_replay once per
// simulate, operation_applied after each dispatched operation and
// record_log for every log entry it keeps.
class ProgressReporter {
  public:
    virtual ~ProgressReporter() = default;

    virtual void begin_replay(std::size_t total_operations) = 0;
    virtual void operation_applied(int position) = 0;
    virtual void record_log(const ExecutionLog& log) = 0;
};

}  // namespace circuit_sim
