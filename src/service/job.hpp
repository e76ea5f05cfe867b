#pragma once

#include "partial_trace.hpp"
#include "progress_reporter.hpp"
#include "service/timeline.hpp"
#include "vm/execution_log.types.hpp"
#include "vm/gate_ops.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace service {

enum class JobStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

struct JobRequest {
    std::string job_id;
    int num_qubits = 0;
    std::vector<GateOperation> operations;
    int shots = 0;                      // 0 skips sampling
    std::optional<std::uint64_t> seed;  // unset draws from std::random_device
    int max_qubits = 0;                 // 0 defers to CIRCUIT_SIM_MAX_QUBITS
    std::vector<int> query_qubits;      // empty reduces every qubit
    std::map<std::string, std::string> metadata;
};

struct QubitReduction {
    int qubit = 0;
    ReducedQubitState state;
};

struct JobResult {
    std::string job_id;
    JobStatus status = JobStatus::Pending;
    std::vector<Amplitude> state_vector;
    std::vector<double> probabilities;
    std::vector<QubitReduction> reduced_states;
    std::map<std::string, int> counts;
    std::vector<TimelineEntry> timeline;
    std::vector<ExecutionLog> logs;
    double elapsed_time = 0.0;
    std::string message;
};

std::string to_json(const JobRequest& job);
std::string to_json(const JobResult& result);
std::string status_to_string(JobStatus status);

class JobRunner {
  public:
    // Never throws; validation and simulation errors yield a Failed result.
    JobResult run(
        const JobRequest& job,
        circuit_sim::ProgressReporter* reporter = nullptr
    );
};

}  // namespace service
