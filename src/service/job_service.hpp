#pragma once

#include "service/job.hpp"

#include "progress_reporter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Progress sink shared by a job's worker thread and status queries. Keeps
// the last kMaxLogs log entries.
class JobProgressReporter final : public circuit_sim::ProgressReporter {
  public:
    static constexpr std::size_t kMaxLogs = 16;

    void begin_replay(std::size_t total_operations) override;
    void operation_applied(int position) override;
    void record_log(const ExecutionLog& log) override;

    // Fraction of operations applied in [0, 1]; 0 before the replay starts.
    double fraction_complete() const;
    int last_position() const;
    std::vector<ExecutionLog> recent_logs() const;

  private:
    mutable std::mutex mutex_;
    std::deque<ExecutionLog> logs_;
    std::size_t total_operations_ = 0;
    std::size_t applied_operations_ = 0;
    int last_position_ = -1;
};

namespace service {

struct JobStatusSnapshot {
    JobStatus status = JobStatus::Pending;
    double percent_complete = 0.0;
    int last_position = -1;
    std::string message;
    std::vector<ExecutionLog> recent_logs;
};

// In-process asynchronous front end over JobRunner. Every submitted job runs
// on its own detached thread with its own engine.
class JobService {
  public:
    JobService() = default;

    // Returns the generated "job-<n>" ID, which replaces any ID on `job`.
    std::string submit(JobRequest job);

    // Final result once the job has completed or failed.
    std::optional<JobResult> poll_result(const std::string& job_id) const;

    // Blocks until the job finishes or `timeout` elapses.
    std::optional<JobResult> wait(
        const std::string& job_id,
        std::chrono::milliseconds timeout
    ) const;

    // Unknown IDs report Failed with message "job_id not found".
    JobStatusSnapshot status(const std::string& job_id) const;

  private:
    struct JobEntry {
        JobRequest request;
        JobResult result;
        JobProgressReporter reporter;
        std::atomic<JobStatus> status{JobStatus::Pending};
        mutable std::mutex result_mutex;
        mutable std::condition_variable finished;
    };

    std::shared_ptr<JobEntry> find(const std::string& job_id) const;
    static bool is_terminal(JobStatus status);
    static void execute(const std::shared_ptr<JobEntry>& entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::atomic<std::uint64_t> id_counter_{0};
};

}  // namespace service
