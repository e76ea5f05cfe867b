#include "service/job_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

void JobProgressReporter::begin_replay(std::size_t total_operations) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_operations_ = total_operations;
    applied_operations_ = 0;
}

void JobProgressReporter::operation_applied(int position) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++applied_operations_;
    last_position_ = position;
}

void JobProgressReporter::record_log(const ExecutionLog& log) {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_.push_back(log);
    while (logs_.size() > kMaxLogs) {
        logs_.pop_front();
    }
}

double JobProgressReporter::fraction_complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (total_operations_ == 0) {
        return 0.0;
    }
    return std::min(
        1.0,
        static_cast<double>(applied_operations_) / static_cast<double>(total_operations_));
}

int JobProgressReporter::last_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_position_;
}

std::vector<ExecutionLog> JobProgressReporter::recent_logs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {logs_.begin(), logs_.end()};
}

namespace service {

bool JobService::is_terminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

std::shared_ptr<JobService::JobEntry> JobService::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        return nullptr;
    }
    return it->second;
}

void JobService::execute(const std::shared_ptr<JobEntry>& entry) {
    entry->status.store(JobStatus::Running, std::memory_order_relaxed);
    JobResult result;
    try {
        JobRunner runner;
        result = runner.run(entry->request, &entry->reporter);
    } catch (const std::exception& ex) {
        result.job_id = entry->request.job_id;
        result.status = JobStatus::Failed;
        result.message = ex.what();
    }
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        entry->result = std::move(result);
        entry->status.store(entry->result.status, std::memory_order_release);
    }
    entry->finished.notify_all();
}

std::string JobService::submit(JobRequest job) {
    const std::uint64_t seq = id_counter_.fetch_add(1, std::memory_order_relaxed);
    const std::string job_id = "job-" + std::to_string(seq);
    job.job_id = job_id;

    auto entry = std::make_shared<JobEntry>();
    entry->request = std::move(job);
    entry->result.job_id = job_id;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.emplace(job_id, entry);
    }

    // The worker holds its own reference, so the entry outlives the service
    // if the caller drops it early.
    std::thread worker([entry]() { execute(entry); });
    worker.detach();

    return job_id;
}

std::optional<JobResult> JobService::poll_result(const std::string& job_id) const {
    const auto entry = find(job_id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    if (!is_terminal(entry->status.load(std::memory_order_acquire))) {
        return std::nullopt;
    }
    return entry->result;
}

std::optional<JobResult> JobService::wait(
    const std::string& job_id,
    std::chrono::milliseconds timeout
) const {
    const auto entry = find(job_id);
    if (!entry) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(entry->result_mutex);
    const bool done = entry->finished.wait_for(lock, timeout, [&entry]() {
        return is_terminal(entry->status.load(std::memory_order_acquire));
    });
    if (!done) {
        return std::nullopt;
    }
    return entry->result;
}

JobStatusSnapshot JobService::status(const std::string& job_id) const {
    JobStatusSnapshot snapshot;
    const auto entry = find(job_id);
    if (!entry) {
        snapshot.status = JobStatus::Failed;
        snapshot.message = "job_id not found";
        return snapshot;
    }
    snapshot.status = entry->status.load(std::memory_order_acquire);
    snapshot.percent_complete = snapshot.status == JobStatus::Completed
        ? 1.0
        : entry->reporter.fraction_complete();
    snapshot.last_position = entry->reporter.last_position();
    snapshot.recent_logs = entry->reporter.recent_logs();
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        snapshot.message = entry->result.message;
    }
    return snapshot;
}

}  // namespace service
