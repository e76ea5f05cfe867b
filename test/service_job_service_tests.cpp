#include "service/job_service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

using service::JobRequest;
using service::JobResult;
using service::JobService;
using service::JobStatus;

namespace {

JobRequest make_simple_job() {
    JobRequest job;
    job.num_qubits = 1;
    job.shots = 16;
    job.seed = 3;
    GateOperation h;
    h.kind = GateKind::H;
    h.qubit = 0;
    GateOperation m;
    m.kind = GateKind::MEASURE;
    m.qubit = 0;
    m.position = 1;
    job.operations = {h, m};
    return job;
}

constexpr std::chrono::milliseconds kTimeout{5000};

}  // namespace

TEST(ServiceJobServiceTests, SubmitsAsyncJobAndReturnsResult) {
    JobService service;
    JobRequest job = make_simple_job();

    const std::string job_id = service.submit(job);
    ASSERT_FALSE(job_id.empty());

    auto snapshot = service.status(job_id);
    EXPECT_TRUE(snapshot.status == JobStatus::Pending ||
                snapshot.status == JobStatus::Running ||
                snapshot.status == JobStatus::Completed);

    const std::optional<JobResult> result = service.wait(job_id, kTimeout);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Completed);
    EXPECT_EQ(result->job_id, job_id);
    EXPECT_EQ(result->state_vector.size(), 2u);

    int total = 0;
    for (const auto& entry : result->counts) {
        total += entry.second;
    }
    EXPECT_EQ(total, 16);

    snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, JobStatus::Completed);
    EXPECT_DOUBLE_EQ(snapshot.percent_complete, 1.0);
    EXPECT_EQ(snapshot.last_position, 1);
    ASSERT_FALSE(snapshot.recent_logs.empty());
    EXPECT_EQ(snapshot.recent_logs.back().category, "Simulate");

    const std::optional<JobResult> polled = service.poll_result(job_id);
    ASSERT_TRUE(polled.has_value());
    EXPECT_EQ(polled->counts, result->counts);
}

TEST(ServiceJobServiceTests, AssignsDistinctJobIds) {
    JobService service;
    const std::string first = service.submit(make_simple_job());
    const std::string second = service.submit(make_simple_job());
    EXPECT_NE(first, second);
    EXPECT_TRUE(service.wait(first, kTimeout).has_value());
    EXPECT_TRUE(service.wait(second, kTimeout).has_value());
}

TEST(ServiceJobServiceTests, InvalidJobEndsFailed) {
    JobService service;
    JobRequest job = make_simple_job();
    job.operations[0].qubit = 7;

    const std::string job_id = service.submit(job);
    const std::optional<JobResult> result = service.wait(job_id, kTimeout);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::Failed);
    EXPECT_NE(result->message.find("references qubit 7"), std::string::npos);

    const auto snapshot = service.status(job_id);
    EXPECT_EQ(snapshot.status, JobStatus::Failed);
    EXPECT_EQ(snapshot.message, result->message);
}

TEST(ServiceJobServiceTests, UnknownJobIdReportsFailure) {
    JobService service;
    const auto snapshot = service.status("job-missing");
    EXPECT_EQ(snapshot.status, JobStatus::Failed);
    EXPECT_EQ(snapshot.message, "job_id not found");
    EXPECT_FALSE(service.poll_result("job-missing").has_value());
}

TEST(ServiceJobServiceTests, WaitOnUnknownJobReturnsNothing) {
    JobService service;
    EXPECT_FALSE(service.wait("job-missing", std::chrono::milliseconds(1)).has_value());
}

TEST(JobProgressReporterTests, KeepsMostRecentLogs) {
    JobProgressReporter reporter;
    EXPECT_DOUBLE_EQ(reporter.fraction_complete(), 0.0);
    reporter.begin_replay(4);
    reporter.operation_applied(0);
    reporter.operation_applied(2);
    EXPECT_DOUBLE_EQ(reporter.fraction_complete(), 0.5);
    EXPECT_EQ(reporter.last_position(), 2);

    for (int i = 0; i < 20; ++i) {
        reporter.record_log(ExecutionLog{i, i, "ApplyGate", "op " + std::to_string(i)});
    }
    const auto logs = reporter.recent_logs();
    ASSERT_EQ(logs.size(), JobProgressReporter::kMaxLogs);
    EXPECT_EQ(logs.front().step, 4);
    EXPECT_EQ(logs.back().step, 19);
}
