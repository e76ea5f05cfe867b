#include "service/job.hpp"
#include "service/job_validation.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

GateOperation gate(GateKind kind, int qubit, int position = 0) {
    GateOperation op;
    op.kind = kind;
    op.qubit = qubit;
    op.position = position;
    return op;
}

service::JobRequest make_job(int num_qubits, std::vector<GateOperation> ops) {
    service::JobRequest job;
    job.job_id = "validation";
    job.num_qubits = num_qubits;
    job.operations = std::move(ops);
    return job;
}

void expect_failure_mentions(const service::JobRequest& job, const std::string& fragment) {
    service::JobRunner runner;
    const service::JobResult result = runner.run(job);
    EXPECT_EQ(result.status, service::JobStatus::Failed);
    EXPECT_NE(result.message.find(fragment), std::string::npos) << result.message;
    EXPECT_TRUE(result.state_vector.empty());
}

class ValidationTest : public ::testing::Test {
  protected:
    void SetUp() override {
        unsetenv("CIRCUIT_SIM_MAX_QUBITS");
    }
};

}  // namespace

TEST_F(ValidationTest, RejectsOutOfRangeQubit) {
    expect_failure_mentions(make_job(2, {gate(GateKind::H, 0), gate(GateKind::X, 2, 1)}), "references qubit 2");
}

TEST_F(ValidationTest, RejectsNegativeQubit) {
    expect_failure_mentions(make_job(2, {gate(GateKind::H, -1)}), "references qubit -1");
}

TEST_F(ValidationTest, RejectsOutOfRangeTarget) {
    GateOperation cnot = gate(GateKind::CNOT, 0);
    cnot.target_qubit = 3;
    expect_failure_mentions(make_job(2, {cnot}), "references qubit 3");
}

TEST_F(ValidationTest, RejectsRotationWithoutTheta) {
    expect_failure_mentions(make_job(1, {gate(GateKind::RY, 0)}), "requires parameter theta");
}

TEST_F(ValidationTest, RejectsControlledGateWithoutTarget) {
    expect_failure_mentions(make_job(2, {gate(GateKind::CZ, 0)}), "requires a target qubit");
}

TEST_F(ValidationTest, RejectsTargetOnSingleQubitGate) {
    GateOperation h = gate(GateKind::H, 0);
    h.target_qubit = 1;
    expect_failure_mentions(make_job(2, {h}), "does not take a target qubit");
}

TEST_F(ValidationTest, RejectsCoincidentOperands) {
    GateOperation swap = gate(GateKind::SWAP, 1);
    swap.target_qubit = 1;
    expect_failure_mentions(make_job(2, {swap}), "as both operands");
}

TEST_F(ValidationTest, RejectsCircuitOverBudget) {
    service::JobRequest job = make_job(5, {gate(GateKind::H, 0)});
    job.max_qubits = 4;
    expect_failure_mentions(job, "budget is 4");
}

TEST_F(ValidationTest, EnvironmentBudgetApplies) {
    setenv("CIRCUIT_SIM_MAX_QUBITS", "3", 1);
    expect_failure_mentions(make_job(4, {}), "budget is 3");
    unsetenv("CIRCUIT_SIM_MAX_QUBITS");
}

TEST_F(ValidationTest, MalformedEnvironmentBudgetIsIgnored) {
    setenv("CIRCUIT_SIM_MAX_QUBITS", "lots", 1);
    service::JobRunner runner;
    const service::JobResult result = runner.run(make_job(4, {gate(GateKind::H, 3)}));
    EXPECT_EQ(result.status, service::JobStatus::Completed) << result.message;
    unsetenv("CIRCUIT_SIM_MAX_QUBITS");
}

TEST_F(ValidationTest, RejectsNegativeShots) {
    service::JobRequest job = make_job(1, {gate(GateKind::H, 0)});
    job.shots = -3;
    expect_failure_mentions(job, "Shot count");
}

TEST_F(ValidationTest, RejectsBadQueryQubit) {
    service::JobRequest job = make_job(2, {gate(GateKind::H, 0)});
    job.query_qubits = {0, 4};
    expect_failure_mentions(job, "Invalid qubit index 4");
}

TEST(ValidationFactoryTests, ValidatorsThrowTypedErrors) {
    const std::vector<GateOperation> out_of_range = {gate(GateKind::X, 5)};
    EXPECT_THROW(service::make_qubit_range_validator()->validate(2, out_of_range), std::out_of_range);

    const std::vector<GateOperation> missing_theta = {gate(GateKind::RX, 0)};
    EXPECT_THROW(
        service::make_gate_parameters_validator()->validate(1, missing_theta),
        std::invalid_argument);

    GateOperation cz = gate(GateKind::CZ, 0);
    cz.target_qubit = 0;
    EXPECT_THROW(
        service::make_distinct_operands_validator()->validate(1, {cz}),
        std::invalid_argument);

    EXPECT_THROW(service::make_qubit_budget_validator(2)->validate(3, {}), std::invalid_argument);
    EXPECT_NO_THROW(service::make_qubit_budget_validator(2)->validate(2, {}));
}
