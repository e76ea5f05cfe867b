#pragma once

#include "vm/gate_ops.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace service {

struct JobRequest;

class Validator {
public:
    virtual ~Validator() = default;
    virtual void validate(
        int num_qubits,
        const std::vector<GateOperation>& operations
    ) const = 0;
    virtual std::string name() const;
};

class LambdaValidator final : public Validator {
public:
    using ValidateFn = std::function<void(
        int num_qubits,
        const std::vector<GateOperation>& operations
    )>;

    LambdaValidator(std::string name, ValidateFn fn);
    void validate(
        int num_qubits,
        const std::vector<GateOperation>& operations
    ) const override;
    std::string name() const override;

private:
    std::string name_;
    ValidateFn fn_;
};

class ValidatorRegistry final {
public:
    void register_validator(std::unique_ptr<Validator> validator);
    void run_all_validators(
        int num_qubits,
        const std::vector<GateOperation>& operations
    ) const;
    std::vector<std::string> validator_names() const;

private:
    std::vector<std::unique_ptr<Validator>> validators_;
};

// Operand indices inside [0, num_qubits); throws std::out_of_range.
std::unique_ptr<Validator> make_qubit_range_validator();
// theta present on RX/RY/RZ, target present on CNOT/CZ/SWAP and absent
// elsewhere; throws std::invalid_argument.
std::unique_ptr<Validator> make_gate_parameters_validator();
// Two-qubit operations on distinct qubits; throws std::invalid_argument.
std::unique_ptr<Validator> make_distinct_operands_validator();
// num_qubits <= max_qubits; throws std::invalid_argument.
std::unique_ptr<Validator> make_qubit_budget_validator(int max_qubits);

// Budget resolution: the job's own max_qubits, else CIRCUIT_SIM_MAX_QUBITS.
int effective_qubit_budget(const JobRequest& job);

ValidatorRegistry make_validator_registry_for(const JobRequest& job);

}  // namespace service
