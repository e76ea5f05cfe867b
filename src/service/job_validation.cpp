#include "service/job.hpp"
#include "service/job_validation.hpp"

#include "engine_config.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace service {
namespace {

std::string describe_operation(const GateOperation& op, std::size_t index) {
    return "Operation " + std::to_string(index) + " (" + gate_kind_name(op.kind) +
           " at position " + std::to_string(op.position) + ")";
}

class QubitRangeValidator final : public Validator {
public:
    void validate(
        int num_qubits,
        const std::vector<GateOperation>& operations
    ) const override {
        if (num_qubits < 0) {
            throw std::invalid_argument("Qubit count must be non-negative");
        }
        for (std::size_t i = 0; i < operations.size(); ++i) {
            for (int qubit : operands_of(operations[i])) {
                if (qubit < 0 || qubit >= num_qubits) {
                    throw std::out_of_range(
                        describe_operation(operations[i], i) + " references qubit " +
                        std::to_string(qubit) + " but the circuit has " +
                        std::to_string(num_qubits) + " qubits");
                }
            }
        }
    }

    std::string name() const override {
        return "qubit_range";
    }
};

class GateParametersValidator final : public Validator {
public:
    void validate(
        int /*num_qubits*/,
        const std::vector<GateOperation>& operations
    ) const override {
        for (std::size_t i = 0; i < operations.size(); ++i) {
            const auto& op = operations[i];
            if (is_rotation(op.kind) && !op.params.theta) {
                throw std::invalid_argument(
                    describe_operation(op, i) + " requires parameter theta");
            }
            const bool two_qubit = gate_arity(op.kind) == 2;
            if (two_qubit && !op.target_qubit) {
                throw std::invalid_argument(
                    describe_operation(op, i) + " requires a target qubit");
            }
            if (!two_qubit && op.target_qubit) {
                throw std::invalid_argument(
                    describe_operation(op, i) + " does not take a target qubit");
            }
        }
    }

    std::string name() const override {
        return "gate_parameters";
    }
};

class DistinctOperandsValidator final : public Validator {
public:
    void validate(
        int /*num_qubits*/,
        const std::vector<GateOperation>& operations
    ) const override {
        for (std::size_t i = 0; i < operations.size(); ++i) {
            const auto& op = operations[i];
            if (op.target_qubit && *op.target_qubit == op.qubit) {
                throw std::invalid_argument(
                    describe_operation(op, i) + " uses qubit " + std::to_string(op.qubit) +
                    " as both operands");
            }
        }
    }

    std::string name() const override {
        return "distinct_operands";
    }
};

class QubitBudgetValidator final : public Validator {
public:
    explicit QubitBudgetValidator(int max_qubits) : max_qubits_(max_qubits) {}

    void validate(
        int num_qubits,
        const std::vector<GateOperation>& /*operations*/
    ) const override {
        if (num_qubits > max_qubits_) {
            throw std::invalid_argument(
                "Circuit requests " + std::to_string(num_qubits) +
                " qubits but the budget is " + std::to_string(max_qubits_));
        }
    }

    std::string name() const override {
        return "qubit_budget";
    }

private:
    int max_qubits_;
};

}  // namespace

std::string Validator::name() const {
    return "validator";
}

LambdaValidator::LambdaValidator(std::string name, ValidateFn fn)
    : name_(std::move(name)), fn_(std::move(fn)) {}

void LambdaValidator::validate(
    int num_qubits,
    const std::vector<GateOperation>& operations
) const {
    if (fn_) {
        fn_(num_qubits, operations);
    }
}

std::string LambdaValidator::name() const {
    return name_;
}

void ValidatorRegistry::register_validator(std::unique_ptr<Validator> validator) {
    if (validator) {
        validators_.push_back(std::move(validator));
    }
}

void ValidatorRegistry::run_all_validators(
    int num_qubits,
    const std::vector<GateOperation>& operations
) const {
    for (const auto& validator : validators_) {
        validator->validate(num_qubits, operations);
    }
}

std::vector<std::string> ValidatorRegistry::validator_names() const {
    std::vector<std::string> names;
    names.reserve(validators_.size());
    for (const auto& validator : validators_) {
        names.push_back(validator->name());
    }
    return names;
}

int effective_qubit_budget(const JobRequest& job) {
    if (job.max_qubits > 0) {
        return job.max_qubits;
    }
    return engine_config_from_env().max_qubits;
}

ValidatorRegistry make_validator_registry_for(const JobRequest& job) {
    ValidatorRegistry registry;
    registry.register_validator(make_qubit_range_validator());
    registry.register_validator(make_gate_parameters_validator());
    registry.register_validator(make_distinct_operands_validator());
    const int budget = effective_qubit_budget(job);
    if (budget > 0) {
        registry.register_validator(make_qubit_budget_validator(budget));
    }
    return registry;
}

std::unique_ptr<Validator> make_qubit_range_validator() {
    return std::make_unique<QubitRangeValidator>();
}

std::unique_ptr<Validator> make_gate_parameters_validator() {
    return std::make_unique<GateParametersValidator>();
}

std::unique_ptr<Validator> make_distinct_operands_validator() {
    return std::make_unique<DistinctOperandsValidator>();
}

std::unique_ptr<Validator> make_qubit_budget_validator(int max_qubits) {
    return std::make_unique<QubitBudgetValidator>(max_qubits);
}

}  // namespace service
