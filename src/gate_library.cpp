#include "gate_library.hpp"

#include <cmath>
#include <stdexcept>

namespace {

constexpr double kPi = 3.14159265358979323846;

double require_theta(GateKind kind, const GateParams& params) {
    if (!params.theta) {
        throw std::invalid_argument(
            "Gate " + gate_kind_name(kind) + " requires a theta parameter");
    }
    return *params.theta;
}

}  // namespace

Matrix2 hadamard() {
    const double inv_sqrt2 = 1.0 / std::sqrt(2.0);
    return {{{inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {inv_sqrt2, 0.0}, {-inv_sqrt2, 0.0}}};
}

Matrix2 pauli_x() {
    return {{{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}};
}

Matrix2 pauli_y() {
    return {{{0.0, 0.0}, {0.0, -1.0}, {0.0, 1.0}, {0.0, 0.0}}};
}

Matrix2 pauli_z() {
    return {{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {-1.0, 0.0}}};
}

Matrix2 phase_s() {
    return {{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}}};
}

Matrix2 phase_t() {
    return {{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, std::polar(1.0, kPi / 4.0)}};
}

Matrix2 rotation_x(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return {{{c, 0.0}, {0.0, -s}, {0.0, -s}, {c, 0.0}}};
}

Matrix2 rotation_y(double theta) {
    const double c = std::cos(theta / 2.0);
    const double s = std::sin(theta / 2.0);
    return {{{c, 0.0}, {-s, 0.0}, {s, 0.0}, {c, 0.0}}};
}

Matrix2 rotation_z(double theta) {
    // diag(e^{-i theta/2}, e^{i theta/2})
    const double half = theta / 2.0;
    return {{std::polar(1.0, -half), {0.0, 0.0}, {0.0, 0.0}, std::polar(1.0, half)}};
}

Matrix2 single_qubit_matrix(GateKind kind, const GateParams& params) {
    switch (kind) {
        case GateKind::H:
            return hadamard();
        case GateKind::X:
            return pauli_x();
        case GateKind::Y:
            return pauli_y();
        case GateKind::Z:
            return pauli_z();
        case GateKind::S:
            return phase_s();
        case GateKind::T:
            return phase_t();
        case GateKind::RX:
            return rotation_x(require_theta(kind, params));
        case GateKind::RY:
            return rotation_y(require_theta(kind, params));
        case GateKind::RZ:
            return rotation_z(require_theta(kind, params));
        case GateKind::CNOT:
        case GateKind::CZ:
        case GateKind::SWAP:
        case GateKind::MEASURE:
            break;
    }
    throw std::invalid_argument(
        "Gate " + gate_kind_name(kind) + " has no single-qubit matrix");
}

GateAction gate_action(GateKind kind, const GateParams& params) {
    switch (kind) {
        case GateKind::CNOT:
            return StructuralRule::ControlledNot;
        case GateKind::CZ:
            return StructuralRule::ControlledZ;
        case GateKind::SWAP:
            return StructuralRule::Swap;
        case GateKind::MEASURE:
            return MeasurementMarker{};
        case GateKind::H:
        case GateKind::X:
        case GateKind::Y:
        case GateKind::Z:
        case GateKind::S:
        case GateKind::T:
        case GateKind::RX:
        case GateKind::RY:
        case GateKind::RZ:
            return single_qubit_matrix(kind, params);
    }
    throw std::invalid_argument("Unknown gate kind");
}

Matrix4 dense_two_qubit_matrix(StructuralRule rule) {
    Matrix4 U{};
    switch (rule) {
        case StructuralRule::ControlledNot:
            U[0] = {1.0, 0.0};
            U[5] = {1.0, 0.0};
            U[11] = {1.0, 0.0};
            U[14] = {1.0, 0.0};
            break;
        case StructuralRule::ControlledZ:
            U[0] = {1.0, 0.0};
            U[5] = {1.0, 0.0};
            U[10] = {1.0, 0.0};
            U[15] = {-1.0, 0.0};
            break;
        case StructuralRule::Swap:
            U[0] = {1.0, 0.0};
            U[6] = {1.0, 0.0};
            U[9] = {1.0, 0.0};
            U[15] = {1.0, 0.0};
            break;
    }
    return U;
}

std::string structural_rule_name(StructuralRule rule) {
    switch (rule) {
        case StructuralRule::ControlledNot:
            return "ControlledNot";
        case StructuralRule::ControlledZ:
            return "ControlledZ";
        case StructuralRule::Swap:
            return "Swap";
    }
    return "Unknown";
}
