#pragma once

#include <array>
#include <string>
#include <variant>

#include "complex_ops.hpp"
#include "vm/gate_ops.hpp"

// Row-major 2x2 unitary: {u00, u01, u10, u11}.
using Matrix2 = std::array<Amplitude, 4>;

// Row-major 4x4 operator on an ordered qubit pair (a, b). The local basis is
// [|00>, |01>, |10>, |11>] with qubit a as the high bit.
using Matrix4 = std::array<Amplitude, 16>;

// Multi-qubit gates are applied as index permutations / phase flips rather
// than dense matrices.
enum class StructuralRule {
    ControlledNot,
    ControlledZ,
    Swap,
};

// Measurement gates have no effect on the amplitudes.
struct MeasurementMarker {};

using GateAction = std::variant<Matrix2, StructuralRule, MeasurementMarker>;

Matrix2 hadamard();
Matrix2 pauli_x();
Matrix2 pauli_y();
Matrix2 pauli_z();
Matrix2 phase_s();
Matrix2 phase_t();
Matrix2 rotation_x(double theta);
Matrix2 rotation_y(double theta);
Matrix2 rotation_z(double theta);

// Matrix for a single-qubit kind. Throws std::invalid_argument for
// multi-qubit or measurement kinds and for rotations without theta.
Matrix2 single_qubit_matrix(GateKind kind, const GateParams& params = {});

GateAction gate_action(GateKind kind, const GateParams& params = {});

// Dense equivalent of a structural rule, with the first operand (control for
// CNOT/CZ) as the high bit of the local basis.
Matrix4 dense_two_qubit_matrix(StructuralRule rule);

std::string structural_rule_name(StructuralRule rule);
