#include "gate_library.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <variant>

namespace {

constexpr double kTol = 1e-12;

void expect_matrix_near(const Matrix2& actual, const Matrix2& expected) {
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_NEAR(actual[i].real(), expected[i].real(), kTol) << "entry " << i;
        EXPECT_NEAR(actual[i].imag(), expected[i].imag(), kTol) << "entry " << i;
    }
}

// U * U^dagger == I
void expect_unitary(const Matrix2& u) {
    for (int r = 0; r < 2; ++r) {
        for (int c = 0; c < 2; ++c) {
            Amplitude acc{0.0, 0.0};
            for (int k = 0; k < 2; ++k) {
                acc += u[2 * r + k] * std::conj(u[2 * c + k]);
            }
            EXPECT_NEAR(acc.real(), r == c ? 1.0 : 0.0, kTol);
            EXPECT_NEAR(acc.imag(), 0.0, kTol);
        }
    }
}

}  // namespace

TEST(GateLibraryTests, FixedMatrices) {
    const double h = 1.0 / std::sqrt(2.0);
    expect_matrix_near(hadamard(), Matrix2{{{h, 0.0}, {h, 0.0}, {h, 0.0}, {-h, 0.0}}});
    expect_matrix_near(pauli_x(), Matrix2{{{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}});
    expect_matrix_near(pauli_y(), Matrix2{{{0.0, 0.0}, {0.0, -1.0}, {0.0, 1.0}, {0.0, 0.0}}});
    expect_matrix_near(pauli_z(), Matrix2{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {-1.0, 0.0}}});
    expect_matrix_near(phase_s(), Matrix2{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}}});
    expect_matrix_near(phase_t(), Matrix2{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {h, h}}});
}

TEST(GateLibraryTests, RotationsAtPi) {
    // RX(pi) = -iX, RY(pi) = [[0,-1],[1,0]], RZ(pi) = diag(-i, i)
    expect_matrix_near(rotation_x(M_PI), Matrix2{{{0.0, 0.0}, {0.0, -1.0}, {0.0, -1.0}, {0.0, 0.0}}});
    expect_matrix_near(rotation_y(M_PI), Matrix2{{{0.0, 0.0}, {-1.0, 0.0}, {1.0, 0.0}, {0.0, 0.0}}});
    expect_matrix_near(rotation_z(M_PI), Matrix2{{{0.0, -1.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 1.0}}});
}

TEST(GateLibraryTests, RotationsAtZeroAreIdentity) {
    const Matrix2 identity{{{1.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}, {1.0, 0.0}}};
    expect_matrix_near(rotation_x(0.0), identity);
    expect_matrix_near(rotation_y(0.0), identity);
    expect_matrix_near(rotation_z(0.0), identity);
}

TEST(GateLibraryTests, EverySingleQubitMatrixIsUnitary) {
    GateParams params;
    params.theta = 0.731;
    for (GateKind kind : kAllGateKinds) {
        if (gate_arity(kind) != 1 || kind == GateKind::MEASURE) {
            continue;
        }
        SCOPED_TRACE(gate_kind_name(kind));
        expect_unitary(single_qubit_matrix(kind, params));
    }
}

TEST(GateLibraryTests, RotationWithoutThetaIsRejected) {
    EXPECT_THROW(single_qubit_matrix(GateKind::RX), std::invalid_argument);
    EXPECT_THROW(single_qubit_matrix(GateKind::RY), std::invalid_argument);
    EXPECT_THROW(gate_action(GateKind::RZ), std::invalid_argument);
}

TEST(GateLibraryTests, MultiQubitKindsHaveNoSingleQubitMatrix) {
    EXPECT_THROW(single_qubit_matrix(GateKind::CNOT), std::invalid_argument);
    EXPECT_THROW(single_qubit_matrix(GateKind::SWAP), std::invalid_argument);
    EXPECT_THROW(single_qubit_matrix(GateKind::MEASURE), std::invalid_argument);
}

TEST(GateLibraryTests, ActionsClassifyEveryKind) {
    EXPECT_EQ(std::get<StructuralRule>(gate_action(GateKind::CNOT)), StructuralRule::ControlledNot);
    EXPECT_EQ(std::get<StructuralRule>(gate_action(GateKind::CZ)), StructuralRule::ControlledZ);
    EXPECT_EQ(std::get<StructuralRule>(gate_action(GateKind::SWAP)), StructuralRule::Swap);
    EXPECT_TRUE(std::holds_alternative<MeasurementMarker>(gate_action(GateKind::MEASURE)));
    EXPECT_TRUE(std::holds_alternative<Matrix2>(gate_action(GateKind::H)));
}

TEST(GateLibraryTests, GateKindNamesRoundTripThroughParser) {
    for (GateKind kind : kAllGateKinds) {
        EXPECT_EQ(parse_gate_kind(gate_kind_name(kind)), kind);
    }
    EXPECT_EQ(parse_gate_kind("M"), GateKind::MEASURE);
    EXPECT_THROW(parse_gate_kind("CCX"), std::invalid_argument);
    EXPECT_THROW(parse_gate_kind("h"), std::invalid_argument);
}

TEST(GateLibraryTests, DenseSwapIsPermutation) {
    const Matrix4 u = dense_two_qubit_matrix(StructuralRule::Swap);
    // |01> <-> |10>, |00> and |11> fixed.
    EXPECT_EQ(u[4 * 0 + 0], Amplitude(1.0, 0.0));
    EXPECT_EQ(u[4 * 1 + 2], Amplitude(1.0, 0.0));
    EXPECT_EQ(u[4 * 2 + 1], Amplitude(1.0, 0.0));
    EXPECT_EQ(u[4 * 3 + 3], Amplitude(1.0, 0.0));
    int nonzero = 0;
    for (const auto& entry : u) {
        nonzero += std::abs(entry) > 0.0 ? 1 : 0;
    }
    EXPECT_EQ(nonzero, 4);
}
