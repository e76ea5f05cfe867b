#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Gate-operation records consumed by the simulator. This header holds no
// simulation state; it is the vocabulary shared by the engine, the job
// service and the bindings.

enum class GateKind {
    H,
    X,
    Y,
    Z,
    S,
    T,
    RX,
    RY,
    RZ,
    CNOT,
    CZ,
    SWAP,
    MEASURE,
};

inline constexpr std::array<GateKind, 13> kAllGateKinds{{
    GateKind::H,
    GateKind::X,
    GateKind::Y,
    GateKind::Z,
    GateKind::S,
    GateKind::T,
    GateKind::RX,
    GateKind::RY,
    GateKind::RZ,
    GateKind::CNOT,
    GateKind::CZ,
    GateKind::SWAP,
    GateKind::MEASURE,
}};

inline std::string gate_kind_name(GateKind kind) {
    switch (kind) {
        case GateKind::H:
            return "H";
        case GateKind::X:
            return "X";
        case GateKind::Y:
            return "Y";
        case GateKind::Z:
            return "Z";
        case GateKind::S:
            return "S";
        case GateKind::T:
            return "T";
        case GateKind::RX:
            return "RX";
        case GateKind::RY:
            return "RY";
        case GateKind::RZ:
            return "RZ";
        case GateKind::CNOT:
            return "CNOT";
        case GateKind::CZ:
            return "CZ";
        case GateKind::SWAP:
            return "SWAP";
        case GateKind::MEASURE:
            return "MEASURE";
    }
    return "UNKNOWN";
}

// Accepts the canonical names above plus "M", which the circuit editor uses
// for the measurement marker.
inline GateKind parse_gate_kind(const std::string& name) {
    for (GateKind kind : kAllGateKinds) {
        if (gate_kind_name(kind) == name) {
            return kind;
        }
    }
    if (name == "M") {
        return GateKind::MEASURE;
    }
    throw std::invalid_argument("Unknown gate kind: " + name);
}

// Number of qubit operands: 2 for CNOT/CZ/SWAP, 1 otherwise.
inline int gate_arity(GateKind kind) {
    switch (kind) {
        case GateKind::CNOT:
        case GateKind::CZ:
        case GateKind::SWAP:
            return 2;
        default:
            return 1;
    }
}

inline bool is_rotation(GateKind kind) {
    return kind == GateKind::RX || kind == GateKind::RY || kind == GateKind::RZ;
}

struct GateParams {
    std::optional<double> theta;  // radians, RX/RY/RZ only
};

struct GateOperation {
    GateKind kind = GateKind::H;
    int qubit = 0;                    // control qubit for CNOT/CZ
    std::optional<int> target_qubit;  // CNOT/CZ/SWAP only
    GateParams params;
    int position = 0;                 // ordering key, not a duration
};

inline std::vector<int> operands_of(const GateOperation& op) {
    if (op.target_qubit) {
        return {op.qubit, *op.target_qubit};
    }
    return {op.qubit};
}
