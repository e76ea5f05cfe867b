#pragma once

// Runtime knobs for StatevectorEngine.
struct EngineConfig {
    int max_qubits = 0;            // 0 means no budget
    bool emit_logs = true;
    double norm_tolerance = 1e-6;  // diagnostics only
};

// Defaults overridden by CIRCUIT_SIM_MAX_QUBITS when it parses as a
// non-negative integer.
EngineConfig engine_config_from_env();
