#include "engine_config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

int max_qubits_from_env(int fallback) {
    const char* env = std::getenv("CIRCUIT_SIM_MAX_QUBITS");
    if (!env || *env == '\0') {
        return fallback;
    }
    try {
        const unsigned long long parsed = std::stoull(env);
        if (parsed > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            return fallback;
        }
        return static_cast<int>(parsed);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

}  // namespace

EngineConfig engine_config_from_env() {
    EngineConfig cfg;
    cfg.max_qubits = max_qubits_from_env(cfg.max_qubits);
    return cfg;
}
