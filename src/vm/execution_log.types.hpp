#pragma once

#include <string>

// One structured log line emitted by the engine while it replays a circuit.
// `step` counts applied operations since the last reset; `position` is the
// scheduling key of the operation that produced the entry (-1 when the entry
// is not tied to an operation).
struct ExecutionLog {
    int step = 0;
    int position = -1;
    std::string category;
    std::string message;
};
