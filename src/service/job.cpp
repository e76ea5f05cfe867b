#include "service/job.hpp"

#include "circuit.hpp"
#include "engine_config.hpp"
#include "engine_statevector.hpp"
#include "random_stream.hpp"
#include "service/job_validation.hpp"
#include "service/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string escape_json(const std::string& str) {
    std::ostringstream out;
    for (const char ch : str) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                out << ch;
        }
    }
    return out.str();
}

void append_int_array(const std::vector<int>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
}

void append_double_array(const std::vector<double>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << values[i];
    }
    out << ']';
}

// Amplitudes as [re, im] pairs.
void append_amplitudes(const std::vector<Amplitude>& values, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << '[' << values[i].real() << ',' << values[i].imag() << ']';
    }
    out << ']';
}

void append_string_map(const std::map<std::string, std::string>& values, std::ostringstream& out) {
    out << '{';
    bool first_entry = true;
    for (const auto& [key, value] : values) {
        if (!first_entry) {
            out << ',';
        }
        first_entry = false;
        out << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
    }
    out << '}';
}

void append_operation_json(const GateOperation& op, std::ostringstream& out) {
    out << "{\"kind\":\"" << gate_kind_name(op.kind) << "\",\"qubit\":" << op.qubit;
    if (op.target_qubit) {
        out << ",\"target_qubit\":" << *op.target_qubit;
    }
    if (op.params.theta) {
        out << ",\"params\":{\"theta\":" << *op.params.theta << '}';
    }
    out << ",\"position\":" << op.position << '}';
}

void append_reduction_json(const service::QubitReduction& reduction, std::ostringstream& out) {
    const auto& s = reduction.state;
    out << "{\"qubit\":" << reduction.qubit
        << ",\"x\":" << s.x
        << ",\"y\":" << s.y
        << ",\"z\":" << s.z
        << ",\"purity\":" << s.purity << '}';
}

void append_timeline_json(const std::vector<service::TimelineEntry>& timeline, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < timeline.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        const auto& entry = timeline[i];
        out << "{\"start_time\":" << entry.start_time
            << ",\"duration\":" << entry.duration
            << ",\"op\":\"" << escape_json(entry.op)
            << "\",\"detail\":\"" << escape_json(entry.detail)
            << "\",\"qubits\":";
        append_int_array(entry.qubits, out);
        out << '}';
    }
    out << ']';
}

void append_logs_json(const std::vector<ExecutionLog>& logs, std::ostringstream& out) {
    out << '[';
    for (std::size_t i = 0; i < logs.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        const auto& log = logs[i];
        out << "{\"step\":" << log.step
            << ",\"position\":" << log.position
            << ",\"category\":\"" << escape_json(log.category)
            << "\",\"message\":\"" << escape_json(log.message) << "\"}";
    }
    out << ']';
}

std::vector<int> qubits_to_reduce(const service::JobRequest& job) {
    if (!job.query_qubits.empty()) {
        return job.query_qubits;
    }
    std::vector<int> all;
    all.reserve(static_cast<std::size_t>(std::max(0, job.num_qubits)));
    for (int q = 0; q < job.num_qubits; ++q) {
        all.push_back(q);
    }
    return all;
}

}  // namespace

namespace service {

std::string to_json(const JobRequest& job) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << '{';
    out << "\"job_id\":\"" << escape_json(job.job_id) << "\",";
    out << "\"num_qubits\":" << job.num_qubits << ',';
    out << "\"shots\":" << job.shots << ',';
    if (job.seed) {
        out << "\"seed\":" << *job.seed << ',';
    }
    if (job.max_qubits > 0) {
        out << "\"max_qubits\":" << job.max_qubits << ',';
    }
    out << "\"operations\":[";
    for (std::size_t i = 0; i < job.operations.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_operation_json(job.operations[i], out);
    }
    out << "],";
    if (!job.query_qubits.empty()) {
        out << "\"query_qubits\":";
        append_int_array(job.query_qubits, out);
        out << ',';
    }
    out << "\"metadata\":";
    append_string_map(job.metadata, out);
    out << '}';
    return out.str();
}

std::string to_json(const JobResult& result) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << '{';
    out << "\"job_id\":\"" << escape_json(result.job_id) << "\",";
    out << "\"status\":\"" << status_to_string(result.status) << "\",";
    out << "\"state_vector\":";
    append_amplitudes(result.state_vector, out);
    out << ",\"probabilities\":";
    append_double_array(result.probabilities, out);
    out << ",\"reduced_states\":[";
    for (std::size_t i = 0; i < result.reduced_states.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        append_reduction_json(result.reduced_states[i], out);
    }
    out << "],\"counts\":{";
    bool first_entry = true;
    for (const auto& [outcome, count] : result.counts) {
        if (!first_entry) {
            out << ',';
        }
        first_entry = false;
        out << "\"" << escape_json(outcome) << "\":" << count;
    }
    out << "},\"timeline\":";
    append_timeline_json(result.timeline, out);
    out << ",\"logs\":";
    append_logs_json(result.logs, out);
    out << ",\"elapsed_time\":" << result.elapsed_time;
    out << ",\"message\":\"" << escape_json(result.message) << "\"";
    out << '}';
    return out.str();
}

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
    }
    return "unknown";
}

JobResult JobRunner::run(
    const JobRequest& job,
    circuit_sim::ProgressReporter* reporter
) {
    auto start = std::chrono::steady_clock::now();
    JobResult result;
    result.job_id = job.job_id;
    try {
        if (job.shots < 0) {
            throw std::invalid_argument("Shot count must be non-negative");
        }
        const ValidatorRegistry validators = make_validator_registry_for(job);
        validators.run_all_validators(job.num_qubits, job.operations);

        SchedulerResult scheduled = schedule_operations(job.operations);
        result.timeline = std::move(scheduled.timeline);

        // Each job gets its own engine; nothing is shared across jobs.
        EngineConfig cfg = engine_config_from_env();
        cfg.max_qubits = effective_qubit_budget(job);
        StatevectorEngine engine(cfg);
        if (reporter) {
            engine.set_progress_reporter(reporter);
        }

        Circuit circuit;
        circuit.num_qubits = job.num_qubits;
        circuit.operations = std::move(scheduled.operations);
        SimulationResult sim = engine.simulate(circuit);

        for (int q : qubits_to_reduce(job)) {
            result.reduced_states.push_back(QubitReduction{q, engine.reduce_qubit(q)});
        }

        if (job.shots > 0) {
            std::mt19937_64 rng;
            if (job.seed) {
                rng.seed(*job.seed);
            } else {
                std::random_device rd;
                rng.seed(rd());
            }
            StdRandomStream stream(rng);
            result.counts = engine.sample_counts(job.shots, stream);
        }

        result.state_vector = std::move(sim.state_vector);
        result.probabilities = std::move(sim.probabilities);
        result.logs = engine.logs();
        result.status = JobStatus::Completed;
    } catch (const std::exception& ex) {
        result.status = JobStatus::Failed;
        result.message = ex.what();
    }
    auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    return result;
}

}  // namespace service
