#include "service/job.hpp"
#include "service/job_service.hpp"
#include "vm/gate_ops.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <utility>

namespace py = pybind11;

namespace {

GateOperation operation_from_dict(const py::dict& obj) {
    GateOperation op;
    op.kind = parse_gate_kind(py::cast<std::string>(obj["kind"]));
    op.qubit = py::cast<int>(obj["qubit"]);
    if (obj.contains("target_qubit") && !obj["target_qubit"].is_none()) {
        op.target_qubit = py::cast<int>(obj["target_qubit"]);
    }
    if (obj.contains("params") && !obj["params"].is_none()) {
        const auto params = py::cast<py::dict>(obj["params"]);
        if (params.contains("theta") && !params["theta"].is_none()) {
            op.params.theta = py::cast<double>(params["theta"]);
        }
    }
    if (obj.contains("position")) {
        op.position = py::cast<int>(obj["position"]);
    }
    return op;
}

std::vector<GateOperation> operations_from_list(const py::list& operations) {
    std::vector<GateOperation> out;
    out.reserve(py::len(operations));
    for (const auto& item : operations) {
        out.push_back(operation_from_dict(py::cast<py::dict>(item)));
    }
    return out;
}

py::dict execution_log_to_dict(const ExecutionLog& entry) {
    py::dict log;
    log["step"] = entry.step;
    log["position"] = entry.position;
    log["category"] = entry.category;
    log["message"] = entry.message;
    return log;
}

py::dict job_result_to_dict(const service::JobResult& result) {
    py::dict out;
    out["job_id"] = result.job_id;
    out["status"] = service::status_to_string(result.status);
    out["elapsed_time"] = result.elapsed_time;
    out["message"] = result.message;

    py::list amplitudes;
    for (const auto& amp : result.state_vector) {
        amplitudes.append(py::make_tuple(amp.real(), amp.imag()));
    }
    out["state_vector"] = amplitudes;
    out["probabilities"] = result.probabilities;

    py::list reduced;
    for (const auto& entry : result.reduced_states) {
        py::dict item;
        item["qubit"] = entry.qubit;
        item["x"] = entry.state.x;
        item["y"] = entry.state.y;
        item["z"] = entry.state.z;
        item["purity"] = entry.state.purity;
        reduced.append(item);
    }
    out["reduced_states"] = reduced;
    out["counts"] = result.counts;

    py::list log_list;
    for (const auto& entry : result.logs) {
        log_list.append(execution_log_to_dict(entry));
    }
    out["logs"] = log_list;

    py::list timeline_list;
    for (const auto& entry : result.timeline) {
        py::dict item;
        item["start_time"] = entry.start_time;
        item["duration"] = entry.duration;
        item["op"] = entry.op;
        item["detail"] = entry.detail;
        item["qubits"] = entry.qubits;
        timeline_list.append(item);
    }
    out["timeline"] = timeline_list;
    return out;
}

service::JobRequest build_job_request(const py::dict& job_obj) {
    service::JobRequest job;

    if (job_obj.contains("job_id")) {
        job.job_id = py::cast<std::string>(job_obj["job_id"]);
    } else {
        job.job_id = "python-client";
    }

    job.num_qubits = py::cast<int>(job_obj["num_qubits"]);
    job.operations = operations_from_list(py::cast<py::list>(job_obj["operations"]));

    if (job_obj.contains("shots")) {
        job.shots = py::cast<int>(job_obj["shots"]);
    }
    if (job_obj.contains("seed") && !job_obj["seed"].is_none()) {
        job.seed = py::cast<std::uint64_t>(job_obj["seed"]);
    }
    if (job_obj.contains("max_qubits")) {
        job.max_qubits = py::cast<int>(job_obj["max_qubits"]);
    }
    if (job_obj.contains("query_qubits")) {
        job.query_qubits = py::cast<std::vector<int>>(job_obj["query_qubits"]);
    }
    if (job_obj.contains("metadata")) {
        job.metadata = py::cast<std::map<std::string, std::string>>(job_obj["metadata"]);
    }
    return job;
}

service::JobService job_service;

py::dict simulate(const py::dict& job_obj) {
    service::JobRequest job = build_job_request(job_obj);
    service::JobRunner runner;
    auto result = runner.run(job);
    return job_result_to_dict(result);
}

py::dict submit_job_async(const py::dict& job_obj) {
    service::JobRequest job = build_job_request(job_obj);
    const std::string job_id = job_service.submit(std::move(job));
    py::dict out;
    out["job_id"] = job_id;
    return out;
}

py::dict job_status(const std::string& job_id) {
    const service::JobStatusSnapshot snapshot = job_service.status(job_id);
    py::dict out;
    out["job_id"] = job_id;
    out["status"] = service::status_to_string(snapshot.status);
    out["percent_complete"] = snapshot.percent_complete;
    out["last_position"] = snapshot.last_position;
    out["message"] = snapshot.message;
    py::list logs;
    for (const auto& entry : snapshot.recent_logs) {
        logs.append(execution_log_to_dict(entry));
    }
    out["recent_logs"] = logs;
    return out;
}

py::dict job_result(const std::string& job_id) {
    const auto result = job_service.poll_result(job_id);
    if (!result) {
        throw std::runtime_error("job result not available yet");
    }
    return job_result_to_dict(*result);
}

std::vector<std::string> gate_kinds() {
    std::vector<std::string> names;
    names.reserve(kAllGateKinds.size());
    for (GateKind kind : kAllGateKinds) {
        names.push_back(gate_kind_name(kind));
    }
    return names;
}

}  // namespace

PYBIND11_MODULE(_circuit_sim, m) {
    m.doc() = "State-vector circuit simulator bindings";
    m.def(
        "simulate",
        &simulate,
        py::arg("job"),
        "Run a circuit synchronously. The job dict mirrors service::JobRequest."
    );
    m.def(
        "submit_job_async",
        &submit_job_async,
        py::arg("job"),
        "Submit a circuit for asynchronous simulation and receive a job_id immediately."
    );
    m.def(
        "job_status",
        &job_status,
        py::arg("job_id"),
        "Query the current status snapshot for an async job."
    );
    m.def(
        "job_result",
        &job_result,
        py::arg("job_id"),
        "Fetch the final result for an async job (raises if not ready)."
    );
    m.def(
        "gate_kinds",
        &gate_kinds,
        "List the gate kind names accepted in operation dicts."
    );
}
