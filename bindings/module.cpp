#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "exec_kernel/catalog.h"
#include "exec_kernel/config.h"
#include "exec_kernel/container.h"
#include "exec_kernel/engine.h"
#include "exec_kernel/limits.h"
#include "exec_kernel/result.h"

namespace py = pybind11;
using namespace exec_kernel;

namespace {

py::dict response_to_dict(const ExecutionResponse& r) {
    py::dict d;
    if (r.ok()) {
        d["stdout"] = r.outcome->stdout_output;
        d["stderr"] = r.outcome->stderr_output;
        d["exit_code"] = r.outcome->exit_code;
    } else {
        d["error"] = to_string(r.kind);
        d["detail"] = r.message;
        if (!r.field.empty()) d["field"] = r.field;
    }
    d["sandboxed"] = r.sandboxed;
    return d;
}

} // anonymous namespace

PYBIND11_MODULE(exec_kernel, m) {
    m.doc() = "FusionAL execution kernel: sandboxed, resource-bounded execution of untrusted Python code";

    // ── Configuration ───────────────────────────────────────────────────

    py::class_<LimitPolicy>(m, "LimitPolicy")
        .def(py::init<>())
        .def_readwrite("default_timeout_seconds", &LimitPolicy::default_timeout_seconds)
        .def_readwrite("max_timeout_seconds", &LimitPolicy::max_timeout_seconds)
        .def_readwrite("default_memory_mb", &LimitPolicy::default_memory_mb)
        .def_readwrite("max_memory_mb", &LimitPolicy::max_memory_mb)
        .def_readwrite("process_count_limit", &LimitPolicy::process_count_limit);

    py::class_<ContainerSettings>(m, "ContainerSettings")
        .def(py::init<>())
        .def_readwrite("runtime", &ContainerSettings::runtime)
        .def_readwrite("image", &ContainerSettings::image)
        .def_readwrite("interpreter", &ContainerSettings::interpreter)
        .def_readwrite("user", &ContainerSettings::user)
        .def_readwrite("tmpfs_size", &ContainerSettings::tmpfs_size)
        .def_readwrite("mount_point", &ContainerSettings::mount_point)
        .def_readwrite("probe_timeout_seconds", &ContainerSettings::probe_timeout_seconds)
        .def_readwrite("teardown_timeout_seconds", &ContainerSettings::teardown_timeout_seconds);

    py::class_<EngineConfig>(m, "EngineConfig")
        .def(py::init<>())
        .def_static("from_env", &EngineConfig::from_env)
        .def_readwrite("limits", &EngineConfig::limits)
        .def_readwrite("staging_root", &EngineConfig::staging_root)
        .def_readwrite("python_executable", &EngineConfig::python_executable)
        .def_readwrite("container", &EngineConfig::container)
        .def_readwrite("max_output_bytes", &EngineConfig::max_output_bytes)
        .def_readwrite("probe_before_run", &EngineConfig::probe_before_run)
        .def_readwrite("log_level", &EngineConfig::log_level);

    m.def("configure_logging", &configure_logging, py::arg("level"));

    // ── Requests and results ────────────────────────────────────────────

    py::class_<ExecutionRequest>(m, "ExecutionRequest")
        .def(py::init([](std::string source, std::optional<int> timeout_seconds,
                         std::optional<int> memory_limit_mb, bool isolation_requested,
                         std::string language) {
                 ExecutionRequest r;
                 r.source = std::move(source);
                 r.timeout_seconds = timeout_seconds;
                 r.memory_limit_mb = memory_limit_mb;
                 r.isolation_requested = isolation_requested;
                 r.language = std::move(language);
                 return r;
             }),
             py::arg("source"), py::arg("timeout_seconds") = py::none(),
             py::arg("memory_limit_mb") = py::none(), py::arg("isolation_requested") = false, py::arg("language") = "python")
        .def_readonly("source", &ExecutionRequest::source)
        .def_readonly("timeout_seconds", &ExecutionRequest::timeout_seconds)
        .def_readonly("memory_limit_mb", &ExecutionRequest::memory_limit_mb)
        .def_readonly("isolation_requested", &ExecutionRequest::isolation_requested)
        .def_readonly("language", &ExecutionRequest::language);

    py::enum_<ResultKind>(m, "ResultKind")
        .value("Completed", ResultKind::Completed)
        .value("TimedOut", ResultKind::TimedOut)
        .value("ProcessLaunchFailed", ResultKind::ProcessLaunchFailed)
        .value("EnvironmentSetupFailed", ResultKind::EnvironmentSetupFailed)
        .value("IsolationUnavailable", ResultKind::IsolationUnavailable)
        .value("InvalidResourceRequest", ResultKind::InvalidResourceRequest);

    py::class_<ExecutionOutcome>(m, "ExecutionOutcome")
        .def_readonly("stdout", &ExecutionOutcome::stdout_output)
        .def_readonly("stderr", &ExecutionOutcome::stderr_output)
        .def_readonly("exit_code", &ExecutionOutcome::exit_code)
        .def_readonly("elapsed_seconds", &ExecutionOutcome::elapsed_seconds)
        .def_readonly("output_truncated", &ExecutionOutcome::output_truncated);

    py::class_<ExecutionResponse>(m, "ExecutionResponse")
        .def_readonly("kind", &ExecutionResponse::kind)
        .def_readonly("outcome", &ExecutionResponse::outcome)
        .def_readonly("message", &ExecutionResponse::message)
        .def_readonly("field", &ExecutionResponse::field)
        .def_readonly("sandboxed", &ExecutionResponse::sandboxed)
        .def_property_readonly("ok", &ExecutionResponse::ok)
        .def_property_readonly("http_status",
                               [](const ExecutionResponse& r) { return http_status(r.kind); })
        .def("to_dict", &response_to_dict);

    py::class_<IsolationStatus>(m, "IsolationStatus")
        .def_readonly("available", &IsolationStatus::available)
        .def_readonly("detail", &IsolationStatus::detail);

    // ── Engine ──────────────────────────────────────────────────────────

    py::class_<ExecutionEngine>(m, "ExecutionEngine")
        .def(py::init([]() {
            EngineConfig config = EngineConfig::from_env();
            configure_logging(config.log_level);
            return std::make_unique<ExecutionEngine>(config);
        }))
        .def(py::init([](const EngineConfig& config) {
                 configure_logging(config.log_level);
                 return std::make_unique<ExecutionEngine>(config);
             }),
             py::arg("config"))
        .def("execute", &ExecutionEngine::execute, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("isolation_status", &ExecutionEngine::isolation_status,
             py::call_guard<py::gil_scoped_release>());

    // ── Catalog ─────────────────────────────────────────────────────────

    py::enum_<RegisterStatus>(m, "RegisterStatus")
        .value("Ok", RegisterStatus::Ok)
        .value("AlreadyExists", RegisterStatus::AlreadyExists);

    py::class_<CatalogEntry>(m, "CatalogEntry")
        .def_readonly("name", &CatalogEntry::name)
        .def_readonly("description", &CatalogEntry::description)
        .def_readonly("url", &CatalogEntry::url)
        .def_readonly("metadata", &CatalogEntry::metadata)
        .def_readonly("registered_at", &CatalogEntry::registered_at);

    py::class_<InMemoryCatalog>(m, "InMemoryCatalog")
        .def(py::init<>())
        .def("register",
             [](InMemoryCatalog& c, std::string name, std::string description, std::string url,
                std::map<std::string, std::string> metadata) {
                 CatalogEntry e;
                 e.name = std::move(name);
                 e.description = std::move(description);
                 e.url = std::move(url);
                 e.metadata = std::move(metadata);
                 return c.add(std::move(e));
             },
             py::arg("name"), py::arg("description") = "", py::arg("url") = "",
             py::arg("metadata") = std::map<std::string, std::string>{})
        .def("list", &InMemoryCatalog::list);
}
