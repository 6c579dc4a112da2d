#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <cloudconnect/cloudconnect.hpp>

using namespace cloudconnect;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_cloudconnect, m) {
    m.doc() = "CloudConnect: lifecycle manager for heterogeneous cloud-like resources";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ResourceState>(m, "ResourceState")
        .value("Stopped", ResourceState::Stopped)
        .value("Running", ResourceState::Running)
        .value("Deleted", ResourceState::Deleted)
        .export_values();

    py::enum_<Transition>(m, "Transition")
        .value("Start",  Transition::Start)
        .value("Stop",   Transition::Stop)
        .value("Delete", Transition::Delete)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("Validation",        ErrorKind::Validation)
        .value("DuplicateName",     ErrorKind::DuplicateName)
        .value("UnknownType",       ErrorKind::UnknownType)
        .value("DuplicateType",     ErrorKind::DuplicateType)
        .value("NotFound",          ErrorKind::NotFound)
        .value("InvalidTransition", ErrorKind::InvalidTransition)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("ResourceTypeRegistered", EventType::ResourceTypeRegistered)
        .value("ResourceCreated",        EventType::ResourceCreated)
        .value("ResourceStarted",        EventType::ResourceStarted)
        .value("ResourceStopped",        EventType::ResourceStopped)
        .value("ResourceDeleted",        EventType::ResourceDeleted)
        .value("AuditEntryWritten",      EventType::AuditEntryWritten)
        .value("TransitionRejected",     EventType::TransitionRejected)
        .value("OperationFailed",        EventType::OperationFailed)
        .value("AuditWriteFailed",       EventType::AuditWriteFailed)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .export_values();

    m.def("next_state", &next_state, py::arg("current"), py::arg("transition"),
          "Target state of a transition, or None if it is illegal");

    // ---- Structs ----------------------------------------------------------

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("log_dir",               &Config::log_dir)
        .def_readwrite("write_audit_files",     &Config::write_audit_files)
        .def_readwrite("max_resources",         &Config::max_resources)
        .def_readwrite("echo_audit_to_monitor", &Config::echo_audit_to_monitor);

    py::class_<AuditEntry>(m, "AuditEntry")
        .def(py::init<>())
        .def_readwrite("timestamp", &AuditEntry::timestamp)
        .def_readwrite("message",   &AuditEntry::message)
        .def("__str__", [](const AuditEntry& e) {
            return format_audit_line(e.timestamp, e.message);
        });

    py::class_<ResourceInfo>(m, "ResourceInfo")
        .def(py::init<>())
        .def_readwrite("name",               &ResourceInfo::name)
        .def_readwrite("type_tag",           &ResourceInfo::type_tag)
        .def_readwrite("state",              &ResourceInfo::state)
        .def_readwrite("description",        &ResourceInfo::description)
        .def_readwrite("start_detail",       &ResourceInfo::start_detail)
        .def_readwrite("created_at",         &ResourceInfo::created_at)
        .def_readwrite("last_transition_at", &ResourceInfo::last_transition_at)
        .def("__repr__", [](const ResourceInfo& r) {
            return "<ResourceInfo name='" + r.name + "' type=" + r.type_tag
                 + " state=" + to_string(r.state) + ">";
        });

    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",          &MonitorEvent::type)
        .def_readwrite("timestamp",     &MonitorEvent::timestamp)
        .def_readwrite("message",       &MonitorEvent::message)
        .def_readwrite("resource_name", &MonitorEvent::resource_name)
        .def_readwrite("type_tag",      &MonitorEvent::type_tag)
        .def_readwrite("state",         &MonitorEvent::state)
        .def_readwrite("error",         &MonitorEvent::error);

    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("resources_created",    &MetricsMonitor::Metrics::resources_created)
        .def_readwrite("resources_started",    &MetricsMonitor::Metrics::resources_started)
        .def_readwrite("resources_stopped",    &MetricsMonitor::Metrics::resources_stopped)
        .def_readwrite("resources_deleted",    &MetricsMonitor::Metrics::resources_deleted)
        .def_readwrite("transitions_rejected", &MetricsMonitor::Metrics::transitions_rejected)
        .def_readwrite("operations_failed",    &MetricsMonitor::Metrics::operations_failed)
        .def_readwrite("audit_write_failures", &MetricsMonitor::Metrics::audit_write_failures);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_CloudConnectError =
        py::register_exception<CloudConnectException>(m, "CloudConnectError", PyExc_RuntimeError);

    // Derived from CloudConnectError
    static auto py_ValidationError =
        py::register_exception<ValidationError>(m, "ValidationError", py_CloudConnectError.ptr());
    static auto py_DuplicateNameError =
        py::register_exception<DuplicateNameError>(m, "DuplicateNameError", py_CloudConnectError.ptr());
    static auto py_NotFoundError =
        py::register_exception<NotFoundError>(m, "NotFoundError", py_CloudConnectError.ptr());
    static auto py_UnknownTypeError =
        py::register_exception<UnknownTypeError>(m, "UnknownTypeError", py_CloudConnectError.ptr());
    static auto py_DuplicateTypeError =
        py::register_exception<DuplicateTypeError>(m, "DuplicateTypeError", py_CloudConnectError.ptr());
    static auto py_InvalidTransitionError =
        py::register_exception<InvalidTransitionError>(m, "InvalidTransitionError", py_CloudConnectError.ptr());
}
