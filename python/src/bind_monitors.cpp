#include "bind_forward.hpp"
#include <cloudconnect/cloudconnect.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace cloudconnect;

// Trampoline class to allow Python subclassing of Monitor
class PyMonitor : public Monitor {
public:
    using Monitor::Monitor;

    void on_event(const MonitorEvent& event) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, Monitor, on_event, event);
    }
};

// Trampoline class to allow Python subclassing of LogSink
class PyLogSink : public LogSink {
public:
    using LogSink::LogSink;

    void append(const std::string& resource_name, const std::string& message) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(void, LogSink, append, resource_name, message);
    }
};

void bind_monitors(py::module_& m) {
    // --- Abstract Monitor with trampoline ---
    py::class_<Monitor, PyMonitor, std::shared_ptr<Monitor>>(m, "Monitor")
        .def(py::init<>())
        .def("on_event", &Monitor::on_event);

    // --- ConsoleMonitor ---
    py::class_<ConsoleMonitor, Monitor, std::shared_ptr<ConsoleMonitor>>(m, "ConsoleMonitor")
        .def(py::init<ConsoleMonitor::Verbosity>(),
             py::arg("verbosity") = ConsoleMonitor::Verbosity::Normal);

    // ConsoleMonitor::Verbosity is bound in bindings.cpp as "Verbosity"

    // --- MetricsMonitor ---
    py::class_<MetricsMonitor, Monitor, std::shared_ptr<MetricsMonitor>>(m, "MetricsMonitor")
        .def(py::init<>())
        .def("get_metrics", &MetricsMonitor::get_metrics)
        .def("reset_metrics", &MetricsMonitor::reset_metrics);

    // MetricsMonitor::Metrics is bound in bindings.cpp as "Metrics"

    // --- CompositeMonitor ---
    py::class_<CompositeMonitor, Monitor, std::shared_ptr<CompositeMonitor>>(m, "CompositeMonitor")
        .def(py::init<>())
        .def("add_monitor", &CompositeMonitor::add_monitor);

    // --- Abstract LogSink with trampoline ---
    py::class_<LogSink, PyLogSink, std::shared_ptr<LogSink>>(m, "LogSink")
        .def(py::init<>())
        .def("append", &LogSink::append, py::arg("resource_name"), py::arg("message"));

    // --- FileLogSink ---
    py::class_<FileLogSink, LogSink, std::shared_ptr<FileLogSink>>(m, "FileLogSink")
        .def(py::init<std::string>(), py::arg("log_dir") = "logs")
        .def("path_for", &FileLogSink::path_for, py::arg("resource_name"))
        .def("read",     &FileLogSink::read,     py::arg("resource_name"))
        .def("log_dir",  &FileLogSink::log_dir);

    // --- MemoryLogSink ---
    py::class_<MemoryLogSink, LogSink, std::shared_ptr<MemoryLogSink>>(m, "MemoryLogSink")
        .def(py::init<>())
        .def("lines",       &MemoryLogSink::lines, py::arg("resource_name"))
        .def("total_lines", &MemoryLogSink::total_lines)
        .def("clear",       &MemoryLogSink::clear);

    // --- CompositeLogSink ---
    py::class_<CompositeLogSink, LogSink, std::shared_ptr<CompositeLogSink>>(m, "CompositeLogSink")
        .def(py::init<>())
        .def("add_sink", &CompositeLogSink::add_sink, py::arg("sink"));
}
