#include "bind_forward.hpp"
#include <cloudconnect/cloudconnect.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <memory>

using namespace cloudconnect;

namespace {

// Owns a Python reference; copies and the final release take the GIL, so
// C++ code may copy or drop it from any thread.
class GilObject {
public:
    explicit GilObject(py::object obj) : obj_(std::move(obj)) {}

    GilObject(const GilObject& other) {
        py::gil_scoped_acquire acquire;
        obj_ = other.obj_;
    }

    GilObject& operator=(const GilObject&) = delete;

    ~GilObject() {
        py::gil_scoped_acquire acquire;
        py::object released = std::move(obj_);
    }

    const py::object& get() const { return obj_; }

private:
    py::object obj_;
};

// ---------------------------------------------------------------------------
// Resource implemented in Python. The Python object must provide
// describe() and may provide start_detail().
// ---------------------------------------------------------------------------
class PythonResource : public Resource {
public:
    PythonResource(std::string name, std::string type_tag, py::object impl)
        : Resource(std::move(name), std::move(type_tag))
        , impl_(std::move(impl)) {}

    std::string describe() const override {
        py::gil_scoped_acquire acquire;
        return impl_.get().attr("describe")().cast<std::string>();
    }

    std::string start_detail() const override {
        py::gil_scoped_acquire acquire;
        if (!py::hasattr(impl_.get(), "start_detail")) return {};
        return impl_.get().attr("start_detail")().cast<std::string>();
    }

private:
    GilObject impl_;
};

ResourceRegistry::Factory wrap_python_factory(const std::string& type_name,
                                              py::function factory) {
    GilObject handle(std::move(factory));
    return [type_name, handle](const std::string& name, const FieldBag& fields)
               -> std::unique_ptr<Resource> {
        py::gil_scoped_acquire acquire;
        py::object impl = handle.get()(name, fields);
        if (impl.is_none()) {
            throw ValidationError("name", "factory for '" + type_name + "' returned None");
        }
        return std::make_unique<PythonResource>(name, type_name, std::move(impl));
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_core  --  free helpers, ResourceRegistry, ResourceManager
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    m.def("format_clock_time", &format_clock_time, py::arg("timestamp"));
    m.def("format_audit_line", &format_audit_line,
          py::arg("timestamp"), py::arg("message"));
    m.def("make_default_sink", &make_default_sink, py::arg("config"));

    // ===================================================================
    // ResourceRegistry
    // ===================================================================
    py::class_<ResourceRegistry>(m, "ResourceRegistry")
        .def(py::init<>())
        .def("register_type",
             [](ResourceRegistry& self, const std::string& type_name, py::function factory) {
                 self.register_type(type_name, wrap_python_factory(type_name, std::move(factory)));
             },
             py::arg("type_name"), py::arg("factory"),
             "factory(name, fields) must return an object with a describe() method")
        .def("register_builtin_types",
             [](ResourceRegistry& self) { register_builtin_types(self); })
        .def("create",
             [](const ResourceRegistry& self, const std::string& type_name,
                const std::string& name, const FieldBag& fields) {
                 return self.create(type_name, name, fields)->info();
             },
             py::arg("type_name"), py::arg("name"), py::arg("fields"))
        .def("contains",         &ResourceRegistry::contains, py::arg("type_name"))
        .def("size",             &ResourceRegistry::size)
        .def("registered_types", &ResourceRegistry::registered_types)
        .def("__len__",          &ResourceRegistry::size)
        .def_static("global_registry", &ResourceRegistry::global,
                    py::return_value_policy::reference);

    // ===================================================================
    // ResourceManager
    // ===================================================================
    py::class_<ResourceManager>(m, "ResourceManager")
        .def(py::init([](Config config, std::shared_ptr<LogSink> sink,
                         ResourceRegistry* registry, bool default_sink) {
                 if (default_sink && !sink) {
                     sink = make_default_sink(config);
                 }
                 return std::make_unique<ResourceManager>(
                     std::move(config), std::move(sink),
                     registry ? *registry : ResourceRegistry::global());
             }),
             py::arg("config") = Config{},
             py::arg("sink") = nullptr,
             py::arg("registry") = nullptr,
             py::arg("default_sink") = true,
             py::keep_alive<1, 4>())

        // Resource types
        .def("register_resource_type",
             [](ResourceManager& self, const std::string& type_name, py::function factory) {
                 self.register_resource_type(type_name,
                                             wrap_python_factory(type_name, std::move(factory)));
             },
             py::arg("type_name"), py::arg("factory"))
        .def("registered_types", &ResourceManager::registered_types)

        // Lifecycle
        .def("create_resource", &ResourceManager::create_resource,
             py::arg("type_name"), py::arg("name"), py::arg("fields"),
             py::call_guard<py::gil_scoped_release>())
        .def("start_resource", &ResourceManager::start_resource,
             py::arg("name"), py::call_guard<py::gil_scoped_release>())
        .def("stop_resource", &ResourceManager::stop_resource,
             py::arg("name"), py::call_guard<py::gil_scoped_release>())
        .def("delete_resource", &ResourceManager::delete_resource,
             py::arg("name"), py::call_guard<py::gil_scoped_release>())

        // Queries
        .def("view_logs",         &ResourceManager::view_logs,     py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def("audit_history",     &ResourceManager::audit_history, py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_resource",      &ResourceManager::get_resource,  py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_all_resources", &ResourceManager::get_all_resources,
             py::call_guard<py::gil_scoped_release>())
        .def("resource_count",    &ResourceManager::resource_count,
             py::call_guard<py::gil_scoped_release>())
        .def("contains",          &ResourceManager::contains, py::arg("name"),
             py::call_guard<py::gil_scoped_release>())
        .def("__len__",           &ResourceManager::resource_count,
             py::call_guard<py::gil_scoped_release>())
        .def("__contains__",      &ResourceManager::contains,
             py::call_guard<py::gil_scoped_release>())

        // Configuration
        .def("set_monitor",  &ResourceManager::set_monitor,  py::arg("monitor"))
        .def("set_log_sink", &ResourceManager::set_log_sink, py::arg("sink"))
        .def("log_sink",     &ResourceManager::log_sink,
             py::call_guard<py::gil_scoped_release>())
        .def("config",       &ResourceManager::config,
             py::return_value_policy::reference_internal);
}
