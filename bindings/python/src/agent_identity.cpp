#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "agentid/agent_handle.hpp"
#include "agentid/validation_error.hpp"

#include <functional>

namespace py = pybind11;
using namespace agentid;

void init_agent_identity(py::module_& m) {
    // Validation failures surface as agentid.IdentityError, a ValueError
    py::register_exception<IdentityError>(m, "IdentityError", PyExc_ValueError);

    py::class_<AgentHandle>(m, "PyAgent", "A validated, immutable agent identity")
        .def(py::init([](const std::string& id) {
                 return AgentHandle::create(id);
             }),
             py::arg("id"),
             "Create an agent identity; raises IdentityError if id is empty")
        .def_property_readonly("id", &AgentHandle::id, "The agent identifier")
        .def_property_readonly("fingerprint",
            [](const AgentHandle& handle) {
                return handle.identity().fingerprint();
            },
            "Hex SHA-256 of the identifier")
        .def("to_json",
            [](const AgentHandle& handle) {
                return handle.identity().to_json();
            })
        .def_static("from_json",
            [](const std::string& json) {
                return AgentHandle::from_result(AgentIdentity::from_json(json));
            },
            py::arg("json"))
        .def("__eq__",
            [](const AgentHandle& lhs, const AgentHandle& rhs) {
                return lhs == rhs;
            },
            py::is_operator())
        .def("__ne__",
            [](const AgentHandle& lhs, const AgentHandle& rhs) {
                return lhs != rhs;
            },
            py::is_operator())
        .def("__hash__",
            [](const AgentHandle& handle) {
                return std::hash<AgentIdentity>()(handle.identity());
            })
        .def("__str__", &AgentHandle::id)
        .def("__repr__",
            [](const AgentHandle& handle) {
                return "PyAgent(" + py::repr(py::str(handle.id())).cast<std::string>() + ")";
            });

    m.attr("AgentIdentity") = m.attr("PyAgent");
}
