#include <pybind11/pybind11.h>
#include "agentid/config.hpp"

namespace py = pybind11;

// Forward declarations of binding functions
void init_agent_identity(py::module_& m);
void init_logging(py::module_& m);

PYBIND11_MODULE(agentid, m) {
    m.doc() = "AgentID SDK Python bindings"; // Module docstring
    m.attr("__version__") = "0.1.0";

    // Honor AGENTID_LOG_LEVEL / AGENTID_LOG_FILE before anything logs
    if (!agentid::config::initialize_logging_from_environment()) {
        PyErr_WarnEx(PyExc_RuntimeWarning, "AgentID logging could not be initialized", 1);
    }

    init_agent_identity(m);
    init_logging(m);
}
