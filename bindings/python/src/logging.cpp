#include <pybind11/pybind11.h>
#include "agentid/config.hpp"
#include "agentid/utilities.hpp"

namespace py = pybind11;
using namespace agentid;

void init_logging(py::module_& m) {
    m.def("init_logging",
        [](const std::string& level, const std::string& log_file) {
            auto parsed = config::parse_log_level(level);
            if (!parsed) {
                throw py::value_error("unknown log level: " + level);
            }
            return utilities::initialize_logging(log_file, *parsed);
        },
        py::arg("level") = "info",
        py::arg("log_file") = "",
        "Reconfigure AgentID logging; returns True on success");
}
