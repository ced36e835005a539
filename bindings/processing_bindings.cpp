#include "numpy_conversion.hpp"
#include "thermolog/processing/binner.hpp"
#include "thermolog/processing/filter_engine.hpp"
#include "thermolog/processing/heat_transfer.hpp"
#include "thermolog/processing/steady_state.hpp"
#include "thermolog/processing/validation.hpp"
#include "thermolog/thermo/property_adapter.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace thermolog;
using bindings::ContiguousArray;
using bindings::to_vector;

void bind_processing(py::module_ &m) {
  // ===== STEADY STATE =====

  py::class_<SteadyRunState>(m, "SteadyRunState",
                             "Running statistics of the current steady run")
      .def(py::init<>())
      .def_readonly("mean", &SteadyRunState::mean)
      .def_readonly("variance", &SteadyRunState::variance)
      .def_readonly("run_length", &SteadyRunState::run_length)
      .def("start", &SteadyRunState::start, py::arg("x"))
      .def("step", &SteadyRunState::step, py::arg("x"), py::arg("sd_limit"),
           "Feed a sample; returns the length of the run it closed, or 0");

  py::class_<SteadyStateSegmenter>(m, "SteadyStateSegmenter")
      .def(py::init<double>(), py::arg("sd_limit_hz") = 2.0)
      .def_property_readonly("sd_limit", &SteadyStateSegmenter::sd_limit)
      .def(
          "run_lengths",
          [](const SteadyStateSegmenter &self, ContiguousArray frequency) {
            return self.run_lengths(to_vector(frequency));
          },
          py::arg("frequency"))
      .def(
          "durations",
          [](const SteadyStateSegmenter &self, ContiguousArray frequency,
             double interval_seconds) {
            auto d = self.durations(to_vector(frequency), interval_seconds);
            return py::array_t<double>(d.size(), d.data());
          },
          py::arg("frequency"), py::arg("interval_seconds"));

  // ===== BINNER =====

  py::class_<Binner>(m, "Binner", "Steady-run duration intervals")
      .def(py::init<std::vector<double>, bool, bool>(), py::arg("thresholds_s"),
           py::arg("include_open_low"), py::arg("include_open_high"))
      .def_static("from_limits", &Binner::from_limits, py::arg("limits_s"))
      .def("label", &Binner::label, py::arg("duration_s"))
      .def(
          "bin",
          [](const Binner &self, ContiguousArray durations) {
            return self.bin(to_vector(durations));
          },
          py::arg("durations_s"))
      .def("labels", &Binner::labels)
      .def_property_readonly("thresholds", &Binner::thresholds);

  // ===== FILTER SIGNATURE =====

  py::class_<FilterSignature>(m, "FilterSignature",
                              "Canonical equality-filter cache key")
      .def(py::init<const Filter &>(), py::arg("filter"))
      .def_property_readonly("key", &FilterSignature::key)
      .def("empty", &FilterSignature::empty)
      .def("__eq__", &FilterSignature::operator==);

  // ===== PROPERTIES =====

  py::enum_<Phase>(m, "Phase")
      .value("LIQUID", Phase::LIQUID)
      .value("GAS", Phase::GAS)
      .value("TWO_PHASE", Phase::TWO_PHASE)
      .value("SUPERCRITICAL", Phase::SUPERCRITICAL)
      .value("SUPERCRITICAL_GAS", Phase::SUPERCRITICAL_GAS)
      .value("SUPERCRITICAL_LIQUID", Phase::SUPERCRITICAL_LIQUID)
      .value("UNKNOWN", Phase::UNKNOWN);

  m.def("pressure_side", &pressure_side, py::arg("state"), py::arg("mode"),
        "Pressure quantity ('pin' or 'pout') of a state number");

  // ===== VALIDATION =====

  py::class_<CheckResult>(m, "CheckResult")
      .def_readonly("name", &CheckResult::name)
      .def_readonly("passed", &CheckResult::passed)
      .def_readonly("message", &CheckResult::message)
      .def_readonly("quantities", &CheckResult::quantities);

  m.def("validation_report", &Validator::report, py::arg("results"));
}
