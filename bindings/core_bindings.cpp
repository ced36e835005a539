/**
 * @file core_bindings.cpp
 * @brief Python bindings for units, quantities and the logger session
 * 
 * Exposes:
 * - Engine errors as Python exceptions
 * - Unit, UnitRegistry, Quantity
 * - EngineOptions, StoreStats, OperatingMode
 * - LoggerSession
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include "thermolog/core/errors.hpp"
#include "thermolog/core/options.hpp"
#include "thermolog/core/quantity.hpp"
#include "thermolog/core/session.hpp"
#include "thermolog/core/types.hpp"
#include "thermolog/core/units.hpp"

namespace py = pybind11;

namespace thermolog {

namespace {

py::array_t<double> to_numpy(const Quantity& q) {
    return py::array_t<double>(q.size(), q.values().data());
}

} // namespace

/**
 * @brief Initialize core bindings
 */
void init_core_bindings(py::module& m) {
    // ========================================================================
    // Errors
    // ========================================================================
    // Translators run newest first, so the base class is registered first
    auto& error = py::register_exception<Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<UnknownQuantity>(m, "UnknownQuantity", error.ptr());
    py::register_exception<MissingColumn>(m, "MissingColumn", error.ptr());
    py::register_exception<DependencyCycle>(m, "DependencyCycle", error.ptr());
    py::register_exception<IncompatibleUnits>(m, "IncompatibleUnits", error.ptr());
    py::register_exception<InvalidThreshold>(m, "InvalidThreshold", error.ptr());
    py::register_exception<EmptySeries>(m, "EmptySeries", error.ptr());
    py::register_exception<ParseError>(m, "ParseError", error.ptr());
    py::register_exception<PropertyError>(m, "PropertyError", error.ptr());
    
    // ========================================================================
    // Units
    // ========================================================================
    py::class_<Unit>(m, "Unit", "Physical unit relative to SI base units")
        .def_readonly("symbol", &Unit::symbol)
        .def_readonly("scale", &Unit::scale)
        .def_readonly("offset", &Unit::offset)
        .def_property_readonly("dimension",
            [](const Unit& u) { return u.dimension.to_string(); })
        .def("__eq__", &Unit::operator==)
        .def("__repr__", [](const Unit& u) {
            return "<Unit '" + u.symbol + "' " + u.dimension.to_string() + ">";
        });
    
    py::class_<UnitRegistry, std::shared_ptr<UnitRegistry>>(m, "UnitRegistry",
        "Named units with expression parsing")
        .def_static("standard", []() {
            return std::const_pointer_cast<UnitRegistry>(UnitRegistry::standard());
        })
        .def("get", &UnitRegistry::get, py::arg("expression"))
        .def("has", &UnitRegistry::has, py::arg("expression"))
        .def("symbols", &UnitRegistry::symbols);
    
    // ========================================================================
    // Quantity
    // ========================================================================
    py::class_<Quantity>(m, "Quantity", "Unit-tagged array with label and property")
        .def(py::init([](std::vector<double> values, const Unit& unit,
                         std::string label, std::string property) {
                 return Quantity(std::move(values), unit, std::move(label), std::move(property));
             }),
             py::arg("values"), py::arg("unit"), py::arg("label") = "",
             py::arg("property") = "")
        .def_property_readonly("magnitude", &to_numpy, "Values as NumPy array (copy)")
        .def_property_readonly("unit", &Quantity::unit)
        .def_property_readonly("label", &Quantity::label)
        .def_property_readonly("property", &Quantity::property)
        .def("to", &Quantity::to, py::arg("unit"))
        .def("__len__", &Quantity::size)
        .def("__getitem__", [](const Quantity& q, size_t i) {
            if (i >= q.size()) throw py::index_error();
            return q[i];
        })
        .def("__repr__", [](const Quantity& q) {
            return "<Quantity " + (q.label().empty() ? std::string("?") : q.label()) +
                   " [" + q.unit().symbol + "] n=" + std::to_string(q.size()) + ">";
        });
    
    // ========================================================================
    // Options and statistics
    // ========================================================================
    py::enum_<OperatingMode>(m, "OperatingMode")
        .value("HEATING", OperatingMode::HEATING)
        .value("COOLING", OperatingMode::COOLING);
    
    py::class_<EngineOptions>(m, "EngineOptions", "Engine configuration")
        .def(py::init<>())
        .def_readwrite("fluid", &EngineOptions::fluid)
        .def_readwrite("atmospheric_pressure_pa", &EngineOptions::atmospheric_pressure_pa)
        .def_readwrite("frequency_divisor", &EngineOptions::frequency_divisor)
        .def_readwrite("sentinel_tokens", &EngineOptions::sentinel_tokens)
        .def_readwrite("steady_state_sd_limit_hz", &EngineOptions::steady_state_sd_limit_hz)
        .def_readwrite("default_steady_state_limits_min",
                       &EngineOptions::default_steady_state_limits_min)
        .def_readwrite("classify_on_load", &EngineOptions::classify_on_load)
        .def_readwrite("verbose", &EngineOptions::verbose);
    
    py::class_<StoreStats>(m, "StoreStats", "Quantity store counters")
        .def_readonly("hits", &StoreStats::hits)
        .def_readonly("derivations", &StoreStats::derivations)
        .def_readonly("rebuilds", &StoreStats::rebuilds)
        .def_readonly("entries", &StoreStats::entries)
        .def_readonly("hit_rate", &StoreStats::hit_rate);
    
    // ========================================================================
    // LoggerSession
    // ========================================================================
    py::class_<LoggerSession>(m, "LoggerSession", "Loaded test campaign")
        .def_static("open", &LoggerSession::open,
            py::arg("csv_paths"), py::arg("name_table_path"),
            py::arg("options") = EngineOptions(),
            py::arg("csv_options") = LoggerCsvOptions())
        .def("get", &LoggerSession::get,
            py::arg("request"), py::arg("filter") = Filter(), py::arg("update") = false,
            "Resolve 'name[/unit] ...' under an equality filter")
        .def("get_one", &LoggerSession::get_one,
            py::arg("request"), py::arg("filter") = Filter(), py::arg("update") = false)
        .def("operating_mode", &LoggerSession::operating_mode, py::arg("filter") = Filter())
        .def("interval_seconds", &LoggerSession::interval_seconds)
        .def("steady_state_durations", [](LoggerSession& s) {
            auto d = s.steady_state_durations();
            return py::array_t<double>(d.size(), d.data());
        })
        .def("set_steady_state_limits", &LoggerSession::set_steady_state_limits,
            py::arg("limits"))
        .def("group_keys", &LoggerSession::group_keys, py::arg("column"))
        .def("grouped", [](LoggerSession& s, const std::string& name, const std::string& column) {
            std::vector<std::pair<FilterValue, Quantity>> groups;
            for (const auto& [key, quantity] : s.grouped(name, column)) {
                groups.emplace_back(key, *quantity);
            }
            return groups;
        }, py::arg("name"), py::arg("column"))
        .def("validate", &LoggerSession::validate)
        .def("validation_report", &LoggerSession::validation_report)
        .def("stats", [](const LoggerSession& s) { return s.store().stats(); })
        .def_property_readonly("dataset", &LoggerSession::dataset,
            py::return_value_policy::reference_internal);
}

} // namespace thermolog
