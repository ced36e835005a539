#include "thermolog/data/column.hpp"
#include "thermolog/data/csv_loader.hpp"
#include "thermolog/data/name_table.hpp"
#include "thermolog/data/raw_dataset.hpp"
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace thermolog;

/// Initialize data-related Python bindings
void init_data_bindings(py::module &m) {

  // ===== ColumnType Enum =====
  py::enum_<ColumnType>(m, "ColumnType", "Column data types")
      .value("FLOAT64", ColumnType::FLOAT64, "64-bit floating point")
      .value("INT64", ColumnType::INT64, "64-bit integer")
      .value("STRING", ColumnType::STRING, "Raw text")
      .value("LABEL", ColumnType::LABEL, "Nullable text label")
      .export_values();

  // ===== LoggerCsvOptions =====
  py::class_<LoggerCsvOptions>(m, "LoggerCsvOptions", "Data-logger CSV options")
      .def(py::init<>(), "Default constructor")
      .def_readwrite("delimiter", &LoggerCsvOptions::delimiter,
                     "Field delimiter (default: ',')")
      .def_readwrite("timestamp_column", &LoggerCsvOptions::timestamp_column,
                     "Timestamp column (default: 'Timestamp')")
      .def_readwrite("timestamp_formats", &LoggerCsvOptions::timestamp_formats,
                     "strptime formats tried in order")
      .def_readwrite("condition_keywords", &LoggerCsvOptions::condition_keywords,
                     "Keywords marking a test conditions first line")
      .def_readwrite("verbose", &LoggerCsvOptions::verbose)
      .def("__repr__", [](const LoggerCsvOptions &opts) {
        return "<LoggerCsvOptions delimiter='" + std::string(1, opts.delimiter) +
               "' timestamp_column='" + opts.timestamp_column + "'>";
      });

  // ===== RawDataset =====
  py::class_<RawDataset>(m, "RawDataset", "Loaded data-logger samples")
      .def_static(
          "load_csv",
          [](const std::vector<std::string> &paths, const LoggerCsvOptions &opts) {
            return RawDataset::load_csv(paths, opts);
          },
          py::arg("paths"), py::arg("options") = LoggerCsvOptions(),
          "Load and concatenate data-logger CSV files")
      .def("row_count", &RawDataset::row_count)
      .def("column_count", &RawDataset::column_count)
      .def("column_names", &RawDataset::column_names)
      .def("has_column", &RawDataset::has_column, py::arg("name"))
      .def("column_type", &RawDataset::column_type, py::arg("name"))
      .def("interval_seconds", &RawDataset::interval_seconds)
      .def_property_readonly("test_conditions", &RawDataset::test_conditions)
      .def_property_readonly("source_files", &RawDataset::source_files)
      .def(
          "numeric",
          [](const RawDataset &ds, const std::string &name) {
            auto values = ds.gather_numeric(name, ds.all_rows());
            return py::array_t<double>(values.size(), values.data());
          },
          py::arg("name"), "Column as float64 NumPy array (copy)")
      .def(
          "text",
          [](const RawDataset &ds, const std::string &name) {
            return ds.gather_text(name, ds.all_rows());
          },
          py::arg("name"), "Column rendered as strings")
      .def("__len__", &RawDataset::row_count)
      .def("__repr__", [](const RawDataset &ds) {
        return "<RawDataset rows=" + std::to_string(ds.row_count()) +
               " columns=" + std::to_string(ds.column_count()) + ">";
      });

  // ===== NameTable =====
  py::class_<NameEntry>(m, "NameEntry", "Raw column and metadata of a quantity")
      .def(py::init<>())
      .def_readwrite("quantity", &NameEntry::quantity)
      .def_readwrite("column", &NameEntry::column)
      .def_readwrite("unit", &NameEntry::unit)
      .def_readwrite("label", &NameEntry::label)
      .def_readwrite("property", &NameEntry::property);

  py::class_<NameTable>(m, "NameTable", "Quantity name lookup table")
      .def(py::init<>())
      .def_static("load", &NameTable::load, py::arg("path"))
      .def("add", &NameTable::add, py::arg("entry"))
      .def(
          "find",
          [](const NameTable &t, const std::string &q) -> std::optional<NameEntry> {
            const NameEntry *entry = t.find(q);
            return entry ? std::optional<NameEntry>(*entry) : std::nullopt;
          },
          py::arg("quantity"))
      .def("__contains__", &NameTable::contains)
      .def("__len__", &NameTable::size)
      .def("names", &NameTable::names);
}
