#pragma once

/**
 * @file errors.hpp
 * @brief Exception taxonomy of the thermolog engine
 *
 * Every failure is raised immediately to the caller. Phase mismatches
 * during enthalpy evaluation are corrected, not reported here.
 */

#include <stdexcept>
#include <string>

namespace thermolog {

/// Base class for all engine errors
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Requested name is neither a derivation rule nor a name-table entry
class UnknownQuantity : public Error {
public:
    explicit UnknownQuantity(const std::string& name, const std::string& detail = "")
        : Error("Unknown quantity: " + name + (detail.empty() ? "" : " (" + detail + ")"))
        , name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// Name table or dataset lacks the column a quantity is read from
class MissingColumn : public Error {
public:
    explicit MissingColumn(const std::string& column, const std::string& detail = "")
        : Error("Missing column: " + column + (detail.empty() ? "" : " (" + detail + ")"))
        , column_(column) {}

    const std::string& column() const { return column_; }

private:
    std::string column_;
};

/// Derivation rules depend on each other in a loop
class DependencyCycle : public Error {
public:
    explicit DependencyCycle(const std::string& path)
        : Error("Dependency cycle: " + path) {}
};

/// Arithmetic, comparison or conversion between incompatible units
class IncompatibleUnits : public Error {
public:
    explicit IncompatibleUnits(const std::string& what)
        : Error("Incompatible units: " + what) {}
};

/// Binning thresholds or segmentation limit are malformed
class InvalidThreshold : public Error {
public:
    explicit InvalidThreshold(const std::string& what)
        : Error("Invalid threshold: " + what) {}
};

/// Series too short for the requested operation
class EmptySeries : public Error {
public:
    explicit EmptySeries(const std::string& what)
        : Error("Empty series: " + what) {}
};

/// Malformed input file
class ParseError : public Error {
public:
    explicit ParseError(const std::string& what)
        : Error("Parse error: " + what) {}
};

/// Property library could not evaluate a finite state
class PropertyError : public Error {
public:
    explicit PropertyError(const std::string& what)
        : Error("Property evaluation: " + what) {}
};

} // namespace thermolog
