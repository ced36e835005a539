#pragma once

/**
 * @file validation.hpp
 * @brief Plausibility checks run against resolved quantities
 *
 * Checks only see a QuantityReader, never the store or the dataset.
 * The registry is a fixed list:
 * - humidity_check (wr, ws): supply air must not be more humid than return air
 * - cycling_check (f): variance of the compressor frequency reveals cycling
 */

#include "thermolog/core/quantity.hpp"
#include "thermolog/core/units.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thermolog {

/// Read-only access to quantities and the unit registry
class QuantityReader {
public:
    virtual ~QuantityReader() = default;
    
    /// Quantity over the whole dataset
    virtual std::shared_ptr<const Quantity> read(const std::string& name) = 0;
    
    virtual const UnitRegistry& units() const = 0;
};

/// Outcome of one check
struct CheckResult {
    std::string name;
    bool passed = true;
    std::string message;                    ///< Warning text, empty when passed
    std::vector<std::string> quantities;    ///< Quantities the check inspected
};

/// Registered check
struct ValidationCheck {
    std::string name;
    std::string description;
    std::vector<std::string> quantities;
    
    /// Warning message, or nullopt when the data pass
    std::function<std::optional<std::string>(QuantityReader&)> run;
};

class Validator {
public:
    /// Registered checks in execution order
    static const std::vector<ValidationCheck>& checks();
    
    /// Run every check
    static std::vector<CheckResult> run(QuantityReader& reader);
    
    /**
     * @brief Human-readable summary
     *
     * "No warnings", "Warning: <message>" for one failure, or a numbered
     * list headed "There are N warnings:".
     */
    static std::string report(const std::vector<CheckResult>& results);
    
    /// Quantities involved in failing checks, in check order
    static std::vector<std::string> failing_quantities(const std::vector<CheckResult>& results);
};

} // namespace thermolog
