#pragma once

/**
 * @file session.hpp
 * @brief One loaded test campaign: dataset, name table, store and classification
 * 
 * Example usage:
 * @code
 *   auto session = LoggerSession::open({"run1.csv", "run2.csv"}, "names.txt");
 *   auto q = session->get("Qcond/kW T4/degC", {{"file_index", int64_t{1}}});
 *   std::cout << session->validation_report() << std::endl;
 * @endcode
 */

#include "thermolog/core/options.hpp"
#include "thermolog/core/quantity_store.hpp"
#include "thermolog/core/units.hpp"
#include "thermolog/data/csv_loader.hpp"
#include "thermolog/data/name_table.hpp"
#include "thermolog/data/raw_dataset.hpp"
#include "thermolog/processing/derivation_rules.hpp"
#include "thermolog/processing/validation.hpp"
#include "thermolog/thermo/property_adapter.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace thermolog {

/// Quantity resolved under each group key of a column
using GroupedQuantities = std::vector<std::pair<FilterValue, std::shared_ptr<const Quantity>>>;

class LoggerSession : public QuantityReader {
public:
    /**
     * @brief Create a session over a loaded dataset
     * 
     * Applies the default steady-state limits when options.classify_on_load is set.
     */
    LoggerSession(RawDataset dataset,
                  NameTable names,
                  std::shared_ptr<const IPropertyAdapter> adapter,
                  std::shared_ptr<const UnitRegistry> units,
                  EngineOptions options = {},
                  RuleSet rules = RuleSet::standard());
    
    /// Load CSV files and a name table, evaluating properties with CoolProp
    static std::unique_ptr<LoggerSession> open(const std::vector<std::string>& csv_paths,
                                               const std::string& name_table_path,
                                               EngineOptions options = {},
                                               LoggerCsvOptions csv_options = {});
    
    // Non-copyable, non-movable (the store references members)
    LoggerSession(const LoggerSession&) = delete;
    LoggerSession& operator=(const LoggerSession&) = delete;
    LoggerSession(LoggerSession&&) = delete;
    LoggerSession& operator=(LoggerSession&&) = delete;
    
    // ========================================================================
    // Quantities
    // ========================================================================
    
    /**
     * @brief Resolve whitespace-separated names, each optionally "name/unit"
     * 
     * Returned quantities are converted to the requested units, in request
     * order; the store keeps them in their derived units.
     * 
     * @param update Clear the store before resolving
     */
    std::vector<Quantity> get(const std::string& request, const Filter& filter = {},
                              bool update = false);
    
    /// First quantity of get()
    Quantity get_one(const std::string& request, const Filter& filter = {}, bool update = false);
    
    /// Store resolution without unit handling
    QuantityMap resolve(const std::vector<std::string>& names, const Filter& filter = {},
                        bool force = false);
    
    /// Operating mode of the rows under the filter
    OperatingMode operating_mode(const Filter& filter = {});
    
    /// Seconds between the first two samples of the dataset
    double interval_seconds() const { return dataset_.interval_seconds(); }
    
    // ========================================================================
    // Steady state
    // ========================================================================
    
    /// Duration (s) of the steady run containing each sample, whole dataset
    std::vector<double> steady_state_durations();
    
    /**
     * @brief Classify samples by steady-run duration
     * 
     * Writes the steady_state_time label column and clears the store.
     * 
     * @param limits Time quantity; a -inf first or +inf last value opens that end
     * @return Label of each sample
     */
    std::vector<std::optional<std::string>> set_steady_state_limits(const Quantity& limits);
    
    // ========================================================================
    // Grouping
    // ========================================================================
    
    /// Distinct non-null values of a column in first-appearance order
    std::vector<FilterValue> group_keys(const std::string& column) const;
    
    /// Quantity resolved under {column: key} for every group key
    GroupedQuantities grouped(const std::string& name, const std::string& column);
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    std::vector<CheckResult> validate();
    std::string validation_report();
    
    // QuantityReader
    std::shared_ptr<const Quantity> read(const std::string& name) override;
    const UnitRegistry& units() const override { return *units_; }
    
    // ========================================================================
    // Access
    // ========================================================================
    
    const RawDataset& dataset() const { return dataset_; }
    const NameTable& names() const { return names_; }
    const IPropertyAdapter& adapter() const { return *adapter_; }
    const EngineOptions& options() const { return options_; }
    const QuantityStore& store() const { return *store_; }
    std::shared_ptr<const UnitRegistry> unit_registry() const { return units_; }
    
private:
    RawDataset dataset_;
    NameTable names_;
    std::shared_ptr<const IPropertyAdapter> adapter_;
    std::shared_ptr<const UnitRegistry> units_;
    EngineOptions options_;
    std::unique_ptr<QuantityStore> store_;
};

} // namespace thermolog
