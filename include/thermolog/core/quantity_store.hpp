#pragma once

/**
 * @file quantity_store.hpp
 * @brief Memoizing store of derived quantities for one row filter
 * 
 * The store is a single-slot cache: its contents are valid only for the
 * active filter signature. A request under a different signature, or a
 * forced request, clears every entry (and the cached operating mode)
 * before anything is derived. Entries are never invalidated individually.
 * 
 * Derivation is depth-first over rule prerequisites, so a quantity's
 * inputs are always in the store before its rule runs. If a derivation
 * fails, names derived earlier in the same call stay cached.
 * 
 * Not thread-safe: one writer and one reader per instance.
 * 
 * Example usage:
 * @code
 *   QuantityStore store(dataset, names, units, adapter, RuleSet::standard(), options);
 *   auto q = store.resolve({"Qcond", "Pel"}, {{"file_index", int64_t{1}}});
 *   double first = (*q["Qcond"])[0];   // kW
 * @endcode
 */

#include "thermolog/core/options.hpp"
#include "thermolog/core/types.hpp"
#include "thermolog/core/units.hpp"
#include "thermolog/data/name_table.hpp"
#include "thermolog/data/raw_dataset.hpp"
#include "thermolog/processing/derivation_rules.hpp"
#include "thermolog/processing/filter_engine.hpp"
#include "thermolog/thermo/property_adapter.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thermolog {

class QuantityStore {
public:
    /**
     * @brief Construct an empty store under the empty filter
     * 
     * The dataset, name table and adapter must outlive the store.
     */
    QuantityStore(const RawDataset& dataset,
                  const NameTable& names,
                  std::shared_ptr<const UnitRegistry> units,
                  const IPropertyAdapter& adapter,
                  RuleSet rules,
                  EngineOptions options = {});
    
    // Non-copyable (holds references)
    QuantityStore(const QuantityStore&) = delete;
    QuantityStore& operator=(const QuantityStore&) = delete;
    
    // ========================================================================
    // Resolution
    // ========================================================================
    
    /**
     * @brief Resolve quantities under a filter
     * 
     * @param names Quantity names (duplicates allowed)
     * @param filter Equality constraints selecting the rows
     * @param force Clear the store even if the filter is unchanged
     * @return name -> quantity for every requested name
     * 
     * @throws UnknownQuantity if a name has no rule and no name-table entry
     * @throws MissingColumn if a raw column or filter column is absent
     * @throws DependencyCycle if rules depend on each other in a loop
     */
    QuantityMap resolve(const std::vector<std::string>& names,
                        const Filter& filter = {},
                        bool force = false);
    
    /// Single-name convenience wrapper of resolve()
    std::shared_ptr<const Quantity> resolve_one(const std::string& name,
                                                const Filter& filter = {},
                                                bool force = false);
    
    /// Operating mode of the rows under the filter (resolves the mode flag)
    OperatingMode operating_mode(const Filter& filter = {});
    
    // ========================================================================
    // Inspection
    // ========================================================================
    
    /// Whether the name is currently stored
    bool contains(const std::string& name) const;
    
    /// Stored quantity or nullptr
    std::shared_ptr<const Quantity> peek(const std::string& name) const;
    
    /// Names currently stored, sorted
    std::vector<std::string> stored_names() const;
    
    const FilterSignature& active_filter() const { return active_; }
    
    /// Rows selected by the active filter
    const RowSelection& rows() const { return rows_; }
    
    /// Cached mode of the active filter, if determined
    std::optional<OperatingMode> cached_mode() const { return mode_; }
    
    const UnitRegistry& units() const { return *units_; }
    std::shared_ptr<const UnitRegistry> unit_registry() const { return units_; }
    
    const RuleSet& rules() const { return rules_; }
    const EngineOptions& options() const { return options_; }
    
    /// Counters; entries reflects the current size
    StoreStats stats() const;
    
    /**
     * @brief Drop every entry and reselect the rows of the active filter
     * 
     * Needed when a dataset column the filter may read has been rewritten.
     */
    void clear();
    
private:
    /// Switch to a signature, dropping all entries
    void rebuild(FilterSignature signature);
    
    /// Derive name and its prerequisites if not stored
    void ensure(const std::string& name, std::vector<std::string>& path);
    
    /// Determine the operating mode under the active filter
    OperatingMode ensure_mode(std::vector<std::string>& path);
    
    const RawDataset& dataset_;
    const NameTable& names_;
    std::shared_ptr<const UnitRegistry> units_;
    const IPropertyAdapter& adapter_;
    RuleSet rules_;
    EngineOptions options_;
    FilterEngine filter_engine_;
    
    FilterSignature active_;
    RowSelection rows_;
    QuantityMap entries_;
    std::optional<OperatingMode> mode_;
    StoreStats stats_;
};

} // namespace thermolog
