#pragma once

/**
 * @file derivation_rules.hpp
 * @brief Statically declared recipes turning raw columns into quantities
 *
 * Rules fall into five categories:
 * - AS_IS: raw column wrapped with the name-table unit, label and property
 * - CLEANED: sentinel readings zeroed (f, flowrt_r)
 * - HUMIDITY_RATIO: moist-air humidity ratio of a state point (ws, wr)
 * - DEPENDENT: heat and power of the cycle, electrical power, elapsed time
 * - ENTHALPY: refrigerant enthalpy at a labelled state (h1..h9)
 *
 * Names without a declared rule that appear in the name table are
 * derived as AS_IS.
 */

#include "thermolog/core/options.hpp"
#include "thermolog/core/quantity.hpp"
#include "thermolog/core/types.hpp"
#include "thermolog/core/units.hpp"
#include "thermolog/data/name_table.hpp"
#include "thermolog/data/raw_dataset.hpp"
#include "thermolog/thermo/property_adapter.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thermolog {

/// Derivation rule categories
enum class RuleCategory {
    AS_IS,
    CLEANED,
    HUMIDITY_RATIO,
    DEPENDENT,
    ENTHALPY
};

const char* to_string(RuleCategory category);

/// Resolved quantities by name
using QuantityMap = std::map<std::string, std::shared_ptr<const Quantity>>;

/// Everything a rule may read while deriving one quantity
struct DerivationContext {
    const RawDataset& dataset;
    const RowSelection& rows;               ///< Rows of the active filter
    const NameTable& names;
    const UnitRegistry& units;
    const IPropertyAdapter& adapter;
    const EngineOptions& options;
    std::optional<OperatingMode> mode;      ///< Set for mode-dependent rules
    const QuantityMap& available;           ///< Prerequisites already derived
    
    /// Prerequisite quantity; throws UnknownQuantity if not derived
    const Quantity& input(const std::string& name) const;
    
    /// Operating mode; throws Error if the rule did not request it
    OperatingMode require_mode() const;
};

/// Recipe for one quantity name
struct DerivationRule {
    std::string name;
    RuleCategory category = RuleCategory::AS_IS;
    
    /// Prerequisites depend on the operating mode
    bool mode_dependent = false;
    
    /// Quantity names needed before derive() runs
    std::function<std::vector<std::string>(std::optional<OperatingMode>)> prerequisites;
    
    /// Compute the quantity over ctx.rows
    std::function<Quantity(const DerivationContext&)> derive;
};

/// Closed set of derivation rules
class RuleSet {
public:
    RuleSet() = default;
    
    /// Rules for f, flowrt_r, ws, wr, Qcond, Qev, Pcomp, Qloss_ev, Pel, t, h1..h9
    static RuleSet standard();
    
    /// Add or replace a rule
    void add(DerivationRule rule);
    
    /// Declared rule, or nullptr
    const DerivationRule* find(const std::string& name) const;
    
    /// Declared rule, else an AS_IS rule when the name table knows the name
    std::optional<DerivationRule> lookup(const std::string& name, const NameTable& names) const;
    
    /// Declared rule names, sorted
    std::vector<std::string> names() const;
    
    /// Rule reading a name-table column unchanged
    static DerivationRule as_is(const std::string& name);
    
private:
    std::map<std::string, DerivationRule> rules_;
};

/// Cleaned raw readings of a name-table quantity: sentinel tokens and
/// non-finite values become 0
/// @throws ParseError on text that is neither a number nor a sentinel
std::vector<double> cleaned_column(const DerivationContext& ctx, const std::string& quantity);

/// Heating iff fewer than half of the flag samples are non-zero
OperatingMode majority_mode(std::span<const double> flags);

} // namespace thermolog
