#pragma once

/**
 * @file heat_transfer.hpp
 * @brief Refrigerant-side heat and power of the cycle processes
 *
 * Each process is bounded by two labelled state points whose pressure
 * side and expected phase depend on the operating mode:
 *
 * | mode    | process  | inlet     | outlet    | phases (in, out) |
 * |---------|----------|-----------|-----------|------------------|
 * | heating | Qcond    | pout, T4  | pout, T6  | gas, liquid      |
 * | heating | Qev      | pout, T6  | pin, T9   | liquid, gas      |
 * | both    | Pcomp    | pin, T1   | pout, T2  | gas, gas         |
 * | cooling | Qcond    | pout, T9  | pout, T7  | gas, liquid      |
 * | cooling | Qev      | pout, T7  | pin, T4   | liquid, gas      |
 * | cooling | Qloss_ev | pin, T4   | pin, T1   | gas, gas         |
 */

#include "thermolog/core/quantity.hpp"
#include "thermolog/core/types.hpp"
#include "thermolog/core/units.hpp"
#include "thermolog/thermo/property_adapter.hpp"
#include <span>
#include <string>
#include <vector>

namespace thermolog {

/// Measured state point bounding a process
struct StatePoint {
    std::string pressure;   ///< Pressure quantity name ("pin" or "pout")
    int state;              ///< Temperature state number (T1..T9)
    Phase expected;         ///< Phase the fluid must be in at this point

    std::string temperature() const { return "T" + std::to_string(state); }
};

/// Heat exchanger or compressor process
struct ProcessDefinition {
    std::string name;       ///< Quantity name ("Qcond")
    StatePoint inlet;
    StatePoint outlet;
    bool heat_rejection;    ///< Result sign-flipped so rejected heat is positive
    std::string label;
    std::string property;
};

/// Process definition for the mode, or nullptr if the process does not
/// exist in that mode
const ProcessDefinition* find_process(const std::string& name, OperatingMode mode);

/// Whether the name is a process in any mode
bool is_process(const std::string& name);

/// Pressure quantity ("pin" or "pout") of a state number in a mode
/// @throws UnknownQuantity if the state is outside 1..9
std::string pressure_side(int state, OperatingMode mode);

/// Enthalpies with phase-mismatched samples replaced by saturated values
struct CorrectedEnthalpy {
    std::vector<double> values;     ///< J/kg
    size_t corrections = 0;         ///< Samples replaced
};

/**
 * @brief Enthalpy at (p, T) with phase correction
 *
 * Samples whose phase differs from the expected one take the saturated
 * enthalpy at the same pressure (quality 0 for liquid, 1 for gas). When
 * every phase matches the result equals the uncorrected enthalpies.
 *
 * @param pressure_pa Pressures in Pa
 * @param temperature_k Temperatures in K
 * @param expected LIQUID or GAS
 */
CorrectedEnthalpy corrected_enthalpy(const IPropertyAdapter& adapter,
                                     std::span<const double> pressure_pa,
                                     std::span<const double> temperature_k,
                                     Phase expected);

/// flow * (h_out - h_in) in kW, negated for heat rejection
Quantity process_power(const ProcessDefinition& process,
                       const Quantity& flow,
                       const Quantity& h_in,
                       const Quantity& h_out,
                       const UnitRegistry& units);

} // namespace thermolog
