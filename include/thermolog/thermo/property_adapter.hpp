#pragma once

/**
 * @file property_adapter.hpp
 * @brief Thermophysical property interface of the working fluid and moist air
 *
 * All values are SI: pressure in Pa, temperature in K, enthalpy in J/kg,
 * relative humidity and humidity ratio as fractions. Non-finite inputs
 * yield NaN (enthalpies, humidity ratios) or Phase::UNKNOWN.
 */

#include <span>
#include <string>
#include <vector>

namespace thermolog {

/// Thermodynamic phase of a fluid state
enum class Phase {
    LIQUID,
    GAS,
    TWO_PHASE,
    SUPERCRITICAL,
    SUPERCRITICAL_GAS,
    SUPERCRITICAL_LIQUID,
    UNKNOWN
};

/// Phase name as reported by the property library ("liquid", "twophase", ...)
const char* to_string(Phase phase);

/// Parse a property-library phase name; unrecognised names give UNKNOWN
Phase parse_phase(const std::string& name);

/**
 * @brief Property evaluation for a fixed working fluid
 */
class IPropertyAdapter {
public:
    virtual ~IPropertyAdapter() = default;
    
    /// Working fluid identifier (e.g. "R410a")
    virtual const std::string& fluid() const = 0;
    
    /// Specific enthalpy at (p, T)
    virtual double enthalpy(double pressure_pa, double temperature_k) const = 0;
    
    /// Saturated enthalpy at p for vapor quality 0 (liquid) or 1 (gas)
    virtual double enthalpy_at_quality(double pressure_pa, double quality) const = 0;
    
    /// Phase at (p, T)
    virtual Phase phase(double pressure_pa, double temperature_k) const = 0;
    
    /// Moist-air humidity ratio (kg water / kg dry air) at (p, T, RH)
    virtual double humidity_ratio(double pressure_pa, double temperature_k,
                                  double relative_humidity) const = 0;
    
    // ===== ARRAY HELPERS =====
    
    std::vector<double> enthalpies(std::span<const double> pressure_pa,
                                 std::span<const double> temperature_k) const;
    
    std::vector<Phase> phases(std::span<const double> pressure_pa,
                             std::span<const double> temperature_k) const;
    
    std::vector<double> humidity_ratios(double pressure_pa,
                                       std::span<const double> temperature_k,
                                       std::span<const double> relative_humidity) const;
};

} // namespace thermolog
