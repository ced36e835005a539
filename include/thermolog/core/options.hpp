#pragma once

/**
 * @file options.hpp
 * @brief Engine-wide configuration
 */

#include "thermolog/core/types.hpp"
#include <limits>
#include <string>
#include <vector>

namespace thermolog {

/**
 * @brief Configuration of a logger session and its quantity store
 */
struct EngineOptions {
    /// Working fluid identifier handed to the property adapter
    std::string fluid = "R410a";
    
    /// Pressure at which humidity ratios are evaluated (Pa)
    double atmospheric_pressure_pa = constants::ATMOSPHERIC_PRESSURE_PA;
    
    /// Cleaned f = raw frequency / divisor
    double frequency_divisor = constants::FREQUENCY_DIVISOR;
    
    /// Raw tokens replaced by zero in cleaned quantities
    std::vector<std::string> sentinel_tokens = {"UnderRange", "OverRange"};
    
    /// Standard deviation limit of f delimiting steady runs (Hz)
    double steady_state_sd_limit_hz = constants::DEFAULT_SD_LIMIT_HZ;
    
    /// Steady-state duration limits (minutes), infinite ends open the outer bins
    std::vector<double> default_steady_state_limits_min = {
        -std::numeric_limits<double>::infinity(), 1.0, 30.0, 60.0,
        std::numeric_limits<double>::infinity()
    };
    
    /// Classify steady-state durations when the session is created
    bool classify_on_load = true;
    
    /// Diagnostic logging to stderr
    bool verbose = false;
};

} // namespace thermolog
