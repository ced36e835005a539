#pragma once

/**
 * @file types.hpp
 * @brief Core value types shared across the thermolog engine
 *
 * Defines the filter signature value types, the operating mode of a
 * heat-pump test, store statistics and engine-wide constants.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace thermolog {

// ============================================================================
// Filter Types
// ============================================================================

/// Value a dataset column must equal for a row to be selected
using FilterValue = std::variant<int64_t, double, std::string>;

/// Equality constraints (column name -> required value), ANDed together
using Filter = std::map<std::string, FilterValue>;

// ============================================================================
// Thermodynamic Cycle
// ============================================================================

/// Direction of the refrigerant cycle during a test
enum class OperatingMode {
    HEATING,    ///< Indoor coil is the condenser
    COOLING     ///< Indoor coil is the evaporator
};

/// Human-readable mode name ("heating" / "cooling")
inline const char* to_string(OperatingMode mode) {
    return mode == OperatingMode::HEATING ? "heating" : "cooling";
}

// ============================================================================
// Store Statistics
// ============================================================================

/**
 * @brief Counters describing quantity store activity
 */
struct StoreStats {
    size_t hits;            ///< Requests served from the store
    size_t derivations;     ///< Quantities computed
    size_t rebuilds;        ///< Whole-store invalidations
    size_t entries;         ///< Quantities currently held
    double hit_rate;        ///< hits / (hits + derivations)

    StoreStats()
        : hits(0), derivations(0), rebuilds(0), entries(0), hit_rate(0.0) {}

    /// Recalculate hit rate from the counters
    void update_hit_rate() {
        size_t total = hits + derivations;
        hit_rate = total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Standard atmosphere used for psychrometric evaluations (Pa)
    constexpr double ATMOSPHERIC_PRESSURE_PA = 101325.0;

    /// Default standard deviation limit of the compressor frequency (Hz)
    constexpr double DEFAULT_SD_LIMIT_HZ = 2.0;

    /// Raw logger frequency is this many times the compressor frequency
    constexpr double FREQUENCY_DIVISOR = 2.0;

    /// Lowest and highest thermodynamic state numbers of the test rig
    constexpr int FIRST_STATE = 1;
    constexpr int LAST_STATE = 9;

    /// Quantity whose majority value selects the operating mode (0 = heating)
    constexpr const char* MODE_FLAG_QUANTITY = "refdir";

    /// Name of the label column written by steady-state classification
    constexpr const char* STEADY_STATE_COLUMN = "steady_state_time";

    /// Columns added to every row by the data-logger loader
    constexpr const char* TIMESTAMP_COLUMN = "Timestamp";
    constexpr const char* FILE_INDEX_COLUMN = "file_index";
    constexpr const char* TEST_PERIOD_COLUMN = "test_period";
    constexpr const char* TEST_DURATION_COLUMN = "test_duration";
}

} // namespace thermolog
