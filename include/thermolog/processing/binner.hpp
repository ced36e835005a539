#pragma once

/**
 * @file binner.hpp
 * @brief Labels steady-run durations with half-open duration intervals
 *
 * Thresholds t0 < t1 < ... < tk (seconds) define the intervals
 * [t(i), t(i+1)), lower bound inclusive. Durations below t0 are labelled
 * "τ < t0" only when the low end is open; durations at or above tk are
 * labelled "τ ≥ tk" only when the high end is open. Others get no label.
 */

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace thermolog {

class Binner {
public:
    /**
     * @param thresholds_s Finite, strictly ascending thresholds in seconds
     * @throws InvalidThreshold on fewer than two thresholds, non-finite or
     *         non-ascending values
     */
    Binner(std::vector<double> thresholds_s, bool include_open_low, bool include_open_high);
    
    /// Limits in seconds whose first/last element may be -inf/+inf to open that end
    static Binner from_limits(std::vector<double> limits_s);
    
    /// Label of one duration (seconds), nullopt if unclassified
    std::optional<std::string> label(double duration_s) const;
    
    /// Label of every duration
    std::vector<std::optional<std::string>> bin(std::span<const double> durations_s) const;
    
    /// Every label the binner can produce, from shortest to longest
    std::vector<std::string> labels() const;
    
    const std::vector<double>& thresholds() const { return thresholds_; }
    bool include_open_low() const { return open_low_; }
    bool include_open_high() const { return open_high_; }
    
    /// Labels use minutes when the second threshold is at least one minute
    bool display_minutes() const { return thresholds_[1] >= 60.0; }
    
private:
    std::string format(double seconds) const;
    std::string between(size_t k) const;
    
    std::vector<double> thresholds_;
    bool open_low_;
    bool open_high_;
};

} // namespace thermolog
