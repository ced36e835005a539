#pragma once

/**
 * @file steady_state.hpp
 * @brief Online segmentation of the compressor frequency into steady runs
 *
 * A run grows while the standard deviation of its samples stays within
 * the limit. The sample that pushes it over the limit closes the run and
 * becomes the first sample of the next one.
 */

#include "thermolog/core/types.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace thermolog {

/**
 * @brief Running statistics of the current steady run
 *
 * Growing-window recurrence, with n = run_length:
 *   mean' = (n * mean + x) / (n + 1)
 *   var'  = (n * (var + mean^2) + x^2) / (n + 1) - mean'^2
 */
struct SteadyRunState {
    double mean = 0.0;
    double variance = 0.0;
    size_t run_length = 0;
    
    /// Begin a run at x
    void start(double x) {
        mean = x;
        variance = 0.0;
        run_length = 1;
    }
    
    /**
     * @brief Feed the next sample
     * @return Length of the run closed by x, or 0 if x extended the run
     */
    size_t step(double x, double sd_limit);
};

class SteadyStateSegmenter {
public:
    /// @throws InvalidThreshold if the limit is not a positive finite value
    explicit SteadyStateSegmenter(double sd_limit_hz = constants::DEFAULT_SD_LIMIT_HZ);
    
    double sd_limit() const { return sd_limit_; }
    
    /// Lengths of consecutive runs, in order; they sum to the input size
    /// @throws EmptySeries on empty input
    std::vector<size_t> run_lengths(std::span<const double> frequency) const;
    
    /// Length of the run containing each sample
    std::vector<size_t> sample_run_lengths(std::span<const double> frequency) const;
    
    /// Duration (s) of the run containing each sample
    std::vector<double> durations(std::span<const double> frequency, double interval_seconds) const;
    
private:
    double sd_limit_;
};

} // namespace thermolog
