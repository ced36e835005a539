#include "thermolog/processing/steady_state.hpp"
#include "thermolog/core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace thermolog {

size_t SteadyRunState::step(double x, double sd_limit) {
    const double n = static_cast<double>(run_length);
    const double next_mean = (n * mean + x) / (n + 1.0);
    double next_variance = (n * (variance + mean * mean) + x * x) / (n + 1.0)
                           - next_mean * next_mean;
    // Cancellation can leave a tiny negative value
    next_variance = std::max(next_variance, 0.0);
    
    if (std::sqrt(next_variance) > sd_limit) {
        const size_t closed = run_length;
        start(x);
        return closed;
    }
    
    mean = next_mean;
    variance = next_variance;
    ++run_length;
    return 0;
}

SteadyStateSegmenter::SteadyStateSegmenter(double sd_limit_hz)
    : sd_limit_(sd_limit_hz)
{
    if (!std::isfinite(sd_limit_hz) || sd_limit_hz <= 0.0) {
        throw InvalidThreshold("standard deviation limit must be positive, got " +
                               std::to_string(sd_limit_hz));
    }
}

std::vector<size_t> SteadyStateSegmenter::run_lengths(std::span<const double> frequency) const {
    if (frequency.empty()) {
        throw EmptySeries("steady-state segmentation of an empty frequency series");
    }
    
    std::vector<size_t> runs;
    SteadyRunState state;
    state.start(frequency[0]);
    
    for (size_t i = 1; i < frequency.size(); ++i) {
        if (size_t closed = state.step(frequency[i], sd_limit_)) {
            runs.push_back(closed);
        }
    }
    runs.push_back(state.run_length);
    return runs;
}

std::vector<size_t> SteadyStateSegmenter::sample_run_lengths(std::span<const double> frequency) const {
    std::vector<size_t> per_sample;
    per_sample.reserve(frequency.size());
    for (size_t length : run_lengths(frequency)) {
        per_sample.insert(per_sample.end(), length, length);
    }
    return per_sample;
}

std::vector<double> SteadyStateSegmenter::durations(std::span<const double> frequency,
                                                    double interval_seconds) const {
    std::vector<double> result;
    result.reserve(frequency.size());
    for (size_t length : sample_run_lengths(frequency)) {
        result.push_back(static_cast<double>(length) * interval_seconds);
    }
    return result;
}

} // namespace thermolog
