#include "thermolog/processing/binner.hpp"
#include "thermolog/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace thermolog {

Binner::Binner(std::vector<double> thresholds_s, bool include_open_low, bool include_open_high)
    : thresholds_(std::move(thresholds_s))
    , open_low_(include_open_low)
    , open_high_(include_open_high)
{
    if (thresholds_.size() < 2) {
        throw InvalidThreshold("at least two finite thresholds are required, got " +
                               std::to_string(thresholds_.size()));
    }
    for (size_t i = 0; i < thresholds_.size(); ++i) {
        if (!std::isfinite(thresholds_[i])) {
            throw InvalidThreshold("threshold " + std::to_string(i) + " is not finite");
        }
        if (i > 0 && !(thresholds_[i] > thresholds_[i - 1])) {
            throw InvalidThreshold("thresholds must be strictly ascending at index " +
                                   std::to_string(i));
        }
    }
}

Binner Binner::from_limits(std::vector<double> limits_s) {
    bool open_low = false;
    bool open_high = false;
    if (!limits_s.empty() && std::isinf(limits_s.front()) && limits_s.front() < 0.0) {
        open_low = true;
        limits_s.erase(limits_s.begin());
    }
    if (!limits_s.empty() && std::isinf(limits_s.back()) && limits_s.back() > 0.0) {
        open_high = true;
        limits_s.pop_back();
    }
    return Binner(std::move(limits_s), open_low, open_high);
}

std::optional<std::string> Binner::label(double duration_s) const {
    // Index of the first threshold strictly above the duration
    auto upper = std::upper_bound(thresholds_.begin(), thresholds_.end(), duration_s);
    const size_t k = static_cast<size_t>(std::distance(thresholds_.begin(), upper));
    
    if (k == 0) {
        if (!open_low_) return std::nullopt;
        return "τ < " + format(thresholds_.front());
    }
    if (k == thresholds_.size()) {
        if (!open_high_) return std::nullopt;
        return "τ ≥ " + format(thresholds_.back());
    }
    return between(k - 1);
}

std::vector<std::optional<std::string>> Binner::bin(std::span<const double> durations_s) const {
    std::vector<std::optional<std::string>> result;
    result.reserve(durations_s.size());
    for (double d : durations_s) {
        result.push_back(label(d));
    }
    return result;
}

std::vector<std::string> Binner::labels() const {
    std::vector<std::string> result;
    if (open_low_) {
        result.push_back("τ < " + format(thresholds_.front()));
    }
    for (size_t k = 0; k + 1 < thresholds_.size(); ++k) {
        result.push_back(between(k));
    }
    if (open_high_) {
        result.push_back("τ ≥ " + format(thresholds_.back()));
    }
    return result;
}

std::string Binner::format(double seconds) const {
    char buffer[32];
    if (display_minutes()) {
        std::snprintf(buffer, sizeof(buffer), "%.0f min", seconds / 60.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.0f s", seconds);
    }
    return buffer;
}

std::string Binner::between(size_t k) const {
    return format(thresholds_[k]) + " ≤ τ < " + format(thresholds_[k + 1]);
}

} // namespace thermolog
