#include "thermolog/processing/validation.hpp"
#include <cctype>
#include <cstdio>
#include <sstream>

namespace thermolog {

namespace {

std::optional<std::string> humidity_check(QuantityReader& reader) {
    const auto wr = reader.read("wr");
    const auto ws = reader.read("ws");
    if (wr->empty()) {
        return std::nullopt;
    }
    
    const std::vector<bool> drier = wr->less_than(*ws);
    size_t count = 0;
    for (bool b : drier) {
        if (b) ++count;
    }
    if (count == 0) {
        return std::nullopt;
    }
    
    const double fraction = static_cast<double>(count) / static_cast<double>(drier.size());
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer),
                  "The supply humidity ratio exceeds the return humidity ratio %.1f%% of the time.",
                  fraction * 100.0);
    return std::string(buffer);
}

std::optional<std::string> cycling_check(QuantityReader& reader) {
    const auto f = reader.read("f");
    const auto hz = f->magnitudes_in(reader.units().get("Hz"));
    if (hz.empty()) {
        return std::nullopt;
    }
    
    // Population variance (Hz^2)
    double mean = 0.0;
    for (double v : hz) mean += v;
    mean /= static_cast<double>(hz.size());
    double variance = 0.0;
    for (double v : hz) variance += (v - mean) * (v - mean);
    variance /= static_cast<double>(hz.size());
    
    if (variance > 400.0) {
        return std::string("There appears to be short cycling.");
    }
    if (variance > 100.0) {
        return std::string("There appears to be cycling with long steps.");
    }
    return std::nullopt;
}

} // namespace

const std::vector<ValidationCheck>& Validator::checks() {
    static const std::vector<ValidationCheck> registry = {
        {"humidity_check", "Check whether the humidity ratio is increasing.",
         {"wr", "ws"}, humidity_check},
        {"cycling_check", "Check if there is cycling.",
         {"f"}, cycling_check},
    };
    return registry;
}

std::vector<CheckResult> Validator::run(QuantityReader& reader) {
    std::vector<CheckResult> results;
    for (const auto& check : checks()) {
        CheckResult result;
        result.name = check.name;
        result.quantities = check.quantities;
        if (auto message = check.run(reader)) {
            result.passed = false;
            result.message = *message;
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::string Validator::report(const std::vector<CheckResult>& results) {
    std::vector<std::string> warnings;
    for (const auto& result : results) {
        if (!result.passed) {
            warnings.push_back(result.message);
        }
    }
    
    if (warnings.empty()) {
        return "No warnings";
    }
    if (warnings.size() == 1) {
        std::string text = warnings[0];
        if (!text.empty()) {
            text[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
        }
        return "Warning: " + text;
    }
    
    std::ostringstream oss;
    oss << "There are " << warnings.size() << " warnings:";
    for (size_t i = 0; i < warnings.size(); ++i) {
        oss << "\n  " << (i + 1) << " " << warnings[i];
    }
    return oss.str();
}

std::vector<std::string> Validator::failing_quantities(const std::vector<CheckResult>& results) {
    std::vector<std::string> names;
    for (const auto& result : results) {
        if (!result.passed) {
            names.insert(names.end(), result.quantities.begin(), result.quantities.end());
        }
    }
    return names;
}

} // namespace thermolog
