#include "thermolog/thermo/property_adapter.hpp"
#include "thermolog/core/errors.hpp"
#include <unordered_map>

namespace thermolog {

namespace {

void require_same_length(size_t a, size_t b, const char* what) {
    if (a != b) {
        throw IncompatibleUnits(std::string(what) + " length mismatch: " +
                                std::to_string(a) + " vs " + std::to_string(b));
    }
}

} // namespace

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::LIQUID:               return "liquid";
        case Phase::GAS:                  return "gas";
        case Phase::TWO_PHASE:            return "twophase";
        case Phase::SUPERCRITICAL:        return "supercritical";
        case Phase::SUPERCRITICAL_GAS:    return "supercritical_gas";
        case Phase::SUPERCRITICAL_LIQUID: return "supercritical_liquid";
        case Phase::UNKNOWN:              return "unknown";
    }
    return "unknown";
}

Phase parse_phase(const std::string& name) {
    static const std::unordered_map<std::string, Phase> phases = {
        {"liquid", Phase::LIQUID},
        {"gas", Phase::GAS},
        {"twophase", Phase::TWO_PHASE},
        {"supercritical", Phase::SUPERCRITICAL},
        {"supercritical_gas", Phase::SUPERCRITICAL_GAS},
        {"supercritical_liquid", Phase::SUPERCRITICAL_LIQUID},
    };
    auto it = phases.find(name);
    return it == phases.end() ? Phase::UNKNOWN : it->second;
}

// ===== Array helpers =====

std::vector<double> IPropertyAdapter::enthalpies(std::span<const double> pressure_pa,
                                               std::span<const double> temperature_k) const {
    require_same_length(pressure_pa.size(), temperature_k.size(), "enthalpy");
    std::vector<double> result(pressure_pa.size());
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = enthalpy(pressure_pa[i], temperature_k[i]);
    }
    return result;
}

std::vector<Phase> IPropertyAdapter::phases(std::span<const double> pressure_pa,
                                           std::span<const double> temperature_k) const {
    require_same_length(pressure_pa.size(), temperature_k.size(), "phase");
    std::vector<Phase> result(pressure_pa.size());
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = phase(pressure_pa[i], temperature_k[i]);
    }
    return result;
}

std::vector<double> IPropertyAdapter::humidity_ratios(double pressure_pa,
                                                     std::span<const double> temperature_k,
                                                     std::span<const double> relative_humidity) const {
    require_same_length(temperature_k.size(), relative_humidity.size(), "humidity ratio");
    std::vector<double> result(temperature_k.size());
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = humidity_ratio(pressure_pa, temperature_k[i], relative_humidity[i]);
    }
    return result;
}

} // namespace thermolog
