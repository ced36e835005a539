#include "thermolog/processing/heat_transfer.hpp"
#include "thermolog/core/errors.hpp"
#include <algorithm>
#include <array>

namespace thermolog {

namespace {

const std::array<ProcessDefinition, 3> HEATING_PROCESSES = {{
    {"Qcond", {"pout", 4, Phase::GAS}, {"pout", 6, Phase::LIQUID}, true,
     "$\\dot{Q}_{cond}$", "heat transfer rate"},
    {"Qev", {"pout", 6, Phase::LIQUID}, {"pin", 9, Phase::GAS}, false,
     "$\\dot{Q}_{ev}$", "heat transfer rate"},
    {"Pcomp", {"pin", 1, Phase::GAS}, {"pout", 2, Phase::GAS}, false,
     "$P_{comp}$", "mechanical power"},
}};

const std::array<ProcessDefinition, 4> COOLING_PROCESSES = {{
    {"Qcond", {"pout", 9, Phase::GAS}, {"pout", 7, Phase::LIQUID}, true,
     "$\\dot{Q}_{cond}$", "heat transfer rate"},
    {"Qev", {"pout", 7, Phase::LIQUID}, {"pin", 4, Phase::GAS}, false,
     "$\\dot{Q}_{ev}$", "heat transfer rate"},
    {"Pcomp", {"pin", 1, Phase::GAS}, {"pout", 2, Phase::GAS}, false,
     "$P_{comp}$", "mechanical power"},
    {"Qloss_ev", {"pin", 4, Phase::GAS}, {"pin", 1, Phase::GAS}, false,
     "$\\dot{Q}_{loss,ev}$", "heat transfer rate"},
}};

template<typename Table>
const ProcessDefinition* find_in(const Table& table, const std::string& name) {
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const ProcessDefinition& p) { return p.name == name; });
    return it == table.end() ? nullptr : &*it;
}

} // namespace

const ProcessDefinition* find_process(const std::string& name, OperatingMode mode) {
    return mode == OperatingMode::HEATING ? find_in(HEATING_PROCESSES, name)
                                          : find_in(COOLING_PROCESSES, name);
}

bool is_process(const std::string& name) {
    return find_in(HEATING_PROCESSES, name) || find_in(COOLING_PROCESSES, name);
}

std::string pressure_side(int state, OperatingMode mode) {
    if (state < constants::FIRST_STATE || state > constants::LAST_STATE) {
        throw UnknownQuantity("h" + std::to_string(state), "state must be between 1 and 9");
    }
    if (state == 1) {
        return "pin";
    }
    if (mode == OperatingMode::HEATING) {
        return state >= 7 ? "pin" : "pout";
    }
    return (state >= 3 && state <= 6) ? "pin" : "pout";
}

CorrectedEnthalpy corrected_enthalpy(const IPropertyAdapter& adapter,
                                     std::span<const double> pressure_pa,
                                     std::span<const double> temperature_k,
                                     Phase expected) {
    CorrectedEnthalpy result;
    result.values = adapter.enthalpies(pressure_pa, temperature_k);
    const std::vector<Phase> observed = adapter.phases(pressure_pa, temperature_k);
    const double quality = expected == Phase::LIQUID ? 0.0 : 1.0;
    
    for (size_t i = 0; i < observed.size(); ++i) {
        if (observed[i] != expected) {
            result.values[i] = adapter.enthalpy_at_quality(pressure_pa[i], quality);
            ++result.corrections;
        }
    }
    return result;
}

Quantity process_power(const ProcessDefinition& process,
                       const Quantity& flow,
                       const Quantity& h_in,
                       const Quantity& h_out,
                       const UnitRegistry& units) {
    Quantity power = flow * (h_out - h_in);
    if (process.heat_rejection) {
        power = -power;
    }
    return power.to(units.get("kW"))
                .with_label(process.label)
                .with_property(process.property);
}

} // namespace thermolog
