#include "thermolog/processing/derivation_rules.hpp"
#include "thermolog/processing/heat_transfer.hpp"
#include "thermolog/core/errors.hpp"
#include "thermolog/data/column.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace thermolog {

namespace {

std::vector<std::string> no_prerequisites(std::optional<OperatingMode>) {
    return {};
}

/// Parse a raw token, mapping sentinels to zero
double clean_token(const std::string& token, const EngineOptions& options,
                   const std::string& column) {
    if (token.empty()) {
        return 0.0;
    }
    if (std::find(options.sentinel_tokens.begin(), options.sentinel_tokens.end(), token) !=
        options.sentinel_tokens.end()) {
        return 0.0;
    }
    try {
        size_t pos = 0;
        double value = std::stod(token, &pos);
        if (pos != token.size()) {
            throw ParseError("column '" + column + "': unexpected token '" + token + "'");
        }
        return std::isfinite(value) ? value : 0.0;
    } catch (const std::logic_error&) {
        throw ParseError("column '" + column + "': unexpected token '" + token + "'");
    }
}

// ===== CLEANED =====

DerivationRule frequency_rule() {
    DerivationRule rule;
    rule.name = "f";
    rule.category = RuleCategory::CLEANED;
    rule.prerequisites = no_prerequisites;
    rule.derive = [](const DerivationContext& ctx) {
        const NameEntry& entry = ctx.names.require("f");
        std::vector<double> values = cleaned_column(ctx, "f");
        // Logger records twice the compressor frequency
        for (auto& v : values) {
            v /= ctx.options.frequency_divisor;
        }
        return Quantity(std::move(values), ctx.units.get(entry.unit), entry.label, entry.property);
    };
    return rule;
}

DerivationRule flow_rate_rule() {
    DerivationRule rule;
    rule.name = "flowrt_r";
    rule.category = RuleCategory::CLEANED;
    rule.prerequisites = [](std::optional<OperatingMode>) {
        return std::vector<std::string>{"f"};
    };
    rule.derive = [](const DerivationContext& ctx) {
        const NameEntry& entry = ctx.names.require("flowrt_r");
        std::vector<double> values = cleaned_column(ctx, "flowrt_r");
        const Quantity& f = ctx.input("f");
        // No refrigerant flow while the compressor is stopped
        for (size_t i = 0; i < values.size(); ++i) {
            if (f[i] == 0.0) {
                values[i] = 0.0;
            }
        }
        return Quantity(std::move(values), ctx.units.get(entry.unit), entry.label, entry.property);
    };
    return rule;
}

// ===== HUMIDITY_RATIO =====

DerivationRule humidity_ratio_rule(const std::string& point) {
    DerivationRule rule;
    rule.name = "w" + point;
    rule.category = RuleCategory::HUMIDITY_RATIO;
    rule.prerequisites = [point](std::optional<OperatingMode>) {
        return std::vector<std::string>{"T" + point, "RH" + point};
    };
    rule.derive = [point](const DerivationContext& ctx) {
        const auto T = ctx.input("T" + point).magnitudes_in(ctx.units.get("K"));
        const auto RH = ctx.input("RH" + point).magnitudes_in(ctx.units.get("frac"));
        auto w = ctx.adapter.humidity_ratios(ctx.options.atmospheric_pressure_pa, T, RH);
        return Quantity(std::move(w), ctx.units.get("frac"))
            .to(ctx.units.get("g/kg"))
            .with_label("$\\omega_{" + point + "}$")
            .with_property("absolute humidity");
    };
    return rule;
}

// ===== DEPENDENT =====

DerivationRule process_rule(const std::string& name) {
    DerivationRule rule;
    rule.name = name;
    rule.category = RuleCategory::DEPENDENT;
    rule.mode_dependent = true;
    rule.prerequisites = [name](std::optional<OperatingMode> mode) {
        const ProcessDefinition* process = mode ? find_process(name, *mode) : nullptr;
        if (!process) {
            throw UnknownQuantity(name, std::string("not defined in ") +
                                  (mode ? to_string(*mode) : "unknown") + " mode");
        }
        return std::vector<std::string>{
            "flowrt_r",
            process->inlet.pressure, process->inlet.temperature(),
            process->outlet.pressure, process->outlet.temperature()
        };
    };
    rule.derive = [name](const DerivationContext& ctx) {
        const OperatingMode mode = ctx.require_mode();
        const ProcessDefinition* process = find_process(name, mode);
        if (!process) {
            throw UnknownQuantity(name, std::string("not defined in ") + to_string(mode) + " mode");
        }
        
        const Unit pa = ctx.units.get("Pa");
        const Unit kelvin = ctx.units.get("K");
        const Unit j_per_kg = ctx.units.get("J/kg");
        
        auto enthalpy_at = [&](const StatePoint& point) {
            const auto p = ctx.input(point.pressure).magnitudes_in(pa);
            const auto T = ctx.input(point.temperature()).magnitudes_in(kelvin);
            CorrectedEnthalpy h = corrected_enthalpy(ctx.adapter, p, T, point.expected);
            if (ctx.options.verbose && h.corrections > 0) {
                std::cerr << "[Derivation] " << name << ": " << h.corrections
                          << " sample(s) at state " << point.state
                          << " replaced by saturated " << to_string(point.expected)
                          << " enthalpy" << std::endl;
            }
            return Quantity(std::move(h.values), j_per_kg);
        };
        
        const Quantity h_in = enthalpy_at(process->inlet);
        const Quantity h_out = enthalpy_at(process->outlet);
        const Quantity flow = ctx.input("flowrt_r").to(ctx.units.get("kg/s"));
        return process_power(*process, flow, h_in, h_out, ctx.units);
    };
    return rule;
}

DerivationRule electrical_power_rule() {
    DerivationRule rule;
    rule.name = "Pel";
    rule.category = RuleCategory::DEPENDENT;
    rule.prerequisites = [](std::optional<OperatingMode>) {
        return std::vector<std::string>{"Pa", "Pb"};
    };
    rule.derive = [](const DerivationContext& ctx) {
        return (ctx.input("Pa") + ctx.input("Pb"))
            .to(ctx.units.get("kW"))
            .with_label("$P_{el}$")
            .with_property("electrical power");
    };
    return rule;
}

DerivationRule elapsed_time_rule() {
    DerivationRule rule;
    rule.name = "t";
    rule.category = RuleCategory::DEPENDENT;
    rule.prerequisites = no_prerequisites;
    rule.derive = [](const DerivationContext& ctx) {
        const double interval = ctx.dataset.interval_seconds();
        std::vector<double> values(ctx.rows.size());
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = static_cast<double>(i) * interval;
        }
        return Quantity(std::move(values), ctx.units.get("s"), "$t$", "time");
    };
    return rule;
}

// ===== ENTHALPY =====

DerivationRule enthalpy_rule(int state) {
    DerivationRule rule;
    rule.name = "h" + std::to_string(state);
    rule.category = RuleCategory::ENTHALPY;
    rule.mode_dependent = true;
    rule.prerequisites = [state](std::optional<OperatingMode> mode) {
        if (!mode) {
            throw Error("enthalpy h" + std::to_string(state) + " needs the operating mode");
        }
        return std::vector<std::string>{pressure_side(state, *mode), "T" + std::to_string(state)};
    };
    rule.derive = [state](const DerivationContext& ctx) {
        const std::string index = std::to_string(state);
        const auto p = ctx.input(pressure_side(state, ctx.require_mode())).magnitudes_in(ctx.units.get("Pa"));
        const auto T = ctx.input("T" + index).magnitudes_in(ctx.units.get("K"));
        return Quantity(ctx.adapter.enthalpies(p, T), ctx.units.get("J/kg"))
            .to(ctx.units.get("kJ/kg"))
            .with_label("$h_{" + index + "}$")
            .with_property("enthalpy");
    };
    return rule;
}

} // namespace

const char* to_string(RuleCategory category) {
    switch (category) {
        case RuleCategory::AS_IS:          return "as-is";
        case RuleCategory::CLEANED:        return "cleaned";
        case RuleCategory::HUMIDITY_RATIO: return "humidity-ratio";
        case RuleCategory::DEPENDENT:      return "dependent";
        case RuleCategory::ENTHALPY:       return "enthalpy";
    }
    return "unknown";
}

// ===== DerivationContext =====

const Quantity& DerivationContext::input(const std::string& name) const {
    auto it = available.find(name);
    if (it == available.end()) {
        throw UnknownQuantity(name, "prerequisite not derived");
    }
    return *it->second;
}

OperatingMode DerivationContext::require_mode() const {
    if (!mode) {
        throw Error("operating mode requested by a mode-independent rule");
    }
    return *mode;
}

// ===== RuleSet =====

RuleSet RuleSet::standard() {
    RuleSet rules;
    rules.add(frequency_rule());
    rules.add(flow_rate_rule());
    rules.add(humidity_ratio_rule("s"));
    rules.add(humidity_ratio_rule("r"));
    for (const char* process : {"Qcond", "Qev", "Pcomp", "Qloss_ev"}) {
        rules.add(process_rule(process));
    }
    rules.add(electrical_power_rule());
    rules.add(elapsed_time_rule());
    for (int state = constants::FIRST_STATE; state <= constants::LAST_STATE; ++state) {
        rules.add(enthalpy_rule(state));
    }
    return rules;
}

void RuleSet::add(DerivationRule rule) {
    std::string name = rule.name;
    rules_[name] = std::move(rule);
}

const DerivationRule* RuleSet::find(const std::string& name) const {
    auto it = rules_.find(name);
    return it == rules_.end() ? nullptr : &it->second;
}

std::optional<DerivationRule> RuleSet::lookup(const std::string& name, const NameTable& names) const {
    if (const DerivationRule* rule = find(name)) {
        return *rule;
    }
    if (names.contains(name)) {
        return as_is(name);
    }
    return std::nullopt;
}

std::vector<std::string> RuleSet::names() const {
    std::vector<std::string> result;
    result.reserve(rules_.size());
    for (const auto& [name, rule] : rules_) {
        result.push_back(name);
    }
    return result;
}

DerivationRule RuleSet::as_is(const std::string& name) {
    DerivationRule rule;
    rule.name = name;
    rule.category = RuleCategory::AS_IS;
    rule.prerequisites = no_prerequisites;
    rule.derive = [name](const DerivationContext& ctx) {
        const NameEntry& entry = ctx.names.require(name);
        return Quantity(ctx.dataset.gather_numeric(*entry.column, ctx.rows),
                        ctx.units.get(entry.unit), entry.label, entry.property);
    };
    return rule;
}

// ===== Helpers =====

std::vector<double> cleaned_column(const DerivationContext& ctx, const std::string& quantity) {
    const NameEntry& entry = ctx.names.require(quantity);
    const std::string& column = *entry.column;
    
    std::vector<double> values;
    if (ctx.dataset.column_type(column) == ColumnType::STRING) {
        const auto tokens = ctx.dataset.gather_text(column, ctx.rows);
        values.reserve(tokens.size());
        for (const auto& token : tokens) {
            values.push_back(clean_token(token, ctx.options, column));
        }
    } else {
        values = ctx.dataset.gather_numeric(column, ctx.rows);
        for (auto& v : values) {
            if (!std::isfinite(v)) {
                v = 0.0;
            }
        }
    }
    return values;
}

OperatingMode majority_mode(std::span<const double> flags) {
    size_t flagged = 0;
    for (double v : flags) {
        if (v != 0.0) {
            ++flagged;
        }
    }
    return static_cast<double>(flagged) < static_cast<double>(flags.size()) / 2.0
        ? OperatingMode::HEATING : OperatingMode::COOLING;
}

} // namespace thermolog
