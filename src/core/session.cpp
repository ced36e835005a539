#include "thermolog/core/session.hpp"
#include "thermolog/core/errors.hpp"
#include "thermolog/processing/binner.hpp"
#include "thermolog/processing/steady_state.hpp"
#include "thermolog/thermo/coolprop_adapter.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace thermolog {

namespace {

/// (name, unit expression or empty) for each whitespace-separated token
std::vector<std::pair<std::string, std::string>> parse_request(const std::string& request) {
    std::vector<std::pair<std::string, std::string>> items;
    std::istringstream stream(request);
    std::string token;
    while (stream >> token) {
        size_t slash = token.find('/');
        if (slash == std::string::npos) {
            items.emplace_back(token, "");
        } else {
            items.emplace_back(token.substr(0, slash), token.substr(slash + 1));
        }
    }
    return items;
}

} // namespace

LoggerSession::LoggerSession(RawDataset dataset,
                             NameTable names,
                             std::shared_ptr<const IPropertyAdapter> adapter,
                             std::shared_ptr<const UnitRegistry> units,
                             EngineOptions options,
                             RuleSet rules)
    : dataset_(std::move(dataset))
    , names_(std::move(names))
    , adapter_(std::move(adapter))
    , units_(std::move(units))
    , options_(std::move(options))
{
    if (!adapter_) {
        throw Error("LoggerSession requires a property adapter");
    }
    store_ = std::make_unique<QuantityStore>(dataset_, names_, units_, *adapter_,
                                             std::move(rules), options_);
    
    if (options_.classify_on_load) {
        set_steady_state_limits(Quantity(options_.default_steady_state_limits_min,
                                         units_->get("min")));
    }
}

std::unique_ptr<LoggerSession> LoggerSession::open(const std::vector<std::string>& csv_paths,
                                                   const std::string& name_table_path,
                                                   EngineOptions options,
                                                   LoggerCsvOptions csv_options) {
    csv_options.verbose = csv_options.verbose || options.verbose;
    RawDataset dataset = RawDataset::load_csv(csv_paths, csv_options);
    NameTable names = NameTable::load(name_table_path);
    auto adapter = std::make_shared<CoolPropAdapter>(options.fluid);
    return std::make_unique<LoggerSession>(std::move(dataset), std::move(names),
                                           std::move(adapter), UnitRegistry::standard(),
                                           std::move(options));
}

// ============================================================================
// Quantities
// ============================================================================

std::vector<Quantity> LoggerSession::get(const std::string& request, const Filter& filter,
                                         bool update) {
    const auto items = parse_request(request);
    if (items.empty()) {
        throw UnknownQuantity(request, "empty request");
    }
    
    std::vector<std::string> names;
    for (const auto& item : items) {
        names.push_back(item.first);
    }
    
    QuantityMap resolved = store_->resolve(names, filter, update);
    
    std::vector<Quantity> result;
    result.reserve(items.size());
    for (const auto& [name, unit] : items) {
        const Quantity& q = *resolved.at(name);
        result.push_back(unit.empty() ? q : q.to(units_->get(unit)));
    }
    return result;
}

Quantity LoggerSession::get_one(const std::string& request, const Filter& filter, bool update) {
    return get(request, filter, update).front();
}

QuantityMap LoggerSession::resolve(const std::vector<std::string>& names, const Filter& filter,
                                   bool force) {
    return store_->resolve(names, filter, force);
}

OperatingMode LoggerSession::operating_mode(const Filter& filter) {
    return store_->operating_mode(filter);
}

// ============================================================================
// Steady state
// ============================================================================

std::vector<double> LoggerSession::steady_state_durations() {
    const auto f = store_->resolve_one("f");
    const auto hz = f->magnitudes_in(units_->get("Hz"));
    SteadyStateSegmenter segmenter(options_.steady_state_sd_limit_hz);
    return segmenter.durations(hz, dataset_.interval_seconds());
}

std::vector<std::optional<std::string>> LoggerSession::set_steady_state_limits(const Quantity& limits) {
    std::vector<double> limits_s = limits.magnitudes_in(units_->get("s"));
    Binner binner = Binner::from_limits(std::move(limits_s));
    
    const auto f = store_->resolve_one("f");
    const auto hz = f->magnitudes_in(units_->get("Hz"));
    SteadyStateSegmenter segmenter(options_.steady_state_sd_limit_hz);
    auto labels = binner.bin(segmenter.durations(hz, dataset_.interval_seconds()));
    
    if (options_.verbose) {
        std::cerr << "[Session] " << segmenter.run_lengths(hz).size()
                  << " steady run(s) over " << hz.size() << " samples" << std::endl;
    }
    
    dataset_.set_column(constants::STEADY_STATE_COLUMN,
        std::make_shared<LabelColumn>(constants::STEADY_STATE_COLUMN, labels, ColumnType::LABEL));
    
    // Filters on the label column now select different rows
    store_->clear();
    return labels;
}

// ============================================================================
// Grouping
// ============================================================================

std::vector<FilterValue> LoggerSession::group_keys(const std::string& column) const {
    const IColumn& col = dataset_.column(column);
    std::vector<FilterValue> keys;
    
    auto add = [&keys](FilterValue value) {
        if (std::find(keys.begin(), keys.end(), value) == keys.end()) {
            keys.push_back(std::move(value));
        }
    };
    
    switch (col.type()) {
        case ColumnType::FLOAT64:
            for (double v : static_cast<const Float64Column&>(col).view()) {
                if (!std::isnan(v)) add(v);
            }
            break;
        case ColumnType::INT64:
            for (int64_t v : static_cast<const Int64Column&>(col).view()) {
                add(v);
            }
            break;
        case ColumnType::STRING:
            for (const auto& v : static_cast<const StringColumn&>(col).view()) {
                add(v);
            }
            break;
        case ColumnType::LABEL:
            for (const auto& v : static_cast<const LabelColumn&>(col).view()) {
                if (v) add(*v);
            }
            break;
    }
    return keys;
}

GroupedQuantities LoggerSession::grouped(const std::string& name, const std::string& column) {
    GroupedQuantities groups;
    for (const auto& key : group_keys(column)) {
        groups.emplace_back(key, store_->resolve_one(name, {{column, key}}));
    }
    return groups;
}

// ============================================================================
// Validation
// ============================================================================

std::vector<CheckResult> LoggerSession::validate() {
    return Validator::run(*this);
}

std::string LoggerSession::validation_report() {
    return Validator::report(validate());
}

std::shared_ptr<const Quantity> LoggerSession::read(const std::string& name) {
    return store_->resolve_one(name);
}

} // namespace thermolog
