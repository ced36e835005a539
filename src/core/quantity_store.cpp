#include "thermolog/core/quantity_store.hpp"
#include "thermolog/core/errors.hpp"
#include <algorithm>
#include <iostream>

namespace thermolog {

QuantityStore::QuantityStore(const RawDataset& dataset,
                             const NameTable& names,
                             std::shared_ptr<const UnitRegistry> units,
                             const IPropertyAdapter& adapter,
                             RuleSet rules,
                             EngineOptions options)
    : dataset_(dataset)
    , names_(names)
    , units_(std::move(units))
    , adapter_(adapter)
    , rules_(std::move(rules))
    , options_(std::move(options))
    , rows_(dataset.all_rows())
{
    if (!units_) {
        throw Error("QuantityStore requires a unit registry");
    }
}

// ============================================================================
// Resolution
// ============================================================================

QuantityMap QuantityStore::resolve(const std::vector<std::string>& names,
                                   const Filter& filter,
                                   bool force) {
    FilterSignature signature(filter);
    if (force || signature != active_) {
        rebuild(std::move(signature));
    }
    
    QuantityMap result;
    for (const auto& name : names) {
        if (result.count(name)) {
            continue;
        }
        if (entries_.count(name)) {
            stats_.hits++;
        } else {
            std::vector<std::string> path;
            ensure(name, path);
        }
        result[name] = entries_.at(name);
    }
    return result;
}

std::shared_ptr<const Quantity> QuantityStore::resolve_one(const std::string& name,
                                                           const Filter& filter,
                                                           bool force) {
    return resolve({name}, filter, force).at(name);
}

OperatingMode QuantityStore::operating_mode(const Filter& filter) {
    FilterSignature signature(filter);
    if (signature != active_) {
        rebuild(std::move(signature));
    }
    std::vector<std::string> path;
    return ensure_mode(path);
}

void QuantityStore::rebuild(FilterSignature signature) {
    if (options_.verbose) {
        std::cerr << "[QuantityStore] Rebuild: filter '" << active_.key()
                  << "' -> '" << signature.key() << "', dropping "
                  << entries_.size() << " quantities" << std::endl;
    }
    
    // Select first so a bad filter column leaves the store untouched
    RowSelection rows = filter_engine_.select_rows(dataset_, signature);
    
    entries_.clear();
    mode_.reset();
    rows_ = std::move(rows);
    active_ = std::move(signature);
    stats_.rebuilds++;
}

void QuantityStore::clear() {
    rebuild(active_);
}

void QuantityStore::ensure(const std::string& name, std::vector<std::string>& path) {
    if (entries_.count(name)) {
        return;
    }
    
    if (std::find(path.begin(), path.end(), name) != path.end()) {
        std::string cycle;
        auto start = std::find(path.begin(), path.end(), name);
        for (auto it = start; it != path.end(); ++it) {
            cycle += *it + " -> ";
        }
        throw DependencyCycle(cycle + name);
    }
    
    auto rule = rules_.lookup(name, names_);
    if (!rule) {
        throw UnknownQuantity(name, "no derivation rule or name table entry");
    }
    
    path.push_back(name);
    
    std::optional<OperatingMode> mode;
    if (rule->mode_dependent) {
        mode = ensure_mode(path);
    }
    
    for (const auto& prerequisite : rule->prerequisites(mode)) {
        ensure(prerequisite, path);
    }
    
    DerivationContext ctx{dataset_, rows_, names_, *units_, adapter_, options_, mode, entries_};
    Quantity quantity = rule->derive(ctx);
    
    if (!quantity.is_scalar() && quantity.size() != rows_.size()) {
        throw Error("rule '" + name + "' produced " + std::to_string(quantity.size()) +
                    " values for " + std::to_string(rows_.size()) + " rows");
    }
    
    if (options_.verbose) {
        std::cerr << "[QuantityStore] Derived " << name << " (" << to_string(rule->category)
                  << ", " << quantity.size() << " samples, "
                  << (quantity.unit().symbol.empty() ? "dimensionless" : quantity.unit().symbol)
                  << ")" << std::endl;
    }
    
    entries_[name] = std::make_shared<const Quantity>(std::move(quantity));
    stats_.derivations++;
    path.pop_back();
}

OperatingMode QuantityStore::ensure_mode(std::vector<std::string>& path) {
    if (mode_) {
        return *mode_;
    }
    
    ensure(constants::MODE_FLAG_QUANTITY, path);
    mode_ = majority_mode(entries_.at(constants::MODE_FLAG_QUANTITY)->values());
    
    if (options_.verbose) {
        std::cerr << "[QuantityStore] Operating mode: " << to_string(*mode_) << std::endl;
    }
    return *mode_;
}

// ============================================================================
// Inspection
// ============================================================================

bool QuantityStore::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

std::shared_ptr<const Quantity> QuantityStore::peek(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::string> QuantityStore::stored_names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [name, quantity] : entries_) {
        result.push_back(name);
    }
    return result;
}

StoreStats QuantityStore::stats() const {
    StoreStats stats = stats_;
    stats.entries = entries_.size();
    stats.update_hit_rate();
    return stats;
}

} // namespace thermolog
