#pragma once

#include "thermolog/core/types.hpp"
#include "thermolog/data/raw_dataset.hpp"
#include <arrow/datum.h>
#include <string>
#include <vector>

namespace thermolog {

/// Single equality condition on a dataset column
struct FilterCondition {
    std::string column_name;    ///< Column to filter
    FilterValue value;          ///< Required value
};

/// Canonical form of a set of equality constraints
///
/// Two signatures compare equal iff their canonical keys match. Keys are
/// sorted, and a double holding an integral value is stored as an integer,
/// so {file_index: 1} and {file_index: 1.0} name the same subset.
class FilterSignature {
public:
    /// Empty signature (every row)
    FilterSignature() = default;
    
    explicit FilterSignature(const Filter& filter);
    
    bool empty() const { return conditions_.empty(); }
    
    const std::vector<FilterCondition>& conditions() const { return conditions_; }
    
    /// Canonical serialization used as the cache key
    const std::string& key() const { return key_; }
    
    bool operator==(const FilterSignature& other) const { return key_ == other.key_; }
    bool operator!=(const FilterSignature& other) const { return key_ != other.key_; }
    
private:
    std::vector<FilterCondition> conditions_;
    std::string key_;
};

/// Equality-filter engine over RawDataset columns, backed by Arrow compute
class FilterEngine {
public:
    /// Constructor
    FilterEngine() = default;
    
    /// Boolean mask of rows satisfying every condition (1 = pass)
    /// @throws MissingColumn if a condition names an unknown column
    std::vector<bool> calculate_mask(
        const RawDataset& dataset,
        const std::vector<FilterCondition>& conditions
    ) const;
    
    /// Indices of rows satisfying the signature, in dataset order
    RowSelection select_rows(
        const RawDataset& dataset,
        const FilterSignature& signature
    ) const;
    
private:
    /// Arrow boolean datum for one condition
    arrow::Datum apply_single_condition(
        const RawDataset& dataset,
        const FilterCondition& cond
    ) const;
};

} // namespace thermolog
