#include "thermolog/processing/filter_engine.hpp"
#include "thermolog/processing/arrow_utils.hpp"
#include <cmath>
#include <cstdio>
#include <memory>

#include <arrow/api.h>
#include <arrow/compute/api.h>

namespace thermolog {

namespace {

/// Integral doubles become integers so equal values share one key
FilterValue normalize(const FilterValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        if (std::isfinite(*d) && *d == std::trunc(*d) && std::fabs(*d) < 9.2e18) {
            return static_cast<int64_t>(*d);
        }
    }
    return value;
}

std::string encode(const FilterValue& value) {
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        return "i:" + std::to_string(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.17g", *d);
        return std::string("d:") + buffer;
    }
    const std::string& s = std::get<std::string>(value);
    return "s" + std::to_string(s.size()) + ":" + s;
}

arrow::Datum all_false(size_t length) {
    auto array = arrow_utils::value_or_throw(
        arrow::MakeArrayFromScalar(arrow::BooleanScalar(false), static_cast<int64_t>(length)),
        "constant mask");
    return arrow::Datum(array);
}

arrow::Datum call_equal(const arrow::Datum& column, const arrow::Datum& scalar) {
    return arrow_utils::value_or_throw(
        arrow::compute::CallFunction("equal", {column, scalar}), "equal");
}

} // namespace

// ===== FilterSignature =====

FilterSignature::FilterSignature(const Filter& filter) {
    // std::map iterates keys in sorted order
    for (const auto& [column, value] : filter) {
        FilterCondition cond{column, normalize(value)};
        key_ += std::to_string(column.size()) + ":" + column + "=" + encode(cond.value) + ";";
        conditions_.push_back(std::move(cond));
    }
}

// ===== FilterEngine =====

arrow::Datum FilterEngine::apply_single_condition(
    const RawDataset& dataset,
    const FilterCondition& cond
) const {
    const IColumn& col = dataset.column(cond.column_name);
    const size_t n = col.size();
    const bool is_text = std::holds_alternative<std::string>(cond.value);
    
    switch (col.type()) {
        case ColumnType::FLOAT64:
        case ColumnType::INT64: {
            if (is_text) {
                return all_false(n);
            }
            
            // Zero-copy wrap as Arrow array
            arrow::Datum column_datum;
            if (col.type() == ColumnType::FLOAT64) {
                column_datum = arrow::Datum(arrow_utils::wrap_span_as_arrow(
                    static_cast<const Float64Column&>(col).view()));
            } else {
                column_datum = arrow::Datum(arrow_utils::wrap_int64_span_as_arrow(
                    static_cast<const Int64Column&>(col).view()));
            }
            
            std::shared_ptr<arrow::Scalar> scalar;
            if (const int64_t* i = std::get_if<int64_t>(&cond.value)) {
                if (col.type() == ColumnType::INT64) {
                    scalar = std::make_shared<arrow::Int64Scalar>(*i);
                } else {
                    scalar = std::make_shared<arrow::DoubleScalar>(static_cast<double>(*i));
                }
            } else {
                // Non-integral double never equals an integer column
                if (col.type() == ColumnType::INT64) {
                    return all_false(n);
                }
                scalar = std::make_shared<arrow::DoubleScalar>(std::get<double>(cond.value));
            }
            return call_equal(column_datum, arrow::Datum(scalar));
        }
        
        case ColumnType::STRING:
        case ColumnType::LABEL: {
            if (!is_text) {
                return all_false(n);
            }
            
            std::shared_ptr<arrow::Array> array;
            if (col.type() == ColumnType::STRING) {
                array = arrow_utils::build_string_array(static_cast<const StringColumn&>(col).view());
            } else {
                array = arrow_utils::build_label_array(static_cast<const LabelColumn&>(col).view());
            }
            auto scalar = std::make_shared<arrow::StringScalar>(std::get<std::string>(cond.value));
            return call_equal(arrow::Datum(array), arrow::Datum(scalar));
        }
    }
    
    return all_false(n);
}

std::vector<bool> FilterEngine::calculate_mask(
    const RawDataset& dataset,
    const std::vector<FilterCondition>& conditions
) const {
    if (conditions.empty()) {
        return std::vector<bool>(dataset.row_count(), true);
    }
    
    arrow_utils::ensure_compute_initialized();
    arrow::Datum result = apply_single_condition(dataset, conditions[0]);
    
    // Combine remaining conditions with AND
    for (size_t i = 1; i < conditions.size(); ++i) {
        arrow::Datum next = apply_single_condition(dataset, conditions[i]);
        result = arrow_utils::value_or_throw(
            arrow::compute::CallFunction("and", {result, next}), "and");
    }
    
    return arrow_utils::datum_to_mask(result);
}

RowSelection FilterEngine::select_rows(
    const RawDataset& dataset,
    const FilterSignature& signature
) const {
    if (signature.empty()) {
        return dataset.all_rows();
    }
    
    auto mask = calculate_mask(dataset, signature.conditions());
    RowSelection rows;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) {
            rows.push_back(i);
        }
    }
    return rows;
}

} // namespace thermolog
