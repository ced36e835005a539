/**
 * Arrow Utilities - Helper functions for dataset columns and Arrow compute
 * 
 * Zero-copy integration between RawDataset columns and Arrow compute
 */

#pragma once

#include "thermolog/core/errors.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <arrow/compute/api.h>

namespace thermolog {
namespace arrow_utils {

/**
 * Wrap std::span as Arrow array (zero-copy!)
 * 
 * CRITICAL: The viewed memory MUST stay alive while Arrow array is used!
 * 
 * @param data Span (already a view, no ownership)
 * @return Arrow array
 */
inline std::shared_ptr<arrow::DoubleArray> wrap_span_as_arrow(
    std::span<const double> data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size() * sizeof(double)
    );
    
    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        data.size(),
        {nullptr, buffer},
        0
    );
    
    return std::make_shared<arrow::DoubleArray>(array_data);
}

/**
 * Wrap int64 span as Arrow array (zero-copy!)
 */
inline std::shared_ptr<arrow::Int64Array> wrap_int64_span_as_arrow(
    std::span<const int64_t> data
) {
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(data.data()),
        data.size() * sizeof(int64_t)
    );
    
    auto array_data = arrow::ArrayData::Make(
        arrow::int64(),
        data.size(),
        {nullptr, buffer},
        0
    );
    
    return std::make_shared<arrow::Int64Array>(array_data);
}

/// Throw on a failed Arrow status
inline void check_status(const arrow::Status& status, const std::string& context) {
    if (!status.ok()) {
        throw Error("Arrow " + context + " failed: " + status.ToString());
    }
}

/// Unwrap an Arrow result or throw
template<typename T>
T value_or_throw(arrow::Result<T> result, const std::string& context) {
    check_status(result.status(), context);
    return result.MoveValueUnsafe();
}

/// Register the compute kernels once (a separate library since Arrow 21)
inline void ensure_compute_initialized() {
#if ARROW_VERSION_MAJOR >= 21
    static const arrow::Status status = arrow::compute::Initialize();
    check_status(status, "compute initialization");
#endif
}

/**
 * Build Arrow string array (copy, strings are not contiguous)
 */
inline std::shared_ptr<arrow::Array> build_string_array(
    std::span<const std::string> data
) {
    arrow::StringBuilder builder;
    check_status(builder.Reserve(static_cast<int64_t>(data.size())), "string reserve");
    for (const auto& value : data) {
        check_status(builder.Append(value), "string append");
    }
    return value_or_throw(builder.Finish(), "string finish");
}

/**
 * Build Arrow string array from nullable labels (nullopt becomes null)
 */
inline std::shared_ptr<arrow::Array> build_label_array(
    std::span<const std::optional<std::string>> data
) {
    arrow::StringBuilder builder;
    check_status(builder.Reserve(static_cast<int64_t>(data.size())), "label reserve");
    for (const auto& value : data) {
        if (value) {
            check_status(builder.Append(*value), "label append");
        } else {
            check_status(builder.AppendNull(), "label append");
        }
    }
    return value_or_throw(builder.Finish(), "label finish");
}

/**
 * Extract boolean mask from Arrow datum (null counts as false)
 * 
 * @param datum Boolean array datum
 * @return Vector with copied mask
 */
inline std::vector<bool> datum_to_mask(const arrow::Datum& datum) {
    auto array = std::static_pointer_cast<arrow::BooleanArray>(datum.make_array());
    std::vector<bool> mask(static_cast<size_t>(array->length()));
    for (int64_t i = 0; i < array->length(); ++i) {
        mask[static_cast<size_t>(i)] = array->IsValid(i) && array->Value(i);
    }
    return mask;
}

}  // namespace arrow_utils
}  // namespace thermolog
