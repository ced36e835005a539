#include "thermolog/data/column.hpp"

namespace thermolog {

// Explicit template instantiations for the column types the loader produces
template class TypedColumn<double>;
template class TypedColumn<int64_t>;
template class TypedColumn<std::string>;
template class TypedColumn<std::optional<std::string>>;

std::string column_type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::FLOAT64: return "Float64";
        case ColumnType::INT64: return "Int64";
        case ColumnType::STRING: return "String";
        case ColumnType::LABEL: return "Label";
        default: return "Unknown";
    }
}

} // namespace thermolog
