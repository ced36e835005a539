#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace thermolog {

/// Column data types
enum class ColumnType {
    FLOAT64,    ///< 64-bit floating point (sensor readings)
    INT64,      ///< 64-bit integer (file index, timestamps)
    STRING,     ///< Raw text (columns holding logger tokens such as "UnderRange")
    LABEL       ///< Nullable text written back by classification
};

/// Type name for diagnostics ("Float64", "Int64", ...)
std::string column_type_to_string(ColumnType type);

/// Abstract column interface
class IColumn {
public:
    virtual ~IColumn() = default;
    
    /// Get column type
    virtual ColumnType type() const = 0;
    
    /// Get number of elements
    virtual size_t size() const = 0;
    
    /// Get column name
    virtual std::string name() const = 0;
};

/// Typed column implementation
/// Stores data in contiguous memory for cache efficiency
template<typename T>
class TypedColumn : public IColumn {
private:
    std::string name_;
    std::vector<T> data_;
    ColumnType type_;
    
public:
    TypedColumn(std::string name, std::vector<T> data, ColumnType type)
        : name_(std::move(name))
        , data_(std::move(data))
        , type_(type)
    {}
    
    /// Get read-only view of data (zero-copy)
    std::span<const T> view() const { 
        return std::span<const T>(data_.data(), data_.size()); 
    }
    
    /// Underlying storage
    const std::vector<T>& values() const { return data_; }
    
    /// Element access
    const T& at(size_t i) const { return data_.at(i); }
    
    /// IColumn interface implementation
    ColumnType type() const override { return type_; }
    size_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }
};

/// Type aliases for common columns
using Float64Column = TypedColumn<double>;
using Int64Column = TypedColumn<int64_t>;
using StringColumn = TypedColumn<std::string>;
using LabelColumn = TypedColumn<std::optional<std::string>>;

} // namespace thermolog
