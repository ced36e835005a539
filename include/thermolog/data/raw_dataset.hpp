#pragma once

#include "thermolog/data/column.hpp"
#include "thermolog/core/errors.hpp"
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace thermolog {

// Forward declarations
struct LoggerCsvOptions;

/// Ordered row indices of a dataset subset
using RowSelection = std::vector<size_t>;

/// Samples loaded from one or more data-logger files
/// Column-oriented; immutable after loading except for label columns
/// written back by classification
class RawDataset {
private:
    /// Column storage (name -> column)
    std::unordered_map<std::string, std::shared_ptr<IColumn>> columns_;
    
    /// Row count
    size_t row_count_ = 0;
    
    /// Column names (preserves insertion order)
    std::vector<std::string> column_names_;
    
    /// Test conditions line of each file that carried one
    std::vector<std::string> test_conditions_;
    
    /// Base names of the files the rows came from
    std::vector<std::string> source_files_;
    
public:
    /// Default constructor (empty dataset)
    RawDataset() = default;
    
    /// No copy (expensive operation)
    RawDataset(const RawDataset&) = delete;
    RawDataset& operator=(const RawDataset&) = delete;
    
    /// Move semantics (efficient)
    RawDataset(RawDataset&&) = default;
    RawDataset& operator=(RawDataset&&) = default;
    
    // ===== FACTORY METHODS =====
    
    /// Load and concatenate data-logger CSV files
    static RawDataset load_csv(const std::vector<std::string>& paths,
                               const LoggerCsvOptions& opts);
    
    // ===== COLUMN ACCESS =====
    
    /// Get column as typed span (zero-copy, const)
    template<typename T>
    std::span<const T> get_column(const std::string& name) const {
        auto* typed_col = dynamic_cast<const TypedColumn<T>*>(&column(name));
        if (!typed_col) {
            throw MissingColumn(name, "type mismatch, stored as " +
                                column_type_to_string(column(name).type()));
        }
        return typed_col->view();
    }
    
    /// Untyped column; throws MissingColumn
    const IColumn& column(const std::string& name) const;
    
    /// Check if column exists
    bool has_column(const std::string& name) const {
        return columns_.find(name) != columns_.end();
    }
    
    /// Numeric values of the selected rows
    /// Int64 columns are widened; text that is not a number becomes NaN
    std::vector<double> gather_numeric(const std::string& name, const RowSelection& rows) const;
    
    /// Text of the selected rows of a STRING column; numeric columns are rendered
    std::vector<std::string> gather_text(const std::string& name, const RowSelection& rows) const;
    
    /// Every row index, in order
    RowSelection all_rows() const;
    
    // ===== TIME =====
    
    /// Timestamps in whole seconds since the epoch
    std::span<const int64_t> timestamps() const;
    
    /// Time between the first two samples, in seconds
    /// @throws EmptySeries if there are fewer than two samples
    double interval_seconds() const;
    
    // ===== METADATA =====
    
    /// Get number of rows
    size_t row_count() const { return row_count_; }
    
    /// Get number of columns
    size_t column_count() const { return columns_.size(); }
    
    /// Get column names
    std::vector<std::string> column_names() const { return column_names_; }
    
    /// Get column type
    ColumnType column_type(const std::string& name) const;
    
    const std::vector<std::string>& test_conditions() const { return test_conditions_; }
    const std::vector<std::string>& source_files() const { return source_files_; }
    
    // ===== BUILDERS =====
    
    /// Add a column, or replace an existing one of the same name
    /// @throws Error on row count mismatch
    void set_column(std::string name, std::shared_ptr<IColumn> column);
    
    /// Record a loaded file and its optional conditions line
    void add_source(std::string file, std::string conditions);
};

} // namespace thermolog
