#include "thermolog/data/raw_dataset.hpp"
#include "thermolog/data/csv_loader.hpp"
#include "thermolog/core/types.hpp"
#include <cmath>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace thermolog {

namespace {

bool parse_number(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        out = std::stod(text, &pos);
        return pos == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

// ===== Column Access =====

const IColumn& RawDataset::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw MissingColumn(name, "not in dataset");
    }
    return *it->second;
}

ColumnType RawDataset::column_type(const std::string& name) const {
    return column(name).type();
}

std::vector<double> RawDataset::gather_numeric(const std::string& name,
                                               const RowSelection& rows) const {
    const IColumn& col = column(name);
    std::vector<double> out;
    out.reserve(rows.size());
    
    switch (col.type()) {
        case ColumnType::FLOAT64: {
            auto data = static_cast<const Float64Column&>(col).view();
            for (size_t r : rows) out.push_back(data[r]);
            break;
        }
        case ColumnType::INT64: {
            auto data = static_cast<const Int64Column&>(col).view();
            for (size_t r : rows) out.push_back(static_cast<double>(data[r]));
            break;
        }
        case ColumnType::STRING: {
            auto data = static_cast<const StringColumn&>(col).view();
            for (size_t r : rows) {
                double value;
                out.push_back(parse_number(data[r], value) ? value : std::nan(""));
            }
            break;
        }
        case ColumnType::LABEL:
            throw MissingColumn(name, "label column has no numeric values");
    }
    return out;
}

std::vector<std::string> RawDataset::gather_text(const std::string& name,
                                                 const RowSelection& rows) const {
    const IColumn& col = column(name);
    std::vector<std::string> out;
    out.reserve(rows.size());
    
    if (col.type() == ColumnType::STRING) {
        auto data = static_cast<const StringColumn&>(col).view();
        for (size_t r : rows) out.push_back(data[r]);
    } else if (col.type() == ColumnType::LABEL) {
        auto data = static_cast<const LabelColumn&>(col).view();
        for (size_t r : rows) out.push_back(data[r].value_or(""));
    } else {
        for (double v : gather_numeric(name, rows)) {
            std::ostringstream oss;
            oss << v;
            out.push_back(oss.str());
        }
    }
    return out;
}

RowSelection RawDataset::all_rows() const {
    RowSelection rows(row_count_);
    std::iota(rows.begin(), rows.end(), size_t{0});
    return rows;
}

// ===== Time =====

std::span<const int64_t> RawDataset::timestamps() const {
    return get_column<int64_t>(constants::TIMESTAMP_COLUMN);
}

double RawDataset::interval_seconds() const {
    auto ts = timestamps();
    if (ts.size() < 2) {
        throw EmptySeries("sampling interval needs at least two samples");
    }
    return static_cast<double>(ts[1] - ts[0]);
}

// ===== Builders =====

void RawDataset::set_column(std::string name, std::shared_ptr<IColumn> column) {
    // Validate row count consistency
    if (column_count() > 0 && column->size() != row_count_) {
        throw Error("Column size mismatch for '" + name + "': " +
                                 std::to_string(column->size()) + " vs " +
                                 std::to_string(row_count_));
    }
    
    if (!has_column(name)) {
        column_names_.push_back(name);
    }
    columns_[name] = std::move(column);
    
    if (column_count() == 1) {
        row_count_ = columns_[name]->size();
    }
}

void RawDataset::add_source(std::string file, std::string conditions) {
    source_files_.push_back(std::move(file));
    if (!conditions.empty()) {
        test_conditions_.push_back(std::move(conditions));
    }
}

// ===== Factory Methods =====

RawDataset RawDataset::load_csv(const std::vector<std::string>& paths,
                                const LoggerCsvOptions& opts) {
    return LoggerCsvLoader::load(paths, opts);
}

} // namespace thermolog
