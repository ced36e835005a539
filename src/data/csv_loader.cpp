#include "thermolog/data/csv_loader.hpp"
#include "thermolog/data/column.hpp"
#include "thermolog/core/errors.hpp"
#include "thermolog/core/types.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace thermolog {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string base_name(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

// ===== Public API =====

RawDataset LoggerCsvLoader::load(const std::vector<std::string>& paths,
                                 const LoggerCsvOptions& opts) {
    std::vector<std::string> contents;
    std::vector<std::string> names;
    
    for (const auto& path : paths) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw ParseError("cannot open file: " + path);
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            throw ParseError("failed to read file: " + path);
        }
        contents.push_back(buffer.str());
        names.push_back(base_name(path));
    }
    
    return parse(contents, names, opts);
}

RawDataset LoggerCsvLoader::parse(const std::vector<std::string>& contents,
                                  const std::vector<std::string>& names,
                                  const LoggerCsvOptions& opts) {
    if (contents.empty()) {
        throw ParseError("no input files");
    }
    if (names.size() != contents.size()) {
        throw ParseError("file names and contents differ in count");
    }
    
    std::vector<FileTable> tables;
    for (size_t i = 0; i < contents.size(); ++i) {
        tables.push_back(parse_file(contents[i], names[i], opts));
    }
    
    // Column union in first-appearance order
    std::vector<std::string> column_names;
    for (const auto& table : tables) {
        for (const auto& name : table.header) {
            if (std::find(column_names.begin(), column_names.end(), name) == column_names.end()) {
                column_names.push_back(name);
            }
        }
    }
    
    // Per-file column lookup and file-level columns
    std::vector<int64_t> timestamps;
    std::vector<int64_t> file_index;
    std::vector<std::string> test_period;
    std::vector<double> test_duration;
    
    for (size_t f = 0; f < tables.size(); ++f) {
        const auto& table = tables[f];
        auto ts_it = std::find(table.header.begin(), table.header.end(), opts.timestamp_column);
        if (ts_it == table.header.end()) {
            throw ParseError("missing '" + opts.timestamp_column + "' column in " + table.name);
        }
        const size_t ts_col = static_cast<size_t>(std::distance(table.header.begin(), ts_it));
        
        std::vector<int64_t> file_ts;
        file_ts.reserve(table.rows.size());
        for (const auto& row : table.rows) {
            file_ts.push_back(parse_timestamp(row[ts_col], opts));
        }
        
        const int64_t start = file_ts.front();
        const int64_t stop = file_ts.back();
        const std::string period = format_test_period(start, stop);
        
        for (int64_t t : file_ts) {
            timestamps.push_back(t);
            file_index.push_back(static_cast<int64_t>(f));
            test_period.push_back(period);
            test_duration.push_back(static_cast<double>(stop - start));
        }
    }
    
    RawDataset dataset;
    dataset.set_column(constants::TIMESTAMP_COLUMN,
        std::make_shared<Int64Column>(constants::TIMESTAMP_COLUMN, std::move(timestamps), ColumnType::INT64));
    
    // Data columns: numeric unless any non-empty field fails to parse
    for (const auto& name : column_names) {
        if (name == opts.timestamp_column) {
            continue;
        }
        
        std::vector<std::string> fields;
        for (const auto& table : tables) {
            auto it = std::find(table.header.begin(), table.header.end(), name);
            if (it == table.header.end()) {
                fields.insert(fields.end(), table.rows.size(), std::string());
                continue;
            }
            const size_t col = static_cast<size_t>(std::distance(table.header.begin(), it));
            for (const auto& row : table.rows) {
                fields.push_back(trim(row[col]));
            }
        }
        
        bool numeric = true;
        std::vector<double> values;
        values.reserve(fields.size());
        for (const auto& field : fields) {
            double value;
            if (field.empty()) {
                values.push_back(std::nan(""));
            } else if (try_parse_double(field, value)) {
                values.push_back(value);
            } else {
                numeric = false;
                break;
            }
        }
        
        if (numeric) {
            dataset.set_column(name, std::make_shared<Float64Column>(name, std::move(values), ColumnType::FLOAT64));
        } else {
            dataset.set_column(name, std::make_shared<StringColumn>(name, std::move(fields), ColumnType::STRING));
        }
    }
    
    dataset.set_column(constants::FILE_INDEX_COLUMN,
        std::make_shared<Int64Column>(constants::FILE_INDEX_COLUMN, std::move(file_index), ColumnType::INT64));
    dataset.set_column(constants::TEST_PERIOD_COLUMN,
        std::make_shared<StringColumn>(constants::TEST_PERIOD_COLUMN, std::move(test_period), ColumnType::STRING));
    dataset.set_column(constants::TEST_DURATION_COLUMN,
        std::make_shared<Float64Column>(constants::TEST_DURATION_COLUMN, std::move(test_duration), ColumnType::FLOAT64));
    
    for (const auto& table : tables) {
        dataset.add_source(table.name, table.conditions);
    }
    
    if (opts.verbose) {
        std::cerr << "[CsvLoader] Loaded " << dataset.row_count() << " rows from "
                  << tables.size() << " file(s)" << std::endl;
        if (tables.size() == 1 && !tables[0].conditions.empty()) {
            std::cerr << "[CsvLoader] Test conditions : " << tables[0].conditions << std::endl;
        }
    }
    
    return dataset;
}

int64_t LoggerCsvLoader::parse_timestamp(const std::string& text, const LoggerCsvOptions& opts) {
    const std::string value = trim(text);
    
    for (const auto& format : opts.timestamp_formats) {
        std::tm tm{};
        std::istringstream stream(value);
        stream >> std::get_time(&tm, format.c_str());
        if (stream.fail()) {
            continue;
        }
        
        // Optional fractional seconds
        double fraction = 0.0;
        std::string rest;
        std::getline(stream, rest);
        rest = trim(rest);
        if (!rest.empty()) {
            if (rest[0] != '.' || !try_parse_double("0" + rest, fraction)) {
                continue;
            }
        }
        
        const int64_t whole = static_cast<int64_t>(timegm(&tm));
        return whole + static_cast<int64_t>(std::llround(fraction));
    }
    
    throw ParseError("unrecognised timestamp '" + value + "'");
}

std::string LoggerCsvLoader::format_test_period(int64_t start, int64_t stop) {
    auto format = [](int64_t seconds, const char* pattern) {
        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), pattern, &tm);
        return std::string(buffer);
    };
    
    constexpr int64_t one_day = 24 * 3600;
    const char* stop_pattern = (stop - start) > one_day ? "%d/%m %H:%M" : "%H:%M";
    return format(start, "%d/%m %H:%M") + " - " + format(stop, stop_pattern);
}

// ===== Internal Methods =====

LoggerCsvLoader::FileTable LoggerCsvLoader::parse_file(const std::string& content,
                                                       const std::string& name,
                                                       const LoggerCsvOptions& opts) {
    FileTable table;
    table.name = name;
    
    std::string text = content;
    // Strip UTF-8 byte order mark
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        text.erase(0, 3);
    }
    
    std::istringstream stream(text);
    std::string line;
    
    if (!std::getline(stream, line)) {
        throw ParseError("empty file: " + name);
    }
    
    // Optional test conditions line before the header
    auto first_fields = split_line(line, opts.delimiter);
    const std::string leading = first_fields.empty() ? "" : trim(first_fields[0]);
    const bool is_conditions = std::any_of(
        opts.condition_keywords.begin(), opts.condition_keywords.end(),
        [&](const std::string& word) { return leading.find(word) != std::string::npos; });
    
    if (is_conditions) {
        table.conditions = leading;
        if (!std::getline(stream, line)) {
            throw ParseError("missing header after test conditions in " + name);
        }
    }
    
    for (auto& column : split_line(line, opts.delimiter)) {
        table.header.push_back(trim(column));
    }
    
    while (std::getline(stream, line)) {
        // Skip empty lines
        if (trim(line).empty()) {
            continue;
        }
        
        auto fields = split_line(line, opts.delimiter);
        if (fields.size() != table.header.size()) {
            throw ParseError(name + ": row " + std::to_string(table.rows.size() + 1) +
                             " has " + std::to_string(fields.size()) + " fields, header has " +
                             std::to_string(table.header.size()));
        }
        table.rows.push_back(std::move(fields));
    }
    
    if (table.rows.empty()) {
        throw ParseError("no data rows in " + name);
    }
    
    return table;
}

bool LoggerCsvLoader::try_parse_double(const std::string& str, double& out) {
    if (str.empty()) {
        return false;
    }
    
    try {
        size_t pos;
        out = std::stod(str, &pos);
        // Check if entire string was consumed
        return pos == str.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

std::vector<std::string> LoggerCsvLoader::split_line(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r' || c == '\n') {
            break;
        } else {
            field += c;
        }
    }
    
    // Add last field
    fields.push_back(field);
    
    return fields;
}

} // namespace thermolog
