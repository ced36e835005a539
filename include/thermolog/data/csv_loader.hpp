#pragma once

#include "thermolog/data/raw_dataset.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace thermolog {

/// Data-logger CSV loading options
struct LoggerCsvOptions {
    char delimiter = ',';                       ///< Field delimiter
    std::string timestamp_column = "Timestamp"; ///< Column holding sample times
    
    /// strptime-style formats tried in order; fractional seconds are rounded
    std::vector<std::string> timestamp_formats = {
        "%Y-%m-%d %H:%M:%S",
        "%d/%m/%Y %H:%M:%S",
        "%Y/%m/%d %H:%M:%S"
    };
    
    /// A first line whose leading field contains one of these is the
    /// test conditions line and precedes the header
    std::vector<std::string> condition_keywords = {"load", "aux", "setpoint", "|", "PdT"};
    
    bool verbose = false;   ///< Log files and conditions to stderr
};

/// Loads one or more data-logger CSV exports into a single RawDataset
///
/// Files are concatenated in the given order. Every row receives the
/// file_index, test_period and test_duration columns; timestamps are
/// stored as whole seconds since the epoch (UTC).
class LoggerCsvLoader {
public:
    LoggerCsvLoader() = delete;  // Static class, no instances
    
    /// Load and concatenate files
    /// @throws ParseError on unreadable or malformed files
    static RawDataset load(const std::vector<std::string>& paths, const LoggerCsvOptions& opts);
    
    /// Parse in-memory CSV contents (one string per file)
    static RawDataset parse(const std::vector<std::string>& contents,
                            const std::vector<std::string>& names,
                            const LoggerCsvOptions& opts);
    
    /// Parse a timestamp with the configured formats, rounded to seconds
    /// @throws ParseError if no format matches
    static int64_t parse_timestamp(const std::string& text, const LoggerCsvOptions& opts);
    
    /// "dd/mm HH:MM - HH:MM", stop prefixed with "dd/mm " beyond one day
    static std::string format_test_period(int64_t start, int64_t stop);
    
    /// Split CSV line into fields
    static std::vector<std::string> split_line(const std::string& line, char delimiter);
    
private:
    /// Parsed contents of one file before merging
    struct FileTable {
        std::string name;
        std::string conditions;
        std::vector<std::string> header;
        std::vector<std::vector<std::string>> rows;
    };
    
    static FileTable parse_file(const std::string& content, const std::string& name,
                                const LoggerCsvOptions& opts);
    
    static bool try_parse_double(const std::string& str, double& out);
};

} // namespace thermolog
