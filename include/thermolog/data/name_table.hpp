#pragma once

#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace thermolog {

/// Raw column and display metadata of one quantity name
struct NameEntry {
    std::string quantity;                   ///< Short name ("T4", "f", "pin")
    std::optional<std::string> column;      ///< Raw dataset column, none if "-"
    std::string unit;                       ///< Unit expression of the raw values
    std::string label;                      ///< Display label ("$T_4$")
    std::string property;                   ///< Physical property ("temperature")
};

/// Lookup table from quantity name to raw column, unit, label and property
///
/// File format is fixed-width: name (12), col_names (36), units (20),
/// labels (20), properties (rest). Lines starting with '#' are comments,
/// the first other line is the header and '-' stands for "none".
class NameTable {
public:
    NameTable() = default;
    
    /// Load a conversion file
    /// @throws ParseError if the file cannot be read or is malformed
    static NameTable load(const std::string& path);
    
    /// Parse conversion table contents
    /// @throws ParseError on malformed input
    static NameTable parse(std::istream& in);
    
    /// Add or replace an entry
    void add(NameEntry entry);
    
    /// Entry for a quantity name, or nullptr
    const NameEntry* find(const std::string& quantity) const;
    
    /// Entry with a raw column
    /// @throws MissingColumn if absent or without column
    const NameEntry& require(const std::string& quantity) const;
    
    bool contains(const std::string& quantity) const { return find(quantity) != nullptr; }
    
    /// Quantity names in insertion order
    const std::vector<std::string>& names() const { return order_; }
    
    size_t size() const { return order_.size(); }
    
private:
    std::unordered_map<std::string, NameEntry> entries_;
    std::vector<std::string> order_;
};

} // namespace thermolog
