#include "thermolog/data/name_table.hpp"
#include "thermolog/core/errors.hpp"
#include <array>
#include <fstream>

namespace thermolog {

namespace {

constexpr std::array<size_t, 4> FIELD_WIDTHS = {12, 36, 20, 20};
constexpr const char* HEADER_FIELDS[] = {"col_names", "units", "labels", "properties"};

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/// Cut a line into the five fixed-width fields
std::array<std::string, 5> split_fixed(const std::string& line) {
    std::array<std::string, 5> fields;
    size_t pos = 0;
    for (size_t i = 0; i < FIELD_WIDTHS.size(); ++i) {
        if (pos < line.size()) {
            fields[i] = trim(line.substr(pos, FIELD_WIDTHS[i]));
        }
        pos += FIELD_WIDTHS[i];
    }
    if (pos < line.size()) {
        fields[4] = trim(line.substr(pos));
    }
    return fields;
}

std::string none_to_empty(const std::string& field) {
    return field == "-" ? std::string() : field;
}

} // namespace

NameTable NameTable::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParseError("cannot open name table: " + path);
    }
    return parse(file);
}

NameTable NameTable::parse(std::istream& in) {
    NameTable table;
    std::string line;
    bool header_seen = false;
    size_t line_number = 0;
    
    while (std::getline(in, line)) {
        ++line_number;
        const std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        
        auto fields = split_fixed(line);
        
        if (!header_seen) {
            for (size_t i = 0; i < 4; ++i) {
                if (fields[i + 1] != HEADER_FIELDS[i]) {
                    throw ParseError("name table line " + std::to_string(line_number) +
                                     ": expected header field '" + HEADER_FIELDS[i] +
                                     "', found '" + fields[i + 1] + "'");
                }
            }
            header_seen = true;
            continue;
        }
        
        if (fields[0].empty()) {
            throw ParseError("name table line " + std::to_string(line_number) + ": missing name");
        }
        
        NameEntry entry;
        entry.quantity = fields[0];
        if (fields[1] != "-" && !fields[1].empty()) {
            entry.column = fields[1];
        }
        entry.unit = none_to_empty(fields[2]);
        entry.label = none_to_empty(fields[3]);
        entry.property = none_to_empty(fields[4]);
        table.add(std::move(entry));
    }
    
    if (!header_seen) {
        throw ParseError("name table has no header");
    }
    return table;
}

void NameTable::add(NameEntry entry) {
    auto it = entries_.find(entry.quantity);
    if (it == entries_.end()) {
        order_.push_back(entry.quantity);
        entries_.emplace(entry.quantity, std::move(entry));
    } else {
        it->second = std::move(entry);
    }
}

const NameEntry* NameTable::find(const std::string& quantity) const {
    auto it = entries_.find(quantity);
    return it == entries_.end() ? nullptr : &it->second;
}

const NameEntry& NameTable::require(const std::string& quantity) const {
    const NameEntry* entry = find(quantity);
    if (!entry) {
        throw MissingColumn(quantity, "no name table entry");
    }
    if (!entry->column) {
        throw MissingColumn(quantity, "name table entry has no column");
    }
    return *entry;
}

} // namespace thermolog
