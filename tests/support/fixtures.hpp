/// @file tests/support/fixtures.hpp
/// @brief In-memory data-logger files and name tables for tests.

#pragma once

#include "thermolog/data/csv_loader.hpp"
#include "thermolog/data/name_table.hpp"
#include "thermolog/data/raw_dataset.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace thermolog::testing {

/// One fixed-width name-table line
inline std::string name_row(const std::string& name, const std::string& column,
                            const std::string& unit, const std::string& label,
                            const std::string& property) {
    auto pad = [](std::string s, size_t width) {
        s.resize(width, ' ');
        return s;
    };
    return pad(name, 12) + pad(column, 36) + pad(unit, 20) + pad(label, 20) + property + "\n";
}

/// Name table covering every raw quantity of the test rig
inline std::string standard_name_table_text() {
    std::string text = "# thermolog name conversions\n";
    text += name_row("name", "col_names", "units", "labels", "properties");
    for (int i = 1; i <= 9; ++i) {
        const std::string n = std::to_string(i);
        text += name_row("T" + n, "T" + n + " refrigerant [C]", "degC", "$T_{" + n + "}$", "temperature");
    }
    text += name_row("Ts", "Supply air [C]", "degC", "$T_{s}$", "temperature");
    text += name_row("RHs", "Supply RH [%]", "percent", "$RH_{s}$", "relative humidity");
    text += name_row("Tr", "Return air [C]", "degC", "$T_{r}$", "temperature");
    text += name_row("RHr", "Return RH [%]", "percent", "$RH_{r}$", "relative humidity");
    text += name_row("pin", "Suction pressure [bar]", "bar", "$p_{in}$", "pressure");
    text += name_row("pout", "Discharge pressure [bar]", "bar", "$p_{out}$", "pressure");
    text += name_row("refdir", "Reversing valve", "-", "-", "-");
    text += name_row("Pa", "Power A [W]", "W", "$P_{a}$", "electrical power");
    text += name_row("Pb", "Power B [W]", "W", "$P_{b}$", "electrical power");
    text += name_row("f", "Compressor freq [Hz]", "Hz", "$f$", "frequency");
    text += name_row("flowrt_r", "Refrigerant flow [g/s]", "g/s", "$\\dot{m}_{r}$", "mass flow rate");
    text += name_row("Tamb", "-", "degC", "$T_{amb}$", "temperature");
    return text;
}

inline NameTable standard_name_table() {
    std::istringstream in(standard_name_table_text());
    return NameTable::parse(in);
}

/// Sample of the rig, in logger units
struct RigSample {
    double T[9] = {10, 70, 40, 65, 35, 25, 10, 8, 12};  // degC, T1..T9
    double Ts = 35, RHs = 20, Tr = 20, RHr = 50;
    double pin = 8, pout = 28;                          // bar
    int refdir = 0;
    double Pa = 1000, Pb = 500;                         // W
    std::string f = "100";                              // raw, twice the compressor frequency
    double flow = 50;                                   // g/s
};

/// Header of a rig CSV file
inline std::string rig_header() {
    std::string header = "Timestamp";
    for (int i = 1; i <= 9; ++i) {
        header += ",T" + std::to_string(i) + " refrigerant [C]";
    }
    header += ",Supply air [C],Supply RH [%],Return air [C],Return RH [%]"
              ",Suction pressure [bar],Discharge pressure [bar],Reversing valve"
              ",Power A [W],Power B [W],Compressor freq [Hz],Refrigerant flow [g/s]";
    return header;
}

/// CSV text with one row per sample, ten seconds apart from start
inline std::string rig_csv(const std::vector<RigSample>& samples,
                           const std::string& start_day = "2019-09-26",
                           int start_hour = 8,
                           const std::string& conditions = "") {
    std::ostringstream out;
    if (!conditions.empty()) {
        out << conditions << "\n";
    }
    out << rig_header() << "\n";
    for (size_t i = 0; i < samples.size(); ++i) {
        const RigSample& s = samples[i];
        const int seconds = static_cast<int>(i) * 10;
        char stamp[32];
        std::snprintf(stamp, sizeof(stamp), "%s %02d:%02d:%02d", start_day.c_str(),
                      start_hour + seconds / 3600, (seconds / 60) % 60, seconds % 60);
        out << stamp;
        for (double t : s.T) out << "," << t;
        out << "," << s.Ts << "," << s.RHs << "," << s.Tr << "," << s.RHr
            << "," << s.pin << "," << s.pout << "," << s.refdir
            << "," << s.Pa << "," << s.Pb << "," << s.f << "," << s.flow << "\n";
    }
    return out.str();
}

/// Dataset parsed from CSV texts (one per file)
inline RawDataset rig_dataset(const std::vector<std::string>& files) {
    std::vector<std::string> names;
    for (size_t i = 0; i < files.size(); ++i) {
        names.push_back("run" + std::to_string(i + 1) + ".csv");
    }
    return LoggerCsvLoader::parse(files, names, LoggerCsvOptions());
}

/// n identical samples
inline std::vector<RigSample> steady_samples(size_t n, RigSample base = RigSample()) {
    return std::vector<RigSample>(n, base);
}

} // namespace thermolog::testing
