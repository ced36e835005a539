#include "thermolog/core/units.hpp"
#include "thermolog/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace thermolog {

// ============================================================================
// Dimension
// ============================================================================

Dimension Dimension::operator*(const Dimension& other) const {
    Dimension result;
    for (size_t i = 0; i < exponents.size(); ++i) {
        result.exponents[i] = exponents[i] + other.exponents[i];
    }
    return result;
}

Dimension Dimension::operator/(const Dimension& other) const {
    Dimension result;
    for (size_t i = 0; i < exponents.size(); ++i) {
        result.exponents[i] = exponents[i] - other.exponents[i];
    }
    return result;
}

std::string Dimension::to_string() const {
    static const char* names[] = {"L", "M", "T", "Theta"};
    std::ostringstream ss;
    ss << "[";
    bool first = true;
    for (size_t i = 0; i < exponents.size(); ++i) {
        if (exponents[i] == 0) {
            continue;
        }
        if (!first) ss << " ";
        ss << names[i];
        if (exponents[i] != 1) ss << "^" << exponents[i];
        first = false;
    }
    ss << "]";
    return ss.str();
}

// ============================================================================
// Unit Arithmetic
// ============================================================================

namespace {

void require_no_offset(const Unit& u, const char* operation) {
    if (u.has_offset()) {
        throw IncompatibleUnits(std::string("offset unit '") + u.symbol +
                                "' cannot be used in " + operation);
    }
}

std::string join_symbols(const std::string& a, char op, const std::string& b) {
    if (a.empty()) {
        return op == '*' ? b : (b.empty() ? "" : "1/" + b);
    }
    if (b.empty()) {
        return a;
    }
    return a + op + b;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

Unit multiply(const Unit& a, const Unit& b) {
    require_no_offset(a, "multiplication");
    require_no_offset(b, "multiplication");
    return Unit(join_symbols(a.symbol, '*', b.symbol),
                a.dimension * b.dimension, a.scale * b.scale);
}

Unit divide(const Unit& a, const Unit& b) {
    require_no_offset(a, "division");
    require_no_offset(b, "division");
    return Unit(join_symbols(a.symbol, '/', b.symbol),
                a.dimension / b.dimension, a.scale / b.scale);
}

Unit power(const Unit& u, int exponent) {
    require_no_offset(u, "exponentiation");
    Unit result = Unit::dimensionless();
    for (int i = 0; i < std::abs(exponent); ++i) {
        result = exponent > 0 ? multiply(result, u) : divide(result, u);
    }
    if (!u.symbol.empty() && exponent != 1 && exponent != 0) {
        result.symbol = u.symbol + "^" + std::to_string(exponent);
    }
    return result;
}

double convert(double value, const Unit& from, const Unit& to) {
    if (!compatible(from, to)) {
        throw IncompatibleUnits("cannot convert '" + from.symbol + "' " +
                                from.dimension.to_string() + " to '" + to.symbol + "' " +
                                to.dimension.to_string());
    }
    return to.from_base(from.to_base(value));
}

std::vector<double> convert(std::span<const double> values, const Unit& from, const Unit& to) {
    if (!compatible(from, to)) {
        throw IncompatibleUnits("cannot convert '" + from.symbol + "' " +
                                from.dimension.to_string() + " to '" + to.symbol + "' " +
                                to.dimension.to_string());
    }
    std::vector<double> result(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        result[i] = to.from_base(from.to_base(values[i]));
    }
    return result;
}

// ============================================================================
// UnitRegistry
// ============================================================================

std::shared_ptr<const UnitRegistry> UnitRegistry::standard() {
    auto registry = std::make_shared<UnitRegistry>();
    UnitRegistry& r = *registry;

    const Dimension none;
    const Dimension length(1, 0, 0, 0);
    const Dimension mass(0, 1, 0, 0);
    const Dimension time(0, 0, 1, 0);
    const Dimension temperature(0, 0, 0, 1);

    // Base units
    r.define(Unit("m", length, 1.0), {"meter"});
    r.define(Unit("kg", mass, 1.0), {"kilogram"});
    r.define(Unit("s", time, 1.0), {"second", "seconds", "sec"});
    r.define(Unit("K", temperature, 1.0), {"kelvin"});

    // Dimensionless
    r.define(Unit("frac", none, 1.0), {"fraction", "ratio", "dimensionless"});
    r.define_scaled("pct", 1e-2, "frac", {"percent", "%"});
    r.define_scaled("ppm", 1e-6, "frac");
    r.define(Unit("g/kg", none, 1e-3));

    // Mass, time, frequency
    r.define_scaled("g", 1e-3, "kg", {"gram"});
    r.define_scaled("min", 60.0, "s", {"minute", "minutes"});
    r.define_scaled("h", 3600.0, "s", {"hr", "hour", "hours"});
    r.define_scaled("ms", 1e-3, "s");
    r.define(Unit("Hz", Dimension(0, 0, -1, 0), 1.0), {"hertz", "hertzs"});
    r.define(Unit("rpm", Dimension(0, 0, -1, 0), 1.0 / 60.0));

    // Temperatures
    r.define(Unit("degC", temperature, 1.0, 273.15), {"°C", "celsius"});
    r.define(Unit("degF", temperature, 5.0 / 9.0, 273.15 - 32.0 * 5.0 / 9.0),
             {"°F", "fahrenheit"});
    r.define(Unit("delta_degC", temperature, 1.0));

    // Force, pressure
    const Dimension force(1, 1, -2, 0);
    const Dimension pressure(-1, 1, -2, 0);
    r.define(Unit("N", force, 1.0), {"newton"});
    r.define(Unit("Pa", pressure, 1.0), {"pascal"});
    r.define_scaled("kPa", 1e3, "Pa");
    r.define_scaled("MPa", 1e6, "Pa");
    r.define_scaled("bar", 1e5, "Pa");
    r.define_scaled("mbar", 1e2, "Pa");
    r.define_scaled("psi", 6894.757293168, "Pa");

    // Energy, power
    const Dimension energy(2, 1, -2, 0);
    const Dimension power_dim(2, 1, -3, 0);
    r.define(Unit("J", energy, 1.0), {"joule"});
    r.define_scaled("kJ", 1e3, "J");
    r.define_scaled("kWh", 3.6e6, "J");
    r.define(Unit("W", power_dim, 1.0), {"watt"});
    r.define_scaled("kW", 1e3, "W", {"kilowatt"});

    // Specific energy, mass flow, volume flow
    r.define(Unit("J/kg", Dimension(2, 0, -2, 0), 1.0));
    r.define(Unit("kJ/kg", Dimension(2, 0, -2, 0), 1e3));
    r.define(Unit("kg/s", Dimension(0, 1, -1, 0), 1.0));
    r.define(Unit("g/s", Dimension(0, 1, -1, 0), 1e-3));
    r.define(Unit("kg/h", Dimension(0, 1, -1, 0), 1.0 / 3600.0));
    r.define(Unit("m3/h", Dimension(3, 0, -1, 0), 1.0 / 3600.0));
    r.define(Unit("l/min", Dimension(3, 0, -1, 0), 1e-3 / 60.0), {"L/min"});

    // Electrical
    r.define(Unit("V", Dimension(2, 1, -3, 0), 1.0), {"volt"});

    return registry;
}

void UnitRegistry::define(const Unit& unit, const std::vector<std::string>& aliases) {
    units_[unit.symbol] = unit;
    for (const auto& alias : aliases) {
        Unit aliased = unit;
        aliased.symbol = alias;
        units_[alias] = aliased;
    }
}

void UnitRegistry::define_scaled(const std::string& symbol, double factor,
                                 const std::string& reference,
                                 const std::vector<std::string>& aliases) {
    const Unit* ref = find(reference);
    if (!ref) {
        throw IncompatibleUnits("unknown reference unit '" + reference + "'");
    }
    define(Unit(symbol, ref->dimension, ref->scale * factor, ref->offset), aliases);
}

const Unit* UnitRegistry::find(const std::string& symbol) const {
    auto it = units_.find(symbol);
    return it == units_.end() ? nullptr : &it->second;
}

Unit UnitRegistry::get(const std::string& expression) const {
    const std::string expr = trim(expression);
    if (expr.empty()) {
        return Unit::dimensionless();
    }
    if (const Unit* unit = find(expr)) {
        return *unit;
    }

    // Compose: factor (('*' | '/') factor)*, factor = symbol [('^' | '**') int]
    Unit result = Unit::dimensionless();
    char pending_op = '*';
    size_t pos = 0;
    while (pos <= expr.size()) {
        size_t next = pos;
        while (next < expr.size() && expr[next] != '/' &&
               !(expr[next] == '*' && (next + 1 >= expr.size() || expr[next + 1] != '*'))) {
            next += (expr[next] == '*') ? 2 : 1;  // skip "**"
        }
        std::string token = trim(expr.substr(pos, next - pos));

        int exponent = 1;
        size_t caret = token.find('^');
        size_t stars = token.find("**");
        size_t exp_pos = caret != std::string::npos ? caret : stars;
        if (exp_pos != std::string::npos) {
            size_t digits = exp_pos + (caret != std::string::npos ? 1 : 2);
            try {
                size_t used = 0;
                exponent = std::stoi(token.substr(digits), &used);
                if (used != token.size() - digits) {
                    throw IncompatibleUnits("malformed exponent in '" + expression + "'");
                }
            } catch (const std::logic_error&) {
                throw IncompatibleUnits("malformed exponent in '" + expression + "'");
            }
            token = trim(token.substr(0, exp_pos));
        }

        const Unit* factor = nullptr;
        Unit numeric_one = Unit::dimensionless();
        if (token == "1") {
            factor = &numeric_one;
        } else {
            factor = find(token);
        }
        if (!factor) {
            throw IncompatibleUnits("unknown unit '" + token + "' in '" + expression + "'");
        }
        Unit term = exponent == 1 ? *factor : power(*factor, exponent);
        result = pending_op == '*' ? multiply(result, term) : divide(result, term);

        if (next >= expr.size()) {
            break;
        }
        pending_op = expr[next];
        pos = next + 1;
    }

    result.symbol = expr;
    return result;
}

bool UnitRegistry::has(const std::string& expression) const {
    try {
        get(expression);
        return true;
    } catch (const IncompatibleUnits&) {
        return false;
    }
}

std::vector<double> UnitRegistry::convert(std::span<const double> values,
                                          const std::string& from,
                                          const std::string& to) const {
    return thermolog::convert(values, get(from), get(to));
}

std::vector<std::string> UnitRegistry::symbols() const {
    std::vector<std::string> result;
    result.reserve(units_.size());
    for (const auto& [symbol, unit] : units_) {
        result.push_back(symbol);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace thermolog
