#pragma once

/**
 * @file units.hpp
 * @brief Physical units, dimensional analysis and conversion
 *
 * A Unit is a scale and offset relative to the SI base unit of its
 * dimension: base = value * scale + offset. Offset units (degC, degF)
 * convert absolutely and refuse multiplicative arithmetic.
 *
 * The UnitRegistry is built once per session by an explicit
 * initialisation step and shared read-only:
 * @code
 *   auto units = UnitRegistry::standard();
 *   const Unit& kw = units->get("kW");
 *   const Unit& flux = units->get("kg/s*J/kg");   // composed on demand
 * @endcode
 */

#include <array>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace thermolog {

// ============================================================================
// Dimension
// ============================================================================

/**
 * @brief Exponents of the base dimensions L, M, T and Theta (temperature)
 */
struct Dimension {
    std::array<int, 4> exponents{};

    Dimension() = default;
    Dimension(int length, int mass, int time, int temperature)
        : exponents{length, mass, time, temperature} {}

    bool operator==(const Dimension& other) const { return exponents == other.exponents; }
    bool operator!=(const Dimension& other) const { return !(*this == other); }

    Dimension operator*(const Dimension& other) const;
    Dimension operator/(const Dimension& other) const;

    bool dimensionless() const { return *this == Dimension(); }

    /// Readable form such as "[L^2 T^-3 M]", or "[]" when dimensionless
    std::string to_string() const;
};

// ============================================================================
// Unit
// ============================================================================

/**
 * @brief Unit definition relative to the SI base unit of its dimension
 */
struct Unit {
    std::string symbol;     ///< Display symbol (e.g. "kW", "kg/s")
    Dimension dimension;    ///< Dimensional formula
    double scale;           ///< Multiplier to the base unit
    double offset;          ///< Additive term to the base unit (temperatures)

    Unit() : scale(1.0), offset(0.0) {}
    Unit(std::string sym, Dimension dim, double s, double off = 0.0)
        : symbol(std::move(sym)), dimension(dim), scale(s), offset(off) {}

    /// Dimensionless unit with unit scale
    static Unit dimensionless() { return Unit("", Dimension(), 1.0); }

    bool has_offset() const { return offset != 0.0; }

    double to_base(double value) const { return value * scale + offset; }
    double from_base(double value) const { return (value - offset) / scale; }

    /// Same symbol, dimension, scale and offset
    bool operator==(const Unit& other) const {
        return symbol == other.symbol && dimension == other.dimension &&
               scale == other.scale && offset == other.offset;
    }
};

/// Whether values in the two units can be converted into each other
inline bool compatible(const Unit& a, const Unit& b) {
    return a.dimension == b.dimension;
}

/// Product unit; throws IncompatibleUnits for offset units
Unit multiply(const Unit& a, const Unit& b);

/// Quotient unit; throws IncompatibleUnits for offset units
Unit divide(const Unit& a, const Unit& b);

/// Integer power of a unit; throws IncompatibleUnits for offset units
Unit power(const Unit& u, int exponent);

/// Convert a single value; throws IncompatibleUnits on dimension mismatch
double convert(double value, const Unit& from, const Unit& to);

/// Convert an array of values; throws IncompatibleUnits on dimension mismatch
std::vector<double> convert(std::span<const double> values, const Unit& from, const Unit& to);

// ============================================================================
// Unit Registry
// ============================================================================

/**
 * @brief Database of named units with expression parsing
 *
 * Expressions combine registered symbols with '*', '/' and integer
 * exponents ('^' or '**'), evaluated left to right: "kg/s", "J/kg",
 * "Hz^2", "W/m**2/K". A registered symbol always wins over parsing, so
 * "g/kg" may be defined as a named unit.
 */
class UnitRegistry {
public:
    UnitRegistry() = default;

    /// Registry populated with SI, laboratory and fraction units
    static std::shared_ptr<const UnitRegistry> standard();

    /// Register a unit under its symbol and optional aliases
    void define(const Unit& unit, const std::vector<std::string>& aliases = {});

    /// Register a unit as a multiple of an already registered one
    void define_scaled(const std::string& symbol, double factor, const std::string& reference,
                       const std::vector<std::string>& aliases = {});

    /**
     * @brief Look up or compose a unit
     * @param expression Symbol or unit expression
     * @return Unit whose symbol is the expression as written
     * @throws IncompatibleUnits if a symbol is unknown or the expression malformed
     */
    Unit get(const std::string& expression) const;

    /// Whether the expression can be resolved
    bool has(const std::string& expression) const;

    /// Convert values between two unit expressions
    std::vector<double> convert(std::span<const double> values,
                                const std::string& from, const std::string& to) const;

    /// All registered symbols and aliases
    std::vector<std::string> symbols() const;

private:
    const Unit* find(const std::string& symbol) const;

    std::unordered_map<std::string, Unit> units_;
};

} // namespace thermolog
