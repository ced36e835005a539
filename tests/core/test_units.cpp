/// @file tests/core/test_units.cpp
/// @brief Tests for Dimension, Unit and UnitRegistry.
///
/// Test categories:
///   - Registered symbols, aliases and fraction units
///   - Composed expressions and exponents
///   - Offset temperatures
///   - Errors for unknown symbols and dimension mismatch

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/core/units.hpp"

#include <vector>

using namespace thermolog;

class UnitRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<const UnitRegistry> units = UnitRegistry::standard();
};

// ─── Lookup ───────────────────────────────────────────────────────────────────

TEST_F(UnitRegistryTest, Aliases_ShareScale) {
    EXPECT_DOUBLE_EQ(units->get("percent").scale, units->get("pct").scale);
    EXPECT_DOUBLE_EQ(units->get("ratio").scale, units->get("frac").scale);
    EXPECT_DOUBLE_EQ(units->get("hertzs").scale, 1.0);
}

TEST_F(UnitRegistryTest, FractionUnits_AreDimensionless) {
    EXPECT_TRUE(units->get("frac").dimension.dimensionless());
    EXPECT_TRUE(units->get("ppm").dimension.dimensionless());
    EXPECT_TRUE(units->get("g/kg").dimension.dimensionless());
    EXPECT_DOUBLE_EQ(convert(1.0, units->get("frac"), units->get("g/kg")), 1000.0);
}

TEST_F(UnitRegistryTest, HasRejectsUnknown) {
    EXPECT_TRUE(units->has("kW"));
    EXPECT_FALSE(units->has("furlong"));
}

// ─── Expressions ──────────────────────────────────────────────────────────────

TEST_F(UnitRegistryTest, ComposedPower_MatchesWatt) {
    Unit flux = units->get("kg/s*J/kg");
    EXPECT_TRUE(compatible(flux, units->get("W")));
    EXPECT_DOUBLE_EQ(flux.scale, 1.0);
    EXPECT_EQ(flux.symbol, "kg/s*J/kg");
}

TEST_F(UnitRegistryTest, Exponents_CaretAndDoubleStar) {
    Unit a = units->get("Hz^2");
    Unit b = units->get("Hz**2");
    EXPECT_EQ(a.dimension, b.dimension);
    EXPECT_EQ(a.dimension, Dimension(0, 0, -2, 0));
}

TEST_F(UnitRegistryTest, MalformedExponent_Throws) {
    EXPECT_THROW(units->get("Hz^x"), IncompatibleUnits);
}

TEST_F(UnitRegistryTest, UnknownSymbol_Throws) {
    EXPECT_THROW(units->get("kg/parsec"), IncompatibleUnits);
}

// ─── Conversion ───────────────────────────────────────────────────────────────

TEST_F(UnitRegistryTest, Celsius_ToKelvin) {
    EXPECT_DOUBLE_EQ(convert(20.0, units->get("degC"), units->get("K")), 293.15);
    EXPECT_NEAR(convert(212.0, units->get("degF"), units->get("degC")), 100.0, 1e-9);
}

TEST_F(UnitRegistryTest, Bar_ToPascal) {
    std::vector<double> bar = {1.0, 28.0};
    auto pa = units->convert(bar, "bar", "Pa");
    EXPECT_DOUBLE_EQ(pa[0], 1e5);
    EXPECT_DOUBLE_EQ(pa[1], 2.8e6);
}

TEST_F(UnitRegistryTest, Minutes_ToSeconds) {
    EXPECT_DOUBLE_EQ(convert(30.0, units->get("min"), units->get("s")), 1800.0);
}

TEST_F(UnitRegistryTest, DimensionMismatch_Throws) {
    EXPECT_THROW(convert(1.0, units->get("kW"), units->get("bar")), IncompatibleUnits);
}

TEST_F(UnitRegistryTest, OffsetUnitArithmetic_Throws) {
    EXPECT_THROW(multiply(units->get("degC"), units->get("s")), IncompatibleUnits);
    EXPECT_THROW(power(units->get("degF"), 2), IncompatibleUnits);
}

TEST(Dimension, ToString_ListsNonZeroExponents) {
    EXPECT_EQ(Dimension().to_string(), "[]");
    EXPECT_EQ(Dimension(2, 1, -3, 0).to_string(), "[L^2 M T^-3]");
}
