/// @file tests/core/test_quantity.cpp
/// @brief Tests for Quantity arithmetic, conversion and broadcasting.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/core/quantity.hpp"

using namespace thermolog;

class QuantityTest : public ::testing::Test {
protected:
    std::shared_ptr<const UnitRegistry> units = UnitRegistry::standard();
    Unit u(const std::string& s) const { return units->get(s); }
};

TEST_F(QuantityTest, Addition_ConvertsRhsToLhsUnit) {
    Quantity a({1.0, 2.0}, u("kW"));
    Quantity b({500.0, 1000.0}, u("W"));
    Quantity sum = a + b;
    EXPECT_EQ(sum.unit().symbol, "kW");
    EXPECT_DOUBLE_EQ(sum[0], 1.5);
    EXPECT_DOUBLE_EQ(sum[1], 3.0);
}

TEST_F(QuantityTest, Addition_DifferentDimension_Throws) {
    Quantity a({1.0}, u("kW"));
    Quantity b({1.0}, u("bar"));
    EXPECT_THROW(a + b, IncompatibleUnits);
}

TEST_F(QuantityTest, Addition_OffsetUnit_Throws) {
    Quantity a({20.0}, u("degC"));
    EXPECT_THROW(a + a, IncompatibleUnits);
    EXPECT_THROW(-a, IncompatibleUnits);
}

TEST_F(QuantityTest, LengthMismatch_Throws) {
    Quantity a({1.0, 2.0}, u("W"));
    Quantity b({1.0, 2.0, 3.0}, u("W"));
    EXPECT_THROW(a - b, IncompatibleUnits);
}

TEST_F(QuantityTest, Scalar_BroadcastsAgainstArray) {
    Quantity a({1.0, 2.0, 3.0}, u("kg/s"));
    Quantity h = Quantity::scalar(1000.0, u("J/kg"));
    Quantity p = a * h;
    ASSERT_EQ(p.size(), 3u);
    EXPECT_FALSE(p.is_scalar());
    EXPECT_DOUBLE_EQ(p.to(u("kW"))[2], 3.0);
}

TEST_F(QuantityTest, Product_GeneratesPowerUnit) {
    Quantity flow({0.05}, u("kg/s"));
    Quantity dh({40000.0}, u("J/kg"));
    Quantity power = flow * dh;
    EXPECT_TRUE(compatible(power.unit(), u("W")));
    EXPECT_DOUBLE_EQ(power.to(u("W"))[0], 2000.0);
}

TEST_F(QuantityTest, Division_GeneratesUnit) {
    Quantity e({3600.0}, u("kJ"));
    Quantity t({1.0}, u("h"));
    EXPECT_DOUBLE_EQ((e / t).to(u("kW"))[0], 1.0);
}

TEST_F(QuantityTest, ToOffsetUnit_Absolute) {
    Quantity t({293.15}, u("K"), "$T$", "temperature");
    Quantity c = t.to(u("degC"));
    EXPECT_NEAR(c[0], 20.0, 1e-12);
    EXPECT_EQ(c.label(), "$T$");
    EXPECT_EQ(c.property(), "temperature");
}

TEST_F(QuantityTest, LessThan_ComparesInCommonUnit) {
    Quantity a({1.0, 5.0}, u("g/kg"));
    Quantity b({0.002, 0.002}, u("frac"));
    auto lt = a.less_than(b);
    EXPECT_TRUE(lt[0]);
    EXPECT_FALSE(lt[1]);
}

TEST_F(QuantityTest, Equality_IncludesMetadata) {
    Quantity a({1.0}, u("W"), "a", "power");
    EXPECT_TRUE(a == Quantity({1.0}, u("W"), "a", "power"));
    EXPECT_FALSE(a == a.with_label("b"));
}
