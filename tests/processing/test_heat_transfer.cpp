/// @file tests/processing/test_heat_transfer.cpp
/// @brief Tests for process tables, pressure sides and phase correction.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/processing/heat_transfer.hpp"
#include "support/fake_property_adapter.hpp"

#include <string>
#include <vector>

using namespace thermolog;
using namespace thermolog::testing;

// ─── Process tables ───────────────────────────────────────────────────────────

TEST(ProcessTableTest, HeatingProcesses) {
    const ProcessDefinition* qcond = find_process("Qcond", OperatingMode::HEATING);
    ASSERT_NE(qcond, nullptr);
    EXPECT_EQ(qcond->inlet.state, 4);
    EXPECT_EQ(qcond->inlet.pressure, "pout");
    EXPECT_EQ(qcond->outlet.temperature(), "T6");
    EXPECT_EQ(qcond->outlet.expected, Phase::LIQUID);
    EXPECT_TRUE(qcond->heat_rejection);

    EXPECT_EQ(find_process("Qloss_ev", OperatingMode::HEATING), nullptr);
}

TEST(ProcessTableTest, CoolingProcesses) {
    const ProcessDefinition* qev = find_process("Qev", OperatingMode::COOLING);
    ASSERT_NE(qev, nullptr);
    EXPECT_EQ(qev->inlet.state, 7);
    EXPECT_EQ(qev->outlet.state, 4);
    EXPECT_EQ(qev->outlet.pressure, "pin");
    EXPECT_FALSE(qev->heat_rejection);

    const ProcessDefinition* loss = find_process("Qloss_ev", OperatingMode::COOLING);
    ASSERT_NE(loss, nullptr);
    EXPECT_EQ(loss->inlet.pressure, "pin");
    EXPECT_EQ(loss->outlet.pressure, "pin");

    EXPECT_TRUE(is_process("Qloss_ev"));
    EXPECT_FALSE(is_process("Pel"));
}

TEST(ProcessTableTest, StatePressuresAgreeWithPressureSide) {
    for (auto mode : {OperatingMode::HEATING, OperatingMode::COOLING}) {
        for (const char* name : {"Qcond", "Qev", "Pcomp", "Qloss_ev"}) {
            const ProcessDefinition* process = find_process(name, mode);
            if (!process) continue;
            EXPECT_EQ(process->inlet.pressure, pressure_side(process->inlet.state, mode)) << name;
            EXPECT_EQ(process->outlet.pressure, pressure_side(process->outlet.state, mode)) << name;
        }
    }
}

// ─── Pressure side ────────────────────────────────────────────────────────────

TEST(PressureSideTest, Heating) {
    EXPECT_EQ(pressure_side(1, OperatingMode::HEATING), "pin");
    for (int s = 2; s <= 6; ++s) EXPECT_EQ(pressure_side(s, OperatingMode::HEATING), "pout") << s;
    for (int s = 7; s <= 9; ++s) EXPECT_EQ(pressure_side(s, OperatingMode::HEATING), "pin") << s;
}

TEST(PressureSideTest, Cooling) {
    EXPECT_EQ(pressure_side(1, OperatingMode::COOLING), "pin");
    EXPECT_EQ(pressure_side(2, OperatingMode::COOLING), "pout");
    for (int s = 3; s <= 6; ++s) EXPECT_EQ(pressure_side(s, OperatingMode::COOLING), "pin") << s;
    for (int s = 7; s <= 9; ++s) EXPECT_EQ(pressure_side(s, OperatingMode::COOLING), "pout") << s;
}

TEST(PressureSideTest, OutOfRange_Throws) {
    EXPECT_THROW(pressure_side(0, OperatingMode::HEATING), UnknownQuantity);
    EXPECT_THROW(pressure_side(10, OperatingMode::COOLING), UnknownQuantity);
}

// ─── Phase correction ─────────────────────────────────────────────────────────

TEST(CorrectedEnthalpyTest, MatchingPhases_LeaveEnthalpiesUntouched) {
    FakePropertyAdapter adapter;
    std::vector<double> p = {2.8e6, 2.8e6, 2.9e6};
    std::vector<double> T = {338.15, 340.0, 360.5};

    CorrectedEnthalpy h = corrected_enthalpy(adapter, p, T, Phase::GAS);
    EXPECT_EQ(h.corrections, 0u);
    EXPECT_EQ(h.values, adapter.enthalpies(p, T));
}

TEST(CorrectedEnthalpyTest, Mismatch_TakesSaturatedValue) {
    FakePropertyAdapter adapter;
    std::vector<double> p = {2.8e6, 2.8e6};
    std::vector<double> T = {298.15, 338.15};   // liquid, gas

    CorrectedEnthalpy liquid = corrected_enthalpy(adapter, p, T, Phase::LIQUID);
    EXPECT_EQ(liquid.corrections, 1u);
    EXPECT_DOUBLE_EQ(liquid.values[0], 227800.0);
    EXPECT_DOUBLE_EQ(liquid.values[1], 400000.0 + 2800.0);

    CorrectedEnthalpy gas = corrected_enthalpy(adapter, p, T, Phase::GAS);
    EXPECT_EQ(gas.corrections, 1u);
    EXPECT_DOUBLE_EQ(gas.values[0], 100000.0 + 2800.0);
}

TEST(CorrectedEnthalpyTest, TwoPhaseCountsAsMismatch) {
    FakePropertyAdapter adapter;
    adapter.phase_oracle = [](double, double) { return Phase::TWO_PHASE; };
    std::vector<double> p = {1e6};
    std::vector<double> T = {283.15};
    CorrectedEnthalpy h = corrected_enthalpy(adapter, p, T, Phase::GAS);
    EXPECT_EQ(h.corrections, 1u);
    EXPECT_DOUBLE_EQ(h.values[0], 401000.0);
}

TEST(CorrectedEnthalpyTest, LengthMismatch_Throws) {
    FakePropertyAdapter adapter;
    std::vector<double> p = {1e6, 1e6};
    std::vector<double> T = {283.15};
    EXPECT_THROW(corrected_enthalpy(adapter, p, T, Phase::GAS), IncompatibleUnits);
}

// ─── Process power ────────────────────────────────────────────────────────────

TEST(ProcessPowerTest, HeatRejection_IsPositive) {
    auto units = UnitRegistry::standard();
    Quantity flow({0.05}, units->get("kg/s"));
    Quantity h_in({267800.0}, units->get("J/kg"));
    Quantity h_out({227800.0}, units->get("J/kg"));

    Quantity qcond = process_power(*find_process("Qcond", OperatingMode::HEATING),
                                   flow, h_in, h_out, *units);
    EXPECT_NEAR(qcond[0], 2.0, 1e-12);
    EXPECT_EQ(qcond.unit().symbol, "kW");
    EXPECT_EQ(qcond.property(), "heat transfer rate");

    Quantity qev = process_power(*find_process("Qev", OperatingMode::HEATING),
                                 flow, h_in, h_out, *units);
    EXPECT_NEAR(qev[0], -2.0, 1e-12);
}

// ─── Phase names ──────────────────────────────────────────────────────────────

TEST(PhaseTest, NamesFollowPropertyLibrary) {
    EXPECT_EQ(parse_phase("liquid"), Phase::LIQUID);
    EXPECT_EQ(parse_phase("twophase"), Phase::TWO_PHASE);
    EXPECT_EQ(parse_phase("supercritical_gas"), Phase::SUPERCRITICAL_GAS);
    EXPECT_EQ(parse_phase("liq"), Phase::UNKNOWN);
    EXPECT_STREQ(to_string(Phase::GAS), "gas");
}
