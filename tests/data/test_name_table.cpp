/// @file tests/data/test_name_table.cpp
/// @brief Tests for the fixed-width name conversion table.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/data/name_table.hpp"
#include "support/fixtures.hpp"

#include <sstream>
#include <string>

using namespace thermolog;
using namespace thermolog::testing;

TEST(NameTableTest, ParsesFixedWidthFields) {
    NameTable table = standard_name_table();
    const NameEntry* pin = table.find("pin");
    ASSERT_NE(pin, nullptr);
    ASSERT_TRUE(pin->column.has_value());
    EXPECT_EQ(*pin->column, "Suction pressure [bar]");
    EXPECT_EQ(pin->unit, "bar");
    EXPECT_EQ(pin->label, "$p_{in}$");
    EXPECT_EQ(pin->property, "pressure");
}

TEST(NameTableTest, DashMeansNone) {
    NameTable table = standard_name_table();
    const NameEntry* refdir = table.find("refdir");
    ASSERT_NE(refdir, nullptr);
    EXPECT_TRUE(refdir->unit.empty());
    EXPECT_TRUE(refdir->label.empty());

    const NameEntry* tamb = table.find("Tamb");
    ASSERT_NE(tamb, nullptr);
    EXPECT_FALSE(tamb->column.has_value());
}

TEST(NameTableTest, KeepsFileOrder) {
    NameTable table = standard_name_table();
    EXPECT_EQ(table.names().front(), "T1");
    EXPECT_EQ(table.names().back(), "Tamb");
    EXPECT_EQ(table.size(), table.names().size());
}

TEST(NameTableTest, Require) {
    NameTable table = standard_name_table();
    EXPECT_EQ(table.require("T4").quantity, "T4");
    EXPECT_THROW(table.require("bogus"), MissingColumn);
    EXPECT_THROW(table.require("Tamb"), MissingColumn);
}

TEST(NameTableTest, AddReplacesEntry) {
    NameTable table = standard_name_table();
    const size_t before = table.size();
    table.add({"T4", std::string("Other [C]"), "degC", "$T_4$", "temperature"});
    EXPECT_EQ(table.size(), before);
    EXPECT_EQ(*table.require("T4").column, "Other [C]");
}

TEST(NameTableTest, CommentsAndBlankLinesSkipped) {
    std::istringstream in("# comment\n\n" +
                          name_row("name", "col_names", "units", "labels", "properties") +
                          "   # indented comment\n" +
                          name_row("f", "Freq [Hz]", "Hz", "$f$", "frequency"));
    NameTable table = NameTable::parse(in);
    EXPECT_EQ(table.size(), 1u);
}

TEST(NameTableTest, MissingHeader_Throws) {
    std::istringstream empty("# nothing\n");
    EXPECT_THROW(NameTable::parse(empty), ParseError);

    std::istringstream wrong(name_row("name", "columns", "units", "labels", "properties"));
    EXPECT_THROW(NameTable::parse(wrong), ParseError);
}

TEST(NameTableTest, MissingFile_Throws) {
    EXPECT_THROW(NameTable::load("/nonexistent/name_conversions.txt"), ParseError);
}
