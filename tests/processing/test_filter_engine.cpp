/// @file tests/processing/test_filter_engine.cpp
/// @brief Tests for canonical filter keys and Arrow-backed row selection.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/data/column.hpp"
#include "thermolog/processing/filter_engine.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace thermolog;

namespace {

RawDataset make_dataset() {
    RawDataset dataset;
    dataset.set_column("file_index", std::make_shared<Int64Column>(
        "file_index", std::vector<int64_t>{0, 0, 1, 1, 2}, ColumnType::INT64));
    dataset.set_column("T1", std::make_shared<Float64Column>(
        "T1", std::vector<double>{10.0, 10.5, 11.0, 10.0, 12.0}, ColumnType::FLOAT64));
    dataset.set_column("test_period", std::make_shared<StringColumn>(
        "test_period", std::vector<std::string>{"a", "a", "b", "b", "c"}, ColumnType::STRING));
    dataset.set_column("steady_state", std::make_shared<LabelColumn>(
        "steady_state",
        std::vector<std::optional<std::string>>{"short", std::nullopt, "long", "long", std::nullopt},
        ColumnType::LABEL));
    return dataset;
}

} // namespace

// ─── Signature ────────────────────────────────────────────────────────────────

TEST(FilterSignatureTest, EmptyFilter) {
    FilterSignature signature{Filter{}};
    EXPECT_TRUE(signature.empty());
    EXPECT_EQ(signature, FilterSignature());
    EXPECT_EQ(signature.key(), "");
}

TEST(FilterSignatureTest, IntegralDouble_SameKeyAsInteger) {
    FilterSignature a(Filter{{"file_index", int64_t{1}}});
    FilterSignature b(Filter{{"file_index", 1.0}});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.key(), "10:file_index=i:1;");
}

TEST(FilterSignatureTest, DistinctValuesAndTypes_Differ) {
    FilterSignature one(Filter{{"file_index", int64_t{1}}});
    EXPECT_NE(one, FilterSignature(Filter{{"file_index", int64_t{2}}}));
    EXPECT_NE(one, FilterSignature(Filter{{"file_index", std::string("1")}}));
    EXPECT_NE(one, FilterSignature(Filter{{"file_index", 1.5}}));
}

TEST(FilterSignatureTest, KeyIsUnambiguous) {
    // Separators inside names and values cannot collide
    FilterSignature a(Filter{{"a", std::string("x;1:b=i:2")}});
    FilterSignature b(Filter{{"a", std::string("x")}, {"1:b", int64_t{2}}});
    EXPECT_NE(a, b);
}

TEST(FilterSignatureTest, ConditionsInColumnOrder) {
    FilterSignature signature(Filter{{"test_period", std::string("a")}, {"file_index", int64_t{0}}});
    ASSERT_EQ(signature.conditions().size(), 2u);
    EXPECT_EQ(signature.conditions()[0].column_name, "file_index");
    EXPECT_EQ(signature.conditions()[1].column_name, "test_period");
}

// ─── Row selection ────────────────────────────────────────────────────────────

class FilterEngineTest : public ::testing::Test {
protected:
    RawDataset dataset = make_dataset();
    FilterEngine engine;

    RowSelection select(const Filter& filter) {
        return engine.select_rows(dataset, FilterSignature(filter));
    }
};

TEST_F(FilterEngineTest, EmptyFilter_SelectsEveryRow) {
    EXPECT_EQ(select({}), (RowSelection{0, 1, 2, 3, 4}));
}

TEST_F(FilterEngineTest, IntegerColumn) {
    EXPECT_EQ(select({{"file_index", int64_t{1}}}), (RowSelection{2, 3}));
    EXPECT_EQ(select({{"file_index", 1.0}}), (RowSelection{2, 3}));
    EXPECT_TRUE(select({{"file_index", 1.5}}).empty());
}

TEST_F(FilterEngineTest, FloatColumn) {
    EXPECT_EQ(select({{"T1", 10.5}}), (RowSelection{1}));
    EXPECT_EQ(select({{"T1", int64_t{10}}}), (RowSelection{0, 3}));
}

TEST_F(FilterEngineTest, TextColumns) {
    EXPECT_EQ(select({{"test_period", std::string("b")}}), (RowSelection{2, 3}));
    EXPECT_EQ(select({{"steady_state", std::string("long")}}), (RowSelection{2, 3}));
}

TEST_F(FilterEngineTest, NullLabels_NeverMatch) {
    auto mask = engine.calculate_mask(
        dataset, std::vector<FilterCondition>{FilterCondition{"steady_state", std::string("short")}});
    EXPECT_EQ(mask, (std::vector<bool>{true, false, false, false, false}));
}

TEST_F(FilterEngineTest, TypeMismatch_MatchesNothing) {
    EXPECT_TRUE(select({{"test_period", int64_t{1}}}).empty());
    EXPECT_TRUE(select({{"file_index", std::string("1")}}).empty());
}

TEST_F(FilterEngineTest, ConditionsCombineWithAnd) {
    EXPECT_EQ(select({{"file_index", int64_t{1}}, {"T1", 10.0}}), (RowSelection{3}));
    EXPECT_TRUE(select({{"file_index", int64_t{0}}, {"test_period", std::string("c")}}).empty());
}

TEST_F(FilterEngineTest, UnknownColumn_Throws) {
    EXPECT_THROW(select({{"nope", int64_t{0}}}), MissingColumn);
}
