#include "functions/cell_normalizer/src/cell_normalizer.hpp"

#include <gtest/gtest.h>

TEST(CellNormalizer, EmptyCellYieldsNothing) {
    EXPECT_FALSE(normalize_cell(CellValue::empty()).has_value());
}

TEST(CellNormalizer, TextIsTrimmed) {
    auto v = normalize_cell(CellValue::of_text("  hello world \n"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, "hello world");
}

TEST(CellNormalizer, WhitespaceOnlyTextYieldsNothing) {
    EXPECT_FALSE(normalize_cell(CellValue::of_text(" \t\r\n ")).has_value());
    EXPECT_FALSE(normalize_cell(CellValue::of_text("")).has_value());
}

TEST(CellNormalizer, NumbersAreStringified) {
    EXPECT_EQ(*normalize_cell(CellValue::of_number(42.0)), "42");
    EXPECT_EQ(*normalize_cell(CellValue::of_number(-7.0)), "-7");
    EXPECT_EQ(*normalize_cell(CellValue::of_number(3.5)), "3.5");
    EXPECT_EQ(*normalize_cell(CellValue::of_number(0.1)), "0.1");
    EXPECT_EQ(format_number(-0.0), "0");
}

TEST(CellNormalizer, BooleansAndDates) {
    EXPECT_EQ(*normalize_cell(CellValue::of_bool(true)), "True");
    EXPECT_EQ(*normalize_cell(CellValue::of_bool(false)), "False");
    EXPECT_EQ(*normalize_cell(CellValue::of_date("2024-01-01 00:00:00")), "2024-01-01 00:00:00");
}
