#include "mergefix_types.h"

#include <gtest/gtest.h>

TEST(DefaultLayout, MatchesReportTemplate) {
    BlockLayout l = default_layout();
    EXPECT_EQ(l.sheet_pattern, "Performance*");
    EXPECT_EQ(l.first_row, 1u);
    EXPECT_EQ(l.stride, 15u);
    EXPECT_EQ(l.marker_column, 2u);
    ASSERT_EQ(l.merges.size(), 5u);

    for (uint32_t i = 0; i < 4; i++) {
        EXPECT_EQ(l.merges[i].row, i);
        EXPECT_EQ(l.merges[i].last_row, i);
        EXPECT_EQ(l.merges[i].col, 2u);
        EXPECT_EQ(l.merges[i].last_col, 3u);
    }
    EXPECT_EQ(l.merges[4].row, 6u);
    EXPECT_EQ(l.merges[4].last_row, 6u);
    EXPECT_EQ(l.merges[4].col, 2u);
    EXPECT_EQ(l.merges[4].last_col, 5u);
}

TEST(SheetMatches, PrefixIgnoresCase) {
    EXPECT_TRUE(sheet_matches("Performance*", "Performance"));
    EXPECT_TRUE(sheet_matches("Performance*", "Performance_5G"));
    EXPECT_TRUE(sheet_matches("Performance*", "Performance 2024-03-01"));
    EXPECT_TRUE(sheet_matches("Performance*", "PERFORMANCE_5g"));
    EXPECT_TRUE(sheet_matches("Performance*", "performance"));
}

TEST(SheetMatches, RejectsOtherSheets) {
    EXPECT_FALSE(sheet_matches("Performance*", "Summary"));
    EXPECT_FALSE(sheet_matches("Performance*", "My Performance"));
    EXPECT_FALSE(sheet_matches("Performance*", "Perf"));
    EXPECT_FALSE(sheet_matches("Performance*", ""));
}

TEST(SheetMatches, Wildcards) {
    EXPECT_TRUE(sheet_matches("*", ""));
    EXPECT_TRUE(sheet_matches("*KPI*", "Daily KPI report"));
    EXPECT_TRUE(sheet_matches("Day ?", "day 7"));
    EXPECT_FALSE(sheet_matches("Day ?", "Day 10"));
    EXPECT_TRUE(sheet_matches("a*b*c", "aXXbYYbZc"));
    EXPECT_FALSE(sheet_matches("a*b*c", "aXXbYYbZ"));
    EXPECT_TRUE(sheet_matches("Summary", "summary"));
    EXPECT_FALSE(sheet_matches("Summary", "Summary2"));
}

TEST(LayoutJson, EmptyObjectKeepsDefaults) {
    BlockLayout l;
    std::string err;
    ASSERT_TRUE(layout_from_json("{}", l, err)) << err;
    BlockLayout d = default_layout();
    EXPECT_EQ(l.sheet_pattern, d.sheet_pattern);
    EXPECT_EQ(l.stride, d.stride);
    EXPECT_EQ(l.merges.size(), d.merges.size());
}

TEST(LayoutJson, OverridesFields) {
    BlockLayout l;
    std::string err;
    ASSERT_TRUE(layout_from_json(R"({
        "sheet_pattern": "Daily*",
        "first_row": 3,
        "stride": 20,
        "marker_column": 1,
        "merges": [{"row": 0, "col": 1, "last_col": 4},
                   {"row": 2, "col": 8, "last_row": 3, "last_col": 8}]
    })", l, err)) << err;

    EXPECT_EQ(l.sheet_pattern, "Daily*");
    EXPECT_EQ(l.first_row, 3u);
    EXPECT_EQ(l.stride, 20u);
    EXPECT_EQ(l.marker_column, 1u);
    ASSERT_EQ(l.merges.size(), 2u);
    EXPECT_EQ(l.merges[0].last_row, 0u);
    EXPECT_EQ(l.merges[0].last_col, 4u);
    EXPECT_EQ(l.merges[1].row, 2u);
    EXPECT_EQ(l.merges[1].last_row, 3u);
}

TEST(LayoutJson, RoundTripsDefault) {
    BlockLayout l;
    std::string err;
    ASSERT_TRUE(layout_from_json(layout_to_json(default_layout()), l, err)) << err;
    ASSERT_EQ(l.merges.size(), 5u);
    EXPECT_EQ(l.merges[4].row, 6u);
    EXPECT_EQ(l.merges[4].last_col, 5u);
}

TEST(LayoutJson, RejectsBadInput) {
    const char* bad[] = {
        "not json",
        "[1, 2]",
        R"({"stride": 0})",
        R"({"stride": -15})",
        R"({"stride": "15"})",
        R"({"first_row": 0})",
        R"({"marker_column": 0})",
        R"({"sheet_pattern": 7})",
        R"({"merges": {}})",
        R"({"merges": [{"row": 0, "col": 2}]})",
        R"({"merges": [{"row": 0, "col": 0, "last_col": 3}]})",
        R"({"merges": [{"row": 0, "col": 3, "last_col": 2}]})",
        R"({"merges": [{"row": 4, "col": 2, "last_row": 3, "last_col": 3}]})",
        R"({"merges": [{"row": 1, "col": 2, "last_col": 2}]})",
        R"({"merges": [{"row": 4294967290, "col": 2, "last_col": 3}]})",
        R"({"merges": [{"row": 0, "col": 2, "last_row": 1048576, "last_col": 3}]})",
        R"({"merges": [{"row": 0, "col": 2, "last_col": 16385}]})",
        R"({"first_row": 1048577})",
        R"({"marker_column": 16385})",
    };
    for (const char* text : bad) {
        BlockLayout l = default_layout();
        l.stride = 99;
        std::string err;
        EXPECT_FALSE(layout_from_json(text, l, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
        EXPECT_EQ(l.stride, 99u) << "output modified for " << text;
    }
}

TEST(LayoutJson, AcceptsLastSheetRow) {
    BlockLayout l;
    std::string err;
    ASSERT_TRUE(layout_from_json(R"({"first_row": 1048576,
        "merges": [{"row": 0, "col": 1, "last_row": 1048575, "last_col": 16384}]})",
        l, err)) << err;
    EXPECT_EQ(l.first_row, kSheetMaxRow);
    EXPECT_EQ(l.merges[0].last_row, kSheetMaxRow - 1);
    EXPECT_EQ(l.merges[0].last_col, kSheetMaxColumn);
}
