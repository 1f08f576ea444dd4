#include "functions/stats_report/src/stats_report.hpp"
#include "xlsx_fixture.hpp"

#include <gtest/gtest.h>

static RunState sample_state() {
    RunState state;
    FileResult a;
    a.path = "a.xlsx";
    a.tokens = {"Summer2024!"};
    a.found = 1;
    a.skipped = 2;
    a.skipped_by_reason[static_cast<size_t>(SkipReason::LowComplexity)] = 2;
    state.merge(std::move(a));

    FileResult bad;
    bad.path = "bad.xlsx";
    bad.unreadable = true;
    bad.error = "zip_open failed: Not a zip archive";
    state.merge(std::move(bad));
    return state;
}

TEST(StatsReport, ContainsTotalsAndFiles) {
    RunOptions opts;
    opts.directory = "in";
    opts.filter.require_complexity = true;
    RunState state = sample_state();

    nlohmann::json j = build_stats_report(opts, state);
    EXPECT_EQ(j["files_processed"], 2);
    EXPECT_EQ(j["unreadable_files"], 1);
    EXPECT_EQ(j["total_found"], 1);
    EXPECT_EQ(j["total_skipped"], 2);
    EXPECT_EQ(j["unique_written"], 1);
    EXPECT_EQ(j["skipped_by_reason"]["low_complexity"], 2);
    EXPECT_EQ(j["skipped_by_reason"]["too_long"], 0);
    EXPECT_EQ(j["config"]["directory"], "in");
    EXPECT_EQ(j["config"]["require_complexity"], true);
    EXPECT_EQ(j["config"]["max_length"], 32);

    ASSERT_EQ(j["files"].size(), 2u);
    EXPECT_EQ(j["files"][0]["path"], "a.xlsx");
    EXPECT_FALSE(j["files"][0].contains("error"));
    EXPECT_EQ(j["files"][1]["unreadable"], true);
    EXPECT_EQ(j["files"][1]["error"], "zip_open failed: Not a zip archive");
}

TEST(StatsReport, WritesParsableFile) {
    TempDir dir;
    const fs::path out = dir / "stats.json";
    RunOptions opts;
    RunState state = sample_state();
    write_stats_report(out.string(), opts, state);

    std::ifstream in(out);
    nlohmann::json j = nlohmann::json::parse(in);
    EXPECT_EQ(j["files_processed"], 2);
}

TEST(StatsReport, UnwritablePathThrows) {
    TempDir dir;
    RunOptions opts;
    RunState state = sample_state();
    EXPECT_THROW(write_stats_report((dir / "no" / "stats.json").string(), opts, state),
                 std::runtime_error);
}
