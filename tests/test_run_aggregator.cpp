#include "functions/run_aggregator/src/run_aggregator.hpp"
#include "functions/xlsxtract_error/src/xlsxtract_error.hpp"
#include "xlsx_fixture.hpp"

#include <gtest/gtest.h>

static FileResult make_result(const std::string& path, std::set<std::string> tokens, size_t skipped = 0) {
    FileResult r;
    r.path = path;
    r.found = tokens.size();
    r.tokens = std::move(tokens);
    r.skipped = skipped;
    return r;
}

static ErrorKind run_and_catch(const RunOptions& opts) {
    try {
        run_extraction(opts);
    } catch (const XlsxtractError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected XlsxtractError";
    return ErrorKind::FileUnreadable;
}

TEST(RunState, CrossFileUnionSumsPerFileFinds) {
    RunState state;
    state.merge(make_result("a.xlsx", {"Shared1!"}));
    state.merge(make_result("b.xlsx", {"Shared1!", "Other2@"}));

    EXPECT_EQ(state.sorted_tokens(), std::vector<std::string>({"Other2@", "Shared1!"}));
    EXPECT_EQ(state.unique(), 2u);
    EXPECT_EQ(state.files(), 2u);
    // 파일마다 새로 찾은 수의 합 (1 + 2)
    EXPECT_EQ(state.found(), 3u);
}

TEST(RunState, CountersAccumulate) {
    RunState state;
    FileResult a = make_result("a.xlsx", {"x"}, 3);
    a.skipped_by_reason[static_cast<size_t>(SkipReason::LowComplexity)] = 2;
    a.skipped_by_reason[static_cast<size_t>(SkipReason::TooLong)] = 1;
    FileResult bad;
    bad.path = "bad.xlsx";
    bad.unreadable = true;
    bad.error = "zip_open failed";

    state.merge(std::move(a));
    state.merge(std::move(bad));

    EXPECT_EQ(state.files(), 2u);
    EXPECT_EQ(state.skipped(), 3u);
    EXPECT_EQ(state.unreadable_files(), 1u);
    EXPECT_EQ(state.skipped_by_reason()[static_cast<size_t>(SkipReason::LowComplexity)], 2u);
    ASSERT_EQ(state.file_summaries().size(), 2u);
    EXPECT_TRUE(state.file_summaries()[1].unreadable);
}

TEST(RunState, SortedByBytesWithoutDuplicates) {
    RunState state;
    state.merge(make_result("a", {"b", "B", "a", "caf\xC3\xA9", "1"}));
    state.merge(make_result("b", {"a", "b"}));
    EXPECT_EQ(state.sorted_tokens(),
              std::vector<std::string>({"1", "B", "a", "b", "caf\xC3\xA9"}));
}

TEST(RunState, WriteOverwritesExistingFile) {
    TempDir dir;
    const fs::path out = dir / "out.txt";
    std::ofstream(out) << "zzz\nyyy\nxxx\nwww\n";

    RunState state;
    state.merge(make_result("a", {"b", "a"}));
    state.write_output(out);

    EXPECT_EQ(read_lines(out), std::vector<std::string>({"a", "b"}));
    EXPECT_FALSE(fs::exists(dir / "out.txt.tmp"));
}

TEST(RunState, WriteFailureIsReported) {
    TempDir dir;
    RunState state;
    state.merge(make_result("a", {"a"}));
    try {
        state.write_output(dir / "missing" / "out.txt");
        FAIL() << "expected OutputWriteFailure";
    } catch (const XlsxtractError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OutputWriteFailure);
    }
}

TEST(RunExtraction, InvalidRoot) {
    TempDir dir;
    RunOptions opts;
    opts.directory = (dir / "nope").string();
    opts.output = (dir / "out.txt").string();
    EXPECT_EQ(run_and_catch(opts), ErrorKind::InvalidRoot);

    const fs::path file = dir / "plain.txt";
    std::ofstream(file) << "x";
    opts.directory = file.string();
    EXPECT_EQ(run_and_catch(opts), ErrorKind::InvalidRoot);
    EXPECT_FALSE(fs::exists(dir / "out.txt"));
}

TEST(RunExtraction, NoFilesLeavesOutputUntouched) {
    TempDir dir;
    fs::create_directories(dir / "input");
    std::ofstream(dir / "input" / "notes.txt") << "not a spreadsheet";
    const fs::path out = dir / "passwords.txt";
    std::ofstream(out) << "keep\n";

    RunOptions opts;
    opts.directory = (dir / "input").string();
    opts.output = out.string();
    EXPECT_EQ(run_and_catch(opts), ErrorKind::NoFilesFound);
    EXPECT_EQ(read_lines(out), std::vector<std::string>({"keep"}));

    write_text_xlsx(dir / "input" / "real.xlsx", {{"token"}});
    opts.name_filter = "other";
    EXPECT_EQ(run_and_catch(opts), ErrorKind::NoFilesFound);
    EXPECT_EQ(read_lines(out), std::vector<std::string>({"keep"}));
}

TEST(RunExtraction, EndToEndAcrossFiles) {
    TempDir dir;
    fs::create_directories(dir / "in" / "nested");
    write_text_xlsx(dir / "in" / "a.xlsx", {{"Shared1!"}});
    write_text_xlsx(dir / "in" / "nested" / "b.xlsx", {{"Shared1!", "Other2@"}});
    std::ofstream(dir / "in" / "broken.xlsx") << "not a zip";

    RunOptions opts;
    opts.directory = (dir / "in").string();
    opts.output = (dir / "out.txt").string();

    RunState state = run_extraction(opts);
    EXPECT_EQ(state.files(), 3u);
    EXPECT_EQ(state.unreadable_files(), 1u);
    EXPECT_EQ(state.found(), 3u);
    EXPECT_EQ(state.unique(), 2u);
    EXPECT_EQ(read_lines(dir / "out.txt"), std::vector<std::string>({"Other2@", "Shared1!"}));
}

TEST(RunExtraction, NameFilterRestrictsToOneFile) {
    TempDir dir;
    write_text_xlsx(dir / "Keep.xlsx", {{"kept"}});
    write_text_xlsx(dir / "skip.xlsx", {{"dropped"}});

    RunOptions opts;
    opts.directory = dir.path().string();
    opts.output = (dir / "out.txt").string();
    opts.name_filter = "keep";

    RunState state = run_extraction(opts);
    EXPECT_EQ(state.files(), 1u);
    EXPECT_EQ(read_lines(dir / "out.txt"), std::vector<std::string>({"kept"}));
}

TEST(RunExtraction, LengthBoundHoldsInOutput) {
    TempDir dir;
    write_text_xlsx(dir / "a.xlsx", {{"short", "muchtoolongtoken", "exactly8", "sp ace", "a b c d e"}});

    RunOptions opts;
    opts.directory = dir.path().string();
    opts.output = (dir / "out.txt").string();
    opts.filter.max_length = 8;

    run_extraction(opts);
    // "a b c d e" 는 정리하면 5글자지만 정리 전 9글자라 제외
    EXPECT_EQ(read_lines(dir / "out.txt"), std::vector<std::string>({"exactly8", "short", "space"}));
}

TEST(RunExtraction, ParallelMatchesSequential) {
    TempDir dir;
    for (int i = 0; i < 6; ++i) {
        write_text_xlsx(dir / ("f" + std::to_string(i) + ".xlsx"),
                        {{"common", "only" + std::to_string(i)}, {"Tok" + std::to_string(i % 2)}});
    }

    RunOptions seq;
    seq.directory = dir.path().string();
    seq.output = (dir / "seq.txt").string();
    RunState a = run_extraction(seq);

    RunOptions par = seq;
    par.output = (dir / "par.txt").string();
    par.threads = 4;
    RunState b = run_extraction(par);

    EXPECT_EQ(a.sorted_tokens(), b.sorted_tokens());
    EXPECT_EQ(a.found(), b.found());
    EXPECT_EQ(a.files(), b.files());
    EXPECT_EQ(read_lines(dir / "seq.txt"), read_lines(dir / "par.txt"));
    EXPECT_EQ(a.unique(), 9u);
}

TEST(RunExtraction, ProgressDoesNotChangeOutput) {
    TempDir dir;
    write_text_xlsx(dir / "a.xlsx", {{"alpha beta", "gamma"}});

    RunOptions opts;
    opts.directory = dir.path().string();
    opts.output = (dir / "out.txt").string();
    opts.filter.split_chars = " ";
    opts.show_progress = true;
    opts.progress_delay = std::chrono::milliseconds(0);

    run_extraction(opts);
    EXPECT_EQ(read_lines(dir / "out.txt"), std::vector<std::string>({"alpha", "beta", "gamma"}));
}
