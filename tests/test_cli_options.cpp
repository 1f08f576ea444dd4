#include "functions/cli_options/src/cli_options.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

static CliAction parse(std::vector<std::string> args, RunOptions& opts) {
    args.insert(args.begin(), "xlsxtract");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_args(static_cast<int>(argv.size()), argv.data(), opts);
}

TEST(CliOptions, Defaults) {
    RunOptions opts;
    EXPECT_EQ(parse({"-d", "data"}, opts), CliAction::Run);
    EXPECT_EQ(opts.directory, "data");
    EXPECT_EQ(opts.output, "passwords.txt");
    EXPECT_TRUE(opts.filter.split_chars.empty());
    EXPECT_EQ(opts.filter.max_length, 32u);
    EXPECT_FALSE(opts.filter.require_complexity);
    EXPECT_FALSE(opts.show_progress);
    EXPECT_EQ(opts.threads, 1u);
    EXPECT_TRUE(opts.name_filter.empty());
}

TEST(CliOptions, AllFlags) {
    RunOptions opts;
    parse({"--directory", "in", "-o", "out.txt", "-s", " ;", "-m", "12", "-f", "report",
           "-c", "-p", "--progress-delay", "0", "-j", "4", "--stats-json", "s.json"}, opts);
    EXPECT_EQ(opts.directory, "in");
    EXPECT_EQ(opts.output, "out.txt");
    EXPECT_EQ(opts.filter.split_chars, " ;");
    EXPECT_EQ(opts.filter.max_length, 12u);
    EXPECT_EQ(opts.name_filter, "report");
    EXPECT_TRUE(opts.filter.require_complexity);
    EXPECT_TRUE(opts.show_progress);
    EXPECT_EQ(opts.progress_delay.count(), 0);
    EXPECT_EQ(opts.threads, 4u);
    EXPECT_EQ(opts.stats_json, "s.json");
}

TEST(CliOptions, InlineValues) {
    RunOptions opts;
    parse({"--directory=in", "--max-length=8", "--split=,"}, opts);
    EXPECT_EQ(opts.directory, "in");
    EXPECT_EQ(opts.filter.max_length, 8u);
    EXPECT_EQ(opts.filter.split_chars, ",");
}

TEST(CliOptions, SplitWordsUsesWhitespaceClass) {
    RunOptions opts;
    parse({"-d", "in", "-w"}, opts);
    EXPECT_TRUE(opts.filter.split_whitespace);
    EXPECT_TRUE(opts.filter.split_chars.empty());

    RunOptions both;
    parse({"-d", "in", "-w", "-s", ";"}, both);
    EXPECT_TRUE(both.filter.split_whitespace);
    EXPECT_EQ(both.filter.split_chars, ";");
}

TEST(CliOptions, CommandLineSplitWordsReplacesEnvironmentSplit) {
    RunOptions opts;
    opts.filter.split_chars = "|";
    parse({"-d", "in", "-w"}, opts);
    EXPECT_TRUE(opts.filter.split_whitespace);
    EXPECT_TRUE(opts.filter.split_chars.empty());

    RunOptions env_words;
    env_words.filter.split_whitespace = true;
    parse({"-d", "in", "-s", ","}, env_words);
    EXPECT_FALSE(env_words.filter.split_whitespace);
    EXPECT_EQ(env_words.filter.split_chars, ",");
}

TEST(CliOptions, ThreadCountIsCapped) {
    RunOptions big;
    EXPECT_THROW(parse({"-d", "in", "-j", "4294967296"}, big), std::invalid_argument);
    RunOptions over;
    EXPECT_THROW(parse({"-d", "in", "-j", std::to_string(kMaxThreads + 1)}, over), std::invalid_argument);
    RunOptions max;
    parse({"-d", "in", "-j", std::to_string(kMaxThreads)}, max);
    EXPECT_EQ(max.threads, kMaxThreads);
}

TEST(CliOptions, CommandLineSplitReplacesEnvironmentDefault) {
    RunOptions opts;
    opts.filter.split_chars = "|";
    parse({"-d", "in", "-s", ";", "-s", ","}, opts);
    EXPECT_EQ(opts.filter.split_chars, ";,");

    RunOptions keep;
    keep.filter.split_chars = "|";
    parse({"-d", "in"}, keep);
    EXPECT_EQ(keep.filter.split_chars, "|");
}

TEST(CliOptions, Help) {
    RunOptions opts;
    EXPECT_EQ(parse({"--help"}, opts), CliAction::Help);
    EXPECT_EQ(parse({"-h", "-d", "in"}, opts), CliAction::Help);

    std::ostringstream os;
    print_usage(os);
    EXPECT_NE(os.str().find("--directory"), std::string::npos);
}

TEST(CliOptions, Errors) {
    RunOptions a;
    EXPECT_THROW(parse({}, a), std::invalid_argument);
    RunOptions b;
    EXPECT_THROW(parse({"-d"}, b), std::invalid_argument);
    RunOptions c;
    EXPECT_THROW(parse({"-d", "in", "--bogus"}, c), std::invalid_argument);
    RunOptions d;
    EXPECT_THROW(parse({"-d", "in", "-m", "0"}, d), std::invalid_argument);
    RunOptions e;
    EXPECT_THROW(parse({"-d", "in", "-j", "two"}, e), std::invalid_argument);
    RunOptions f;
    EXPECT_THROW(parse({"-d", "in", "-o", ""}, f), std::invalid_argument);
}
