/**
 * @file test_output_parser.cpp
 * @brief Unit tests for bulk-copy output parsing
 *
 * Sample lines are taken from the utility's verbose console output with
 * /BYTES /TS /FP; update them together with the patterns.
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/core/output_parser.h>

#include <string>

namespace kcenon::ultracopy::test {

class OutputParserTest : public ::testing::Test {
protected:
    void SetUp() override { stats_.start(); }

    statistics_accumulator stats_;
    output_parser parser_{stats_};
};

// =============================================================================
// Pattern helpers
// =============================================================================

TEST_F(OutputParserTest, MatchNewFileLine) {
    auto entry = output_parser::match_file_line("\t    New File  \t\t   1048576\tC:\\a\\file.bin");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->tag, "New File");
    EXPECT_EQ(entry->size, 1048576u);
    EXPECT_EQ(entry->path, "C:\\a\\file.bin");
}

TEST_F(OutputParserTest, MatchFileLineWithTimestamp) {
    auto entry = output_parser::match_file_line(
        "\t    Newer     \t\t      2048\t2024/01/02 03:04:05\tC:\\data\\report v2.docx\r\n");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->tag, "Newer");
    EXPECT_EQ(entry->size, 2048u);
    EXPECT_EQ(entry->path, "C:\\data\\report v2.docx");
}

TEST_F(OutputParserTest, MatchOlderLine) {
    auto entry = output_parser::match_file_line("    Older  77  /mnt/share/old.txt");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->tag, "Older");
    EXPECT_EQ(entry->size, 77u);
}

TEST_F(OutputParserTest, SkippedLinesAreNotFileLines) {
    EXPECT_FALSE(output_parser::match_file_line("\t   same\t\t  1024\tC:\\a\\same.bin").has_value());
    EXPECT_FALSE(output_parser::match_file_line("  New Dir   3  C:\\a\\sub\\").has_value());
}

TEST_F(OutputParserTest, FileLineWithVeryLongPath) {
    const std::string path = "C:\\" + std::string(40000, 'a');

    auto entry = output_parser::match_file_line("\tNew File\t\t1048576\t" + path + "  \r\n");

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->size, 1048576u);
    EXPECT_EQ(entry->path, path);

    EXPECT_TRUE(has_kind(parser_.parse_line("\tNew File\t\t1048576\t" + path),
                         line_kind::file_copied));
    EXPECT_EQ(parser_.parse_line(std::string(40000, 'x')), line_kind::none);
    EXPECT_EQ(stats_.snapshot().files_copied, 1u);
}

TEST_F(OutputParserTest, FileLineWithoutPathIsIgnored) {
    EXPECT_FALSE(output_parser::match_file_line("\tNew File\t\t1048576\t   ").has_value());
}

TEST_F(OutputParserTest, SpeedInBytesPerSecond) {
    auto speed = output_parser::match_speed("   Speed :            10485760 Bytes/sec.");

    ASSERT_TRUE(speed.has_value());
    EXPECT_DOUBLE_EQ(*speed, 10.0);
}

TEST_F(OutputParserTest, SpeedInMegabytesPerMinute) {
    auto speed = output_parser::match_speed("   Speed :             600.000 MegaBytes/min.");

    ASSERT_TRUE(speed.has_value());
    EXPECT_DOUBLE_EQ(*speed, 10.0);
}

TEST_F(OutputParserTest, TotalsIgnoreTableHeader) {
    EXPECT_FALSE(output_parser::match_files_total(
        "               Total    Copied   Skipped  Mismatch    FAILED    Extras").has_value());

    auto files = output_parser::match_files_total("   Files :        42         40         2         0         0         0");
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(*files, 42u);

    auto bytes = output_parser::match_bytes_total("   Bytes :   7340032    7340032         0         0         0         0");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, 7340032u);
}

TEST_F(OutputParserTest, ErrorDetectionIsCaseInsensitive) {
    EXPECT_TRUE(output_parser::is_error_line(
        "2024/01/02 03:04:05 ERROR 5 (0x00000005) Copying File C:\\locked.db"));
    EXPECT_TRUE(output_parser::is_error_line("Retry limit exceeded, error persists"));
    EXPECT_FALSE(output_parser::is_error_line("   Files :  3"));
}

// =============================================================================
// parse_line
// =============================================================================

TEST_F(OutputParserTest, NewFileAndSpeedLinesUpdateStatistics) {
    EXPECT_EQ(parser_.parse_line("\t    New File  \t\t   1048576\tC:\\a\\file.bin"),
              line_kind::file_copied);
    EXPECT_EQ(parser_.parse_line("   Speed :            10485760 Bytes/sec."), line_kind::speed);

    auto snap = stats_.snapshot();
    EXPECT_EQ(snap.files_copied, 1u);
    EXPECT_EQ(snap.bytes_copied, 1048576u);
    EXPECT_EQ(snap.current_file, "C:\\a\\file.bin");
    EXPECT_DOUBLE_EQ(snap.speed_mbps, 10.0);
}

TEST_F(OutputParserTest, FilesTotalOverwritesRunningCount) {
    parser_.parse_line("  New File  10  C:\\a\\one.txt");
    parser_.parse_line("  New File  20  C:\\a\\two.txt");
    ASSERT_EQ(stats_.snapshot().files_copied, 2u);

    EXPECT_TRUE(has_kind(parser_.parse_line("   Files : 42"), line_kind::files_total));

    EXPECT_EQ(stats_.snapshot().files_copied, 42u);
}

TEST_F(OutputParserTest, BytesTotalOverwritesRunningBytes) {
    parser_.parse_line("  New File  10  C:\\a\\one.txt");
    parser_.parse_line("   Bytes :   4096");

    EXPECT_EQ(stats_.snapshot().bytes_copied, 4096u);
}

TEST_F(OutputParserTest, ErrorLineCountsError) {
    auto kinds = parser_.parse_line(
        "2024/01/02 03:04:05 ERROR 32 (0x00000020) Copying File C:\\in-use.pst");

    EXPECT_TRUE(has_kind(kinds, line_kind::error));
    EXPECT_EQ(stats_.snapshot().error_count, 1u);
}

TEST_F(OutputParserTest, UnrecognizedLinesAreCountedNotFatal) {
    EXPECT_EQ(parser_.parse_line("-------------------------------------------------------"),
              line_kind::none);
    EXPECT_EQ(parser_.parse_line("   ROBOCOPY     ::     Robust File Copy for Windows"),
              line_kind::none);
    EXPECT_EQ(parser_.parse_line(""), line_kind::none);
    EXPECT_EQ(parser_.parse_line("   \t  "), line_kind::none);

    EXPECT_EQ(parser_.unrecognized_lines(), 2u);

    auto snap = stats_.snapshot();
    EXPECT_EQ(snap.files_copied, 0u);
    EXPECT_EQ(snap.error_count, 0u);
}

TEST_F(OutputParserTest, ParsesWholeSummaryBlock) {
    const char* lines[] = {
        "  New File  \t\t  100\tC:\\src\\a.txt",
        "  New File  \t\t  200\tC:\\src\\b.txt",
        "               Total    Copied   Skipped  Mismatch    FAILED    Extras",
        "    Dirs :         1         0         1         0         0         0",
        "   Files :         2         2         0         0         0         0",
        "   Bytes :       300       300         0         0         0         0",
        "   Speed :               30000 Bytes/sec.",
        "   Speed :               1.716 MegaBytes/min.",
    };
    for (const char* line : lines) {
        parser_.parse_line(line);
    }

    auto snap = stats_.snapshot();
    EXPECT_EQ(snap.files_copied, 2u);
    EXPECT_EQ(snap.bytes_copied, 300u);
    EXPECT_NEAR(snap.speed_mbps, 1.716 / 60.0, 1e-9);
    EXPECT_EQ(snap.error_count, 0u);
}

}  // namespace kcenon::ultracopy::test
