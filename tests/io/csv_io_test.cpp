// Tests for io/CsvIO -- RFC 4180 parsing, header lookup and the export files.

#include "io/CsvIO.hpp"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace align {
namespace {

using test_helpers::TempDir;
using test_helpers::read_file;
using test_helpers::record;

TEST(CsvIOTest, ParsesQuotesEmbeddedNewlinesAndCrlf) {
    auto rows = parse_csv("a,b\r\n\"x, y\",\"say \"\"hi\"\"\"\r\n\"multi\nline\",z\r\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1][0], "x, y");
    EXPECT_EQ(rows[1][1], "say \"hi\"");
    EXPECT_EQ(rows[2][0], "multi\nline");
    EXPECT_EQ(rows[2][1], "z");
}

TEST(CsvIOTest, KeepsTrailingEmptyFieldAndLastLineWithoutNewline) {
    auto rows = parse_csv("a,b\n1,\n2,3");
    ASSERT_EQ(rows.size(), 3u);
    ASSERT_EQ(rows[1].size(), 2u);
    EXPECT_EQ(rows[1][1], "");
    EXPECT_EQ(rows[2][1], "3");
}

TEST(CsvIOTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(parse_csv("a,b\n\"open,1\n"), std::runtime_error);
}

TEST(CsvIOTest, ReadsContentColumnsInAnyPositionAndCase) {
    TempDir dir;
    const std::string path = dir.write("in.csv",
        "\xEF\xBB\xBFNotes,content,CONTENTID\n"
        "n1,  Hello world ,id-1\n"
        "\n"
        "n2,\"Second, row\",id-2\n");

    auto recs = read_content_csv(path);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].id, "id-1");
    EXPECT_EQ(recs[0].raw_text, "Hello world");
    EXPECT_EQ(recs[0].original_index, 0);
    EXPECT_EQ(recs[1].id, "id-2");
    EXPECT_EQ(recs[1].raw_text, "Second, row");
    EXPECT_EQ(recs[1].original_index, 1);
    EXPECT_FALSE(recs[0].has_embedding());
}

TEST(CsvIOTest, ShortRowsGetEmptyFields) {
    TempDir dir;
    const std::string path = dir.write("in.csv", "ContentId,Content\nonly-id\n");
    auto recs = read_content_csv(path);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].id, "only-id");
    EXPECT_EQ(recs[0].raw_text, "");
}

TEST(CsvIOTest, MissingFileOrColumnsThrow) {
    TempDir dir;
    EXPECT_THROW(read_content_csv(dir.file("nope.csv")), std::runtime_error);

    const std::string bad = dir.write("bad.csv", "Id,Text\n1,hello\n");
    EXPECT_THROW(read_content_csv(bad), std::runtime_error);

    const std::string empty = dir.write("empty.csv", "");
    EXPECT_THROW(read_content_csv(empty), std::runtime_error);
}

TEST(CsvIOTest, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_escape("say \"x\""), "\"say \"\"x\"\"\"");
    EXPECT_EQ(csv_escape("two\nlines"), "\"two\nlines\"");
}

TEST(CsvIOTest, ContentCsvReadsBack) {
    TempDir dir;
    const std::string path = dir.file("out/reordered.csv");
    write_content_csv(path, {{"t2", "Bonjour, monde"}, {"UNMATCHED_r3", "[NO MATCH FOR: Bye]"}});

    auto recs = read_content_csv(path);
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].id, "t2");
    EXPECT_EQ(recs[0].raw_text, "Bonjour, monde");
    EXPECT_EQ(recs[1].raw_text, "[NO MATCH FOR: Bye]");
}

TEST(CsvIOTest, AlignedCsvLayout) {
    std::vector<ContentRecord> ref = {record("r1", 0, {1, 0}, "Hello"), record("r2", 1, {}, "World")};
    std::vector<ContentRecord> tgt = {record("t1", 0, {1, 0}, "Bonjour"), record("t2", 1, {}, "Monde")};
    auto res = align_records(ref, tgt).value;

    TempDir dir;
    const std::string path = dir.file("aligned.csv");
    write_aligned_csv(path, build_display_rows(ref, res));

    auto rows = parse_csv(read_file(path));
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"RefLine", "RefContent", "TargetLine", "ContentId", "Content",
                                                 "TranslatedContent", "Status", "SimilarityScore", "Quality",
                                                 "RowType"}));
    EXPECT_EQ(rows[1], (std::vector<std::string>{"1", "Hello", "1", "t1", "Bonjour", "", "Matched", "1.0000",
                                                 "High", "ReferenceAligned"}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"2", "World", "", "", "", "", "Missing", "", "",
                                                 "ReferenceAligned"}));
    EXPECT_EQ(rows[3], (std::vector<std::string>{"", "", "2", "t2", "Monde", "", "Unmatched Target", "", "",
                                                 "UnmatchedTarget"}));
}

TEST(CsvIOTest, LineByLineCsvLayout) {
    auto diags = line_by_line({record("r1", 0, {1, 0}, "Hello")},
                              {record("t1", 0, {0, 1}, "Monde"), record("t2", 1, {1, 0}, "Bonjour")}, 0.5).value;

    TempDir dir;
    const std::string path = dir.file("lines.csv");
    write_line_by_line_csv(path, diags);

    auto rows = parse_csv(read_file(path));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].size(), 11u);
    EXPECT_EQ(rows[1], (std::vector<std::string>{"1", "t1", "Monde", "1", "Hello", "0.0000", "Poor", "Review",
                                                 "1", "Hello", "0.0000"}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"2", "t2", "Bonjour", "", "", "", "", "Extra Target",
                                                 "1", "Hello", "1.0000"}));
}

}  // namespace
}  // namespace align
