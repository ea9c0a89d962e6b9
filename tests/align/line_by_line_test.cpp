// Tests for align/LineByLine -- positional scores and best-reference suggestions.

#include "align/LineByLine.hpp"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace align {
namespace {

using test_helpers::at_cos;
using test_helpers::record;

std::vector<LineDiagnostic> run(const std::vector<ContentRecord>& ref, const std::vector<ContentRecord>& tgt,
                                double threshold = 0.5) {
    auto out = line_by_line(ref, tgt, threshold);
    EXPECT_TRUE(out.ok) << out.error.code;
    return out.value;
}

TEST(LineByLineTest, GoodPositionalPairHasNoSuggestion) {
    auto d = run({record("1", 0, {1, 0})}, {record("A", 0, at_cos(0.9))});
    ASSERT_EQ(d.size(), 1u);
    ASSERT_TRUE(d[0].score.has_value());
    EXPECT_NEAR(*d[0].score, 0.9, 1e-6);
    EXPECT_TRUE(d[0].is_good);
    EXPECT_EQ(d[0].quality, QualityBand::High);
    EXPECT_FALSE(d[0].suggestion.has_value());
}

TEST(LineByLineTest, SwappedRowsSuggestTheirCounterparts) {
    auto d = run({record("1", 0, {1, 0}), record("2", 1, {0, 1})},
                 {record("A", 0, {0, 1}), record("B", 1, {1, 0})});

    ASSERT_EQ(d.size(), 2u);
    EXPECT_FALSE(d[0].is_good);
    ASSERT_TRUE(d[0].suggestion.has_value());
    EXPECT_EQ(d[0].suggestion->reference_index, 1);
    EXPECT_EQ(d[0].suggestion->reference_id, "2");
    EXPECT_TRUE(d[0].suggestion->is_good);

    ASSERT_TRUE(d[1].suggestion.has_value());
    EXPECT_EQ(d[1].suggestion->reference_index, 0);
}

TEST(LineByLineTest, SuggestionsAreNotExclusive) {
    auto d = run({record("1", 0, {0, 1}), record("2", 1, {1, 0}), record("3", 2, {0, 1})},
                 {record("A", 0, {1, 0}), record("B", 1, {0, -1}), record("C", 2, {1, 0})});

    ASSERT_TRUE(d[0].suggestion.has_value());
    ASSERT_TRUE(d[2].suggestion.has_value());
    EXPECT_EQ(d[0].suggestion->reference_index, 1);
    EXPECT_EQ(d[2].suggestion->reference_index, 1);
}

TEST(LineByLineTest, SuggestionTiesGoToFirstReference) {
    auto d = run({record("1", 0, {1, 0}), record("2", 1, {1, 0})},
                 {record("A", 0, {0, 1})});
    ASSERT_TRUE(d[0].suggestion.has_value());
    EXPECT_EQ(d[0].suggestion->reference_index, 0);
    EXPECT_FALSE(d[0].suggestion->is_good);
}

TEST(LineByLineTest, ExtraTargetsHaveNoReferenceButGetSuggestion) {
    auto d = run({record("1", 0, {1, 0})},
                 {record("A", 0, {1, 0}), record("B", 1, at_cos(0.7))});

    ASSERT_EQ(d.size(), 2u);
    EXPECT_FALSE(d[1].reference.has_value());
    EXPECT_FALSE(d[1].score.has_value());
    EXPECT_FALSE(d[1].is_good);
    ASSERT_TRUE(d[1].suggestion.has_value());
    EXPECT_EQ(d[1].suggestion->reference_id, "1");
    EXPECT_NEAR(d[1].suggestion->score, 0.7, 1e-6);
}

TEST(LineByLineTest, ShorterTargetListOnlyReportsTargets) {
    auto d = run({record("1", 0, {1, 0}), record("2", 1, {0, 1})}, {record("A", 0, {1, 0})});
    EXPECT_EQ(d.size(), 1u);
}

TEST(LineByLineTest, MissingEmbeddingLeavesScoreAbsent) {
    auto d = run({record("1", 0, {}), record("2", 1, {0, 1})},
                 {record("A", 0, {0, 1}), record("B", 1, {})});

    EXPECT_FALSE(d[0].score.has_value());
    EXPECT_EQ(d[0].quality, QualityBand::Poor);
    // target has an embedding, so a suggestion is still searched
    ASSERT_TRUE(d[0].suggestion.has_value());
    EXPECT_EQ(d[0].suggestion->reference_id, "2");

    EXPECT_FALSE(d[1].score.has_value());
    EXPECT_FALSE(d[1].suggestion.has_value());
}

TEST(LineByLineTest, InvalidInputsFail) {
    EXPECT_EQ(line_by_line({}, {record("A", 0, {1, 0})}, 0.5).error.code, "empty_reference");
    EXPECT_EQ(line_by_line({record("1", 0, {1, 0})}, {record("A", 0, {1, 0})}, 2.0).error.code,
              "threshold_out_of_range");
}

TEST(LineByLineTest, MixedDimensionsFail) {
    auto out = line_by_line({record("1", 0, {1, 0})}, {record("A", 0, {1, 0, 0})}, 0.5);
    ASSERT_FALSE(out.ok);
    EXPECT_EQ(out.error.code, "dimension_mismatch");
}

TEST(LineByLineTest, BestReferenceForEmptyInputs) {
    ContentRecord r = record("1", 0, {1, 0});
    EXPECT_FALSE(best_reference_for({}, {&r}, 0.5).has_value());
    EXPECT_FALSE(best_reference_for({1, 0}, {}, 0.5).has_value());
}

TEST(LineByLineTest, RestoresOriginalTextByOriginalIndex) {
    // target list order differs from the order of the pre-translation rows
    auto d = run({record("1", 0, {1, 0}), record("2", 1, {0, 1})},
                 {record("B", 1, {1, 0}, "translated b"), record("A", 0, {0, 1}, "translated a")});
    const std::vector<ContentRecord> originals = {record("A", 0, {}, "original a"),
                                                  record("B", 1, {}, "original b")};

    restore_original_text(d, originals);

    ASSERT_EQ(d.size(), 2u);
    EXPECT_EQ(d[0].target.id, "B");
    EXPECT_EQ(d[0].target.raw_text, "original b");
    EXPECT_EQ(d[1].target.id, "A");
    EXPECT_EQ(d[1].target.raw_text, "original a");
}

TEST(LineByLineTest, RestoreKeepsTextWithoutOriginal) {
    auto d = run({record("1", 0, {1, 0})}, {record("A", 7, {1, 0}, "kept")});
    restore_original_text(d, {record("Z", 0, {}, "other")});
    EXPECT_EQ(d[0].target.raw_text, "kept");
}

}  // namespace
}  // namespace align
