// Tests for llm/Translator and llm/MockTranslator -- canned translations and
// how translated copies keep their identity.

#include "llm/MockTranslator.hpp"

#include <gtest/gtest.h>

#include "align/Aligner.hpp"
#include "test_helpers.h"

namespace llm {
namespace {

using test_helpers::TempDir;
using test_helpers::record;

std::vector<align::ContentRecord> targets() {
    return {record("t1", 0, {}, "Hallo"), record("t2", 1, {}, "Welt"), record("t1", 2, {}, "Tschuess")};
}

TEST(TranslatorTest, NullTranslatorIsIdentity) {
    NullTranslator t;
    auto res = t.translate_batch(targets(), "de", "en");
    ASSERT_EQ(res.size(), 3u);
    EXPECT_EQ(res[1].translated, "Welt");
    EXPECT_EQ(res[2].original_index, 2);
}

TEST(TranslatorTest, MockLoadsArrayForm) {
    TempDir dir;
    const std::string path = dir.write("mock.json",
        R"({"translations":[{"id":"t1","text":"Hello"},{"id":"t2","text":"World"}]})");

    MockTranslator t(path);
    EXPECT_EQ(t.size(), 2u);

    auto res = t.translate_batch(targets(), "de", "en");
    ASSERT_EQ(res.size(), 3u);  // duplicate id t1 gets the same text twice
    EXPECT_EQ(res[0].translated, "Hello");
    EXPECT_EQ(res[2].original_index, 2);
    EXPECT_EQ(res[2].translated, "Hello");
}

TEST(TranslatorTest, MockLoadsMapFormAndSkipsUnknownIds) {
    TempDir dir;
    const std::string path = dir.write("mock.json", R"({"t2":"World"})");
    MockTranslator t(path);

    auto res = t.translate_batch(targets(), "", "en");
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].id, "t2");
    EXPECT_EQ(res[0].original_index, 1);
}

TEST(TranslatorTest, MockRejectsBadFiles) {
    TempDir dir;
    EXPECT_THROW(MockTranslator(dir.file("missing.json")), std::runtime_error);
    EXPECT_THROW(MockTranslator(dir.write("a.json", "not json")), std::runtime_error);
    EXPECT_THROW(MockTranslator(dir.write("b.json", R"({"translations":[{"id":"x"}]})")), std::runtime_error);
    EXPECT_THROW(MockTranslator(dir.write("c.json", R"({"x": 3})")), std::runtime_error);
    EXPECT_THROW(MockTranslator(dir.write("d.json", R"(["x"])")), std::runtime_error);
}

TEST(TranslatorTest, ApplyTranslationsReturnsNewRecordsWithSameIdentity) {
    auto original = targets();
    original[0].clean_text = "hallo";
    original[0].embedding = std::vector<float>{1, 0};

    std::vector<TranslationResult> results = {{"t1", 0, "Hello"}};
    auto translated = apply_translations(original, results);

    ASSERT_EQ(translated.size(), 3u);
    EXPECT_EQ(translated[0].raw_text, "Hello");
    EXPECT_EQ(translated[0].id, "t1");
    EXPECT_EQ(translated[0].original_index, 0);
    EXPECT_TRUE(translated[0].clean_text.empty());
    EXPECT_FALSE(translated[0].has_embedding());

    EXPECT_EQ(translated[2].raw_text, "Tschuess");  // same id, different row
    EXPECT_EQ(original[0].raw_text, "Hallo");
}

TEST(TranslatorTest, TranslationMapIsKeyedByOriginalIndex) {
    auto m = translation_map({{"t1", 0, "Hello"}, {"t1", 2, "Bye"}});
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m.at(0), "Hello");
    EXPECT_EQ(m.at(2), "Bye");
}

TEST(TranslatorTest, AlignmentOfTranslatedCopiesKeepsEveryTarget) {
    std::vector<align::ContentRecord> ref = {record("r1", 0, {1, 0}), record("r2", 1, {0, 1})};
    auto original = targets();
    auto translated = apply_translations(original, {{"t1", 0, "Hello"}, {"t2", 1, "World"}});
    translated[0].embedding = std::vector<float>{0, 1};
    translated[1].embedding = std::vector<float>{1, 0};

    auto out = align::align_records(ref, translated);
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.value.rows[0].target->original_index, 1);
    EXPECT_EQ(out.value.rows[1].target->original_index, 0);
    ASSERT_EQ(out.value.leftover_targets.size(), 1u);
    EXPECT_EQ(out.value.leftover_targets[0].original_index, 2);
}

}  // namespace
}  // namespace llm
