// Tests for llm/OllamaTranslator helpers and llm/ProcUtil. No server is
// contacted: answers come from the on-disk cache.

#include "llm/OllamaTranslator.hpp"
#include "llm/ProcUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "test_helpers.h"

namespace llm {
namespace {

using test_helpers::record;

TEST(OllamaTranslatorTest, CacheKeyIsStableAndSensitiveToInputs) {
    const std::string k = translation_cache_key("m", "de", "en", "Hallo");
    EXPECT_EQ(k, translation_cache_key("m", "de", "en", "Hallo"));
    EXPECT_EQ(k.rfind("translate_v1-", 0), 0u);
    EXPECT_EQ(k.size(), std::string("translate_v1-").size() + 16);
    EXPECT_NE(k, translation_cache_key("m", "fr", "en", "Hallo"));
    EXPECT_NE(k, translation_cache_key("m2", "de", "en", "Hallo"));
    EXPECT_NE(k, translation_cache_key("m", "de", "en", "Hallo!"));
}

TEST(OllamaTranslatorTest, ParsesAnswerWithSurroundingNoise) {
    EXPECT_EQ(parse_translation_json(R"({"translation":"Hello"})"), "Hello");
    EXPECT_EQ(parse_translation_json("Sure!\n{\"translation\": \"Bye\"}\nDone."), "Bye");
    EXPECT_EQ(parse_translation_json(R"({"text":"Hello"})"), "");
    EXPECT_EQ(parse_translation_json("no json"), "");
    EXPECT_EQ(parse_translation_json("{broken"), "");
}

TEST(OllamaTranslatorTest, ServesCachedAnswersWithoutAServer) {
    test_helpers::TempDir dir;
    const std::string cache = dir.file("cache");
    // unroutable endpoint: any real request would fail
    OllamaTranslator t("test-model", cache, "http://127.0.0.1:9/api/generate");

    {
        std::ofstream f(dir.path() / "cache" / (translation_cache_key("test-model", "de", "en", "Hallo") + ".json"));
        f << R"({"translation":"Hello"})";
    }

    auto res = t.translate_batch({record("t1", 0, {}, "Hallo")}, "de", "en");
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].translated, "Hello");
    EXPECT_EQ(res[0].original_index, 0);
    EXPECT_EQ(t.name(), "ollama:test-model");
}

TEST(OllamaTranslatorTest, CacheOnlySkipsMissesWithoutARequest) {
    test_helpers::TempDir dir;
    const std::string cache = dir.file("cache");
    OllamaTranslator t("test-model", cache, "http://127.0.0.1:9/api/generate");
    t.set_cache_only(true);

    {
        std::ofstream f(dir.path() / "cache" / (translation_cache_key("test-model", "de", "en", "Hallo") + ".json"));
        f << R"({"translation":"Hello"})";
    }

    auto res = t.translate_batch({record("t1", 0, {}, "Hallo"), record("t2", 1, {}, "Tschuess")}, "de", "en");
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].id, "t1");
    EXPECT_EQ(res[0].translated, "Hello");
    // a request would have written its payload into the cache directory
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "cache" / "ollama_payload.tmp.json"));
}

TEST(ProcUtilTest, CapturesMergedOutput) {
    EXPECT_EQ(procutil::run_capture_stdout("printf out; printf err 1>&2"), "outerr");
}

TEST(ProcUtilTest, ReportsExitCodes) {
    EXPECT_EQ(procutil::run_wait_exitcode("true"), 0);
    EXPECT_EQ(procutil::run_wait_exitcode("exit 3"), 3);
}

TEST(ProcUtilTest, QuotesForTheShell) {
    EXPECT_EQ(procutil::shell_quote("plain"), "'plain'");
    EXPECT_EQ(procutil::shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(procutil::run_capture_stdout("printf %s " + procutil::shell_quote("a b'c")), "a b'c");
}

}  // namespace
}  // namespace llm
