// Tests for text/TextCleaner -- HTML stripping, entities, whitespace and
// punctuation handling across scripts.

#include "text/TextCleaner.hpp"

#include <gtest/gtest.h>

namespace textutil {
namespace {

TEST(TextCleanerTest, StripsTagsAndPunctuation) {
    EXPECT_EQ(clean_content("<p>Hello&nbsp;<b>World</b>!</p>"), "Hello World");
}

TEST(TextCleanerTest, DropsScriptAndStyleBodies) {
    EXPECT_EQ(clean_content("a<script>var x = 1;</script>b"), "a b");
    EXPECT_EQ(clean_content("<STYLE type=\"text/css\">p{color:red}</STYLE>Text"), "Text");
}

TEST(TextCleanerTest, DropsComments) {
    EXPECT_EQ(clean_content("keep<!-- hidden -->this"), "keep this");
}

TEST(TextCleanerTest, LiteralLessThanIsNotATag) {
    CleanOptions keep;
    keep.remove_special_characters = false;
    EXPECT_EQ(clean_content("a < b", keep), "a < b");
}

TEST(TextCleanerTest, DecodesEntities) {
    CleanOptions keep;
    keep.remove_special_characters = false;
    EXPECT_EQ(clean_content("Tom &amp; Jerry &lt;3 &quot;hi&quot; &#39;x&#39;", keep),
              "Tom & Jerry <3 \"hi\" 'x'");
    EXPECT_EQ(decode_entities("&#233;t&#xE9;"), "\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(decode_entities("&bogus; & &#;"), "&bogus; & &#;");
}

TEST(TextCleanerTest, CollapsesAndTrimsWhitespace) {
    EXPECT_EQ(collapse_whitespace("  a \t\n b  "), "a b");
    EXPECT_EQ(collapse_whitespace("a\xE3\x80\x80" "b"), "a b");  // ideographic space
    EXPECT_EQ(clean_content("   "), "");
    EXPECT_EQ(clean_content(""), "");
}

TEST(TextCleanerTest, KeepsLettersOfEveryScript) {
    EXPECT_EQ(clean_content("\xE4\xBD\xA0\xE5\xA5\xBD\xEF\xBC\x8C\xE4\xB8\x96\xE7\x95\x8C\xEF\xBC\x81"),
              "\xE4\xBD\xA0\xE5\xA5\xBD \xE4\xB8\x96\xE7\x95\x8C");  // 你好，世界！ -> 你好 世界
    EXPECT_EQ(clean_content("\xEC\x95\x88\xEB\x85\x95."), "\xEC\x95\x88\xEB\x85\x95");  // 안녕.
    EXPECT_EQ(clean_content("Caf\xC3\xA9 -- cr\xC3\xA8me!"), "Caf\xC3\xA9 cr\xC3\xA8me");
    EXPECT_EQ(clean_content("snake_case 42%"), "snake_case 42");
}

TEST(TextCleanerTest, OptionsCanBeDisabled) {
    CleanOptions raw;
    raw.strip_html = false;
    raw.normalize_whitespace = false;
    raw.remove_special_characters = false;
    EXPECT_EQ(clean_content(" <b>x</b>  y ", raw), " <b>x</b>  y ");
}

TEST(TextCleanerTest, ValidityCountsCodePoints) {
    EXPECT_FALSE(is_content_valid(""));
    EXPECT_FALSE(is_content_valid("   "));
    EXPECT_FALSE(is_content_valid("ab"));
    EXPECT_TRUE(is_content_valid("abc"));
    EXPECT_TRUE(is_content_valid("\xE4\xBD\xA0\xE5\xA5\xBD\xE5\x90\x97"));  // 你好吗: 3 code points
    EXPECT_FALSE(is_content_valid("abcde", 3, 4));
}

TEST(TextCleanerTest, CleanRecordsFillsCleanText) {
    std::vector<align::ContentRecord> recs(2);
    recs[0].raw_text = "<i>One</i>.";
    recs[1].raw_text = "Two  words";
    clean_records(recs);
    EXPECT_EQ(recs[0].clean_text, "One");
    EXPECT_EQ(recs[1].clean_text, "Two words");
    EXPECT_EQ(recs[0].raw_text, "<i>One</i>.");
}

}  // namespace
}  // namespace textutil
