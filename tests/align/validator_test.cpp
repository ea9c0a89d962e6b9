// Tests for align/Validator -- the invariant checker flags each broken rule.

#include "align/Validator.hpp"

#include <gtest/gtest.h>

#include "nlohmann/json.hpp"
#include "test_helpers.h"

namespace align {
namespace {

using test_helpers::record;

bool has_code(const ValidationReport& rep, const std::string& code) {
    for (const auto& e : rep.errors)
        if (e.code == code) return true;
    return false;
}

struct Fixture {
    std::vector<ContentRecord> ref = {record("1", 0, {1, 0}), record("2", 1, {0, 1})};
    std::vector<ContentRecord> tgt = {record("A", 0, {1, 0}), record("B", 1, {-1, 0})};
    AlignmentResult result;

    Fixture() { result = align_records(ref, tgt).value; }
};

TEST(ValidatorTest, CleanResultPasses) {
    Fixture f;
    EXPECT_TRUE(check_alignment(f.ref, f.tgt, f.result).pass);
}

TEST(ValidatorTest, LostTargetIsReported) {
    Fixture f;
    f.result.leftover_targets.clear();
    f.result.leftover_count = 0;
    auto rep = check_alignment(f.ref, f.tgt, f.result);
    EXPECT_FALSE(rep.pass);
    EXPECT_TRUE(has_code(rep, "lost_target"));
}

TEST(ValidatorTest, DuplicateTargetIsReported) {
    Fixture f;
    f.result.leftover_targets.push_back(f.tgt[0]);
    f.result.leftover_count = 2;
    auto rep = check_alignment(f.ref, f.tgt, f.result);
    EXPECT_TRUE(has_code(rep, "duplicate_target"));
}

TEST(ValidatorTest, OrderViolationIsReported) {
    Fixture f;
    std::swap(f.result.rows[0], f.result.rows[1]);
    EXPECT_TRUE(has_code(check_alignment(f.ref, f.tgt, f.result), "order_violation"));
}

TEST(ValidatorTest, LeftoverOrderViolationIsReported) {
    Fixture f;
    f.result.leftover_targets = {record("C", 3, {}), record("B", 1, {})};
    f.result.leftover_count = 2;
    EXPECT_TRUE(has_code(check_alignment(f.ref, f.tgt, f.result), "leftover_order_violation"));
}

TEST(ValidatorTest, CountMismatchIsReported) {
    Fixture f;
    f.result.matched_count += 1;
    EXPECT_TRUE(has_code(check_alignment(f.ref, f.tgt, f.result), "count_mismatch"));
}

TEST(ValidatorTest, RowCountMismatchIsReported) {
    Fixture f;
    f.result.rows.pop_back();
    EXPECT_TRUE(has_code(check_alignment(f.ref, f.tgt, f.result), "row_count_mismatch"));
}

TEST(ValidatorTest, ReportIsWrittenAsJson) {
    test_helpers::TempDir dir;
    ValidationReport rep;
    rep.pass = false;
    rep.errors.push_back({"lost_target", "gone", "B"});

    const std::string path = dir.file("nested/report.json");
    write_validation_report(path, rep);

    auto j = nlohmann::json::parse(test_helpers::read_file(path));
    EXPECT_FALSE(j["pass"].get<bool>());
    ASSERT_EQ(j["errors"].size(), 1u);
    EXPECT_EQ(j["errors"][0]["code"], "lost_target");
    EXPECT_EQ(j["errors"][0]["record_id"], "B");
}

}  // namespace
}  // namespace align
