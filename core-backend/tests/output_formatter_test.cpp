// =============================================================================
// output_formatter_test.cpp
// =============================================================================
// Unit tests for perspective::OutputFormatter.
//
// Validates:
//   - Kept rows appear as weight * factor under container / positions
//   - Every requested perspective appears, even with nothing kept
//   - verbose: removed positions listed, removed lookthroughs summed per parent
//   - Unsigned weights beyond int64 are summed as doubles
//   - scale_factors only for containers that lost something
//   - flatten: parallel arrays, integer identifiers, 13-digit rounding
// =============================================================================

#include "perspective/output_formatter.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace perspective;

// =============================================================================
// Fixture
// =============================================================================
class OutputFormatterTest : public ::testing::Test {
protected:
  MetadataMap metadata = {{"cfg", 7, "f_cfg_7", {}}, {"cfg", 8, "f_cfg_8", {}}};
  ResultTable positions;
  ResultTable lookthroughs;

  void SetUp() override {
    positions.names = {"identifier", "container", "record_type", "weight", "f_cfg_7", "f_cfg_8"};
    positions.rows = {
        {"1", "fund", "position", 0.6, 1.0, nullptr},
        {"2", "fund", "position", 0.4, nullptr, nullptr},
        {"3", "other", "position", 1.0, 1.0, nullptr},
    };

    lookthroughs.names = {"identifier", "container", "record_type", "parent_instrument_id", "weight", "f_cfg_7",
                          "f_cfg_8"};
    lookthroughs.rows = {
        {"10", "fund", "essential_lookthroughs", 100, 1, nullptr, nullptr},
        {"11", "fund", "essential_lookthroughs", 100, 2, nullptr, nullptr},
        {"12", "fund", "essential_lookthroughs", 100, 3, nullptr, nullptr},
        {"13", "fund", "essential_lookthroughs", 200, 4, 0.5, nullptr},
    };
  }

  json run(FormatOptions opts = {}) {
    json out = OutputFormatter::format(positions, lookthroughs, metadata, {"weight"}, {"weight"}, opts);
    return out["perspective_configurations"]["cfg"];
  }
};

TEST_F(OutputFormatterTest, KeptRowsCarryScaledWeights) {
  json cfg = run();
  EXPECT_DOUBLE_EQ(cfg["7"]["fund"]["positions"]["1"]["weight"].get<double>(), 0.6);
  EXPECT_FALSE(cfg["7"]["fund"]["positions"].contains("2"));
  EXPECT_DOUBLE_EQ(cfg["7"]["fund"]["essential_lookthroughs"]["13"]["weight"].get<double>(), 2.0);
  EXPECT_FALSE(cfg["7"]["fund"].contains("removed_positions_weight_summary"));
}

TEST_F(OutputFormatterTest, EveryPerspectiveIsPresent) {
  json cfg = run();
  ASSERT_TRUE(cfg.contains("8"));
  EXPECT_TRUE(cfg["8"].empty());
}

TEST_F(OutputFormatterTest, VerboseListsRemovedPositions) {
  json summary = run({true, false})["7"]["fund"]["removed_positions_weight_summary"];
  EXPECT_DOUBLE_EQ(summary["positions"]["2"]["weight"].get<double>(), 0.4);
  EXPECT_FALSE(summary["positions"].contains("1"));
}

TEST_F(OutputFormatterTest, VerboseSumsRemovedLookthroughsPerParent) {
  json summary = run({true, false})["7"]["fund"]["removed_positions_weight_summary"];
  ASSERT_TRUE(summary.contains("essential_lookthroughs"));
  EXPECT_EQ(summary["essential_lookthroughs"]["100"]["weight"], 6);
  EXPECT_TRUE(summary["essential_lookthroughs"]["100"]["weight"].is_number_integer());
  EXPECT_FALSE(summary["essential_lookthroughs"].contains("200"));
}

TEST_F(OutputFormatterTest, HugeUnsignedWeightsSumAsDouble) {
  lookthroughs.rows = {
      {"20", "fund", "essential_lookthroughs", 300, json(UINT64_MAX), nullptr, nullptr},
      {"21", "fund", "essential_lookthroughs", 300, 1, nullptr, nullptr},
  };
  json weight = run({true, false})["7"]["fund"]["removed_positions_weight_summary"]["essential_lookthroughs"]["300"]
                                   ["weight"];
  ASSERT_TRUE(weight.is_number_float());
  EXPECT_DOUBLE_EQ(weight.get<double>(), static_cast<double>(UINT64_MAX) + 1.0);
}

TEST_F(OutputFormatterTest, ScaleFactorsOnlyWhereSomethingWasRemoved) {
  json cfg = run({true, false});
  EXPECT_DOUBLE_EQ(cfg["7"]["fund"]["scale_factors"]["weight"].get<double>(), 0.6);
  EXPECT_FALSE(cfg["7"]["other"].contains("scale_factors"));
  // 全部删除时没有保留行, 也就没有 scale_factors
  EXPECT_FALSE(cfg["8"].contains("fund") && cfg["8"]["fund"].contains("scale_factors"));
}

TEST_F(OutputFormatterTest, FlattenProducesParallelArrays) {
  json block = run({false, true})["7"]["fund"]["positions"];
  ASSERT_EQ(block["identifier"].size(), 1u);
  EXPECT_EQ(block["identifier"][0], 1);
  EXPECT_TRUE(block["identifier"][0].is_number_integer());
  EXPECT_DOUBLE_EQ(block["weight"][0].get<double>(), 0.6);
}

TEST(FlattenEntriesTest, RoundsAndKeepsNonNumericIds) {
  json entries = {{"abc", {{"weight", 0.1 + 0.2}}}, {"5", {{"weight", 1}}}};
  json out = OutputFormatter::flatten_entries(entries);
  ASSERT_EQ(out["identifier"].size(), 2u);
  EXPECT_EQ(out["identifier"][0], 5);
  EXPECT_EQ(out["identifier"][1], "abc");
  EXPECT_EQ(out["weight"][0], 1);
  EXPECT_DOUBLE_EQ(out["weight"][1].get<double>(), 0.3);
}

TEST(FlattenEntriesTest, EmptyBlock) {
  json out = OutputFormatter::flatten_entries(json::object());
  EXPECT_EQ(out, (json{{"identifier", json::array()}}));
}
