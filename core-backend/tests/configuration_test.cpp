// =============================================================================
// configuration_test.cpp
// =============================================================================
// Unit tests for perspective::ConfigurationManager and the perspective loaders.
//
// Validates:
//   - Rows with the same id are grouped, flags AND-ed, rules concatenated
//   - Inactive / unsupported perspectives are dropped at load
//   - required_columns hints are lifted out of rule criteria
//   - Scale factors are percentages divided by 100
//   - Active modifiers honour request order, defaults and overrides
//   - Custom perspectives: negative ids only, required fields, request-scoped
// =============================================================================

#include "core/errors.hpp"
#include "loaders/perspective_loader.hpp"
#include "perspective/configuration.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace perspective;

namespace {

json sample_document() {
  return json::parse(R"({
    "perspectives": [
      {"id": 100, "name": "Liquid only", "is_active": true,
       "is_compatible_with_sub_setting_service": true,
       "rules": [{"apply_to": "both",
                  "criteria": {"column": "liquidity_type_id", "operator_type": "==", "value": 2,
                               "required_columns": {"INSTRUMENT_CATEGORIZATION": ["liquidity_type_id"]}},
                  "condition_for_next_rule": "Or"}]},
      {"id": 100, "is_active": true,
       "rules": [{"apply_to": "holding", "is_scaling_rule": true, "scale_factor": 50,
                  "criteria": "{\"column\": \"currency\", \"operator_type\": \"==\", \"value\": \"USD\"}"}]},
      {"id": 200, "name": "Retired", "is_active": false, "rules": []},
      {"id": 300, "name": "Unsupported", "is_active": true,
       "is_compatible_with_sub_setting_service": false, "rules": []},
      {"id": 400, "name": "Broken", "rules": [{"apply_to": "sideways", "criteria": null}]}
    ]
  })");
}

} // namespace

// =============================================================================
// Fixture
// =============================================================================
class ConfigurationTest : public ::testing::Test {
protected:
  loaders::StaticPerspectiveLoader loader{sample_document()};
  ConfigurationManager config{&loader};
};

TEST_F(ConfigurationTest, GroupsRowsAndDropsInactive) {
  EXPECT_TRUE(config.has_perspective(100));
  EXPECT_FALSE(config.has_perspective(200));
  EXPECT_FALSE(config.has_perspective(300));
  EXPECT_FALSE(config.has_perspective(400));

  const Perspective &p = config.perspective(100);
  EXPECT_EQ(p.name, "Liquid only");
  ASSERT_EQ(p.rules.size(), 2u);
  EXPECT_EQ(p.rules[0].condition_for_next_rule, NextCondition::Or);
  EXPECT_EQ(p.rules[1].apply_to, ApplyTo::Position);
}

TEST_F(ConfigurationTest, RequiredColumnsAreLiftedFromCriteria) {
  const Perspective &p = config.perspective(100);
  auto *cols = p.required_columns.find("INSTRUMENT_CATEGORIZATION");
  ASSERT_NE(cols, nullptr);
  EXPECT_EQ(*cols, std::vector<std::string>{"liquidity_type_id"});
  EXPECT_EQ(p.rules[0].criteria.kind, NodeKind::Leaf);
  EXPECT_EQ(p.rules[0].criteria.column, "liquidity_type_id");
}

TEST_F(ConfigurationTest, ScaleFactorIsPercentage) {
  const Rule &r = config.perspective(100).rules[1];
  EXPECT_TRUE(r.is_scaling_rule);
  EXPECT_DOUBLE_EQ(r.scale_factor, 0.5);
  EXPECT_DOUBLE_EQ(config.perspective(100).rules[0].scale_factor, 1.0);
}

TEST_F(ConfigurationTest, UnknownLookupsAreConfigErrors) {
  EXPECT_THROW(config.perspective(999), ConfigError);
  EXPECT_THROW(config.modifier("no_such_modifier"), ConfigError);
  EXPECT_THROW(config.active_modifiers({"no_such_modifier"}), ConfigError);
}

TEST_F(ConfigurationTest, ModifierCatalogue) {
  EXPECT_EQ(config.modifiers().size(), 24u);
  EXPECT_EQ(config.modifier("exclude_other_net_assets").type, ModifierType::PreProcessing);
  EXPECT_EQ(config.modifier("include_all_trade_cash").rule_result_operator, RuleResultOp::Or);
  EXPECT_EQ(config.modifier("scale_holdings_to_100_percent").type, ModifierType::Scaling);
  EXPECT_TRUE(config.modifier("scale_holdings_to_100_percent").criteria.is_empty());
}

TEST_F(ConfigurationTest, ActiveModifiersAppendDefaults) {
  auto active = config.active_modifiers({"exclude_other_net_assets"});
  EXPECT_EQ(active, (std::vector<std::string>{"exclude_other_net_assets", "exclude_perspective_level_simulated_cash"}));
}

TEST_F(ConfigurationTest, OverrideRemovesTargets) {
  // exclude_simulated_cash 覆盖默认的 exclude_perspective_level_simulated_cash
  auto active = config.active_modifiers({"exclude_simulated_cash", "include_simulated_cash"});
  EXPECT_EQ(active, std::vector<std::string>{"exclude_simulated_cash"});
}

TEST_F(ConfigurationTest, RequiredColumnsForModifiersUnion) {
  auto rc = config.required_columns_for({"exclude_simulated_cash", "exclude_other_net_assets"});
  auto *cols = rc.find("position_data");
  ASSERT_NE(cols, nullptr);
  EXPECT_EQ(*cols, (std::vector<std::string>{"position_source_type_id", "liquidity_type_id"}));
}

// =============================================================================
// Custom perspectives
// =============================================================================

TEST_F(ConfigurationTest, CustomPerspectiveIsRequestScoped) {
  json custom = {{"-1",
                  {{"rules",
                    {{{"apply_to", "both"},
                      {"criteria", {{"column", "currency"}, {"operator_type", "=="}, {"value", "USD"}}}},
                     {{"apply_to", "lookthrough"},
                      {"criteria", nullptr},
                      {"is_scaling_rule", true},
                      {"scale_factor", 25}}}}}}};
  ConfigurationManager scoped = config.with_custom_perspectives(custom);
  ASSERT_TRUE(scoped.has_perspective(-1));
  EXPECT_FALSE(config.has_perspective(-1));
  ASSERT_EQ(scoped.perspective(-1).rules.size(), 2u);
  EXPECT_DOUBLE_EQ(scoped.perspective(-1).rules[1].scale_factor, 0.25);
  EXPECT_EQ(scoped.perspective(-1).rules[1].apply_to, ApplyTo::Lookthrough);
}

TEST_F(ConfigurationTest, CustomPerspectiveValidation) {
  json rule = {{"apply_to", "both"}, {"criteria", nullptr}};
  EXPECT_THROW(config.with_custom_perspectives({{"5", {{"rules", {rule}}}}}), InputError);
  EXPECT_THROW(config.with_custom_perspectives({{"abc", {{"rules", {rule}}}}}), InputError);
  EXPECT_THROW(config.with_custom_perspectives({{"-1", json::object()}}), InputError);
  EXPECT_THROW(config.with_custom_perspectives({{"-1", {{"rules", {{{"apply_to", "both"}}}}}}}), InputError);
  EXPECT_THROW(config.with_custom_perspectives({{"-1", {{"rules", {{{"criteria", nullptr}}}}}}}), InputError);
  EXPECT_THROW(config.with_custom_perspectives(
                   {{"-1", {{"rules", {{{"apply_to", "both"}, {"criteria", nullptr}, {"is_scaling_rule", true}}}}}}}),
               InputError);
}

TEST_F(ConfigurationTest, CustomPerspectiveWithEmptyRulesIsIgnored) {
  ConfigurationManager scoped = config.with_custom_perspectives({{"-7", {{"rules", json::array()}}}});
  EXPECT_FALSE(scoped.has_perspective(-7));
}

TEST(ConfigurationNoLoaderTest, StartsWithModifiersOnly) {
  ConfigurationManager config(nullptr);
  EXPECT_TRUE(config.perspectives().empty());
  EXPECT_FALSE(config.modifiers().empty());
}

TEST(PerspectiveLoaderTest, FileLoaderMissingFile) {
  loaders::FilePerspectiveLoader loader("/nonexistent/perspectives.json");
  EXPECT_THROW(loader.load(std::nullopt), ConfigError);
}
