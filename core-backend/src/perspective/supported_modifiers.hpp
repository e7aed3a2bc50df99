#pragma once

// ============================================================================
// 内置 modifier 目录
//
// PreProcessing   命中的行被移除
// PostProcessing  与规则链合并: or = 救回, and = 进一步限制
// Scaling         只是开关, 由 processor 做 100% 归一
//
// required_columns 的表名:
//   position_data              请求里自带的列
//   INSTRUMENT                 按 instrument_id 关联
//   PARENT_INSTRUMENT          按 parent_instrument_id 关联 INSTRUMENT, 列加 parent_ 前缀
//   INSTRUMENT_CATEGORIZATION  按 instrument_id 关联
// ============================================================================

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace perspective {

// -2147483648 与 INT_NULL 一致
inline const char *SUPPORTED_MODIFIERS_JSON = R"JSON({
  "exclude_other_net_assets": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "liquidity_type_id", "operator_type": "==", "value": 2},
    "required_columns": {"position_data": ["liquidity_type_id"]}
  },
  "exclude_class_positions": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "is_class_position", "operator_type": "==", "value": true},
    "required_columns": {"position_data": ["is_class_position"]}
  },
  "exclude_non_class_positions": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "is_class_position", "operator_type": "==", "value": false},
    "required_columns": {"position_data": ["is_class_position"]}
  },
  "exclude_future_in_kind_delivery": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "trade_type_id", "operator_type": "==", "value": 1},
    "required_columns": {"position_data": ["trade_type_id"]}
  },
  "exclude_future_trades": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"and": [
      {"column": "trade_type_id", "operator_type": "==", "value": 4},
      {"column": "upcoming_trade_date", "operator_type": "==", "value": true}
    ]},
    "required_columns": {"position_data": ["trade_type_id", "upcoming_trade_date"]}
  },
  "exclude_future_flows": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"and": [
      {"column": "liquidity_type_id", "operator_type": "==", "value": 3},
      {"column": "upcoming_trade_date", "operator_type": "==", "value": true}
    ]},
    "required_columns": {"position_data": ["liquidity_type_id", "upcoming_trade_date"]}
  },
  "exclude_pending_stop_trades": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "trade_type_id", "operator_type": "==", "value": 2},
    "required_columns": {"position_data": ["trade_type_id"]}
  },
  "exclude_pending_limit_trades": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "trade_type_id", "operator_type": "==", "value": 3},
    "required_columns": {"position_data": ["trade_type_id"]}
  },
  "exclude_potential_red_flags": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "red_flag_exclusion_type_id", "operator_type": "IsNotNull"},
    "required_columns": {"position_data": ["red_flag_exclusion_type_id"]}
  },
  "exclude_simulated_trades": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"or": [
      {"and": [
        {"column": "position_source_type_id", "operator_type": "==", "value": 10},
        {"or": [
          {"column": "liquidity_type_id", "operator_type": "==", "value": -2147483648},
          {"column": "liquidity_type_id", "operator_type": "!=", "value": 5}
        ]}
      ]},
      {"column": "simulated_trade_id", "operator_type": "IsNotNull"}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id", "simulated_trade_id"]},
    "override_modifiers": ["include_all_trade_cash", "include_trade_cash_within_perspective"]
  },
  "exclude_simulated_cash": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 5}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id"]},
    "override_modifiers": ["exclude_perspective_level_simulated_cash", "include_simulated_cash"]
  },
  "exclude_pending_trades": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "position_source_type_id", "operator_type": "==", "value": 9},
    "required_columns": {"position_data": ["position_source_type_id"]}
  },
  "exclude_current_flow": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"and": [
      {"column": "liquidity_type_id", "operator_type": "==", "value": 3},
      {"column": "upcoming_trade_date", "operator_type": "==", "value": false}
    ]},
    "required_columns": {"position_data": ["liquidity_type_id", "upcoming_trade_date"]}
  },
  "exclude_manual_corrections": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "position_source_type_id", "operator_type": "==", "value": 8},
    "required_columns": {"position_data": ["position_source_type_id"]}
  },
  "exclude_initial_positions": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "position_source_type_id", "operator_type": "In", "value": [1, 9, 11]},
    "required_columns": {"position_data": ["position_source_type_id"]}
  },
  "exclude_blocked_positions": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"column": "position_blocking_type_id", "operator_type": "IsNotNull"},
    "required_columns": {"position_data": ["position_blocking_type_id"]}
  },
  "exclude_other_net_assets_excl_investment_grade_accrual": {
    "type": "PreProcessing", "apply_to": "both",
    "criteria": {"and": [
      {"column": "liquidity_type_id", "operator_type": "==", "value": 2},
      {"column": "parent_instrument_subtype_id", "operator_type": "NotIn", "value": [93, 94]}
    ]},
    "required_columns": {
      "position_data": ["liquidity_type_id", "parent_instrument_id"],
      "PARENT_INSTRUMENT": ["instrument_subtype_id"]
    }
  },

  "include_all_trade_cash": {
    "type": "PostProcessing", "apply_to": "both", "rule_result_operator": "or",
    "criteria": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 6}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id"]},
    "override_modifiers": ["exclude_perspective_level_simulated_cash"]
  },
  "include_trade_cash_within_perspective": {
    "type": "PostProcessing", "apply_to": "both", "rule_result_operator": "or",
    "criteria": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 6}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id"]},
    "override_modifiers": ["exclude_perspective_level_simulated_cash"]
  },
  "exclude_trade_cash": {
    "type": "PostProcessing", "apply_to": "both", "rule_result_operator": "and",
    "criteria": {"not": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 6}
    ]}},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id"]},
    "override_modifiers": ["exclude_perspective_level_simulated_cash"]
  },
  "exclude_perspective_level_simulated_cash": {
    "type": "PostProcessing", "apply_to": "both", "rule_result_operator": "or",
    "criteria": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 5},
      {"column": "perspective_id", "operator_type": "In", "value": "(-2147483648,perspective_id)"}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id", "perspective_id"]}
  },
  "include_simulated_cash": {
    "type": "PostProcessing", "apply_to": "both", "rule_result_operator": "or",
    "criteria": {"and": [
      {"column": "position_source_type_id", "operator_type": "==", "value": 10},
      {"column": "liquidity_type_id", "operator_type": "==", "value": 5}
    ]},
    "required_columns": {"position_data": ["position_source_type_id", "liquidity_type_id"]}
  },

  "scale_holdings_to_100_percent": {
    "type": "Scaling", "apply_to": "both",
    "criteria": null,
    "required_columns": {}
  },
  "scale_lookthroughs_to_100_percent": {
    "type": "Scaling", "apply_to": "both",
    "criteria": {"column": "instrument_subtype_id", "operator_type": "In", "value": [27, 38, 66, 81, 84]},
    "required_columns": {"INSTRUMENT": ["instrument_subtype_id"]}
  }
})JSON";

// 除非被覆盖, 每个 perspective 都会带上
inline const std::vector<std::string> DEFAULT_MODIFIERS = {"exclude_perspective_level_simulated_cash"};

} // namespace perspective
