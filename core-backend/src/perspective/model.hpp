#pragma once

// ============================================================================
// Perspective / Rule / Modifier 数据模型
// ============================================================================

#include "../core/errors.hpp"
#include "criteria.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace perspective {

enum class ApplyTo { Position, Lookthrough, Both };
enum class NextCondition { None, And, Or };
enum class ModifierType { PreProcessing, PostProcessing, Scaling };
enum class RuleResultOp { And, Or };

// 处理模式: 持仓 / 穿透
enum class Mode { Position, Lookthrough };

inline std::string to_lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

inline ApplyTo parse_apply_to(const std::string &s) {
  std::string v = to_lower(s);
  if (v == "both")
    return ApplyTo::Both;
  if (v == "holding" || v == "position")
    return ApplyTo::Position;
  if (v == "lookthrough" || v == "reference")
    return ApplyTo::Lookthrough;
  throw ConfigError("unknown apply_to: " + s);
}

inline const char *apply_to_name(ApplyTo a) {
  switch (a) {
  case ApplyTo::Position:
    return "holding";
  case ApplyTo::Lookthrough:
    return "lookthrough";
  case ApplyTo::Both:
    break;
  }
  return "both";
}

inline bool applies_to(ApplyTo a, Mode m) {
  if (a == ApplyTo::Both)
    return true;
  return (a == ApplyTo::Position) == (m == Mode::Position);
}

inline NextCondition parse_next_condition(const json &j) {
  if (!j.is_string())
    return NextCondition::None;
  std::string v = to_lower(j.get<std::string>());
  if (v == "or")
    return NextCondition::Or;
  if (v == "and")
    return NextCondition::And;
  return NextCondition::None;
}

inline ModifierType parse_modifier_type(const std::string &s) {
  if (s == "PreProcessing")
    return ModifierType::PreProcessing;
  if (s == "PostProcessing")
    return ModifierType::PostProcessing;
  if (s == "Scaling")
    return ModifierType::Scaling;
  throw ConfigError("unknown modifier type: " + s);
}

inline const char *modifier_type_name(ModifierType t) {
  switch (t) {
  case ModifierType::PreProcessing:
    return "PreProcessing";
  case ModifierType::PostProcessing:
    return "PostProcessing";
  case ModifierType::Scaling:
    return "Scaling";
  }
  return "";
}

// ============================================================================
// RequiredColumns - table → columns, 保持首次出现的顺序, 去重
// ============================================================================
class RequiredColumns {
public:
  void add(const std::string &table, const std::string &column) {
    auto &cols = entry(table);
    if (std::find(cols.begin(), cols.end(), column) == cols.end())
      cols.push_back(column);
  }

  void merge(const RequiredColumns &other) {
    for (auto &[table, cols] : other.tables_) {
      entry(table);
      for (auto &c : cols)
        add(table, c);
    }
  }

  // {"TABLE": ["col", ...]}, 也接受 JSON 字符串
  static RequiredColumns from_json(const json &j) {
    RequiredColumns rc;
    if (j.is_string()) {
      json parsed = json::parse(j.get<std::string>(), nullptr, false);
      if (parsed.is_discarded())
        throw ConfigError("malformed required_columns: " + j.get<std::string>());
      return from_json(parsed);
    }
    if (!j.is_object())
      return rc;
    for (auto &[table, cols] : j.items()) {
      rc.entry(table);
      if (!cols.is_array())
        throw ConfigError("required_columns for " + table + " must be a list");
      for (auto &c : cols)
        rc.add(table, c.get<std::string>());
    }
    return rc;
  }

  json to_json() const {
    json j = json::object();
    for (auto &[table, cols] : tables_)
      j[table] = cols;
    return j;
  }

  bool empty() const { return tables_.empty(); }
  const std::vector<std::pair<std::string, std::vector<std::string>>> &tables() const { return tables_; }

  const std::vector<std::string> *find(const std::string &table) const {
    for (auto &[t, cols] : tables_) {
      if (t == table)
        return &cols;
    }
    return nullptr;
  }

private:
  std::vector<std::string> &entry(const std::string &table) {
    for (auto &[t, cols] : tables_) {
      if (t == table)
        return cols;
    }
    tables_.emplace_back(table, std::vector<std::string>{});
    return tables_.back().second;
  }

  std::vector<std::pair<std::string, std::vector<std::string>>> tables_;
};

struct Rule {
  std::string name;
  ApplyTo apply_to = ApplyTo::Both;
  Criteria criteria;
  NextCondition condition_for_next_rule = NextCondition::None;
  bool is_scaling_rule = false;
  double scale_factor = 1.0; // 已经除过 100
};

struct Modifier {
  std::string name;
  ApplyTo apply_to = ApplyTo::Both;
  ModifierType type = ModifierType::PreProcessing;
  Criteria criteria;
  RuleResultOp rule_result_operator = RuleResultOp::And;
  RequiredColumns required_columns;
  std::vector<std::string> override_modifiers;

  json to_json() const {
    json j = {{"name", name},
              {"apply_to", apply_to_name(apply_to)},
              {"type", modifier_type_name(type)},
              {"criteria", criteria.to_json()},
              {"required_columns", required_columns.to_json()},
              {"override_modifiers", override_modifiers}};
    if (type == ModifierType::PostProcessing)
      j["rule_result_operator"] = rule_result_operator == RuleResultOp::Or ? "or" : "and";
    return j;
  }
};

struct Perspective {
  int64_t id = 0;
  std::string name;
  std::vector<Rule> rules;
  RequiredColumns required_columns;
};

} // namespace perspective
