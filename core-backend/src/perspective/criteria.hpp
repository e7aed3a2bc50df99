#pragma once

// ============================================================================
// Criteria 树
//
// Leaf  {column, operator_type, value}
// And   {"and": [...]}    空 And 恒真
// Or    {"or":  [...]}    空 Or 恒假
// Not   {"not": {...}}
//
// 解析阶段就拒绝未知运算符, evaluator 不再处理非法输入.
// ============================================================================

#include "../core/errors.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace perspective {

enum class NodeKind { Leaf, And, Or, Not };

enum class Op {
  Eq,
  Ne,
  Gt,
  Lt,
  Ge,
  Le,
  In,
  NotIn,
  IsNull,
  IsNotNull,
  Between,
  NotBetween,
  Like,
  NotLike
};

inline Op parse_op(const std::string &s) {
  if (s == "=" || s == "==")
    return Op::Eq;
  if (s == "!=")
    return Op::Ne;
  if (s == ">")
    return Op::Gt;
  if (s == "<")
    return Op::Lt;
  if (s == ">=")
    return Op::Ge;
  if (s == "<=")
    return Op::Le;
  if (s == "In")
    return Op::In;
  if (s == "NotIn")
    return Op::NotIn;
  if (s == "IsNull")
    return Op::IsNull;
  if (s == "IsNotNull")
    return Op::IsNotNull;
  if (s == "Between")
    return Op::Between;
  if (s == "NotBetween")
    return Op::NotBetween;
  if (s == "Like")
    return Op::Like;
  if (s == "NotLike")
    return Op::NotLike;
  throw ConfigError("unknown criteria operator: " + s);
}

inline const char *op_name(Op op) {
  switch (op) {
  case Op::Eq:
    return "==";
  case Op::Ne:
    return "!=";
  case Op::Gt:
    return ">";
  case Op::Lt:
    return "<";
  case Op::Ge:
    return ">=";
  case Op::Le:
    return "<=";
  case Op::In:
    return "In";
  case Op::NotIn:
    return "NotIn";
  case Op::IsNull:
    return "IsNull";
  case Op::IsNotNull:
    return "IsNotNull";
  case Op::Between:
    return "Between";
  case Op::NotBetween:
    return "NotBetween";
  case Op::Like:
    return "Like";
  case Op::NotLike:
    return "NotLike";
  }
  return "";
}

struct Criteria {
  NodeKind kind = NodeKind::And;
  std::string column;
  Op op = Op::Eq;
  json value;
  std::vector<Criteria> children;

  // 没有任何条件 (null / {} / 缺字段的叶子)
  bool is_empty() const { return kind == NodeKind::And && children.empty(); }

  // In/NotIn 的 value 是一棵子 criteria 树, 需要预计算
  bool is_nested() const {
    return kind == NodeKind::Leaf && (op == Op::In || op == Op::NotIn) && value.is_object();
  }

  static Criteria parse(const json &j) {
    if (j.is_null())
      return Criteria{};
    if (j.is_string()) {
      std::string s = j.get<std::string>();
      if (s.empty())
        return Criteria{};
      json parsed = json::parse(s, nullptr, false);
      if (parsed.is_discarded())
        throw ConfigError("malformed criteria JSON: " + s);
      return parse(parsed);
    }
    if (!j.is_object())
      throw ConfigError("criteria must be an object: " + j.dump());

    Criteria c;
    if (j.contains("and")) {
      c.kind = NodeKind::And;
      c.children = parse_children(j["and"], "and");
      return c;
    }
    if (j.contains("or")) {
      c.kind = NodeKind::Or;
      c.children = parse_children(j["or"], "or");
      return c;
    }
    if (j.contains("not")) {
      c.kind = NodeKind::Not;
      c.children.push_back(parse(j["not"]));
      return c;
    }

    std::string column = j.value("column", "");
    std::string op;
    if (j.contains("operator_type") && j["operator_type"].is_string())
      op = j["operator_type"].get<std::string>();
    else if (j.contains("operator") && j["operator"].is_string())
      op = j["operator"].get<std::string>();
    if (column.empty() || op.empty())
      return Criteria{};

    c.kind = NodeKind::Leaf;
    c.column = column;
    c.op = parse_op(op);
    c.value = j.contains("value") ? j["value"] : json();
    return c;
  }

  json to_json() const {
    switch (kind) {
    case NodeKind::Leaf:
      return json{{"column", column}, {"operator_type", op_name(op)}, {"value", value}};
    case NodeKind::And:
    case NodeKind::Or: {
      json arr = json::array();
      for (auto &ch : children)
        arr.push_back(ch.to_json());
      if (kind == NodeKind::And && arr.empty())
        return nullptr;
      return json{{kind == NodeKind::And ? "and" : "or", arr}};
    }
    case NodeKind::Not:
      return json{{"not", children.empty() ? json() : children[0].to_json()}};
    }
    return nullptr;
  }

  // 遍历所有叶子 (含嵌套在 Not 下的)
  template <typename F>
  void for_each_leaf(F &&fn) const {
    if (kind == NodeKind::Leaf) {
      fn(*this);
      return;
    }
    for (auto &ch : children)
      ch.for_each_leaf(fn);
  }

private:
  static std::vector<Criteria> parse_children(const json &arr, const char *key) {
    if (!arr.is_array())
      throw ConfigError(std::string("criteria '") + key + "' must be a list");
    std::vector<Criteria> out;
    out.reserve(arr.size());
    for (auto &ch : arr)
      out.push_back(parse(ch));
    return out;
  }
};

} // namespace perspective
