#pragma once

// ============================================================================
// RuleEvaluator - Criteria 树 → 布尔 Expr
//
// 按目标 frame 的列类型生成字面量; 类型对不上时退化为文本比较.
// frame 里没有的列是配置错误 (声明过的参考列已由引擎补成占位列).
// 嵌套 In/NotIn 只查预计算表, 查不到按恒真处理并告警.
// ============================================================================

#include "../core/constants.hpp"
#include "criteria.hpp"
#include "expr.hpp"
#include "lazy_frame.hpp"
#include "value_parser.hpp"

#include <cctype>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace perspective {

// canonical nested criteria JSON → 满足条件的外层列取值
using PrecomputedValues = std::map<std::string, std::vector<json>>;

// 子条件里带 perspective_id 时, 不同 perspective 的取值不同, key 要带上 id
inline std::string nested_key(const json &nested, int64_t perspective_id) {
  std::string key = nested.dump();
  if (key.find("perspective_id") != std::string::npos)
    key += "#" + std::to_string(perspective_id);
  return key;
}

class RuleEvaluator {
public:
  RuleEvaluator(const LazyFrame &frame, const PrecomputedValues *precomputed)
      : frame_(frame), precomputed_(precomputed) {}

  Expr evaluate(const Criteria &c, int64_t perspective_id) const {
    switch (c.kind) {
    case NodeKind::And: {
      Expr e = Expr::lit(true);
      for (auto &ch : c.children)
        e = e & evaluate(ch, perspective_id);
      return e;
    }
    case NodeKind::Or: {
      if (c.children.empty())
        return Expr::lit(false);
      Expr e = evaluate(c.children[0], perspective_id);
      for (size_t i = 1; i < c.children.size(); ++i)
        e = e | evaluate(c.children[i], perspective_id);
      return e;
    }
    case NodeKind::Not:
      return !(c.children.empty() ? Expr::lit(true) : evaluate(c.children[0], perspective_id));
    case NodeKind::Leaf:
      return evaluate_leaf(c, perspective_id);
    }
    return Expr::lit(true);
  }

private:
  struct ColumnRef {
    Expr expr;
    ColumnType type;
  };

  ColumnRef column_ref(const std::string &name) const {
    const Column *c = frame_.find(name);
    if (!c)
      throw ConfigError("criteria column not found: " + name);
    return {Expr::col(name), c->type};
  }

  Expr evaluate_leaf(const Criteria &c, int64_t perspective_id) const {
    json value = c.value;
    if (perspective_id != 0 && value.is_string()) {
      std::string s = value.get<std::string>();
      const std::string token = "perspective_id";
      std::string pid = std::to_string(perspective_id);
      size_t pos = 0;
      while ((pos = s.find(token, pos)) != std::string::npos) {
        s.replace(pos, token.size(), pid);
        pos += pid.size();
      }
      value = s;
    }

    ColumnRef col = column_ref(c.column);

    switch (c.op) {
    case Op::In:
    case Op::NotIn: {
      std::vector<json> items;
      if (value.is_object()) {
        auto found = lookup_nested(c.value, perspective_id);
        if (!found) {
          std::cerr << "[Rule] nested criteria on '" << c.column
                    << "' was not precomputed, evaluating as true" << std::endl;
          return Expr::lit(true);
        }
        items = *found;
      } else {
        items = values::parse_list(value);
      }
      Expr in = membership(col, items);
      return c.op == Op::In ? in : !in;
    }
    case Op::IsNull:
      return null_check(col);
    case Op::IsNotNull:
      return !null_check(col);
    case Op::Between:
    case Op::NotBetween: {
      auto range = values::parse_range(value);
      if (!range) {
        std::cerr << "[Rule] malformed range for '" << c.column << "': " << value.dump()
                  << ", using [0,0]" << std::endl;
        range = std::make_pair(json(0), json(0));
      }
      if (c.op == Op::Between)
        return compare(col, Op::Ge, range->first) & compare(col, Op::Le, range->second);
      return compare(col, Op::Lt, range->first) | compare(col, Op::Gt, range->second);
    }
    case Op::Like:
    case Op::NotLike: {
      Expr like = like_expr(col, values::parse_scalar(value));
      return c.op == Op::Like ? like : !like;
    }
    default:
      return compare(col, c.op, values::parse_scalar(value));
    }
  }

  std::optional<std::vector<json>> lookup_nested(const json &nested, int64_t perspective_id) const {
    if (!precomputed_)
      return std::nullopt;
    auto it = precomputed_->find(nested_key(nested, perspective_id));
    if (it == precomputed_->end())
      return std::nullopt;
    return it->second;
  }

  // 数值列里的哨兵值也算 null
  static Expr null_check(const ColumnRef &col) {
    if (col.type == ColumnType::Integer)
      return col.expr.is_null() | col.expr.eq(Expr::lit(INT_NULL));
    if (col.type == ColumnType::Double)
      return col.expr.is_null() | col.expr.eq(Expr::lit(FLOAT_NULL));
    return col.expr.is_null();
  }

  static std::string as_text(const json &v) {
    if (v.is_string())
      return v.get<std::string>();
    if (v.is_boolean())
      return v.get<bool>() ? "true" : "false";
    return v.dump();
  }

  // 按列类型生成字面量; nullopt 表示只能按文本比较
  static std::optional<Expr> typed_literal(ColumnType type, const json &v) {
    if (v.is_null())
      return Expr::raw("NULL");
    switch (type) {
    case ColumnType::Integer:
    case ColumnType::Double:
      if (v.is_number())
        return Expr::lit(v);
      if (v.is_boolean())
        return Expr::lit(static_cast<int64_t>(v.get<bool>() ? 1 : 0));
      if (v.is_string()) {
        std::string s = values::trim(v.get<std::string>());
        if (values::is_integer_literal(s)) {
          try {
            return Expr::lit(static_cast<int64_t>(std::stoll(s)));
          } catch (const std::out_of_range &) {
            return std::nullopt;
          }
        }
        try {
          size_t used = 0;
          double d = std::stod(s, &used);
          if (used == s.size() && !s.empty())
            return Expr::lit(d);
        } catch (const std::exception &) {
          return std::nullopt;
        }
      }
      return std::nullopt;
    case ColumnType::Boolean:
      if (v.is_boolean())
        return Expr::lit(v.get<bool>());
      if (v.is_number())
        return Expr::lit(v.get<double>() != 0.0);
      if (v.is_string()) {
        std::string s = v.get<std::string>();
        for (auto &ch : s)
          ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (s == "true")
          return Expr::lit(true);
        if (s == "false")
          return Expr::lit(false);
      }
      return std::nullopt;
    case ColumnType::Text:
      return Expr::lit(as_text(v));
    case ColumnType::Null:
      return Expr::lit(v);
    }
    return std::nullopt;
  }

  static Expr apply(const Expr &lhs, Op op, const Expr &rhs) {
    switch (op) {
    case Op::Ne:
      return lhs.ne(rhs);
    case Op::Gt:
      return lhs.gt(rhs);
    case Op::Lt:
      return lhs.lt(rhs);
    case Op::Ge:
      return lhs.ge(rhs);
    case Op::Le:
      return lhs.le(rhs);
    default:
      return lhs.eq(rhs);
    }
  }

  static Expr compare(const ColumnRef &col, Op op, const json &v) {
    if (auto lit = typed_literal(col.type, v))
      return apply(col.expr, op, *lit);
    return apply(col.expr.cast("VARCHAR"), op, Expr::lit(as_text(v)));
  }

  static Expr membership(const ColumnRef &col, const std::vector<json> &items) {
    std::vector<Expr> typed;
    typed.reserve(items.size());
    for (auto &item : items) {
      auto lit = typed_literal(col.type, item);
      if (!lit) {
        std::vector<Expr> text;
        for (auto &i : items)
          text.push_back(Expr::lit(as_text(i)));
        return col.expr.cast("VARCHAR").is_in(text);
      }
      typed.push_back(*lit);
    }
    return col.expr.is_in(typed);
  }

  static Expr like_expr(const ColumnRef &col, const json &v) {
    std::string pattern = as_text(v);
    std::string lowered = pattern;
    for (auto &ch : lowered)
      ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    Expr text = (col.type == ColumnType::Text ? col.expr : col.expr.cast("VARCHAR")).lower();
    bool lead = !pattern.empty() && pattern.front() == '%';
    bool trail = !pattern.empty() && pattern.back() == '%';

    if (lead && trail) {
      std::string inner = lowered.size() >= 2 ? lowered.substr(1, lowered.size() - 2) : "";
      return text.contains(Expr::lit(inner));
    }
    if (trail)
      return text.starts_with(Expr::lit(lowered.substr(0, lowered.size() - 1)));
    if (lead)
      return text.ends_with(Expr::lit(lowered.substr(1)));
    return text.eq(Expr::lit(lowered));
  }

  const LazyFrame &frame_;
  const PrecomputedValues *precomputed_;
};

} // namespace perspective
