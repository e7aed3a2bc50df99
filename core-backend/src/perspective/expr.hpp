#pragma once

// ============================================================================
// Expr - DuckDB SQL 表达式片段
//
// 只拼字符串, 不执行. 所有 keep/scale/rescale 逻辑都先拼成 Expr,
// 最后挂到 LazyFrame 上一次性 collect.
// ============================================================================

#include <cstdint>
#include <iomanip>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace perspective {

inline std::string quote_ident(const std::string &name) {
  std::string r = "\"";
  for (char c : name) {
    if (c == '"')
      r += "\"\"";
    else
      r += c;
  }
  r += "\"";
  return r;
}

inline std::string quote_str(const std::string &s) {
  std::string r = "'";
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  r += "'";
  return r;
}

// Round-trip precision, no locale
inline std::string format_double(double v) {
  std::ostringstream os;
  os.imbue(std::locale::classic());
  os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return os.str();
}

class Expr {
public:
  Expr() : sql_("TRUE") {}

  static Expr raw(std::string sql) { return Expr(std::move(sql)); }

  static Expr lit(bool v) { return Expr(v ? "TRUE" : "FALSE"); }
  static Expr lit(int v) { return Expr(std::to_string(v)); }
  static Expr lit(int64_t v) { return Expr(std::to_string(v)); }
  // DuckDB 把 1.0 解析成 DECIMAL, 必须显式 DOUBLE
  static Expr lit(double v) { return Expr("CAST(" + format_double(v) + " AS DOUBLE)"); }
  static Expr lit(const std::string &v) { return Expr(quote_str(v)); }
  static Expr lit(const char *v) { return Expr(quote_str(v)); }

  static Expr lit(const json &v) {
    if (v.is_null())
      return Expr("NULL");
    if (v.is_boolean())
      return lit(v.get<bool>());
    if (v.is_number_unsigned()) {
      uint64_t u = v.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        return Expr(std::to_string(u));
      return lit(static_cast<int64_t>(u));
    }
    if (v.is_number_integer())
      return lit(v.get<int64_t>());
    if (v.is_number_float())
      return lit(v.get<double>());
    if (v.is_string())
      return lit(v.get<std::string>());
    return lit(v.dump());
  }

  static Expr null_double() { return Expr("CAST(NULL AS DOUBLE)"); }

  static Expr col(const std::string &name) { return Expr(quote_ident(name)); }

  static Expr when(const Expr &cond, const Expr &then, const Expr &otherwise) {
    return Expr("(CASE WHEN " + cond.sql_ + " THEN " + then.sql_ + " ELSE " + otherwise.sql_ + " END)");
  }

  static Expr coalesce(const Expr &a, const Expr &b) {
    return Expr("COALESCE(" + a.sql_ + ", " + b.sql_ + ")");
  }

  // SUM(x) OVER (PARTITION BY ...)
  static Expr window_sum(const Expr &x, const std::vector<std::string> &partition) {
    std::string s = "SUM(" + x.sql_ + ") OVER (PARTITION BY ";
    for (size_t i = 0; i < partition.size(); ++i) {
      if (i > 0)
        s += ", ";
      s += quote_ident(partition[i]);
    }
    s += ")";
    return Expr(s);
  }

  // Boolean algebra. TRUE is the identity of AND and is folded away.
  Expr operator&(const Expr &o) const {
    if (is_true())
      return o;
    if (o.is_true())
      return *this;
    return Expr("(" + sql_ + " AND " + o.sql_ + ")");
  }
  Expr operator|(const Expr &o) const {
    if (is_false())
      return o;
    if (o.is_false())
      return *this;
    return Expr("(" + sql_ + " OR " + o.sql_ + ")");
  }
  Expr operator!() const { return Expr("(NOT " + sql_ + ")"); }

  Expr eq(const Expr &o) const { return binary("=", o); }
  Expr ne(const Expr &o) const { return binary("<>", o); }
  Expr gt(const Expr &o) const { return binary(">", o); }
  Expr lt(const Expr &o) const { return binary("<", o); }
  Expr ge(const Expr &o) const { return binary(">=", o); }
  Expr le(const Expr &o) const { return binary("<=", o); }

  Expr operator*(const Expr &o) const { return binary("*", o); }
  Expr operator/(const Expr &o) const { return binary("/", o); }
  Expr operator+(const Expr &o) const { return binary("+", o); }

  Expr is_in(const std::vector<Expr> &values) const {
    if (values.empty())
      return lit(false);
    std::string s = "(" + sql_ + " IN (";
    for (size_t i = 0; i < values.size(); ++i) {
      if (i > 0)
        s += ", ";
      s += values[i].sql_;
    }
    s += "))";
    return Expr(s);
  }

  Expr is_null() const { return Expr("(" + sql_ + " IS NULL)"); }
  Expr is_not_null() const { return Expr("(" + sql_ + " IS NOT NULL)"); }

  Expr lower() const { return Expr("lower(" + sql_ + ")"); }
  Expr contains(const Expr &needle) const { return call2("contains", needle); }
  Expr starts_with(const Expr &prefix) const { return call2("starts_with", prefix); }
  Expr ends_with(const Expr &suffix) const { return call2("ends_with", suffix); }

  Expr sum() const { return Expr("SUM(" + sql_ + ")"); }
  Expr max() const { return Expr("MAX(" + sql_ + ")"); }
  Expr cast(const std::string &type) const { return Expr("CAST(" + sql_ + " AS " + type + ")"); }

  const std::string &sql() const { return sql_; }
  bool is_true() const { return sql_ == "TRUE"; }
  bool is_false() const { return sql_ == "FALSE"; }

private:
  explicit Expr(std::string sql) : sql_(std::move(sql)) {}

  Expr binary(const char *op, const Expr &o) const {
    return Expr("(" + sql_ + " " + op + " " + o.sql_ + ")");
  }
  Expr call2(const char *fn, const Expr &arg) const {
    return Expr(std::string(fn) + "(" + sql_ + ", " + arg.sql_ + ")");
  }

  std::string sql_;
};

} // namespace perspective
