#pragma once

// ============================================================================
// LazyFrame - 延迟执行的关系
//
// 每个操作只是在外面再包一层 SELECT, collect() 是唯一真正跑 DuckDB 的地方.
// 列类型跟着 frame 走, criteria 编译时需要按列类型决定字面量怎么写.
// ============================================================================

#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "expr.hpp"

#include <duckdb.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace perspective {

enum class ColumnType { Null, Boolean, Integer, Double, Text };

inline const char *sql_type_name(ColumnType t) {
  switch (t) {
  case ColumnType::Boolean:
    return "BOOLEAN";
  case ColumnType::Integer:
    return "BIGINT";
  case ColumnType::Double:
    return "DOUBLE";
  case ColumnType::Text:
    return "VARCHAR";
  case ColumnType::Null:
    break;
  }
  return "NULL";
}

inline bool is_numeric(ColumnType t) { return t == ColumnType::Integer || t == ColumnType::Double; }

struct Column {
  std::string name;
  ColumnType type = ColumnType::Null;
};

struct NamedExpr {
  std::string name;
  Expr expr;
  ColumnType type = ColumnType::Null;
};

// ============================================================================
// ResultTable - collect() 的物化结果, 单元格统一转成 json
// ============================================================================
struct ResultTable {
  std::vector<std::string> names;
  std::vector<std::vector<json>> rows;

  int index_of(const std::string &name) const {
    for (size_t i = 0; i < names.size(); ++i) {
      if (names[i] == name)
        return static_cast<int>(i);
    }
    return -1;
  }
  size_t size() const { return rows.size(); }
  bool empty() const { return rows.empty(); }
};

class LazyFrame {
public:
  LazyFrame() = default;

  // Null 列不进物理表, 扫描时投影成无类型 NULL
  static LazyFrame scan(const std::string &table, std::vector<Column> columns) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0)
        sql += ", ";
      if (columns[i].type == ColumnType::Null)
        sql += "NULL AS " + quote_ident(columns[i].name);
      else
        sql += quote_ident(columns[i].name);
    }
    if (columns.empty())
      sql += "*";
    sql += " FROM " + quote_ident(table);
    return LazyFrame(std::move(sql), std::move(columns));
  }

  static LazyFrame from_sql(std::string sql, std::vector<Column> columns) {
    return LazyFrame(std::move(sql), std::move(columns));
  }

  const std::string &sql() const { return sql_; }
  const std::vector<Column> &columns() const { return columns_; }

  bool has(const std::string &name) const { return find(name) != nullptr; }

  const Column *find(const std::string &name) const {
    for (auto &c : columns_) {
      if (c.name == name)
        return &c;
    }
    return nullptr;
  }

  ColumnType type_of(const std::string &name) const {
    auto *c = find(name);
    return c ? c->type : ColumnType::Null;
  }

  // 同名列原地替换, 新列追加在末尾
  LazyFrame with_columns(const std::vector<NamedExpr> &exprs) const {
    if (exprs.empty())
      return *this;

    // 同一批里重复的名字以最后一个为准
    std::vector<std::string> order;
    std::unordered_map<std::string, const NamedExpr *> last;
    for (auto &e : exprs) {
      if (last.find(e.name) == last.end())
        order.push_back(e.name);
      last[e.name] = &e;
    }

    std::vector<Column> cols = columns_;
    std::string repl;
    std::string appended;
    for (auto &name : order) {
      const NamedExpr *e = last[name];
      bool exists = false;
      for (auto &c : cols) {
        if (c.name == name) {
          c.type = e->type;
          exists = true;
          break;
        }
      }
      if (exists) {
        if (!repl.empty())
          repl += ", ";
        repl += e->expr.sql() + " AS " + quote_ident(name);
      } else {
        cols.push_back({name, e->type});
        appended += ", " + e->expr.sql() + " AS " + quote_ident(name);
      }
    }

    std::string sel = "SELECT *";
    if (!repl.empty())
      sel += " REPLACE (" + repl + ")";
    sel += appended;

    return LazyFrame(sel + " FROM (" + sql_ + ") AS t", std::move(cols));
  }

  LazyFrame filter(const Expr &pred) const {
    if (pred.is_true())
      return *this;
    return LazyFrame("SELECT * FROM (" + sql_ + ") AS t WHERE " + pred.sql(), columns_);
  }

  LazyFrame select(const std::vector<NamedExpr> &exprs) const {
    std::string sel = "SELECT ";
    std::vector<Column> cols;
    for (size_t i = 0; i < exprs.size(); ++i) {
      if (i > 0)
        sel += ", ";
      sel += exprs[i].expr.sql() + " AS " + quote_ident(exprs[i].name);
      cols.push_back({exprs[i].name, exprs[i].type});
    }
    return LazyFrame(sel + " FROM (" + sql_ + ") AS t", std::move(cols));
  }

  LazyFrame select_columns(const std::vector<std::string> &names) const {
    std::vector<NamedExpr> exprs;
    for (auto &n : names)
      exprs.push_back({n, Expr::col(n), type_of(n)});
    return select(exprs);
  }

  LazyFrame distinct() const {
    return LazyFrame("SELECT DISTINCT * FROM (" + sql_ + ") AS t", columns_);
  }

  // 每个 key 组合只留一行
  LazyFrame distinct_on(const std::vector<std::string> &keys) const {
    std::string k;
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0)
        k += ", ";
      k += quote_ident(keys[i]);
    }
    return LazyFrame("SELECT DISTINCT ON (" + k + ") * FROM (" + sql_ + ") AS t", columns_);
  }

  LazyFrame group_by(const std::vector<std::string> &keys, const std::vector<NamedExpr> &aggs) const {
    std::string sel = "SELECT ";
    std::string grp;
    std::vector<Column> cols;
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0) {
        sel += ", ";
        grp += ", ";
      }
      sel += quote_ident(keys[i]);
      grp += quote_ident(keys[i]);
      cols.push_back({keys[i], type_of(keys[i])});
    }
    for (auto &a : aggs) {
      if (!cols.empty())
        sel += ", ";
      sel += a.expr.sql() + " AS " + quote_ident(a.name);
      cols.push_back({a.name, a.type});
    }
    std::string sql = sel + " FROM (" + sql_ + ") AS t";
    if (!grp.empty())
      sql += " GROUP BY " + grp;
    return LazyFrame(std::move(sql), std::move(cols));
  }

  // 按列名对齐拼接, 列集合以左侧为准
  LazyFrame union_all(const LazyFrame &other) const {
    return LazyFrame("(SELECT * FROM (" + sql_ + ") AS a) UNION ALL BY NAME (SELECT * FROM (" + other.sql_ + ") AS b)",
                     columns_);
  }

  // 右侧与左侧重名的列丢弃 (左侧优先), 右侧 key 列不带出
  // key 类型不一致时两侧都转 VARCHAR 比较
  LazyFrame left_join(const LazyFrame &right,
                      const std::vector<std::pair<std::string, std::string>> &on) const {
    std::vector<Column> cols = columns_;
    std::string sel = "SELECT l.*";
    for (auto &c : right.columns_) {
      bool is_key = false;
      for (auto &[lk, rk] : on) {
        if (rk == c.name)
          is_key = true;
      }
      if (is_key || has(c.name))
        continue;
      sel += ", r." + quote_ident(c.name);
      cols.push_back(c);
    }

    std::string cond;
    for (auto &[lk, rk] : on) {
      if (!cond.empty())
        cond += " AND ";
      ColumnType lt = type_of(lk);
      ColumnType rt = right.type_of(rk);
      std::string l = "l." + quote_ident(lk);
      std::string r = "r." + quote_ident(rk);
      if (lt != rt && !(is_numeric(lt) && is_numeric(rt))) {
        l = "CAST(" + l + " AS VARCHAR)";
        r = "CAST(" + r + " AS VARCHAR)";
      }
      cond += l + " = " + r;
    }
    if (cond.empty())
      cond = "TRUE";

    return LazyFrame(sel + " FROM (" + sql_ + ") AS l LEFT JOIN (" + right.sql_ + ") AS r ON " + cond,
                     std::move(cols));
  }

private:
  LazyFrame(std::string sql, std::vector<Column> columns)
      : sql_(std::move(sql)), columns_(std::move(columns)) {}

  std::string sql_;
  std::vector<Column> columns_;
};

inline ResultTable to_result_table(duckdb::MaterializedQueryResult &result) {
  ResultTable table;
  table.names = result.names;
  auto &types = result.types;
  table.rows.reserve(result.RowCount());
  for (size_t row = 0; row < result.RowCount(); ++row) {
    std::vector<json> cells;
    cells.reserve(result.ColumnCount());
    for (size_t col = 0; col < result.ColumnCount(); ++col)
      cells.push_back(duckdb_value_to_json(result.GetValue(col, row), types[col]));
    table.rows.push_back(std::move(cells));
  }
  return table;
}

// 唯一的执行点
inline ResultTable collect(duckdb::Connection &conn, const LazyFrame &frame) {
  auto result = conn.Query(frame.sql());
  if (result->HasError())
    throw PlanError("collect failed: " + result->GetError());
  return to_result_table(*result);
}

} // namespace perspective
