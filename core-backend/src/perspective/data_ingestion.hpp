#pragma once

// ============================================================================
// DataIngestion - 请求 JSON → positions / lookthroughs 两张关系
//
// 1. extract_records()   容器里的 positions 与 *lookthrough* 展平成行
// 2. build_frames()      推断类型, 建临时表, 批量 INSERT
// 3. standardize / fill  instrument_id, sub_portfolio_id, perspective_id, 哨兵填充
// 4. join_reference()    参考表落临时表后 LEFT JOIN (输入列优先)
// 5. ensure_declared_columns() 补齐声明过但仍缺的 position_data / 参考列
// ============================================================================

#include "../core/constants.hpp"
#include "../core/reference_schema.hpp"
#include "../loaders/reference_loader.hpp"
#include "expr.hpp"
#include "lazy_frame.hpp"
#include "model.hpp"

#include <algorithm>
#include <cstdint>
#include <duckdb.hpp>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

// ============================================================================
// Tuning parameters
// ============================================================================
#define PERSPECTIVE_INSERT_BATCH 2000 // Rows per INSERT statement

namespace perspective {

struct Records {
  std::vector<json> positions;
  std::vector<json> lookthroughs;
};

struct Frames {
  LazyFrame positions;
  std::optional<LazyFrame> lookthroughs;
};

// 参考表查询用到的 id
struct InstrumentIds {
  std::vector<int64_t> instrument_ids;
  std::vector<int64_t> parent_instrument_ids;
};

// ============================================================================
// 记录抽取
// ============================================================================

inline Records extract_records(const json &request) {
  Records out;
  if (!request.is_object())
    return out;

  for (auto &[container, data] : request.items()) {
    if (!data.is_object() || !data.contains("position_type"))
      continue;

    auto tag = [&](const json &attrs, const std::string &id, const std::string &record_type) {
      json row = attrs.is_object() ? attrs : json::object();
      row["container"] = container;
      row["position_type"] = data["position_type"];
      row["identifier"] = id;
      row["record_type"] = record_type;
      return row;
    };

    if (data.contains("positions") && data["positions"].is_object()) {
      for (auto &[id, attrs] : data["positions"].items())
        out.positions.push_back(tag(attrs, id, POSITION_RECORD_TYPE));
    }
    for (auto &[key, block] : data.items()) {
      if (key.find("lookthrough") == std::string::npos || !block.is_object())
        continue;
      for (auto &[id, attrs] : block.items())
        out.lookthroughs.push_back(tag(attrs, id, key));
    }
  }
  return out;
}

inline std::optional<int64_t> as_int64(const json &v) {
  if (v.is_number_integer())
    return v.get<int64_t>();
  if (v.is_number_unsigned() && v.get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX))
    return static_cast<int64_t>(v.get<uint64_t>());
  if (v.is_string()) {
    std::string s = v.get<std::string>();
    try {
      size_t used = 0;
      long long n = std::stoll(s, &used);
      if (used == s.size())
        return n;
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

inline InstrumentIds collect_instrument_ids(const Records &records) {
  std::set<int64_t> ids;
  std::set<int64_t> parents;
  auto visit = [&](const json &row) {
    const char *id_key = row.contains("instrument_identifier") ? "instrument_identifier" : "instrument_id";
    if (row.contains(id_key)) {
      if (auto id = as_int64(row[id_key]))
        ids.insert(*id);
    }
    if (row.contains("parent_instrument_id")) {
      auto pid = as_int64(row["parent_instrument_id"]);
      if (pid && *pid != INT_NULL)
        parents.insert(*pid);
    }
  };
  for (auto &r : records.positions)
    visit(r);
  for (auto &r : records.lookthroughs)
    visit(r);
  return {std::vector<int64_t>(ids.begin(), ids.end()), std::vector<int64_t>(parents.begin(), parents.end())};
}

// ============================================================================
// 类型推断: 只有整数 → Integer, 出现小数 → Double, 只有布尔 → Boolean,
// 其它混合 → Text, 全空 → Null
// ============================================================================

inline ColumnType infer_type(const std::vector<const json *> &values) {
  bool any_int = false, any_float = false, any_bool = false, any_other = false;
  for (auto *v : values) {
    if (!v || v->is_null())
      continue;
    if (v->is_boolean())
      any_bool = true;
    else if (v->is_number_integer() || v->is_number_unsigned())
      any_int = true;
    else if (v->is_number_float())
      any_float = true;
    else
      any_other = true;
  }
  if (any_other || (any_bool && (any_int || any_float)))
    return ColumnType::Text;
  if (any_bool)
    return ColumnType::Boolean;
  if (any_float)
    return ColumnType::Double;
  if (any_int)
    return ColumnType::Integer;
  return ColumnType::Null;
}

inline std::vector<Column> infer_schema(const std::vector<json> &rows) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<const json *>> values;
  for (auto &row : rows) {
    for (auto &[k, v] : row.items()) {
      auto it = values.find(k);
      if (it == values.end()) {
        order.push_back(k);
        it = values.emplace(k, std::vector<const json *>{}).first;
      }
      it->second.push_back(&v);
    }
  }
  std::vector<Column> cols;
  cols.reserve(order.size());
  for (auto &name : order)
    cols.push_back({name, infer_type(values[name])});
  return cols;
}

inline std::string sql_literal(const json &v, ColumnType type) {
  if (v.is_null())
    return "NULL";
  switch (type) {
  case ColumnType::Integer:
    return v.dump();
  case ColumnType::Double:
    return "CAST(" + format_double(v.get<double>()) + " AS DOUBLE)";
  case ColumnType::Boolean:
    return v.get<bool>() ? "TRUE" : "FALSE";
  case ColumnType::Text:
    return reference::escape_sql(v.is_string() ? v.get<std::string>() : v.dump());
  case ColumnType::Null:
    break;
  }
  return "NULL";
}

// 建临时表并批量写入, Null 列不落表
inline void materialize(duckdb::Connection &conn, const std::string &table, const std::vector<Column> &columns,
                        const std::vector<std::vector<const json *>> &rows, size_t batch_rows) {
  std::string ddl = "CREATE OR REPLACE TEMP TABLE " + quote_ident(table) + " (";
  std::string names;
  std::vector<size_t> physical;
  for (size_t i = 0; i < columns.size(); ++i) {
    if (columns[i].type == ColumnType::Null)
      continue;
    if (!physical.empty()) {
      ddl += ", ";
      names += ", ";
    }
    ddl += quote_ident(columns[i].name) + " " + sql_type_name(columns[i].type);
    names += quote_ident(columns[i].name);
    physical.push_back(i);
  }
  if (physical.empty()) {
    ddl += "_placeholder INTEGER";
  }
  ddl += ")";

  auto r = conn.Query(ddl);
  if (r->HasError())
    throw PlanError("create " + table + ": " + r->GetError());
  if (physical.empty() || rows.empty())
    return;

  if (batch_rows == 0)
    batch_rows = PERSPECTIVE_INSERT_BATCH;
  for (size_t start = 0; start < rows.size(); start += batch_rows) {
    size_t end = std::min(rows.size(), start + batch_rows);
    std::string sql = "INSERT INTO " + quote_ident(table) + " (" + names + ") VALUES ";
    for (size_t row = start; row < end; ++row) {
      if (row > start)
        sql += ", ";
      sql += "(";
      for (size_t k = 0; k < physical.size(); ++k) {
        if (k > 0)
          sql += ", ";
        const json *v = rows[row][physical[k]];
        sql += v ? sql_literal(*v, columns[physical[k]].type) : "NULL";
      }
      sql += ")";
    }
    auto ins = conn.Query(sql);
    if (ins->HasError())
      throw PlanError("insert " + table + ": " + ins->GetError());
  }
}

// json 对象行 → 临时表 → LazyFrame
inline LazyFrame frame_from_records(duckdb::Connection &conn, const std::string &table, const std::vector<json> &rows,
                                    size_t batch_rows) {
  auto columns = infer_schema(rows);
  std::vector<std::vector<const json *>> cells;
  cells.reserve(rows.size());
  for (auto &row : rows) {
    std::vector<const json *> line(columns.size(), nullptr);
    for (size_t i = 0; i < columns.size(); ++i) {
      auto it = row.find(columns[i].name);
      if (it != row.end())
        line[i] = &*it;
    }
    cells.push_back(std::move(line));
  }
  materialize(conn, table, columns, cells, batch_rows);
  return LazyFrame::scan(table, std::move(columns));
}

// ResultTable → 临时表 → LazyFrame
inline LazyFrame frame_from_table(duckdb::Connection &conn, const std::string &table, const ResultTable &data,
                                  size_t batch_rows) {
  std::vector<Column> columns;
  for (size_t c = 0; c < data.names.size(); ++c) {
    std::vector<const json *> values;
    values.reserve(data.rows.size());
    for (auto &row : data.rows)
      values.push_back(&row[c]);
    columns.push_back({data.names[c], infer_type(values)});
  }
  std::vector<std::vector<const json *>> cells;
  cells.reserve(data.rows.size());
  for (auto &row : data.rows) {
    std::vector<const json *> line;
    line.reserve(row.size());
    for (auto &v : row)
      line.push_back(&v);
    cells.push_back(std::move(line));
  }
  materialize(conn, table, columns, cells, batch_rows);
  return LazyFrame::scan(table, std::move(columns));
}

// ============================================================================
// 标准化与哨兵填充
// ============================================================================

inline LazyFrame standardize(const LazyFrame &lf) {
  std::vector<NamedExpr> exprs;
  if (lf.has("instrument_identifier"))
    exprs.push_back({"instrument_id", Expr::col("instrument_identifier"), lf.type_of("instrument_identifier")});

  if (lf.has("sub_portfolio_id"))
    exprs.push_back({"sub_portfolio_id",
                     Expr::coalesce(Expr::col("sub_portfolio_id").cast("VARCHAR"), Expr::lit(DEFAULT_SUB_PORTFOLIO)),
                     ColumnType::Text});
  else
    exprs.push_back({"sub_portfolio_id", Expr::lit(DEFAULT_SUB_PORTFOLIO), ColumnType::Text});

  // exclude_perspective_level_simulated_cash 会和它比较
  if (!lf.has("perspective_id"))
    exprs.push_back({"perspective_id", Expr::lit(INT_NULL), ColumnType::Integer});

  return lf.with_columns(exprs);
}

// modifier / perspective 声明但输入里没有的 position_data 列
inline LazyFrame ensure_columns(const LazyFrame &lf, const std::vector<std::string> &columns) {
  std::vector<NamedExpr> exprs;
  for (auto &c : columns) {
    if (!lf.has(c))
      exprs.push_back({c, Expr::lit(INT_NULL), ColumnType::Integer});
  }
  return lf.with_columns(exprs);
}

inline LazyFrame fill_null_values(const LazyFrame &lf, const std::vector<std::string> &weight_labels) {
  std::vector<NamedExpr> exprs;
  for (auto &c : lf.columns()) {
    if (std::find(weight_labels.begin(), weight_labels.end(), c.name) != weight_labels.end())
      continue;
    if (c.type == ColumnType::Integer)
      exprs.push_back({c.name, Expr::coalesce(Expr::col(c.name), Expr::lit(INT_NULL)), ColumnType::Integer});
    else if (c.type == ColumnType::Double)
      exprs.push_back({c.name, Expr::coalesce(Expr::col(c.name), Expr::lit(FLOAT_NULL)), ColumnType::Double});
  }
  return lf.with_columns(exprs);
}

// ============================================================================
// DataIngestion
// ============================================================================

class DataIngestion {
public:
  DataIngestion(duckdb::Connection &conn, size_t batch_rows = PERSPECTIVE_INSERT_BATCH)
      : conn_(conn), batch_rows_(batch_rows) {}

  // positions 为空时返回 nullopt
  std::optional<Frames> build_frames(const Records &records, const std::vector<std::string> &weight_labels) {
    if (records.positions.empty())
      return std::nullopt;

    auto prepare = [&](const std::string &table, const std::vector<json> &rows) {
      LazyFrame lf = frame_from_records(conn_, table, rows, batch_rows_);
      lf = standardize(lf);
      return fill_null_values(lf, weight_labels);
    };

    Frames frames;
    frames.positions = prepare("positions", records.positions);
    if (!records.lookthroughs.empty())
      frames.lookthroughs = prepare("lookthroughs", records.lookthroughs);

    std::cout << "[Ingest] " << records.positions.size() << " positions, " << records.lookthroughs.size()
              << " lookthroughs, " << frames.positions.columns().size() << " columns" << std::endl;
    return frames;
  }

  // PARENT_INSTRUMENT 按 parent_instrument_id 关联, 其它按 instrument_id
  Frames join_reference(Frames frames, const loaders::ReferenceTables &tables) {
    for (auto &[table, data] : tables) {
      if (data.empty())
        continue;
      bool parent = table == PARENT_INSTRUMENT_TABLE;
      std::string key = parent ? "parent_instrument_id" : "instrument_id";
      if (std::find(data.names.begin(), data.names.end(), key) == data.names.end())
        continue;

      LazyFrame ref = frame_from_table(conn_, "ref_" + table, data, batch_rows_).distinct_on({key});
      auto join = [&](const LazyFrame &lf) {
        if (!lf.has(key))
          return lf;
        return lf.left_join(ref, {{key, key}});
      };
      frames.positions = join(frames.positions);
      if (frames.lookthroughs)
        frames.lookthroughs = join(*frames.lookthroughs);
      std::cout << "[Ingest] joined " << table << " (" << data.size() << " rows)" << std::endl;
    }
    return frames;
  }

  // 声明过的 position_data / 参考列, 在 join 之后补成 INT_NULL 占位列
  // (参考表为空时 join 被跳过, 列也要存在); 提前补会挡住同名的参考列
  static Frames ensure_declared_columns(Frames frames, const std::vector<std::string> &columns) {
    frames.positions = ensure_columns(frames.positions, columns);
    if (frames.lookthroughs)
      frames.lookthroughs = ensure_columns(*frames.lookthroughs, columns);
    return frames;
  }

private:
  duckdb::Connection &conn_;
  size_t batch_rows_;
};

// 需要加载的参考表: position_data 之外有任何表时, INSTRUMENT_CATEGORIZATION 的基础列总会带上
inline RequiredColumns reference_tables_to_load(const RequiredColumns &required) {
  RequiredColumns out;
  bool any = false;
  for (auto &[table, cols] : required.tables()) {
    if (table == POSITION_DATA_TABLE)
      continue;
    any = true;
    for (auto &c : cols)
      out.add(table, c);
  }
  if (any) {
    for (auto &c : reference::CATEGORIZATION_BASE_COLUMNS)
      out.add(INSTRUMENT_CATEGORIZATION_TABLE, c);
  }
  return out;
}

} // namespace perspective
