#pragma once

// ============================================================================
// ReferenceLoader - 参考表拉取
//
// 每张表一个 std::async 任务, 各自一个 DuckDB 连接; 全部完成后按表名汇总.
// 任一任务失败, 整个请求失败.
// ============================================================================

#include "../core/constants.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../perspective/expr.hpp"
#include "../perspective/lazy_frame.hpp"
#include "../perspective/model.hpp"

#include <cstdint>
#include <duckdb.hpp>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loaders {

struct ReferenceQuery {
  std::vector<int64_t> instrument_ids;
  std::vector<int64_t> parent_instrument_ids;
  std::string ed = perspective::DEFAULT_EFFECTIVE_DATE;
  std::optional<std::string> system_version_timestamp;
};

// PARENT_INSTRUMENT 的结果已经改名: instrument_id → parent_instrument_id, c → parent_c
using ReferenceTables = std::map<std::string, perspective::ResultTable>;

class ReferenceLoader {
public:
  virtual ~ReferenceLoader() = default;
  virtual ReferenceTables load(const perspective::RequiredColumns &tables, const ReferenceQuery &query) = 0;
};

class DatabaseReferenceLoader : public ReferenceLoader {
public:
  explicit DatabaseReferenceLoader(Database &db) : db_(db) {}

  ReferenceTables load(const perspective::RequiredColumns &tables, const ReferenceQuery &query) override {
    struct Task {
      std::string table;
      std::unique_ptr<duckdb::Connection> conn;
      std::future<perspective::ResultTable> result;
    };

    std::vector<Task> tasks;
    ReferenceTables out;
    for (auto &[table, columns] : tables.tables()) {
      if (table == perspective::POSITION_DATA_TABLE)
        continue;
      std::optional<std::string> sql = build_query(table, columns, query);
      if (!sql) {
        out[table] = empty_result(table, columns);
        continue;
      }
      Task t;
      t.table = table;
      t.conn = std::make_unique<duckdb::Connection>(db_.get_duckdb());
      duckdb::Connection *conn = t.conn.get();
      std::string name = table;
      t.result = std::async(std::launch::async, [conn, name, text = *sql]() {
        auto r = conn->Query(text);
        if (r->HasError())
          throw perspective::ReferenceLoadError("failed to load " + name + ": " + r->GetError());
        return perspective::to_result_table(*r);
      });
      tasks.push_back(std::move(t));
    }

    // 先等全部结束再抛, 避免连接在任务运行中被析构
    std::optional<perspective::ReferenceLoadError> failure;
    for (auto &t : tasks) {
      try {
        out[t.table] = t.result.get();
        std::cout << "[Reference] " << t.table << ": " << out[t.table].size() << " rows" << std::endl;
      } catch (const perspective::ReferenceLoadError &e) {
        if (!failure)
          failure = e;
      } catch (const std::exception &e) {
        if (!failure)
          failure = perspective::ReferenceLoadError("failed to load " + t.table + ": " + e.what());
      }
    }
    if (failure)
      throw *failure;
    return out;
  }

private:
  static std::vector<std::string> value_columns(const std::vector<std::string> &columns) {
    std::vector<std::string> out;
    for (auto &c : columns) {
      if (c != "instrument_id")
        out.push_back(c);
    }
    return out;
  }

  static perspective::ResultTable empty_result(const std::string &table, const std::vector<std::string> &columns) {
    perspective::ResultTable r;
    bool parent = table == perspective::PARENT_INSTRUMENT_TABLE;
    r.names.push_back(parent ? "parent_instrument_id" : "instrument_id");
    for (auto &c : value_columns(columns))
      r.names.push_back(parent ? "parent_" + c : c);
    return r;
  }

  static std::optional<std::string> build_query(const std::string &table, const std::vector<std::string> &columns,
                                                const ReferenceQuery &query) {
    using perspective::quote_ident;
    auto cols = value_columns(columns);

    if (table == perspective::PARENT_INSTRUMENT_TABLE) {
      std::vector<int64_t> ids;
      for (auto id : query.parent_instrument_ids) {
        if (id != perspective::INT_NULL)
          ids.push_back(id);
      }
      if (ids.empty())
        return std::nullopt;
      std::string sql = "SELECT instrument_id AS parent_instrument_id";
      for (auto &c : cols)
        sql += ", " + quote_ident(c) + " AS " + quote_ident("parent_" + c);
      return sql + " FROM " + quote_ident(perspective::INSTRUMENT_TABLE) +
             " WHERE instrument_id IN (" + reference::join_ids(ids) + ")";
    }

    if (query.instrument_ids.empty())
      return std::nullopt;

    std::string sql = "SELECT instrument_id";
    for (auto &c : cols)
      sql += ", " + quote_ident(c);
    sql += " FROM " + quote_ident(table) + " WHERE instrument_id IN (" + reference::join_ids(query.instrument_ids) + ")";

    if (table == perspective::INSTRUMENT_CATEGORIZATION_TABLE) {
      if (!query.ed.empty())
        sql += " AND ED = CAST(" + reference::escape_sql(query.ed) + " AS DATE)";
      if (query.system_version_timestamp) {
        std::string ts = "CAST(" + reference::escape_sql(*query.system_version_timestamp) + " AS TIMESTAMP)";
        sql += " AND valid_from <= " + ts + " AND (valid_to IS NULL OR valid_to > " + ts + ")";
      } else {
        sql += " AND valid_to IS NULL";
      }
    }
    return sql;
  }

  Database &db_;
};

} // namespace loaders
