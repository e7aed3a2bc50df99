#pragma once

#include "reference_schema.hpp"
#include <cstdint>
#include <duckdb.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// DuckDB Value → json, 按列的逻辑类型分派
inline json duckdb_value_to_json(const duckdb::Value &value, const duckdb::LogicalType &type) {
  if (value.IsNull())
    return nullptr;
  switch (type.id()) {
  case duckdb::LogicalTypeId::BOOLEAN:
    return value.GetValue<bool>();
  case duckdb::LogicalTypeId::TINYINT:
  case duckdb::LogicalTypeId::SMALLINT:
  case duckdb::LogicalTypeId::INTEGER:
    return value.GetValue<int32_t>();
  case duckdb::LogicalTypeId::BIGINT:
  case duckdb::LogicalTypeId::UTINYINT:
  case duckdb::LogicalTypeId::USMALLINT:
  case duckdb::LogicalTypeId::UINTEGER:
    return value.GetValue<int64_t>();
  case duckdb::LogicalTypeId::UBIGINT:
    return value.GetValue<uint64_t>();
  case duckdb::LogicalTypeId::HUGEINT: {
    // 超出 int64 的按文本输出
    auto h = value.GetValue<duckdb::hugeint_t>();
    bool fits = (h.upper == 0 && h.lower <= static_cast<uint64_t>(INT64_MAX)) ||
                (h.upper == -1 && h.lower > static_cast<uint64_t>(INT64_MAX));
    if (fits)
      return value.GetValue<int64_t>();
    return value.ToString();
  }
  case duckdb::LogicalTypeId::FLOAT:
  case duckdb::LogicalTypeId::DOUBLE:
  case duckdb::LogicalTypeId::DECIMAL:
    return value.GetValue<double>();
  default:
    return value.ToString();
  }
}

class Database {
public:
  // 空路径 = 内存库
  explicit Database(const std::string &path) {
    db_ = path.empty() ? std::make_unique<duckdb::DuckDB>(nullptr) : std::make_unique<duckdb::DuckDB>(path);
    conn_ = std::make_unique<duckdb::Connection>(*db_);
    read_conn_ = std::make_unique<duckdb::Connection>(*db_);
  }

  // 表初始化
  void init_reference_store(const std::string &perspectives_table) {
    execute(reference::INSTRUMENT_DDL);
    execute(reference::INSTRUMENT_CATEGORIZATION_DDL);
    if (!perspectives_table.empty())
      execute(reference::perspective_documents_ddl(perspectives_table));
  }

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("execute failed: " + result->GetError());
  }

  // 批量插入, rows 里每个元素是已经转义好的 "(v1, v2, ...)" 内容
  void batch_insert(const std::string &table, const std::string &columns,
                    const std::vector<std::string> &values_list) {
    if (values_list.empty())
      return;
    std::string sql = "INSERT INTO " + table + " (" + columns + ") VALUES ";
    for (size_t i = 0; i < values_list.size(); ++i) {
      if (i > 0)
        sql += ", ";
      sql += "(" + values_list[i] + ")";
    }
    execute(sql);
  }

  // 只读查询
  json query_json(const std::string &sql) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("query failed: " + result->GetError());

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col)
        obj[names[col]] = duckdb_value_to_json(result->GetValue(col, row), types[col]);
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  bool table_exists(const std::string &table) {
    std::lock_guard<std::mutex> rlock(read_mutex_);
    auto result = read_conn_->Query(
        "SELECT COUNT(*) FROM information_schema.tables WHERE lower(table_name) = lower(" +
        reference::escape_sql(table) + ")");
    if (result->HasError() || result->RowCount() == 0)
      return false;
    return result->GetValue(0, 0).GetValue<int64_t>() > 0;
  }

  // 获取底层 DuckDB 引用
  duckdb::DuckDB &get_duckdb() { return *db_; }

private:
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::mutex write_mutex_;
  std::mutex read_mutex_;
};
