#pragma once

// ============================================================================
// 参考数据库 schema
// INSTRUMENT / INSTRUMENT_CATEGORIZATION / perspective 文档表, 以及 SQL 转义工具
// ============================================================================

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace reference {

// ============================================================================
// 工具函数
// ============================================================================

inline std::string escape_sql_raw(const std::string &s) {
  std::string r;
  r.reserve(s.size());
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  return r;
}

inline std::string escape_sql(const std::string &s) {
  return "'" + escape_sql_raw(s) + "'";
}

// json 标量 → SQL 字面量, 嵌套值按 JSON 文本存
inline std::string json_sql_value(const json &v) {
  if (v.is_null())
    return "NULL";
  if (v.is_boolean())
    return v.get<bool>() ? "TRUE" : "FALSE";
  if (v.is_number_integer() || v.is_number_unsigned())
    return v.dump();
  if (v.is_number_float())
    return "CAST(" + v.dump() + " AS DOUBLE)";
  if (v.is_string())
    return escape_sql(v.get<std::string>());
  return escape_sql(v.dump());
}

// "1,2,3" 供 IN (...) 使用
inline std::string join_ids(const std::vector<int64_t> &ids) {
  std::string s;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i > 0)
      s += ",";
    s += std::to_string(ids[i]);
  }
  return s;
}

// ============================================================================
// 参考表
//
// INSTRUMENT_CATEGORIZATION 按 ED 切片, valid_from/valid_to 是系统版本区间,
// 用来回答 "as of system_version_timestamp" 的查询
// ============================================================================

inline const char *INSTRUMENT_DDL = R"(
CREATE TABLE IF NOT EXISTS INSTRUMENT (
    instrument_id BIGINT NOT NULL,
    instrument_subtype_id BIGINT,
    instrument_name VARCHAR,
    PRIMARY KEY (instrument_id)
))";

inline const char *INSTRUMENT_CATEGORIZATION_DDL = R"(
CREATE TABLE IF NOT EXISTS INSTRUMENT_CATEGORIZATION (
    instrument_id BIGINT NOT NULL,
    ED DATE NOT NULL,
    liquidity_type_id BIGINT,
    position_source_type_id BIGINT,
    valid_from TIMESTAMP DEFAULT TIMESTAMP '1900-01-01 00:00:00',
    valid_to TIMESTAMP
))";

// 每行一份完整的 perspective 文档 {"perspectives": [...]}
inline std::string perspective_documents_ddl(const std::string &table) {
  return "CREATE TABLE IF NOT EXISTS " + table + " ("
         "document VARCHAR NOT NULL, "
         "valid_from TIMESTAMP DEFAULT TIMESTAMP '1900-01-01 00:00:00')";
}

// INSTRUMENT_CATEGORIZATION 在有参考表时总会带上的列
inline const std::vector<std::string> CATEGORIZATION_BASE_COLUMNS = {"liquidity_type_id", "position_source_type_id"};

} // namespace reference
