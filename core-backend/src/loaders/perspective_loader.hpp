#pragma once

// ============================================================================
// PerspectiveLoader - perspective 文档来源
//
// 文档格式 {"perspectives": [{id, name, is_active,
//           is_compatible_with_sub_setting_service, rules: [...]}, ...]}
// 同一个 id 可能出现多行: is_active / is_supported 取 AND, rules 按行拼接.
// ============================================================================

#include "../core/database.hpp"
#include "../core/errors.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace loaders {

struct PerspectiveRecord {
  int64_t id = 0;
  std::string name;
  bool is_active = true;
  bool is_supported = true;
  json rules = json::array();
};

inline bool truthy(const json &j, const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return true;
  const json &v = j[key];
  if (v.is_boolean())
    return v.get<bool>();
  if (v.is_number())
    return v.get<double>() != 0.0;
  if (v.is_string())
    return !v.get<std::string>().empty();
  return !v.empty();
}

inline std::map<int64_t, PerspectiveRecord> group_perspectives(const json &document) {
  std::map<int64_t, PerspectiveRecord> grouped;
  if (!document.is_object() || !document.contains("perspectives"))
    return grouped;
  const json &rows = document["perspectives"];
  if (!rows.is_array())
    throw perspective::ConfigError("perspective document: 'perspectives' must be a list");

  for (auto &p : rows) {
    if (!p.contains("id") || !p["id"].is_number_integer())
      throw perspective::ConfigError("perspective without integer id: " + p.dump());
    int64_t pid = p["id"].get<int64_t>();

    auto it = grouped.find(pid);
    if (it == grouped.end()) {
      PerspectiveRecord rec;
      rec.id = pid;
      if (p.contains("name") && p["name"].is_string())
        rec.name = p["name"].get<std::string>();
      it = grouped.emplace(pid, std::move(rec)).first;
    }
    auto &rec = it->second;
    rec.is_active = rec.is_active && truthy(p, "is_active");
    rec.is_supported = rec.is_supported && truthy(p, "is_compatible_with_sub_setting_service");
    if (p.contains("rules") && p["rules"].is_array()) {
      for (auto &r : p["rules"])
        rec.rules.push_back(r);
    }
  }
  return grouped;
}

class PerspectiveLoader {
public:
  virtual ~PerspectiveLoader() = default;
  virtual json load_document(const std::optional<std::string> &system_version_timestamp) = 0;

  std::map<int64_t, PerspectiveRecord> load(const std::optional<std::string> &system_version_timestamp) {
    auto grouped = group_perspectives(load_document(system_version_timestamp));
    std::cout << "[Config] loaded " << grouped.size() << " perspectives" << std::endl;
    return grouped;
  }
};

// 内存中的文档, 主要给测试和 --input 模式使用
class StaticPerspectiveLoader : public PerspectiveLoader {
public:
  explicit StaticPerspectiveLoader(json document) : document_(std::move(document)) {}

  json load_document(const std::optional<std::string> &) override { return document_; }

private:
  json document_;
};

class FilePerspectiveLoader : public PerspectiveLoader {
public:
  explicit FilePerspectiveLoader(std::string path) : path_(std::move(path)) {}

  json load_document(const std::optional<std::string> &) override {
    std::ifstream f(path_);
    if (!f.is_open())
      throw perspective::ConfigError("cannot open perspective file: " + path_);
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded())
      throw perspective::ConfigError("malformed perspective file: " + path_);
    return j;
  }

private:
  std::string path_;
};

// 文档表里取 valid_from 不晚于 svt 的最新一份
class DatabasePerspectiveLoader : public PerspectiveLoader {
public:
  DatabasePerspectiveLoader(Database &db, std::string table) : db_(db), table_(std::move(table)) {}

  json load_document(const std::optional<std::string> &system_version_timestamp) override {
    if (!db_.table_exists(table_))
      throw perspective::ConfigError("perspective table does not exist: " + table_);
    std::string sql = "SELECT document FROM " + table_;
    if (system_version_timestamp)
      sql += " WHERE valid_from <= CAST(" + reference::escape_sql(*system_version_timestamp) + " AS TIMESTAMP)";
    sql += " ORDER BY valid_from DESC LIMIT 1";

    json rows;
    try {
      rows = db_.query_json(sql);
    } catch (const std::exception &e) {
      throw perspective::ConfigError(std::string("loading perspectives: ") + e.what());
    }
    if (rows.empty() || !rows[0]["document"].is_string())
      throw perspective::ConfigError("no perspectives found in " + table_);

    json doc = json::parse(rows[0]["document"].get<std::string>(), nullptr, false);
    if (doc.is_discarded())
      throw perspective::ConfigError("malformed perspective document in " + table_);
    return doc;
  }

  // 新版本, valid_from 为空时取当前时间
  void store(const json &document, const std::optional<std::string> &valid_from = std::nullopt) {
    if (!document.is_object() || !document.contains("perspectives"))
      throw perspective::InputError("perspective document must contain 'perspectives'");
    group_perspectives(document);
    std::string ts = valid_from ? "CAST(" + reference::escape_sql(*valid_from) + " AS TIMESTAMP)" : "CURRENT_TIMESTAMP";
    db_.batch_insert(table_, "document, valid_from", {reference::json_sql_value(document) + ", " + ts});
    std::cout << "[Config] stored perspective document in " << table_ << std::endl;
  }

private:
  Database &db_;
  std::string table_;
};

} // namespace loaders
