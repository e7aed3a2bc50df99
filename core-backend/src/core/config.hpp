#pragma once

#include "errors.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

// ============================================================================
// 配置结构
// ============================================================================

struct Config {
  std::string db_path;            // 参考库, 空 = 不加载参考表
  std::string perspectives_path;  // perspective 文档 (JSON 文件)
  std::string perspectives_table; // 或者: 参考库里的文档表
  std::optional<std::string> system_version_timestamp;
  int port = 8001;
  size_t insert_batch_rows = 2000;

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw perspective::ConfigError("无法打开配置文件: " + path);

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      throw perspective::ConfigError("配置文件格式错误: " + path);

    Config config;
    config.db_path = j.value("db_path", "");
    config.perspectives_path = j.value("perspectives_path", "");
    config.perspectives_table = j.value("perspectives_table", "");
    if (j.contains("system_version_timestamp") && j["system_version_timestamp"].is_string())
      config.system_version_timestamp = j["system_version_timestamp"].get<std::string>();
    config.port = j.value("port", 8001);
    config.insert_batch_rows = j.value("insert_batch_rows", static_cast<size_t>(2000));

    if (config.port <= 0 || config.port > 65535)
      throw perspective::ConfigError("port out of range: " + std::to_string(config.port));
    if (!config.perspectives_table.empty() && config.db_path.empty())
      throw perspective::ConfigError("perspectives_table requires db_path");
    return config;
  }
};
