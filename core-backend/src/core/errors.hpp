#pragma once

// ============================================================================
// 错误分类
//
// ConfigError        - perspective/modifier 查找失败, criteria 格式错误
// InputError         - 请求本身不合法 (custom perspective, 缺字段)
// ReferenceLoadError - 参考表拉取失败, 整个请求失败
// PlanError          - DuckDB 执行计划失败
// ============================================================================

#include <stdexcept>
#include <string>

namespace perspective {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

class InputError : public std::runtime_error {
public:
  explicit InputError(const std::string &msg) : std::runtime_error(msg) {}
};

class ReferenceLoadError : public std::runtime_error {
public:
  explicit ReferenceLoadError(const std::string &msg) : std::runtime_error(msg) {}
};

class PlanError : public std::runtime_error {
public:
  explicit PlanError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace perspective
