#pragma once

// ============================================================================
// Criteria 值解析
//
// 数据库里的 value 常常是字符串编码: "(1,2,3)", "['USD','EUR']",
// "fncriteria:0:10", "'USD'". 这里只做解析, 回退策略由 evaluator 决定.
// ============================================================================

#include <cctype>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace perspective {
namespace values {

inline std::string trim(const std::string &s, const char *chars = " \t\r\n") {
  size_t b = s.find_first_not_of(chars);
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(chars);
  return s.substr(b, e - b + 1);
}

inline std::string strip_quotes(const std::string &s) { return trim(s, "'\""); }

// "-12" / "7", 不接受小数和空串
inline bool is_integer_literal(const std::string &s) {
  size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (i >= s.size())
    return false;
  for (; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

// "3.5" / "10", 不接受负号
inline bool is_unsigned_decimal(const std::string &s) {
  bool dot = false;
  bool digit = false;
  for (char c : s) {
    if (c == '.') {
      if (dot)
        return false;
      dot = true;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      digit = true;
    } else {
      return false;
    }
  }
  return digit;
}

inline std::vector<std::string> split(const std::string &s, char sep) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (true) {
    size_t next = s.find(sep, pos);
    if (next == std::string::npos) {
      out.push_back(s.substr(pos));
      break;
    }
    out.push_back(s.substr(pos, next - pos));
    pos = next + 1;
  }
  return out;
}

// In / NotIn 的成员列表
inline std::vector<json> parse_list(const json &value) {
  std::vector<json> out;
  if (value.is_array()) {
    for (auto &v : value)
      out.push_back(v);
    return out;
  }
  if (!value.is_string()) {
    out.push_back(value);
    return out;
  }

  std::string body = trim(value.get<std::string>(), "[]()");
  for (auto &raw : split(body, ',')) {
    std::string item = strip_quotes(trim(raw));
    if (item.empty())
      continue;
    if (is_integer_literal(item)) {
      try {
        out.push_back(std::stoll(item));
        continue;
      } catch (const std::out_of_range &) {
        // 超出 int64 的按字符串处理
      }
    }
    out.push_back(item);
  }
  return out;
}

// Between / NotBetween 的区间, 格式不对返回 nullopt
inline std::optional<std::pair<json, json>> parse_range(const json &value) {
  if (value.is_array()) {
    if (value.size() != 2)
      return std::nullopt;
    return std::make_pair(value[0], value[1]);
  }
  if (!value.is_string())
    return std::nullopt;

  std::string s = value.get<std::string>();
  size_t tag = s.find("fncriteria:");
  if (tag == std::string::npos)
    return std::nullopt;
  s.erase(tag, std::string("fncriteria:").size());

  auto parts = split(s, ':');
  if (parts.size() < 2)
    return std::nullopt;

  auto to_bound = [](const std::string &p) -> json {
    if (is_unsigned_decimal(p))
      return std::stod(p);
    return p;
  };
  return std::make_pair(to_bound(parts[0]), to_bound(parts[1]));
}

// 标量比较值: 字符串去掉外层引号
inline json parse_scalar(const json &value) {
  if (value.is_string())
    return strip_quotes(value.get<std::string>());
  return value;
}

} // namespace values
} // namespace perspective
