#pragma once

// ============================================================================
// ConfigurationManager - perspective 与 modifier 的只读目录
//
// 进程级: 构造时加载一次. 请求里的 custom perspective 通过
// with_custom_perspectives() 得到一份请求私有的副本, 不污染共享目录.
// ============================================================================

#include "../core/errors.hpp"
#include "../loaders/perspective_loader.hpp"
#include "model.hpp"
#include "supported_modifiers.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace perspective {

class ConfigurationManager {
public:
  // loader 为空时只有内置 modifier, 没有 perspective
  explicit ConfigurationManager(loaders::PerspectiveLoader *loader,
                                const std::optional<std::string> &system_version_timestamp = std::nullopt) {
    if (loader) {
      load_perspectives(loader->load(system_version_timestamp));
    } else {
      std::cerr << "[Config] no perspective source configured, starting with empty perspectives" << std::endl;
    }
    load_modifiers();
  }

  bool has_perspective(int64_t id) const { return perspectives_.count(id) > 0; }

  const Perspective &perspective(int64_t id) const {
    auto it = perspectives_.find(id);
    if (it == perspectives_.end())
      throw ConfigError("unknown perspective: " + std::to_string(id));
    return it->second;
  }

  const Modifier &modifier(const std::string &name) const {
    auto it = modifiers_.find(name);
    if (it == modifiers_.end())
      throw ConfigError("unknown modifier: " + name);
    return it->second;
  }

  const std::map<int64_t, Perspective> &perspectives() const { return perspectives_; }
  const std::map<std::string, Modifier> &modifiers() const { return modifiers_; }
  const std::vector<std::string> &default_modifiers() const { return default_modifiers_; }

  // 请求顺序在前, 默认 modifier 在后; 再去掉被任一成员覆盖的名字
  std::vector<std::string> active_modifiers(const std::vector<std::string> &requested) const {
    std::vector<std::string> merged;
    auto push_unique = [&](const std::string &name) {
      if (std::find(merged.begin(), merged.end(), name) == merged.end())
        merged.push_back(name);
    };
    for (auto &name : requested) {
      modifier(name);
      push_unique(name);
    }
    for (auto &name : default_modifiers_)
      push_unique(name);

    std::vector<std::string> overridden;
    for (auto &name : merged) {
      for (auto &o : modifier(name).override_modifiers)
        overridden.push_back(o);
    }

    std::vector<std::string> active;
    for (auto &name : merged) {
      if (std::find(overridden.begin(), overridden.end(), name) == overridden.end())
        active.push_back(name);
    }
    return active;
  }

  RequiredColumns required_columns_for(const std::vector<std::string> &modifier_names) const {
    RequiredColumns rc;
    for (auto &name : modifier_names) {
      auto it = modifiers_.find(name);
      if (it != modifiers_.end())
        rc.merge(it->second.required_columns);
    }
    return rc;
  }

  // custom_perspective_rules: {"-1": {"rules": [...]}, ...}
  ConfigurationManager with_custom_perspectives(const json &custom) const {
    ConfigurationManager copy = *this;
    if (custom.is_null() || custom.empty())
      return copy;
    if (!custom.is_object())
      throw InputError("custom_perspective_rules must be an object");

    std::vector<std::pair<int64_t, const json *>> parsed;
    for (auto &[key, def] : custom.items()) {
      int64_t pid = parse_custom_id(key);
      if (pid > 0)
        throw InputError("Custom Perspective Rule IDs MUST be negative to separate them from real Perspective IDs");
      parsed.emplace_back(pid, &def);
    }

    for (auto &[pid, def] : parsed) {
      if (!def->is_object() || !def->contains("rules"))
        throw InputError("Custom perspective " + std::to_string(pid) + " is missing required 'rules' field");
      const json &rules = (*def)["rules"];
      if (!rules.is_array())
        throw InputError("Custom perspective " + std::to_string(pid) + ": 'rules' must be a list");
      if (rules.empty())
        continue;

      Perspective p;
      p.id = pid;
      p.name = def->value("name", "custom_" + std::to_string(pid));
      for (size_t i = 0; i < rules.size(); ++i) {
        const json &r = rules[i];
        std::string where = "Custom perspective " + std::to_string(pid) + " rule " + std::to_string(i);
        if (!r.is_object() || !r.contains("criteria"))
          throw InputError(where + " is missing required 'criteria' field");
        if (!r.contains("apply_to") || !r["apply_to"].is_string())
          throw InputError(where + " is missing required 'apply_to' field");
        bool scaling = r.value("is_scaling_rule", false);
        if (scaling && (!r.contains("scale_factor") || !r["scale_factor"].is_number()))
          throw InputError(where + " is a scaling rule but missing 'scale_factor'");

        Rule rule;
        rule.name = "custom_rule_" + std::to_string(pid) + "_" + std::to_string(i);
        rule.apply_to = parse_apply_to(r["apply_to"].get<std::string>());
        rule.criteria = Criteria::parse(extract_required_columns(r["criteria"], p.required_columns));
        rule.condition_for_next_rule = parse_next_condition(r.value("condition_for_next_rule", json()));
        rule.is_scaling_rule = scaling;
        rule.scale_factor = scaling ? r["scale_factor"].get<double>() / 100.0 : 1.0;
        p.rules.push_back(std::move(rule));
      }
      copy.perspectives_[pid] = std::move(p);
    }
    return copy;
  }

private:
  static int64_t parse_custom_id(const std::string &key) {
    long long v = 0;
    size_t used = 0;
    try {
      v = std::stoll(key, &used);
    } catch (const std::exception &) {
      used = 0;
    }
    if (used == 0 || used != key.size())
      throw InputError("custom perspective id is not an integer: " + key);
    return v;
  }

  // criteria 根上的 required_columns 是元数据, 取出后从 criteria 里删掉
  static json extract_required_columns(const json &raw, RequiredColumns &into) {
    json criteria = raw;
    if (criteria.is_string()) {
      std::string s = criteria.get<std::string>();
      if (s.empty())
        return nullptr;
      criteria = json::parse(s, nullptr, false);
      if (criteria.is_discarded())
        throw ConfigError("malformed criteria JSON: " + s);
    }
    if (criteria.is_object() && criteria.contains("required_columns")) {
      into.merge(RequiredColumns::from_json(criteria["required_columns"]));
      criteria.erase("required_columns");
    }
    return criteria;
  }

  void load_perspectives(const std::map<int64_t, loaders::PerspectiveRecord> &records) {
    size_t skipped = 0;
    for (auto &[pid, rec] : records) {
      if (!rec.is_active || !rec.is_supported) {
        ++skipped;
        continue;
      }
      try {
        Perspective p;
        p.id = pid;
        p.name = rec.name;
        for (size_t i = 0; i < rec.rules.size(); ++i) {
          const json &r = rec.rules[i];
          Rule rule;
          rule.name = "rule_" + std::to_string(i);
          rule.apply_to = parse_apply_to(r.value("apply_to", "both"));
          rule.criteria = Criteria::parse(extract_required_columns(r.value("criteria", json()), p.required_columns));
          rule.condition_for_next_rule = parse_next_condition(r.value("condition_for_next_rule", json()));
          rule.is_scaling_rule = r.contains("is_scaling_rule") && r["is_scaling_rule"].is_boolean()
                                     ? r["is_scaling_rule"].get<bool>()
                                     : false;
          double pct = (r.contains("scale_factor") && r["scale_factor"].is_number())
                           ? r["scale_factor"].get<double>()
                           : 100.0;
          rule.scale_factor = pct / 100.0;
          p.rules.push_back(std::move(rule));
        }
        perspectives_[pid] = std::move(p);
      } catch (const ConfigError &e) {
        std::cerr << "[Config] dropping perspective " << pid << ": " << e.what() << std::endl;
        ++skipped;
      } catch (const json::exception &e) {
        std::cerr << "[Config] dropping perspective " << pid << ": " << e.what() << std::endl;
        ++skipped;
      }
    }
    std::cout << "[Config] parsed " << perspectives_.size() << " perspectives (" << skipped << " skipped)" << std::endl;
  }

  void load_modifiers() {
    json catalogue = json::parse(SUPPORTED_MODIFIERS_JSON);
    for (auto &[name, def] : catalogue.items()) {
      Modifier m;
      m.name = name;
      m.apply_to = parse_apply_to(def.value("apply_to", "both"));
      m.type = parse_modifier_type(def.value("type", "PreProcessing"));
      m.criteria = Criteria::parse(def.value("criteria", json()));
      m.rule_result_operator = to_lower(def.value("rule_result_operator", "and")) == "or" ? RuleResultOp::Or : RuleResultOp::And;
      m.required_columns = RequiredColumns::from_json(def.value("required_columns", json::object()));
      if (def.contains("override_modifiers"))
        m.override_modifiers = def["override_modifiers"].get<std::vector<std::string>>();
      modifiers_[name] = std::move(m);
    }
    default_modifiers_ = DEFAULT_MODIFIERS;
    std::cout << "[Config] loaded " << modifiers_.size() << " modifiers" << std::endl;
  }

  std::map<int64_t, Perspective> perspectives_;
  std::map<std::string, Modifier> modifiers_;
  std::vector<std::string> default_modifiers_;
};

} // namespace perspective
