#pragma once

// ============================================================================
// OutputFormatter - 物化后的结果表 → 嵌套响应
//
// result[config][perspective_id][container]["positions" | record_type]
//   = {identifier: {weight_label: weight * factor}}
// verbose: removed_positions_weight_summary + scale_factors
// flatten: {identifier: [...], weight: [...]}
// ============================================================================

#include "lazy_frame.hpp"
#include "perspective_processor.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

using json = nlohmann::json;

namespace perspective {

struct FormatOptions {
  bool verbose = false;
  bool flatten = false;
};

class OutputFormatter {
public:
  static json format(const ResultTable &positions, const std::optional<ResultTable> &lookthroughs,
                     const MetadataMap &metadata, const std::vector<std::string> &position_weights,
                     const std::vector<std::string> &lookthrough_weights, const FormatOptions &opts) {
    json results = json::object();
    for (auto &fc : metadata) {
      if (!results.contains(fc.config))
        results[fc.config] = json::object();
      results[fc.config][std::to_string(fc.perspective_id)] = json::object();
    }

    for (auto &fc : metadata) {
      json &target = results[fc.config][std::to_string(fc.perspective_id)];
      add_kept(positions, fc.column, position_weights, false, target);
      if (lookthroughs)
        add_kept(*lookthroughs, fc.column, lookthrough_weights, true, target);

      if (opts.verbose) {
        add_removed_positions(positions, fc.column, position_weights, target);
        if (lookthroughs)
          add_removed_lookthroughs(*lookthroughs, fc.column, lookthrough_weights, target);
        add_scale_factors(positions, fc.column, position_weights, target);
      }
    }

    if (opts.flatten)
      flatten_results(results);
    return {{"perspective_configurations", results}};
  }

  // {"123": {"weight": 0.5}, ...} → {"identifier": [123, ...], "weight": [0.5, ...]}
  static json flatten_entries(const json &entries) {
    json out = {{"identifier", json::array()}};
    if (!entries.is_object())
      return out;
    for (auto &[id, data] : entries.items()) {
      out["identifier"].push_back(identifier_value(id));
      if (!data.is_object())
        continue;
      for (auto &[k, v] : data.items()) {
        if (!out.contains(k))
          out[k] = json::array();
        out[k].push_back(v.is_number_float() ? json(round_to(v.get<double>(), 13)) : v);
      }
    }
    return out;
  }

  static void flatten_results(json &results) {
    for (auto &[config, perspectives] : results.items()) {
      for (auto &[pid, containers] : perspectives.items()) {
        for (auto &[container, blocks] : containers.items()) {
          for (auto &[key, block] : blocks.items()) {
            if (key == "positions" || key.find("lookthrough") != std::string::npos)
              block = flatten_entries(block);
          }
        }
      }
    }
  }

private:
  // ==========================================================================
  // 小工具
  // ==========================================================================

  static std::vector<int> weight_indices(const ResultTable &t, const std::vector<std::string> &weights,
                                         std::vector<std::string> &names) {
    std::vector<int> idx;
    for (auto &w : weights) {
      int i = t.index_of(w);
      if (i >= 0) {
        idx.push_back(i);
        names.push_back(w);
      }
    }
    return idx;
  }

  static std::string text_of(const json &v) { return v.is_string() ? v.get<std::string>() : v.dump(); }

  static json multiply(const json &w, const json &f) {
    if (!w.is_number() || !f.is_number())
      return nullptr;
    return w.get<double>() * f.get<double>();
  }

  static double round_to(double v, int digits) {
    double scale = std::pow(10.0, digits);
    double scaled = v * scale;
    if (!std::isfinite(scaled))
      return v;
    return std::round(scaled) / scale;
  }

  static json identifier_value(const std::string &id) {
    try {
      size_t used = 0;
      long long n = std::stoll(id, &used);
      if (used == id.size())
        return n;
    } catch (const std::exception &) {
      return id;
    }
    return id;
  }

  // 整数相加保持整数, 出现小数或超出 int64 的无符号数就转 double
  struct Sum {
    bool any = false;
    bool integral = true;
    int64_t i = 0;
    double d = 0.0;

    void add(const json &v) {
      if (!v.is_number())
        return;
      any = true;
      bool small = v.is_number_integer() &&
                   (!v.is_number_unsigned() || v.get<uint64_t>() <= static_cast<uint64_t>(INT64_MAX));
      if (integral && small) {
        i += v.get<int64_t>();
        return;
      }
      if (integral) {
        d = static_cast<double>(i);
        integral = false;
      }
      d += v.get<double>();
    }
    json value() const {
      if (!any)
        return nullptr;
      return integral ? json(i) : json(d);
    }
  };

  // ==========================================================================
  // 保留的行
  // ==========================================================================
  static void add_kept(const ResultTable &t, const std::string &factor, const std::vector<std::string> &weights,
                       bool lookthrough, json &target) {
    int f = t.index_of(factor);
    int id = t.index_of("identifier");
    int container = t.index_of("container");
    int record_type = t.index_of("record_type");
    std::vector<std::string> names;
    auto w = weight_indices(t, weights, names);
    if (f < 0 || id < 0 || container < 0 || w.empty())
      return;

    for (auto &row : t.rows) {
      if (row[f].is_null())
        continue;
      json values = json::object();
      for (size_t k = 0; k < w.size(); ++k)
        values[names[k]] = multiply(row[w[k]], row[f]);

      std::string key = lookthrough ? (record_type >= 0 ? text_of(row[record_type]) : "lookthrough") : "positions";
      target[text_of(row[container])][key][text_of(row[id])] = std::move(values);
    }
  }

  // ==========================================================================
  // verbose
  // ==========================================================================

  // 被删的 position 逐条列出原始 weight
  static void add_removed_positions(const ResultTable &t, const std::string &factor,
                                    const std::vector<std::string> &weights, json &target) {
    int f = t.index_of(factor);
    int id = t.index_of("identifier");
    int container = t.index_of("container");
    std::vector<std::string> names;
    auto w = weight_indices(t, weights, names);
    if (f < 0 || id < 0 || container < 0 || w.empty())
      return;

    for (auto &row : t.rows) {
      if (!row[f].is_null())
        continue;
      json values = json::object();
      for (size_t k = 0; k < w.size(); ++k)
        values[names[k]] = row[w[k]];
      target[text_of(row[container])]["removed_positions_weight_summary"]["positions"][text_of(row[id])] =
          std::move(values);
    }
  }

  // 被删的 lookthrough 按 (container, record_type, parent_instrument_id) 汇总
  static void add_removed_lookthroughs(const ResultTable &t, const std::string &factor,
                                       const std::vector<std::string> &weights, json &target) {
    int f = t.index_of(factor);
    int parent = t.index_of("parent_instrument_id");
    int container = t.index_of("container");
    int record_type = t.index_of("record_type");
    std::vector<std::string> names;
    auto w = weight_indices(t, weights, names);
    if (f < 0 || parent < 0 || container < 0 || record_type < 0 || w.empty())
      return;

    std::map<std::tuple<std::string, std::string, std::string>, std::vector<Sum>> groups;
    for (auto &row : t.rows) {
      if (!row[f].is_null())
        continue;
      auto key = std::make_tuple(text_of(row[container]), text_of(row[record_type]), text_of(row[parent]));
      auto &sums = groups[key];
      sums.resize(w.size());
      for (size_t k = 0; k < w.size(); ++k)
        sums[k].add(row[w[k]]);
    }

    for (auto &[key, sums] : groups) {
      auto &[c, rt, p] = key;
      json values = json::object();
      for (size_t k = 0; k < sums.size(); ++k)
        values[names[k]] = sums[k].value();
      target[c]["removed_positions_weight_summary"][rt][p] = std::move(values);
    }
  }

  // 有删除且有保留的 container 才输出: 保留行的原始 weight 之和
  static void add_scale_factors(const ResultTable &t, const std::string &factor,
                                const std::vector<std::string> &weights, json &target) {
    int f = t.index_of(factor);
    int container = t.index_of("container");
    std::vector<std::string> names;
    auto w = weight_indices(t, weights, names);
    if (f < 0 || container < 0 || w.empty())
      return;

    std::set<std::string> with_removals;
    for (auto &row : t.rows) {
      if (row[f].is_null())
        with_removals.insert(text_of(row[container]));
    }
    if (with_removals.empty())
      return;

    std::map<std::string, std::vector<Sum>> kept;
    for (auto &row : t.rows) {
      std::string c = text_of(row[container]);
      if (row[f].is_null() || !with_removals.count(c))
        continue;
      auto &sums = kept[c];
      sums.resize(w.size());
      for (size_t k = 0; k < w.size(); ++k)
        sums[k].add(row[w[k]]);
    }

    for (auto &[c, sums] : kept) {
      json values = json::object();
      for (size_t k = 0; k < sums.size(); ++k) {
        json v = sums[k].value();
        if (!v.is_null())
          values[names[k]] = v;
      }
      if (!values.empty())
        target[c]["scale_factors"] = std::move(values);
    }
  }
};

} // namespace perspective
