#pragma once

// ============================================================================
// PerspectiveEngine - 9 步流水线
//
//   1. 加载 perspectives      (构造时)
//   2. 加载 modifiers         (构造时)
//   3. 解析请求 + custom perspectives, 校验, 算出需要的参考表
//   4. 并行拉取参考表
//   5. 建 positions / lookthroughs
//   6. 预计算嵌套 criteria
//   7. 拼计划 (keep / scale / sync / rescale)
//   8. collect
//   9. 格式化输出
//
// 每个请求一个 DuckDB 连接, 临时表只在这个连接里可见.
// ============================================================================

#include "../core/constants.hpp"
#include "../core/errors.hpp"
#include "../loaders/perspective_loader.hpp"
#include "../loaders/reference_loader.hpp"
#include "configuration.hpp"
#include "data_ingestion.hpp"
#include "lazy_frame.hpp"
#include "output_formatter.hpp"
#include "perspective_processor.hpp"
#include "rule_evaluator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <duckdb.hpp>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace perspective {

// 请求解析后的参数
struct ProcessRequest {
  MetadataMap metadata;
  std::vector<std::string> position_weights;
  std::vector<std::string> lookthrough_weights;
  std::string ed = DEFAULT_EFFECTIVE_DATE;
  std::optional<std::string> system_version_timestamp;
  FormatOptions format;
};

class PerspectiveEngine {
public:
  PerspectiveEngine(loaders::PerspectiveLoader *perspective_loader, loaders::ReferenceLoader *reference_loader,
                    const std::optional<std::string> &system_version_timestamp = std::nullopt,
                    size_t insert_batch_rows = PERSPECTIVE_INSERT_BATCH)
      : workspace_(nullptr), reference_loader_(reference_loader), batch_rows_(insert_batch_rows),
        config_(timed_load(perspective_loader, system_version_timestamp)) {}

  const ConfigurationManager &config() const { return config_; }

  json process(const json &request) {
    auto t0 = std::chrono::steady_clock::now();
    auto lap = [&t0](const char *step) {
      auto now = std::chrono::steady_clock::now();
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - t0).count();
      std::cout << "[Engine] " << step << ": " << ms << "ms" << std::endl;
      t0 = now;
    };

    if (!request.is_object())
      throw InputError("request must be a JSON object");

    // ---- 3. parse ----
    ConfigurationManager config = config_.with_custom_perspectives(request.value("custom_perspective_rules", json()));
    ProcessRequest req = parse_request(request, config);
    RequiredColumns required = required_columns(config, req.metadata);
    std::vector<std::string> declared_columns = declared_column_names(required);
    lap("step 3 parse request");

    // ---- 4. reference data ----
    Records records = extract_records(request);
    if (records.positions.empty()) {
      std::cout << "[Engine] no positions in request" << std::endl;
      return {{"perspective_configurations", json::object()}};
    }
    loaders::ReferenceTables reference;
    RequiredColumns tables = reference_tables_to_load(required);
    if (!tables.empty()) {
      if (reference_loader_) {
        InstrumentIds ids = collect_instrument_ids(records);
        loaders::ReferenceQuery query;
        query.instrument_ids = std::move(ids.instrument_ids);
        query.parent_instrument_ids = std::move(ids.parent_instrument_ids);
        query.ed = req.ed;
        query.system_version_timestamp = req.system_version_timestamp;
        reference = reference_loader_->load(tables, query);
      } else {
        throw ReferenceLoadError("reference tables required but no reference store configured");
      }
    }
    lap("step 4 load reference data");

    // ---- 5. frames ----
    duckdb::Connection conn(workspace_);
    DataIngestion ingestion(conn, batch_rows_);
    std::vector<std::string> all_weights = req.position_weights;
    for (auto &w : req.lookthrough_weights) {
      if (std::find(all_weights.begin(), all_weights.end(), w) == all_weights.end())
        all_weights.push_back(w);
    }
    std::optional<Frames> built = ingestion.build_frames(records, all_weights);
    if (!built)
      return {{"perspective_configurations", json::object()}};
    Frames frames = ingestion.join_reference(std::move(*built), reference);
    frames = DataIngestion::ensure_declared_columns(std::move(frames), declared_columns);
    lap("step 5 build frames");

    // ---- 6. nested criteria ----
    PrecomputedValues precomputed = precompute_nested(conn, frames.positions, config, req.metadata);
    lap("step 6 precompute nested criteria");

    // ---- 7. plan ----
    PerspectiveProcessor processor(config, &precomputed);
    frames = processor.process(std::move(frames), req.metadata, req.position_weights, req.lookthrough_weights);
    lap("step 7 build plan");

    // ---- 8. collect ----
    ResultTable positions = collect(conn, frames.positions);
    std::optional<ResultTable> lookthroughs;
    if (frames.lookthroughs)
      lookthroughs = collect(conn, *frames.lookthroughs);
    lap("step 8 collect");

    // ---- 9. format ----
    json out = OutputFormatter::format(positions, lookthroughs, req.metadata, req.position_weights,
                                       req.lookthrough_weights, req.format);
    lap("step 9 format output");
    return out;
  }

  // perspective_configurations: {config: {"pid": [modifier, ...] | null}}
  static ProcessRequest parse_request(const json &request, const ConfigurationManager &config) {
    ProcessRequest req;

    if (!request.contains("perspective_configurations") || !request["perspective_configurations"].is_object())
      throw InputError("perspective_configurations must be an object");

    for (auto &[name, perspectives] : request["perspective_configurations"].items()) {
      if (!perspectives.is_object())
        throw InputError("perspective configuration '" + name + "' must be an object");

      std::vector<FactorColumn> columns;
      for (auto &[key, mods] : perspectives.items()) {
        int64_t pid = parse_perspective_id(key);
        config.perspective(pid);

        std::vector<std::string> requested;
        if (!mods.is_null()) {
          if (!mods.is_array())
            throw InputError("modifiers for perspective " + key + " must be a list");
          for (auto &m : mods) {
            if (!m.is_string())
              throw InputError("modifier names must be strings");
            requested.push_back(m.get<std::string>());
          }
        }

        FactorColumn fc;
        fc.config = name;
        fc.perspective_id = pid;
        fc.column = factor_column_name(name, pid);
        fc.modifiers = config.active_modifiers(requested);
        columns.push_back(std::move(fc));
      }
      std::sort(columns.begin(), columns.end(),
                [](const FactorColumn &a, const FactorColumn &b) { return a.perspective_id < b.perspective_id; });
      for (auto &fc : columns)
        req.metadata.push_back(std::move(fc));
    }

    req.position_weights = weight_labels(request, "position_weight_labels", {"weight"});
    req.lookthrough_weights = weight_labels(request, "lookthrough_weight_labels", req.position_weights);

    if (request.contains("ed") && request["ed"].is_string())
      req.ed = request["ed"].get<std::string>();
    if (request.contains("system_version_timestamp") && request["system_version_timestamp"].is_string())
      req.system_version_timestamp = request["system_version_timestamp"].get<std::string>();
    req.format.verbose = request.value("verbose_output", false);
    req.format.flatten = request.value("flatten_response", false);
    return req;
  }

private:
  static ConfigurationManager timed_load(loaders::PerspectiveLoader *loader,
                                         const std::optional<std::string> &system_version_timestamp) {
    auto t0 = std::chrono::steady_clock::now();
    ConfigurationManager config(loader, system_version_timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    std::cout << "[Engine] step 1-2 load perspectives and modifiers: " << ms << "ms ("
              << config.perspectives().size() << " perspectives, " << config.modifiers().size() << " modifiers)"
              << std::endl;
    return config;
  }

  static int64_t parse_perspective_id(const std::string &key) {
    long long v = 0;
    size_t used = 0;
    try {
      v = std::stoll(key, &used);
    } catch (const std::exception &) {
      used = 0;
    }
    if (used == 0 || used != key.size())
      throw InputError("perspective id is not an integer: " + key);
    return v;
  }

  static std::vector<std::string> weight_labels(const json &request, const char *key,
                                                const std::vector<std::string> &fallback) {
    if (!request.contains(key) || request[key].is_null())
      return fallback;
    const json &labels = request[key];
    if (!labels.is_array())
      throw InputError(std::string(key) + " must be a list");
    std::vector<std::string> out;
    for (auto &l : labels) {
      if (!l.is_string())
        throw InputError(std::string(key) + " entries must be strings");
      out.push_back(l.get<std::string>());
    }
    if (out.empty())
      throw InputError(std::string(key) + " must not be empty");
    return out;
  }

  // 声明过的列在 frame 里的名字: PARENT_INSTRUMENT 带 parent_ 前缀, 其余原名
  static std::vector<std::string> declared_column_names(const RequiredColumns &required) {
    std::vector<std::string> out;
    for (auto &[table, cols] : required.tables()) {
      for (auto &c : cols) {
        std::string name = table == PARENT_INSTRUMENT_TABLE ? "parent_" + c : c;
        if (std::find(out.begin(), out.end(), name) == out.end())
          out.push_back(name);
      }
    }
    return out;
  }

  // 请求里用到的 perspective 与 modifier 的参考列并集
  static RequiredColumns required_columns(const ConfigurationManager &config, const MetadataMap &metadata) {
    RequiredColumns rc;
    std::set<int64_t> seen;
    std::vector<std::string> modifiers;
    for (auto &fc : metadata) {
      if (seen.insert(fc.perspective_id).second)
        rc.merge(config.perspective(fc.perspective_id).required_columns);
      for (auto &m : fc.modifiers) {
        if (std::find(modifiers.begin(), modifiers.end(), m) == modifiers.end())
          modifiers.push_back(m);
      }
    }
    rc.merge(config.required_columns_for(modifiers));
    return rc;
  }

  // ==========================================================================
  // 嵌套 In/NotIn: 在 positions 里找满足子条件的行, 取外层列的去重取值
  // ==========================================================================
  static void precompute_criteria(duckdb::Connection &conn, const LazyFrame &positions, const Criteria &criteria,
                                  int64_t perspective_id, PrecomputedValues &out) {
    criteria.for_each_leaf([&](const Criteria &leaf) {
      if (!leaf.is_nested())
        return;
      std::string key = nested_key(leaf.value, perspective_id);
      if (out.count(key))
        return;

      Criteria inner = Criteria::parse(leaf.value);
      precompute_criteria(conn, positions, inner, perspective_id, out);

      if (!positions.has(leaf.column))
        throw ConfigError("criteria column not found: " + leaf.column);

      std::vector<json> values;
      {
        RuleEvaluator eval(positions, &out);
        Expr col = Expr::col(leaf.column);
        Expr pred = eval.evaluate(inner, perspective_id) & col.is_not_null();
        ColumnType type = positions.type_of(leaf.column);
        if (type == ColumnType::Integer)
          pred = pred & col.ne(Expr::lit(INT_NULL));
        else if (type == ColumnType::Double)
          pred = pred & col.ne(Expr::lit(FLOAT_NULL));

        ResultTable r = collect(conn, positions.filter(pred).select_columns({leaf.column}).distinct());
        for (auto &row : r.rows)
          values.push_back(row[0]);
      }
      std::cout << "[Engine] precomputed " << values.size() << " values for " << leaf.column << std::endl;
      out[key] = std::move(values);
    });
  }

  static PrecomputedValues precompute_nested(duckdb::Connection &conn, const LazyFrame &positions,
                                             const ConfigurationManager &config, const MetadataMap &metadata) {
    // modifier 的 criteria 也按所属 perspective 的 id 求值; 与 id 无关的 key 只算一次
    PrecomputedValues out;
    for (auto &fc : metadata) {
      for (auto &rule : config.perspective(fc.perspective_id).rules)
        precompute_criteria(conn, positions, rule.criteria, fc.perspective_id, out);
      for (auto &m : fc.modifiers)
        precompute_criteria(conn, positions, config.modifier(m).criteria, fc.perspective_id, out);
    }
    return out;
  }

  duckdb::DuckDB workspace_;
  loaders::ReferenceLoader *reference_loader_;
  size_t batch_rows_;
  ConfigurationManager config_;
};

} // namespace perspective
