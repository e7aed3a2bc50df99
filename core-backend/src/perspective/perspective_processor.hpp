#pragma once

// ============================================================================
// PerspectiveProcessor - 每个 (config, perspective) 一列 factor
//
// factor = keep ? scale : NULL
//   keep  = NOT pre_1 AND NOT pre_2 ... AND (rule chain ∘ post modifiers)
//   scale = 1.0, 每条命中的 scaling rule 乘上它的 scale_factor
// 然后 lookthrough 跟随父 position 置空, 最后按需做 100% rescale.
// 整个过程只拼 SQL, 不执行.
// ============================================================================

#include "../core/constants.hpp"
#include "configuration.hpp"
#include "data_ingestion.hpp"
#include "expr.hpp"
#include "lazy_frame.hpp"
#include "model.hpp"
#include "rule_evaluator.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace perspective {

struct FactorColumn {
  std::string config;
  int64_t perspective_id = 0;
  std::string column;
  std::vector<std::string> modifiers; // 已经去掉被覆盖的
};

// 按 config 名, 再按 perspective id 升序
using MetadataMap = std::vector<FactorColumn>;

inline std::string factor_column_name(const std::string &config, int64_t perspective_id) {
  return "f_" + config + "_" + std::to_string(perspective_id);
}

inline bool has_modifier(const FactorColumn &fc, const char *name) {
  return std::find(fc.modifiers.begin(), fc.modifiers.end(), name) != fc.modifiers.end();
}

class PerspectiveProcessor {
public:
  PerspectiveProcessor(const ConfigurationManager &config, const PrecomputedValues *precomputed)
      : config_(config), precomputed_(precomputed) {}

  Frames process(Frames frames, const MetadataMap &metadata, const std::vector<std::string> &position_weights,
                 const std::vector<std::string> &lookthrough_weights) const {
    if (metadata.empty())
      return frames;

    frames.positions = add_factors(frames.positions, metadata, Mode::Position);
    if (frames.lookthroughs) {
      frames.lookthroughs = add_factors(*frames.lookthroughs, metadata, Mode::Lookthrough);
      frames.lookthroughs = synchronize_lookthroughs(*frames.lookthroughs, frames.positions, metadata);
    }
    return rescale(std::move(frames), metadata, position_weights, lookthrough_weights);
  }

  // ==========================================================================
  // keep / scale
  // ==========================================================================

  Expr keep_expression(const LazyFrame &frame, int64_t perspective_id, const std::vector<std::string> &modifiers,
                       Mode mode) const {
    RuleEvaluator eval(frame, precomputed_);
    Expr keep = Expr::lit(true);

    for (auto &name : modifiers) {
      const Modifier &m = config_.modifier(name);
      if (m.type == ModifierType::PreProcessing && applies_to(m.apply_to, mode))
        keep = keep & !eval.evaluate(m.criteria, perspective_id);
    }

    Expr chain = rule_chain(eval, config_.perspective(perspective_id), mode);

    for (auto &name : modifiers) {
      const Modifier &m = config_.modifier(name);
      if (m.type != ModifierType::PostProcessing || !applies_to(m.apply_to, mode))
        continue;
      Expr post = eval.evaluate(m.criteria, perspective_id);
      chain = m.rule_result_operator == RuleResultOp::Or ? (chain | post) : (chain & post);
    }
    return keep & chain;
  }

  Expr scale_expression(const LazyFrame &frame, int64_t perspective_id, Mode mode) const {
    RuleEvaluator eval(frame, precomputed_);
    Expr scale = Expr::lit(1.0);
    for (auto &rule : config_.perspective(perspective_id).rules) {
      if (!rule.is_scaling_rule || !applies_to(rule.apply_to, mode))
        continue;
      Expr hit = eval.evaluate(rule.criteria, perspective_id);
      scale = Expr::when(hit, scale * Expr::lit(rule.scale_factor), scale);
    }
    return scale;
  }

private:
  // 第一条规则直接作为起点, 之后看前一条 (原始顺序) 的 condition_for_next_rule
  static Expr rule_chain(const RuleEvaluator &eval, const Perspective &p, Mode mode) {
    bool started = false;
    Expr chain = Expr::lit(true);
    for (size_t i = 0; i < p.rules.size(); ++i) {
      const Rule &rule = p.rules[i];
      if (rule.is_scaling_rule || !applies_to(rule.apply_to, mode))
        continue;
      Expr current = eval.evaluate(rule.criteria, p.id);
      if (!started) {
        chain = current;
        started = true;
      } else if (i > 0 && p.rules[i - 1].condition_for_next_rule == NextCondition::Or) {
        chain = chain | current;
      } else {
        chain = chain & current;
      }
    }
    return chain;
  }

  LazyFrame add_factors(const LazyFrame &frame, const MetadataMap &metadata, Mode mode) const {
    std::vector<NamedExpr> exprs;
    exprs.reserve(metadata.size());
    for (auto &fc : metadata) {
      Expr keep = keep_expression(frame, fc.perspective_id, fc.modifiers, mode);
      Expr scale = scale_expression(frame, fc.perspective_id, mode);
      exprs.push_back({fc.column, Expr::when(keep, scale, Expr::null_double()), ColumnType::Double});
    }
    return frame.with_columns(exprs);
  }

  // ==========================================================================
  // lookthrough → 父 position
  // 同一 (instrument_id, sub_portfolio_id) 有多行时取 MAX, 全为 NULL 才算 NULL
  // ==========================================================================
  static LazyFrame synchronize_lookthroughs(const LazyFrame &lookthroughs, const LazyFrame &positions,
                                            const MetadataMap &metadata) {
    std::vector<NamedExpr> nulls;
    if (!lookthroughs.has("parent_instrument_id") || !positions.has("instrument_id")) {
      for (auto &fc : metadata)
        nulls.push_back({fc.column, Expr::null_double(), ColumnType::Double});
      std::cerr << "[Processor] lookthroughs without parent linkage, all factors cleared" << std::endl;
      return lookthroughs.with_columns(nulls);
    }

    std::vector<NamedExpr> aggs;
    for (auto &fc : metadata)
      aggs.push_back({"parent_" + fc.column, Expr::col(fc.column).max(), ColumnType::Double});
    LazyFrame parents = positions.group_by({"instrument_id", "sub_portfolio_id"}, aggs);

    LazyFrame joined = lookthroughs.left_join(
        parents, {{"parent_instrument_id", "instrument_id"}, {"sub_portfolio_id", "sub_portfolio_id"}});

    std::vector<NamedExpr> synced;
    for (auto &fc : metadata) {
      Expr parent = Expr::col("parent_" + fc.column);
      synced.push_back({fc.column, Expr::when(parent.is_null(), Expr::null_double(), Expr::col(fc.column)),
                        ColumnType::Double});
    }

    std::vector<std::string> keep_cols;
    for (auto &c : lookthroughs.columns())
      keep_cols.push_back(c.name);
    return joined.with_columns(synced).select_columns(keep_cols);
  }

  // ==========================================================================
  // 100% rescale
  // ==========================================================================
  static Expr weighted(const LazyFrame &frame, const std::string &weight, const std::string &factor) {
    Expr w = frame.has(weight) ? Expr::col(weight) : Expr::null_double();
    return w * Expr::col(factor);
  }

  static Expr divide_unless_zero(const std::string &factor, const Expr &denominator) {
    Expr f = Expr::col(factor);
    return Expr::when(denominator.ne(Expr::lit(0.0)), f / denominator, f);
  }

  Frames rescale(Frames frames, const MetadataMap &metadata, const std::vector<std::string> &position_weights,
                 const std::vector<std::string> &lookthrough_weights) const {
    std::vector<const FactorColumn *> holdings;
    std::vector<const FactorColumn *> looks;
    for (auto &fc : metadata) {
      if (has_modifier(fc, SCALE_HOLDINGS_MODIFIER))
        holdings.push_back(&fc);
      if (frames.lookthroughs && has_modifier(fc, SCALE_LOOKTHROUGHS_MODIFIER))
        looks.push_back(&fc);
    }

    if (!holdings.empty() && !position_weights.empty()) {
      // 分母 = positions 与 essential_lookthroughs 在 (container, sub_portfolio_id) 内的 weight*factor 之和
      const std::string &weight = position_weights.front();
      const std::vector<std::string> keys = {"container", "sub_portfolio_id"};

      auto contributions = [&](const LazyFrame &lf) {
        std::vector<NamedExpr> cols = {{"container", Expr::col("container"), lf.type_of("container")},
                                       {"sub_portfolio_id", Expr::col("sub_portfolio_id"), ColumnType::Text}};
        for (auto *fc : holdings)
          cols.push_back({"c_" + fc->column, weighted(lf, weight, fc->column), ColumnType::Double});
        return lf.select(cols);
      };

      LazyFrame parts = contributions(frames.positions);
      if (frames.lookthroughs && frames.lookthroughs->has("record_type")) {
        LazyFrame essential =
            frames.lookthroughs->filter(Expr::col("record_type").eq(Expr::lit(ESSENTIAL_LOOKTHROUGHS)));
        parts = parts.union_all(contributions(essential));
      }

      std::vector<NamedExpr> sums;
      for (auto *fc : holdings)
        sums.push_back({"den_" + fc->column, Expr::col("c_" + fc->column).sum(), ColumnType::Double});
      LazyFrame denominators = parts.group_by(keys, sums);

      std::vector<NamedExpr> scaled;
      for (auto *fc : holdings)
        scaled.push_back({fc->column, divide_unless_zero(fc->column, Expr::col("den_" + fc->column)), ColumnType::Double});

      std::vector<std::string> keep_cols;
      for (auto &c : frames.positions.columns())
        keep_cols.push_back(c.name);
      frames.positions = frames.positions.left_join(denominators, {{"container", "container"}, {"sub_portfolio_id", "sub_portfolio_id"}})
                             .with_columns(scaled)
                             .select_columns(keep_cols);
    }

    if (!looks.empty() && !lookthrough_weights.empty()) {
      const LazyFrame &lt = *frames.lookthroughs;
      const std::string &weight = lookthrough_weights.front();
      const std::vector<std::string> partition = {"container", "parent_instrument_id", "sub_portfolio_id", "record_type"};
      std::vector<NamedExpr> scaled;
      for (auto *fc : looks) {
        if (!lt.has("parent_instrument_id"))
          continue;
        Expr total = Expr::window_sum(weighted(lt, weight, fc->column), partition);
        scaled.push_back({fc->column, divide_unless_zero(fc->column, total), ColumnType::Double});
      }
      frames.lookthroughs = lt.with_columns(scaled);
    }
    return frames;
  }

  const ConfigurationManager &config_;
  const PrecomputedValues *precomputed_;
};

} // namespace perspective
