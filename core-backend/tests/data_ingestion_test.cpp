// =============================================================================
// data_ingestion_test.cpp
// =============================================================================
// Unit tests for perspective::DataIngestion and the record helpers.
//
// Validates:
//   - Containers are detected by position_type; lookthrough keys by substring
//   - Rows inherit container / position_type and carry identifier / record_type
//   - Column types are inferred over all rows
//   - Standardisation: instrument_identifier, sub_portfolio_id, perspective_id
//   - Sentinel filling skips weight labels and non-numeric columns
//   - Reference join on instrument_id / parent_instrument_id, input columns win
//   - Declared columns exist after the join even when a reference table is empty
// =============================================================================

#include "core/constants.hpp"
#include "perspective/data_ingestion.hpp"

#include <gtest/gtest.h>

#include <duckdb.hpp>
#include <map>
#include <string>

using namespace perspective;

namespace {

json sample_request() {
  return json::parse(R"({
    "fund_a": {
      "position_type": "holding",
      "positions": {
        "1": {"instrument_identifier": 11, "weight": 0.6, "liquidity_type_id": 2, "parent_instrument_id": null},
        "2": {"instrument_identifier": 12, "weight": null, "liquidity_type_id": null, "sub_portfolio_id": 7}
      },
      "essential_lookthroughs": {
        "10": {"instrument_identifier": 21, "parent_instrument_id": 11, "weight": 0.1}
      },
      "metadata": {"note": "ignored"}
    },
    "perspective_configurations": {"cfg": {"1": null}},
    "not_a_container": {"positions": {}}
  })");
}

// identifier → {column: value}
std::map<std::string, json> by_identifier(const ResultTable &t) {
  std::map<std::string, json> out;
  int id = t.index_of("identifier");
  for (auto &row : t.rows) {
    json obj = json::object();
    for (size_t i = 0; i < t.names.size(); ++i)
      obj[t.names[i]] = row[i];
    out[row[id].get<std::string>()] = obj;
  }
  return out;
}

} // namespace

TEST(ExtractRecordsTest, ContainersAndLookthroughs) {
  Records r = extract_records(sample_request());
  ASSERT_EQ(r.positions.size(), 2u);
  ASSERT_EQ(r.lookthroughs.size(), 1u);
  EXPECT_EQ(r.positions[0]["container"], "fund_a");
  EXPECT_EQ(r.positions[0]["position_type"], "holding");
  EXPECT_EQ(r.positions[0]["record_type"], "position");
  EXPECT_EQ(r.lookthroughs[0]["record_type"], "essential_lookthroughs");
  EXPECT_EQ(r.lookthroughs[0]["identifier"], "10");
}

TEST(ExtractRecordsTest, InstrumentIdsExcludeSentinelParents) {
  Records r = extract_records(sample_request());
  r.positions[1]["parent_instrument_id"] = INT_NULL;
  InstrumentIds ids = collect_instrument_ids(r);
  EXPECT_EQ(ids.instrument_ids, (std::vector<int64_t>{11, 12, 21}));
  EXPECT_EQ(ids.parent_instrument_ids, (std::vector<int64_t>{11}));
}

TEST(InferTypeTest, TypesOverAllRows) {
  std::vector<json> rows = {{{"a", 1}, {"b", 1}, {"c", true}, {"d", "x"}, {"e", nullptr}, {"f", {{"k", 1}}}},
                            {{"a", 2}, {"b", 2.5}, {"c", false}, {"d", 3}}};
  auto cols = infer_schema(rows);
  std::map<std::string, ColumnType> types;
  for (auto &c : cols)
    types[c.name] = c.type;
  EXPECT_EQ(types["a"], ColumnType::Integer);
  EXPECT_EQ(types["b"], ColumnType::Double);
  EXPECT_EQ(types["c"], ColumnType::Boolean);
  EXPECT_EQ(types["d"], ColumnType::Text);
  EXPECT_EQ(types["e"], ColumnType::Null);
  EXPECT_EQ(types["f"], ColumnType::Text);
}

// =============================================================================
// Fixture with a live DuckDB connection
// =============================================================================
class DataIngestionTest : public ::testing::Test {
protected:
  duckdb::DuckDB db{nullptr};
  duckdb::Connection conn{db};
  DataIngestion ingestion{conn, 1}; // 每条 INSERT 一行, 顺带覆盖分批

  Frames build() {
    auto frames = ingestion.build_frames(extract_records(sample_request()), {"weight"});
    EXPECT_TRUE(frames.has_value());
    return *frames;
  }
};

TEST_F(DataIngestionTest, StandardisesAndFills) {
  Frames f = build();
  auto rows = by_identifier(collect(conn, f.positions));
  ASSERT_EQ(rows.size(), 2u);

  EXPECT_EQ(rows["1"]["instrument_id"], 11);
  EXPECT_EQ(rows["1"]["sub_portfolio_id"], "default");
  EXPECT_EQ(rows["2"]["sub_portfolio_id"], "7");
  EXPECT_EQ(rows["1"]["perspective_id"], INT_NULL);
  EXPECT_EQ(rows["2"]["liquidity_type_id"], INT_NULL);
  // weight 保留真正的 null
  EXPECT_TRUE(rows["2"]["weight"].is_null());
  // 全空列没有类型, 不填充
  EXPECT_TRUE(rows["1"]["parent_instrument_id"].is_null());
}

TEST_F(DataIngestionTest, EmptyPositionsShortCircuit) {
  json request = {{"c", {{"position_type", "x"}, {"positions", json::object()}}}};
  EXPECT_FALSE(ingestion.build_frames(extract_records(request), {"weight"}).has_value());
}

TEST_F(DataIngestionTest, ReferenceJoinInputWins) {
  Frames f = build();

  loaders::ReferenceTables tables;
  ResultTable cat;
  cat.names = {"instrument_id", "liquidity_type_id", "position_source_type_id"};
  cat.rows = {{11, 5, 9}, {12, 6, 9}, {21, 7, 10}, {21, 8, 10}};
  tables[INSTRUMENT_CATEGORIZATION_TABLE] = cat;

  ResultTable parent;
  parent.names = {"parent_instrument_id", "parent_instrument_subtype_id"};
  parent.rows = {{11, 27}};
  tables[PARENT_INSTRUMENT_TABLE] = parent;

  Frames joined = ingestion.join_reference(f, tables);

  auto pos = by_identifier(collect(conn, joined.positions));
  ASSERT_EQ(pos.size(), 2u);
  EXPECT_EQ(pos["1"]["liquidity_type_id"], 2);
  EXPECT_EQ(pos["1"]["position_source_type_id"], 9);

  auto lt = by_identifier(collect(conn, joined.lookthroughs.value()));
  ASSERT_EQ(lt.size(), 1u); // 重复 key 去重, 不放大行数
  EXPECT_EQ(lt["10"]["position_source_type_id"], 10);
  EXPECT_EQ(lt["10"]["parent_instrument_subtype_id"], 27);
}

TEST_F(DataIngestionTest, DeclaredColumnsAddedAfterJoin) {
  Frames f = DataIngestion::ensure_declared_columns(build(), {"trade_type_id", "liquidity_type_id"});
  ASSERT_TRUE(f.positions.has("trade_type_id"));
  EXPECT_EQ(f.positions.type_of("trade_type_id"), ColumnType::Integer);
  auto rows = by_identifier(collect(conn, f.positions));
  EXPECT_EQ(rows["1"]["trade_type_id"], INT_NULL);
  EXPECT_EQ(rows["1"]["liquidity_type_id"], 2);
}

TEST_F(DataIngestionTest, EmptyReferenceTableStillYieldsDeclaredColumn) {
  loaders::ReferenceTables tables;
  ResultTable instrument;
  instrument.names = {"instrument_id", "instrument_subtype_id"};
  tables[INSTRUMENT_TABLE] = instrument; // 0 行, join 被跳过

  Frames f = DataIngestion::ensure_declared_columns(ingestion.join_reference(build(), tables),
                                                    {"instrument_subtype_id"});
  ASSERT_TRUE(f.positions.has("instrument_subtype_id"));
  ASSERT_TRUE(f.lookthroughs->has("instrument_subtype_id"));
  auto rows = by_identifier(collect(conn, f.positions));
  EXPECT_EQ(rows["1"]["instrument_subtype_id"], INT_NULL);
}

TEST(ReferenceTablesToLoadTest, CategorizationBaseColumnsAlwaysAdded) {
  RequiredColumns rc;
  rc.add(POSITION_DATA_TABLE, "liquidity_type_id");
  EXPECT_TRUE(reference_tables_to_load(rc).empty());

  rc.add(INSTRUMENT_TABLE, "instrument_subtype_id");
  RequiredColumns out = reference_tables_to_load(rc);
  EXPECT_EQ(out.find(POSITION_DATA_TABLE), nullptr);
  auto *cat = out.find(INSTRUMENT_CATEGORIZATION_TABLE);
  ASSERT_NE(cat, nullptr);
  EXPECT_EQ(*cat, (std::vector<std::string>{"liquidity_type_id", "position_source_type_id"}));
}
