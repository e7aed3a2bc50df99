// =============================================================================
// reference_loader_test.cpp
// =============================================================================
// Unit tests for loaders::DatabaseReferenceLoader and DatabasePerspectiveLoader.
//
// Validates:
//   - Each table is fetched for the requested instrument ids only
//   - INSTRUMENT_CATEGORIZATION is pinned to ED and the system version window
//   - PARENT_INSTRUMENT reads INSTRUMENT keyed by parent id, columns prefixed
//   - position_data is never fetched; empty id lists yield empty tables
//   - A failing table fetch raises ReferenceLoadError
//   - Perspective documents are versioned; the latest as of a timestamp wins
// =============================================================================

#include "core/constants.hpp"
#include "core/database.hpp"
#include "core/errors.hpp"
#include "core/reference_schema.hpp"
#include "loaders/perspective_loader.hpp"
#include "loaders/reference_loader.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

using namespace perspective;

// =============================================================================
// Fixture: in-memory reference store
// =============================================================================
class ReferenceLoaderTest : public ::testing::Test {
protected:
  Database db{""};
  loaders::DatabaseReferenceLoader loader{db};

  void SetUp() override {
    db.init_reference_store("perspective_documents");

    auto row = [](std::initializer_list<json> cells) {
      std::string s;
      for (auto &c : cells) {
        if (!s.empty())
          s += ", ";
        s += reference::json_sql_value(c);
      }
      return s;
    };

    db.batch_insert("INSTRUMENT", "instrument_id, instrument_subtype_id, instrument_name",
                    {row({11, 27, "Alpha"}), row({12, 38, "Beta"}), row({99, 1, "Unused"})});

    db.batch_insert("INSTRUMENT_CATEGORIZATION",
                    "instrument_id, ED, liquidity_type_id, position_source_type_id, valid_from, valid_to",
                    {"11, DATE '2024-01-01', 2, 9, TIMESTAMP '2023-01-01', NULL",
                     "11, DATE '2024-06-30', 3, 9, TIMESTAMP '2023-01-01', NULL",
                     "12, DATE '2024-01-01', 4, 9, TIMESTAMP '2023-01-01', TIMESTAMP '2024-03-01'",
                     "12, DATE '2024-01-01', 5, 9, TIMESTAMP '2024-03-01', NULL"});
  }

  static RequiredColumns tables(std::initializer_list<std::pair<std::string, std::string>> cols) {
    RequiredColumns rc;
    for (auto &[t, c] : cols)
      rc.add(t, c);
    return rc;
  }

  // instrument_id → 第一列之后的值
  static std::map<int64_t, json> keyed(const ResultTable &t) {
    std::map<int64_t, json> out;
    for (auto &row : t.rows)
      out[row[0].get<int64_t>()] = row[1];
    return out;
  }
};

TEST_F(ReferenceLoaderTest, CurrentCategorizationForEffectiveDate) {
  loaders::ReferenceQuery q;
  q.instrument_ids = {11, 12};
  auto result = loader.load(tables({{INSTRUMENT_CATEGORIZATION_TABLE, "liquidity_type_id"}}), q);

  const ResultTable &cat = result.at(INSTRUMENT_CATEGORIZATION_TABLE);
  EXPECT_EQ(cat.names, (std::vector<std::string>{"instrument_id", "liquidity_type_id"}));
  auto values = keyed(cat);
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[11], 2);
  EXPECT_EQ(values[12], 5);
}

TEST_F(ReferenceLoaderTest, SystemVersionTimestampSelectsHistoricRow) {
  loaders::ReferenceQuery q;
  q.instrument_ids = {12};
  q.system_version_timestamp = "2024-02-01 00:00:00";
  auto result = loader.load(tables({{INSTRUMENT_CATEGORIZATION_TABLE, "liquidity_type_id"}}), q);
  auto values = keyed(result.at(INSTRUMENT_CATEGORIZATION_TABLE));
  ASSERT_EQ(values.size(), 1u);
  EXPECT_EQ(values[12], 4);
}

TEST_F(ReferenceLoaderTest, OtherEffectiveDate) {
  loaders::ReferenceQuery q;
  q.instrument_ids = {11};
  q.ed = "2024-06-30";
  auto result = loader.load(tables({{INSTRUMENT_CATEGORIZATION_TABLE, "liquidity_type_id"}}), q);
  EXPECT_EQ(keyed(result.at(INSTRUMENT_CATEGORIZATION_TABLE))[11], 3);
}

TEST_F(ReferenceLoaderTest, ParentInstrumentIsPrefixed) {
  loaders::ReferenceQuery q;
  q.instrument_ids = {11};
  q.parent_instrument_ids = {12, INT_NULL};
  auto result = loader.load(tables({{INSTRUMENT_TABLE, "instrument_subtype_id"},
                                    {PARENT_INSTRUMENT_TABLE, "instrument_subtype_id"},
                                    {POSITION_DATA_TABLE, "weight"}}),
                            q);

  EXPECT_EQ(result.count(POSITION_DATA_TABLE), 0u);
  EXPECT_EQ(keyed(result.at(INSTRUMENT_TABLE))[11], 27);

  const ResultTable &parent = result.at(PARENT_INSTRUMENT_TABLE);
  EXPECT_EQ(parent.names, (std::vector<std::string>{"parent_instrument_id", "parent_instrument_subtype_id"}));
  EXPECT_EQ(keyed(parent)[12], 38);
}

TEST_F(ReferenceLoaderTest, EmptyIdsGiveEmptyTables) {
  loaders::ReferenceQuery q;
  auto result = loader.load(tables({{INSTRUMENT_TABLE, "instrument_subtype_id"},
                                    {PARENT_INSTRUMENT_TABLE, "instrument_subtype_id"}}),
                            q);
  EXPECT_TRUE(result.at(INSTRUMENT_TABLE).empty());
  EXPECT_EQ(result.at(PARENT_INSTRUMENT_TABLE).names.front(), "parent_instrument_id");
}

TEST_F(ReferenceLoaderTest, MissingTableFailsRequest) {
  loaders::ReferenceQuery q;
  q.instrument_ids = {11};
  EXPECT_THROW(loader.load(tables({{"NO_SUCH_TABLE", "x"}, {INSTRUMENT_TABLE, "instrument_subtype_id"}}), q),
               ReferenceLoadError);
}

TEST_F(ReferenceLoaderTest, PerspectiveDocumentAsOfTimestamp) {
  loaders::DatabasePerspectiveLoader docs(db, "perspective_documents");
  EXPECT_THROW(docs.load(std::nullopt), ConfigError);

  docs.store(json::parse(R"({"perspectives": [{"id": 1, "name": "old", "rules": []}]})"),
             std::string("2023-01-01"));
  docs.store(json::parse(R"({"perspectives": [{"id": 1, "name": "new", "rules": []}]})"),
             std::string("2024-01-01"));

  EXPECT_EQ(docs.load(std::nullopt).at(1).name, "new");
  EXPECT_EQ(docs.load(std::string("2023-06-01")).at(1).name, "old");
  EXPECT_THROW(docs.load(std::string("2000-01-01")), ConfigError);
}

TEST_F(ReferenceLoaderTest, StoreRejectsMalformedDocuments) {
  loaders::DatabasePerspectiveLoader docs(db, "perspective_documents");
  EXPECT_THROW(docs.store(json::array()), InputError);
  EXPECT_THROW(docs.store(json::parse(R"({"perspectives": [{"id": "x"}]})")), ConfigError);
}

TEST_F(ReferenceLoaderTest, MissingPerspectiveTable) {
  loaders::DatabasePerspectiveLoader docs(db, "no_such_documents");
  EXPECT_THROW(docs.load(std::nullopt), ConfigError);
}
