#include "TestFixtures.hpp"
#include "DatasetWriters.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/source/EmbeddedRelationalAdapter.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::source;
using namespace dsvalidator::test;

namespace {

// GeoPackage header (no envelope, srs 4326) followed by WKB Point(1 2)
const char *kGpkgPoint = "X'47500001E6100000"
                         "0101000000000000000000F03F0000000000000040'";

} // namespace

class EmbeddedRelationalAdapterTest : public ValidatorTest {
protected:
  std::filesystem::path write_parcels(size_t rows) {
    std::vector<std::string> values;
    for (size_t i = 1; i <= rows; ++i) {
      std::string land_use = i % 4 == 0 ? "NULL" : "'forest'";
      values.push_back(std::to_string(i) + ", " + land_use + ", " +
                       std::to_string(i) + ".5, " + kGpkgPoint);
    }
    auto file = path("parcels.gpkg");
    write_geopackage(file, "parcels",
                     "fid INTEGER PRIMARY KEY, land_use TEXT, area REAL, "
                     "geom BLOB",
                     values);
    return file;
  }

  size_t count_rows(DatasetHandle &handle, const std::vector<std::string> &cols,
                    size_t chunk_size) {
    auto stream = handle.iter_chunks(chunk_size, cols);
    RowChunk chunk;
    size_t rows = 0;
    while (stream->next(chunk)) {
      EXPECT_LE(chunk.row_count, chunk_size);
      rows += chunk.row_count;
    }
    return rows;
  }

  EmbeddedRelationalAdapter adapter_;
};

TEST(SqlIdentifiers, QuoteIdentifier) {
  EXPECT_EQ(quote_identifier("parcels"), "\"parcels\"");
  EXPECT_EQ(quote_identifier("odd\"name"), "\"odd\"\"name\"");
}

TEST_F(EmbeddedRelationalAdapterTest, LayerFromContents) {
  auto file = write_parcels(3);
  auto handle = adapter_.open(file.string(), {});
  auto schema = handle->schema_probe();
  ASSERT_EQ(schema.size(), 4u);
  EXPECT_EQ(schema[0].name, "fid");
  EXPECT_EQ(schema[0].physical_type, "INTEGER");
  EXPECT_EQ(schema[3].name, "geom");
  EXPECT_EQ(handle->diagnostics().at("layer"), "parcels");
}

TEST_F(EmbeddedRelationalAdapterTest, KeysetPagingReadsEverything) {
  auto file = write_parcels(10);
  auto handle = adapter_.open(file.string(), {});
  auto stream = handle->iter_chunks(3, {"land_use", "area", "geom"});
  EXPECT_EQ(handle->diagnostics().at("strategy"), "keyset");

  RowChunk chunk;
  std::vector<CellValue> land_use;
  size_t rows = 0;
  while (stream->next(chunk)) {
    EXPECT_EQ(chunk.first_row, rows + 1);
    rows += chunk.row_count;
    land_use.insert(land_use.end(), chunk.columns[0].begin(),
                    chunk.columns[0].end());
    ASSERT_TRUE(std::holds_alternative<Blob>(chunk.columns[2][0]));
    EXPECT_EQ(std::get<Blob>(chunk.columns[2][0]).bytes[0], 'G');
    EXPECT_TRUE(std::holds_alternative<double>(chunk.columns[1][0]));
  }
  EXPECT_EQ(rows, 10u);
  ASSERT_EQ(land_use.size(), 10u);
  EXPECT_TRUE(is_absent(land_use[3]));
  EXPECT_EQ(std::get<std::string>(land_use[0]), "forest");
}

TEST_F(EmbeddedRelationalAdapterTest, ExactMultipleOfChunkSize) {
  auto file = write_parcels(6);
  auto handle = adapter_.open(file.string(), {});
  EXPECT_EQ(count_rows(*handle, {"fid"}, 3), 6u);
}

TEST_F(EmbeddedRelationalAdapterTest, ExplicitLayer) {
  auto file = path("multi.gpkg");
  write_sqlite(file, {"CREATE TABLE first_table (a INTEGER)",
                      "CREATE TABLE second_table (b TEXT, c REAL)",
                      "INSERT INTO second_table VALUES ('x', 1.0)",
                      "INSERT INTO second_table VALUES ('y', 2.0)"});
  OpenOptions options;
  options.layer = "second_table";
  auto handle = adapter_.open(file.string(), options);
  EXPECT_EQ(handle->schema_probe().size(), 2u);
  EXPECT_EQ(count_rows(*handle, {"b"}, 10), 2u);
}

TEST_F(EmbeddedRelationalAdapterTest, FirstUserTableWithoutContents) {
  auto file = path("plain.sqlite");
  write_sqlite(file, {"CREATE TABLE only_table (v TEXT)",
                      "INSERT INTO only_table VALUES ('a')"});
  auto handle = adapter_.open(file.string(), {});
  EXPECT_EQ(handle->diagnostics().at("layer"), "only_table");
}

TEST_F(EmbeddedRelationalAdapterTest, MissingLayerIsCorruption) {
  auto file = write_parcels(1);
  OpenOptions options;
  options.layer = "roads";
  EXPECT_THROW(adapter_.open(file.string(), options), CorruptionError);
}

TEST_F(EmbeddedRelationalAdapterTest, WithoutRowidUsesCursor) {
  auto file = path("norowid.gpkg");
  write_sqlite(file, {"CREATE TABLE codes (code TEXT PRIMARY KEY, n INTEGER) "
                      "WITHOUT ROWID",
                      "INSERT INTO codes VALUES ('a', 1)",
                      "INSERT INTO codes VALUES ('b', 2)",
                      "INSERT INTO codes VALUES ('c', 3)"});
  auto handle = adapter_.open(file.string(), {});
  EXPECT_EQ(count_rows(*handle, {"n"}, 2), 3u);
  EXPECT_EQ(handle->diagnostics().at("strategy"), "cursor");
}

TEST_F(EmbeddedRelationalAdapterTest, ViewLayerUsesCursor) {
  auto file = path("view.gpkg");
  write_sqlite(file, {"CREATE TABLE base (name TEXT, area REAL)",
                      "INSERT INTO base VALUES ('a', 1.0)",
                      "INSERT INTO base VALUES ('b', 2.0)",
                      "INSERT INTO base VALUES ('c', 3.0)",
                      "CREATE VIEW big AS SELECT name, area FROM base "
                      "WHERE area > 1"});
  OpenOptions options;
  options.layer = "big";
  auto handle = adapter_.open(file.string(), options);
  EXPECT_EQ(handle->schema_probe().size(), 2u);
  EXPECT_EQ(count_rows(*handle, {"name", "area"}, 1), 2u);
  EXPECT_EQ(handle->diagnostics().at("strategy"), "cursor");
}

TEST_F(EmbeddedRelationalAdapterTest, NotSqliteIsCorruption) {
  auto file = path("fake.gpkg");
  write_text_file(file, "definitely not a database file, just text");
  EXPECT_THROW(adapter_.open(file.string(), {}), CorruptionError);
}

TEST_F(EmbeddedRelationalAdapterTest, EmptyDatabaseIsCorruption) {
  auto file = path("empty.gpkg");
  write_sqlite(file, {"CREATE TABLE gpkg_contents (table_name TEXT, "
                      "data_type TEXT)"});
  EXPECT_THROW(adapter_.open(file.string(), {}), CorruptionError);
}
