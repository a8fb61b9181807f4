#include "TestFixtures.hpp"
#include "DatasetWriters.hpp"
#include "dataset-validator/Report.hpp"
#include "dataset-validator/engine/StreamingValidator.hpp"
#include "dataset-validator/source/DelimitedTextAdapter.hpp"
#include "dataset-validator/source/parquet/ParquetMetadata.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::engine;
using namespace dsvalidator::test;

namespace pq = dsvalidator::source::parquet;

class StreamingValidatorTest : public ValidatorTest {
protected:
  RunResult validate(const Template &tmpl, const std::filesystem::path &file,
                     ValidatorConfig config = {},
                     const RunOptions &options = {}) {
    StreamingValidator validator(tmpl, std::move(config), "test-run");
    RunResult result = validator.run(file.string(), options);
    EXPECT_EQ(validator.state(), RunState::Finalized);
    return result;
  }

  static int exit_code(const RunResult &result) {
    return ReportBuilder::exit_code_for(
        result.aggregator, result.internal_failure, result.timed_out);
  }

  static std::vector<uint64_t> rows_of(const RunResult &result,
                                       ViolationKind kind) {
    std::vector<uint64_t> rows;
    for (const auto &v : result.aggregator.samples())
      if (v.kind == kind && v.row_index)
        rows.push_back(*v.row_index);
    return rows;
  }

  Template unique_id_template() {
    return make_template(R"({
      "template_id": "ids", "version": "1.0.0",
      "columns": [
        {"name": "id", "dtype": "int64", "required": true, "unique": true}
      ]
    })");
  }
};

TEST(RunStates, Names) {
  EXPECT_EQ(to_string(RunState::Init), "INIT");
  EXPECT_EQ(to_string(RunState::SchemaCheck), "SCHEMA_CHECK");
  EXPECT_EQ(to_string(RunState::Scanning), "SCANNING");
  EXPECT_EQ(to_string(RunState::Finalized), "FINALIZED");
}

TEST_F(StreamingValidatorTest, DuplicateAndNullInUniqueColumn) {
  auto tmpl = unique_id_template();
  auto file = path("ids.csv");
  write_text_file(file, "id,name\n1,a\n2,b\n2,c\n,d\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 4u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::DuplicateError), 1u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::NullError), 1u);
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            std::vector<uint64_t>{3});
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{4});
  EXPECT_EQ(result.null_counts.at("id"), 1u);
  EXPECT_EQ(*result.format, source::SourceFormat::DelimitedText);
  // NullError outranks DuplicateError
  EXPECT_EQ(exit_code(result), EXIT_DATA);
}

TEST_F(StreamingValidatorTest, SingleColumnDuplicateThenEmptyLine) {
  auto tmpl = unique_id_template();
  auto file = path("ids.csv");
  write_text_file(file, "id\n1\n2\n2\n\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 4u);
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            std::vector<uint64_t>{3});
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{4});
  EXPECT_EQ(exit_code(result), EXIT_DATA);
}

TEST_F(StreamingValidatorTest, RequiredNullSkipsRangeCheck) {
  auto tmpl = make_template(R"({
    "template_id": "scores", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true},
      {"name": "score", "dtype": "float64", "required": true,
       "range": {"min": 0, "max": 10}}
    ]
  })");
  auto file = path("scores.csv");
  write_text_file(file, "id,score\n1,5\n2,\n3,7.5\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.aggregator.count(ViolationKind::NullError), 1u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::RangeError), 0u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::TypeError), 0u);
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{2});
}

TEST_F(StreamingValidatorTest, RepeatedRunsAgree) {
  auto tmpl = make_template(R"({
    "template_id": "mixed", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true, "unique": true},
      {"name": "kind", "dtype": "string", "enum": ["a", "b"]},
      {"name": "score", "dtype": "float64", "range": {"min": 0, "max": 10}}
    ]
  })");
  auto file = path("mixed.csv");
  write_text_file(file, "id,kind,score\n1,a,1\n2,c,2\n2,b,11\n,a,x\n5,,\n");

  ValidatorConfig config;
  config.chunk_size = 2;
  auto first = validate(tmpl, file, config);
  auto second = validate(tmpl, file, config);

  EXPECT_EQ(first.row_count, second.row_count);
  EXPECT_EQ(first.null_counts, second.null_counts);
  EXPECT_EQ(first.aggregator.counts(), second.aggregator.counts());
  EXPECT_EQ(exit_code(first), exit_code(second));
  const auto &a = first.aggregator.samples();
  const auto &b = second.aggregator.samples();
  ASSERT_EQ(a.size(), b.size());
  ASSERT_FALSE(a.empty());
  for (size_t i = 0; i < a.size(); ++i) {
    EXPECT_EQ(a[i].kind, b[i].kind);
    EXPECT_EQ(a[i].column, b[i].column);
    EXPECT_EQ(a[i].row_index, b[i].row_index);
    EXPECT_EQ(a[i].message, b[i].message);
  }
}

TEST_F(StreamingValidatorTest, CleanFileExitsZero) {
  auto tmpl = unique_id_template();
  auto file = path("ids.csv");
  write_text_file(file, "id\n1\n2\n3\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 3u);
  EXPECT_EQ(result.aggregator.error_count(), 0u);
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, ResultsDoNotDependOnChunkSize) {
  auto tmpl = make_template(R"({
    "template_id": "mixed", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true, "unique": true},
      {"name": "kind", "dtype": "string", "enum": ["a", "b"]},
      {"name": "score", "dtype": "float64", "range": {"min": 0, "max": 10}}
    ]
  })");
  std::string content = "id,kind,score\n";
  for (int i = 1; i <= 200; ++i) {
    std::string id = i % 17 == 0 ? "5" : std::to_string(i);
    std::string kind = i % 11 == 0 ? "c" : (i % 2 ? "a" : "b");
    std::string score = i % 13 == 0 ? "x" : std::to_string(i % 15);
    content += id + "," + kind + "," + score + "\n";
  }
  auto file = path("mixed.csv");
  write_text_file(file, content);

  std::vector<RunResult> results;
  for (size_t chunk : {1u, 7u, 64u, 65536u}) {
    ValidatorConfig config;
    config.chunk_size = chunk;
    results.push_back(validate(tmpl, file, config));
  }
  const auto &base = results.front();
  EXPECT_EQ(base.row_count, 200u);
  EXPECT_GT(base.aggregator.count(ViolationKind::DuplicateError), 0u);
  EXPECT_GT(base.aggregator.count(ViolationKind::EnumError), 0u);
  EXPECT_GT(base.aggregator.count(ViolationKind::RangeError), 0u);
  EXPECT_GT(base.aggregator.count(ViolationKind::TypeError), 0u);
  for (const auto &other : results) {
    EXPECT_EQ(other.row_count, base.row_count);
    EXPECT_EQ(other.aggregator.counts(), base.aggregator.counts());
    for (auto kind : ALL_VIOLATION_KINDS)
      EXPECT_EQ(rows_of(other, kind), rows_of(base, kind));
  }
}

TEST_F(StreamingValidatorTest, SamplesAreCappedCountsAreNot) {
  auto tmpl = make_template(R"({
    "template_id": "typed", "version": "1.0.0",
    "columns": [{"name": "n", "dtype": "int64"}]
  })");
  std::string content = "n\n";
  for (int i = 0; i < 25; ++i)
    content += "bad\n";
  auto file = path("typed.csv");
  write_text_file(file, content);

  ValidatorConfig config;
  config.violation_cap = 3;
  auto result = validate(tmpl, file, config);
  EXPECT_EQ(result.aggregator.count(ViolationKind::TypeError), 25u);
  EXPECT_EQ(result.aggregator.samples().size(), 3u);
  EXPECT_EQ(rows_of(result, ViolationKind::TypeError),
            (std::vector<uint64_t>{1, 2, 3}));
}

TEST_F(StreamingValidatorTest, MissingRequiredColumnStopsBeforeScan) {
  auto tmpl = make_template(R"({
    "template_id": "pair", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true},
      {"name": "name", "dtype": "string", "required": true}
    ]
  })");
  auto file = path("pair.csv");
  write_text_file(file, "id\n1\n2\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 0u);
  EXPECT_TRUE(result.null_counts.empty());
  ASSERT_EQ(result.aggregator.samples().size(), 1u);
  const auto &v = result.aggregator.samples()[0];
  EXPECT_EQ(v.kind, ViolationKind::SchemaError);
  EXPECT_EQ(*v.column, "name");
  EXPECT_FALSE(v.row_index.has_value());
  EXPECT_EQ(exit_code(result), EXIT_SCHEMA);
}

TEST_F(StreamingValidatorTest, MissingOptionalColumnIsFine) {
  auto tmpl = make_template(R"({
    "template_id": "pair", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true},
      {"name": "note", "dtype": "string"}
    ]
  })");
  auto file = path("pair.csv");
  write_text_file(file, "id\n1\n2\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(result.null_counts.count("note"), 0u);
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, UndeclaredColumnsWarnWhenNotAllowed) {
  auto tmpl = make_template(R"({
    "template_id": "strict", "version": "1.0.0",
    "allow_extra_columns": false,
    "columns": [{"name": "id", "dtype": "int64", "required": true}]
  })");
  auto file = path("strict.csv");
  write_text_file(file, "id,extra\n1,x\n2,y\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(result.aggregator.warning_count(), 1u);
  EXPECT_EQ(result.aggregator.error_count(), 0u);
  ASSERT_EQ(result.aggregator.samples().size(), 1u);
  EXPECT_EQ(result.aggregator.samples()[0].severity, Severity::Warning);
  EXPECT_EQ(*result.aggregator.samples()[0].column, "extra");
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, CorruptionMidFileKeepsEarlierRows) {
  auto tmpl = unique_id_template();
  auto file = path("broken.csv");
  write_text_file(file, "id,name\n1,a\n2,b\n3,c,extra\n4,d\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::CorruptionError), 1u);
  EXPECT_EQ(rows_of(result, ViolationKind::CorruptionError),
            std::vector<uint64_t>{3});
  EXPECT_EQ(exit_code(result), EXIT_CORRUPTION);
}

TEST_F(StreamingValidatorTest, UnopenableFileReportsZeroRows) {
  auto tmpl = unique_id_template();
  auto file = path("data.parquet");
  write_parquet(file, {{"id", pq::INT64, ParquetAnnotation::None, false,
                        {CellValue{int64_t{1}}, CellValue{int64_t{2}}}}});
  std::string bytes = read_file(file);
  auto truncated = path("truncated.parquet");
  write_text_file(truncated, bytes.substr(0, bytes.size() / 2));

  auto result = validate(tmpl, truncated);
  EXPECT_EQ(result.row_count, 0u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::CorruptionError), 1u);
  EXPECT_EQ(exit_code(result), EXIT_CORRUPTION);

  Report report = ReportBuilder::build(tmpl, result);
  EXPECT_FALSE(report.ok);
  EXPECT_EQ(report.exit_code, EXIT_CORRUPTION);
}

TEST_F(StreamingValidatorTest, MissingInputIsCorruption) {
  auto tmpl = unique_id_template();
  auto result = validate(tmpl, path("nowhere.csv"));
  EXPECT_EQ(result.row_count, 0u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::CorruptionError), 1u);
  EXPECT_EQ(exit_code(result), EXIT_CORRUPTION);
}

TEST_F(StreamingValidatorTest, TimeoutIsInternal) {
  auto tmpl = unique_id_template();
  std::string content = "id\n";
  for (int i = 1; i <= 50; ++i)
    content += std::to_string(i) + "\n";
  auto file = path("ids.csv");
  write_text_file(file, content);

  ValidatorConfig config;
  config.timeout_seconds = 1e-9;
  config.chunk_size = 5;
  auto result = validate(tmpl, file, config);
  EXPECT_TRUE(result.timed_out);
  EXPECT_TRUE(result.internal_failure);
  EXPECT_LT(result.row_count, 50u);
  EXPECT_EQ(exit_code(result), EXIT_INTERNAL);
}

TEST_F(StreamingValidatorTest, CompositeDuplicateUsesCheckSeverity) {
  auto tmpl = make_template(R"({
    "template_id": "pairs", "version": "1.0.0",
    "columns": [
      {"name": "a", "dtype": "string", "required": true},
      {"name": "b", "dtype": "int64", "required": true}
    ],
    "duplicate_checks": [{"keys": ["a", "b"], "severity": "warning"}]
  })");
  auto file = path("pairs.csv");
  write_text_file(file, "a,b\nx,1\nx,2\nx,1\ny,1\nx,01\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 5u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::DuplicateError), 2u);
  EXPECT_EQ(result.aggregator.warning_count(), 2u);
  EXPECT_EQ(result.aggregator.error_count(), 0u);
  // "01" coerces to the same int64 as "1"
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            (std::vector<uint64_t>{3, 5}));
  EXPECT_EQ(*result.aggregator.samples()[0].column, "a,b");
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, CompositeDuplicateErrorSeverity) {
  auto tmpl = make_template(R"({
    "template_id": "pairs", "version": "1.0.0",
    "columns": [
      {"name": "a", "dtype": "string"},
      {"name": "b", "dtype": "string"}
    ],
    "duplicate_checks": [{"keys": ["a", "b"]}]
  })");
  auto file = path("pairs.csv");
  // Rows with a missing key part never collide
  write_text_file(file, "a,b\nx,y\nx,\nx,\nx,y\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            std::vector<uint64_t>{4});
  EXPECT_EQ(exit_code(result), EXIT_DUPLICATES);
}

TEST_F(StreamingValidatorTest, NullEquivalents) {
  auto tmpl = make_template(R"({
    "template_id": "nulls", "version": "1.0.0",
    "null_equivalents": ["NA", "-"],
    "columns": [
      {"name": "v", "dtype": "float64", "required": true},
      {"name": "w", "dtype": "float64"}
    ]
  })");
  auto file = path("nulls.csv");
  write_text_file(file, "v,w\n1.5,NA\nNA,-\n-,2\nn/a,3\n");

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.null_counts.at("v"), 2u);
  EXPECT_EQ(result.null_counts.at("w"), 2u);
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            (std::vector<uint64_t>{2, 3}));
  // Only the listed tokens are nulls
  EXPECT_EQ(rows_of(result, ViolationKind::TypeError),
            std::vector<uint64_t>{4});
}

TEST_F(StreamingValidatorTest, ParquetInput) {
  auto tmpl = make_template(R"({
    "template_id": "parcels", "version": "1.0.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true, "unique": true},
      {"name": "name", "dtype": "string", "required": true},
      {"name": "registered_on", "dtype": "date"},
      {"name": "area", "dtype": "float64", "range": {"max": 5}}
    ]
  })");
  ParquetColumnSpec id{"id", pq::INT64, ParquetAnnotation::None, false, {}};
  ParquetColumnSpec name{"name", pq::BYTE_ARRAY, ParquetAnnotation::String,
                         true, {}};
  ParquetColumnSpec day{"registered_on", pq::INT32, ParquetAnnotation::Date,
                        true, {}};
  ParquetColumnSpec area{"area", pq::DOUBLE, ParquetAnnotation::None, true, {}};
  for (int64_t i = 1; i <= 5; ++i) {
    id.values.emplace_back(i);
    if (i == 2)
      name.values.emplace_back(std::monostate{});
    else
      name.values.emplace_back("p" + std::to_string(i));
    day.values.emplace_back(int64_t{19782} + i);
    area.values.emplace_back(static_cast<double>(i) * 1.5);
  }
  auto file = path("parcels.parquet");
  ParquetWriteOptions options;
  options.rows_per_group = 2;
  write_parquet(file, {id, name, day, area}, options);

  ValidatorConfig config;
  config.chunk_size = 3;
  auto result = validate(tmpl, file, config);
  EXPECT_EQ(*result.format, source::SourceFormat::ColumnarArchive);
  EXPECT_EQ(result.row_count, 5u);
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{2});
  EXPECT_EQ(rows_of(result, ViolationKind::RangeError),
            (std::vector<uint64_t>{4, 5}));
  EXPECT_EQ(result.aggregator.count(ViolationKind::TypeError), 0u);
  EXPECT_EQ(result.diagnostics.at("num_rows"), "5");
  EXPECT_EQ(exit_code(result), EXIT_DATA);
}

TEST_F(StreamingValidatorTest, GeoPackageWithGeometryAlias) {
  auto tmpl = make_template(R"({
    "template_id": "features", "version": "1.0.0",
    "columns": [
      {"name": "fid", "dtype": "int64", "required": true, "unique": true},
      {"name": "land_use", "dtype": "string", "enum": ["forest", "urban"]},
      {"name": "geometry", "dtype": "geometry", "required": true}
    ]
  })");
  auto file = path("features.gpkg");
  const std::string point = "X'47500001E6100000"
                            "0101000000000000000000F03F0000000000000040'";
  write_geopackage(file, "features",
                   "fid INTEGER PRIMARY KEY, land_use TEXT, geom BLOB",
                   {"1, 'forest', " + point, "2, 'water', " + point,
                    "3, NULL, NULL"});

  auto result = validate(tmpl, file);
  EXPECT_EQ(*result.format, source::SourceFormat::EmbeddedRelational);
  EXPECT_EQ(result.row_count, 3u);
  EXPECT_EQ(result.diagnostics.at("alias.geometry"), "geom");
  EXPECT_EQ(result.diagnostics.at("layer"), "features");
  EXPECT_EQ(rows_of(result, ViolationKind::EnumError),
            std::vector<uint64_t>{2});
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{3});
  EXPECT_EQ(result.null_counts.at("land_use"), 1u);
}

TEST_F(StreamingValidatorTest, IntegerColumnDeclaredAsString) {
  auto tmpl = make_template(R"({
    "template_id": "parcels", "version": "1.0.0",
    "columns": [
      {"name": "parcel_id", "dtype": "string", "required": true,
       "unique": true, "enum": ["101", "102"]}
    ]
  })");
  auto file = path("parcels.gpkg");
  write_geopackage(file, "parcels", "parcel_id INTEGER", {"101", "102"});

  auto result = validate(tmpl, file);
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(result.aggregator.count(ViolationKind::TypeError), 0u);
  EXPECT_EQ(result.aggregator.error_count(), 0u);
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, ShapefileInput) {
  auto tmpl = make_template(R"({
    "template_id": "fields", "version": "1.0.0",
    "columns": [
      {"name": "FIELD_ID", "dtype": "string", "required": true,
       "unique": true},
      {"name": "CROP", "dtype": "int64", "range": {"min": 1, "max": 999}},
      {"name": "geometry", "dtype": "geometry", "required": true}
    ]
  })");
  auto shp = path("fields.shp");
  write_point_shapefile(shp, {{"FIELD_ID", 'C', 10}, {"CROP", 'N', 5}},
                        {{{"F-1", "110"}},
                         {{"F-2", "1200"}, true},
                         {{"F-1", ""}}});

  auto result = validate(tmpl, shp);
  EXPECT_EQ(*result.format, source::SourceFormat::VectorGeometry);
  EXPECT_EQ(result.row_count, 3u);
  EXPECT_EQ(rows_of(result, ViolationKind::RangeError),
            std::vector<uint64_t>{2});
  EXPECT_EQ(rows_of(result, ViolationKind::NullError),
            std::vector<uint64_t>{2});
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            std::vector<uint64_t>{3});
  EXPECT_EQ(result.diagnostics.at("shape_type"), "Point");
}

TEST_F(StreamingValidatorTest, ZippedInputReportsContainer) {
  auto tmpl = unique_id_template();
  auto zip = path("upload.zip");
  write_zip(zip, {{"export/ids.csv", "id\n1\n1\n"}});

  auto result = validate(tmpl, zip);
  EXPECT_EQ(result.diagnostics.at("container"), "zip");
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(exit_code(result), EXIT_DUPLICATES);
}

TEST_F(StreamingValidatorTest, ExplicitFormatAndDelimiter) {
  auto tmpl = unique_id_template();
  auto file = path("ids.txt");
  write_text_file(file, "name;id\na;1\nb;2\n");

  RunOptions options;
  options.format = source::SourceFormat::DelimitedText;
  options.open.delimiter = ';';
  auto result = validate(tmpl, file, {}, options);
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(result.diagnostics.at("delimiter"), ";");
  EXPECT_EQ(exit_code(result), EXIT_OK);
}

TEST_F(StreamingValidatorTest, RunWithGivenAdapter) {
  auto tmpl = unique_id_template();
  auto file = path("ids.csv");
  write_text_file(file, "id\n7\nseven\n");

  source::DelimitedTextAdapter adapter;
  StreamingValidator validator(tmpl, ValidatorConfig{}, "adapter-run");
  auto result = validator.run_with(adapter, file.string());
  EXPECT_EQ(validator.state(), RunState::Finalized);
  EXPECT_EQ(validator.run_id(), "adapter-run");
  EXPECT_EQ(result.row_count, 2u);
  EXPECT_EQ(rows_of(result, ViolationKind::TypeError),
            std::vector<uint64_t>{2});
  EXPECT_GT(result.input_size_bytes, 0u);
}

TEST_F(StreamingValidatorTest, BloomStrategyFindsRepeats) {
  auto tmpl = unique_id_template();
  std::string content = "id\n";
  for (int i = 1; i <= 500; ++i)
    content += std::to_string(i) + "\n";
  content += "250\n";
  auto file = path("ids.csv");
  write_text_file(file, content);

  ValidatorConfig config;
  config.uniqueness_strategy = UniquenessStrategy::Bloom;
  config.bloom_expected_items = 100000;
  config.bloom_false_positive_rate = 1e-6;
  auto result = validate(tmpl, file, config);
  EXPECT_EQ(result.row_count, 501u);
  EXPECT_EQ(rows_of(result, ViolationKind::DuplicateError),
            std::vector<uint64_t>{501});
}
