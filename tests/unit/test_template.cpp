#include "TestFixtures.hpp"
#include "DatasetWriters.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Template.hpp"
#include "dataset-validator/TemplateSchema.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::test;

class TemplateTest : public ValidatorTest {};

TEST_F(TemplateTest, LoadsColumnsAndDefaults) {
  auto tmpl = make_template(R"({
    "template_id": "parcels",
    "version": "1.2.0",
    "columns": [
      {"name": "id", "dtype": "int64", "required": true, "unique": true},
      {"name": "name", "dtype": "string"},
      {"name": "area", "dtype": "float64", "range": {"min": 0, "max": 100}},
      {"name": "kind", "dtype": "string", "enum": ["a", "b"]}
    ]
  })");

  EXPECT_EQ(tmpl.identity(), "parcels:1.2.0");
  ASSERT_EQ(tmpl.columns.size(), 4u);
  EXPECT_TRUE(tmpl.allow_extra_columns);
  EXPECT_TRUE(tmpl.null_equivalents.empty());

  const ColumnSpec *id = tmpl.find_column("id");
  ASSERT_NE(id, nullptr);
  EXPECT_EQ(id->dtype, DType::Int64);
  EXPECT_TRUE(id->required);
  EXPECT_TRUE(id->unique);
  EXPECT_FALSE(id->nullable());

  const ColumnSpec *name = tmpl.find_column("name");
  ASSERT_NE(name, nullptr);
  EXPECT_TRUE(name->nullable());

  const ColumnSpec *area = tmpl.find_column("area");
  ASSERT_NE(area, nullptr);
  ASSERT_TRUE(area->range.has_value());
  EXPECT_TRUE(area->range->contains(0));
  EXPECT_TRUE(area->range->contains(100));
  EXPECT_FALSE(area->range->contains(100.5));

  EXPECT_EQ(tmpl.find_column("kind")->enum_values.size(), 2u);
  EXPECT_EQ(tmpl.find_column("missing"), nullptr);
}

TEST_F(TemplateTest, OptionalColumnCanForbidNulls) {
  auto tmpl = make_template(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "string", "nullable": false}]
  })");
  EXPECT_FALSE(tmpl.columns[0].required);
  EXPECT_FALSE(tmpl.columns[0].nullable());
}

TEST_F(TemplateTest, ReadsDuplicateChecksAndAliases) {
  auto tmpl = make_template(R"({
    "template_id": "fields", "version": "2.0.0",
    "allow_extra_columns": false,
    "null_equivalents": ["NA"],
    "columns": [
      {"name": "farm", "dtype": "string"},
      {"name": "crop", "dtype": "int64"},
      {"name": "geometry", "dtype": "geometry"}
    ],
    "duplicate_checks": [{"keys": ["farm", "crop"], "severity": "warning"}],
    "geometry_aliases": {"geometry": ["geom", "the_geom"]}
  })");

  EXPECT_FALSE(tmpl.allow_extra_columns);
  ASSERT_EQ(tmpl.null_equivalents.size(), 1u);
  ASSERT_EQ(tmpl.duplicate_checks.size(), 1u);
  EXPECT_EQ(tmpl.duplicate_checks[0].keys,
            (std::vector<std::string>{"farm", "crop"}));
  EXPECT_EQ(tmpl.duplicate_checks[0].severity, Severity::Warning);
  ASSERT_EQ(tmpl.geometry_aliases.count("geometry"), 1u);
  EXPECT_EQ(tmpl.geometry_aliases.at("geometry").size(), 2u);
}

TEST_F(TemplateTest, RejectsMissingColumns) {
  auto doc = nlohmann::json::parse(R"({"template_id": "t", "version": "1.0.0"})");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsUnknownDtype) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "decimal"}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsBadVersion) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "v1",
    "columns": [{"name": "x", "dtype": "string"}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsRequiredAndNullable) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "string", "required": true,
                 "nullable": true}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsRangeOnText) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "string", "range": {"min": 1}}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsInvertedRange) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64",
                 "range": {"min": 10, "max": 1}}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsEnumValueOfWrongType) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64", "enum": [1, "two"]}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsDuplicateColumnNames) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64"},
                {"name": "x", "dtype": "string"}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsDuplicateCheckOnUnknownColumn) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64"}],
    "duplicate_checks": [{"keys": ["x", "y"]}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsUniqueGeometry) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "geometry", "dtype": "geometry", "unique": true}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);

  doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "id", "dtype": "int64"},
                {"name": "geometry", "dtype": "geometry"}],
    "duplicate_checks": [{"keys": ["id", "geometry"]}]
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsAliasesOnNonGeometryColumn) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64"}],
    "geometry_aliases": {"x": ["y"]}
  })");
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, RejectsUnknownColumnField) {
  auto doc = nlohmann::json::parse(R"({
    "template_id": "t", "version": "1.0.0",
    "columns": [{"name": "x", "dtype": "int64", "primary": true}]
  })");
  auto result = TemplateSchema::validate(doc);
  EXPECT_FALSE(result.valid);
  EXPECT_THROW(Template::from_json(doc), TemplateLoadError);
}

TEST_F(TemplateTest, LoadFromFile) {
  auto file = path("t.json");
  write_text_file(file, R"({"template_id": "t", "version": "0.1.0",
    "columns": [{"name": "x", "dtype": "bool"}]})");
  Template tmpl = Template::load(file.string());
  EXPECT_EQ(tmpl.identity(), "t:0.1.0");
  EXPECT_EQ(tmpl.columns[0].dtype, DType::Bool);
}

TEST_F(TemplateTest, LoadMissingFileThrows) {
  EXPECT_THROW(Template::load(path("nope.json").string()), TemplateLoadError);
}

TEST_F(TemplateTest, LoadInvalidJsonThrows) {
  auto file = path("broken.json");
  write_text_file(file, "{ not json");
  EXPECT_THROW(Template::load(file.string()), TemplateLoadError);
}

TEST_F(TemplateTest, EmbeddedSchemaIsJson) {
  auto schema = nlohmann::json::parse(TemplateSchema::get_template_schema());
  EXPECT_EQ(schema["title"], "Dataset validation template");
}
