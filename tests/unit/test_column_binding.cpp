#include "TestFixtures.hpp"
#include "dataset-validator/engine/ColumnBinding.hpp"

#include <gtest/gtest.h>

using namespace dsvalidator;
using namespace dsvalidator::engine;
using namespace dsvalidator::test;

class ColumnBindingTest : public ValidatorTest {
protected:
  void SetUp() override {
    ValidatorTest::SetUp();
    tmpl_ = make_template(R"({
      "template_id": "fields", "version": "1.0.0",
      "columns": [
        {"name": "id", "dtype": "int64", "required": true},
        {"name": "crop", "dtype": "string"},
        {"name": "geometry", "dtype": "geometry", "required": true}
      ],
      "geometry_aliases": {"geometry": ["geom", "the_geom"]}
    })");
  }

  Template tmpl_;
};

TEST_F(ColumnBindingTest, BindsByExactName) {
  source::PhysicalSchema schema = {
      {"id", "INT64"}, {"crop", "TEXT"}, {"geometry", "BLOB"}};
  auto binding = bind_columns(tmpl_, schema);
  ASSERT_EQ(binding.bound.size(), 3u);
  EXPECT_EQ(binding.bound[0].spec->name, "id");
  EXPECT_EQ(binding.bound[2].physical_name, "geometry");
  EXPECT_TRUE(binding.missing_required.empty());
  EXPECT_TRUE(binding.extra.empty());
  EXPECT_TRUE(binding.aliases.empty());
}

TEST_F(ColumnBindingTest, ExactNameIsCaseSensitive) {
  source::PhysicalSchema schema = {{"ID", "INT64"}, {"geometry", "BLOB"}};
  auto binding = bind_columns(tmpl_, schema);
  EXPECT_EQ(binding.missing_required, std::vector<std::string>{"id"});
  EXPECT_EQ(binding.missing_optional, std::vector<std::string>{"crop"});
  EXPECT_EQ(binding.extra, std::vector<std::string>{"ID"});
}

TEST_F(ColumnBindingTest, GeometryFallsBackToAliases) {
  source::PhysicalSchema schema = {
      {"id", "INT64"}, {"THE_GEOM", "BLOB"}, {"note", "TEXT"}};
  auto binding = bind_columns(tmpl_, schema);
  ASSERT_EQ(binding.bound.size(), 2u);
  EXPECT_EQ(binding.bound[1].physical_name, "THE_GEOM");
  EXPECT_EQ(binding.aliases.at("geometry"), "THE_GEOM");
  EXPECT_EQ(binding.extra, std::vector<std::string>{"note"});
}

TEST_F(ColumnBindingTest, AliasOrderDecides) {
  source::PhysicalSchema schema = {
      {"id", "INT64"}, {"the_geom", "BLOB"}, {"geom", "BLOB"}};
  auto binding = bind_columns(tmpl_, schema);
  EXPECT_EQ(binding.aliases.at("geometry"), "geom");
  EXPECT_EQ(binding.extra, std::vector<std::string>{"the_geom"});
}

TEST_F(ColumnBindingTest, DefaultAliasesWithoutTemplateEntry) {
  Template plain = make_template(R"({
    "template_id": "p", "version": "1.0.0",
    "columns": [{"name": "shape_col", "dtype": "geometry"}]
  })");
  auto candidates = geometry_alias_candidates(plain, "shape_col");
  EXPECT_FALSE(candidates.empty());

  source::PhysicalSchema schema = {{"wkb_geometry", "BLOB"}};
  auto binding = bind_columns(plain, schema);
  ASSERT_EQ(binding.bound.size(), 1u);
  EXPECT_EQ(binding.aliases.at("shape_col"), "wkb_geometry");
}

TEST_F(ColumnBindingTest, NonGeometryColumnsNeverAlias) {
  source::PhysicalSchema schema = {{"geom", "BLOB"}, {"geometry", "BLOB"}};
  auto binding = bind_columns(tmpl_, schema);
  EXPECT_EQ(binding.missing_required, std::vector<std::string>{"id"});
  EXPECT_EQ(binding.extra, std::vector<std::string>{"geom"});
}
