#include "TestFixtures.hpp"
#include "DatasetWriters.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

#ifndef DATASET_VALIDATE_BIN
#define DATASET_VALIDATE_BIN "dataset-validate"
#endif
#ifndef VALIDATE_TEMPLATE_BIN
#define VALIDATE_TEMPLATE_BIN "validate-template"
#endif

using namespace dsvalidator;
using namespace dsvalidator::test;

namespace {

const char *kParcelsHeader =
    "parcel_id,municipality,land_use,area_m2,owner_share,registered_on\n";

} // namespace

class EndToEndTest : public IntegrationTest {
protected:
  void SetUp() override {
    IntegrationTest::SetUp();
    stdout_file_ = path("stdout.txt");
    user_templates_ = path("templates");
    std::filesystem::create_directories(user_templates_);
    write_text_file(user_templates_ / "ids.json", R"({
      "template_id": "ids", "version": "1.0.0",
      "columns": [
        {"name": "id", "dtype": "int64", "required": true, "unique": true}
      ]
    })");
  }

  /// Run dataset-validate with args, capturing stdout
  int validate(const std::string &args) {
    std::string cmd = std::string("\"") + DATASET_VALIDATE_BIN + "\" " + args +
                      " > \"" + stdout_file_.string() + "\" 2> /dev/null";
    return run_command(cmd);
  }

  std::string quoted(const std::filesystem::path &p) const {
    return "\"" + p.string() + "\"";
  }

  std::vector<std::string> output_lines() const {
    std::vector<std::string> lines;
    std::istringstream in(read_file(stdout_file_));
    std::string line;
    while (std::getline(in, line))
      lines.push_back(line);
    return lines;
  }

  nlohmann::json read_json(const std::filesystem::path &p) const {
    return nlohmann::json::parse(read_file(p));
  }

  std::filesystem::path stdout_file_;
  std::filesystem::path user_templates_;
};

TEST_F(EndToEndTest, ShippedTemplatesDirectoryFound) {
  EXPECT_TRUE(std::filesystem::exists(source_dir_ / "CMakeLists.txt"));
  EXPECT_TRUE(std::filesystem::exists(templates_dir_ / "parcels.json"));
  EXPECT_TRUE(std::filesystem::exists(templates_dir_ / "index.json"));
}

TEST_F(EndToEndTest, DuplicateAndNullExitsWithDataCode) {
  auto input = path("ids.csv");
  write_text_file(input, "id,name\n1,a\n2,b\n2,c\n,d\n");
  auto report = path("out/report.json");

  int code = validate("--input " + quoted(input) + " --template-id ids" +
                      " --templates-dir " + quoted(user_templates_) +
                      " --report " + quoted(report));
  EXPECT_EQ(code, 4);

  auto lines = output_lines();
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0].rfind("FAILED template=ids:1.0.0 rows=4 errors=2 "
                           "warnings=0 duration=",
                           0),
            0u)
      << lines[0];

  auto j = read_json(report);
  EXPECT_FALSE(j["ok"].get<bool>());
  EXPECT_EQ(j["exit_code"].get<int>(), 4);
  EXPECT_EQ(j["row_count"].get<uint64_t>(), 4u);
  EXPECT_EQ(j["counts"]["DuplicateError"].get<uint64_t>(), 1u);
  EXPECT_EQ(j["counts"]["NullError"].get<uint64_t>(), 1u);
  EXPECT_EQ(j["input"]["format"], "CSV");
  ASSERT_EQ(j["violations"].size(), 2u);
  EXPECT_EQ(j["violations"][0]["kind"], "DuplicateError");
  EXPECT_EQ(j["violations"][0]["row_index"].get<uint64_t>(), 3u);
  EXPECT_EQ(j["violations"][1]["kind"], "NullError");
  EXPECT_EQ(j["violations"][1]["row_index"].get<uint64_t>(), 4u);
}

TEST_F(EndToEndTest, SingleColumnTrailingEmptyLineIsNull) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\n2\n2\n\n");
  auto report = path("report.json");

  int code = validate("--input " + quoted(input) + " --template-id ids" +
                      " --templates-dir " + quoted(user_templates_) +
                      " --report " + quoted(report));
  EXPECT_EQ(code, 4);

  auto j = read_json(report);
  EXPECT_EQ(j["row_count"].get<uint64_t>(), 4u);
  EXPECT_EQ(j["counts"]["DuplicateError"].get<uint64_t>(), 1u);
  EXPECT_EQ(j["counts"]["NullError"].get<uint64_t>(), 1u);
  ASSERT_EQ(j["violations"].size(), 2u);
  EXPECT_EQ(j["violations"][0]["kind"], "DuplicateError");
  EXPECT_EQ(j["violations"][0]["row_index"].get<uint64_t>(), 3u);
  EXPECT_EQ(j["violations"][1]["kind"], "NullError");
  EXPECT_EQ(j["violations"][1]["row_index"].get<uint64_t>(), 4u);
}

TEST_F(EndToEndTest, ProvenanceRunIdComesFromEnvironment) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\n");
  auto report = path("report.json");
  std::string args = "--input " + quoted(input) + " --template-id ids" +
                     " --templates-dir " + quoted(user_templates_) +
                     " --report " + quoted(report);

  auto with_env = [&](const std::string &prefix) {
    return run_command(prefix + " \"" + DATASET_VALIDATE_BIN + "\" " + args +
                       " > /dev/null 2> /dev/null");
  };

  ASSERT_EQ(with_env("env -u RUN_ID"), 0);
  EXPECT_TRUE(read_json(report)["provenance"]["run_id"].is_null());

  ASSERT_EQ(with_env("env RUN_ID=nightly-7"), 0);
  EXPECT_EQ(read_json(report)["provenance"]["run_id"], "nightly-7");
}

TEST_F(EndToEndTest, RepeatedRunsGiveSameReport) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\nx\n1\n\n");
  auto first = path("first.json");
  auto second = path("second.json");
  std::string args = "--input " + quoted(input) + " --template-id ids" +
                     " --templates-dir " + quoted(user_templates_);
  EXPECT_EQ(validate(args + " --report " + quoted(first)), 4);
  EXPECT_EQ(validate(args + " --report " + quoted(second)), 4);

  auto a = read_json(first);
  auto b = read_json(second);
  for (auto *j : {&a, &b}) {
    j->erase("started_at");
    j->erase("finished_at");
    j->erase("duration_sec");
  }
  EXPECT_EQ(a, b);
}

TEST_F(EndToEndTest, CleanFileAgainstShippedTemplate) {
  auto input = path("parcels.csv");
  write_text_file(input, std::string(kParcelsHeader) +
                             "1,Gent,forest,120.5,0.5,2024-01-31\n"
                             "2,Gent,urban,80,1,2023-12-01\n"
                             "3,Brugge,NA,,,\n");

  int code = validate("--input " + quoted(input) + " --template-id parcels" +
                      " --templates-dir " + quoted(templates_dir_) +
                      " --print-json");
  EXPECT_EQ(code, 0);

  auto lines = output_lines();
  ASSERT_GT(lines.size(), 1u);
  // Highest version wins when none is pinned
  EXPECT_EQ(lines[0].rfind("OK template=parcels:1.1.0 rows=3 errors=0 "
                           "warnings=0 duration=",
                           0),
            0u)
      << lines[0];

  std::string json_text;
  for (size_t i = 1; i < lines.size(); ++i)
    json_text += lines[i] + "\n";
  auto j = nlohmann::json::parse(json_text);
  EXPECT_TRUE(j["ok"].get<bool>());
  EXPECT_EQ(j["template_version"], "1.1.0");
  EXPECT_EQ(j["metrics"]["null_counts"]["land_use"].get<uint64_t>(), 1u);
  EXPECT_EQ(j["metrics"]["adapter_diagnostics"]["delimiter"], ",");
}

TEST_F(EndToEndTest, AliasAndPinnedVersion) {
  auto input = path("parcels.csv");
  write_text_file(input, "parcel_id,municipality\n1,Gent\n");

  int code = validate("--input " + quoted(input) + " --template-id cadastre" +
                      " --template-version 1.0.0 --templates-dir " +
                      quoted(templates_dir_));
  EXPECT_EQ(code, 0);
  auto lines = output_lines();
  ASSERT_FALSE(lines.empty());
  EXPECT_NE(lines[0].find("template=parcels:1.0.0"), std::string::npos);
}

TEST_F(EndToEndTest, MissingRequiredColumnExitsWithSchemaCode) {
  auto input = path("parcels.csv");
  write_text_file(input, "parcel_id\n1\n");
  int code = validate("--input " + quoted(input) + " --template-id parcels" +
                      " --templates-dir " + quoted(templates_dir_));
  EXPECT_EQ(code, 3);
}

TEST_F(EndToEndTest, CorruptFileExitsWithCorruptionCode) {
  auto input = path("broken.parquet");
  write_text_file(input, "PAR1 this is not really parquet");
  auto report = path("report.json");
  int code = validate("--input " + quoted(input) + " --template-id ids" +
                      " --templates-dir " + quoted(user_templates_) +
                      " --report " + quoted(report));
  EXPECT_EQ(code, 2);
  auto j = read_json(report);
  EXPECT_EQ(j["row_count"].get<uint64_t>(), 0u);
  EXPECT_EQ(j["counts"]["CorruptionError"].get<uint64_t>(), 1u);
}

TEST_F(EndToEndTest, DuplicatesOnlyExitFive) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\n2\n1\n");
  int code = validate("--input " + quoted(input) + " --template-id ids" +
                      " --templates-dir " + quoted(user_templates_));
  EXPECT_EQ(code, 5);
}

TEST_F(EndToEndTest, UnknownTemplateIsInternalError) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\n");
  int code = validate("--input " + quoted(input) + " --template-id nothing" +
                      " --templates-dir " + quoted(user_templates_));
  EXPECT_EQ(code, 6);
}

TEST_F(EndToEndTest, UsageErrors) {
  EXPECT_EQ(validate("--template-id ids"), 1);
  EXPECT_EQ(validate("--input x.csv --template-id ids --bogus"), 1);
  EXPECT_EQ(validate("--input x.csv --template-id ids --format XLSX"), 1);
  EXPECT_EQ(validate("--help"), 1);
}

TEST_F(EndToEndTest, ConfigFileControlsEngine) {
  auto config = path("validator.yaml");
  write_text_file(config, "engine:\n  violation_cap: 1\n");
  auto input = path("ids.csv");
  write_text_file(input, "id\nx\ny\nz\n");
  auto report = path("report.json");

  int code = validate("--input " + quoted(input) + " --template-id ids" +
                      " --templates-dir " + quoted(user_templates_) +
                      " --config " + quoted(config) + " --report " +
                      quoted(report));
  EXPECT_EQ(code, 4);
  auto j = read_json(report);
  EXPECT_EQ(j["counts"]["TypeError"].get<uint64_t>(), 3u);
  EXPECT_EQ(j["violations"].size(), 1u);

  write_text_file(config, "engine:\n  chunk_size: 0\n");
  EXPECT_EQ(validate("--input " + quoted(input) + " --template-id ids" +
                     " --templates-dir " + quoted(user_templates_) +
                     " --config " + quoted(config)),
            1);
}

TEST_F(EndToEndTest, NdjsonAppends) {
  auto input = path("ids.csv");
  write_text_file(input, "id\n1\n");
  auto log = path("runs.ndjson");
  std::string args = "--input " + quoted(input) + " --template-id ids" +
                     " --templates-dir " + quoted(user_templates_) +
                     " --ndjson --report " + quoted(log);
  ASSERT_EQ(validate(args), 0);
  ASSERT_EQ(validate(args), 0);

  std::istringstream in(read_file(log));
  std::string line;
  size_t count = 0;
  while (std::getline(in, line)) {
    auto j = nlohmann::json::parse(line);
    EXPECT_EQ(j["template_id"], "ids");
    ++count;
  }
  EXPECT_EQ(count, 2u);
}

TEST_F(EndToEndTest, ListTemplates) {
  int code = validate("--list-templates --templates-dir " +
                      quoted(templates_dir_));
  EXPECT_EQ(code, 0);
  std::string out = read_file(stdout_file_);
  EXPECT_NE(out.find("parcels 1.0.0"), std::string::npos);
  EXPECT_NE(out.find("parcels 1.1.0"), std::string::npos);
  EXPECT_NE(out.find("lpis_fields 2.0.0"), std::string::npos);
}

TEST_F(EndToEndTest, TemplateValidatorTool) {
  auto run_tool = [&](const std::string &args) {
    return run_command(std::string("\"") + VALIDATE_TEMPLATE_BIN + "\" " +
                       args + " > \"" + stdout_file_.string() +
                       "\" 2> /dev/null");
  };

  EXPECT_EQ(run_tool(quoted(templates_dir_ / "lpis_fields.json")), 0);
  EXPECT_NE(read_file(stdout_file_).find("lpis_fields:2.0.0"),
            std::string::npos);

  auto bad = path("bad.json");
  write_text_file(bad, R"({"template_id": "bad", "version": "1.0.0",
                           "columns": [{"name": "a", "dtype": "complex"}]})");
  EXPECT_EQ(run_tool(quoted(bad)), 2);
  EXPECT_NE(read_file(stdout_file_).find("Validation failed"),
            std::string::npos);

  EXPECT_EQ(run_tool("--print-schema"), 0);
  auto schema = nlohmann::json::parse(read_file(stdout_file_));
  EXPECT_TRUE(schema.contains("properties"));

  EXPECT_EQ(run_tool(""), 1);
}
