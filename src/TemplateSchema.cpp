#include "dataset-validator/TemplateSchema.hpp"

#include <fstream>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace dsvalidator {

// Forward declaration for embedded schema
extern const char *TEMPLATE_SCHEMA;

static std::string json_type(const nlohmann::json &node) {
  if (node.is_string())
    return "string";
  if (node.is_boolean())
    return "boolean";
  if (node.is_number())
    return "number";
  if (node.is_array())
    return "array";
  if (node.is_object())
    return "object";
  return "null";
}

static std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out;
}

static void add_error(ValidationResult &result,
                      const std::vector<std::string> &path,
                      const std::string &msg) {
  result.valid = false;
  result.errors.push_back({node_path(path), msg, 0, 0});
}

static void expect_type(ValidationResult &result, const nlohmann::json &obj,
                        const char *key, const char *type,
                        const std::vector<std::string> &path) {
  if (!obj.contains(key))
    return;
  std::string actual = json_type(obj[key]);
  if (actual != type) {
    std::vector<std::string> p = path;
    p.push_back(key);
    add_error(result, p,
              std::string("Expected ") + type + ", got " + actual);
  }
}

static void validate_column(const nlohmann::json &column,
                            ValidationResult &result,
                            const std::vector<std::string> &path) {
  static const std::set<std::string> allowed_keys = {
      "name",     "dtype", "required", "unique", "nullable",
      "description", "enum", "range"};
  static const std::set<std::string> dtypes = {
      "int64", "float64", "string", "bool", "date", "timestamp", "geometry"};

  if (!column.is_object()) {
    add_error(result, path, "Column entry must be an object");
    return;
  }
  for (const auto &req : {"name", "dtype"}) {
    if (!column.contains(req)) {
      add_error(result, path,
                std::string("Missing required column field '") + req + "'");
    }
  }
  for (auto it = column.begin(); it != column.end(); ++it) {
    if (allowed_keys.find(it.key()) == allowed_keys.end()) {
      add_error(result, path, "Unknown column field '" + it.key() + "'");
    }
  }

  expect_type(result, column, "name", "string", path);
  expect_type(result, column, "dtype", "string", path);
  expect_type(result, column, "required", "boolean", path);
  expect_type(result, column, "unique", "boolean", path);
  expect_type(result, column, "nullable", "boolean", path);
  expect_type(result, column, "description", "string", path);

  if (column.contains("name") && column["name"].is_string() &&
      column["name"].get<std::string>().empty()) {
    add_error(result, path, "Column name must not be empty");
  }
  if (column.contains("dtype") && column["dtype"].is_string() &&
      dtypes.find(column["dtype"].get<std::string>()) == dtypes.end()) {
    std::vector<std::string> p = path;
    p.push_back("dtype");
    add_error(result, p,
              "Unknown dtype '" + column["dtype"].get<std::string>() + "'");
  }

  if (column.contains("enum")) {
    std::vector<std::string> p = path;
    p.push_back("enum");
    const auto &values = column["enum"];
    if (!values.is_array()) {
      add_error(result, p, "enum must be an array");
    } else if (values.empty()) {
      add_error(result, p, "enum must not be empty");
    } else {
      for (size_t i = 0; i < values.size(); ++i) {
        const auto &v = values[i];
        if (!v.is_string() && !v.is_number() && !v.is_boolean()) {
          std::vector<std::string> vp = p;
          vp.push_back(std::to_string(i));
          add_error(result, vp, "enum values must be scalars");
        }
      }
    }
  }

  if (column.contains("range")) {
    std::vector<std::string> p = path;
    p.push_back("range");
    const auto &range = column["range"];
    if (!range.is_object()) {
      add_error(result, p, "range must be an object");
    } else {
      if (!range.contains("min") && !range.contains("max")) {
        add_error(result, p, "range must declare min and/or max");
      }
      for (auto it = range.begin(); it != range.end(); ++it) {
        if (it.key() != "min" && it.key() != "max") {
          add_error(result, p, "Unknown range field '" + it.key() + "'");
        } else if (!it.value().is_number()) {
          add_error(result, p, "range " + it.key() + " must be a number");
        }
      }
    }
  }
}

ValidationResult TemplateSchema::validate(const nlohmann::json &doc) {
  ValidationResult result;
  result.valid = true;

  std::vector<std::string> path;
  if (!doc.is_object()) {
    add_error(result, path, "Template must be a JSON object");
    return result;
  }

  for (const auto &key : {"template_id", "version", "columns"}) {
    if (!doc.contains(key)) {
      add_error(result, path,
                std::string("Missing required field '") + key + "'");
    }
  }

  expect_type(result, doc, "template_id", "string", path);
  expect_type(result, doc, "version", "string", path);
  expect_type(result, doc, "label", "string", path);
  expect_type(result, doc, "description", "string", path);
  expect_type(result, doc, "allow_extra_columns", "boolean", path);

  if (doc.contains("template_id") && doc["template_id"].is_string() &&
      doc["template_id"].get<std::string>().empty()) {
    add_error(result, {"template_id"}, "template_id must not be empty");
  }

  if (doc.contains("version") && doc["version"].is_string()) {
    static const std::regex semver_re("^[0-9]+\\.[0-9]+\\.[0-9]+$");
    if (!std::regex_match(doc["version"].get<std::string>(), semver_re)) {
      add_error(result, {"version"},
                "version must be a semantic version (major.minor.patch)");
    }
  }

  if (doc.contains("columns")) {
    const auto &columns = doc["columns"];
    if (!columns.is_array()) {
      add_error(result, {"columns"}, "columns must be an array");
    } else if (columns.empty()) {
      add_error(result, {"columns"}, "columns must declare at least one column");
    } else {
      for (size_t i = 0; i < columns.size(); ++i) {
        validate_column(columns[i], result, {"columns", std::to_string(i)});
      }
    }
  }

  if (doc.contains("null_equivalents")) {
    const auto &values = doc["null_equivalents"];
    if (!values.is_array()) {
      add_error(result, {"null_equivalents"},
                "null_equivalents must be an array");
    } else {
      for (const auto &v : values) {
        if (!v.is_string()) {
          add_error(result, {"null_equivalents"},
                    "null_equivalents entries must be strings");
          break;
        }
      }
    }
  }

  if (doc.contains("geometry_aliases")) {
    const auto &aliases = doc["geometry_aliases"];
    if (!aliases.is_object()) {
      add_error(result, {"geometry_aliases"},
                "geometry_aliases must be an object");
    } else {
      for (auto it = aliases.begin(); it != aliases.end(); ++it) {
        bool ok = it.value().is_array();
        if (ok) {
          for (const auto &v : it.value())
            ok = ok && v.is_string();
        }
        if (!ok) {
          add_error(result, {"geometry_aliases", it.key()},
                    "aliases must be an array of strings");
        }
      }
    }
  }

  if (doc.contains("duplicate_checks")) {
    const auto &checks = doc["duplicate_checks"];
    if (!checks.is_array()) {
      add_error(result, {"duplicate_checks"},
                "duplicate_checks must be an array");
    } else {
      for (size_t i = 0; i < checks.size(); ++i) {
        std::vector<std::string> p = {"duplicate_checks", std::to_string(i)};
        const auto &check = checks[i];
        if (!check.is_object()) {
          add_error(result, p, "duplicate check must be an object");
          continue;
        }
        if (!check.contains("keys") || !check["keys"].is_array() ||
            check["keys"].empty()) {
          add_error(result, p, "keys must be a non-empty array");
        } else {
          for (const auto &k : check["keys"]) {
            if (!k.is_string()) {
              add_error(result, p, "keys entries must be strings");
              break;
            }
          }
        }
        if (check.contains("severity")) {
          const auto &sev = check["severity"];
          if (!sev.is_string() || (sev.get<std::string>() != "error" &&
                                   sev.get<std::string>() != "warning")) {
            add_error(result, p, "severity must be 'error' or 'warning'");
          }
        }
      }
    }
  }

  return result;
}

ValidationResult TemplateSchema::validate_file(const std::string &json_path) {
  ValidationResult result;
  result.valid = true;
  std::ifstream file(json_path);
  if (!file) {
    result.valid = false;
    result.errors.push_back({"", "Cannot open file: " + json_path, 0, 0});
    return result;
  }
  try {
    nlohmann::json doc = nlohmann::json::parse(file);
    return validate(doc);
  } catch (const nlohmann::json::parse_error &e) {
    result.valid = false;
    result.errors.push_back(
        {"", std::string("JSON parse error: ") + e.what(), 0, 0});
  }
  return result;
}

std::string TemplateSchema::get_template_schema() { return TEMPLATE_SCHEMA; }

} // namespace dsvalidator
