#include "dataset-validator/Template.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"
#include "dataset-validator/TemplateSchema.hpp"
#include "dataset-validator/ValueCoercion.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <set>

namespace dsvalidator {

static std::string join_errors(const ValidationResult &result) {
  std::string out;
  for (const auto &err : result.errors) {
    if (!out.empty())
      out += "; ";
    out += (err.path.empty() ? "/" : err.path) + ": " + err.message;
  }
  return out;
}

static ColumnSpec parse_column(const nlohmann::json &j) {
  ColumnSpec spec;
  spec.name = j.at("name").get<std::string>();
  // dtype vocabulary already checked by TemplateSchema
  spec.dtype = parse_dtype(j.at("dtype").get<std::string>()).value();
  spec.required = j.value("required", false);
  spec.unique = j.value("unique", false);
  if (j.contains("nullable"))
    spec.nullable_override = j["nullable"].get<bool>();
  if (j.contains("description"))
    spec.description = j["description"].get<std::string>();
  if (j.contains("enum")) {
    for (const auto &v : j["enum"])
      spec.enum_values.push_back(v);
  }
  if (j.contains("range")) {
    NumericRange range;
    const auto &r = j["range"];
    if (r.contains("min"))
      range.min = r["min"].get<double>();
    if (r.contains("max"))
      range.max = r["max"].get<double>();
    spec.range = range;
  }
  return spec;
}

Template Template::from_json(const nlohmann::json &doc,
                             const std::string &source) {
  auto shape = TemplateSchema::validate(doc);
  if (!shape.valid) {
    throw TemplateLoadError("Template " + source +
                            " does not match schema: " + join_errors(shape));
  }

  Template tmpl;
  tmpl.template_id = doc["template_id"].get<std::string>();
  tmpl.version = doc["version"].get<std::string>();
  if (doc.contains("label"))
    tmpl.label = doc["label"].get<std::string>();
  if (doc.contains("description"))
    tmpl.description = doc["description"].get<std::string>();
  tmpl.allow_extra_columns = doc.value("allow_extra_columns", true);

  for (const auto &column : doc["columns"])
    tmpl.columns.push_back(parse_column(column));

  if (doc.contains("null_equivalents"))
    tmpl.null_equivalents =
        doc["null_equivalents"].get<std::vector<std::string>>();

  if (doc.contains("geometry_aliases")) {
    for (auto it = doc["geometry_aliases"].begin();
         it != doc["geometry_aliases"].end(); ++it) {
      tmpl.geometry_aliases[it.key()] =
          it.value().get<std::vector<std::string>>();
    }
  }

  if (doc.contains("duplicate_checks")) {
    for (const auto &check : doc["duplicate_checks"]) {
      DuplicateCheck dc;
      dc.keys = check["keys"].get<std::vector<std::string>>();
      dc.severity = check.value("severity", std::string("error")) == "warning"
                        ? Severity::Warning
                        : Severity::Error;
      tmpl.duplicate_checks.push_back(std::move(dc));
    }
  }

  auto consistency = tmpl.validate_self();
  if (!consistency.valid) {
    throw TemplateLoadError("Template " + source +
                            " is inconsistent: " + join_errors(consistency));
  }
  return tmpl;
}

Template Template::load(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw TemplateLoadError("Template file not found: " + path);
  }
  std::ifstream file(path);
  if (!file) {
    throw TemplateLoadError("Cannot open template file: " + path);
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    throw TemplateLoadError("Template " + path +
                            " is not valid JSON: " + e.what());
  }
  auto tmpl = from_json(doc, path);
  LOG_DEBUG("TEMPLATE", tmpl.identity(), "Loaded {} columns from {}",
            tmpl.columns.size(), path);
  return tmpl;
}

ValidationResult Template::validate_self() const {
  ValidationResult result;
  result.valid = true;
  auto add_error = [&result](const std::string &path, const std::string &msg) {
    result.valid = false;
    result.errors.push_back({path, msg, 0, 0});
  };

  if (template_id.empty())
    add_error("/template_id", "template_id must not be empty");
  static const std::regex semver_re("^[0-9]+\\.[0-9]+\\.[0-9]+$");
  if (!std::regex_match(version, semver_re))
    add_error("/version", "version '" + version +
                              "' is not a semantic version");
  if (columns.empty())
    add_error("/columns", "at least one column must be declared");

  std::set<std::string> names;
  for (size_t i = 0; i < columns.size(); ++i) {
    const auto &col = columns[i];
    const std::string path = "/columns/" + std::to_string(i);
    if (col.name.empty())
      add_error(path + "/name", "column name must not be empty");
    if (!names.insert(col.name).second)
      add_error(path + "/name", "duplicate column name '" + col.name + "'");

    if (col.required && col.nullable_override.value_or(false))
      add_error(path, "column '" + col.name +
                          "' cannot be both required and nullable");

    if (col.range) {
      if (!is_numeric(col.dtype)) {
        add_error(path + "/range", "range is only allowed on numeric dtypes, "
                                   "column '" +
                                       col.name + "' is " +
                                       to_string(col.dtype));
      } else if (col.range->min && col.range->max &&
                 *col.range->min > *col.range->max) {
        add_error(path + "/range", "range min is greater than max");
      } else if (!col.range->min && !col.range->max) {
        add_error(path + "/range", "range must declare min and/or max");
      }
    }

    for (size_t e = 0; e < col.enum_values.size(); ++e) {
      auto cell = cell_from_json(col.enum_values[e]);
      if (!cell || !coerce(*cell, col.dtype)) {
        add_error(path + "/enum/" + std::to_string(e),
                  "enum value " + col.enum_values[e].dump() +
                      " is not a valid " + to_string(col.dtype));
      }
    }
    if (!col.enum_values.empty() && col.dtype == DType::Geometry)
      add_error(path + "/enum", "enum is not supported on geometry columns");
    if (col.unique && col.dtype == DType::Geometry)
      add_error(path + "/unique",
                "unique is not supported on geometry columns");
  }

  for (size_t i = 0; i < duplicate_checks.size(); ++i) {
    const std::string path = "/duplicate_checks/" + std::to_string(i);
    if (duplicate_checks[i].keys.empty())
      add_error(path + "/keys", "duplicate check needs at least one key");
    for (const auto &key : duplicate_checks[i].keys) {
      const ColumnSpec *spec = find_column(key);
      if (!spec)
        add_error(path + "/keys",
                  "duplicate check key '" + key + "' is not a declared column");
      else if (spec->dtype == DType::Geometry)
        add_error(path + "/keys",
                  "duplicate check key '" + key + "' is a geometry column");
    }
  }

  for (const auto &[column, aliases] : geometry_aliases) {
    const ColumnSpec *spec = find_column(column);
    if (!spec) {
      add_error("/geometry_aliases/" + column,
                "aliases declared for unknown column '" + column + "'");
    } else if (spec->dtype != DType::Geometry) {
      add_error("/geometry_aliases/" + column,
                "aliases are only allowed for geometry columns");
    }
  }

  return result;
}

const ColumnSpec *Template::find_column(const std::string &name) const {
  for (const auto &col : columns) {
    if (col.name == name)
      return &col;
  }
  return nullptr;
}

void to_json(nlohmann::json &j, const Template &t) {
  j = nlohmann::json{{"template_id", t.template_id}, {"version", t.version}};
  if (t.label)
    j["label"] = *t.label;
}

} // namespace dsvalidator
