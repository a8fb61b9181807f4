#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dsvalidator {

struct NumericRange {
  std::optional<double> min;
  std::optional<double> max;

  bool contains(double v) const {
    return (!min || v >= *min) && (!max || v <= *max);
  }
};

struct ColumnSpec {
  std::string name;
  DType dtype{DType::String};
  bool required{false};
  bool unique{false};
  std::optional<bool> nullable_override;
  std::vector<nlohmann::json> enum_values; // raw scalars as declared
  std::optional<NumericRange> range;
  std::optional<std::string> description;

  /// Not required implies nullable unless explicitly forbidden
  bool nullable() const { return nullable_override.value_or(!required); }
};

struct DuplicateCheck {
  std::vector<std::string> keys;
  Severity severity{Severity::Error};
};

/// Declarative description of one dataset layout. Read-only once loaded.
struct DATASET_VALIDATOR_API Template {
  std::string template_id;
  std::string version;
  std::optional<std::string> label;
  std::optional<std::string> description;
  std::vector<ColumnSpec> columns;

  bool allow_extra_columns{true};
  std::vector<std::string> null_equivalents;
  std::vector<DuplicateCheck> duplicate_checks;
  std::map<std::string, std::vector<std::string>> geometry_aliases;

  /// Load and validate a template file; throws TemplateLoadError
  static Template load(const std::string &path);

  /// Build from a parsed document; throws TemplateLoadError.
  /// source names the document in error messages.
  static Template from_json(const nlohmann::json &doc,
                            const std::string &source = "<memory>");

  /// Internal consistency check. Pure, no dataset I/O.
  ValidationResult validate_self() const;

  const ColumnSpec *find_column(const std::string &name) const;

  std::string identity() const { return template_id + ":" + version; }
};

DATASET_VALIDATOR_API void to_json(nlohmann::json &j, const Template &t);

} // namespace dsvalidator
