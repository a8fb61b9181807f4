#pragma once
#include "dataset-validator/Template.hpp"
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <map>
#include <string>
#include <vector>

namespace dsvalidator {
namespace engine {

/// A template column found in the file
struct BoundColumn {
  const ColumnSpec *spec;
  std::string physical_name;
};

/// Outcome of matching template columns against a physical schema
struct SchemaBinding {
  std::vector<BoundColumn> bound;              // template order
  std::vector<std::string> missing_required;   // template order
  std::vector<std::string> missing_optional;   // template order
  std::vector<std::string> extra;              // physical order
  std::map<std::string, std::string> aliases;  // template name -> physical
};

/// Alternative physical names tried for a geometry column that is not
/// present under its own name
DATASET_VALIDATOR_API std::vector<std::string>
geometry_alias_candidates(const Template &tmpl, const std::string &column);

/// Match by exact name; geometry columns fall back to their aliases,
/// compared case-insensitively
DATASET_VALIDATOR_API SchemaBinding
bind_columns(const Template &tmpl, const source::PhysicalSchema &schema);

} // namespace engine
} // namespace dsvalidator
