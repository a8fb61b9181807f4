#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace dsvalidator {

class DATASET_VALIDATOR_API TemplateSchema {
public:
  // Structural check of a template document (shape, types, vocabulary)
  static ValidationResult validate(const nlohmann::json &doc);
  static ValidationResult validate_file(const std::string &json_path);

  // Get embedded schema
  static std::string get_template_schema();
};

} // namespace dsvalidator
