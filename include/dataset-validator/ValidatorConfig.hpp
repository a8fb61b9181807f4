#pragma once
#include "dataset-validator/export.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace dsvalidator {

enum class UniquenessStrategy { Exact, Bloom };

/// Engine knobs for one run. Passed by value into the validator so that
/// concurrent runs never share configuration state.
struct DATASET_VALIDATOR_API ValidatorConfig {
  size_t chunk_size{65536};
  size_t violation_cap{2000};
  double timeout_seconds{0.0}; // 0 disables

  UniquenessStrategy uniqueness_strategy{UniquenessStrategy::Exact};
  uint64_t bloom_expected_items{10000000};
  double bloom_false_positive_rate{0.001};

  std::string log_level{"info"};
  std::string log_file{"dataset_validator.log"};

  std::vector<std::string> template_dirs;

  /// Load from a YAML file; throws std::invalid_argument on bad values and
  /// std::runtime_error when the file cannot be read
  static ValidatorConfig load_yaml(const std::string &path);

  /// Apply the recognised keys of an already parsed document on top of the
  /// defaults
  static ValidatorConfig from_yaml(const YAML::Node &root);

  /// Throws std::invalid_argument naming the offending key
  void validate() const;
};

DATASET_VALIDATOR_API std::string to_string(UniquenessStrategy strategy);

} // namespace dsvalidator
