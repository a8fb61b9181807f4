#pragma once
#include "dataset-validator/export.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace dsvalidator {

/// The template document itself is unusable. Fatal before any scanning.
class DATASET_VALIDATOR_API TemplateLoadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The dataset cannot be opened or read as its format.
/// row_index is the 1-based row at which reading failed, when known.
class DATASET_VALIDATOR_API CorruptionError : public std::runtime_error {
public:
  explicit CorruptionError(const std::string &message,
                           std::optional<uint64_t> row_index = std::nullopt)
      : std::runtime_error(message), row_index_(row_index) {}

  std::optional<uint64_t> row_index() const { return row_index_; }

private:
  std::optional<uint64_t> row_index_;
};

/// Archive or compressed container could not be turned into one dataset
class DATASET_VALIDATOR_API UnpackError : public CorruptionError {
public:
  using CorruptionError::CorruptionError;
};

} // namespace dsvalidator
