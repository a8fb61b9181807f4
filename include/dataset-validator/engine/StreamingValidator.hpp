#pragma once
#include "dataset-validator/Template.hpp"
#include "dataset-validator/ValidatorConfig.hpp"
#include "dataset-validator/engine/ViolationAggregator.hpp"
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace dsvalidator {
namespace engine {

enum class RunState { Init, SchemaCheck, Scanning, Finalized };

DATASET_VALIDATOR_API std::string to_string(RunState state);

struct RunOptions {
  std::optional<source::SourceFormat> format; // detected when absent
  source::OpenOptions open;
};

/// Everything a finished run knows; frozen into a Report afterwards
struct RunResult {
  explicit RunResult(size_t violation_cap) : aggregator(violation_cap) {}

  std::string input_path;
  uint64_t input_size_bytes{0};
  std::optional<source::SourceFormat> format;

  uint64_t row_count{0};
  ViolationAggregator aggregator;
  std::map<std::string, uint64_t> null_counts;
  std::map<std::string, std::string> diagnostics;

  bool internal_failure{false};
  std::string internal_error;
  bool timed_out{false};

  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point finished_at;
  double duration_sec{0.0};
};

/// Drives one adapter through one file in bounded-memory chunks and applies
/// the template rules. Never throws for malformed input: every failure ends
/// up in the returned RunResult.
class DATASET_VALIDATOR_API StreamingValidator {
public:
  StreamingValidator(const Template &tmpl, ValidatorConfig config,
                     std::string run_id = "-");

  /// Unpack, detect the format and validate
  RunResult run(const std::string &input_path, const RunOptions &options = {});

  /// Validate path through the given adapter, without unpacking
  RunResult run_with(source::SourceAdapter &adapter, const std::string &path,
                     const source::OpenOptions &options = {});

  RunState state() const { return state_; }
  const std::string &run_id() const { return run_id_; }

private:
  void scan(source::SourceAdapter &adapter, const std::string &path,
            const source::OpenOptions &options, RunResult &result);
  void finalize(RunResult &result,
                std::chrono::steady_clock::time_point start);

  const Template &template_;
  ValidatorConfig config_;
  std::string run_id_;
  RunState state_{RunState::Init};
};

} // namespace engine
} // namespace dsvalidator
