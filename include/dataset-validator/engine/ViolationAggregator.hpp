#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace dsvalidator {
namespace engine {

/// Collects violations for one run.
///
/// Counts are exact; stored samples are capped per kind, not in total, so
/// samples() holds at most cap() entries of each kind and at most
/// kKinds * cap() entries overall. Warning-severity violations are counted
/// separately and never influence the severity.
class DATASET_VALIDATOR_API ViolationAggregator {
public:
  explicit ViolationAggregator(size_t cap_per_kind = 2000);

  void add(Violation violation);

  /// Total of kind, both severities
  uint64_t count(ViolationKind kind) const;

  uint64_t error_count() const { return errors_; }
  uint64_t warning_count() const { return warnings_; }

  /// Stored samples in arrival order
  const std::vector<Violation> &samples() const { return samples_; }

  /// Highest-priority error-severity kind present
  std::optional<ViolationKind> severity() const;

  /// Totals keyed by kind name, every kind present (zero when unseen)
  std::map<std::string, uint64_t> counts() const;

  size_t cap() const { return cap_; }

private:
  static constexpr size_t kKinds = sizeof(ALL_VIOLATION_KINDS) /
                                   sizeof(ALL_VIOLATION_KINDS[0]);

  size_t cap_;
  std::array<uint64_t, kKinds> totals_{};
  std::array<uint64_t, kKinds> error_totals_{};
  std::array<size_t, kKinds> stored_{};
  std::vector<Violation> samples_;
  uint64_t errors_{0};
  uint64_t warnings_{0};
};

} // namespace engine
} // namespace dsvalidator
