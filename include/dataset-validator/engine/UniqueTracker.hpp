#pragma once
#include "dataset-validator/ValidatorConfig.hpp"
#include "dataset-validator/export.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace dsvalidator {
namespace engine {

/// Seen-value set for one uniqueness constraint
class DATASET_VALIDATOR_API UniqueTracker {
public:
  virtual ~UniqueTracker() = default;

  /// Record key; returns true when it was (possibly) seen before
  virtual bool check_and_insert(const std::string &key) = 0;

  virtual size_t memory_bytes() const = 0;
};

/// Exact hash set, no false positives
class DATASET_VALIDATOR_API ExactUniqueTracker : public UniqueTracker {
public:
  bool check_and_insert(const std::string &key) override;
  size_t memory_bytes() const override;

  size_t size() const { return seen_.size(); }

private:
  std::unordered_set<std::string> seen_;
  size_t key_bytes_{0};
};

/// Fixed-size Bloom filter. Never misses a true duplicate; may report a
/// false one at roughly the configured rate once expected_items keys were
/// inserted.
class DATASET_VALIDATOR_API BloomUniqueTracker : public UniqueTracker {
public:
  BloomUniqueTracker(uint64_t expected_items, double false_positive_rate);

  bool check_and_insert(const std::string &key) override;
  size_t memory_bytes() const override { return bits_.size() * 8; }

  uint64_t bit_count() const { return bit_count_; }
  unsigned hash_count() const { return hash_count_; }

private:
  std::vector<uint64_t> bits_;
  uint64_t bit_count_;
  unsigned hash_count_;
};

DATASET_VALIDATOR_API std::unique_ptr<UniqueTracker>
make_unique_tracker(const ValidatorConfig &config);

} // namespace engine
} // namespace dsvalidator
