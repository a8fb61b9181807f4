#include "dataset-validator/engine/UniqueTracker.hpp"

#include <algorithm>
#include <cmath>

namespace dsvalidator {
namespace engine {

namespace {

constexpr uint64_t kMaxBloomBits = uint64_t{1} << 35; // 4 GiB

uint64_t fnv1a(const std::string &key) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : key) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

// splitmix64 finaliser, decorrelates the second hash from the first
uint64_t mix(uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

} // namespace

bool ExactUniqueTracker::check_and_insert(const std::string &key) {
  auto inserted = seen_.insert(key);
  if (inserted.second)
    key_bytes_ += key.size();
  return !inserted.second;
}

size_t ExactUniqueTracker::memory_bytes() const {
  return key_bytes_ + seen_.size() * (sizeof(std::string) + 2 * sizeof(void *));
}

BloomUniqueTracker::BloomUniqueTracker(uint64_t expected_items,
                                       double false_positive_rate) {
  const double n = static_cast<double>(std::max<uint64_t>(expected_items, 1));
  const double ln2 = std::log(2.0);
  double m = -n * std::log(false_positive_rate) / (ln2 * ln2);
  bit_count_ = std::min<uint64_t>(
      std::max<uint64_t>(static_cast<uint64_t>(std::ceil(m)), 64),
      kMaxBloomBits);
  double k = static_cast<double>(bit_count_) / n * ln2;
  hash_count_ = static_cast<unsigned>(
      std::clamp(static_cast<int>(std::lround(k)), 1, 16));
  bits_.assign((bit_count_ + 63) / 64, 0);
}

bool BloomUniqueTracker::check_and_insert(const std::string &key) {
  // Double hashing: h1 + i*h2
  const uint64_t h1 = fnv1a(key);
  const uint64_t h2 = mix(h1) | 1;
  bool present = true;
  for (unsigned i = 0; i < hash_count_; ++i) {
    uint64_t bit = (h1 + i * h2) % bit_count_;
    uint64_t &word = bits_[bit / 64];
    uint64_t mask = 1ULL << (bit % 64);
    if (!(word & mask)) {
      present = false;
      word |= mask;
    }
  }
  return present;
}

std::unique_ptr<UniqueTracker>
make_unique_tracker(const ValidatorConfig &config) {
  if (config.uniqueness_strategy == UniquenessStrategy::Bloom)
    return std::make_unique<BloomUniqueTracker>(
        config.bloom_expected_items, config.bloom_false_positive_rate);
  return std::make_unique<ExactUniqueTracker>();
}

} // namespace engine
} // namespace dsvalidator
