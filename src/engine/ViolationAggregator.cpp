#include "dataset-validator/engine/ViolationAggregator.hpp"

#include <stdexcept>

namespace dsvalidator {
namespace engine {

ViolationAggregator::ViolationAggregator(size_t cap_per_kind)
    : cap_(cap_per_kind) {
  if (cap_ == 0)
    throw std::invalid_argument("violation cap must be > 0");
}

void ViolationAggregator::add(Violation violation) {
  const size_t k = static_cast<size_t>(violation.kind);
  ++totals_[k];
  if (violation.severity == Severity::Warning) {
    ++warnings_;
  } else {
    ++errors_;
    ++error_totals_[k];
  }
  if (stored_[k] < cap_) {
    ++stored_[k];
    samples_.push_back(std::move(violation));
  }
}

uint64_t ViolationAggregator::count(ViolationKind kind) const {
  return totals_[static_cast<size_t>(kind)];
}

std::optional<ViolationKind> ViolationAggregator::severity() const {
  std::optional<ViolationKind> worst;
  for (ViolationKind kind : ALL_VIOLATION_KINDS) {
    if (error_totals_[static_cast<size_t>(kind)] == 0)
      continue;
    if (!worst || severity_rank(kind) > severity_rank(*worst))
      worst = kind;
  }
  return worst;
}

std::map<std::string, uint64_t> ViolationAggregator::counts() const {
  std::map<std::string, uint64_t> out;
  for (ViolationKind kind : ALL_VIOLATION_KINDS)
    out[to_string(kind)] = totals_[static_cast<size_t>(kind)];
  return out;
}

} // namespace engine
} // namespace dsvalidator
