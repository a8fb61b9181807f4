#pragma once
#include "dataset-validator/export.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dsvalidator {

/// Template-level column types
enum class DType { Int64, Float64, String, Bool, Date, Timestamp, Geometry };

DATASET_VALIDATOR_API std::string to_string(DType dtype);
DATASET_VALIDATOR_API std::optional<DType> parse_dtype(const std::string &name);
inline bool is_numeric(DType dtype) {
  return dtype == DType::Int64 || dtype == DType::Float64;
}

/// Raw binary cell (WKB, GeoPackage geometry, fixed-length bytes)
struct Blob {
  std::vector<uint8_t> bytes;
};

/// Geometry decoded by an adapter; only the shape type is kept
struct Geometry {
  std::string type; // "Point", "Polygon", ...
};

/// One cell as emitted by a source adapter. monostate means absent.
using CellValue = std::variant<std::monostate, bool, int64_t, double,
                               std::string, Blob, Geometry>;

DATASET_VALIDATOR_API bool is_absent(const CellValue &value);

/// Short human-readable rendering for violation messages
DATASET_VALIDATOR_API std::string describe(const CellValue &value);

enum class ViolationKind {
  SchemaError,
  TypeError,
  NullError,
  EnumError,
  RangeError,
  DuplicateError,
  CorruptionError
};

inline constexpr ViolationKind ALL_VIOLATION_KINDS[] = {
    ViolationKind::SchemaError,    ViolationKind::TypeError,
    ViolationKind::NullError,      ViolationKind::EnumError,
    ViolationKind::RangeError,     ViolationKind::DuplicateError,
    ViolationKind::CorruptionError};

DATASET_VALIDATOR_API std::string to_string(ViolationKind kind);

/// Higher value wins the severity classification
DATASET_VALIDATOR_API int severity_rank(ViolationKind kind);

enum class Severity { Error, Warning };

DATASET_VALIDATOR_API std::string to_string(Severity severity);

struct Violation {
  ViolationKind kind;
  Severity severity{Severity::Error};
  std::optional<std::string> column;
  std::optional<uint64_t> row_index; // 1-based, absent for whole-file errors
  std::string message;
};

DATASET_VALIDATOR_API void to_json(nlohmann::json &j, const Violation &v);

struct ValidationError {
  std::string path;
  std::string message;
  int line;
  int column;
};

struct ValidationResult {
  bool valid;
  std::vector<ValidationError> errors;
  std::vector<std::string> warnings;
};

} // namespace dsvalidator
