#include "dataset-validator/types.hpp"

#include <cmath>
#include <fmt/format.h>

namespace dsvalidator {

std::string to_string(DType dtype) {
  switch (dtype) {
  case DType::Int64:
    return "int64";
  case DType::Float64:
    return "float64";
  case DType::String:
    return "string";
  case DType::Bool:
    return "bool";
  case DType::Date:
    return "date";
  case DType::Timestamp:
    return "timestamp";
  case DType::Geometry:
    return "geometry";
  }
  return "unknown";
}

std::optional<DType> parse_dtype(const std::string &name) {
  if (name == "int64")
    return DType::Int64;
  if (name == "float64")
    return DType::Float64;
  if (name == "string")
    return DType::String;
  if (name == "bool")
    return DType::Bool;
  if (name == "date")
    return DType::Date;
  if (name == "timestamp")
    return DType::Timestamp;
  if (name == "geometry")
    return DType::Geometry;
  return std::nullopt;
}

bool is_absent(const CellValue &value) {
  if (std::holds_alternative<std::monostate>(value))
    return true;
  // NaN is how columnar writers spell a missing float
  if (auto d = std::get_if<double>(&value))
    return std::isnan(*d);
  return false;
}

namespace {

struct DescribeVisitor {
  static constexpr size_t max_len = 64;
  std::string operator()(std::monostate) const { return "null"; }
  std::string operator()(bool b) const { return b ? "true" : "false"; }
  std::string operator()(int64_t i) const { return std::to_string(i); }
  std::string operator()(double d) const { return fmt::format("{}", d); }
  std::string operator()(const std::string &s) const {
    if (s.size() > max_len)
      return s.substr(0, max_len) + "...";
    return s;
  }
  std::string operator()(const Blob &b) const {
    return fmt::format("<{} bytes>", b.bytes.size());
  }
  std::string operator()(const Geometry &g) const { return "<" + g.type + ">"; }
};

} // namespace

std::string describe(const CellValue &value) {
  return std::visit(DescribeVisitor{}, value);
}

std::string to_string(ViolationKind kind) {
  switch (kind) {
  case ViolationKind::SchemaError:
    return "SchemaError";
  case ViolationKind::TypeError:
    return "TypeError";
  case ViolationKind::NullError:
    return "NullError";
  case ViolationKind::EnumError:
    return "EnumError";
  case ViolationKind::RangeError:
    return "RangeError";
  case ViolationKind::DuplicateError:
    return "DuplicateError";
  case ViolationKind::CorruptionError:
    return "CorruptionError";
  }
  return "Unknown";
}

int severity_rank(ViolationKind kind) {
  switch (kind) {
  case ViolationKind::CorruptionError:
    return 4;
  case ViolationKind::SchemaError:
    return 3;
  case ViolationKind::TypeError:
  case ViolationKind::NullError:
  case ViolationKind::EnumError:
  case ViolationKind::RangeError:
    return 2;
  case ViolationKind::DuplicateError:
    return 1;
  }
  return 0;
}

std::string to_string(Severity severity) {
  return severity == Severity::Warning ? "warning" : "error";
}

void to_json(nlohmann::json &j, const Violation &v) {
  j = nlohmann::json{{"kind", to_string(v.kind)},
                     {"severity", to_string(v.severity)},
                     {"message", v.message}};
  j["column"] = v.column ? nlohmann::json(*v.column) : nlohmann::json();
  j["row_index"] = v.row_index ? nlohmann::json(*v.row_index) : nlohmann::json();
}

} // namespace dsvalidator
