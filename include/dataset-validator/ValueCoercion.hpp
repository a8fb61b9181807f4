#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/types.hpp"

#include <optional>
#include <string>

namespace dsvalidator {

/// Coerce a present cell to a template dtype.
///
/// Returns the normalised typed value, or nullopt when the cell does not
/// satisfy the dtype. Normalised forms:
///   int64      -> int64_t
///   float64    -> double
///   string     -> std::string
///   bool       -> bool
///   date       -> std::string "YYYY-MM-DD"
///   timestamp  -> std::string (ISO-8601 text as given, trimmed)
///   geometry   -> the input cell (Geometry, Blob or WKT text)
/// Callers must handle absent values before calling.
DATASET_VALIDATOR_API std::optional<CellValue> coerce(const CellValue &raw,
                                                      DType dtype);

/// Stable key of a coerced value; equal keys mean equal values for enum and
/// uniqueness purposes
DATASET_VALIDATOR_API std::string canonical_key(const CellValue &typed);

/// Numeric view of a coerced int64/float64 value
DATASET_VALIDATOR_API std::optional<double> numeric_value(const CellValue &typed);

/// Convert a JSON scalar (template enum entry) into a cell
DATASET_VALIDATOR_API std::optional<CellValue>
cell_from_json(const nlohmann::json &scalar);

// Text predicates shared with the adapters
DATASET_VALIDATOR_API bool is_iso_date(const std::string &text);
DATASET_VALIDATOR_API bool is_iso_timestamp(const std::string &text);
DATASET_VALIDATOR_API bool looks_like_wkt(const std::string &text);
DATASET_VALIDATOR_API bool looks_like_wkb(const Blob &blob);

/// Civil date for a count of days since 1970-01-01
DATASET_VALIDATOR_API std::string format_epoch_days(int64_t days);

/// ISO timestamp for a count of units since the epoch
/// (units_per_second: 1000 millis, 1000000 micros, 1000000000 nanos)
DATASET_VALIDATOR_API std::string format_epoch_time(int64_t value,
                                                    int64_t units_per_second);

} // namespace dsvalidator
