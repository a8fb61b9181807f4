#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <filesystem>
#include <optional>

namespace dsvalidator {
namespace source {

/// Format implied by the file name, ignoring a trailing compression
/// extension (data.csv.gz -> DelimitedText)
DATASET_VALIDATOR_API std::optional<SourceFormat>
format_from_extension(const std::filesystem::path &path);

/// Extension first, then magic bytes. Unknown text falls back to
/// DelimitedText.
DATASET_VALIDATOR_API SourceFormat
detect_format(const std::filesystem::path &path);

} // namespace source
} // namespace dsvalidator
