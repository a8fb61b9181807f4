#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dsvalidator {
namespace source {

/// ESRI Shapefile reader (.shp geometry, .shx index, .dbf attributes).
/// Attribute columns come from the .dbf; shapes appear as a "geometry"
/// column carrying the shape type only.
class DATASET_VALIDATOR_API VectorGeometryAdapter : public SourceAdapter {
public:
  SourceFormat format() const override { return SourceFormat::VectorGeometry; }

  std::unique_ptr<DatasetHandle> open(const std::string &path,
                                      const OpenOptions &options) override;
};

/// Sibling of shp with the given extension, matched case-insensitively
DATASET_VALIDATOR_API std::optional<std::filesystem::path>
find_sidecar(const std::filesystem::path &shp, const std::string &extension);

/// Geometry name of a shapefile shape type code ("Point", "Polygon", ...)
DATASET_VALIDATOR_API std::string shape_type_name(int32_t code);

} // namespace source
} // namespace dsvalidator
