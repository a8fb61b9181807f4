#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <string>

namespace dsvalidator {
namespace source {

/// GeoPackage (or any SQLite database) reader.
///
/// The layer is OpenOptions::layer, else the first 'features' table listed in
/// gpkg_contents, else the first user table. Rows are paged by rowid; tables
/// without a usable rowid fall back to a single forward cursor.
class DATASET_VALIDATOR_API EmbeddedRelationalAdapter : public SourceAdapter {
public:
  SourceFormat format() const override {
    return SourceFormat::EmbeddedRelational;
  }

  std::unique_ptr<DatasetHandle> open(const std::string &path,
                                      const OpenOptions &options) override;
};

/// Double-quote an SQL identifier
DATASET_VALIDATOR_API std::string quote_identifier(const std::string &name);

} // namespace source
} // namespace dsvalidator
