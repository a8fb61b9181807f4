#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/SourceAdapter.hpp"

namespace dsvalidator {
namespace source {

/// Parquet / GeoParquet reader. Schema comes from the footer alone; rows
/// are decoded column by column, page by page, one row group at a time.
/// Geometry columns arrive as WKB blobs.
class DATASET_VALIDATOR_API ColumnarArchiveAdapter : public SourceAdapter {
public:
  SourceFormat format() const override {
    return SourceFormat::ColumnarArchive;
  }

  std::unique_ptr<DatasetHandle> open(const std::string &path,
                                      const OpenOptions &options) override;
};

} // namespace source
} // namespace dsvalidator
