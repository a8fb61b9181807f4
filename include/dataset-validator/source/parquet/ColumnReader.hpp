#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/parquet/ParquetMetadata.hpp"
#include "dataset-validator/types.hpp"

#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {
namespace parquet {

/// Sequential reader of one leaf column across every row group.
/// Holds its own file stream so columns advance independently.
class DATASET_VALIDATOR_API ColumnReader {
public:
  ColumnReader(const std::string &path,
               std::shared_ptr<const FileMetaData> meta, LeafColumn leaf);

  /// Append up to count cells (nulls as monostate). Returns the number
  /// appended; fewer than count only at the end of the column.
  size_t read(size_t count, std::vector<CellValue> &out);

  const LeafColumn &leaf() const { return leaf_; }

private:
  bool next_page();
  bool open_row_group();
  void decode_data_page(const PageHeader &header,
                        std::vector<uint8_t> page);
  void decode_data_page_v2(const PageHeader &header,
                           std::vector<uint8_t> page);
  void decode_values(int32_t encoding, const uint8_t *data, size_t size,
                     const std::vector<uint32_t> &def_levels,
                     size_t num_values);

  std::string path_;
  std::ifstream in_;
  std::shared_ptr<const FileMetaData> meta_;
  LeafColumn leaf_;

  size_t next_row_group_{0};
  bool in_row_group_{false};
  uint64_t chunk_end_{0};
  int32_t codec_{UNCOMPRESSED};
  int64_t chunk_values_left_{0};

  std::vector<CellValue> dictionary_;
  std::vector<CellValue> page_values_;
  size_t page_pos_{0};
};

} // namespace parquet
} // namespace source
} // namespace dsvalidator
