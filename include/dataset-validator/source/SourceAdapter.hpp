#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {

enum class SourceFormat {
  DelimitedText,      // CSV / TSV
  ColumnarArchive,    // Parquet / GeoParquet
  EmbeddedRelational, // GeoPackage / SQLite
  VectorGeometry      // Shapefile
};

DATASET_VALIDATOR_API std::string to_string(SourceFormat format);

/// Accepts the family names and the usual format names
/// (CSV, PARQUET, GEOPARQUET, GPKG, GEOPACKAGE, SHP, SHAPEFILE), any case
DATASET_VALIDATOR_API std::optional<SourceFormat>
parse_format(const std::string &name);

struct PhysicalColumn {
  std::string name;
  std::string physical_type;
};

using PhysicalSchema = std::vector<PhysicalColumn>;

/// Column-major batch of rows
struct DATASET_VALIDATOR_API RowChunk {
  uint64_t first_row{1}; // 1-based index of the first row in this chunk
  size_t row_count{0};
  std::vector<std::string> column_names;
  std::vector<std::vector<CellValue>> columns;

  void reset(const std::vector<std::string> &names);

  /// Truncate every column to the shortest one and set row_count to match
  void settle();
};

struct OpenOptions {
  std::optional<char> delimiter;   // delimited text only
  std::optional<std::string> layer; // embedded relational only
};

/// Lazy, finite, non-restartable sequence of chunks.
///
/// A decode fault after some rows of a pull were read returns those rows
/// first; the fault is raised as CorruptionError on the following pull.
class DATASET_VALIDATOR_API ChunkStream {
public:
  virtual ~ChunkStream() = default;

  /// Fill chunk with up to chunk_size rows. Returns false at end of data.
  bool next(RowChunk &chunk);

  uint64_t rows_read() const { return next_row_ - 1; }

protected:
  explicit ChunkStream(std::vector<std::string> columns)
      : columns_(std::move(columns)) {}

  /// Append rows to chunk.columns; throw CorruptionError on decode faults.
  /// Return false once no row could be produced.
  virtual bool fill(RowChunk &chunk) = 0;

  const std::vector<std::string> &columns() const { return columns_; }
  uint64_t next_row() const { return next_row_; }

private:
  struct PendingFault {
    std::string message;
    std::optional<uint64_t> row_index;
  };

  std::vector<std::string> columns_;
  uint64_t next_row_{1};
  bool finished_{false};
  std::optional<PendingFault> pending_fault_;
};

/// Open dataset. Owned exclusively by one validation run; close() is
/// idempotent and always runs from the destructor.
class DATASET_VALIDATOR_API DatasetHandle {
public:
  virtual ~DatasetHandle() = default;

  DatasetHandle(const DatasetHandle &) = delete;
  DatasetHandle &operator=(const DatasetHandle &) = delete;

  /// Metadata-only read of column names and physical types
  virtual PhysicalSchema schema_probe() = 0;

  /// Start the single pass over the data, projecting the given physical
  /// columns in that order. A second call throws std::logic_error.
  std::unique_ptr<ChunkStream> iter_chunks(size_t chunk_size,
                                           const std::vector<std::string> &columns);

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  /// Free-form facts about how the source was read (strategy, layer, ...)
  virtual std::map<std::string, std::string> diagnostics() const { return {}; }

protected:
  DatasetHandle() = default;

  virtual std::unique_ptr<ChunkStream>
  make_stream(size_t chunk_size, const std::vector<std::string> &columns) = 0;

private:
  bool iterated_{false};
};

/// One implementation per format family
class DATASET_VALIDATOR_API SourceAdapter {
public:
  virtual ~SourceAdapter() = default;

  virtual SourceFormat format() const = 0;

  /// Throws CorruptionError when path cannot be read as this format
  virtual std::unique_ptr<DatasetHandle> open(const std::string &path,
                                              const OpenOptions &options) = 0;
};

DATASET_VALIDATOR_API std::unique_ptr<SourceAdapter>
make_adapter(SourceFormat format);

} // namespace source
} // namespace dsvalidator
