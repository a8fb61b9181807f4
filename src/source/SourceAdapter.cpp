#include "dataset-validator/source/SourceAdapter.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/source/ColumnarArchiveAdapter.hpp"
#include "dataset-validator/source/DelimitedTextAdapter.hpp"
#include "dataset-validator/source/EmbeddedRelationalAdapter.hpp"
#include "dataset-validator/source/VectorGeometryAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dsvalidator {
namespace source {

std::string to_string(SourceFormat format) {
  switch (format) {
  case SourceFormat::DelimitedText:
    return "CSV";
  case SourceFormat::ColumnarArchive:
    return "GEOPARQUET";
  case SourceFormat::EmbeddedRelational:
    return "GEOPACKAGE";
  case SourceFormat::VectorGeometry:
    return "SHAPEFILE";
  }
  return "UNKNOWN";
}

std::optional<SourceFormat> parse_format(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "CSV" || upper == "TSV" || upper == "DELIMITEDTEXT")
    return SourceFormat::DelimitedText;
  if (upper == "PARQUET" || upper == "GEOPARQUET" ||
      upper == "COLUMNARARCHIVE")
    return SourceFormat::ColumnarArchive;
  if (upper == "GPKG" || upper == "GEOPACKAGE" || upper == "SQLITE" ||
      upper == "EMBEDDEDRELATIONAL")
    return SourceFormat::EmbeddedRelational;
  if (upper == "SHP" || upper == "SHAPEFILE" || upper == "VECTORGEOMETRY")
    return SourceFormat::VectorGeometry;
  return std::nullopt;
}

void RowChunk::reset(const std::vector<std::string> &names) {
  column_names = names;
  row_count = 0;
  columns.resize(names.size());
  for (auto &col : columns)
    col.clear();
}

void RowChunk::settle() {
  if (columns.empty())
    return;
  size_t shortest = columns.front().size();
  for (const auto &col : columns)
    shortest = std::min(shortest, col.size());
  for (auto &col : columns)
    col.resize(shortest);
  row_count = shortest;
}

bool ChunkStream::next(RowChunk &chunk) {
  if (pending_fault_) {
    auto fault = *pending_fault_;
    pending_fault_.reset();
    finished_ = true;
    throw CorruptionError(fault.message, fault.row_index);
  }
  if (finished_)
    return false;

  chunk.reset(columns_);
  chunk.first_row = next_row_;
  bool produced = false;
  try {
    produced = fill(chunk);
    // A projection without columns still counts rows
    if (!chunk.columns.empty())
      chunk.settle();
  } catch (const CorruptionError &e) {
    if (!chunk.columns.empty())
      chunk.settle();
    if (chunk.row_count == 0) {
      finished_ = true;
      throw;
    }
    pending_fault_ = PendingFault{e.what(), e.row_index()};
    next_row_ += chunk.row_count;
    return true;
  }

  if (!produced || chunk.row_count == 0) {
    finished_ = true;
    return false;
  }
  next_row_ += chunk.row_count;
  return true;
}

std::unique_ptr<ChunkStream>
DatasetHandle::iter_chunks(size_t chunk_size,
                           const std::vector<std::string> &columns) {
  if (iterated_)
    throw std::logic_error("iter_chunks called twice on the same handle");
  if (!is_open())
    throw std::logic_error("iter_chunks called on a closed handle");
  if (chunk_size == 0)
    throw std::invalid_argument("chunk_size must be > 0");
  iterated_ = true;
  return make_stream(chunk_size, columns);
}

std::unique_ptr<SourceAdapter> make_adapter(SourceFormat format) {
  switch (format) {
  case SourceFormat::DelimitedText:
    return std::make_unique<DelimitedTextAdapter>();
  case SourceFormat::ColumnarArchive:
    return std::make_unique<ColumnarArchiveAdapter>();
  case SourceFormat::EmbeddedRelational:
    return std::make_unique<EmbeddedRelationalAdapter>();
  case SourceFormat::VectorGeometry:
    return std::make_unique<VectorGeometryAdapter>();
  }
  throw std::invalid_argument("Unknown source format");
}

} // namespace source
} // namespace dsvalidator
