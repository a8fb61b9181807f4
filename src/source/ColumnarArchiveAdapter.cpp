#include "dataset-validator/source/ColumnarArchiveAdapter.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"
#include "dataset-validator/source/parquet/ColumnReader.hpp"
#include "dataset-validator/source/parquet/ParquetMetadata.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

namespace {

using parquet::ColumnReader;
using parquet::FileMetaData;
using parquet::LeafColumn;

class ParquetHandle;

class ParquetChunkStream : public ChunkStream {
public:
  ParquetChunkStream(ParquetHandle *handle, size_t chunk_size,
                     std::vector<std::string> columns,
                     std::vector<std::unique_ptr<ColumnReader>> readers,
                     uint64_t total_rows)
      : ChunkStream(std::move(columns)), handle_(handle),
        chunk_size_(chunk_size), readers_(std::move(readers)),
        total_rows_(total_rows) {}

protected:
  bool fill(RowChunk &chunk) override;

private:
  ParquetHandle *handle_;
  size_t chunk_size_;
  std::vector<std::unique_ptr<ColumnReader>> readers_;
  uint64_t total_rows_;
};

class ParquetHandle : public DatasetHandle {
public:
  explicit ParquetHandle(const std::string &path) : path_(path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw CorruptionError("Cannot open " + path);
    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec)
      throw CorruptionError("Cannot stat " + path + ": " + ec.message());

    meta_ = std::make_shared<FileMetaData>(parquet::read_file_metadata(in, size));
    leaves_ = parquet::build_leaf_columns(meta_->schema);

    int64_t group_rows = 0;
    for (const auto &group : meta_->row_groups)
      group_rows += group.num_rows;
    if (group_rows != meta_->num_rows)
      throw CorruptionError("Row group row counts (" +
                            std::to_string(group_rows) +
                            ") disagree with file row count (" +
                            std::to_string(meta_->num_rows) + ")");
    open_ = true;

    LOG_DEBUG("PARQUET", "OPEN", "{}: {} columns, {} rows in {} row groups",
              path, leaves_.size(), meta_->num_rows, meta_->row_groups.size());
  }

  ~ParquetHandle() override { close(); }

  PhysicalSchema schema_probe() override {
    PhysicalSchema schema;
    for (const auto &leaf : leaves_)
      schema.push_back(
          {leaf.path, parquet::physical_type_name(leaf.physical_type,
                                                  leaf.logical)});
    return schema;
  }

  void close() override { open_ = false; }
  bool is_open() const override { return open_; }

  std::map<std::string, std::string> diagnostics() const override {
    std::map<std::string, std::string> out{
        {"row_groups", std::to_string(meta_->row_groups.size())},
        {"num_rows", std::to_string(meta_->num_rows)}};
    if (meta_->created_by)
      out["created_by"] = *meta_->created_by;
    return out;
  }

protected:
  std::unique_ptr<ChunkStream>
  make_stream(size_t chunk_size,
              const std::vector<std::string> &columns) override {
    std::vector<std::unique_ptr<ColumnReader>> readers;
    for (const auto &name : columns) {
      auto it = std::find_if(leaves_.begin(), leaves_.end(),
                             [&](const LeafColumn &l) { return l.path == name; });
      if (it == leaves_.end())
        throw std::invalid_argument("Unknown column: " + name);
      readers.push_back(std::make_unique<ColumnReader>(path_, meta_, *it));
    }
    return std::make_unique<ParquetChunkStream>(
        this, chunk_size, columns, std::move(readers),
        static_cast<uint64_t>(std::max<int64_t>(meta_->num_rows, 0)));
  }

private:
  std::string path_;
  std::shared_ptr<FileMetaData> meta_;
  std::vector<LeafColumn> leaves_;
  bool open_{false};
};

bool ParquetChunkStream::fill(RowChunk &chunk) {
  if (!handle_->is_open())
    throw CorruptionError("Dataset handle closed during iteration");

  const uint64_t done = next_row() - 1;
  const uint64_t remaining = total_rows_ > done ? total_rows_ - done : 0;
  const size_t want =
      static_cast<size_t>(std::min<uint64_t>(chunk_size_, remaining));

  if (readers_.empty()) {
    chunk.row_count = want;
    return want > 0;
  }

  size_t shortest = want;
  std::string short_column;
  for (size_t c = 0; c < readers_.size(); ++c) {
    size_t got = readers_[c]->read(want, chunk.columns[c]);
    if (got < shortest) {
      shortest = got;
      short_column = readers_[c]->leaf().path;
    }
  }
  chunk.row_count = shortest;
  if (shortest < want) {
    uint64_t row = next_row() + shortest;
    throw CorruptionError("Column '" + short_column + "' ends at row " +
                              std::to_string(row - 1) + " but the file has " +
                              std::to_string(total_rows_) + " rows",
                          row);
  }
  return want > 0;
}

} // namespace

std::unique_ptr<DatasetHandle>
ColumnarArchiveAdapter::open(const std::string &path,
                             const OpenOptions & /*options*/) {
  if (!fs::is_regular_file(path))
    throw CorruptionError("File not found: " + path);
  return std::make_unique<ParquetHandle>(path);
}

} // namespace source
} // namespace dsvalidator
