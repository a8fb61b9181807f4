#include "dataset-validator/source/EmbeddedRelationalAdapter.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sqlite3.h>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

std::string quote_identifier(const std::string &name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

namespace {

constexpr char kSqliteMagic[16] = {'S', 'Q', 'L', 'i', 't', 'e', ' ', 'f',
                                   'o', 'r', 'm', 'a', 't', ' ', '3', '\0'};

bool has_sqlite_magic(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  char head[16];
  in.read(head, sizeof(head));
  return in && std::memcmp(head, kSqliteMagic, sizeof(head)) == 0;
}

/// Owning prepared statement
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) !=
        SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_)
      sqlite3_finalize(stmt_);
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool ok() const { return stmt_ != nullptr; }
  const std::string &error() const { return error_; }
  sqlite3_stmt *get() { return stmt_; }

  /// SQLITE_ROW or SQLITE_DONE; anything else becomes CorruptionError
  int step(std::optional<uint64_t> row = std::nullopt) {
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
      throw CorruptionError(std::string("SQLite read failed: ") +
                                sqlite3_errmsg(db_),
                            row);
    return rc;
  }

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_{nullptr};
  std::string error_;
};

CellValue read_cell(sqlite3_stmt *stmt, int col) {
  switch (sqlite3_column_type(stmt, col)) {
  case SQLITE_INTEGER:
    return CellValue{static_cast<int64_t>(sqlite3_column_int64(stmt, col))};
  case SQLITE_FLOAT:
    return CellValue{sqlite3_column_double(stmt, col)};
  case SQLITE_TEXT: {
    const auto *text =
        reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
    int n = sqlite3_column_bytes(stmt, col);
    return CellValue{std::string(text ? text : "", static_cast<size_t>(n))};
  }
  case SQLITE_BLOB: {
    const auto *data =
        static_cast<const uint8_t *>(sqlite3_column_blob(stmt, col));
    int n = sqlite3_column_bytes(stmt, col);
    Blob blob;
    if (data && n > 0)
      blob.bytes.assign(data, data + n);
    return CellValue{std::move(blob)};
  }
  default:
    return CellValue{std::monostate{}};
  }
}

class GpkgHandle;

class GpkgChunkStream : public ChunkStream {
public:
  GpkgChunkStream(GpkgHandle *handle, size_t chunk_size,
                  std::vector<std::string> columns,
                  std::unique_ptr<Statement> stmt, bool keyset)
      : ChunkStream(std::move(columns)), handle_(handle),
        chunk_size_(chunk_size), stmt_(std::move(stmt)), keyset_(keyset) {}

protected:
  bool fill(RowChunk &chunk) override;

private:
  GpkgHandle *handle_;
  size_t chunk_size_;
  std::unique_ptr<Statement> stmt_;
  bool keyset_;
  int64_t last_rowid_{std::numeric_limits<int64_t>::min()};
  bool done_{false};
};

class GpkgHandle : public DatasetHandle {
public:
  GpkgHandle(const std::string &path, const OpenOptions &options)
      : path_(path) {
    if (!has_sqlite_magic(path))
      throw CorruptionError(path + " is not an SQLite database");

    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READONLY,
                             nullptr);
    if (rc != SQLITE_OK) {
      std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
      close();
      throw CorruptionError("Cannot open " + path + ": " + msg);
    }

    try {
      check_integrity();
      layer_ = options.layer ? *options.layer : default_layer();
      load_columns();
      is_view_ = layer_is_view();
    } catch (...) {
      close();
      throw;
    }

    LOG_DEBUG("GPKG", "OPEN", "{}: layer '{}' with {} columns", path, layer_,
              columns_.size());
  }

  ~GpkgHandle() override { close(); }

  PhysicalSchema schema_probe() override { return columns_; }

  void close() override {
    if (db_) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }
  bool is_open() const override { return db_ != nullptr; }

  std::map<std::string, std::string> diagnostics() const override {
    std::map<std::string, std::string> out{{"layer", layer_}};
    if (!strategy_.empty())
      out["strategy"] = strategy_;
    return out;
  }

  sqlite3 *db() { return db_; }

protected:
  std::unique_ptr<ChunkStream>
  make_stream(size_t chunk_size,
              const std::vector<std::string> &columns) override {
    std::string projection;
    for (const auto &name : columns) {
      auto it = std::find_if(columns_.begin(), columns_.end(),
                             [&](const PhysicalColumn &c) {
                               return c.name == name;
                             });
      if (it == columns_.end())
        throw std::invalid_argument("Unknown column: " + name);
      projection += ", " + quote_identifier(name);
    }
    const std::string table = quote_identifier(layer_);

    // Depending on the SQLite build a view either rejects rowid or yields NULL
    std::unique_ptr<Statement> keyset;
    if (!is_view_)
      keyset = std::make_unique<Statement>(
          db_, "SELECT rowid" + projection + " FROM " + table +
                   " WHERE rowid > ?1 ORDER BY rowid LIMIT ?2");
    if (keyset && keyset->ok()) {
      strategy_ = "keyset";
      LOG_DEBUG("GPKG", "SCAN", "Paging '{}' by rowid", layer_);
      return std::make_unique<GpkgChunkStream>(this, chunk_size, columns,
                                               std::move(keyset), true);
    }

    // Views and WITHOUT ROWID tables
    std::string select_list =
        projection.empty() ? std::string("1") : projection.substr(2);
    auto cursor = std::make_unique<Statement>(
        db_, "SELECT " + select_list + " FROM " + table);
    if (!cursor->ok())
      throw CorruptionError("Cannot query layer '" + layer_ +
                            "': " + cursor->error());
    strategy_ = "cursor";
    LOG_DEBUG("GPKG", "SCAN", "rowid unavailable for '{}' ({}), using cursor",
              layer_, keyset ? keyset->error() : std::string("view"));
    return std::make_unique<GpkgChunkStream>(this, chunk_size, columns,
                                             std::move(cursor), false);
  }

private:
  void check_integrity() {
    Statement check(db_, "PRAGMA quick_check");
    if (!check.ok())
      throw CorruptionError("Cannot read " + path_ + ": " + check.error());
    if (check.step() == SQLITE_ROW) {
      const auto *text =
          reinterpret_cast<const char *>(sqlite3_column_text(check.get(), 0));
      std::string result = text ? text : "";
      if (result != "ok")
        throw CorruptionError("Integrity check failed for " + path_ + ": " +
                              result);
    }
  }

  std::string default_layer() {
    {
      Statement contents(db_, "SELECT table_name FROM gpkg_contents "
                              "WHERE data_type = 'features' ORDER BY rowid");
      if (contents.ok() && contents.step() == SQLITE_ROW)
        return reinterpret_cast<const char *>(
            sqlite3_column_text(contents.get(), 0));
    }
    Statement tables(db_,
                     "SELECT name FROM sqlite_master "
                     "WHERE type IN ('table', 'view') "
                     "AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
                     "AND name NOT LIKE 'gpkg\\_%' ESCAPE '\\' "
                     "AND name NOT LIKE 'rtree\\_%' ESCAPE '\\' "
                     "ORDER BY rowid");
    if (!tables.ok())
      throw CorruptionError("Cannot list tables of " + path_ + ": " +
                            tables.error());
    if (tables.step() != SQLITE_ROW)
      throw CorruptionError(path_ + " contains no tables");
    return reinterpret_cast<const char *>(sqlite3_column_text(tables.get(), 0));
  }

  void load_columns() {
    Statement info(db_, "PRAGMA table_info(" + quote_identifier(layer_) + ")");
    if (!info.ok())
      throw CorruptionError("Cannot describe layer '" + layer_ +
                            "': " + info.error());
    while (info.step() == SQLITE_ROW) {
      const auto *name =
          reinterpret_cast<const char *>(sqlite3_column_text(info.get(), 1));
      const auto *type =
          reinterpret_cast<const char *>(sqlite3_column_text(info.get(), 2));
      std::string declared = type ? type : "";
      columns_.push_back({name ? name : "", declared.empty() ? "ANY" : declared});
    }
    if (columns_.empty())
      throw CorruptionError("Layer '" + layer_ + "' not found in " + path_);
  }

  bool layer_is_view() {
    Statement kind(db_, "SELECT type FROM sqlite_master WHERE name = ?1");
    if (!kind.ok())
      return false;
    sqlite3_bind_text(kind.get(), 1, layer_.c_str(), -1, SQLITE_TRANSIENT);
    if (kind.step() != SQLITE_ROW)
      return false;
    const auto *type =
        reinterpret_cast<const char *>(sqlite3_column_text(kind.get(), 0));
    return type && std::strcmp(type, "view") == 0;
  }

  std::string path_;
  sqlite3 *db_{nullptr};
  std::string layer_;
  bool is_view_{false};
  std::string strategy_;
  PhysicalSchema columns_;
};

bool GpkgChunkStream::fill(RowChunk &chunk) {
  sqlite3 *db = handle_->db();
  if (!db)
    throw CorruptionError("Dataset handle closed during iteration");
  if (done_)
    return false;

  sqlite3_stmt *stmt = stmt_->get();
  const int offset = keyset_ ? 1 : 0;
  if (keyset_) {
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, last_rowid_);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk_size_));
  }

  uint64_t row = next_row();
  while (chunk.row_count < chunk_size_) {
    if (stmt_->step(row) != SQLITE_ROW) {
      done_ = true;
      break;
    }
    if (keyset_)
      last_rowid_ = sqlite3_column_int64(stmt, 0);
    for (size_t c = 0; c < chunk.columns.size(); ++c)
      chunk.columns[c].push_back(read_cell(stmt, static_cast<int>(c) + offset));
    ++chunk.row_count;
    ++row;
  }
  // A short keyset page means the table is exhausted
  if (keyset_ && chunk.row_count < chunk_size_)
    done_ = true;
  return chunk.row_count > 0;
}

} // namespace

std::unique_ptr<DatasetHandle>
EmbeddedRelationalAdapter::open(const std::string &path,
                                const OpenOptions &options) {
  if (!fs::is_regular_file(path))
    throw CorruptionError("File not found: " + path);
  return std::make_unique<GpkgHandle>(path, options);
}

} // namespace source
} // namespace dsvalidator
