#pragma once
#include "dataset-validator/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dsvalidator {
namespace test {

// Small writers that produce real files in each supported format

void write_text_file(const std::filesystem::path &path,
                     const std::string &content);

void write_gzip_file(const std::filesystem::path &path,
                     const std::string &content);

/// Create an SQLite database and run the statements in order
void write_sqlite(const std::filesystem::path &path,
                  const std::vector<std::string> &statements);

/// Minimal GeoPackage: gpkg_contents plus one feature table
void write_geopackage(const std::filesystem::path &path,
                      const std::string &table, const std::string &columns_sql,
                      const std::vector<std::string> &row_values);

struct ArchiveMember {
  std::string name;
  std::string content;
};

/// Stored (uncompressed) zip archive
void write_zip(const std::filesystem::path &path,
               const std::vector<ArchiveMember> &members);

/// ustar archive, gzip compressed when gzip is true
void write_tar(const std::filesystem::path &path,
               const std::vector<ArchiveMember> &members, bool gzip = false);

std::string read_file(const std::filesystem::path &path);

struct DbfFieldSpec {
  std::string name;
  char type;
  uint8_t length;
  uint8_t decimals{0};
};

struct PointRecord {
  std::vector<std::string> attributes; // one per field, unpadded
  bool null_shape{false};
  bool deleted{false};
  double x{0.0};
  double y{0.0};
};

/// Point shapefile (.shp, .shx, .dbf) next to shp. dbf_count_delta skews the
/// record count in the .dbf header.
void write_point_shapefile(const std::filesystem::path &shp,
                           const std::vector<DbfFieldSpec> &fields,
                           const std::vector<PointRecord> &records,
                           int dbf_count_delta = 0);

enum class ParquetAnnotation { None, String, Date };

struct ParquetColumnSpec {
  std::string name;
  int32_t physical_type; // parquet::PhysicalType
  ParquetAnnotation annotation{ParquetAnnotation::None};
  bool optional{true};
  /// monostate for null; int64_t for INT32/INT64, double, bool, string
  std::vector<CellValue> values;
};

struct ParquetWriteOptions {
  size_t rows_per_group{0}; // 0 writes one row group
  std::optional<int64_t> declared_num_rows;
};

/// Uncompressed PLAIN-encoded Parquet file with v1 data pages
void write_parquet(const std::filesystem::path &path,
                   const std::vector<ParquetColumnSpec> &columns,
                   const ParquetWriteOptions &options = {});

} // namespace test
} // namespace dsvalidator
