#pragma once
#include "dataset-validator/export.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {
namespace parquet {

enum PhysicalType : int32_t {
  BOOLEAN = 0,
  INT32 = 1,
  INT64 = 2,
  INT96 = 3,
  FLOAT = 4,
  DOUBLE = 5,
  BYTE_ARRAY = 6,
  FIXED_LEN_BYTE_ARRAY = 7
};

enum Encoding : int32_t {
  PLAIN = 0,
  PLAIN_DICTIONARY = 2,
  RLE = 3,
  BIT_PACKED = 4,
  RLE_DICTIONARY = 8
};

enum Codec : int32_t { UNCOMPRESSED = 0, SNAPPY = 1, GZIP = 2 };

enum PageType : int32_t {
  DATA_PAGE = 0,
  INDEX_PAGE = 1,
  DICTIONARY_PAGE = 2,
  DATA_PAGE_V2 = 3
};

enum Repetition : int32_t { REQUIRED = 0, OPTIONAL = 1, REPEATED = 2 };

/// Value interpretation derived from converted_type / logicalType
enum class LogicalKind {
  None,
  String,
  Date,
  TimestampMillis,
  TimestampMicros,
  TimestampNanos
};

struct SchemaElement {
  std::optional<int32_t> type;
  int32_t type_length{0};
  std::optional<int32_t> repetition;
  std::string name;
  int32_t num_children{0};
  std::optional<int32_t> converted_type;
  LogicalKind logical{LogicalKind::None};
};

struct ColumnMetaData {
  int32_t type{0};
  std::vector<std::string> path;
  int32_t codec{UNCOMPRESSED};
  int64_t num_values{0};
  int64_t total_compressed_size{0};
  int64_t data_page_offset{0};
  std::optional<int64_t> dictionary_page_offset;
};

struct RowGroup {
  std::vector<ColumnMetaData> columns;
  int64_t num_rows{0};
};

struct FileMetaData {
  std::vector<SchemaElement> schema;
  int64_t num_rows{0};
  std::vector<RowGroup> row_groups;
  std::optional<std::string> created_by;
};

struct DataPageHeader {
  int32_t num_values{0};
  int32_t encoding{PLAIN};
  int32_t definition_level_encoding{RLE};
};

struct DataPageHeaderV2 {
  int32_t num_values{0};
  int32_t num_nulls{0};
  int32_t num_rows{0};
  int32_t encoding{PLAIN};
  int32_t definition_levels_byte_length{0};
  int32_t repetition_levels_byte_length{0};
  bool is_compressed{true};
};

struct DictionaryPageHeader {
  int32_t num_values{0};
  int32_t encoding{PLAIN};
};

struct PageHeader {
  int32_t type{DATA_PAGE};
  int32_t uncompressed_page_size{0};
  int32_t compressed_page_size{0};
  std::optional<DataPageHeader> data_page;
  std::optional<DictionaryPageHeader> dictionary_page;
  std::optional<DataPageHeaderV2> data_page_v2;
};

/// Leaf column of the schema tree
struct LeafColumn {
  std::string path; // dotted
  int32_t physical_type{BYTE_ARRAY};
  int32_t type_length{0};
  LogicalKind logical{LogicalKind::None};
  uint32_t max_definition_level{0};
  uint32_t max_repetition_level{0};
  size_t column_index{0}; // position in RowGroup::columns
};

/// Validate magic bytes and decode the footer. Throws CorruptionError.
DATASET_VALIDATOR_API FileMetaData read_file_metadata(std::ifstream &in,
                                                      uint64_t file_size);

/// Decode a page header at the current stream position, reading at most
/// limit bytes. Throws CorruptionError.
DATASET_VALIDATOR_API PageHeader read_page_header(std::ifstream &in,
                                                  uint64_t limit);

DATASET_VALIDATOR_API std::vector<LeafColumn>
build_leaf_columns(const std::vector<SchemaElement> &schema);

DATASET_VALIDATOR_API std::string physical_type_name(int32_t type,
                                                     LogicalKind logical);

} // namespace parquet
} // namespace source
} // namespace dsvalidator
