#include "dataset-validator/source/parquet/ParquetMetadata.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/source/parquet/ThriftCompact.hpp"

#include <cstring>

namespace dsvalidator {
namespace source {
namespace parquet {

namespace {

constexpr uint32_t kMaxFooterSize = 256u * 1024u * 1024u;

// converted_type values that matter here
constexpr int32_t CONVERTED_UTF8 = 0;
constexpr int32_t CONVERTED_ENUM = 4;
constexpr int32_t CONVERTED_DATE = 6;
constexpr int32_t CONVERTED_TIMESTAMP_MILLIS = 9;
constexpr int32_t CONVERTED_TIMESTAMP_MICROS = 10;
constexpr int32_t CONVERTED_JSON = 19;

using Reader = CompactReader<BufferSource>;

LogicalKind parse_time_unit(Reader &r) {
  LogicalKind kind = LogicalKind::None;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    if (h.type == CT_STRUCT) {
      if (h.id == 1)
        kind = LogicalKind::TimestampMillis;
      else if (h.id == 2)
        kind = LogicalKind::TimestampMicros;
      else if (h.id == 3)
        kind = LogicalKind::TimestampNanos;
    }
    r.skip(h.type);
  }
  return kind;
}

LogicalKind parse_timestamp_type(Reader &r) {
  LogicalKind kind = LogicalKind::None;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    if (h.id == 2 && h.type == CT_STRUCT)
      kind = parse_time_unit(r);
    else
      r.skip(h.type);
  }
  return kind;
}

LogicalKind parse_logical_type(Reader &r) {
  LogicalKind kind = LogicalKind::None;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:  // STRING
    case 4:  // ENUM
    case 12: // JSON
      kind = LogicalKind::String;
      r.skip(h.type);
      break;
    case 6: // DATE
      kind = LogicalKind::Date;
      r.skip(h.type);
      break;
    case 8: // TIMESTAMP
      kind = h.type == CT_STRUCT ? parse_timestamp_type(r) : LogicalKind::None;
      if (h.type != CT_STRUCT)
        r.skip(h.type);
      break;
    default:
      r.skip(h.type);
    }
  }
  return kind;
}

SchemaElement parse_schema_element(Reader &r) {
  SchemaElement out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:
      out.type = r.expect_i32(h);
      break;
    case 2:
      out.type_length = r.expect_i32(h);
      break;
    case 3:
      out.repetition = r.expect_i32(h);
      break;
    case 4:
      if (h.type != CT_BINARY)
        throw CorruptionError("Schema element name has wrong type");
      out.name = r.read_binary();
      break;
    case 5:
      out.num_children = r.expect_i32(h);
      break;
    case 6:
      out.converted_type = r.expect_i32(h);
      break;
    case 10:
      if (h.type == CT_STRUCT)
        out.logical = parse_logical_type(r);
      else
        r.skip(h.type);
      break;
    default:
      r.skip(h.type);
    }
  }
  if (out.logical == LogicalKind::None && out.converted_type) {
    switch (*out.converted_type) {
    case CONVERTED_UTF8:
    case CONVERTED_ENUM:
    case CONVERTED_JSON:
      out.logical = LogicalKind::String;
      break;
    case CONVERTED_DATE:
      out.logical = LogicalKind::Date;
      break;
    case CONVERTED_TIMESTAMP_MILLIS:
      out.logical = LogicalKind::TimestampMillis;
      break;
    case CONVERTED_TIMESTAMP_MICROS:
      out.logical = LogicalKind::TimestampMicros;
      break;
    default:
      break;
    }
  }
  return out;
}

ColumnMetaData parse_column_metadata(Reader &r) {
  ColumnMetaData out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:
      out.type = r.expect_i32(h);
      break;
    case 3: {
      if (h.type != CT_LIST)
        throw CorruptionError("Column path has wrong type");
      uint8_t elem = CT_STOP;
      uint64_t n = r.read_list_header(elem);
      for (uint64_t i = 0; i < n; ++i)
        out.path.push_back(r.read_binary());
      break;
    }
    case 4:
      out.codec = r.expect_i32(h);
      break;
    case 5:
      out.num_values = r.expect_i64(h);
      break;
    case 7:
      out.total_compressed_size = r.expect_i64(h);
      break;
    case 9:
      out.data_page_offset = r.expect_i64(h);
      break;
    case 11:
      out.dictionary_page_offset = r.expect_i64(h);
      break;
    default:
      r.skip(h.type);
    }
  }
  return out;
}

ColumnMetaData parse_column_chunk(Reader &r) {
  ColumnMetaData out;
  bool has_meta = false;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    if (h.id == 1 && h.type == CT_BINARY) {
      // Column data in another file
      if (!r.read_binary().empty())
        throw CorruptionError("External column chunk files are not supported");
    } else if (h.id == 3 && h.type == CT_STRUCT) {
      out = parse_column_metadata(r);
      has_meta = true;
    } else {
      r.skip(h.type);
    }
  }
  if (!has_meta)
    throw CorruptionError("Column chunk without metadata");
  return out;
}

RowGroup parse_row_group(Reader &r) {
  RowGroup out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    if (h.id == 1 && h.type == CT_LIST) {
      uint8_t elem = CT_STOP;
      uint64_t n = r.read_list_header(elem);
      for (uint64_t i = 0; i < n; ++i)
        out.columns.push_back(parse_column_chunk(r));
    } else if (h.id == 3) {
      out.num_rows = r.expect_i64(h);
    } else {
      r.skip(h.type);
    }
  }
  return out;
}

FileMetaData parse_file_metadata(Reader &r) {
  FileMetaData out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 2: {
      uint8_t elem = CT_STOP;
      uint64_t n = r.read_list_header(elem);
      for (uint64_t i = 0; i < n; ++i)
        out.schema.push_back(parse_schema_element(r));
      break;
    }
    case 3:
      out.num_rows = r.expect_i64(h);
      break;
    case 4: {
      uint8_t elem = CT_STOP;
      uint64_t n = r.read_list_header(elem);
      for (uint64_t i = 0; i < n; ++i)
        out.row_groups.push_back(parse_row_group(r));
      break;
    }
    case 6:
      if (h.type == CT_BINARY)
        out.created_by = r.read_binary();
      else
        r.skip(h.type);
      break;
    default:
      r.skip(h.type);
    }
  }
  return out;
}

template <typename Src>
DataPageHeader parse_data_page_header(CompactReader<Src> &r) {
  DataPageHeader out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:
      out.num_values = r.expect_i32(h);
      break;
    case 2:
      out.encoding = r.expect_i32(h);
      break;
    case 3:
      out.definition_level_encoding = r.expect_i32(h);
      break;
    default:
      r.skip(h.type);
    }
  }
  return out;
}

template <typename Src>
DictionaryPageHeader parse_dictionary_page_header(CompactReader<Src> &r) {
  DictionaryPageHeader out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    if (h.id == 1)
      out.num_values = r.expect_i32(h);
    else if (h.id == 2)
      out.encoding = r.expect_i32(h);
    else
      r.skip(h.type);
  }
  return out;
}

template <typename Src>
DataPageHeaderV2 parse_data_page_header_v2(CompactReader<Src> &r) {
  DataPageHeaderV2 out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:
      out.num_values = r.expect_i32(h);
      break;
    case 2:
      out.num_nulls = r.expect_i32(h);
      break;
    case 3:
      out.num_rows = r.expect_i32(h);
      break;
    case 4:
      out.encoding = r.expect_i32(h);
      break;
    case 5:
      out.definition_levels_byte_length = r.expect_i32(h);
      break;
    case 6:
      out.repetition_levels_byte_length = r.expect_i32(h);
      break;
    case 7:
      out.is_compressed = h.bool_value();
      break;
    default:
      r.skip(h.type);
    }
  }
  return out;
}

uint32_t load_u32_le(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

void collect_leaves(const std::vector<SchemaElement> &schema, size_t &idx,
                    const std::string &prefix, uint32_t def, uint32_t rep,
                    std::vector<LeafColumn> &leaves) {
  if (idx >= schema.size())
    throw CorruptionError("Parquet schema tree is truncated");
  const SchemaElement &el = schema[idx++];
  uint32_t d = def;
  uint32_t r = rep;
  int32_t repetition = el.repetition.value_or(REQUIRED);
  if (repetition == OPTIONAL)
    ++d;
  else if (repetition == REPEATED) {
    ++d;
    ++r;
  }
  std::string path = prefix.empty() ? el.name : prefix + "." + el.name;

  if (el.num_children > 0) {
    for (int32_t c = 0; c < el.num_children; ++c)
      collect_leaves(schema, idx, path, d, r, leaves);
    return;
  }
  if (!el.type)
    throw CorruptionError("Parquet leaf '" + path + "' has no physical type");
  LeafColumn leaf;
  leaf.path = path;
  leaf.physical_type = *el.type;
  leaf.type_length = el.type_length;
  leaf.logical = el.logical;
  leaf.max_definition_level = d;
  leaf.max_repetition_level = r;
  leaf.column_index = leaves.size();
  leaves.push_back(std::move(leaf));
}

} // namespace

FileMetaData read_file_metadata(std::ifstream &in, uint64_t file_size) {
  if (file_size < 12)
    throw CorruptionError("File too small to be Parquet");

  char head[4];
  in.seekg(0);
  in.read(head, 4);
  if (!in || std::memcmp(head, "PAR1", 4) != 0)
    throw CorruptionError("Missing leading PAR1 magic");

  uint8_t tail[8];
  in.seekg(static_cast<std::streamoff>(file_size - 8));
  in.read(reinterpret_cast<char *>(tail), 8);
  if (!in || std::memcmp(tail + 4, "PAR1", 4) != 0)
    throw CorruptionError("Missing trailing PAR1 magic (truncated file?)");

  uint32_t footer_len = load_u32_le(tail);
  if (footer_len == 0 || footer_len > kMaxFooterSize ||
      footer_len > file_size - 12)
    throw CorruptionError("Invalid Parquet footer length " +
                          std::to_string(footer_len));

  std::vector<uint8_t> footer(footer_len);
  in.seekg(static_cast<std::streamoff>(file_size - 8 - footer_len));
  in.read(reinterpret_cast<char *>(footer.data()), footer_len);
  if (!in)
    throw CorruptionError("Cannot read Parquet footer");

  BufferSource src(footer.data(), footer.size());
  Reader reader(src);
  FileMetaData meta = parse_file_metadata(reader);
  if (meta.schema.empty())
    throw CorruptionError("Parquet footer has no schema");
  return meta;
}

PageHeader read_page_header(std::ifstream &in, uint64_t limit) {
  StreamSource src(in, limit);
  CompactReader<StreamSource> r(src);
  PageHeader out;
  int16_t last = 0;
  while (true) {
    FieldHeader h = r.read_field_header(last);
    if (h.is_stop())
      break;
    switch (h.id) {
    case 1:
      out.type = r.expect_i32(h);
      break;
    case 2:
      out.uncompressed_page_size = r.expect_i32(h);
      break;
    case 3:
      out.compressed_page_size = r.expect_i32(h);
      break;
    case 5:
      out.data_page = parse_data_page_header(r);
      break;
    case 7:
      out.dictionary_page = parse_dictionary_page_header(r);
      break;
    case 8:
      out.data_page_v2 = parse_data_page_header_v2(r);
      break;
    default:
      r.skip(h.type);
    }
  }
  if (out.compressed_page_size < 0 || out.uncompressed_page_size < 0)
    throw CorruptionError("Negative page size in page header");
  return out;
}

std::vector<LeafColumn>
build_leaf_columns(const std::vector<SchemaElement> &schema) {
  std::vector<LeafColumn> leaves;
  if (schema.empty())
    return leaves;
  // schema[0] is the root group
  size_t idx = 1;
  for (int32_t c = 0; c < schema[0].num_children; ++c)
    collect_leaves(schema, idx, "", 0, 0, leaves);
  return leaves;
}

std::string physical_type_name(int32_t type, LogicalKind logical) {
  std::string name;
  switch (type) {
  case BOOLEAN:
    name = "BOOLEAN";
    break;
  case INT32:
    name = "INT32";
    break;
  case INT64:
    name = "INT64";
    break;
  case INT96:
    name = "INT96";
    break;
  case FLOAT:
    name = "FLOAT";
    break;
  case DOUBLE:
    name = "DOUBLE";
    break;
  case BYTE_ARRAY:
    name = "BYTE_ARRAY";
    break;
  case FIXED_LEN_BYTE_ARRAY:
    name = "FIXED_LEN_BYTE_ARRAY";
    break;
  default:
    name = "UNKNOWN";
  }
  switch (logical) {
  case LogicalKind::String:
    return name + "/STRING";
  case LogicalKind::Date:
    return name + "/DATE";
  case LogicalKind::TimestampMillis:
  case LogicalKind::TimestampMicros:
  case LogicalKind::TimestampNanos:
    return name + "/TIMESTAMP";
  case LogicalKind::None:
    break;
  }
  return name;
}

} // namespace parquet
} // namespace source
} // namespace dsvalidator
