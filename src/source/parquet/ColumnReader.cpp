#include "dataset-validator/source/parquet/ColumnReader.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/source/parquet/PageDecoding.hpp"

#include <algorithm>
#include <cstring>

namespace dsvalidator {
namespace source {
namespace parquet {

namespace {

uint32_t load_u32(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

ColumnReader::ColumnReader(const std::string &path,
                           std::shared_ptr<const FileMetaData> meta,
                           LeafColumn leaf)
    : path_(path), in_(path, std::ios::binary), meta_(std::move(meta)),
      leaf_(std::move(leaf)) {
  if (!in_)
    throw CorruptionError("Cannot open " + path);
  if (leaf_.max_repetition_level > 0)
    throw CorruptionError("Repeated column '" + leaf_.path +
                          "' is not supported");
}

bool ColumnReader::open_row_group() {
  while (next_row_group_ < meta_->row_groups.size()) {
    const RowGroup &group = meta_->row_groups[next_row_group_++];
    if (leaf_.column_index >= group.columns.size())
      throw CorruptionError("Row group is missing column '" + leaf_.path +
                            "'");
    const ColumnMetaData &chunk = group.columns[leaf_.column_index];
    if (chunk.num_values == 0)
      continue;

    int64_t start = chunk.data_page_offset;
    if (chunk.dictionary_page_offset && *chunk.dictionary_page_offset > 0 &&
        *chunk.dictionary_page_offset < start)
      start = *chunk.dictionary_page_offset;
    if (start < 4 || chunk.total_compressed_size <= 0)
      throw CorruptionError("Invalid column chunk offsets for '" +
                            leaf_.path + "'");

    in_.clear();
    in_.seekg(static_cast<std::streamoff>(start));
    if (!in_)
      throw CorruptionError("Cannot seek to column chunk of '" + leaf_.path +
                            "'");
    chunk_end_ = static_cast<uint64_t>(start) +
                 static_cast<uint64_t>(chunk.total_compressed_size);
    codec_ = chunk.codec;
    chunk_values_left_ = chunk.num_values;
    dictionary_.clear();
    in_row_group_ = true;
    return true;
  }
  return false;
}

bool ColumnReader::next_page() {
  page_values_.clear();
  page_pos_ = 0;
  while (true) {
    if (!in_row_group_ && !open_row_group())
      return false;

    uint64_t pos = static_cast<uint64_t>(in_.tellg());
    if (chunk_values_left_ <= 0 || pos >= chunk_end_) {
      if (chunk_values_left_ > 0)
        throw CorruptionError("Column chunk of '" + leaf_.path +
                              "' ends before all values were read");
      in_row_group_ = false;
      continue;
    }

    PageHeader header = read_page_header(in_, chunk_end_ - pos);
    uint64_t body_pos = static_cast<uint64_t>(in_.tellg());
    if (static_cast<uint64_t>(header.compressed_page_size) >
        chunk_end_ - body_pos)
      throw CorruptionError("Page of '" + leaf_.path +
                            "' overruns its column chunk");

    std::vector<uint8_t> body(static_cast<size_t>(header.compressed_page_size));
    if (!body.empty()) {
      in_.read(reinterpret_cast<char *>(body.data()),
               static_cast<std::streamsize>(body.size()));
      if (!in_)
        throw CorruptionError("Unexpected end of file in column '" +
                              leaf_.path + "'");
    }

    switch (header.type) {
    case DICTIONARY_PAGE: {
      if (!header.dictionary_page)
        throw CorruptionError("Dictionary page without header");
      auto data = decompress_page(codec_, std::move(body),
                                  static_cast<size_t>(
                                      header.uncompressed_page_size));
      dictionary_.clear();
      decode_plain(leaf_, data.data(), data.size(),
                   static_cast<size_t>(header.dictionary_page->num_values),
                   dictionary_);
      break;
    }
    case DATA_PAGE:
      decode_data_page(header, std::move(body));
      break;
    case DATA_PAGE_V2:
      decode_data_page_v2(header, std::move(body));
      break;
    default:
      // Index pages carry no values
      break;
    }
    if (!page_values_.empty())
      return true;
  }
}

void ColumnReader::decode_data_page(const PageHeader &header,
                                    std::vector<uint8_t> page) {
  if (!header.data_page)
    throw CorruptionError("Data page without header");
  const size_t num_values =
      static_cast<size_t>(std::max<int32_t>(header.data_page->num_values, 0));
  auto data = decompress_page(codec_, std::move(page),
                              static_cast<size_t>(header.uncompressed_page_size));

  size_t pos = 0;
  std::vector<uint32_t> def_levels;
  if (leaf_.max_definition_level > 0) {
    if (data.size() < 4)
      throw CorruptionError("Truncated definition levels in '" + leaf_.path +
                            "'");
    uint32_t len = load_u32(data.data());
    if (len > data.size() - 4)
      throw CorruptionError("Definition levels overrun page in '" +
                            leaf_.path + "'");
    decode_rle_hybrid(data.data() + 4, len,
                      bit_width(leaf_.max_definition_level), num_values,
                      def_levels);
    pos = 4 + len;
  }
  decode_values(header.data_page->encoding, data.data() + pos,
                data.size() - pos, def_levels, num_values);
  chunk_values_left_ -= static_cast<int64_t>(num_values);
}

void ColumnReader::decode_data_page_v2(const PageHeader &header,
                                       std::vector<uint8_t> page) {
  if (!header.data_page_v2)
    throw CorruptionError("Data page v2 without header");
  const DataPageHeaderV2 &v2 = *header.data_page_v2;
  const size_t num_values = static_cast<size_t>(std::max<int32_t>(v2.num_values, 0));
  const size_t rep_len =
      static_cast<size_t>(std::max<int32_t>(v2.repetition_levels_byte_length, 0));
  const size_t def_len =
      static_cast<size_t>(std::max<int32_t>(v2.definition_levels_byte_length, 0));
  if (rep_len + def_len > page.size())
    throw CorruptionError("Level sections overrun page in '" + leaf_.path +
                          "'");

  std::vector<uint32_t> def_levels;
  if (leaf_.max_definition_level > 0)
    decode_rle_hybrid(page.data() + rep_len, def_len,
                      bit_width(leaf_.max_definition_level), num_values,
                      def_levels);

  std::vector<uint8_t> values(page.begin() + rep_len + def_len, page.end());
  if (v2.is_compressed) {
    size_t expected = static_cast<size_t>(header.uncompressed_page_size) -
                      std::min(static_cast<size_t>(header.uncompressed_page_size),
                               rep_len + def_len);
    values = decompress_page(codec_, std::move(values), expected);
  }
  decode_values(v2.encoding, values.data(), values.size(), def_levels,
                num_values);
  chunk_values_left_ -= static_cast<int64_t>(num_values);
}

void ColumnReader::decode_values(int32_t encoding, const uint8_t *data,
                                 size_t size,
                                 const std::vector<uint32_t> &def_levels,
                                 size_t num_values) {
  size_t present = num_values;
  if (leaf_.max_definition_level > 0)
    present = static_cast<size_t>(
        std::count(def_levels.begin(), def_levels.end(),
                   leaf_.max_definition_level));

  std::vector<CellValue> values;
  values.reserve(present);
  switch (encoding) {
  case PLAIN:
    decode_plain(leaf_, data, size, present, values);
    break;
  case PLAIN_DICTIONARY:
  case RLE_DICTIONARY: {
    if (present == 0)
      break;
    if (size < 1)
      throw CorruptionError("Missing dictionary index width in '" +
                            leaf_.path + "'");
    if (dictionary_.empty())
      throw CorruptionError("Dictionary-encoded page without dictionary in '" +
                            leaf_.path + "'");
    std::vector<uint32_t> ids;
    decode_rle_hybrid(data + 1, size - 1, data[0], present, ids);
    for (uint32_t id : ids) {
      if (id >= dictionary_.size())
        throw CorruptionError("Dictionary index out of range in '" +
                              leaf_.path + "'");
      values.push_back(dictionary_[id]);
    }
    break;
  }
  case RLE: {
    if (leaf_.physical_type != BOOLEAN)
      throw CorruptionError("RLE value encoding on non-boolean column '" +
                            leaf_.path + "'");
    if (size < 4)
      throw CorruptionError("Truncated RLE booleans in '" + leaf_.path + "'");
    uint32_t len = load_u32(data);
    if (len > size - 4)
      throw CorruptionError("RLE booleans overrun page in '" + leaf_.path +
                            "'");
    std::vector<uint32_t> bits;
    decode_rle_hybrid(data + 4, len, 1, present, bits);
    for (uint32_t b : bits)
      values.emplace_back(b != 0);
    break;
  }
  default:
    throw CorruptionError("Unsupported encoding " + std::to_string(encoding) +
                          " in column '" + leaf_.path + "'");
  }

  page_values_.reserve(num_values);
  if (leaf_.max_definition_level == 0) {
    page_values_ = std::move(values);
    return;
  }
  size_t v = 0;
  for (uint32_t level : def_levels) {
    if (level == leaf_.max_definition_level)
      page_values_.push_back(std::move(values[v++]));
    else
      page_values_.emplace_back(std::monostate{});
  }
}

size_t ColumnReader::read(size_t count, std::vector<CellValue> &out) {
  size_t appended = 0;
  while (appended < count) {
    if (page_pos_ >= page_values_.size() && !next_page())
      break;
    size_t take = std::min(count - appended, page_values_.size() - page_pos_);
    for (size_t i = 0; i < take; ++i)
      out.push_back(std::move(page_values_[page_pos_ + i]));
    page_pos_ += take;
    appended += take;
  }
  return appended;
}

} // namespace parquet
} // namespace source
} // namespace dsvalidator
