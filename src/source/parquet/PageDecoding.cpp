#include "dataset-validator/source/parquet/PageDecoding.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/ValueCoercion.hpp"

#include <algorithm>
#include <cstring>
#include <zlib.h>

namespace dsvalidator {
namespace source {
namespace parquet {

namespace {

constexpr size_t kMaxPageSize = size_t{1} << 30;

uint64_t read_varint(const uint8_t *data, size_t size, size_t &pos) {
  uint64_t out = 0;
  for (int shift = 0; shift < 64; shift += 7) {
    if (pos >= size)
      throw CorruptionError("Truncated varint in page data");
    uint8_t b = data[pos++];
    out |= static_cast<uint64_t>(b & 0x7F) << shift;
    if ((b & 0x80) == 0)
      return out;
  }
  throw CorruptionError("Malformed varint in page data");
}

template <typename T> T load_le(const uint8_t *p) {
  T out;
  std::memcpy(&out, p, sizeof(T));
  return out; // little-endian hosts only
}

CellValue convert_int32(const LeafColumn &leaf, int32_t v) {
  if (leaf.logical == LogicalKind::Date)
    return CellValue{format_epoch_days(v)};
  return CellValue{static_cast<int64_t>(v)};
}

CellValue convert_int64(const LeafColumn &leaf, int64_t v) {
  switch (leaf.logical) {
  case LogicalKind::TimestampMillis:
    return CellValue{format_epoch_time(v, 1000)};
  case LogicalKind::TimestampMicros:
    return CellValue{format_epoch_time(v, 1000000)};
  case LogicalKind::TimestampNanos:
    return CellValue{format_epoch_time(v, 1000000000)};
  default:
    return CellValue{v};
  }
}

CellValue convert_bytes(const LeafColumn &leaf, const uint8_t *p, size_t n) {
  if (leaf.logical == LogicalKind::String)
    return CellValue{std::string(reinterpret_cast<const char *>(p), n)};
  return CellValue{Blob{std::vector<uint8_t>(p, p + n)}};
}

} // namespace

unsigned bit_width(uint32_t max_value) {
  unsigned width = 0;
  while (max_value != 0) {
    ++width;
    max_value >>= 1;
  }
  return width;
}

void decode_rle_hybrid(const uint8_t *data, size_t size, unsigned width,
                       size_t count, std::vector<uint32_t> &out) {
  out.clear();
  out.reserve(count);
  if (width == 0) {
    out.assign(count, 0);
    return;
  }
  if (width > 32)
    throw CorruptionError("Unsupported bit width " + std::to_string(width));

  size_t pos = 0;
  while (out.size() < count) {
    uint64_t header = read_varint(data, size, pos);
    if ((header & 1) == 0) {
      // RLE run
      uint64_t run = header >> 1;
      size_t byte_width = (width + 7) / 8;
      if (pos + byte_width > size)
        throw CorruptionError("Truncated RLE run");
      uint32_t value = 0;
      for (size_t i = 0; i < byte_width; ++i)
        value |= static_cast<uint32_t>(data[pos + i]) << (8 * i);
      pos += byte_width;
      if (run == 0)
        throw CorruptionError("Empty RLE run");
      size_t take =
          static_cast<size_t>(std::min<uint64_t>(run, count - out.size()));
      out.insert(out.end(), take, value);
    } else {
      // Bit-packed groups of 8 values
      uint64_t values = (header >> 1) * 8;
      uint64_t byte_len = (values * width + 7) / 8;
      if (values == 0)
        throw CorruptionError("Empty bit-packed run");
      // Writers may omit padding bytes of the final group
      size_t available = size - pos;
      size_t take =
          static_cast<size_t>(std::min<uint64_t>(values, count - out.size()));
      if ((static_cast<uint64_t>(take) * width + 7) / 8 > available)
        throw CorruptionError("Truncated bit-packed run");
      for (size_t i = 0; i < take; ++i) {
        uint32_t value = 0;
        uint64_t base = static_cast<uint64_t>(i) * width;
        for (unsigned b = 0; b < width; ++b) {
          uint64_t bit = base + b;
          if ((data[pos + bit / 8] >> (bit % 8)) & 1)
            value |= (1u << b);
        }
        out.push_back(value);
      }
      pos += static_cast<size_t>(std::min<uint64_t>(byte_len, available));
    }
  }
}

std::vector<uint8_t> snappy_decompress(const uint8_t *src, size_t size) {
  size_t pos = 0;
  uint64_t expected = read_varint(src, size, pos);
  if (expected > kMaxPageSize)
    throw CorruptionError("Snappy block too large");
  std::vector<uint8_t> out;
  out.reserve(static_cast<size_t>(expected));

  while (pos < size) {
    uint8_t tag = src[pos++];
    uint8_t kind = tag & 0x03;
    if (kind == 0) {
      // Literal
      uint32_t len = tag >> 2;
      if (len >= 60) {
        uint32_t n = len - 59;
        if (pos + n > size)
          throw CorruptionError("Truncated snappy literal length");
        len = 0;
        for (uint32_t i = 0; i < n; ++i)
          len |= static_cast<uint32_t>(src[pos + i]) << (8 * i);
        pos += n;
      }
      len += 1;
      if (pos + len > size)
        throw CorruptionError("Truncated snappy literal");
      out.insert(out.end(), src + pos, src + pos + len);
      pos += len;
      continue;
    }

    uint32_t len = 0;
    uint32_t offset = 0;
    if (kind == 1) {
      if (pos >= size)
        throw CorruptionError("Truncated snappy copy");
      len = 4 + ((tag >> 2) & 0x07);
      offset = (static_cast<uint32_t>(tag & 0xE0) << 3) | src[pos++];
    } else if (kind == 2) {
      if (pos + 2 > size)
        throw CorruptionError("Truncated snappy copy");
      len = 1 + (tag >> 2);
      offset = static_cast<uint32_t>(src[pos]) |
               (static_cast<uint32_t>(src[pos + 1]) << 8);
      pos += 2;
    } else {
      if (pos + 4 > size)
        throw CorruptionError("Truncated snappy copy");
      len = 1 + (tag >> 2);
      offset = load_le<uint32_t>(src + pos);
      pos += 4;
    }
    if (offset == 0 || offset > out.size())
      throw CorruptionError("Invalid snappy copy offset");
    if (out.size() + len > expected)
      throw CorruptionError("Snappy output overruns declared length");
    size_t start = out.size() - offset;
    for (uint32_t i = 0; i < len; ++i)
      out.push_back(out[start + i]);
  }

  if (out.size() != expected)
    throw CorruptionError("Snappy output length mismatch");
  return out;
}

std::vector<uint8_t> gzip_decompress(const uint8_t *src, size_t size,
                                     size_t expected_size) {
  z_stream strm{};
  strm.next_in = const_cast<Bytef *>(src);
  strm.avail_in = static_cast<uInt>(size);
  if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK)
    throw CorruptionError("inflateInit2 failed");

  std::vector<uint8_t> out(std::max<size_t>(expected_size, 1024));
  int ret = Z_OK;
  while (true) {
    if (strm.total_out == out.size()) {
      if (out.size() > kMaxPageSize) {
        inflateEnd(&strm);
        throw CorruptionError("Decompressed page too large");
      }
      out.resize(out.size() * 2);
    }
    strm.next_out = out.data() + strm.total_out;
    strm.avail_out = static_cast<uInt>(out.size() - strm.total_out);
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret == Z_STREAM_END)
      break;
    if (ret != Z_OK) {
      inflateEnd(&strm);
      throw CorruptionError("gzip page decode failed");
    }
  }
  out.resize(strm.total_out);
  inflateEnd(&strm);
  return out;
}

std::vector<uint8_t> decompress_page(int32_t codec,
                                     std::vector<uint8_t> compressed,
                                     size_t uncompressed_size) {
  switch (codec) {
  case UNCOMPRESSED:
    return compressed;
  case SNAPPY:
    return snappy_decompress(compressed.data(), compressed.size());
  case GZIP:
    return gzip_decompress(compressed.data(), compressed.size(),
                           uncompressed_size);
  default:
    throw CorruptionError("Unsupported Parquet codec " + std::to_string(codec));
  }
}

size_t decode_plain(const LeafColumn &leaf, const uint8_t *data, size_t size,
                    size_t count, std::vector<CellValue> &out) {
  size_t pos = 0;
  auto need = [&](size_t n) {
    if (n > size - pos)
      throw CorruptionError("Truncated PLAIN values in column '" + leaf.path +
                            "'");
  };

  switch (leaf.physical_type) {
  case BOOLEAN:
    need((count + 7) / 8);
    for (size_t i = 0; i < count; ++i)
      out.emplace_back(static_cast<bool>((data[i / 8] >> (i % 8)) & 1));
    return (count + 7) / 8;
  case INT32:
    need(count * 4);
    for (size_t i = 0; i < count; ++i)
      out.push_back(convert_int32(leaf, load_le<int32_t>(data + i * 4)));
    return count * 4;
  case INT64:
    need(count * 8);
    for (size_t i = 0; i < count; ++i)
      out.push_back(convert_int64(leaf, load_le<int64_t>(data + i * 8)));
    return count * 8;
  case INT96:
    need(count * 12);
    for (size_t i = 0; i < count; ++i)
      out.emplace_back(
          Blob{std::vector<uint8_t>(data + i * 12, data + i * 12 + 12)});
    return count * 12;
  case FLOAT:
    need(count * 4);
    for (size_t i = 0; i < count; ++i)
      out.emplace_back(static_cast<double>(load_le<float>(data + i * 4)));
    return count * 4;
  case DOUBLE:
    need(count * 8);
    for (size_t i = 0; i < count; ++i)
      out.emplace_back(load_le<double>(data + i * 8));
    return count * 8;
  case BYTE_ARRAY:
    for (size_t i = 0; i < count; ++i) {
      need(4);
      uint32_t len = load_le<uint32_t>(data + pos);
      pos += 4;
      need(len);
      out.push_back(convert_bytes(leaf, data + pos, len));
      pos += len;
    }
    return pos;
  case FIXED_LEN_BYTE_ARRAY: {
    if (leaf.type_length <= 0)
      throw CorruptionError("Invalid fixed length for column '" + leaf.path +
                            "'");
    size_t len = static_cast<size_t>(leaf.type_length);
    need(count * len);
    for (size_t i = 0; i < count; ++i)
      out.push_back(convert_bytes(leaf, data + i * len, len));
    return count * len;
  }
  default:
    throw CorruptionError("Unsupported physical type " +
                          std::to_string(leaf.physical_type));
  }
}

} // namespace parquet
} // namespace source
} // namespace dsvalidator
