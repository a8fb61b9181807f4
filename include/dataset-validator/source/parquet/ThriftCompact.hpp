#pragma once
#include "dataset-validator/Errors.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {
namespace parquet {

// Thrift compact protocol type ids
constexpr uint8_t CT_STOP = 0x00;
constexpr uint8_t CT_BOOLEAN_TRUE = 0x01;
constexpr uint8_t CT_BOOLEAN_FALSE = 0x02;
constexpr uint8_t CT_BYTE = 0x03;
constexpr uint8_t CT_I16 = 0x04;
constexpr uint8_t CT_I32 = 0x05;
constexpr uint8_t CT_I64 = 0x06;
constexpr uint8_t CT_DOUBLE = 0x07;
constexpr uint8_t CT_BINARY = 0x08;
constexpr uint8_t CT_LIST = 0x09;
constexpr uint8_t CT_SET = 0x0A;
constexpr uint8_t CT_MAP = 0x0B;
constexpr uint8_t CT_STRUCT = 0x0C;

/// Raised when a source runs out of bytes mid-structure
class ThriftUnderflow : public CorruptionError {
public:
  using CorruptionError::CorruptionError;
};

/// In-memory byte source (footer)
class BufferSource {
public:
  BufferSource(const uint8_t *data, size_t size) : data_(data), size_(size) {}

  uint8_t read_u8() {
    if (pos_ >= size_)
      throw ThriftUnderflow("Thrift buffer underflow");
    return data_[pos_++];
  }

  void read_bytes(void *out, size_t n) {
    if (n > size_ - pos_)
      throw ThriftUnderflow("Thrift buffer underflow");
    std::memcpy(out, data_ + pos_, n);
    pos_ += n;
  }

  void skip(size_t n) {
    if (n > size_ - pos_)
      throw ThriftUnderflow("Thrift buffer underflow");
    pos_ += n;
  }

  size_t pos() const { return pos_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_{0};
};

/// File-backed byte source bounded by limit (page headers)
class StreamSource {
public:
  StreamSource(std::ifstream &in, uint64_t limit) : in_(in), limit_(limit) {}

  uint8_t read_u8() {
    uint8_t b = 0;
    read_bytes(&b, 1);
    return b;
  }

  void read_bytes(void *out, size_t n) {
    if (pos_ + n > limit_)
      throw ThriftUnderflow("Thrift stream underflow");
    in_.read(static_cast<char *>(out), static_cast<std::streamsize>(n));
    if (!in_)
      throw ThriftUnderflow("Unexpected end of file in page header");
    pos_ += n;
  }

  void skip(size_t n) {
    if (pos_ + n > limit_)
      throw ThriftUnderflow("Thrift stream underflow");
    in_.seekg(static_cast<std::streamoff>(n), std::ios::cur);
    if (!in_)
      throw ThriftUnderflow("Unexpected end of file in page header");
    pos_ += n;
  }

  uint64_t pos() const { return pos_; }

private:
  std::ifstream &in_;
  uint64_t limit_;
  uint64_t pos_{0};
};

struct FieldHeader {
  int16_t id{0};
  uint8_t type{CT_STOP};

  bool is_stop() const { return type == CT_STOP; }
  // Booleans inside structs carry their value in the type nibble
  bool bool_value() const { return type == CT_BOOLEAN_TRUE; }
};

/// Compact protocol decoding primitives over a Source
template <typename Source> class CompactReader {
public:
  explicit CompactReader(Source &src) : src_(src) {}

  uint64_t read_varint() {
    uint64_t out = 0;
    for (int shift = 0; shift < 70; shift += 7) {
      uint8_t b = src_.read_u8();
      out |= static_cast<uint64_t>(b & 0x7F) << shift;
      if ((b & 0x80) == 0)
        return out;
    }
    throw CorruptionError("Malformed varint in Thrift data");
  }

  static int64_t zigzag(uint64_t n) {
    return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
  }

  int16_t read_i16() { return static_cast<int16_t>(zigzag(read_varint())); }
  int32_t read_i32() { return static_cast<int32_t>(zigzag(read_varint())); }
  int64_t read_i64() { return zigzag(read_varint()); }

  double read_double() {
    uint8_t bytes[8];
    src_.read_bytes(bytes, 8);
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i)
      bits = (bits << 8) | bytes[i];
    double out = 0;
    std::memcpy(&out, &bits, sizeof(out));
    return out;
  }

  std::string read_binary() {
    uint64_t len = read_varint();
    if (len > (1ull << 31))
      throw CorruptionError("Thrift binary field too large");
    std::string out(static_cast<size_t>(len), '\0');
    if (len > 0)
      src_.read_bytes(&out[0], static_cast<size_t>(len));
    return out;
  }

  /// Read a field header relative to the previous field id of the struct
  FieldHeader read_field_header(int16_t &last_id) {
    FieldHeader header;
    uint8_t b = src_.read_u8();
    if (b == CT_STOP)
      return header;
    uint8_t delta = static_cast<uint8_t>(b >> 4);
    header.type = static_cast<uint8_t>(b & 0x0F);
    header.id = delta == 0 ? read_i16() : static_cast<int16_t>(last_id + delta);
    last_id = header.id;
    return header;
  }

  /// Returns element count; elem_type receives the element type id
  uint64_t read_list_header(uint8_t &elem_type) {
    uint8_t b = src_.read_u8();
    elem_type = static_cast<uint8_t>(b & 0x0F);
    uint64_t size = b >> 4;
    if (size == 15)
      size = read_varint();
    return size;
  }

  /// Boolean as a list element (one byte)
  bool read_bool_element() { return src_.read_u8() == CT_BOOLEAN_TRUE; }

  int32_t expect_i32(const FieldHeader &h) {
    if (h.type != CT_I32)
      throw CorruptionError("Unexpected Thrift type for i32 field " +
                            std::to_string(h.id));
    return read_i32();
  }

  int64_t expect_i64(const FieldHeader &h) {
    if (h.type == CT_I32)
      return read_i32();
    if (h.type != CT_I64)
      throw CorruptionError("Unexpected Thrift type for i64 field " +
                            std::to_string(h.id));
    return read_i64();
  }

  void skip(uint8_t type, int depth = 0) {
    if (depth > 64)
      throw CorruptionError("Thrift structure nested too deeply");
    switch (type) {
    case CT_BOOLEAN_TRUE:
    case CT_BOOLEAN_FALSE:
      return;
    case CT_BYTE:
      src_.read_u8();
      return;
    case CT_I16:
    case CT_I32:
    case CT_I64:
      read_varint();
      return;
    case CT_DOUBLE:
      src_.skip(8);
      return;
    case CT_BINARY:
      src_.skip(static_cast<size_t>(read_varint()));
      return;
    case CT_LIST:
    case CT_SET: {
      uint8_t elem = CT_STOP;
      uint64_t n = read_list_header(elem);
      for (uint64_t i = 0; i < n; ++i) {
        if (elem == CT_BOOLEAN_TRUE || elem == CT_BOOLEAN_FALSE)
          src_.read_u8();
        else
          skip(elem, depth + 1);
      }
      return;
    }
    case CT_MAP: {
      uint64_t n = read_varint();
      if (n == 0)
        return;
      uint8_t kv = src_.read_u8();
      for (uint64_t i = 0; i < n; ++i) {
        skip(static_cast<uint8_t>(kv >> 4), depth + 1);
        skip(static_cast<uint8_t>(kv & 0x0F), depth + 1);
      }
      return;
    }
    case CT_STRUCT: {
      int16_t last = 0;
      while (true) {
        FieldHeader h = read_field_header(last);
        if (h.is_stop())
          return;
        skip(h.type, depth + 1);
      }
    }
    default:
      throw CorruptionError("Unknown Thrift type id " + std::to_string(type));
    }
  }

  Source &source() { return src_; }

private:
  Source &src_;
};

} // namespace parquet
} // namespace source
} // namespace dsvalidator
