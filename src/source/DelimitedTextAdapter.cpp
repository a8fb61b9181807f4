#include "dataset-validator/source/DelimitedTextAdapter.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <unordered_map>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

namespace {
constexpr size_t kReadSize = 1 << 16;
constexpr size_t kMaxSniffLine = 1 << 20;
} // namespace

CsvRecordReader::CsvRecordReader(std::unique_ptr<ByteStream> in,
                                 char delimiter)
    : in_(std::move(in)), delimiter_(delimiter), buffer_(kReadSize) {
  // Strip a UTF-8 byte order mark
  while (end_ < 3 && fill_buffer()) {
  }
  if (end_ >= 3 && static_cast<unsigned char>(buffer_[0]) == 0xEF &&
      static_cast<unsigned char>(buffer_[1]) == 0xBB &&
      static_cast<unsigned char>(buffer_[2]) == 0xBF) {
    pos_ = 3;
  }
}

bool CsvRecordReader::fill_buffer() {
  if (eof_)
    return false;
  if (pos_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + pos_, end_ - pos_);
    end_ -= pos_;
    pos_ = 0;
  }
  if (end_ == buffer_.size())
    buffer_.resize(buffer_.size() * 2);
  size_t got = in_->read(buffer_.data() + end_, buffer_.size() - end_);
  if (got == 0) {
    eof_ = true;
    return false;
  }
  end_ += got;
  return true;
}

int CsvRecordReader::get() {
  if (pos_ == end_ && !fill_buffer())
    return -1;
  return static_cast<unsigned char>(buffer_[pos_++]);
}

int CsvRecordReader::peek() {
  if (pos_ == end_ && !fill_buffer())
    return -1;
  return static_cast<unsigned char>(buffer_[pos_]);
}

std::string CsvRecordReader::peek_line() {
  while (true) {
    const char *begin = buffer_.data() + pos_;
    const char *finish = buffer_.data() + end_;
    const char *nl = std::find(begin, finish, '\n');
    if (nl != finish || end_ - pos_ >= kMaxSniffLine || eof_ ||
        !fill_buffer()) {
      // fill_buffer may have moved the data
      begin = buffer_.data() + pos_;
      finish = buffer_.data() + end_;
      nl = std::find(begin, finish, '\n');
      std::string line(begin, nl);
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      return line;
    }
  }
}

bool CsvRecordReader::read_record(std::vector<Field> &fields) {
  fields.clear();
  int c = get();
  if (c < 0)
    return false;

  Field field;
  bool in_quotes = false;
  while (true) {
    if (c < 0) {
      if (in_quotes)
        throw CorruptionError("Unterminated quoted field at end of " +
                              in_->path());
      fields.push_back(std::move(field));
      return true;
    }
    const char ch = static_cast<char>(c);
    if (in_quotes) {
      if (ch == '"') {
        if (peek() == '"') {
          get();
          field.text += '"';
        } else {
          in_quotes = false;
        }
      } else {
        field.text += ch;
      }
    } else if (ch == delimiter_) {
      fields.push_back(std::move(field));
      field = Field{};
    } else if (ch == '\n') {
      fields.push_back(std::move(field));
      return true;
    } else if (ch == '\r') {
      if (peek() == '\n')
        get();
      fields.push_back(std::move(field));
      return true;
    } else if (ch == '"' && field.text.empty() && !field.quoted) {
      in_quotes = true;
      field.quoted = true;
    } else {
      field.text += ch;
    }
    c = get();
  }
}

char sniff_delimiter(const std::string &line) {
  const char candidates[] = {',', ';', '\t', '|'};
  std::unordered_map<char, size_t> counts;
  bool in_quotes = false;
  for (char ch : line) {
    if (ch == '"') {
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes)
      ++counts[ch];
  }
  char best = ',';
  size_t best_count = 0;
  for (char c : candidates) {
    if (counts[c] > best_count) {
      best = c;
      best_count = counts[c];
    }
  }
  return best;
}

namespace {

class CsvHandle;

class CsvChunkStream : public ChunkStream {
public:
  CsvChunkStream(CsvHandle *handle, size_t chunk_size,
                 std::vector<std::string> columns,
                 std::vector<size_t> field_index)
      : ChunkStream(std::move(columns)), handle_(handle),
        chunk_size_(chunk_size), field_index_(std::move(field_index)) {}

protected:
  bool fill(RowChunk &chunk) override;

private:
  CsvHandle *handle_;
  size_t chunk_size_;
  std::vector<size_t> field_index_;
  std::vector<CsvRecordReader::Field> record_;
};

class CsvHandle : public DatasetHandle {
public:
  CsvHandle(const std::string &path, const OpenOptions &options)
      : path_(path) {
    reader_ = std::make_unique<CsvRecordReader>(
        open_byte_stream(path, compression_from_extension(path)));

    char delimiter = options.delimiter ? *options.delimiter
                                       : sniff_delimiter(reader_->peek_line());
    reader_->set_delimiter(delimiter);

    std::vector<CsvRecordReader::Field> header;
    if (!reader_->read_record(header))
      throw CorruptionError("Missing header row in " + path);
    for (auto &field : header)
      header_.push_back(field.text);
    if (header_.size() == 1 && header_[0].empty())
      throw CorruptionError("Empty header row in " + path);

    LOG_DEBUG("CSV", "OPEN", "{}: {} columns, delimiter '{}'", path,
              header_.size(), delimiter == '\t' ? std::string("\\t")
                                                : std::string(1, delimiter));
  }

  ~CsvHandle() override { close(); }

  PhysicalSchema schema_probe() override {
    PhysicalSchema schema;
    for (const auto &name : header_)
      schema.push_back({name, "text"});
    return schema;
  }

  void close() override { reader_.reset(); }
  bool is_open() const override { return reader_ != nullptr; }

  std::map<std::string, std::string> diagnostics() const override {
    std::string delim(1, reader_ ? reader_->delimiter() : ',');
    if (delim == "\t")
      delim = "\\t";
    return {{"delimiter", delim}};
  }

  CsvRecordReader *reader() { return reader_.get(); }
  size_t field_count() const { return header_.size(); }

protected:
  std::unique_ptr<ChunkStream>
  make_stream(size_t chunk_size,
              const std::vector<std::string> &columns) override {
    std::vector<size_t> index;
    for (const auto &name : columns) {
      auto it = std::find(header_.begin(), header_.end(), name);
      if (it == header_.end())
        throw std::invalid_argument("Unknown column: " + name);
      index.push_back(static_cast<size_t>(it - header_.begin()));
    }
    return std::make_unique<CsvChunkStream>(this, chunk_size, columns,
                                            std::move(index));
  }

private:
  std::string path_;
  std::unique_ptr<CsvRecordReader> reader_;
  std::vector<std::string> header_;
};

bool CsvChunkStream::fill(RowChunk &chunk) {
  CsvRecordReader *reader = handle_->reader();
  if (!reader)
    throw CorruptionError("Dataset handle closed during iteration");

  const size_t expected = handle_->field_count();
  uint64_t row = next_row();
  while (chunk.row_count < chunk_size_) {
    if (!reader->read_record(record_))
      break;
    // Blank line; with a single column it is a missing value instead
    if (expected > 1 && record_.size() == 1 && record_[0].text.empty() &&
        !record_[0].quoted)
      continue;
    if (record_.size() != expected) {
      throw CorruptionError("Row " + std::to_string(row) + ": expected " +
                                std::to_string(expected) + " fields, found " +
                                std::to_string(record_.size()),
                            row);
    }
    for (size_t c = 0; c < field_index_.size(); ++c) {
      auto &field = record_[field_index_[c]];
      if (field.text.empty() && !field.quoted)
        chunk.columns[c].emplace_back(std::monostate{});
      else
        chunk.columns[c].emplace_back(std::move(field.text));
    }
    ++chunk.row_count;
    ++row;
  }
  return chunk.row_count > 0;
}

} // namespace

std::unique_ptr<DatasetHandle>
DelimitedTextAdapter::open(const std::string &path,
                           const OpenOptions &options) {
  if (!fs::is_regular_file(path))
    throw CorruptionError("File not found: " + path);
  return std::make_unique<CsvHandle>(path, options);
}

} // namespace source
} // namespace dsvalidator
