#pragma once
#include "dataset-validator/export.h"
#include "dataset-validator/source/ByteStream.hpp"
#include "dataset-validator/source/SourceAdapter.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dsvalidator {
namespace source {

/// RFC-4180 record reader over a byte stream
class DATASET_VALIDATOR_API CsvRecordReader {
public:
  struct Field {
    std::string text;
    bool quoted{false};
  };

  CsvRecordReader(std::unique_ptr<ByteStream> in, char delimiter = ',');

  /// Next record; false at end of input. Throws CorruptionError on an
  /// unterminated quoted field.
  bool read_record(std::vector<Field> &fields);

  /// First physical line without consuming it (for delimiter sniffing)
  std::string peek_line();

  void set_delimiter(char delimiter) { delimiter_ = delimiter; }
  char delimiter() const { return delimiter_; }

private:
  bool fill_buffer();
  int get();
  int peek();

  std::unique_ptr<ByteStream> in_;
  char delimiter_;
  std::vector<char> buffer_;
  size_t pos_{0};
  size_t end_{0};
  bool eof_{false};
};

/// Most frequent candidate delimiter (, ; tab |) outside quotes, ',' if none
DATASET_VALIDATOR_API char sniff_delimiter(const std::string &line);

class DATASET_VALIDATOR_API DelimitedTextAdapter : public SourceAdapter {
public:
  SourceFormat format() const override { return SourceFormat::DelimitedText; }

  std::unique_ptr<DatasetHandle> open(const std::string &path,
                                      const OpenOptions &options) override;
};

} // namespace source
} // namespace dsvalidator
