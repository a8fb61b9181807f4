#pragma once
#include "dataset-validator/export.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace dsvalidator {
namespace source {

enum class Compression { None, Gzip, Bzip2, Xz };

/// Compression implied by the last extension (.gz/.tgz, .bz2/.tbz2, .xz/.txz)
DATASET_VALIDATOR_API Compression
compression_from_extension(const std::filesystem::path &path);

/// Sequential reader over a possibly compressed file
class DATASET_VALIDATOR_API ByteStream {
public:
  virtual ~ByteStream() = default;

  /// Read up to size bytes. Returns 0 at end of stream.
  /// Throws CorruptionError on read or decompression failure.
  virtual size_t read(char *buffer, size_t size) = 0;

  const std::string &path() const { return path_; }

protected:
  explicit ByteStream(std::string path) : path_(std::move(path)) {}

private:
  std::string path_;
};

/// Throws CorruptionError when the file cannot be opened
DATASET_VALIDATOR_API std::unique_ptr<ByteStream>
open_byte_stream(const std::filesystem::path &path, Compression compression);

/// Copy a whole stream into a file; returns bytes written
DATASET_VALIDATOR_API uint64_t copy_to_file(ByteStream &in,
                                            const std::filesystem::path &out);

} // namespace source
} // namespace dsvalidator
