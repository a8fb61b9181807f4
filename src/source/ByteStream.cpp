#include "dataset-validator/source/ByteStream.hpp"
#include "dataset-validator/Errors.hpp"

#include <algorithm>
#include <bzlib.h>
#include <cctype>
#include <fstream>
#include <lzma.h>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

namespace {

constexpr size_t kInputBufferSize = 1 << 16;

class PlainByteStream : public ByteStream {
public:
  explicit PlainByteStream(const fs::path &path)
      : ByteStream(path.string()), file_(path, std::ios::binary) {
    if (!file_)
      throw CorruptionError("Cannot open file: " + path.string());
  }

  size_t read(char *buffer, size_t size) override {
    file_.read(buffer, static_cast<std::streamsize>(size));
    if (file_.bad())
      throw CorruptionError("I/O error reading " + this->path());
    return static_cast<size_t>(file_.gcount());
  }

private:
  std::ifstream file_;
};

/// Shared input side of the streaming decompressors
class CompressedByteStream : public ByteStream {
protected:
  explicit CompressedByteStream(const fs::path &path)
      : ByteStream(path.string()), file_(path, std::ios::binary),
        input_(kInputBufferSize) {
    if (!file_)
      throw CorruptionError("Cannot open file: " + path.string());
  }

  /// Refill the input buffer; returns bytes available (0 at end of file)
  size_t refill() {
    file_.read(input_.data(), static_cast<std::streamsize>(input_.size()));
    if (file_.bad())
      throw CorruptionError("I/O error reading " + this->path());
    return static_cast<size_t>(file_.gcount());
  }

  bool input_exhausted() const { return file_.eof(); }

  std::ifstream file_;
  std::vector<char> input_;
};

class GzipByteStream : public CompressedByteStream {
public:
  explicit GzipByteStream(const fs::path &path) : CompressedByteStream(path) {
    // 16 + MAX_WBITS selects gzip framing
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK)
      throw CorruptionError("zlib initialisation failed for " + path.string());
    initialised_ = true;
  }

  ~GzipByteStream() override {
    if (initialised_)
      inflateEnd(&strm_);
  }

  size_t read(char *buffer, size_t size) override {
    if (done_ || size == 0)
      return 0;
    strm_.next_out = reinterpret_cast<Bytef *>(buffer);
    strm_.avail_out = static_cast<uInt>(size);
    while (strm_.avail_out > 0) {
      if (strm_.avail_in == 0) {
        size_t got = refill();
        if (got == 0) {
          if (!in_member_)
            done_ = true;
          else
            throw CorruptionError("Unexpected end of gzip data in " +
                                  this->path());
          break;
        }
        strm_.next_in = reinterpret_cast<Bytef *>(input_.data());
        strm_.avail_in = static_cast<uInt>(got);
      }
      in_member_ = true;
      int ret = inflate(&strm_, Z_NO_FLUSH);
      if (ret == Z_STREAM_END) {
        in_member_ = false;
        // Concatenated members continue after a reset
        if (strm_.avail_in == 0 && input_exhausted()) {
          done_ = true;
          break;
        }
        inflateReset(&strm_);
        continue;
      }
      if (ret != Z_OK && ret != Z_BUF_ERROR) {
        throw CorruptionError("gzip decode error in " + this->path() + ": " +
                              (strm_.msg ? strm_.msg : "unknown"));
      }
    }
    return size - strm_.avail_out;
  }

private:
  z_stream strm_{};
  bool initialised_{false};
  bool in_member_{false};
  bool done_{false};
};

class Bzip2ByteStream : public CompressedByteStream {
public:
  explicit Bzip2ByteStream(const fs::path &path) : CompressedByteStream(path) {
    init();
  }

  ~Bzip2ByteStream() override {
    if (initialised_)
      BZ2_bzDecompressEnd(&strm_);
  }

  size_t read(char *buffer, size_t size) override {
    if (done_ || size == 0)
      return 0;
    strm_.next_out = buffer;
    strm_.avail_out = static_cast<unsigned int>(size);
    while (strm_.avail_out > 0) {
      if (strm_.avail_in == 0) {
        size_t got = refill();
        if (got == 0) {
          if (!in_stream_)
            done_ = true;
          else
            throw CorruptionError("Unexpected end of bzip2 data in " +
                                  this->path());
          break;
        }
        strm_.next_in = input_.data();
        strm_.avail_in = static_cast<unsigned int>(got);
      }
      in_stream_ = true;
      int ret = BZ2_bzDecompress(&strm_);
      if (ret == BZ_STREAM_END) {
        in_stream_ = false;
        if (strm_.avail_in == 0 && input_exhausted()) {
          done_ = true;
          break;
        }
        // Next concatenated stream: keep pending input across re-init
        char *pending = strm_.next_in;
        unsigned int pending_len = strm_.avail_in;
        BZ2_bzDecompressEnd(&strm_);
        initialised_ = false;
        init();
        strm_.next_in = pending;
        strm_.avail_in = pending_len;
        continue;
      }
      if (ret != BZ_OK) {
        throw CorruptionError("bzip2 decode error " + std::to_string(ret) +
                              " in " + this->path());
      }
    }
    return size - strm_.avail_out;
  }

private:
  void init() {
    strm_ = bz_stream{};
    if (BZ2_bzDecompressInit(&strm_, 0, 0) != BZ_OK)
      throw CorruptionError("bzip2 initialisation failed for " + this->path());
    initialised_ = true;
  }

  bz_stream strm_{};
  bool initialised_{false};
  bool in_stream_{false};
  bool done_{false};
};

class XzByteStream : public CompressedByteStream {
public:
  explicit XzByteStream(const fs::path &path) : CompressedByteStream(path) {
    if (lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK)
      throw CorruptionError("liblzma initialisation failed for " +
                            path.string());
  }

  ~XzByteStream() override { lzma_end(&strm_); }

  size_t read(char *buffer, size_t size) override {
    if (done_ || size == 0)
      return 0;
    strm_.next_out = reinterpret_cast<uint8_t *>(buffer);
    strm_.avail_out = size;
    while (strm_.avail_out > 0) {
      if (strm_.avail_in == 0 && !finishing_) {
        size_t got = refill();
        if (got == 0) {
          finishing_ = true;
        } else {
          strm_.next_in = reinterpret_cast<const uint8_t *>(input_.data());
          strm_.avail_in = got;
        }
      }
      lzma_ret ret = lzma_code(&strm_, finishing_ ? LZMA_FINISH : LZMA_RUN);
      if (ret == LZMA_STREAM_END) {
        done_ = true;
        break;
      }
      if (ret != LZMA_OK) {
        throw CorruptionError(
            (ret == LZMA_BUF_ERROR ? "Unexpected end of xz data in "
                                   : "xz decode error in ") +
            this->path());
      }
    }
    return size - strm_.avail_out;
  }

private:
  lzma_stream strm_ = LZMA_STREAM_INIT;
  bool finishing_{false};
  bool done_{false};
};

std::string lower_extension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

} // namespace

Compression compression_from_extension(const fs::path &path) {
  std::string ext = lower_extension(path);
  if (ext == ".gz" || ext == ".tgz")
    return Compression::Gzip;
  if (ext == ".bz2" || ext == ".tbz2" || ext == ".tbz")
    return Compression::Bzip2;
  if (ext == ".xz" || ext == ".txz")
    return Compression::Xz;
  return Compression::None;
}

std::unique_ptr<ByteStream> open_byte_stream(const fs::path &path,
                                             Compression compression) {
  switch (compression) {
  case Compression::Gzip:
    return std::make_unique<GzipByteStream>(path);
  case Compression::Bzip2:
    return std::make_unique<Bzip2ByteStream>(path);
  case Compression::Xz:
    return std::make_unique<XzByteStream>(path);
  case Compression::None:
    break;
  }
  return std::make_unique<PlainByteStream>(path);
}

uint64_t copy_to_file(ByteStream &in, const fs::path &out) {
  std::ofstream file(out, std::ios::binary | std::ios::trunc);
  if (!file)
    throw CorruptionError("Cannot create file: " + out.string());
  std::vector<char> buffer(kInputBufferSize);
  uint64_t total = 0;
  size_t got = 0;
  while ((got = in.read(buffer.data(), buffer.size())) > 0) {
    file.write(buffer.data(), static_cast<std::streamsize>(got));
    if (!file)
      throw CorruptionError("Cannot write file: " + out.string());
    total += got;
  }
  return total;
}

} // namespace source
} // namespace dsvalidator
