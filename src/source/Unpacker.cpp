#include "dataset-validator/source/Unpacker.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"
#include "dataset-validator/source/ByteStream.hpp"
#include "dataset-validator/source/FormatDetector.hpp"
#include "dataset-validator/source/VectorGeometryAdapter.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <random>
#include <zlib.h>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

namespace {

constexpr size_t kBlock = 512;
constexpr size_t kCopyBuffer = 1 << 16;
constexpr uint32_t kZipLocalHeader = 0x04034b50;
constexpr uint32_t kZipCentralHeader = 0x02014b50;
constexpr uint32_t kZipEndOfDirectory = 0x06054b50;

enum class ArchiveKind { None, Zip, Tar };

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string compression_name(Compression c) {
  switch (c) {
  case Compression::Gzip:
    return "gzip";
  case Compression::Bzip2:
    return "bzip2";
  case Compression::Xz:
    return "xz";
  case Compression::None:
    break;
  }
  return "none";
}

ArchiveKind archive_kind(const fs::path &path) {
  const std::string name = lower(path.filename().string());
  auto ends_with = [&](const std::string &suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) ==
               0;
  };
  if (ends_with(".zip"))
    return ArchiveKind::Zip;
  for (const char *suffix : {".tar", ".tar.gz", ".tgz", ".tar.bz2", ".tbz2",
                             ".tbz", ".tar.xz", ".txz"}) {
    if (ends_with(suffix))
      return ArchiveKind::Tar;
  }
  std::ifstream in(path, std::ios::binary);
  char magic[4] = {};
  in.read(magic, 4);
  if (in && std::memcmp(magic, "PK\x03\x04", 4) == 0)
    return ArchiveKind::Zip;
  return ArchiveKind::None;
}

fs::path make_temp_dir() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dist;
  std::error_code ec;
  for (int attempt = 0; attempt < 8; ++attempt) {
    fs::path dir = fs::temp_directory_path(ec) /
                   ("dsvalidator-" + std::to_string(dist(gen)));
    if (ec)
      break;
    if (fs::create_directory(dir, ec))
      return dir;
  }
  throw UnpackError("Cannot create a temporary directory" +
                    (ec ? ": " + ec.message() : std::string()));
}

uint32_t le32(const uint8_t *p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t le16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

/// Writes archive members under root, remembering what was written
class Extractor {
public:
  explicit Extractor(fs::path root) : root_(std::move(root)) {}

  /// Returns nullptr for members that are skipped (resource forks)
  std::unique_ptr<std::ofstream> create(const std::string &name) {
    if (!Unpacker::is_safe_member_path(name))
      throw UnpackError("Unsafe path in archive: " + name);
    fs::path rel = fs::path(name).lexically_normal();
    const std::string first = rel.begin() != rel.end() ? rel.begin()->string()
                                                       : std::string();
    if (first == "__MACOSX" || rel.filename().string().rfind("._", 0) == 0)
      return nullptr;

    fs::path target = root_ / rel;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
      throw UnpackError("Cannot create " + target.parent_path().string() +
                        ": " + ec.message());
    auto out = std::make_unique<std::ofstream>(
        target, std::ios::binary | std::ios::trunc);
    if (!*out)
      throw UnpackError("Cannot create " + target.string());
    files_.push_back(target);
    return out;
  }

  const std::vector<fs::path> &files() const { return files_; }

private:
  fs::path root_;
  std::vector<fs::path> files_;
};

void write_or_throw(std::ofstream &out, const char *data, size_t n) {
  out.write(data, static_cast<std::streamsize>(n));
  if (!out)
    throw UnpackError("Write failed while extracting archive");
}

// ---------------------------------------------------------------------------
// zip

void inflate_member(std::ifstream &in, uint64_t compressed, std::ofstream *out,
                    uint32_t &crc) {
  z_stream strm{};
  if (inflateInit2(&strm, -MAX_WBITS) != Z_OK)
    throw UnpackError("inflateInit2 failed");

  std::vector<char> input(kCopyBuffer);
  std::vector<char> output(kCopyBuffer);
  uint64_t left = compressed;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    if (strm.avail_in == 0) {
      if (left == 0) {
        inflateEnd(&strm);
        throw UnpackError("Truncated deflate stream in zip member");
      }
      size_t want = static_cast<size_t>(std::min<uint64_t>(left, input.size()));
      in.read(input.data(), static_cast<std::streamsize>(want));
      if (static_cast<size_t>(in.gcount()) != want) {
        inflateEnd(&strm);
        throw UnpackError("Unexpected end of zip file");
      }
      left -= want;
      strm.next_in = reinterpret_cast<Bytef *>(input.data());
      strm.avail_in = static_cast<uInt>(want);
    }
    strm.next_out = reinterpret_cast<Bytef *>(output.data());
    strm.avail_out = static_cast<uInt>(output.size());
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&strm);
      throw UnpackError("Corrupt deflate data in zip member");
    }
    size_t produced = output.size() - strm.avail_out;
    crc = static_cast<uint32_t>(
        crc32(crc, reinterpret_cast<const Bytef *>(output.data()),
              static_cast<uInt>(produced)));
    if (out)
      write_or_throw(*out, output.data(), produced);
  }
  inflateEnd(&strm);
}

void extract_zip(const fs::path &archive, Extractor &extractor) {
  std::ifstream in(archive, std::ios::binary);
  if (!in)
    throw UnpackError("Cannot open " + archive.string());
  std::error_code ec;
  uint64_t size = fs::file_size(archive, ec);
  if (ec || size < 22)
    throw UnpackError(archive.string() + " is too small to be a zip archive");

  // End of central directory record, possibly followed by a comment
  size_t tail_len = static_cast<size_t>(std::min<uint64_t>(size, 65557));
  std::vector<uint8_t> tail(tail_len);
  in.seekg(static_cast<std::streamoff>(size - tail_len));
  in.read(reinterpret_cast<char *>(tail.data()),
          static_cast<std::streamsize>(tail_len));
  if (!in)
    throw UnpackError("Cannot read zip directory of " + archive.string());
  size_t eocd = tail_len;
  for (size_t i = tail_len - 22 + 1; i-- > 0;) {
    if (le32(tail.data() + i) == kZipEndOfDirectory) {
      eocd = i;
      break;
    }
  }
  if (eocd == tail_len)
    throw UnpackError("Missing zip end of central directory record");

  const uint16_t entries = le16(tail.data() + eocd + 10);
  const uint32_t dir_size = le32(tail.data() + eocd + 12);
  const uint32_t dir_offset = le32(tail.data() + eocd + 16);
  if (dir_offset == 0xFFFFFFFFu || entries == 0xFFFF)
    throw UnpackError("ZIP64 archives are not supported");
  if (static_cast<uint64_t>(dir_offset) + dir_size > size)
    throw UnpackError("Zip central directory lies outside the file");

  std::vector<uint8_t> dir(dir_size);
  in.seekg(dir_offset);
  in.read(reinterpret_cast<char *>(dir.data()),
          static_cast<std::streamsize>(dir_size));
  if (!in)
    throw UnpackError("Cannot read zip central directory");

  size_t pos = 0;
  for (uint16_t e = 0; e < entries; ++e) {
    if (pos + 46 > dir.size() || le32(dir.data() + pos) != kZipCentralHeader)
      throw UnpackError("Corrupt zip central directory");
    const uint8_t *h = dir.data() + pos;
    const uint16_t flags = le16(h + 8);
    const uint16_t method = le16(h + 10);
    const uint32_t crc_expected = le32(h + 16);
    const uint32_t compressed = le32(h + 20);
    const uint32_t uncompressed = le32(h + 24);
    const uint16_t name_len = le16(h + 28);
    const uint16_t extra_len = le16(h + 30);
    const uint16_t comment_len = le16(h + 32);
    const uint32_t local_offset = le32(h + 42);
    if (pos + 46 + name_len > dir.size())
      throw UnpackError("Corrupt zip central directory");
    std::string name(reinterpret_cast<const char *>(h + 46), name_len);
    pos += 46 + name_len + extra_len + comment_len;

    if (!name.empty() && name.back() == '/')
      continue;
    if (flags & 0x1)
      throw UnpackError("Encrypted zip member: " + name);
    if (method != 0 && method != 8)
      throw UnpackError("Unsupported compression method " +
                        std::to_string(method) + " for zip member " + name);

    uint8_t local[30];
    in.seekg(local_offset);
    in.read(reinterpret_cast<char *>(local), sizeof(local));
    if (!in || le32(local) != kZipLocalHeader)
      throw UnpackError("Corrupt local header for zip member " + name);
    in.seekg(le16(local + 26) + le16(local + 28), std::ios::cur);

    auto out = extractor.create(name);
    uint32_t crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    if (method == 0) {
      if (compressed != uncompressed)
        throw UnpackError("Stored zip member size mismatch: " + name);
      std::vector<char> buffer(kCopyBuffer);
      uint64_t left = compressed;
      while (left > 0) {
        size_t want =
            static_cast<size_t>(std::min<uint64_t>(left, buffer.size()));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in.gcount()) != want)
          throw UnpackError("Unexpected end of zip file in member " + name);
        crc = static_cast<uint32_t>(
            crc32(crc, reinterpret_cast<const Bytef *>(buffer.data()),
                  static_cast<uInt>(want)));
        if (out)
          write_or_throw(*out, buffer.data(), want);
        left -= want;
      }
    } else {
      inflate_member(in, compressed, out.get(), crc);
    }
    if (crc != crc_expected)
      throw UnpackError("CRC mismatch for zip member " + name);
  }
}

// ---------------------------------------------------------------------------
// tar

void read_full(ByteStream &in, char *buffer, size_t n, const char *what) {
  size_t got = 0;
  while (got < n) {
    size_t r = in.read(buffer + got, n - got);
    if (r == 0)
      throw UnpackError(std::string("Unexpected end of tar archive in ") +
                        what);
    got += r;
  }
}

uint64_t parse_tar_size(const char *field, size_t len) {
  // GNU base-256 for sizes beyond the octal range
  if (static_cast<unsigned char>(field[0]) & 0x80) {
    uint64_t v = static_cast<unsigned char>(field[0]) & 0x7F;
    for (size_t i = 1; i < len; ++i)
      v = (v << 8) | static_cast<unsigned char>(field[i]);
    return v;
  }
  uint64_t v = 0;
  for (size_t i = 0; i < len; ++i) {
    char c = field[i];
    if (c == ' ' || c == '\0') {
      if (v != 0)
        break;
      continue;
    }
    if (c < '0' || c > '7')
      throw UnpackError("Invalid size field in tar header");
    v = (v << 3) | static_cast<uint64_t>(c - '0');
  }
  return v;
}

std::string read_member_text(ByteStream &in, uint64_t size) {
  if (size > (1u << 20))
    throw UnpackError("Oversized tar extension header");
  uint64_t padded = (size + kBlock - 1) / kBlock * kBlock;
  std::string data(static_cast<size_t>(padded), '\0');
  if (padded > 0)
    read_full(in, &data[0], static_cast<size_t>(padded), "extension header");
  data.resize(static_cast<size_t>(size));
  return data;
}

/// "path" value of a pax extended header, empty if absent
std::string pax_path(const std::string &records) {
  size_t pos = 0;
  std::string path;
  while (pos < records.size()) {
    size_t space = records.find(' ', pos);
    if (space == std::string::npos)
      break;
    size_t len = std::strtoul(records.c_str() + pos, nullptr, 10);
    if (len == 0 || pos + len > records.size())
      break;
    std::string record = records.substr(space + 1, pos + len - space - 2);
    size_t eq = record.find('=');
    if (eq != std::string::npos && record.substr(0, eq) == "path")
      path = record.substr(eq + 1);
    pos += len;
  }
  return path;
}

void skip_bytes(ByteStream &in, uint64_t n) {
  std::vector<char> buffer(kCopyBuffer);
  while (n > 0) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(n, buffer.size()));
    read_full(in, buffer.data(), want, "member data");
    n -= want;
  }
}

void extract_tar(const fs::path &archive, Extractor &extractor) {
  auto in = open_byte_stream(archive, compression_from_extension(archive));
  std::vector<char> buffer(kCopyBuffer);
  std::string long_name;
  char header[kBlock];

  while (true) {
    size_t got = 0;
    while (got < kBlock) {
      size_t r = in->read(header + got, kBlock - got);
      if (r == 0)
        break;
      got += r;
    }
    if (got == 0)
      break; // archive without end-of-archive blocks
    if (got < kBlock)
      throw UnpackError("Truncated tar header");
    if (std::all_of(header, header + kBlock, [](char c) { return c == 0; }))
      break;

    const uint64_t size = parse_tar_size(header + 124, 12);
    const char type = header[156];
    std::string name(header, strnlen(header, 100));
    if (std::memcmp(header + 257, "ustar", 5) == 0 && header[345] != '\0') {
      std::string prefix(header + 345, strnlen(header + 345, 155));
      name = prefix + "/" + name;
    }

    if (type == 'L') {
      long_name = read_member_text(*in, size);
      while (!long_name.empty() && long_name.back() == '\0')
        long_name.pop_back();
      continue;
    }
    if (type == 'x') {
      std::string path = pax_path(read_member_text(*in, size));
      if (!path.empty())
        long_name = path;
      continue;
    }
    if (!long_name.empty()) {
      name = long_name;
      long_name.clear();
    }

    const uint64_t padded = (size + kBlock - 1) / kBlock * kBlock;
    if (type != '0' && type != '\0') {
      // Directories, links, devices, global headers
      skip_bytes(*in, padded);
      continue;
    }

    auto out = extractor.create(name);
    uint64_t left = size;
    while (left > 0) {
      size_t want = static_cast<size_t>(std::min<uint64_t>(left, buffer.size()));
      read_full(*in, buffer.data(), want, "member data");
      if (out)
        write_or_throw(*out, buffer.data(), want);
      left -= want;
    }
    skip_bytes(*in, padded - size);
  }
}

/// One dataset among the extracted files
fs::path select_dataset(const std::vector<fs::path> &files,
                        const fs::path &archive) {
  std::vector<fs::path> shapefiles;
  for (const auto &f : files) {
    if (lower(f.extension().string()) == ".shp")
      shapefiles.push_back(f);
  }

  if (shapefiles.size() > 1)
    throw UnpackError(archive.string() + " contains " +
                      std::to_string(shapefiles.size()) + " shapefiles");
  if (shapefiles.size() == 1) {
    const fs::path &shp = shapefiles.front();
    for (const char *ext : {".shx", ".dbf"}) {
      if (!find_sidecar(shp, ext))
        throw UnpackError("Shapefile " + shp.filename().string() +
                          " in " + archive.string() + " has no " + ext);
    }
    const std::string stem = lower(shp.stem().string());
    for (const auto &f : files) {
      if (lower(f.stem().string()) != stem ||
          f.parent_path() != shp.parent_path())
        throw UnpackError(archive.string() +
                          " contains files besides the shapefile: " +
                          f.filename().string());
    }
    return shp;
  }

  if (files.empty())
    throw UnpackError(archive.string() + " contains no dataset");
  if (files.size() > 1)
    throw UnpackError(archive.string() + " contains " +
                      std::to_string(files.size()) +
                      " files; expected exactly one dataset");
  return files.front();
}

} // namespace

UnpackedInput::UnpackedInput(fs::path dataset, std::string container,
                             fs::path temp_dir)
    : dataset_(std::move(dataset)), container_(std::move(container)),
      temp_dir_(std::move(temp_dir)) {}

UnpackedInput::~UnpackedInput() { cleanup(); }

UnpackedInput::UnpackedInput(UnpackedInput &&other) noexcept
    : dataset_(std::move(other.dataset_)),
      container_(std::move(other.container_)),
      temp_dir_(std::move(other.temp_dir_)) {
  other.temp_dir_.clear();
}

UnpackedInput &UnpackedInput::operator=(UnpackedInput &&other) noexcept {
  if (this != &other) {
    cleanup();
    dataset_ = std::move(other.dataset_);
    container_ = std::move(other.container_);
    temp_dir_ = std::move(other.temp_dir_);
    other.temp_dir_.clear();
  }
  return *this;
}

void UnpackedInput::cleanup() noexcept {
  if (temp_dir_.empty())
    return;
  std::error_code ec;
  fs::remove_all(temp_dir_, ec);
  if (ec)
    LOG_WARN("UNPACK", "CLEANUP", "Could not remove {}: {}",
             temp_dir_.string(), ec.message());
  temp_dir_.clear();
}

bool Unpacker::is_safe_member_path(const std::string &name) {
  if (name.empty() || name.front() == '/' || name.front() == '\\')
    return false;
  if (name.size() > 1 && name[1] == ':')
    return false;
  for (const auto &part : fs::path(name)) {
    if (part == "..")
      return false;
  }
  return true;
}

UnpackedInput Unpacker::prepare(const fs::path &input) {
  std::error_code ec;
  if (!fs::is_regular_file(input, ec))
    throw UnpackError("File not found: " + input.string());

  const ArchiveKind kind = archive_kind(input);
  const Compression compression = compression_from_extension(input);

  if (kind == ArchiveKind::None) {
    if (compression == Compression::None)
      return UnpackedInput(input, "none");

    fs::path inner = input.filename().stem();
    auto inner_format = format_from_extension(inner);
    if (inner_format && *inner_format == SourceFormat::DelimitedText)
      return UnpackedInput(input, compression_name(compression));

    fs::path dir = make_temp_dir();
    UnpackedInput unpacked(dir / inner, compression_name(compression), dir);
    try {
      auto stream = open_byte_stream(input, compression);
      uint64_t bytes = copy_to_file(*stream, unpacked.dataset_path());
      LOG_DEBUG("UNPACK", "DECOMPRESS", "{} -> {} ({} bytes)", input.string(),
                unpacked.dataset_path().string(), bytes);
    } catch (const UnpackError &) {
      throw;
    } catch (const CorruptionError &e) {
      throw UnpackError(e.what());
    }
    return unpacked;
  }

  fs::path dir = make_temp_dir();
  std::string container = kind == ArchiveKind::Zip ? "zip" : "tar";
  if (kind == ArchiveKind::Tar && compression != Compression::None)
    container += "+" + compression_name(compression);
  // Owns the directory from here on so failures still clean up
  UnpackedInput holder(fs::path(), container, dir);

  Extractor extractor(dir);
  try {
    if (kind == ArchiveKind::Zip)
      extract_zip(input, extractor);
    else
      extract_tar(input, extractor);
  } catch (const UnpackError &) {
    throw;
  } catch (const CorruptionError &e) {
    throw UnpackError(e.what());
  }

  fs::path dataset = select_dataset(extractor.files(), input);
  LOG_DEBUG("UNPACK", "EXTRACT", "{}: {} file(s), dataset {}", input.string(),
            extractor.files().size(), dataset.string());
  holder.dataset_ = dataset;
  return holder;
}

} // namespace source
} // namespace dsvalidator
