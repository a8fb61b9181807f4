#include "dataset-validator/source/FormatDetector.hpp"
#include "dataset-validator/source/ByteStream.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

std::optional<SourceFormat> format_from_extension(const fs::path &path) {
  fs::path name = path.filename();
  if (compression_from_extension(name) != Compression::None)
    name = name.stem();
  std::string ext = name.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (ext == ".csv" || ext == ".tsv" || ext == ".txt")
    return SourceFormat::DelimitedText;
  if (ext == ".parquet" || ext == ".geoparquet" || ext == ".pq")
    return SourceFormat::ColumnarArchive;
  if (ext == ".gpkg" || ext == ".sqlite" || ext == ".db")
    return SourceFormat::EmbeddedRelational;
  if (ext == ".shp")
    return SourceFormat::VectorGeometry;
  return std::nullopt;
}

SourceFormat detect_format(const fs::path &path) {
  if (auto format = format_from_extension(path))
    return *format;

  std::array<char, 16> magic{};
  std::ifstream file(path, std::ios::binary);
  if (file) {
    file.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    auto got = static_cast<size_t>(file.gcount());
    if (got >= 4 && std::memcmp(magic.data(), "PAR1", 4) == 0)
      return SourceFormat::ColumnarArchive;
    if (got == 16 && std::memcmp(magic.data(), "SQLite format 3", 16) == 0)
      return SourceFormat::EmbeddedRelational;
    // Shapefile file code 9994, big-endian
    if (got >= 4 && magic[0] == 0 && magic[1] == 0 &&
        static_cast<unsigned char>(magic[2]) == 0x27 &&
        static_cast<unsigned char>(magic[3]) == 0x0a)
      return SourceFormat::VectorGeometry;
  }
  return SourceFormat::DelimitedText;
}

} // namespace source
} // namespace dsvalidator
