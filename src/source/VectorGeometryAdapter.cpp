#include "dataset-validator/source/VectorGeometryAdapter.hpp"
#include "dataset-validator/Errors.hpp"
#include "dataset-validator/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace dsvalidator {
namespace source {

namespace {

constexpr int32_t kShapeFileCode = 9994;
constexpr int32_t kShapeVersion = 1000;
constexpr size_t kShapeHeaderSize = 100;
constexpr char kGeometryColumn[] = "geometry";

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

int32_t be32(const uint8_t *p) {
  return static_cast<int32_t>((static_cast<uint32_t>(p[0]) << 24) |
                              (static_cast<uint32_t>(p[1]) << 16) |
                              (static_cast<uint32_t>(p[2]) << 8) |
                              static_cast<uint32_t>(p[3]));
}

int32_t le32(const uint8_t *p) {
  return static_cast<int32_t>(static_cast<uint32_t>(p[0]) |
                              (static_cast<uint32_t>(p[1]) << 8) |
                              (static_cast<uint32_t>(p[2]) << 16) |
                              (static_cast<uint32_t>(p[3]) << 24));
}

uint16_t le16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(' ');
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(' ');
  return s.substr(b, e - b + 1);
}

void read_exact(std::ifstream &in, void *out, size_t n, const std::string &what,
                std::optional<uint64_t> row = std::nullopt) {
  in.read(static_cast<char *>(out), static_cast<std::streamsize>(n));
  if (!in || static_cast<size_t>(in.gcount()) != n)
    throw CorruptionError("Truncated " + what, row);
}

/// Main header shared by .shp and .shx. Returns the shape type.
int32_t read_main_header(std::ifstream &in, const std::string &what) {
  uint8_t header[kShapeHeaderSize];
  read_exact(in, header, sizeof(header), what + " header");
  if (be32(header) != kShapeFileCode)
    throw CorruptionError("Bad file code in " + what + " header");
  if (le32(header + 28) != kShapeVersion)
    throw CorruptionError("Unsupported " + what + " version " +
                          std::to_string(le32(header + 28)));
  return le32(header + 32);
}

struct DbfField {
  std::string name;
  char type{'C'};
  size_t length{0};
  size_t decimals{0};
  size_t offset{0}; // within the record, after the deletion flag
};

CellValue parse_dbf_value(const DbfField &field, const std::string &raw) {
  std::string text = trim(raw);
  switch (field.type) {
  case 'N':
  case 'F': {
    if (text.empty() ||
        text.find_first_not_of('*') == std::string::npos)
      return std::monostate{};
    if (field.type == 'N' && field.decimals == 0) {
      int64_t v = 0;
      const char *begin = text.data();
      if (*begin == '+')
        ++begin;
      auto res = std::from_chars(begin, text.data() + text.size(), v);
      if (res.ec == std::errc() && res.ptr == text.data() + text.size())
        return v;
    }
    char *end = nullptr;
    double d = std::strtod(text.c_str(), &end);
    if (end == text.c_str() + text.size() && std::isfinite(d))
      return d;
    return text;
  }
  case 'L':
    if (text.empty() || text == "?")
      return std::monostate{};
    switch (text[0]) {
    case 'T':
    case 't':
    case 'Y':
    case 'y':
      return true;
    case 'F':
    case 'f':
    case 'N':
    case 'n':
      return false;
    default:
      return text;
    }
  case 'D':
    if (text.empty() || text.find_first_not_of('0') == std::string::npos)
      return std::monostate{};
    if (text.size() == 8 &&
        std::all_of(text.begin(), text.end(),
                    [](unsigned char c) { return std::isdigit(c); }))
      return text.substr(0, 4) + "-" + text.substr(4, 2) + "-" +
             text.substr(6, 2);
    return text;
  default:
    if (text.empty())
      return std::monostate{};
    return text;
  }
}

class ShapefileHandle;

class ShapefileChunkStream : public ChunkStream {
public:
  ShapefileChunkStream(ShapefileHandle *handle, size_t chunk_size,
                       std::vector<std::string> columns,
                       std::vector<int> sources)
      : ChunkStream(std::move(columns)), handle_(handle),
        chunk_size_(chunk_size), sources_(std::move(sources)) {}

protected:
  bool fill(RowChunk &chunk) override;

private:
  ShapefileHandle *handle_;
  size_t chunk_size_;
  std::vector<int> sources_; // dbf field index, -1 for the geometry
  uint64_t record_{0};       // next physical record
};

class ShapefileHandle : public DatasetHandle {
public:
  explicit ShapefileHandle(const fs::path &shp) : shp_path_(shp) {
    auto shx = find_sidecar(shp, ".shx");
    auto dbf = find_sidecar(shp, ".dbf");
    if (!shx)
      throw CorruptionError("Missing .shx index next to " + shp.string());
    if (!dbf)
      throw CorruptionError("Missing .dbf attributes next to " + shp.string());

    shp_.open(shp, std::ios::binary);
    shx_.open(*shx, std::ios::binary);
    dbf_.open(*dbf, std::ios::binary);
    if (!shp_ || !shx_ || !dbf_)
      throw CorruptionError("Cannot open shapefile components of " +
                            shp.string());

    shape_type_ = read_main_header(shp_, ".shp");
    if (read_main_header(shx_, ".shx") != shape_type_)
      throw CorruptionError(".shx shape type does not match .shp");

    std::error_code ec;
    uint64_t shx_size = fs::file_size(*shx, ec);
    if (ec || shx_size < kShapeHeaderSize ||
        (shx_size - kShapeHeaderSize) % 8 != 0)
      throw CorruptionError("Malformed .shx index size");
    shx_records_ = (shx_size - kShapeHeaderSize) / 8;

    read_dbf_header();
    if (shx_records_ != dbf_records_)
      throw CorruptionError("Record count mismatch: .shx has " +
                            std::to_string(shx_records_) + ", .dbf has " +
                            std::to_string(dbf_records_));

    if (auto cpg = find_sidecar(shp, ".cpg")) {
      std::ifstream in(*cpg);
      std::string encoding;
      std::getline(in, encoding);
      encoding_ = trim(encoding);
    }
    open_ = true;

    LOG_DEBUG("SHP", "OPEN", "{}: {} records of {}, {} attributes",
              shp.string(), dbf_records_, shape_type_name(shape_type_),
              fields_.size());
  }

  ~ShapefileHandle() override { close(); }

  PhysicalSchema schema_probe() override {
    PhysicalSchema schema;
    for (const auto &f : fields_) {
      std::string type = std::string(1, f.type) + "(" +
                         std::to_string(f.length);
      if (f.decimals > 0)
        type += "," + std::to_string(f.decimals);
      schema.push_back({f.name, type + ")"});
    }
    schema.push_back({kGeometryColumn, shape_type_name(shape_type_)});
    return schema;
  }

  void close() override {
    open_ = false;
    shp_.close();
    shx_.close();
    dbf_.close();
  }
  bool is_open() const override { return open_; }

  std::map<std::string, std::string> diagnostics() const override {
    std::map<std::string, std::string> out{
        {"shape_type", shape_type_name(shape_type_)},
        {"records", std::to_string(dbf_records_)}};
    if (!encoding_.empty())
      out["encoding"] = encoding_;
    return out;
  }

  uint64_t record_count() const { return dbf_records_; }
  const std::vector<DbfField> &fields() const { return fields_; }

  /// Read physical record i. Returns false when the dbf marks it deleted.
  bool read_record(uint64_t i, uint64_t row, bool want_shape,
                   std::string &attributes, CellValue &shape) {
    attributes.resize(dbf_record_length_);
    dbf_.seekg(static_cast<std::streamoff>(dbf_header_length_ +
                                           i * dbf_record_length_));
    read_exact(dbf_, &attributes[0], dbf_record_length_,
               ".dbf record " + std::to_string(i + 1), row);
    if (attributes[0] == '*')
      return false;
    if (attributes[0] != ' ')
      throw CorruptionError("Invalid deletion flag in .dbf record " +
                                std::to_string(i + 1),
                            row);
    if (want_shape)
      shape = read_shape(i, row);
    return true;
  }

protected:
  std::unique_ptr<ChunkStream>
  make_stream(size_t chunk_size,
              const std::vector<std::string> &columns) override {
    std::vector<int> sources;
    for (const auto &name : columns) {
      if (name == kGeometryColumn) {
        sources.push_back(-1);
        continue;
      }
      auto it = std::find_if(fields_.begin(), fields_.end(),
                             [&](const DbfField &f) { return f.name == name; });
      if (it == fields_.end())
        throw std::invalid_argument("Unknown column: " + name);
      sources.push_back(static_cast<int>(it - fields_.begin()));
    }
    return std::make_unique<ShapefileChunkStream>(this, chunk_size, columns,
                                                  std::move(sources));
  }

private:
  void read_dbf_header() {
    uint8_t header[32];
    read_exact(dbf_, header, sizeof(header), ".dbf header");
    dbf_records_ = static_cast<uint32_t>(le32(header + 4));
    dbf_header_length_ = le16(header + 8);
    dbf_record_length_ = le16(header + 10);
    if (dbf_header_length_ < 33 || dbf_record_length_ < 1)
      throw CorruptionError("Malformed .dbf header");

    size_t offset = 1;
    while (true) {
      uint8_t first = 0;
      read_exact(dbf_, &first, 1, ".dbf field descriptors");
      if (first == 0x0D)
        break;
      uint8_t desc[32];
      desc[0] = first;
      read_exact(dbf_, desc + 1, 31, ".dbf field descriptors");
      DbfField field;
      const char *name = reinterpret_cast<const char *>(desc);
      field.name = std::string(name, strnlen(name, 11));
      field.type = static_cast<char>(std::toupper(desc[11]));
      field.length = desc[16];
      field.decimals = desc[17];
      field.offset = offset;
      offset += field.length;
      fields_.push_back(std::move(field));
    }
    if (offset > dbf_record_length_)
      throw CorruptionError(".dbf fields exceed the record length");
  }

  CellValue read_shape(uint64_t i, uint64_t row) {
    uint8_t entry[8];
    shx_.seekg(static_cast<std::streamoff>(kShapeHeaderSize + i * 8));
    read_exact(shx_, entry, sizeof(entry), ".shx entry", row);
    uint64_t offset = static_cast<uint64_t>(be32(entry)) * 2;
    uint64_t length = static_cast<uint64_t>(be32(entry + 4)) * 2;
    if (offset < kShapeHeaderSize || length < 4)
      throw CorruptionError("Invalid .shx entry for record " +
                                std::to_string(i + 1),
                            row);

    uint8_t header[12];
    shp_.clear();
    shp_.seekg(static_cast<std::streamoff>(offset));
    read_exact(shp_, header, sizeof(header),
               ".shp record " + std::to_string(i + 1), row);
    if (static_cast<uint64_t>(be32(header + 4)) * 2 != length)
      throw CorruptionError(".shp record length disagrees with .shx", row);
    // Skip the rest of the record content but make sure it exists
    shp_.seekg(static_cast<std::streamoff>(length - 4), std::ios::cur);
    if (length > 4) {
      shp_.seekg(-1, std::ios::cur);
      char last = 0;
      read_exact(shp_, &last, 1, ".shp record " + std::to_string(i + 1), row);
    }

    int32_t type = le32(header + 8);
    if (type == 0)
      return std::monostate{};
    if (type != shape_type_)
      throw CorruptionError("Shape type " + shape_type_name(type) +
                                " in a " + shape_type_name(shape_type_) +
                                " file",
                            row);
    return Geometry{shape_type_name(type)};
  }

  fs::path shp_path_;
  std::ifstream shp_;
  std::ifstream shx_;
  std::ifstream dbf_;
  int32_t shape_type_{0};
  uint64_t shx_records_{0};
  uint64_t dbf_records_{0};
  size_t dbf_header_length_{0};
  size_t dbf_record_length_{0};
  std::vector<DbfField> fields_;
  std::string encoding_;
  bool open_{false};
};

bool ShapefileChunkStream::fill(RowChunk &chunk) {
  if (!handle_->is_open())
    throw CorruptionError("Dataset handle closed during iteration");

  const bool want_shape =
      std::find(sources_.begin(), sources_.end(), -1) != sources_.end();
  const auto &fields = handle_->fields();
  std::string attributes;
  CellValue shape;
  uint64_t row = next_row();

  while (chunk.row_count < chunk_size_ && record_ < handle_->record_count()) {
    uint64_t i = record_++;
    if (!handle_->read_record(i, row, want_shape, attributes, shape))
      continue;
    for (size_t c = 0; c < sources_.size(); ++c) {
      if (sources_[c] < 0) {
        chunk.columns[c].push_back(shape);
        continue;
      }
      const DbfField &f = fields[static_cast<size_t>(sources_[c])];
      chunk.columns[c].push_back(
          parse_dbf_value(f, attributes.substr(f.offset, f.length)));
    }
    ++chunk.row_count;
    ++row;
  }
  return chunk.row_count > 0;
}

} // namespace

std::optional<fs::path> find_sidecar(const fs::path &shp,
                                     const std::string &extension) {
  fs::path exact = shp;
  exact.replace_extension(extension);
  std::error_code ec;
  if (fs::is_regular_file(exact, ec))
    return exact;

  const std::string stem = lower(shp.stem().string());
  const std::string ext = lower(extension);
  fs::path dir = shp.parent_path().empty() ? fs::path(".") : shp.parent_path();
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file())
      continue;
    const fs::path &p = entry.path();
    if (lower(p.stem().string()) == stem && lower(p.extension().string()) == ext)
      return p;
  }
  return std::nullopt;
}

std::string shape_type_name(int32_t code) {
  switch (code) {
  case 0:
    return "Null";
  case 1:
  case 11:
  case 21:
    return "Point";
  case 3:
  case 13:
  case 23:
    return "LineString";
  case 5:
  case 15:
  case 25:
    return "Polygon";
  case 8:
  case 18:
  case 28:
    return "MultiPoint";
  case 31:
    return "MultiPatch";
  default:
    return "Unknown(" + std::to_string(code) + ")";
  }
}

std::unique_ptr<DatasetHandle>
VectorGeometryAdapter::open(const std::string &path,
                            const OpenOptions & /*options*/) {
  if (!fs::is_regular_file(path))
    throw CorruptionError("File not found: " + path);
  return std::make_unique<ShapefileHandle>(fs::path(path));
}

} // namespace source
} // namespace dsvalidator
