#include "dataset-validator/ValueCoercion.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <limits>

namespace dsvalidator {

namespace {

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool all_digits(const std::string &s, size_t pos, size_t len) {
  if (pos + len > s.size())
    return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

int digits_value(const std::string &s, size_t pos, size_t len) {
  int v = 0;
  for (size_t i = pos; i < pos + len; ++i)
    v = v * 10 + (s[i] - '0');
  return v;
}

bool is_leap(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year))
    return 29;
  return days[month - 1];
}

std::optional<int64_t> parse_int64(const std::string &text) {
  std::string s = trim(text);
  if (!s.empty() && s[0] == '+')
    s.erase(0, 1);
  if (s.empty())
    return std::nullopt;
  int64_t value = 0;
  const char *first = s.data();
  const char *last = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last)
    return std::nullopt;
  return value;
}

std::optional<double> parse_float64(const std::string &text) {
  std::string s = trim(text);
  if (s.empty())
    return std::nullopt;
  char *end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(value))
    return std::nullopt;
  return value;
}

std::optional<bool> parse_bool(const std::string &text) {
  std::string s = to_lower(trim(text));
  if (s == "true" || s == "t" || s == "yes" || s == "y" || s == "1")
    return true;
  if (s == "false" || s == "f" || s == "no" || s == "n" || s == "0")
    return false;
  return std::nullopt;
}

bool hex_to_bytes(const std::string &hex, Blob &out) {
  if (hex.size() % 2 != 0)
    return false;
  out.bytes.clear();
  out.bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte = 0;
    auto [ptr, ec] =
        std::from_chars(hex.data() + i, hex.data() + i + 2, byte, 16);
    if (ec != std::errc() || ptr != hex.data() + i + 2)
      return false;
    out.bytes.push_back(static_cast<uint8_t>(byte));
  }
  return true;
}

} // namespace

bool is_iso_date(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    return false;
  if (!all_digits(text, 0, 4) || !all_digits(text, 5, 2) ||
      !all_digits(text, 8, 2))
    return false;
  int year = digits_value(text, 0, 4);
  int month = digits_value(text, 5, 2);
  int day = digits_value(text, 8, 2);
  if (month < 1 || month > 12)
    return false;
  return day >= 1 && day <= days_in_month(year, month);
}

bool is_iso_timestamp(const std::string &text) {
  if (text.size() < 10 || !is_iso_date(text.substr(0, 10)))
    return false;
  if (text.size() == 10)
    return true;
  size_t pos = 10;
  if (text[pos] != 'T' && text[pos] != ' ')
    return false;
  ++pos;
  // HH:MM
  if (!all_digits(text, pos, 2) || pos + 5 > text.size() ||
      text[pos + 2] != ':' || !all_digits(text, pos + 3, 2))
    return false;
  if (digits_value(text, pos, 2) > 23 || digits_value(text, pos + 3, 2) > 59)
    return false;
  pos += 5;
  // :SS
  if (pos < text.size() && text[pos] == ':') {
    if (!all_digits(text, pos + 1, 2) || digits_value(text, pos + 1, 2) > 60)
      return false;
    pos += 3;
    // .fraction
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
      size_t digits = 0;
      ++pos;
      while (pos < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
        ++digits;
      }
      if (digits == 0 || digits > 9)
        return false;
    }
  }
  if (pos == text.size())
    return true;
  // Zone designator
  if (text[pos] == 'Z')
    return pos + 1 == text.size();
  if (text[pos] != '+' && text[pos] != '-')
    return false;
  std::string zone = text.substr(pos + 1);
  if (zone.size() == 2)
    return all_digits(zone, 0, 2) && digits_value(zone, 0, 2) <= 23;
  if (zone.size() == 4)
    return all_digits(zone, 0, 4) && digits_value(zone, 0, 2) <= 23 &&
           digits_value(zone, 2, 2) <= 59;
  if (zone.size() == 5 && zone[2] == ':')
    return all_digits(zone, 0, 2) && all_digits(zone, 3, 2) &&
           digits_value(zone, 0, 2) <= 23 && digits_value(zone, 3, 2) <= 59;
  return false;
}

bool looks_like_wkt(const std::string &text) {
  std::string s = to_upper(trim(text));
  if (s.rfind("SRID=", 0) == 0) {
    auto semi = s.find(';');
    if (semi == std::string::npos || !all_digits(s, 5, semi - 5) ||
        semi == 5)
      return false;
    s = trim(s.substr(semi + 1));
  }
  static const char *keywords[] = {
      "GEOMETRYCOLLECTION", "MULTIPOLYGON", "MULTILINESTRING", "MULTIPOINT",
      "POLYGON",            "LINESTRING",   "POINT"};
  for (const char *kw : keywords) {
    std::string keyword(kw);
    if (s.rfind(keyword, 0) != 0)
      continue;
    std::string rest = trim(s.substr(keyword.size()));
    for (const char *dim : {"ZM", "Z", "M"}) {
      std::string d(dim);
      if (rest.rfind(d, 0) == 0 &&
          (rest.size() == d.size() || rest[d.size()] == ' ' ||
           rest[d.size()] == '(')) {
        rest = trim(rest.substr(d.size()));
        break;
      }
    }
    if (rest == "EMPTY")
      return true;
    return rest.size() >= 2 && rest.front() == '(' && rest.back() == ')';
  }
  return false;
}

bool looks_like_wkb(const Blob &blob) {
  const auto &b = blob.bytes;
  // GeoPackage binary header: "GP", version, flags, srs_id, envelope, WKB
  if (b.size() >= 8 && b[0] == 'G' && b[1] == 'P')
    return true;
  if (b.size() < 5 || b[0] > 1)
    return false;
  uint32_t type = 0;
  if (b[0] == 1) {
    type = static_cast<uint32_t>(b[1]) | (static_cast<uint32_t>(b[2]) << 8) |
           (static_cast<uint32_t>(b[3]) << 16) |
           (static_cast<uint32_t>(b[4]) << 24);
  } else {
    type = (static_cast<uint32_t>(b[1]) << 24) |
           (static_cast<uint32_t>(b[2]) << 16) |
           (static_cast<uint32_t>(b[3]) << 8) | static_cast<uint32_t>(b[4]);
  }
  uint32_t base = (type & 0x0FFFFFFFu) % 1000u; // strip EWKB flags and ISO Z/M
  return base >= 1 && base <= 17;
}

std::optional<CellValue> coerce(const CellValue &raw, DType dtype) {
  switch (dtype) {
  case DType::Int64:
    if (auto i = std::get_if<int64_t>(&raw))
      return CellValue{*i};
    if (auto d = std::get_if<double>(&raw)) {
      if (std::isfinite(*d) && std::floor(*d) == *d &&
          std::fabs(*d) < 9.2e18)
        return CellValue{static_cast<int64_t>(*d)};
      return std::nullopt;
    }
    if (auto s = std::get_if<std::string>(&raw)) {
      if (auto v = parse_int64(*s))
        return CellValue{*v};
    }
    return std::nullopt;

  case DType::Float64:
    if (auto d = std::get_if<double>(&raw))
      return CellValue{*d};
    if (auto i = std::get_if<int64_t>(&raw))
      return CellValue{static_cast<double>(*i)};
    if (auto s = std::get_if<std::string>(&raw)) {
      if (auto v = parse_float64(*s))
        return CellValue{*v};
    }
    return std::nullopt;

  case DType::String:
    if (auto s = std::get_if<std::string>(&raw))
      return CellValue{*s};
    // Scalars cast to their text form; binary and geometry do not
    if (auto i = std::get_if<int64_t>(&raw))
      return CellValue{std::to_string(*i)};
    if (auto b = std::get_if<bool>(&raw))
      return CellValue{std::string(*b ? "true" : "false")};
    if (auto d = std::get_if<double>(&raw)) {
      std::string text = fmt::format("{}", *d);
      if (text.find_first_of(".en") == std::string::npos)
        text += ".0";
      return CellValue{text};
    }
    return std::nullopt;

  case DType::Bool:
    if (auto b = std::get_if<bool>(&raw))
      return CellValue{*b};
    if (auto i = std::get_if<int64_t>(&raw)) {
      if (*i == 0 || *i == 1)
        return CellValue{*i == 1};
      return std::nullopt;
    }
    if (auto s = std::get_if<std::string>(&raw)) {
      if (auto v = parse_bool(*s))
        return CellValue{*v};
    }
    return std::nullopt;

  case DType::Date:
    if (auto s = std::get_if<std::string>(&raw)) {
      std::string t = trim(*s);
      if (is_iso_date(t))
        return CellValue{t};
    }
    return std::nullopt;

  case DType::Timestamp:
    if (auto s = std::get_if<std::string>(&raw)) {
      std::string t = trim(*s);
      if (is_iso_timestamp(t))
        return CellValue{t};
    }
    return std::nullopt;

  case DType::Geometry:
    if (std::holds_alternative<Geometry>(raw))
      return raw;
    if (auto b = std::get_if<Blob>(&raw)) {
      if (looks_like_wkb(*b))
        return raw;
      return std::nullopt;
    }
    if (auto s = std::get_if<std::string>(&raw)) {
      if (looks_like_wkt(*s))
        return raw;
      Blob decoded;
      std::string t = trim(*s);
      if (t.size() >= 10 && hex_to_bytes(t, decoded) && looks_like_wkb(decoded))
        return raw;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

std::string canonical_key(const CellValue &typed) {
  if (auto b = std::get_if<bool>(&typed))
    return *b ? "b:1" : "b:0";
  if (auto i = std::get_if<int64_t>(&typed))
    return "i:" + std::to_string(*i);
  if (auto d = std::get_if<double>(&typed))
    return fmt::format("d:{}", *d == 0.0 ? 0.0 : *d);
  if (auto s = std::get_if<std::string>(&typed))
    return "s:" + *s;
  if (auto blob = std::get_if<Blob>(&typed)) {
    std::string key = "x:";
    key.reserve(2 + blob->bytes.size() * 2);
    for (uint8_t byte : blob->bytes)
      key += fmt::format("{:02x}", byte);
    return key;
  }
  if (auto g = std::get_if<Geometry>(&typed))
    return "g:" + g->type;
  return "null";
}

std::optional<double> numeric_value(const CellValue &typed) {
  if (auto i = std::get_if<int64_t>(&typed))
    return static_cast<double>(*i);
  if (auto d = std::get_if<double>(&typed))
    return *d;
  return std::nullopt;
}

std::optional<CellValue> cell_from_json(const nlohmann::json &scalar) {
  if (scalar.is_string())
    return CellValue{scalar.get<std::string>()};
  if (scalar.is_boolean())
    return CellValue{scalar.get<bool>()};
  if (scalar.is_number_unsigned()) {
    auto u = scalar.get<uint64_t>();
    if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return CellValue{static_cast<int64_t>(u)};
    return CellValue{static_cast<double>(u)};
  }
  if (scalar.is_number_integer())
    return CellValue{scalar.get<int64_t>()};
  if (scalar.is_number_float())
    return CellValue{scalar.get<double>()};
  return std::nullopt;
}

// Howard Hinnant's days-from-civil inverse
std::string format_epoch_days(int64_t days) {
  days += 719468;
  const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const int64_t doe = days - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  int64_t year = yoe + era * 400;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int64_t day = doy - (153 * mp + 2) / 5 + 1;
  const int64_t month = mp < 10 ? mp + 3 : mp - 9;
  if (month <= 2)
    ++year;
  return fmt::format("{:04}-{:02}-{:02}", year, month, day);
}

std::string format_epoch_time(int64_t value, int64_t units_per_second) {
  int64_t seconds = value / units_per_second;
  int64_t fraction = value % units_per_second;
  if (fraction < 0) {
    fraction += units_per_second;
    --seconds;
  }
  int64_t days = seconds / 86400;
  int64_t secs_of_day = seconds % 86400;
  if (secs_of_day < 0) {
    secs_of_day += 86400;
    --days;
  }
  std::string out = fmt::format("{}T{:02}:{:02}:{:02}", format_epoch_days(days),
                                secs_of_day / 3600, (secs_of_day / 60) % 60,
                                secs_of_day % 60);
  if (fraction != 0) {
    int width = units_per_second == 1000      ? 3
                : units_per_second == 1000000 ? 6
                                              : 9;
    out += fmt::format(".{:0{}}", fraction, width);
  }
  return out;
}

} // namespace dsvalidator
