#include "sync/TypeMapper.h"
#include "utils/string_utils.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {
constexpr int DATE32_MIN_YEAR = 1900;
constexpr int DATE32_MAX_YEAR = 2299;
constexpr int TIMESTAMP_MIN_YEAR = 1970;
constexpr int TIMESTAMP_MAX_YEAR = 2105;
constexpr int MAX_FSP = 6;

bool isDigits(const std::string &text, size_t from, size_t to) {
  if (from >= to)
    return false;
  for (size_t i = from; i < to; ++i) {
    if (text[i] < '0' || text[i] > '9')
      return false;
  }
  return true;
}

int toInt(const std::string &text, size_t from, size_t len) {
  return std::atoi(text.substr(from, len).c_str());
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year))
    return 29;
  return days[month - 1];
}

bool isZeroDate(const std::string &text) {
  return StringUtils::startsWith(text, "0000-00-00");
}

std::string withNullable(const std::string &type, bool nullable) {
  return nullable ? "Nullable(" + type + ")" : type;
}
} // namespace

const std::unordered_map<std::string, int> TypeMapper::integerWidths = {
    {"tinyint", 8},  {"smallint", 16}, {"mediumint", 32},
    {"int", 32},     {"integer", 32},  {"bigint", 64},
    {"bool", 8},     {"boolean", 8}};

TypeMapper::TypeMapper(std::string sourceCharset)
    : sourceCharset_(std::move(sourceCharset)),
      utf8Charset_(
          StringUtils::startsWith(StringUtils::toLower(sourceCharset_), "utf8")) {}

// Splits a MySQL COLUMN_TYPE such as "decimal(12,2) unsigned zerofill" into
// the base name, the numeric arguments and the unsigned flag. enum/set carry
// quoted string arguments which are irrelevant for the mapping and skipped.
TypeMapper::ParsedType TypeMapper::parseType(const std::string &columnType) {
  ParsedType parsed;
  std::string lowered = StringUtils::toLower(StringUtils::trim(columnType));

  size_t baseEnd = lowered.find_first_of("( ");
  parsed.base = lowered.substr(0, baseEnd);

  size_t open = lowered.find('(');
  size_t close = lowered.find(')');
  if (open != std::string::npos && close != std::string::npos &&
      close > open && parsed.base != "enum" && parsed.base != "set") {
    std::string inner = lowered.substr(open + 1, close - open - 1);
    size_t start = 0;
    while (start <= inner.size()) {
      size_t comma = inner.find(',', start);
      std::string part = StringUtils::trim(inner.substr(
          start, comma == std::string::npos ? std::string::npos
                                            : comma - start));
      if (!part.empty() && isDigits(part, 0, part.size())) {
        parsed.args.push_back(std::atoi(part.c_str()));
      }
      if (comma == std::string::npos)
        break;
      start = comma + 1;
    }
  }

  parsed.is_unsigned = lowered.find(" unsigned") != std::string::npos;
  return parsed;
}

ColumnDef TypeMapper::mapColumn(const SourceColumn &column) const {
  ColumnDef def;
  def.name = column.name;
  def.source_type = column.column_type;
  def.nullable = column.nullable;

  ParsedType type = parseType(column.column_type);
  const std::string &base = type.base;
  std::string chType;

  auto intIt = integerWidths.find(base);
  if (intIt != integerWidths.end()) {
    def.bits = intIt->second;
    def.rule = type.is_unsigned ? CoercionRule::UNSIGNED_INT
                                : CoercionRule::SIGNED_INT;
    chType = (type.is_unsigned ? "UInt" : "Int") + std::to_string(def.bits);
  } else if (base == "bit") {
    int width = type.args.empty() ? 1 : type.args[0];
    def.bits = width <= 8 ? 8 : width <= 16 ? 16 : width <= 32 ? 32 : 64;
    def.rule = CoercionRule::BIT_FIELD;
    chType = "UInt" + std::to_string(def.bits);
  } else if (base == "year") {
    def.bits = 16;
    def.rule = CoercionRule::UNSIGNED_INT;
    chType = "UInt16";
  } else if (base == "float") {
    def.rule = CoercionRule::FLOAT;
    def.bits = 32;
    chType = "Float32";
  } else if (base == "double" || base == "real") {
    def.rule = CoercionRule::FLOAT;
    def.bits = 64;
    chType = "Float64";
  } else if (base == "decimal" || base == "numeric" || base == "dec" ||
             base == "fixed") {
    def.rule = CoercionRule::DECIMAL;
    def.precision = type.args.empty() ? 10 : type.args[0];
    def.scale = type.args.size() > 1 ? type.args[1] : 0;
    if (def.precision < 1 || def.precision > 76 || def.scale > def.precision) {
      throw UnsupportedTypeError(column.name, column.column_type);
    }
    chType = "Decimal(" + std::to_string(def.precision) + ", " +
             std::to_string(def.scale) + ")";
  } else if (base == "char" || base == "varchar" || base == "tinytext" ||
             base == "text" || base == "mediumtext" || base == "longtext" ||
             base == "enum" || base == "set" || base == "json" ||
             base == "time") {
    def.rule = CoercionRule::TEXT;
    def.validate_utf8 = utf8Charset_ && base != "time";
    chType = "String";
  } else if (base == "binary" || base == "varbinary" || base == "tinyblob" ||
             base == "blob" || base == "mediumblob" || base == "longblob") {
    def.rule = CoercionRule::BINARY;
    chType = "String";
  } else if (base == "date") {
    def.rule = CoercionRule::DATE;
    chType = "Date32";
  } else if (base == "datetime") {
    def.rule = CoercionRule::DATETIME;
    def.scale = type.args.empty() ? 0 : type.args[0];
    if (def.scale > MAX_FSP)
      throw UnsupportedTypeError(column.name, column.column_type);
    chType = "DateTime64(" + std::to_string(def.scale) + ")";
  } else if (base == "timestamp") {
    def.rule = CoercionRule::TIMESTAMP;
    def.scale = type.args.empty() ? 0 : type.args[0];
    if (def.scale > MAX_FSP)
      throw UnsupportedTypeError(column.name, column.column_type);
    chType = def.scale > 0
                 ? "DateTime64(" + std::to_string(def.scale) + ", 'UTC')"
                 : "DateTime('UTC')";
  } else {
    throw UnsupportedTypeError(column.name, column.column_type);
  }

  def.destination_type = withNullable(chType, def.nullable);
  return def;
}

std::vector<ColumnDef>
TypeMapper::mapColumns(const std::vector<SourceColumn> &columns) const {
  std::vector<ColumnDef> defs;
  defs.reserve(columns.size());
  for (const auto &column : columns) {
    defs.push_back(mapColumn(column));
  }
  return defs;
}

Value TypeMapper::coerce(const SourceValue &value,
                         const ColumnDef &column) const {
  if (!value) {
    if (!column.nullable) {
      throw CoercionError(column.name, "NULL in non-nullable column");
    }
    return NullValue{};
  }

  const std::string &text = *value;
  switch (column.rule) {
  case CoercionRule::SIGNED_INT:
    return coerceSigned(text, column);
  case CoercionRule::UNSIGNED_INT:
    return coerceUnsigned(text, column);
  case CoercionRule::BIT_FIELD:
    return coerceBitField(text, column);
  case CoercionRule::FLOAT:
    return coerceFloat(text, column);
  case CoercionRule::DECIMAL:
    return coerceDecimal(text, column);
  case CoercionRule::TEXT:
    if (column.validate_utf8 && !isValidUTF8(text)) {
      throw CoercionError(column.name, "malformed UTF-8 under charset " +
                                           sourceCharset_);
    }
    return text;
  case CoercionRule::BINARY:
    return BytesValue{text};
  case CoercionRule::DATE:
  case CoercionRule::DATETIME:
  case CoercionRule::TIMESTAMP:
    return coerceTemporal(text, column);
  }
  throw CoercionError(column.name, "no coercion rule");
}

DestinationRow TypeMapper::coerceRow(const SourceRow &row,
                                     const std::vector<ColumnDef> &columns) const {
  if (row.size() != columns.size()) {
    throw CoercionError("<row>", "row has " + std::to_string(row.size()) +
                                 " fields, expected " +
                                 std::to_string(columns.size()));
  }
  DestinationRow out;
  out.reserve(row.size());
  for (size_t i = 0; i < row.size(); ++i) {
    out.push_back(coerce(row[i], columns[i]));
  }
  return out;
}

Value TypeMapper::coerceSigned(const std::string &text,
                               const ColumnDef &column) const {
  if (text.empty()) {
    throw CoercionError(column.name, "empty integer value");
  }
  errno = 0;
  char *end = nullptr;
  long long parsed = std::strtoll(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    throw CoercionError(column.name, "not a " + std::to_string(column.bits) +
                                         "-bit integer: " + text);
  }
  if (column.bits < 64) {
    long long maxValue = (1LL << (column.bits - 1)) - 1;
    long long minValue = -maxValue - 1;
    if (parsed < minValue || parsed > maxValue) {
      throw CoercionError(column.name, "value " + text + " out of range for Int" +
                                           std::to_string(column.bits));
    }
  }
  return static_cast<int64_t>(parsed);
}

Value TypeMapper::coerceUnsigned(const std::string &text,
                                 const ColumnDef &column) const {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    throw CoercionError(column.name, "not an unsigned integer: " + text);
  }
  errno = 0;
  char *end = nullptr;
  unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    throw CoercionError(column.name, "not an unsigned integer: " + text);
  }
  if (column.bits < 64 && parsed > ((1ULL << column.bits) - 1)) {
    throw CoercionError(column.name, "value " + text +
                                         " out of range for UInt" +
                                         std::to_string(column.bits));
  }
  return static_cast<uint64_t>(parsed);
}

// BIT(n) arrives from the text protocol as ceil(n/8) raw bytes, most
// significant byte first.
Value TypeMapper::coerceBitField(const std::string &bytes,
                                 const ColumnDef &column) const {
  if (bytes.size() > 8) {
    throw CoercionError(column.name, "bit value wider than 64 bits");
  }
  uint64_t result = 0;
  for (unsigned char byte : bytes) {
    result = (result << 8) | byte;
  }
  if (column.bits < 64 && result > ((1ULL << column.bits) - 1)) {
    throw CoercionError(column.name,
                        "bit value out of range for UInt" +
                            std::to_string(column.bits));
  }
  return result;
}

Value TypeMapper::coerceFloat(const std::string &text,
                              const ColumnDef &column) const {
  if (text.empty()) {
    throw CoercionError(column.name, "empty floating point value");
  }
  char *end = nullptr;
  double parsed = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
    throw CoercionError(column.name, "not a finite number: " + text);
  }
  if (column.bits == 32 &&
      std::fabs(parsed) > static_cast<double>(std::numeric_limits<float>::max())) {
    throw CoercionError(column.name, "value " + text +
                                         " out of range for Float32");
  }
  return parsed;
}

// Accepts "[-]digits[.digits]" and checks the digit counts against the
// declared precision and scale so ClickHouse never has to round or reject.
Value TypeMapper::coerceDecimal(const std::string &text,
                                const ColumnDef &column) const {
  size_t pos = 0;
  bool negative = false;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    negative = text[0] == '-';
    pos = 1;
  }

  size_t dot = text.find('.', pos);
  size_t intEnd = dot == std::string::npos ? text.size() : dot;
  if (!isDigits(text, pos, intEnd) ||
      (dot != std::string::npos && !isDigits(text, dot + 1, text.size()))) {
    throw CoercionError(column.name, "malformed decimal: " + text);
  }

  std::string integerPart = text.substr(pos, intEnd - pos);
  size_t firstNonZero = integerPart.find_first_not_of('0');
  integerPart = firstNonZero == std::string::npos
                    ? "0"
                    : integerPart.substr(firstNonZero);
  std::string fractionPart =
      dot == std::string::npos ? "" : text.substr(dot + 1);

  int integerDigits = integerPart == "0" ? 0 : static_cast<int>(integerPart.size());
  if (integerDigits > column.precision - column.scale ||
      static_cast<int>(fractionPart.size()) > column.scale) {
    throw CoercionError(column.name, "value " + text + " exceeds Decimal(" +
                                         std::to_string(column.precision) +
                                         ", " + std::to_string(column.scale) +
                                         ")");
  }

  std::string canonical = (negative ? "-" : "") + integerPart;
  if (!fractionPart.empty())
    canonical += "." + fractionPart;
  return DecimalValue{canonical};
}

// Parses "YYYY-MM-DD" or "YYYY-MM-DD HH:MM:SS[.ffffff]". MySQL zero dates
// become NULL for nullable columns and the epoch otherwise, which is how the
// destination itself renders an out-of-band zero.
Value TypeMapper::coerceTemporal(const std::string &text,
                                 const ColumnDef &column) const {
  bool dateOnly = column.rule == CoercionRule::DATE;

  if (isZeroDate(text)) {
    if (column.nullable)
      return NullValue{};
    DateTimeValue epoch;
    epoch.fsp = column.scale;
    epoch.date_only = dateOnly;
    return epoch;
  }

  auto malformed = [&]() {
    return CoercionError(column.name, "malformed " +
                                          std::string(dateOnly ? "date"
                                                               : "datetime") +
                                          ": " + text);
  };

  if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
      !isDigits(text, 0, 4) || !isDigits(text, 5, 7) ||
      !isDigits(text, 8, 10)) {
    throw malformed();
  }

  DateTimeValue result;
  result.year = toInt(text, 0, 4);
  result.month = toInt(text, 5, 2);
  result.day = toInt(text, 8, 2);
  result.fsp = column.scale;
  result.date_only = dateOnly;

  if (text.size() > 10) {
    if (text.size() < 19 || text[10] != ' ' || text[13] != ':' ||
        text[16] != ':' || !isDigits(text, 11, 13) ||
        !isDigits(text, 14, 16) || !isDigits(text, 17, 19)) {
      throw malformed();
    }
    result.hour = toInt(text, 11, 2);
    result.minute = toInt(text, 14, 2);
    result.second = toInt(text, 17, 2);

    if (text.size() > 19) {
      if (text[19] != '.' || !isDigits(text, 20, text.size()) ||
          text.size() - 20 > static_cast<size_t>(MAX_FSP)) {
        throw malformed();
      }
      std::string fraction = text.substr(20);
      fraction.append(MAX_FSP - fraction.size(), '0');
      result.micros = std::atoi(fraction.c_str());
    }
  }

  if (result.month < 1 || result.month > 12 || result.day < 1 ||
      result.day > daysInMonth(result.year, result.month) ||
      result.hour > 23 || result.minute > 59 || result.second > 59) {
    throw malformed();
  }

  int minYear = column.rule == CoercionRule::TIMESTAMP ? TIMESTAMP_MIN_YEAR
                                                       : DATE32_MIN_YEAR;
  int maxYear = column.rule == CoercionRule::TIMESTAMP ? TIMESTAMP_MAX_YEAR
                                                       : DATE32_MAX_YEAR;
  if (result.year < minYear || result.year > maxYear) {
    throw CoercionError(column.name, "value " + text + " outside " +
                                         std::to_string(minYear) + ".." +
                                         std::to_string(maxYear));
  }
  return result;
}

bool TypeMapper::isValidUTF8(const std::string &text) {
  const auto *bytes = reinterpret_cast<const unsigned char *>(text.data());
  size_t len = text.size();
  size_t i = 0;
  while (i < len) {
    unsigned char c = bytes[i];
    if (c < 0x80) {
      i++;
      continue;
    }

    size_t extra = 0;
    uint32_t codepoint = 0;
    if ((c & 0xE0) == 0xC0) {
      extra = 1;
      codepoint = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      codepoint = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      codepoint = c & 0x07;
    } else {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k) {
      if (i + k >= len || (bytes[i + k] & 0xC0) != 0x80)
        return false;
      codepoint = (codepoint << 6) | (bytes[i + k] & 0x3F);
    }

    if ((extra == 1 && codepoint < 0x80) ||
        (extra == 2 && codepoint < 0x800) ||
        (extra == 3 && codepoint < 0x10000) || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}
