#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

// Drops every whitespace character; used to compare type strings such as
// "Decimal(10, 2)" and "Decimal(10,2)".
inline std::string removeWhitespace(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  for (unsigned char c : str) {
    if (!std::isspace(c))
      result += static_cast<char>(c);
  }
  return result;
}

// 1234567 -> "1,234,567"
inline std::string formatNumber(uint64_t value) {
  std::string digits = std::to_string(value);
  std::string result;
  result.reserve(digits.size() + digits.size() / 3);
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0)
      result += ',';
    result += digits[i];
  }
  return result;
}

// Quotes an identifier for MySQL. Embedded backticks are doubled.
inline std::string quoteMySQLIdentifier(const std::string &identifier) {
  if (identifier.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }
  std::string escaped;
  escaped.reserve(identifier.size() + 2);
  escaped += '`';
  for (char c : identifier) {
    if (c == '`')
      escaped += '`';
    escaped += c;
  }
  escaped += '`';
  return escaped;
}

// Quotes an identifier for ClickHouse. Backslash and backtick are escaped with
// a backslash, which is what the ClickHouse parser expects inside `...`.
inline std::string quoteClickHouseIdentifier(const std::string &identifier) {
  if (identifier.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }
  std::string escaped;
  escaped.reserve(identifier.size() + 2);
  escaped += '`';
  for (char c : identifier) {
    if (c == '`' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += '`';
  return escaped;
}

// Single-quoted SQL string literal with backslash and quote escaped. Works
// for both MySQL (default sql_mode) and ClickHouse.
inline std::string quoteLiteral(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped += '\'';
  for (char c : value) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += '\'';
  return escaped;
}

inline std::string join(const std::vector<std::string> &parts,
                        const std::string &separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += separator;
    result += parts[i];
  }
  return result;
}

} // namespace StringUtils

#endif
