#ifndef TYPEMAPPER_H
#define TYPEMAPPER_H

#include "sync/MigrationErrors.h"
#include "sync/MigrationTypes.h"
#include <string>
#include <unordered_map>

// Maps MySQL column definitions to ClickHouse columns and converts source
// field text into destination-typed values. Holds no state besides the source
// character set, so one instance can be shared across threads.
class TypeMapper {
public:
  explicit TypeMapper(std::string sourceCharset = "utf8mb4");

  ColumnDef mapColumn(const SourceColumn &column) const;
  std::vector<ColumnDef> mapColumns(const std::vector<SourceColumn> &columns) const;

  Value coerce(const SourceValue &value, const ColumnDef &column) const;
  DestinationRow coerceRow(const SourceRow &row,
                           const std::vector<ColumnDef> &columns) const;

  static bool isValidUTF8(const std::string &text);

private:
  struct ParsedType {
    std::string base;
    std::vector<int> args;
    bool is_unsigned = false;
  };

  std::string sourceCharset_;
  bool utf8Charset_;

  static const std::unordered_map<std::string, int> integerWidths;

  static ParsedType parseType(const std::string &columnType);

  Value coerceSigned(const std::string &text, const ColumnDef &column) const;
  Value coerceUnsigned(const std::string &text, const ColumnDef &column) const;
  Value coerceBitField(const std::string &bytes, const ColumnDef &column) const;
  Value coerceFloat(const std::string &text, const ColumnDef &column) const;
  Value coerceDecimal(const std::string &text, const ColumnDef &column) const;
  Value coerceTemporal(const std::string &text, const ColumnDef &column) const;
};

#endif
