#include "../support/TestRunner.h"
#include "sync/TypeMapper.h"

namespace {
SourceColumn col(const std::string &name, const std::string &type,
                 bool nullable = true) {
  return SourceColumn{name, type, nullable, false};
}
} // namespace

int main() {
  TestRunner runner;
  TypeMapper mapper("utf8mb4");

  runner.runTest("integer widths and signedness", [&]() {
    runner.assertEquals(std::string("Int8"),
                        mapper.mapColumn(col("a", "tinyint(4)", false))
                            .destination_type,
                        "tinyint");
    runner.assertEquals(std::string("UInt8"),
                        mapper.mapColumn(col("a", "tinyint(3) unsigned", false))
                            .destination_type,
                        "tinyint unsigned");
    runner.assertEquals(std::string("Int16"),
                        mapper.mapColumn(col("a", "smallint(6)", false))
                            .destination_type,
                        "smallint");
    runner.assertEquals(std::string("Int32"),
                        mapper.mapColumn(col("a", "mediumint(9)", false))
                            .destination_type,
                        "mediumint widens to Int32");
    runner.assertEquals(std::string("UInt32"),
                        mapper.mapColumn(col("a", "int(10) unsigned", false))
                            .destination_type,
                        "int unsigned");
    runner.assertEquals(std::string("Nullable(Int64)"),
                        mapper.mapColumn(col("a", "bigint(20)", true))
                            .destination_type,
                        "nullable bigint");
    runner.assertEquals(std::string("UInt64"),
                        mapper.mapColumn(col("a", "BIGINT UNSIGNED", false))
                            .destination_type,
                        "upper case type");
  });

  runner.runTest("decimal, float, text, binary and temporal types", [&]() {
    runner.assertEquals(std::string("Decimal(12, 2)"),
                        mapper.mapColumn(col("p", "decimal(12,2)", false))
                            .destination_type,
                        "decimal keeps precision and scale");
    runner.assertEquals(std::string("Decimal(10, 0)"),
                        mapper.mapColumn(col("p", "decimal", false))
                            .destination_type,
                        "bare decimal defaults to (10,0)");
    runner.assertEquals(std::string("Float32"),
                        mapper.mapColumn(col("f", "float", false))
                            .destination_type,
                        "float");
    runner.assertEquals(std::string("Float64"),
                        mapper.mapColumn(col("f", "double", false))
                            .destination_type,
                        "double");
    runner.assertEquals(std::string("Nullable(String)"),
                        mapper.mapColumn(col("s", "varchar(255)"))
                            .destination_type,
                        "varchar");
    runner.assertEquals(std::string("String"),
                        mapper.mapColumn(col("s", "enum('a','b')", false))
                            .destination_type,
                        "enum");
    runner.assertEquals(std::string("String"),
                        mapper.mapColumn(col("b", "varbinary(16)", false))
                            .destination_type,
                        "varbinary");
    runner.assertEquals(std::string("Date32"),
                        mapper.mapColumn(col("d", "date", false))
                            .destination_type,
                        "date");
    runner.assertEquals(std::string("DateTime64(3)"),
                        mapper.mapColumn(col("d", "datetime(3)", false))
                            .destination_type,
                        "datetime(3)");
    runner.assertEquals(std::string("DateTime('UTC')"),
                        mapper.mapColumn(col("d", "timestamp", false))
                            .destination_type,
                        "timestamp");
    runner.assertEquals(std::string("DateTime64(6, 'UTC')"),
                        mapper.mapColumn(col("d", "timestamp(6)", false))
                            .destination_type,
                        "timestamp(6)");
    runner.assertEquals(std::string("UInt8"),
                        mapper.mapColumn(col("flag", "bit(1)", false))
                            .destination_type,
                        "bit(1)");
    runner.assertEquals(std::string("UInt16"),
                        mapper.mapColumn(col("y", "year(4)", false))
                            .destination_type,
                        "year");
  });

  runner.runTest("unsupported types are rejected", [&]() {
    runner.assertThrows<UnsupportedTypeError>(
        [&]() { mapper.mapColumn(col("shape", "geometry")); }, "geometry");
    runner.assertThrows<UnsupportedTypeError>(
        [&]() { mapper.mapColumn(col("p", "point")); }, "point");
    try {
      mapper.mapColumn(col("shape", "polygon"));
      runner.assertTrue(false, "polygon should throw");
    } catch (const UnsupportedTypeError &e) {
      runner.assertEquals(std::string("shape"), e.column(), "column name");
      runner.assertEquals(std::string("polygon"), e.type(), "column type");
      runner.assertEquals(std::string("UnsupportedTypeError"), e.name(),
                          "error name");
    }
  });

  runner.runTest("integer coercion enforces range", [&]() {
    ColumnDef tiny = mapper.mapColumn(col("t", "tinyint(4)", false));
    runner.assertTrue(mapper.coerce(SourceValue("-128"), tiny) ==
                          Value(int64_t(-128)),
                      "min tinyint");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("128"), tiny); }, "overflow");

    ColumnDef big = mapper.mapColumn(col("b", "bigint unsigned", false));
    runner.assertTrue(mapper.coerce(SourceValue("18446744073709551615"), big) ==
                          Value(uint64_t(18446744073709551615ULL)),
                      "max UInt64");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("-1"), big); }, "negative unsigned");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("12abc"), big); }, "garbage");
  });

  runner.runTest("NULL handling follows nullability", [&]() {
    ColumnDef nullable = mapper.mapColumn(col("n", "int(11)", true));
    ColumnDef required = mapper.mapColumn(col("r", "int(11)", false));
    runner.assertTrue(std::holds_alternative<NullValue>(
                          mapper.coerce(std::nullopt, nullable)),
                      "NULL passes through nullable column");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(std::nullopt, required); },
        "NULL in NOT NULL column");
  });

  runner.runTest("decimal coercion is exact", [&]() {
    ColumnDef price = mapper.mapColumn(col("price", "decimal(8,2)", false));
    Value v = mapper.coerce(SourceValue("00123.45"), price);
    runner.assertEquals(std::string("123.45"), std::get<DecimalValue>(v).text,
                        "leading zeros stripped, digits kept");
    Value negative = mapper.coerce(SourceValue("-0.50"), price);
    runner.assertEquals(std::string("-0.50"),
                        std::get<DecimalValue>(negative).text, "negative");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("1234567.00"), price); },
        "too many integer digits");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("1.234"), price); },
        "too many fraction digits");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("1e5"), price); }, "exponent");
  });

  runner.runTest("temporal coercion", [&]() {
    ColumnDef created = mapper.mapColumn(col("created", "datetime(3)", false));
    Value v = mapper.coerce(SourceValue("2024-02-29 13:45:07.125"), created);
    const auto &dt = std::get<DateTimeValue>(v);
    runner.assertEquals(2024, dt.year, "year");
    runner.assertEquals(29, dt.day, "leap day");
    runner.assertEquals(125000, dt.micros, "fraction in microseconds");
    runner.assertEquals(3, dt.fsp, "fsp from column");

    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("2023-02-29 00:00:00"), created); },
        "not a leap year");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("1850-01-01 00:00:00"), created); },
        "before DateTime64 range");

    ColumnDef ts = mapper.mapColumn(col("ts", "timestamp", false));
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("1969-12-31 23:59:59"), ts); },
        "before the epoch");
  });

  runner.runTest("zero dates", [&]() {
    ColumnDef nullableDate = mapper.mapColumn(col("d", "date", true));
    runner.assertTrue(std::holds_alternative<NullValue>(mapper.coerce(
                          SourceValue("0000-00-00"), nullableDate)),
                      "zero date becomes NULL when nullable");

    ColumnDef requiredDate = mapper.mapColumn(col("d", "datetime", false));
    Value epoch =
        mapper.coerce(SourceValue("0000-00-00 00:00:00"), requiredDate);
    runner.assertEquals(1970, std::get<DateTimeValue>(epoch).year,
                        "zero datetime becomes the epoch otherwise");
  });

  runner.runTest("bit fields and UTF-8 validation", [&]() {
    ColumnDef flags = mapper.mapColumn(col("f", "bit(12)", false));
    Value v = mapper.coerce(SourceValue(std::string("\x0A\xBC", 2)), flags);
    runner.assertTrue(v == Value(uint64_t(0x0ABC)), "big-endian bytes");

    ColumnDef name = mapper.mapColumn(col("name", "varchar(10)", false));
    runner.assertTrue(mapper.coerce(SourceValue("caf\xC3\xA9"), name) ==
                          Value(std::string("caf\xC3\xA9")),
                      "valid UTF-8 kept");
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerce(SourceValue("caf\xE9"), name); },
        "latin1 byte under utf8mb4");

    TypeMapper latin1("latin1");
    ColumnDef raw = latin1.mapColumn(col("name", "varchar(10)", false));
    runner.assertTrue(latin1.coerce(SourceValue("caf\xE9"), raw) ==
                          Value(std::string("caf\xE9")),
                      "no validation for non-UTF-8 charsets");

    runner.assertFalse(TypeMapper::isValidUTF8("\xED\xA0\x80"),
                       "surrogate rejected");
    runner.assertFalse(TypeMapper::isValidUTF8("\xC0\xAF"),
                       "overlong rejected");
  });

  runner.runTest("row width mismatch", [&]() {
    auto columns = mapper.mapColumns(
        {col("id", "int(11)", false), col("name", "varchar(10)")});
    runner.assertThrows<CoercionError>(
        [&]() { mapper.coerceRow({SourceValue("1")}, columns); },
        "one field for two columns");
    auto row = mapper.coerceRow({SourceValue("7"), std::nullopt}, columns);
    runner.assertEquals(2, row.size(), "two values");
  });

  runner.printSummary();
  return 0;
}
