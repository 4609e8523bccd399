#include "../support/TestRunner.h"
#include "engines/clickhouse_engine.h"
#include "sync/TypeMapper.h"
#include "utils/string_utils.h"

int main() {
  TestRunner runner;
  TypeMapper mapper;

  runner.runTest("TabSeparated escaping", [&]() {
    runner.assertEquals(std::string("a\\tb\\nc\\\\d"),
                        ClickHouseEngine::escapeTSV("a\tb\nc\\d"),
                        "tab, newline, backslash");
    runner.assertEquals(std::string("x\\0y"),
                        ClickHouseEngine::escapeTSV(std::string("x\0y", 3)),
                        "NUL byte");
    runner.assertEquals(std::string("caf\xE9"),
                        ClickHouseEngine::escapeTSV("caf\xE9"),
                        "raw bytes pass through");
  });

  runner.runTest("value formatting", [&]() {
    runner.assertEquals(std::string("\\N"),
                        ClickHouseEngine::formatValue(NullValue{}), "NULL");
    runner.assertEquals(std::string("-42"),
                        ClickHouseEngine::formatValue(int64_t(-42)), "Int");
    runner.assertEquals(
        std::string("18446744073709551615"),
        ClickHouseEngine::formatValue(uint64_t(18446744073709551615ULL)),
        "UInt64 max");
    runner.assertEquals(std::string("0.10000000000000001"),
                        ClickHouseEngine::formatValue(0.1),
                        "doubles keep full precision");
    runner.assertEquals(std::string("-0.50"),
                        ClickHouseEngine::formatValue(DecimalValue{"-0.50"}),
                        "decimal text unchanged");

    DateTimeValue date;
    date.year = 2024;
    date.month = 3;
    date.day = 7;
    date.date_only = true;
    runner.assertEquals(std::string("2024-03-07"),
                        ClickHouseEngine::formatValue(date), "date");

    DateTimeValue stamp;
    stamp.year = 2024;
    stamp.month = 3;
    stamp.day = 7;
    stamp.hour = 9;
    stamp.minute = 5;
    stamp.second = 1;
    stamp.micros = 123456;
    stamp.fsp = 3;
    runner.assertEquals(std::string("2024-03-07 09:05:01.123"),
                        ClickHouseEngine::formatValue(stamp),
                        "fraction truncated to fsp");
    stamp.fsp = 0;
    runner.assertEquals(std::string("2024-03-07 09:05:01"),
                        ClickHouseEngine::formatValue(stamp), "no fraction");
  });

  runner.runTest("batch body is one line per row", [&]() {
    auto columns = mapper.mapColumns({{"id", "int(11)", false, true},
                                      {"note", "text", true, false}});
    Batch batch;
    batch.rows.push_back(
        mapper.coerceRow({SourceValue("1"), SourceValue("line1\nline2")},
                         columns));
    batch.rows.push_back(mapper.coerceRow({SourceValue("2"), std::nullopt},
                                          columns));
    runner.assertEquals(std::string("1\tline1\\nline2\n2\t\\N\n"),
                        ClickHouseEngine::encodeTSV(batch), "body");
  });

  runner.runTest("DDL and insert statements", [&]() {
    auto columns = mapper.mapColumns({{"id", "bigint(20)", false, true},
                                      {"price", "decimal(10,2)", true, false}});
    std::string ddl = ClickHouseEngine::buildCreateTableSQL(
        "analytics", "orders", columns, {"id"});
    runner.assertEquals(
        std::string("CREATE TABLE IF NOT EXISTS `analytics`.`orders` (\n"
                    "  `id` Int64,\n"
                    "  `price` Nullable(Decimal(10, 2))\n"
                    ") ENGINE = MergeTree() ORDER BY (`id`) "
                    "SETTINGS index_granularity = 8192"),
        ddl, "create table");

    std::string noKey = ClickHouseEngine::buildCreateTableSQL(
        "analytics", "orders", columns, {});
    runner.assertContains(noKey, "ORDER BY tuple()", "no primary key");

    runner.assertEquals(
        std::string("INSERT INTO `analytics`.`orders` (`id`, `price`) "
                    "FORMAT TabSeparated"),
        ClickHouseEngine::buildInsertQuery("analytics", "orders", columns),
        "insert");
  });

  runner.runTest("identifier quoting", [&]() {
    runner.assertEquals(std::string("`we\\`ird`"),
                        StringUtils::quoteClickHouseIdentifier("we`ird"),
                        "ClickHouse backtick");
    runner.assertEquals(std::string("`we``ird`"),
                        StringUtils::quoteMySQLIdentifier("we`ird"),
                        "MySQL backtick");
    runner.assertThrows<std::invalid_argument>(
        []() { StringUtils::quoteMySQLIdentifier(""); }, "empty identifier");
  });

  runner.runTest("HTTP status classification", [&]() {
    runner.assertTrue(ClickHouseEngine::isTransientHttpStatus(503), "503");
    runner.assertTrue(ClickHouseEngine::isTransientHttpStatus(429), "429");
    runner.assertFalse(ClickHouseEngine::isTransientHttpStatus(400), "400");
    runner.assertFalse(ClickHouseEngine::isTransientHttpStatus(500),
                       "500 carries a ClickHouse exception");
  });

  runner.printSummary();
  return 0;
}
