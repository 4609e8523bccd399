#include "../support/TestRunner.h"
#include "core/migration_config.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace {
const char *kFullConfig = R"({
  "mysql": {"host": "db1", "port": "3307", "user": "reader",
            "password": "secret", "database": "shop"},
  "clickhouse": {"host": "ch1", "port": 8124, "database": "analytics",
                 "password": "chsecret"},
  "performance": {"fetch_size": 2000, "max_parallel_tables": 2,
                  "write_retries": 5},
  "migration": {
    "task_name": "nightly",
    "default_batch_size": 5000,
    "default_verify": false,
    "continue_on_error": true,
    "tables": [
      {"mysql_table": "users", "ch_table": "users_ch"},
      {"mysql_table": "orders", "ch_table": "orders_ch", "batch_size": 100,
       "verify": true, "continue_on_error": false}
    ]
  },
  "feishu": {"enabled": true, "webhook_url": "https://example.invalid/hook",
             "mention_users": ["ou_1", "ou_2"]},
  "logging": {"level": "DEBUG", "file_output": false}
})";
} // namespace

int main() {
  TestRunner runner;

  runner.runTest("parses every section", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(kFullConfig);
    runner.assertEquals(std::string("db1"), config.source.host, "mysql host");
    runner.assertEquals(3307, config.source.port, "port given as string");
    runner.assertEquals(8124, config.destination.port, "numeric port");
    runner.assertEquals(std::string("default"), config.destination.user,
                        "clickhouse user default");
    runner.assertEquals(2000, config.performance.fetch_size, "fetch size");
    runner.assertEquals(2, config.performance.max_parallel_tables, "parallel");
    runner.assertEquals(5, config.performance.write_retries, "retries");
    runner.assertEquals(3, config.performance.read_retries,
                        "read retries default");
    runner.assertEquals(std::string("nightly"), config.task.task_name, "name");
    runner.assertEquals(2, config.tables.size(), "two tables");
    runner.assertEquals(2, config.notification.mention_users.size(),
                        "mentions");
    runner.assertEquals(std::string("DEBUG"), config.logging.level, "level");
    runner.assertFalse(config.logging.file_output, "file output off");
    runner.assertFalse(config.history.enabled, "history off by default");
  });

  runner.runTest("tables inherit task defaults", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(kFullConfig);
    const TableSpec &users = config.tables[0];
    runner.assertEquals(5000, users.batch_size, "inherited batch size");
    runner.assertFalse(users.verify, "inherited verify");
    runner.assertTrue(users.continue_on_error, "inherited continue_on_error");

    const TableSpec &orders = config.tables[1];
    runner.assertEquals(100, orders.batch_size, "own batch size");
    runner.assertTrue(orders.verify, "own verify");
    runner.assertFalse(orders.continue_on_error, "own continue_on_error");
  });

  runner.runTest("minimal config uses defaults", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(
        R"({"mysql": {"user": "u", "database": "d"},
            "clickhouse": {"database": "c"}})");
    runner.assertEquals(3306, config.source.port, "mysql default port");
    runner.assertEquals(8123, config.destination.port, "http default port");
    runner.assertEquals(std::string("utf8mb4"), config.source.charset,
                        "charset");
    runner.assertEquals(1, config.performance.max_parallel_tables,
                        "sequential by default");
    runner.assertFalse(config.task.drop_table_before_create,
                       "never drops by default");
    runner.assertTrue(config.task.skip_empty_tables, "skips empty tables");
    config.validate();
  });

  runner.runTest("malformed input is rejected", [&]() {
    runner.assertThrows<std::invalid_argument>(
        []() { MigrationConfig::fromJsonString("{not json"); }, "bad JSON");
    runner.assertThrows<std::invalid_argument>(
        []() {
          MigrationConfig::fromJsonString(R"({"mysql": {"port": "33o6"}})");
        },
        "bad port");
    runner.assertThrows<std::invalid_argument>(
        []() {
          MigrationConfig::fromJsonString(
              R"({"migration": {"tables": [{"mysql_table": "users"}]}})");
        },
        "table without destination");
    runner.assertThrows<std::invalid_argument>(
        []() {
          MigrationConfig::fromJsonString(
              R"({"performance": {"fetch_size": "many"}})");
        },
        "wrong value type");
  });

  runner.runTest("validation enforces ranges", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(kFullConfig);
    config.validate();

    MigrationConfig zeroBatch = config;
    zeroBatch.tables[0].batch_size = 0;
    runner.assertThrows<std::invalid_argument>([&]() { zeroBatch.validate(); },
                                               "batch size 0");

    MigrationConfig noDatabase = config;
    noDatabase.source.database.clear();
    runner.assertThrows<std::invalid_argument>(
        [&]() { noDatabase.validate(); }, "missing database");

    MigrationConfig tooParallel = config;
    tooParallel.performance.max_parallel_tables = 64;
    runner.assertThrows<std::invalid_argument>(
        [&]() { tooParallel.validate(); }, "too many workers");

    MigrationConfig history = config;
    history.history.enabled = true;
    runner.assertThrows<std::invalid_argument>([&]() { history.validate(); },
                                               "history without connection");
  });

  runner.runTest("environment overrides secrets", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(kFullConfig);
    setenv("MYSQL_PASSWORD", "from-env", 1);
    setenv("HISTORY_DB_URL", "postgresql://h/db", 1);
    config.applyEnvOverrides();
    unsetenv("MYSQL_PASSWORD");
    unsetenv("HISTORY_DB_URL");
    runner.assertEquals(std::string("from-env"), config.source.password,
                        "mysql password");
    runner.assertEquals(std::string("chsecret"), config.destination.password,
                        "clickhouse password untouched");
    runner.assertEquals(std::string("postgresql://h/db"),
                        config.history.connection_string, "history url");
  });

  runner.runTest("snapshot masks passwords", [&]() {
    MigrationConfig config = MigrationConfig::fromJsonString(kFullConfig);
    std::string snapshot = config.toSnapshotJson();
    runner.assertTrue(snapshot.find("secret") == std::string::npos,
                      "no password in snapshot");
    auto parsed = nlohmann::json::parse(snapshot);
    runner.assertEquals(std::string("******"),
                        parsed["mysql"]["password"].get<std::string>(),
                        "masked");
    runner.assertEquals(2, parsed["migration"]["tables"].size(), "tables");
  });

  runner.runTest("loadFromFile reads and validates", [&]() {
    runner.assertThrows<std::runtime_error>(
        []() { MigrationConfig::loadFromFile("/nonexistent/config.json"); },
        "missing file");

    std::string path = "test_migration_config.tmp.json";
    {
      std::ofstream out(path);
      out << kFullConfig;
    }
    MigrationConfig config = MigrationConfig::loadFromFile(path);
    std::remove(path.c_str());
    runner.assertEquals(std::string("shop"), config.source.database,
                        "loaded");
  });

  runner.printSummary();
  return 0;
}
