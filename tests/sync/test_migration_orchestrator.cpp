#include "../support/InMemoryEngines.h"
#include "../support/TestRunner.h"
#include "sync/MigrationOrchestrator.h"

namespace {
MigrationConfig testConfig() {
  MigrationConfig config;
  config.source.database = "shop";
  config.destination.database = "analytics";
  config.performance.fetch_size = 1000;
  config.performance.queue_capacity = 2;
  config.performance.write_retries = 3;
  config.performance.read_retries = 3;
  config.performance.retry_backoff_ms = 1;
  config.task.log_interval = 60;
  return config;
}

TableSpec spec(const std::string &table, size_t batchSize, bool verify = true) {
  TableSpec s;
  s.source_table = table;
  s.destination_table = table;
  s.batch_size = batchSize;
  s.verify = verify;
  return s;
}

struct StateLog {
  std::vector<TableState> states;
  StateCallback callback() {
    return [this](const TableStateRecord &record) {
      states.push_back(record.state);
    };
  }
  int terminalCount() const {
    int count = 0;
    for (auto state : states)
      count += isTerminal(state) ? 1 : 0;
    return count;
  }
};
} // namespace

int main() {
  TestRunner runner;
  TypeMapper mapper;

  runner.runTest("25,000 rows in batches of 10,000", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 25000);
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);
    StateLog log;

    TableResult result =
        orchestrator.migrateTable(spec("users", 10000), nullptr, log.callback());

    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status), "succeeded");
    runner.assertEquals(25000, result.rows_written, "rows written");
    runner.assertEquals(25000, result.rows_read, "rows read");
    runner.assertTrue(result.verified, "verified");
    runner.assertEquals(25000, result.destination_count, "destination count");

    auto table = warehouse.snapshot("users");
    runner.assertEquals(3, table.batchSizes.size(), "three write calls");
    runner.assertEquals(10000, table.batchSizes[0], "first batch");
    runner.assertEquals(10000, table.batchSizes[1], "second batch");
    runner.assertEquals(5000, table.batchSizes[2], "third batch");

    bool ordered = true;
    for (size_t i = 0; i < table.rows.size(); ++i)
      ordered = ordered && table.rows[i][0] == Value(int64_t(i + 1));
    runner.assertTrue(ordered, "rows in source order");

    std::vector<TableState> expected = {TableState::SYNCING,
                                        TableState::STREAMING,
                                        TableState::VERIFYING,
                                        TableState::SUCCEEDED};
    runner.assertTrue(log.states == expected, "state sequence");
    runner.assertEquals(0, source.openCursors.load(), "cursor released");
  });

  runner.runTest("unsupported column type fails before anything is written",
                 [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    auto &table = source.addTable(
        "legacy_events",
        {{"id", "int(11)", false, true}, {"area", "geometry", true, false}});
    table.rows.push_back({SourceValue("1"), SourceValue("POINT(0 0)")});
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);
    StateLog log;

    TableResult result = orchestrator.migrateTable(spec("legacy_events", 100),
                                                   nullptr, log.callback());

    runner.assertEquals(std::string("failed"),
                        tableStatusToString(result.status), "failed");
    runner.assertEquals(std::string("UnsupportedTypeError"),
                        result.error->name, "error name");
    runner.assertContains(result.error->message, "area", "names the column");
    runner.assertEquals(std::string("SYNCING"),
                        tableStateToString(result.error->state),
                        "raised while mapping the schema");
    runner.assertFalse(warehouse.hasTable("legacy_events"),
                       "destination untouched");
    runner.assertEquals(1, log.terminalCount(), "one terminal state");
  });

  runner.runTest("destination lost after two batches keeps them", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 50000);
    InMemoryWarehouse warehouse;
    warehouse.unreachableAfterBatches = 2;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 10000));

    runner.assertEquals(std::string("failed"),
                        tableStatusToString(result.status), "failed");
    runner.assertEquals(std::string("WriteError"), result.error->name,
                        "write error");
    runner.assertEquals(std::string("STREAMING"),
                        tableStateToString(result.error->state),
                        "failed while streaming");
    runner.assertEquals(20000, result.rows_written,
                        "committed batches counted");
    runner.assertEquals(2, result.batches_written, "two batches");
    runner.assertEquals(20000, warehouse.rowCount("users"),
                        "committed rows stay, no rollback");
    runner.assertEquals(2 + config.performance.write_retries,
                        warehouse.insertCalls.load(),
                        "third batch tried write_retries times");
    runner.assertEquals(0, source.openCursors.load(), "cursor released");
  });

  runner.runTest("rows inserted during migration fail verification", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 3000).rowsInsertedDuringMigration = 7;
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 1000));

    runner.assertEquals(std::string("failed"),
                        tableStatusToString(result.status), "failed");
    runner.assertEquals(std::string("VerificationMismatch"),
                        result.error->name, "mismatch");
    runner.assertEquals(std::string("VERIFYING"),
                        tableStateToString(result.error->state), "state");
    runner.assertEquals(3007, result.source_count, "source count recorded");
    runner.assertEquals(3000, result.destination_count,
                        "destination count recorded");
    runner.assertFalse(result.verified, "not verified");
    runner.assertEquals(3000, warehouse.rowCount("users"), "rows kept");
  });

  runner.runTest("verification can be turned off per table", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 100).rowsInsertedDuringMigration = 7;
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);
    StateLog log;

    TableResult result = orchestrator.migrateTable(spec("users", 30, false),
                                                   nullptr, log.callback());
    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status), "succeeded");
    runner.assertFalse(result.verified, "not verified");
    runner.assertEquals(4, result.batches_written, "ceil(100/30) batches");
    for (auto state : log.states)
      runner.assertTrue(state != TableState::VERIFYING, "no VERIFYING state");
  });

  runner.runTest("empty table is skipped", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "empty", 0);
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("empty", 100));
    runner.assertEquals(std::string("skipped"),
                        tableStatusToString(result.status), "skipped");
    runner.assertFalse(result.error.has_value(), "no error");
    runner.assertFalse(warehouse.hasTable("empty"), "no table created");

    config.task.skip_empty_tables = false;
    MigrationOrchestrator keepEmpty(config, source, warehouse, mapper);
    TableResult created = keepEmpty.migrateTable(spec("empty", 100));
    runner.assertEquals(std::string("success"),
                        tableStatusToString(created.status),
                        "empty table migrated when not skipping");
    runner.assertTrue(warehouse.hasTable("empty"), "table created");
    runner.assertEquals(0, created.batches_written, "no write calls");
  });

  runner.runTest("mid-stream read failure fails the table", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 5000).failAfterRows = 2500;
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 1000));
    runner.assertEquals(std::string("ReadError"), result.error->name,
                        "read error");
    runner.assertEquals(std::string("STREAMING"),
                        tableStateToString(result.error->state), "state");
    runner.assertTrue(result.rows_written <= 2500, "no phantom rows");
    runner.assertEquals(0, source.openCursors.load(), "cursor released");
  });

  runner.runTest("schema drift after sync fails the table", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 10).cursorColumnsOverride = {"id"};
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 5));
    runner.assertEquals(std::string("SchemaDriftError"), result.error->name,
                        "drift");
    runner.assertEquals(0, warehouse.rowCount("users"), "nothing written");
  });

  runner.runTest("incompatible existing table fails in SYNCING", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 10);
    InMemoryWarehouse warehouse;
    warehouse.addTable("users", {{"id", "String"}, {"name", "String"}});
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 5));
    runner.assertEquals(std::string("SchemaMismatchError"), result.error->name,
                        "mismatch");
    runner.assertEquals(std::string("SYNCING"),
                        tableStateToString(result.error->state), "state");
    runner.assertEquals(0, warehouse.rowCount("users"), "nothing written");
  });

  runner.runTest("stop request ends the table after the batch in flight",
                 [&]() {
    MigrationConfig config = testConfig();
    config.performance.fetch_size = 10;
    InMemorySource source;
    addUsersTable(source, "users", 100);
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    StopPredicate stop = [&]() { return warehouse.rowCount("users") >= 20; };
    TableResult result = orchestrator.migrateTable(spec("users", 10), stop);

    runner.assertEquals(std::string("skipped"),
                        tableStatusToString(result.status), "skipped");
    runner.assertEquals(std::string("Cancelled"), result.error->name,
                        "cancelled");
    runner.assertEquals(20, result.rows_written, "two whole batches");
    runner.assertEquals(20, warehouse.rowCount("users"),
                        "no half-written batch");
    runner.assertEquals(0, source.openCursors.load(), "cursor released");
  });

  runner.runTest("backpressure bounds the reader", [&]() {
    MigrationConfig config = testConfig();
    config.performance.fetch_size = 10;
    config.performance.queue_capacity = 1;
    InMemorySource source;
    addUsersTable(source, "users", 2000);
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 10));
    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status),
                        "completes with a one-slot queue");
    runner.assertEquals(200, result.batches_written, "200 batches");
  });

  runner.runTest("transient count failures are retried", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 30);
    source.countFailures = 1;
    InMemoryWarehouse warehouse;
    warehouse.countFailures = 2;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 10));
    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status), "succeeded");
    runner.assertTrue(result.verified, "verified after retry");
    runner.assertEquals(30, result.destination_count, "destination count");
    runner.assertEquals(30, result.rows_written, "rows written once");
    runner.assertEquals(0, warehouse.countFailures, "destination retried");
  });

  runner.runTest("transient metadata failures are retried", [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 12);
    source.describeFailures = 2;
    InMemoryWarehouse warehouse;
    warehouse.tableExistsFailures = 1;
    warehouse.createFailures = 1;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 5));
    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status), "succeeded");
    runner.assertEquals(1, warehouse.tablesCreated.load(), "created once");
    runner.assertEquals(12, warehouse.rowCount("users"), "all rows");
  });

  runner.runTest("count failures beyond the retry budget fail the table",
                 [&]() {
    MigrationConfig config = testConfig();
    InMemorySource source;
    addUsersTable(source, "users", 10);
    source.countFailures = 3;
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 5));
    runner.assertEquals(std::string("failed"),
                        tableStatusToString(result.status), "failed");
    runner.assertEquals(std::string("ReadError"), result.error->name,
                        "read error");
    runner.assertEquals(3, source.countCalls.load(), "read_retries attempts");
    runner.assertFalse(warehouse.hasTable("users"), "no table created");
  });

  runner.runTest("write failure stops the reader early", [&]() {
    MigrationConfig config = testConfig();
    config.performance.fetch_size = 100;
    config.performance.queue_capacity = 2;
    InMemorySource source;
    addUsersTable(source, "users", 100000);
    InMemoryWarehouse warehouse;
    warehouse.rejectTable = "users";
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 100));
    runner.assertEquals(std::string("WriteError"), result.error->name,
                        "write error");
    runner.assertTrue(source.rowsFetched.load() < 1000,
                      "rest of the table not read");
    runner.assertEquals(0, source.openCursors.load(), "cursor released");
  });

  runner.runTest("flush interval writes a partial batch while the source "
                 "stalls",
                 [&]() {
    MigrationConfig config = testConfig();
    config.performance.fetch_size = 5;
    config.performance.flush_interval_ms = 50;
    InMemorySource source;
    auto &table = addUsersTable(source, "users", 15);
    table.stallAtRow = 5;
    table.stallMs = 500;
    InMemoryWarehouse warehouse;
    MigrationOrchestrator orchestrator(config, source, warehouse, mapper);

    TableResult result = orchestrator.migrateTable(spec("users", 1000));
    runner.assertEquals(std::string("success"),
                        tableStatusToString(result.status), "succeeded");
    auto written = warehouse.snapshot("users");
    runner.assertEquals(2, written.batchSizes.size(), "two write calls");
    if (written.batchSizes.size() == 2) {
      runner.assertEquals(5, written.batchSizes[0], "flushed during stall");
      runner.assertEquals(10, written.batchSizes[1], "remainder at end");
    }
  });

  runner.printSummary();
  return 0;
}
