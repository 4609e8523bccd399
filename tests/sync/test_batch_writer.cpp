#include "../support/InMemoryEngines.h"
#include "../support/TestRunner.h"
#include "sync/BatchWriter.h"
#include <thread>

namespace {
PerformanceConfig fastRetries(int attempts) {
  PerformanceConfig performance;
  performance.write_retries = attempts;
  performance.retry_backoff_ms = 1;
  return performance;
}

std::vector<ColumnDef> idNameColumns(const TypeMapper &mapper) {
  return mapper.mapColumns({{"id", "int(11)", false, true},
                            {"name", "varchar(64)", true, false}});
}

SourceRow idRow(int id) {
  return {SourceValue(std::to_string(id)), SourceValue("n" + std::to_string(id))};
}

size_t writeRows(BatchWriter &writer, int rows) {
  for (int i = 1; i <= rows; ++i) {
    writer.append(idRow(i));
    if (writer.shouldFlush())
      writer.flush();
  }
  return writer.flush();
}
} // namespace

int main() {
  TestRunner runner;
  TypeMapper mapper;

  runner.runTest("one write call per full batch plus the remainder", [&]() {
    struct Case {
      int rows;
      size_t batch;
      int expectedCalls;
    };
    const Case cases[] = {{25000, 10000, 3}, {10000, 10000, 1},
                          {1, 10000, 1},     {7, 3, 3},
                          {9, 3, 3},         {0, 5, 0}};
    for (const auto &c : cases) {
      InMemoryWarehouse warehouse;
      auto columns = idNameColumns(mapper);
      warehouse.createTable("users", columns, {"id"});
      BatchWriter writer(warehouse, "users", columns, mapper, c.batch,
                         fastRetries(3));
      writeRows(writer, c.rows);

      std::string label = std::to_string(c.rows) + " rows / batch " +
                          std::to_string(c.batch);
      runner.assertEquals(c.expectedCalls, writer.writeCalls(),
                          label + ": write calls");
      runner.assertEquals(c.rows, warehouse.rowCount("users"),
                          label + ": rows stored");
      runner.assertEquals(c.rows, writer.rowsWritten(),
                          label + ": rows reported");
    }
  });

  runner.runTest("batches keep source order and sequence numbers", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    warehouse.createTable("users", columns, {"id"});
    BatchWriter writer(warehouse, "users", columns, mapper, 4, fastRetries(3));
    writeRows(writer, 10);

    auto table = warehouse.snapshot("users");
    runner.assertEquals(3, table.batchSizes.size(), "three batches");
    runner.assertEquals(2, table.batchSizes.back(), "last batch is partial");
    for (size_t i = 0; i < table.batchSequences.size(); ++i) {
      runner.assertEquals(i + 1, table.batchSequences[i], "sequence");
    }
    for (size_t i = 0; i < table.rows.size(); ++i) {
      runner.assertTrue(table.rows[i][0] == Value(int64_t(i + 1)),
                        "row " + std::to_string(i + 1) + " in order");
    }
  });

  runner.runTest("transient failures are retried on a fresh inserter", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    warehouse.createTable("users", columns, {"id"});
    warehouse.transientFailures = 2;
    BatchWriter writer(warehouse, "users", columns, mapper, 5, fastRetries(3));
    writeRows(writer, 5);

    runner.assertEquals(1, writer.writeCalls(), "one logical write");
    runner.assertEquals(3, writer.insertAttempts(), "three attempts");
    runner.assertEquals(3, warehouse.insertersOpened.load(),
                        "new inserter per attempt");
    runner.assertEquals(5, warehouse.rowCount("users"), "rows landed once");
  });

  runner.runTest("exhausted retries escalate to table-fatal", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    warehouse.createTable("users", columns, {"id"});
    warehouse.transientFailures = 10;
    BatchWriter writer(warehouse, "users", columns, mapper, 5, fastRetries(3));
    for (int i = 1; i <= 5; ++i)
      writer.append(idRow(i));

    try {
      writer.flush();
      runner.assertTrue(false, "flush should throw");
    } catch (const WriteError &e) {
      runner.assertFalse(e.isTransient(), "escalated");
      runner.assertContains(e.what(), "after 3 attempts", "attempt count");
    }
    runner.assertEquals(3, warehouse.insertCalls.load(), "exactly 3 attempts");
    runner.assertEquals(0, writer.bufferedRows(),
                        "failed batch is not kept for a later flush");
    runner.assertEquals(0, writer.rowsWritten(), "nothing counted");
  });

  runner.runTest("permanent failures are not retried", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    warehouse.createTable("users", columns, {"id"});
    warehouse.rejectTable = "users";
    BatchWriter writer(warehouse, "users", columns, mapper, 5, fastRetries(5));
    writer.append(idRow(1));
    runner.assertThrows<WriteError>([&]() { writer.flush(); }, "rejected");
    runner.assertEquals(1, warehouse.insertCalls.load(), "single attempt");
  });

  runner.runTest("coercion failures surface at append", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    BatchWriter writer(warehouse, "users", columns, mapper, 5, fastRetries(3));
    runner.assertThrows<CoercionError>(
        [&]() { writer.append({std::nullopt, SourceValue("x")}); },
        "NULL id");
    runner.assertEquals(0, writer.bufferedRows(), "nothing buffered");
  });

  runner.runTest("flush interval triggers a partial batch", [&]() {
    InMemoryWarehouse warehouse;
    auto columns = idNameColumns(mapper);
    PerformanceConfig performance = fastRetries(3);
    performance.flush_interval_ms = 1;
    BatchWriter writer(warehouse, "users", columns, mapper, 1000, performance);
    writer.append(idRow(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    runner.assertTrue(writer.shouldFlush(), "interval elapsed");

    PerformanceConfig noInterval = fastRetries(3);
    BatchWriter sizeOnly(warehouse, "users", columns, mapper, 1000,
                         noInterval);
    sizeOnly.append(idRow(1));
    runner.assertFalse(sizeOnly.shouldFlush(), "size-only writer waits");
  });

  runner.printSummary();
  return 0;
}
