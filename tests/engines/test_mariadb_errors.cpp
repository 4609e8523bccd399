#include "../support/TestRunner.h"
#include "engines/mariadb_engine.h"

int main() {
  TestRunner runner;

  runner.runTest("lost connections are transient", [&]() {
    runner.assertTrue(MariaDBEngine::isTransientError(2006),
                      "server has gone away");
    runner.assertTrue(MariaDBEngine::isTransientError(2013),
                      "lost connection during query");
    runner.assertTrue(MariaDBEngine::isTransientError(2002),
                      "can't connect through socket");
    runner.assertTrue(MariaDBEngine::isTransientError(2003),
                      "can't connect to host");
    runner.assertTrue(MariaDBEngine::isTransientError(1205),
                      "lock wait timeout");
    runner.assertTrue(MariaDBEngine::isTransientError(1213), "deadlock");
  });

  runner.runTest("statement errors are not transient", [&]() {
    runner.assertFalse(MariaDBEngine::isTransientError(1064), "syntax error");
    runner.assertFalse(MariaDBEngine::isTransientError(1142),
                       "SELECT command denied");
    runner.assertFalse(MariaDBEngine::isTransientError(1054), "unknown column");
    runner.assertFalse(MariaDBEngine::isTransientError(0), "no error");
  });

  runner.runTest("unknown column and missing table mean schema drift", [&]() {
    runner.assertTrue(MariaDBEngine::isSchemaChangeError(1054),
                      "unknown column");
    runner.assertTrue(MariaDBEngine::isSchemaChangeError(1146),
                      "table doesn't exist");
    runner.assertFalse(MariaDBEngine::isSchemaChangeError(2013),
                       "lost connection");
    runner.assertFalse(MariaDBEngine::isSchemaChangeError(1064),
                       "syntax error");
  });

  runner.printSummary();
  return 0;
}
