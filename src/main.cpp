#include "catalog/task_history_recorder.h"
#include "catalog/task_history_repository.h"
#include "core/logger.h"
#include "core/migration_config.h"
#include "engines/clickhouse_engine.h"
#include "engines/mariadb_engine.h"
#include "governance/WebhookNotifier.h"
#include "sync/TaskRunner.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <iomanip>
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_WARNINGS = 1;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_FAILED = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_CANCELLED = 7;

constexpr int DEFAULT_LIST_LIMIT = 10;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

struct CommandLine {
  std::string configPath = "config.json";
  bool listTasks = false;
  int listLimit = DEFAULT_LIST_LIMIT;
  bool help = false;
};

void printUsage(const char *program) {
  std::cout << "Usage: " << program
            << " [--config <path>] [--list-tasks [N]]\n\n"
            << "  --config <path>    configuration file (default config.json)\n"
            << "  --list-tasks [N]   show the N most recent tasks from the "
               "history store (default "
            << DEFAULT_LIST_LIMIT << ")\n"
            << "  --help             show this message\n";
}

CommandLine parseArguments(int argc, char *argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc)
        throw std::invalid_argument("--config requires a path");
      cmd.configPath = argv[++i];
    } else if (arg == "--list-tasks") {
      cmd.listTasks = true;
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        try {
          cmd.listLimit = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          throw std::invalid_argument("--list-tasks expects a number, got '" +
                                      std::string(argv[i]) + "'");
        }
        if (cmd.listLimit <= 0)
          throw std::invalid_argument("--list-tasks expects a positive number");
      }
    } else if (arg == "--help" || arg == "-h") {
      cmd.help = true;
    } else {
      throw std::invalid_argument("Unknown argument: " + arg);
    }
  }
  return cmd;
}

int listTasks(const MigrationConfig &config, int limit) {
  if (!config.history.enabled) {
    std::cerr << "Task history is not enabled in the configuration"
              << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  TaskHistoryRepository repository(config.history.connection_string);
  auto tasks = repository.getRecentTasks(limit);
  if (tasks.empty()) {
    std::cout << "No tasks recorded" << std::endl;
    return EXIT_SUCCESS_CODE;
  }

  std::cout << std::left << std::setw(6) << "ID" << std::setw(24) << "TASK"
            << std::setw(26) << "STATUS" << std::setw(21) << "STARTED"
            << std::setw(10) << "TABLES" << std::setw(16) << "ROWS"
            << "TIME" << "\n";
  for (const auto &task : tasks) {
    std::string tables = std::to_string(task.success_tables) + "/" +
                         std::to_string(task.total_tables);
    std::cout << std::left << std::setw(6) << task.id << std::setw(24)
              << task.task_name << std::setw(26) << task.status
              << std::setw(21) << task.start_time << std::setw(10) << tables
              << std::setw(16)
              << StringUtils::formatNumber(
                     static_cast<uint64_t>(task.total_rows))
              << TimeUtils::formatDuration(task.total_time) << "\n";
    if (!task.error_message.empty())
      std::cout << "      error: " << task.error_message << "\n";
  }
  return EXIT_SUCCESS_CODE;
}

void printSummary(const TaskResult &result) {
  std::cout << "\n========== Migration Summary ==========\n";
  for (const auto &table : result.table_results) {
    std::cout << "  " << std::left << std::setw(8)
              << tableStatusToString(table.status) << table.spec.source_table
              << " -> " << table.spec.destination_table << ": "
              << StringUtils::formatNumber(table.rows_written) << " rows, "
              << TimeUtils::formatDuration(table.durationSeconds());
    if (table.error)
      std::cout << " [" << table.error->name << ": " << table.error->message
                << "]";
    std::cout << "\n";
  }
  std::cout << "Status: " << overallStatusToString(result.overall_status)
            << " | Tables: " << result.countWithStatus(TableStatus::SUCCESS)
            << " ok, " << result.countWithStatus(TableStatus::FAILED)
            << " failed, " << result.countWithStatus(TableStatus::SKIPPED)
            << " skipped | Rows: "
            << StringUtils::formatNumber(result.totalRowsWritten())
            << " | Time: "
            << TimeUtils::formatDuration(result.duration.count() / 1000.0)
            << "\n";
}

int exitCodeFor(OverallStatus status) {
  switch (status) {
  case OverallStatus::SUCCESS:
    return EXIT_SUCCESS_CODE;
  case OverallStatus::SUCCESS_WITH_WARNINGS:
    return EXIT_WARNINGS;
  case OverallStatus::CANCELLED:
    return EXIT_CANCELLED;
  case OverallStatus::FAILED:
  default:
    return EXIT_FAILED;
  }
}
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  MigrationConfig config;
  try {
    cmd = parseArguments(argc, argv);
    if (cmd.help) {
      printUsage(argv[0]);
      return EXIT_SUCCESS_CODE;
    }
    config = MigrationConfig::loadFromFile(cmd.configPath);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    printUsage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  if (cmd.listTasks) {
    return listTasks(config, cmd.listLimit);
  }

  Logger::initialize(config.logging);

  if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
      std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register signal handlers" << std::endl;
    Logger::shutdown();
    return EXIT_INIT_ERROR;
  }

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    std::cerr << "Error: Failed to initialize libcurl" << std::endl;
    Logger::shutdown();
    return EXIT_INIT_ERROR;
  }

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    Logger::info(LogCategory::SYSTEM, "main",
                 "Starting task '" + config.task.task_name + "' with " +
                     std::to_string(config.tables.size()) + " tables (" +
                     config.source.database + " -> " +
                     config.destination.database + ")");
    Logger::debug(LogCategory::CONFIG, "main",
                  "Configuration: " + config.toSnapshotJson());

    MariaDBEngine source(config.source, config.performance);
    ClickHouseEngine destination(config.destination, config.performance);
    TaskRunner runner(config, source, destination);

    if (config.history.enabled) {
      auto repository = std::make_shared<TaskHistoryRepository>(
          config.history.connection_string);
      runner.addListener(std::make_shared<TaskHistoryRecorder>(
          repository, config.toSnapshotJson()));
    }
    if (config.notification.enabled) {
      runner.addListener(
          std::make_shared<WebhookNotifier>(config.notification));
    }

    TaskResult result =
        runner.run([]() { return g_shutdownRequested.load(); });

    printSummary(result);
    exitCode = exitCodeFor(result.overall_status);
    Logger::info(LogCategory::SYSTEM, "main",
                 "Task finished with status " +
                     overallStatusToString(result.overall_status));
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Critical error: " + std::string(e.what()));
    std::cerr << "Critical error: " << e.what() << std::endl;
    exitCode = EXIT_CRITICAL_ERROR;
  }

  curl_global_cleanup();
  Logger::shutdown();
  return exitCode;
}
