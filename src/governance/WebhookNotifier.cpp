#include "governance/WebhookNotifier.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <curl/curl.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
std::string localTimeText(std::chrono::system_clock::time_point point) {
  auto time_t = std::chrono::system_clock::to_time_t(point);
  struct tm tm_buf;
  localtime_r(&time_t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string nowText() {
  return localTimeText(std::chrono::system_clock::now());
}

uint64_t averageSpeed(uint64_t rows, double seconds) {
  return seconds > 0 ? static_cast<uint64_t>(rows / seconds) : 0;
}
} // namespace

WebhookType stringToWebhookType(const std::string &str) {
  if (StringUtils::toUpper(str) == "HTTP")
    return WebhookType::HTTP;
  return WebhookType::FEISHU;
}

static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                            void *userp) {
  ((std::string *)userp)->append((char *)contents, size * nmemb);
  return size * nmemb;
}

WebhookNotifier::WebhookNotifier(const NotificationConfig &config)
    : config_(config), type_(stringToWebhookType(config.webhook_type)),
      enabled_(config.enabled) {
  if (enabled_ && config_.webhook_url.empty()) {
    Logger::warning(LogCategory::NOTIFY, "WebhookNotifier",
                    "Notifications enabled but webhook_url not configured, "
                    "disabling");
    enabled_ = false;
  } else if (enabled_) {
    Logger::info(LogCategory::NOTIFY, "WebhookNotifier",
                 "Webhook notifications enabled (" + config_.webhook_type +
                     ")");
  }
}

void WebhookNotifier::onTaskStarted(const TaskStartedEvent &event) {
  sourceDatabase_ = event.source_database;
  destinationDatabase_ = event.destination_database;
  if (!enabled_ || !config_.notify_on_start)
    return;
  send(buildStartPayload(event));
}

// A task that failed or was cancelled gets the failure card; a task that
// finished with some failed tables under continue_on_error still counts as
// a success and lists those tables as [FAIL] in the details.
void WebhookNotifier::onTaskCompleted(const TaskResult &result) {
  if (!enabled_)
    return;

  bool failed = result.overall_status == OverallStatus::FAILED ||
                result.overall_status == OverallStatus::CANCELLED;
  if (failed) {
    if (config_.notify_on_failure)
      send(buildFailurePayload(result));
  } else if (config_.notify_on_success) {
    send(buildSuccessPayload(result));
  }
}

json WebhookNotifier::markdownElement(const std::string &content) {
  return {{"tag", "div"}, {"text", {{"tag", "lark_md"}, {"content", content}}}};
}

json WebhookNotifier::mentionElement() const {
  if (config_.mention_all)
    return markdownElement("<at id=all></at>");
  if (config_.mention_users.empty())
    return nullptr;

  std::vector<std::string> mentions;
  for (const auto &user : config_.mention_users)
    mentions.push_back("<at id=" + user + "></at>");
  return markdownElement(StringUtils::join(mentions, " "));
}

json WebhookNotifier::buildCard(const std::string &title, const json &elements,
                                const std::string &color) const {
  json allElements = elements;
  json mention = mentionElement();
  if (!mention.is_null()) {
    allElements.push_back({{"tag", "hr"}});
    allElements.push_back(mention);
  }

  json card;
  card["msg_type"] = "interactive";
  card["card"]["config"]["wide_screen_mode"] = true;
  card["card"]["header"]["title"] = {{"tag", "plain_text"},
                                     {"content", title}};
  card["card"]["header"]["template"] = color;
  card["card"]["elements"] = allElements;
  return card;
}

json WebhookNotifier::buildHttpEvent(const std::string &event,
                                     const std::string &title,
                                     const std::string &message) const {
  json payload;
  payload["event_type"] = event;
  payload["title"] = title;
  payload["message"] = message;
  payload["environment"] = config_.env_name;
  payload["project"] = config_.project_name;
  payload["timestamp"] = std::time(nullptr);
  return payload;
}

json WebhookNotifier::buildStartPayload(const TaskStartedEvent &event) const {
  std::string title = "[START] " + config_.project_name;

  std::ostringstream header;
  header << "**Environment**: " << config_.env_name << "\n\n"
         << "**Time**: " << localTimeText(event.started_at) << "\n\n"
         << "**Source DB**: " << event.source_database << "\n\n"
         << "**Target DB**: " << event.destination_database << "\n\n"
         << "**Tables Count**: " << event.tables.size();

  std::vector<std::string> tableList;
  for (size_t i = 0; i < event.tables.size(); ++i) {
    const auto &table = event.tables[i];
    tableList.push_back(std::to_string(i + 1) + ". **" + table.source_table +
                        "** -> **" + table.destination_table +
                        "** (batch: " + std::to_string(table.batch_size) + ")");
  }

  if (type_ == WebhookType::HTTP) {
    json payload = buildHttpEvent("TASK_STARTED", title, header.str());
    payload["task_name"] = event.task_name;
    payload["source_database"] = event.source_database;
    payload["destination_database"] = event.destination_database;
    payload["tables"] = json::array();
    for (const auto &table : event.tables) {
      payload["tables"].push_back({{"source_table", table.source_table},
                                   {"destination_table",
                                    table.destination_table},
                                   {"batch_size", table.batch_size}});
    }
    return payload;
  }

  json elements = json::array();
  elements.push_back(markdownElement(header.str()));
  elements.push_back({{"tag", "hr"}});
  elements.push_back(markdownElement("**Table List**:\n\n" +
                                     StringUtils::join(tableList, "\n\n")));
  return buildCard(title, elements, "blue");
}

json WebhookNotifier::buildSuccessPayload(const TaskResult &result) const {
  std::string title = "[SUCCESS] " + config_.project_name;
  double totalSeconds = result.duration.count() / 1000.0;
  uint64_t totalRows = result.totalRowsWritten();
  size_t success = result.countWithStatus(TableStatus::SUCCESS);

  std::ostringstream summary;
  summary << "**Environment**: " << config_.env_name << "\n\n"
          << "**Complete Time**: " << nowText() << "\n\n"
          << "**Success Tables**: " << success << "/"
          << result.table_results.size() << "\n\n"
          << "**Total Rows**: " << StringUtils::formatNumber(totalRows)
          << "\n\n"
          << "**Total Time**: " << TimeUtils::formatDuration(totalSeconds)
          << "\n\n"
          << "**Avg Speed**: "
          << StringUtils::formatNumber(averageSpeed(totalRows, totalSeconds))
          << " rows/s";

  std::vector<std::string> details;
  for (const auto &table : result.table_results) {
    std::string icon;
    switch (table.status) {
    case TableStatus::SUCCESS:
      icon = "[OK]";
      break;
    case TableStatus::FAILED:
      icon = "[FAIL]";
      break;
    default:
      icon = "[SKIP]";
      break;
    }
    details.push_back(
        icon + " **" + table.spec.source_table +
        "**: " + StringUtils::formatNumber(table.rows_written) + " rows, " +
        TimeUtils::formatDuration(table.durationSeconds()) + ", " +
        StringUtils::formatNumber(
            averageSpeed(table.rows_written, table.durationSeconds())) +
        " rows/s");
  }

  if (type_ == WebhookType::HTTP) {
    json payload = buildHttpEvent("TASK_SUCCEEDED", title, summary.str());
    payload["task_name"] = result.task_name;
    payload["status"] = overallStatusToString(result.overall_status);
    payload["total_tables"] = result.table_results.size();
    payload["success_tables"] = success;
    payload["total_rows"] = totalRows;
    payload["total_time"] = totalSeconds;
    payload["details"] = details;
    return payload;
  }

  json elements = json::array();
  elements.push_back(markdownElement(summary.str()));
  if (!details.empty()) {
    elements.push_back({{"tag", "hr"}});
    elements.push_back(markdownElement("**Migration Details**:\n\n" +
                                       StringUtils::join(details, "\n\n")));
  }
  return buildCard(title, elements, "green");
}

json WebhookNotifier::buildFailurePayload(const TaskResult &result) const {
  std::string title = "[FAILURE] " + config_.project_name;

  std::string failedTable = "N/A";
  std::string errorMessage = "Unknown error";
  if (result.task_error) {
    errorMessage = *result.task_error;
  } else if (const TableResult *failed = result.firstFailure()) {
    failedTable = failed->spec.source_table;
    errorMessage = failed->error ? failed->error->name + ": " +
                                       failed->error->message
                                 : "Table failed";
  } else if (result.overall_status == OverallStatus::CANCELLED) {
    errorMessage = "Task cancelled";
  }

  size_t completed = result.countWithStatus(TableStatus::SUCCESS);
  std::ostringstream body;
  body << "**Environment**: " << config_.env_name << "\n\n"
       << "**Failed Time**: " << nowText() << "\n\n"
       << "**Failed Table**: " << failedTable << "\n\n"
       << "**Progress**: " << completed << "/" << result.table_results.size()
       << " tables completed";

  if (type_ == WebhookType::HTTP) {
    json payload = buildHttpEvent("TASK_FAILED", title, body.str());
    payload["task_name"] = result.task_name;
    payload["status"] = overallStatusToString(result.overall_status);
    payload["failed_table"] = failedTable;
    payload["error_message"] = errorMessage;
    payload["completed_tables"] = completed;
    payload["total_tables"] = result.table_results.size();
    return payload;
  }

  json elements = json::array();
  elements.push_back(markdownElement(body.str()));
  elements.push_back({{"tag", "hr"}});
  elements.push_back(
      markdownElement("**Error Message**:\n\n```\n" + errorMessage + "\n```"));
  return buildCard(title, elements, "red");
}

bool WebhookNotifier::isDeliveryAccepted(WebhookType type, long httpCode,
                                         const std::string &responseBody) {
  if (httpCode < 200 || httpCode >= 300)
    return false;
  if (type == WebhookType::HTTP)
    return true;

  json response = json::parse(responseBody, nullptr, false);
  if (response.is_discarded() || !response.is_object())
    return false;
  auto code = response.find("code");
  if (code == response.end()) {
    // Older Feishu endpoints answer {"StatusCode":0}.
    code = response.find("StatusCode");
  }
  return code != response.end() && code->is_number_integer() &&
         code->get<int>() == 0;
}

bool WebhookNotifier::send(const json &payload) {
  if (!enabled_)
    return false;

  CURL *curl = curl_easy_init();
  if (!curl) {
    Logger::error(LogCategory::NOTIFY, "WebhookNotifier",
                  "Failed to initialize CURL for webhook");
    return false;
  }

  std::string responseBody;
  struct curl_slist *headerList = nullptr;
  headerList = curl_slist_append(headerList, "Content-Type: application/json");

  std::string payloadStr = payload.dump();

  curl_easy_setopt(curl, CURLOPT_URL, config_.webhook_url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payloadStr.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, payloadStr.length());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(config_.timeout_seconds));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode res = curl_easy_perform(curl);
  long httpCode = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

  curl_slist_free_all(headerList);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    Logger::error(LogCategory::NOTIFY, "WebhookNotifier",
                  "Webhook failed: " + std::string(curl_easy_strerror(res)));
    return false;
  }

  if (isDeliveryAccepted(type_, httpCode, responseBody)) {
    Logger::info(LogCategory::NOTIFY, "WebhookNotifier",
                 "Notification sent successfully");
    return true;
  }

  Logger::warning(LogCategory::NOTIFY, "WebhookNotifier",
                  "Webhook rejected notification (HTTP " +
                      std::to_string(httpCode) + "): " + responseBody);
  return false;
}
