#ifndef WEBHOOK_NOTIFIER_H
#define WEBHOOK_NOTIFIER_H

#include "core/migration_config.h"
#include "sync/MigrationListener.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

enum class WebhookType { FEISHU, HTTP };

WebhookType stringToWebhookType(const std::string &str);

// Posts task lifecycle notifications. Feishu webhooks receive interactive
// cards, plain HTTP webhooks receive a flat JSON event. Delivery failures are
// logged under NOTIFY and reported as false; nothing here throws into the
// task.
class WebhookNotifier : public IMigrationListener {
  NotificationConfig config_;
  WebhookType type_;
  bool enabled_;

  std::string sourceDatabase_;
  std::string destinationDatabase_;

public:
  explicit WebhookNotifier(const NotificationConfig &config);

  bool isEnabled() const { return enabled_; }

  void onTaskStarted(const TaskStartedEvent &event) override;
  void onTaskCompleted(const TaskResult &result) override;

  json buildStartPayload(const TaskStartedEvent &event) const;
  json buildSuccessPayload(const TaskResult &result) const;
  json buildFailurePayload(const TaskResult &result) const;

  bool send(const json &payload);

  // Feishu answers {"code":0} on success, HTTP webhooks any 2xx status.
  static bool isDeliveryAccepted(WebhookType type, long httpCode,
                                 const std::string &responseBody);

private:
  json buildCard(const std::string &title, const json &elements,
                 const std::string &color) const;
  json buildHttpEvent(const std::string &event, const std::string &title,
                      const std::string &message) const;
  json mentionElement() const;
  static json markdownElement(const std::string &content);
};

#endif
