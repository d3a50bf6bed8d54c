#pragma once
#include "models.hpp"
#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <memory>
#include <string>

// 消息类型
constexpr int kMessageTypeCue = 10;
constexpr int kMessageTypeProgress = 20;
constexpr int kMessageTypeFailure = 40;

// Publishes extraction events to RabbitMQ. Connection settings come from
// RABBITMQ_* environment variables.
class MessageProxy {
public:
  MessageProxy();

  void sendProgress(const ProgressEvent &event);
  void sendCue(int task_id, const SubtitleCue &cue);
  void sendSummary(int task_id, const DetectionInfo &info);
  void sendFailure(int task_id, const std::string &kind,
                   const std::string &message);

  static std::string progressJson(const ProgressEvent &event);
  static std::string cueJson(int task_id, const SubtitleCue &cue);
  static std::string summaryJson(int task_id, const DetectionInfo &info);
  static std::string failureJson(int task_id, const std::string &kind,
                                 const std::string &message);
  static std::string escapeJson(const std::string &text);

private:
  std::string host_;
  int port_;
  std::string user_;
  std::string password_;
  std::string vhost_;
  std::string exchange_;
  std::string result_queue_;
  std::string notify_queue_;

  AmqpClient::Channel::ptr_t channel_;
  void sendNotificationMessage(const std::string &message);
  void sendResultMessage(const std::string &message);
};
