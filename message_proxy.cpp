#include "message_proxy.h"
#include "progress_tracker.h"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string envOr(const char *key, const char *fallback) {
  const char *value = std::getenv(key);
  return value ? value : fallback;
}

} // namespace

MessageProxy::MessageProxy() {
  host_ = envOr("RABBITMQ_HOST", "localhost");
  port_ = 5672;
  if (const char *port = std::getenv("RABBITMQ_PORT")) {
    try {
      port_ = std::stoi(port);
    } catch (const std::invalid_argument &) {
      std::cerr << "[WARN] RABBITMQ_PORT (" << port
                << ") is not a number, using 5672" << std::endl;
    } catch (const std::out_of_range &) {
      std::cerr << "[WARN] RABBITMQ_PORT (" << port
                << ") out of range, using 5672" << std::endl;
    }
  }
  user_ = envOr("RABBITMQ_USER", "guest");
  password_ = envOr("RABBITMQ_PASS", "guest");
  vhost_ = envOr("RABBITMQ_VHOST", "/");
  exchange_ = envOr("RABBITMQ_EXCHANGE", "");
  result_queue_ = envOr("RABBITMQ_RESULT_QUEUE", "");
  notify_queue_ = envOr("RABBITMQ_NOTIFY_QUEUE", "");

  channel_ =
      AmqpClient::Channel::Create(host_, port_, user_, password_, vhost_);
  if (!exchange_.empty()) {
    channel_->DeclareExchange(exchange_,
                              AmqpClient::Channel::EXCHANGE_TYPE_DIRECT, false,
                              true, false);
  }
}

void MessageProxy::sendNotificationMessage(const std::string &message) {
  AmqpClient::BasicMessage::ptr_t msg =
      AmqpClient::BasicMessage::Create(message);
  channel_->BasicPublish(exchange_, notify_queue_, msg);
}

void MessageProxy::sendResultMessage(const std::string &message) {
  AmqpClient::BasicMessage::ptr_t msg =
      AmqpClient::BasicMessage::Create(message);
  channel_->BasicPublish(exchange_, result_queue_, msg);
}

std::string MessageProxy::escapeJson(const std::string &text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else {
        out += static_cast<char>(c);
      }
    }
  }
  return out;
}

std::string MessageProxy::progressJson(const ProgressEvent &event) {
  std::ostringstream oss;
  oss << "{"
      << "\"taskId\":\"" << event.taskId << "\","
      << "\"type\":\"" << kMessageTypeProgress << "\","
      << "\"phase\":\"" << phaseName(event.phase) << "\","
      << "\"percentage\":" << event.percentage << ","
      << "\"message\":\"" << escapeJson(event.message) << "\","
      << "\"eta\":";
  if (event.eta_seconds) {
    oss << *event.eta_seconds;
  } else {
    oss << "null";
  }
  oss << "}";
  return oss.str();
}

std::string MessageProxy::cueJson(int task_id, const SubtitleCue &cue) {
  std::ostringstream oss;
  oss << "{"
      << "\"taskId\":\"" << task_id << "\","
      << "\"type\":\"" << kMessageTypeCue << "\","
      << "\"index\":" << cue.index << ","
      << "\"start_ms\":" << cue.start_ms << ","
      << "\"end_ms\":" << cue.end_ms << ","
      << "\"text\":\"" << escapeJson(cue.text) << "\"";
  if (cue.bbox) {
    oss << ",\"bbox\":[" << cue.bbox->x << "," << cue.bbox->y << ","
        << cue.bbox->width << "," << cue.bbox->height << "]";
  }
  oss << "}";
  return oss.str();
}

std::string MessageProxy::summaryJson(int task_id, const DetectionInfo &info) {
  std::ostringstream oss;
  oss << "{"
      << "\"taskId\":\"" << task_id << "\","
      << "\"type\":\"" << kMessageTypeCue << "\","
      << "\"event\":\"summary\","
      << "\"cues\":" << info.cues << ","
      << "\"roi_mode\":\"" << escapeJson(info.roi_mode) << "\",";
  if (info.roi) {
    oss << "\"roi\":[" << info.roi->x << "," << info.roi->y << ","
        << info.roi->width << "," << info.roi->height << "],";
  }
  oss << "\"engine\":\"" << escapeJson(info.engine.name) << "\","
      << "\"engine_inits\":" << info.engine.initializations << ","
      << "\"frames_sampled\":" << info.frames_sampled << ","
      << "\"frames_with_text\":" << info.frames_with_text << ","
      << "\"frames_failed\":" << info.frames_failed << ","
      << "\"frames_timed_out\":" << info.frames_timed_out << "}";
  return oss.str();
}

std::string MessageProxy::failureJson(int task_id, const std::string &kind,
                                      const std::string &message) {
  std::ostringstream oss;
  oss << "{"
      << "\"taskId\":\"" << task_id << "\","
      << "\"type\":\"" << kMessageTypeFailure << "\","
      << "\"kind\":\"" << escapeJson(kind) << "\","
      << "\"message\":\"" << escapeJson(message) << "\"}";
  return oss.str();
}

void MessageProxy::sendProgress(const ProgressEvent &event) {
  sendNotificationMessage(progressJson(event));
}

void MessageProxy::sendCue(int task_id, const SubtitleCue &cue) {
  sendResultMessage(cueJson(task_id, cue));
}

void MessageProxy::sendSummary(int task_id, const DetectionInfo &info) {
  sendResultMessage(summaryJson(task_id, info));
}

void MessageProxy::sendFailure(int task_id, const std::string &kind,
                               const std::string &message) {
  sendNotificationMessage(failureJson(task_id, kind, message));
}
