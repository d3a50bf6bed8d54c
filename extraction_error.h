#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
  FileOpen,
  Decode,
  EngineInit,
  Config,
  Timeout,
};

inline const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileOpen:
    return "FileOpen";
  case ErrorKind::Decode:
    return "Decode";
  case ErrorKind::EngineInit:
    return "EngineInit";
  case ErrorKind::Config:
    return "ConfigError";
  case ErrorKind::Timeout:
    return "Timeout";
  }
  return "Unknown";
}

// Typed failure surfaced to callers of the extraction pipeline.
class ExtractionError : public std::runtime_error {
public:
  ExtractionError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Raised when a cooperative cancellation check fails. Not an error: the run
// ends in the Cancelled state and produces no cues.
class ExtractionCancelled : public std::runtime_error {
public:
  explicit ExtractionCancelled(const std::string &where)
      : std::runtime_error("extraction cancelled during " + where) {}
};
