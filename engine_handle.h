#pragma once
#include "bounded_execution.h"
#include "models.hpp"
#include "recognition_engine.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

using EngineFactory = std::function<std::unique_ptr<RecognitionEngine>()>;

// Owns the recognition engine for one run. After a forced kill of an
// isolated call the engine state is untrusted: invalidate() drops it and the
// next acquire() builds a fresh one from the factory.
class EngineHandle {
public:
  explicit EngineHandle(EngineFactory factory);

  // Initializes the engine if the handle is invalid. Throws
  // ExtractionError{EngineInit} when the factory fails.
  void acquire();

  // Runs the engine on one prepared image. Calls are serialized.
  EngineOutput recognize(const cv::Mat &image);

  // Sends request to a freshly spawned worker process (command) bounded by
  // timeout. The local engine is acquired first so init failures surface in
  // this process. A timed-out worker leaves the handle invalidated.
  IsolatedOutcome recognizeIsolated(const IsolatedCommand &command,
                                    const std::string &request,
                                    std::chrono::milliseconds timeout);

  void invalidate();
  bool valid() const;

  EngineIdentity identity() const;
  void setIsolated(bool isolated);

private:
  RecognitionEngine &engineLocked();

  EngineFactory factory_;
  std::unique_ptr<RecognitionEngine> engine_;
  bool valid_ = false;
  bool isolated_ = false;
  int initializations_ = 0;
  std::string name_;
  mutable std::mutex engine_mutex_;
};
