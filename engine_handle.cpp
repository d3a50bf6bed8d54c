#include "engine_handle.h"
#include "extraction_error.h"
#include <iostream>

EngineHandle::EngineHandle(EngineFactory factory)
    : factory_(std::move(factory)) {}

RecognitionEngine &EngineHandle::engineLocked() {
  if (valid_ && engine_)
    return *engine_;

  engine_.reset();
  std::unique_ptr<RecognitionEngine> fresh;
  try {
    fresh = factory_();
  } catch (const ExtractionError &) {
    throw;
  } catch (const std::exception &e) {
    throw ExtractionError(ErrorKind::EngineInit,
                          std::string("Recognition engine init failed: ") +
                              e.what());
  }
  if (!fresh) {
    throw ExtractionError(ErrorKind::EngineInit,
                          "Recognition engine factory returned nothing");
  }
  engine_ = std::move(fresh);
  valid_ = true;
  initializations_++;
  name_ = engine_->name();
  if (initializations_ > 1) {
    std::cout << "[OCR] Engine re-initialized: " << name_ << " (#"
              << initializations_ << ")" << std::endl;
  } else {
    std::cout << "[OCR] Engine initialized: " << name_ << std::endl;
  }
  return *engine_;
}

void EngineHandle::acquire() {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  engineLocked();
}

EngineOutput EngineHandle::recognize(const cv::Mat &image) {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  return engineLocked().recognize(image);
}

IsolatedOutcome
EngineHandle::recognizeIsolated(const IsolatedCommand &command,
                                const std::string &request,
                                std::chrono::milliseconds timeout) {
  std::string name;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    name = engineLocked().name();
  }

  // 子进程自带引擎实例, 不持锁以便并发
  IsolatedOutcome outcome = runIsolated(command, request, timeout);
  if (outcome.status == IsolatedStatus::TimedOut) {
    // 子进程被强制终止, 引擎状态不可信
    std::lock_guard<std::mutex> lock(engine_mutex_);
    std::cerr << "[OCR] Isolated call exceeded " << timeout.count()
              << "ms, engine handle invalidated: " << name << std::endl;
    valid_ = false;
    engine_.reset();
  }
  return outcome;
}

void EngineHandle::setIsolated(bool isolated) {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  isolated_ = isolated;
}

void EngineHandle::invalidate() {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  if (valid_) {
    std::cerr << "[OCR] Engine handle invalidated: " << name_ << std::endl;
  }
  valid_ = false;
  engine_.reset();
}

bool EngineHandle::valid() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  return valid_;
}

EngineIdentity EngineHandle::identity() const {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  EngineIdentity id;
  id.name = name_;
  id.initializations = initializations_;
  id.isolated = isolated_;
  return id;
}
