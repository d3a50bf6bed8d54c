#include "recognition_worker.h"
#include "recognition_codec.h"
#include "text_recognizer.h"
#include <cerrno>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

namespace {

bool readAll(int fd, std::string &out) {
  char chunk[65536];
  while (true) {
    ssize_t n = ::read(fd, chunk, sizeof(chunk));
    if (n > 0) {
      out.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      return true;
    } else if (errno != EINTR) {
      return false;
    }
  }
}

bool writeAll(int fd, const std::string &data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

} // namespace

int serveRecognitionRequest(const EngineFactory &factory) {
  // 结果通道独占原 stdout, 其余输出一律转到 stderr
  std::cout.flush();
  int result_fd = ::dup(STDOUT_FILENO);
  if (result_fd < 0 || ::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
    std::cerr << "[Worker] Could not redirect stdout" << std::endl;
    return kWorkerBadRequest;
  }

  std::string payload;
  if (!readAll(STDIN_FILENO, payload)) {
    std::cerr << "[Worker] Failed to read request" << std::endl;
    ::close(result_fd);
    return kWorkerBadRequest;
  }

  RecognitionRequest request;
  try {
    request = decodeRecognitionRequest(payload);
  } catch (const std::exception &e) {
    std::cerr << "[Worker] Bad request: " << e.what() << std::endl;
    ::close(result_fd);
    return kWorkerBadRequest;
  }
  payload.clear();

  std::unique_ptr<RecognitionEngine> engine;
  try {
    engine = factory();
  } catch (const std::exception &e) {
    std::cerr << "[Worker] Engine init failed: " << e.what() << std::endl;
    ::close(result_fd);
    return kWorkerEngineInit;
  }
  if (!engine) {
    std::cerr << "[Worker] Engine factory returned nothing" << std::endl;
    ::close(result_fd);
    return kWorkerEngineInit;
  }

  std::string encoded;
  try {
    encoded = encodeRecognitionResults(TextRecognizer::parseOutput(
        engine->recognize(request.image), request.scale,
        request.confidence_threshold));
  } catch (const std::exception &e) {
    std::cerr << "[Worker] Recognition failed: " << e.what() << std::endl;
    ::close(result_fd);
    return kWorkerEngineFailed;
  }

  bool sent = writeAll(result_fd, encoded);
  ::close(result_fd);
  if (!sent) {
    std::cerr << "[Worker] Failed to write results" << std::endl;
    return kWorkerEngineFailed;
  }
  return kWorkerOk;
}
