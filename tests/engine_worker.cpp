// Worker executable spawned by the isolation suites.
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

#include "fake_engine.hpp"
#include "recognition_worker.h"

namespace {

// Copies stdin to stdout.
int echo() {
  char chunk[65536];
  while (true) {
    ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (n == 0)
      return 0;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return 1;
    }
    ssize_t off = 0;
    while (off < n) {
      ssize_t w = ::write(STDOUT_FILENO, chunk + off, n - off);
      if (w < 0) {
        if (errno == EINTR)
          continue;
        return 1;
      }
      off += w;
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  const std::string mode = argc > 1 ? argv[1] : "";
  if (mode == kRecognizeWorkerFlag) {
    auto stats = std::make_shared<FakeEngineStats>();
    return serveRecognitionRequest(fakeFactory(isolationScript, stats));
  }
  if (mode == "--echo")
    return echo();
  if (mode == "--sleep") {
    std::this_thread::sleep_for(std::chrono::seconds(5));
    return 0;
  }
  if (mode == "--exit")
    return argc > 2 ? std::atoi(argv[2]) : 1;
  if (mode == "--abort")
    std::abort();
  return 64;
}
