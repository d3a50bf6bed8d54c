// Progress weighting, ETA, worker pool and result channel.
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "progress_tracker.h"
#include "result_channel.hpp"
#include "worker_pool.h"

namespace {

bool check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "[progress_unit] FAIL: " << msg << "\n";
  }
  return cond;
}

bool test_phase_weights() {
  int total = 0;
  for (auto phase : {ExtractionPhase::Init, ExtractionPhase::LocatingRoi,
                     ExtractionPhase::Sampling, ExtractionPhase::Recognizing,
                     ExtractionPhase::Grouping}) {
    total += ProgressTracker::phaseWeight(phase);
  }
  bool ok = check(total == 100, "weights sum to 100");
  ok &= check(ProgressTracker::overallPercentage(ExtractionPhase::Init, 0.0) == 0,
              "start at 0");
  ok &= check(ProgressTracker::overallPercentage(ExtractionPhase::Sampling,
                                                 1.0) == 30,
              "sampling done is 30%");
  ok &= check(ProgressTracker::overallPercentage(ExtractionPhase::Recognizing,
                                                 0.5) == 60,
              "half of recognition is 60%");
  ok &= check(ProgressTracker::overallPercentage(ExtractionPhase::Grouping,
                                                 3.0) == 100,
              "fraction clamped");
  ok &= check(ProgressTracker::overallPercentage(ExtractionPhase::Done, 0.0) ==
                  100,
              "done is 100%");
  ok &= check(std::string(phaseName(ExtractionPhase::Recognizing)) ==
                  "recognizing",
              "phase names");
  return ok;
}

bool test_eta() {
  bool ok = check(!ProgressTracker::estimateEta(10.0, 5), "no ETA up to 5%");
  ok &= check(!ProgressTracker::estimateEta(0.0, 50), "no ETA without time");
  auto eta = ProgressTracker::estimateEta(10.0, 50);
  ok &= check(eta && *eta > 9.99 && *eta < 10.01, "half way doubles elapsed");
  eta = ProgressTracker::estimateEta(30.0, 100);
  ok &= check(eta && *eta == 0.0, "finished has no remaining time");
  return ok;
}

bool test_reports_are_monotonic() {
  std::vector<ProgressEvent> events;
  ProgressTracker tracker(42, [&events](const ProgressEvent &event) {
    events.push_back(event);
  });
  tracker.start();
  tracker.report(ExtractionPhase::Recognizing, 0.5, "half");
  tracker.report(ExtractionPhase::Sampling, 0.0, "late sampling update");
  tracker.report(ExtractionPhase::Done, 1.0, "done");
  bool ok = check(events.size() == 3, "every report delivered");
  if (events.size() == 3) {
    ok &= check(events[0].taskId == 42 && events[0].type == 20,
                "task id and progress type");
    ok &= check(events[1].percentage == 60, "percentage never goes back");
    ok &= check(events[2].percentage == 100, "done reports 100");
    ok &= check(events[2].message == "done", "message carried");
  }
  ok &= check(tracker.percentage() == 100, "tracker remembers last value");
  return ok;
}

bool test_callback_failures_contained() {
  int calls = 0;
  ProgressTracker tracker(1, [&calls](const ProgressEvent &) {
    ++calls;
    throw std::runtime_error("listener gone");
  });
  tracker.report(ExtractionPhase::Init, 1.0, "first");
  tracker.report(ExtractionPhase::LocatingRoi, 1.0, "second");
  bool ok = check(calls == 2, "throwing callback does not stop reports");

  ProgressTracker silent(2, nullptr);
  silent.report(ExtractionPhase::Sampling, 0.5, "nobody listening");
  ok &= check(silent.percentage() == 22, "tracker works without a callback");
  return ok;
}

bool test_worker_pool() {
  bool ok = true;
  std::atomic<int> done{0};
  {
    WorkerPool pool(3);
    ok &= check(pool.size() == 3, "pool size");
    for (int i = 0; i < 20; ++i) {
      pool.submit([&done, i]() {
        if (i == 7)
          throw std::runtime_error("task failure");
        done++;
      });
    }
    pool.shutdown();
    pool.shutdown();
    ok &= check(done.load() == 19, "all other tasks ran after a failure");

    bool rejected = false;
    try {
      pool.submit([]() {});
    } catch (const std::logic_error &) {
      rejected = true;
    }
    ok &= check(rejected, "stopped pool rejects work");
  }

  bool threw = false;
  try {
    WorkerPool empty(0);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  ok &= check(threw, "zero threads rejected");

  std::atomic<bool> release{false};
  std::atomic<int> ran{0};
  WorkerPool single(1);
  single.submit([&release, &ran]() {
    while (!release.load())
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ran++;
  });
  for (int i = 0; i < 5; ++i)
    single.submit([&ran]() { ran++; });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  size_t dropped = single.discardPending();
  release.store(true);
  single.shutdown();
  ok &= check(dropped == 5, "queued tasks discarded");
  ok &= check(ran.load() == 1, "running task finishes");
  return ok;
}

bool test_result_channel() {
  ResultChannel<int> channel;
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&channel, p]() {
      for (int i = 0; i < 25; ++i)
        channel.push(p * 100 + i);
    });
  }
  int received = 0;
  int value = 0;
  while (received < 100 && channel.pop(value))
    ++received;
  for (auto &t : producers)
    t.join();
  bool ok = check(received == 100, "every value delivered once");

  channel.push(1);
  channel.close();
  channel.push(2);
  ok &= check(channel.size() == 1, "push after close ignored");
  ok &= check(channel.pop(value) && value == 1, "drains after close");
  ok &= check(!channel.pop(value), "closed and drained");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_phase_weights();
  ok &= test_eta();
  ok &= test_reports_are_monotonic();
  ok &= test_callback_failures_contained();
  ok &= test_worker_pool();
  ok &= test_result_channel();
  return ok ? 0 : 1;
}
