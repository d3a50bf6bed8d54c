#pragma once
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

// Platform default for running engine calls in a child process.
bool defaultIsolateEngineCalls();

// 提取任务配置. 默认值与桌面端一致, 可通过 .env / 环境变量覆盖.
struct ExtractionConfig {
  double sample_fps = 3.0;
  std::string roi_mode = "auto"; // auto | fixed_bottom | manual
  std::optional<cv::Rect> roi_rect;
  double bottom_ratio = 0.3;
  float confidence_threshold = 0.7f;
  float similarity_threshold = 0.90f;
  double min_duration_sec = 1.2;
  double max_gap_sec = 0.5;

  // Recognition adapter limits
  long long max_pixels = 1600LL * 1200LL;
  int max_side = 1920;
  int batch_size = 8;
  int engine_timeout_ms = 30000;
  bool isolate_engine_calls = defaultIsolateEngineCalls();
  // Worker executable for isolated calls; empty means this executable.
  std::string engine_worker;

  int max_workers = 4;
  long long dedup_window_ms = 30000;
  int grouping_gap_factor = 3;
  bool run_qc = false;

  long long minDurationMs() const {
    return static_cast<long long>(min_duration_sec * 1000.0);
  }
  long long maxGapMs() const {
    return static_cast<long long>(max_gap_sec * 1000.0);
  }

  // Problems that make the configuration unusable. Empty when valid.
  std::vector<std::string> validate() const;

  static ExtractionConfig fromEnvironment();
};

// Loads KEY=VALUE pairs from ./.env or $HOME/.env into the process
// environment. Returns false when no file was found.
bool loadEnvFile();

// Parses "x,y,w,h". Returns nullopt on malformed input.
std::optional<cv::Rect> parseRect(const std::string &text);
