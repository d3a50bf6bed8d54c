#include "extraction_config.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

int envInt(const char *key, int fallback) {
  const char *value = std::getenv(key);
  if (!value)
    return fallback;
  try {
    return std::stoi(value);
  } catch (const std::invalid_argument &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is not an integer, using default " << fallback
              << std::endl;
  } catch (const std::out_of_range &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is out of range, using default " << fallback
              << std::endl;
  }
  return fallback;
}

long long envLong(const char *key, long long fallback) {
  const char *value = std::getenv(key);
  if (!value)
    return fallback;
  try {
    return std::stoll(value);
  } catch (const std::invalid_argument &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is not an integer, using default " << fallback
              << std::endl;
  } catch (const std::out_of_range &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is out of range, using default " << fallback
              << std::endl;
  }
  return fallback;
}

double envDouble(const char *key, double fallback) {
  const char *value = std::getenv(key);
  if (!value)
    return fallback;
  try {
    return std::stod(value);
  } catch (const std::invalid_argument &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is not a number, using default " << fallback
              << std::endl;
  } catch (const std::out_of_range &) {
    std::cerr << "[WARN] " << key << " (" << value
              << ") is out of range, using default " << fallback
              << std::endl;
  }
  return fallback;
}

bool envBool(const char *key, bool fallback) {
  const char *value = std::getenv(key);
  if (!value)
    return fallback;
  std::string v(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  std::cerr << "[WARN] " << key << " (" << v
            << ") is not a boolean, using default " << fallback << std::endl;
  return fallback;
}

} // namespace

bool defaultIsolateEngineCalls() {
#ifdef __APPLE__
  return true;
#else
  return false;
#endif
}

std::optional<cv::Rect> parseRect(const std::string &text) {
  std::istringstream in(text);
  std::string part;
  std::vector<int> values;
  while (std::getline(in, part, ',')) {
    try {
      size_t used = 0;
      int v = std::stoi(part, &used);
      values.push_back(v);
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  if (values.size() != 4)
    return std::nullopt;
  return cv::Rect(values[0], values[1], values[2], values[3]);
}

bool loadEnvFile() {
  std::vector<std::string> possiblePaths = {".env"};
  if (const char *home = std::getenv("HOME")) {
    possiblePaths.push_back(std::string(home) + "/.env");
  }
  std::ifstream envFile;
  for (const auto &path : possiblePaths) {
    envFile.open(path);
    if (envFile.is_open()) {
      std::string line;
      while (std::getline(envFile, line)) {
        if (line.empty() || line[0] == '#')
          continue;
        std::istringstream lineStream(line);
        std::string key, value;
        if (std::getline(lineStream, key, '=') &&
            std::getline(lineStream, value)) {
          if (!key.empty() && !value.empty()) {
            // 已存在的环境变量优先
            setenv(key.c_str(), value.c_str(), 0);
          }
        }
      }
      envFile.close();
      return true;
    }
    envFile.clear();
  }
  std::cerr << "[WARNING] .env file not found in current or user directory."
            << std::endl;
  return false;
}

ExtractionConfig ExtractionConfig::fromEnvironment() {
  ExtractionConfig config;
  config.sample_fps = envDouble("SUBEX_SAMPLE_FPS", config.sample_fps);
  if (const char *mode = std::getenv("SUBEX_ROI_MODE")) {
    config.roi_mode = mode;
  }
  if (const char *rect = std::getenv("SUBEX_ROI_RECT")) {
    config.roi_rect = parseRect(rect);
    if (!config.roi_rect) {
      std::cerr << "[WARN] SUBEX_ROI_RECT (" << rect
                << ") is not x,y,w,h, ignoring" << std::endl;
    }
  }
  config.bottom_ratio = envDouble("SUBEX_BOTTOM_RATIO", config.bottom_ratio);
  config.confidence_threshold = static_cast<float>(
      envDouble("SUBEX_CONFIDENCE", config.confidence_threshold));
  config.similarity_threshold = static_cast<float>(
      envDouble("SUBEX_SIMILARITY", config.similarity_threshold));
  config.min_duration_sec =
      envDouble("SUBEX_MIN_DURATION_SEC", config.min_duration_sec);
  config.max_gap_sec = envDouble("SUBEX_MAX_GAP_SEC", config.max_gap_sec);
  config.max_pixels = envLong("SUBEX_MAX_PIXELS", config.max_pixels);
  config.max_side = envInt("SUBEX_MAX_SIDE", config.max_side);
  config.batch_size = envInt("SUBEX_BATCH_SIZE", config.batch_size);
  config.engine_timeout_ms =
      envInt("SUBEX_ENGINE_TIMEOUT_MS", config.engine_timeout_ms);
  config.isolate_engine_calls =
      envBool("SUBEX_ISOLATE_ENGINE", config.isolate_engine_calls);
  if (const char *worker = std::getenv("SUBEX_ENGINE_WORKER")) {
    config.engine_worker = worker;
  }
  config.max_workers = envInt("SUBEX_MAX_WORKERS", config.max_workers);
  config.dedup_window_ms =
      envLong("SUBEX_DEDUP_WINDOW_MS", config.dedup_window_ms);
  config.run_qc = envBool("SUBEX_RUN_QC", config.run_qc);
  return config;
}

std::vector<std::string> ExtractionConfig::validate() const {
  std::vector<std::string> problems;
  if (!(sample_fps > 0.0))
    problems.push_back("sample_fps must be positive");
  if (roi_mode != "auto" && roi_mode != "fixed_bottom" &&
      roi_mode != "bottom_30" && roi_mode != "manual")
    problems.push_back("unknown roi_mode: " + roi_mode);
  if (roi_mode == "manual" && !roi_rect)
    problems.push_back("roi_mode manual requires roi_rect");
  if (!(bottom_ratio > 0.0 && bottom_ratio <= 1.0))
    problems.push_back("bottom_ratio must be in (0, 1]");
  if (confidence_threshold < 0.0f || confidence_threshold > 1.0f)
    problems.push_back("confidence_threshold must be in [0, 1]");
  if (similarity_threshold < 0.0f || similarity_threshold > 1.0f)
    problems.push_back("similarity_threshold must be in [0, 1]");
  if (!(min_duration_sec > 0.0))
    problems.push_back("min_duration_sec must be positive");
  if (max_gap_sec < 0.0)
    problems.push_back("max_gap_sec must not be negative");
  if (max_pixels <= 0 || max_side <= 0)
    problems.push_back("image size ceilings must be positive");
  if (batch_size <= 0)
    problems.push_back("batch_size must be positive");
  if (engine_timeout_ms <= 0)
    problems.push_back("engine_timeout_ms must be positive");
  if (max_workers <= 0)
    problems.push_back("max_workers must be positive");
  if (dedup_window_ms < 0)
    problems.push_back("dedup_window_ms must not be negative");
  if (grouping_gap_factor <= 0)
    problems.push_back("grouping_gap_factor must be positive");
  return problems;
}
