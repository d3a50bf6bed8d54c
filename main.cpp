#include "dnn_text_engine.h"
#include "extraction_config.h"
#include "extraction_error.h"
#include "message_proxy.h"
#include "recognition_worker.h"
#include "subtitle_extractor.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <thread>

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitTimeout = 3;
constexpr int kExitCancelled = 130;

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) { g_interrupted = 1; }

void usage(const char *program_name) {
  std::cerr << "Usage: " << program_name
            << " <task_id> <video_file> [roi_mode]\n"
            << "       " << program_name
            << " --preview <video_file> <time_ms> <output_image>\n"
            << "  - task_id: number\n"
            << "  - video_file: path to the video\n"
            << "  - roi_mode: auto | fixed_bottom | bottom_30 | manual "
               "(default from SUBEX_ROI_MODE or auto)\n";
}

std::string formatTimestamp(long long ms) {
  long long hours = ms / 3600000;
  ms %= 3600000;
  long long minutes = ms / 60000;
  ms %= 60000;
  long long seconds = ms / 1000;
  long long millis = ms % 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld,%03lld", hours,
                minutes, seconds, millis);
  return buf;
}

void printProgress(const ProgressEvent &event) {
  std::cout << "\r[Progress] " << event.percentage << "% " << event.message;
  if (event.eta_seconds) {
    std::cout << " (ETA " << static_cast<int>(*event.eta_seconds) << "s)";
  }
  std::cout << "        " << std::flush;
}

// 导出指定时间点的字幕区域截图
int runPreview(int argc, char *argv[]) {
  if (argc != 5) {
    usage(argv[0]);
    return kExitUsage;
  }
  const std::string video_file = argv[2];
  long long time_ms = 0;
  try {
    time_ms = std::stoll(argv[3]);
  } catch (const std::exception &) {
    std::cerr << "[Error] time_ms must be a number: " << argv[3] << std::endl;
    return kExitUsage;
  }
  const std::string output = argv[4];

  loadEnvFile();
  ExtractionConfig config = ExtractionConfig::fromEnvironment();
  EngineFactory no_engine = []() -> std::unique_ptr<RecognitionEngine> {
    return nullptr;
  };
  SubtitleExtractor extractor(0, config, no_engine);
  try {
    VideoFrame frame = extractor.previewFrame(video_file, time_ms, true);
    if (frame.image.empty() || !cv::imwrite(output, frame.image)) {
      std::cerr << "[Error] Failed to write preview: " << output << std::endl;
      return kExitFatal;
    }
    std::cout << "[INFO] Preview at " << formatTimestamp(frame.timestamp_ms)
              << " written to " << output << std::endl;
  } catch (const ExtractionError &e) {
    std::cerr << "[Error] " << errorKindName(e.kind()) << ": " << e.what()
              << std::endl;
    return kExitFatal;
  } catch (const cv::Exception &e) {
    std::cerr << "[Error] " << e.what() << std::endl;
    return kExitFatal;
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  // 隔离识别的子进程入口, 环境变量由父进程继承
  if (argc == 2 && std::string(argv[1]) == kRecognizeWorkerFlag) {
    return serveRecognitionRequest([]() -> std::unique_ptr<RecognitionEngine> {
      return std::make_unique<DnnTextEngine>();
    });
  }
  if (argc > 1 && std::string(argv[1]) == "--preview") {
    return runPreview(argc, argv);
  }
  if (argc < 3 || argc > 4) {
    usage(argv[0]);
    return kExitUsage;
  }

  int task_id = 0;
  try {
    task_id = std::stoi(argv[1]);
  } catch (const std::exception &) {
    std::cerr << "[Error] task_id must be a number: " << argv[1] << std::endl;
    usage(argv[0]);
    return kExitUsage;
  }
  const std::string video_file = argv[2];

  loadEnvFile();
  ExtractionConfig config = ExtractionConfig::fromEnvironment();
  if (argc == 4) {
    config.roi_mode = argv[3];
  }

  std::unique_ptr<MessageProxy> proxy;
  if (std::getenv("RABBITMQ_HOST")) {
    try {
      proxy = std::make_unique<MessageProxy>();
    } catch (const std::exception &e) {
      std::cerr << "[Error] RabbitMQ connection failed: " << e.what()
                << std::endl;
      return kExitFatal;
    }
  }

  ProgressCallback on_progress = [&proxy](const ProgressEvent &event) {
    if (proxy) {
      proxy->sendProgress(event);
    } else {
      printProgress(event);
    }
  };

  EngineFactory factory = []() -> std::unique_ptr<RecognitionEngine> {
    return std::make_unique<DnnTextEngine>();
  };

  SubtitleExtractor extractor(task_id, config, factory, on_progress);

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);
  std::atomic<bool> finished{false};
  std::thread watcher([&extractor, &finished]() {
    while (!finished.load()) {
      if (g_interrupted) {
        extractor.cancel();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  int exit_code = 0;
  std::vector<SubtitleCue> cues;
  try {
    cues = extractor.extract(video_file);
  } catch (const ExtractionCancelled &e) {
    std::cout << std::endl << "[INFO] " << e.what() << std::endl;
    exit_code = kExitCancelled;
  } catch (const ExtractionError &e) {
    std::cerr << std::endl
              << "[Error] " << errorKindName(e.kind()) << ": " << e.what()
              << std::endl;
    exit_code = e.kind() == ErrorKind::Timeout ? kExitTimeout : kExitFatal;
    if (proxy) {
      try {
        proxy->sendFailure(task_id, errorKindName(e.kind()), e.what());
      } catch (const std::exception &send_error) {
        std::cerr << "[Error] Failed to publish failure: " << send_error.what()
                  << std::endl;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << std::endl << "[Error] " << e.what() << std::endl;
    exit_code = kExitFatal;
  }

  finished.store(true);
  watcher.join();
  if (exit_code != 0)
    return exit_code;

  std::cout << std::endl;
  DetectionInfo info = extractor.detectionInfo();
  if (proxy) {
    try {
      for (const auto &cue : cues)
        proxy->sendCue(task_id, cue);
      proxy->sendSummary(task_id, info);
    } catch (const std::exception &e) {
      std::cerr << "[Error] Failed to publish results: " << e.what()
                << std::endl;
      return kExitFatal;
    }
  }

  for (const auto &cue : cues) {
    std::cout << cue.index << "  " << formatTimestamp(cue.start_ms) << " --> "
              << formatTimestamp(cue.end_ms) << "  ";
    for (char c : cue.text)
      std::cout << (c == '\n' ? '|' : c);
    std::cout << std::endl;
  }

  std::cout << "-------------------" << std::endl
            << "Video: " << info.video.width << "x" << info.video.height
            << " @ " << info.video.fps << " fps, " << info.video.duration_sec
            << "s" << std::endl
            << "ROI mode: " << info.roi_mode << std::endl
            << "Engine: " << info.engine.name << " (inits "
            << info.engine.initializations << ")" << std::endl
            << "Frames sampled: " << info.frames_sampled << std::endl
            << "Frames with text: " << info.frames_with_text << std::endl
            << "Frames failed: " << info.frames_failed << std::endl
            << "Frames timed out: " << info.frames_timed_out << std::endl
            << "Cues: " << info.cues << std::endl;
  return 0;
}
