#pragma once
#include <chrono>
#include <string>
#include <vector>

enum class IsolatedStatus { Completed, TimedOut, Crashed };

struct IsolatedOutcome {
  IsolatedStatus status = IsolatedStatus::Crashed;
  std::string payload; // bytes written by the child, valid when Completed
  std::string detail;
};

// Program plus arguments (argv[1..]) of a worker process.
struct IsolatedCommand {
  std::string program;
  std::vector<std::string> args;
};

// Starts command as a fresh process (posix_spawn, no bare fork), writes input
// to its stdin and returns what it printed on stdout. The child is killed
// with SIGKILL once timeout elapses. Threads cannot be aborted safely while
// they are inside native engine code; a process can.
IsolatedOutcome runIsolated(const IsolatedCommand &command,
                            const std::string &input,
                            std::chrono::milliseconds timeout);

// Absolute path of the running executable, empty when it cannot be resolved.
std::string currentExecutablePath();
