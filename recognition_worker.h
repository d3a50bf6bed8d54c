#pragma once
#include "engine_handle.h"

// Argument that switches an executable into recognition worker mode.
constexpr const char *kRecognizeWorkerFlag = "--recognize-worker";

// Exit codes of a worker process; anything but 0 is reported as Crashed.
constexpr int kWorkerOk = 0;
constexpr int kWorkerBadRequest = 2;
constexpr int kWorkerEngineFailed = 3;
constexpr int kWorkerEngineInit = 4;

// Body of an isolated recognition process: reads one RecognitionRequest from
// stdin, builds an engine from factory, writes the encoded results to stdout
// and returns the exit code. Log output of the engine goes to stderr so it
// cannot corrupt the result stream.
int serveRecognitionRequest(const EngineFactory &factory);
