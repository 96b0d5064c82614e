//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Log.hpp"
#include <stdarg.h>
#include <atomic>
#include <mutex>
#include "SpinLock.hpp"

#ifndef HYPERENCLAVE_LOG_LEVEL
#define HYPERENCLAVE_LOG_LEVEL 2
#endif

namespace HyperEnclave {

static FILE* logSink = NULL;
/* read on every log call from every core */
static std::atomic<int> logThreshold(HYPERENCLAVE_LOG_LEVEL);
static SpinLock logLock;

void
setLogSink(FILE* sink) {
  std::lock_guard<SpinLock> guard(logLock);
  logSink = sink;
}

void
setLogLevel(LogLevel level) {
  logThreshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel
getLogLevel() {
  return static_cast<LogLevel>(
      logThreshold.load(std::memory_order_relaxed));
}

void
logWrite(LogLevel level, const char* fmt, ...) {
  if (static_cast<int>(level) >
      logThreshold.load(std::memory_order_relaxed))
    return;

  va_list args;
  va_start(args, fmt);
  {
    std::lock_guard<SpinLock> guard(logLock);
    FILE* out = logSink ? logSink : stderr;
    vfprintf(out, fmt, args);
    fflush(out);
  }
  va_end(args);
}

}  // namespace HyperEnclave
