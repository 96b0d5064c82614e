//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdio.h>

namespace HyperEnclave {

enum class LogLevel {
  Error = 0,
  Warn  = 1,
  Info  = 2,
  Debug = 3,
};

/* The console driver is outside the hypervisor core; whatever FILE it
 * exposes becomes the sink. Passing NULL restores stderr. */
void
setLogSink(FILE* sink);

void
setLogLevel(LogLevel level);

LogLevel
getLogLevel();

void
logWrite(LogLevel level, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

}  // namespace HyperEnclave
