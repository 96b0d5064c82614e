//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

namespace HyperEnclave {

/* The numeric value is what the guest finds in RAX after an emulated
 * enclave instruction or hypercall, so existing values must not move. */
enum class Error {
  Success = 0,
  Exhausted,
  OutOfMemory,
  InvalidRange,
  NotBuilding,
  AlreadyInitialized,
  NoIdleThread,
  NotInEnclave,
  IllegalFree,
  EnclaveBusy,
  InvalidState,
  InvalidParameter,
  InvalidMeasurement,
  SsaOverflow,
  NotFound,
  SecurityViolation,
  VcpuInitFailure,
  UnsupportedFeature,
  VmEntryFailure,
};

enum class ErrorKind {
  None,
  ResourceExhaustion,
  ProtocolViolation,
  HardwareFault,
  SecurityBreach,
};

ErrorKind
errorKind(Error err);

const char*
errorString(Error err);

}  // namespace HyperEnclave
