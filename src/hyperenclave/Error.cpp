//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Error.hpp"

namespace HyperEnclave {

ErrorKind
errorKind(Error err) {
  switch (err) {
    case Error::Success:
      return ErrorKind::None;
    case Error::Exhausted:
    case Error::OutOfMemory:
      return ErrorKind::ResourceExhaustion;
    case Error::VcpuInitFailure:
    case Error::UnsupportedFeature:
    case Error::VmEntryFailure:
      return ErrorKind::HardwareFault;
    case Error::SecurityViolation:
      return ErrorKind::SecurityBreach;
    default:
      return ErrorKind::ProtocolViolation;
  }
}

const char*
errorString(Error err) {
  switch (err) {
    case Error::Success:
      return "Success";
    case Error::Exhausted:
      return "Exhausted";
    case Error::OutOfMemory:
      return "OutOfMemory";
    case Error::InvalidRange:
      return "InvalidRange";
    case Error::NotBuilding:
      return "NotBuilding";
    case Error::AlreadyInitialized:
      return "AlreadyInitialized";
    case Error::NoIdleThread:
      return "NoIdleThread";
    case Error::NotInEnclave:
      return "NotInEnclave";
    case Error::IllegalFree:
      return "IllegalFree";
    case Error::EnclaveBusy:
      return "EnclaveBusy";
    case Error::InvalidState:
      return "InvalidState";
    case Error::InvalidParameter:
      return "InvalidParameter";
    case Error::InvalidMeasurement:
      return "InvalidMeasurement";
    case Error::SsaOverflow:
      return "SsaOverflow";
    case Error::NotFound:
      return "NotFound";
    case Error::SecurityViolation:
      return "SecurityViolation";
    case Error::VcpuInitFailure:
      return "VcpuInitFailure";
    case Error::UnsupportedFeature:
      return "UnsupportedFeature";
    case Error::VmEntryFailure:
      return "VmEntryFailure";
  }
  return "Unknown";
}

}  // namespace HyperEnclave
