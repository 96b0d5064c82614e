//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "VmxExit.hpp"
#include "HyperCall.hpp"
#include "common.hpp"

namespace HyperEnclave {

static ExitInfo
decodeInterruption(const VmxExitRecord& record, ExitReason reason) {
  ExitInfo info    = ExitInfo::make(reason);
  uint32_t intInfo = record.interruptionInfo;

  info.rawCode = record.exitReason;
  if (intInfo & VMX_INTR_INFO_VALID) {
    info.vector    = static_cast<uint8_t>(intInfo & VMX_INTR_INFO_VECTOR_MASK);
    info.hasVector = true;
  }
  if (intInfo & VMX_INTR_INFO_ERROR_CODE) {
    info.hasErrorCode = true;
    info.errorCode    = record.interruptionErrorCode;
  }
  if (reason == ExitReason::Exception && info.vector == Vector::PageFault)
    info.faultAddress = record.qualification;
  return info;
}

ExitInfo
vmxDecodeExit(const VmxExitRecord& record) {
  ExitInfo info;
  uint32_t basic = record.exitReason & 0xffff;

  switch (basic) {
    case VMX_EXIT_EXCEPTION_NMI: {
      uint32_t type = (record.interruptionInfo & VMX_INTR_INFO_TYPE_MASK) >>
                      VMX_INTR_INFO_TYPE_SHIFT;
      /* an NMI is delivered like an interrupt, not reflected as a fault */
      if (type == VMX_INTR_TYPE_NMI)
        return decodeInterruption(record, ExitReason::Interrupt);
      return decodeInterruption(record, ExitReason::Exception);
    }
    case VMX_EXIT_EXTERNAL_INTERRUPT:
      return decodeInterruption(record, ExitReason::Interrupt);
    case VMX_EXIT_VMCALL:
      info = ExitInfo::make(
          isEnclaveHyperCall(record.rax) ? ExitReason::EnclaveInstruction
                                         : ExitReason::Hypercall);
      info.hypercall = record.rax;
      break;
    case VMX_EXIT_CPUID:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Cpuid;
      break;
    case VMX_EXIT_XSETBV:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Xsetbv;
      break;
    case VMX_EXIT_RDMSR:
    case VMX_EXIT_WRMSR:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Msr;
      break;
    case VMX_EXIT_INTERRUPT_WINDOW:
    case VMX_EXIT_NMI_WINDOW:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::EventWindow;
      break;
    case VMX_EXIT_HLT:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Hlt;
      break;
    case VMX_EXIT_EPT_VIOLATION:
      info              = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op           = PrivilegedOp::NestedPageFault;
      info.faultAddress = record.guestPhysAddr;
      if (record.qualification & VMX_EPT_QUAL_READ)
        info.accessPerms |= Perm::Read;
      if (record.qualification & VMX_EPT_QUAL_WRITE)
        info.accessPerms |= Perm::Write;
      if (record.qualification & VMX_EPT_QUAL_FETCH)
        info.accessPerms |= Perm::Exec;
      break;
    default:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Unknown;
      break;
  }

  info.rawCode           = record.exitReason;
  info.instructionLength = record.instructionLength;
  return info;
}

}  // namespace HyperEnclave
