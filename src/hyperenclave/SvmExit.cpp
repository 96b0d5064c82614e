//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "SvmExit.hpp"
#include "HyperCall.hpp"
#include "common.hpp"

namespace HyperEnclave {

/* exceptions that push an error code */
static bool
vectorHasErrorCode(uint8_t vector) {
  switch (vector) {
    case 8:
    case 10:
    case 11:
    case 12:
    case 13:
    case 14:
    case 17:
    case 21:
    case 30:
      return true;
    default:
      return false;
  }
}

ExitInfo
svmDecodeExit(const SvmExitRecord& record) {
  ExitInfo info;
  uint64_t code = record.exitCode;

  if (code >= SVM_EXIT_EXCP_BASE && code <= SVM_EXIT_EXCP_LAST) {
    info           = ExitInfo::make(ExitReason::Exception);
    info.vector    = static_cast<uint8_t>(code - SVM_EXIT_EXCP_BASE);
    info.hasVector = true;
    if (vectorHasErrorCode(info.vector)) {
      info.hasErrorCode = true;
      info.errorCode    = static_cast<uint32_t>(record.exitInfo1);
    }
    if (info.vector == Vector::PageFault) info.faultAddress = record.exitInfo2;
    info.rawCode = code;
    return info;
  }

  switch (code) {
    case SVM_EXIT_INTR:
      /* only intercepted in enclave mode; the vector stays pending in
       * the local APIC and the guest takes it once it runs again */
      info = ExitInfo::make(ExitReason::Interrupt);
      break;
    case SVM_EXIT_NMI:
      info           = ExitInfo::make(ExitReason::Interrupt);
      info.vector    = Vector::Nmi;
      info.hasVector = true;
      break;
    case SVM_EXIT_VINTR:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::EventWindow;
      break;
    case SVM_EXIT_VMMCALL:
      info = ExitInfo::make(
          isEnclaveHyperCall(record.rax) ? ExitReason::EnclaveInstruction
                                         : ExitReason::Hypercall);
      info.hypercall = record.rax;
      break;
    case SVM_EXIT_CPUID:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Cpuid;
      break;
    case SVM_EXIT_XSETBV:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Xsetbv;
      break;
    case SVM_EXIT_MSR:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Msr;
      break;
    case SVM_EXIT_HLT:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Hlt;
      break;
    case SVM_EXIT_NPF:
      info              = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op           = PrivilegedOp::NestedPageFault;
      info.faultAddress = record.exitInfo2;
      info.accessPerms  = Perm::Read;
      if (record.exitInfo1 & SVM_NPF_WRITE) info.accessPerms |= Perm::Write;
      if (record.exitInfo1 & SVM_NPF_FETCH) info.accessPerms |= Perm::Exec;
      break;
    default:
      info    = ExitInfo::make(ExitReason::OtherPrivileged);
      info.op = PrivilegedOp::Unknown;
      break;
  }

  info.rawCode = code;
  if (record.nextRip > record.rip)
    info.instructionLength = static_cast<unsigned>(record.nextRip - record.rip);
  return info;
}

}  // namespace HyperEnclave
