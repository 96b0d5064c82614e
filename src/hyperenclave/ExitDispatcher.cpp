//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "ExitDispatcher.hpp"
#include <string.h>
#include "Config.hpp"
#include "Cpu.hpp"
#include "HyperCall.hpp"
#include "common.hpp"

namespace HyperEnclave {

/* fallback lengths when the exit record carries none (SVM without
 * next-RIP save) */
#define HE_INSN_LEN_CPUID 2
#define HE_INSN_LEN_XSETBV 3
#define HE_INSN_LEN_HLT 1
#define HE_INSN_LEN_VMCALL 3

#define XCR0_AVX (1ULL << 2)

static unsigned
insnLength(const ExitInfo& exit, unsigned fallback) {
  return exit.instructionLength ? exit.instructionLength : fallback;
}

ExitDispatcher::ExitDispatcher(
    EnclaveTable& enclaveTable, EnclaveInstructions& enclaveInstructions,
    AexRedirector& aexRedirector, const EpcAllocator& epcAllocator)
    : table(enclaveTable),
      instructions(enclaveInstructions),
      redirector(aexRedirector),
      epc(epcAllocator) {}

Error
ExitDispatcher::run(Vcpu& vcpu) {
  VendorBackend& cpu = vcpu.getBackend();
  Error ret          = Error::Success;

  HE_INFO("CPU %u: entering guest", vcpu.getId());
  for (;;) {
    deliverPendingEvent(vcpu);

    ret = cpu.vmEntry();
    if (ret != Error::Success) {
      HE_ERROR("CPU %u: VM entry failed: %s", vcpu.getId(), errorString(ret));
      break;
    }

    ExitInfo exit = cpu.readExitReason();
    vcpu.getStats().exits[static_cast<unsigned>(exit.reason)]++;
    if (!handleExit(vcpu, exit)) break;
  }

  if (Config::kStatsEnabled) vcpu.dumpStats();
  return ret;
}

void
ExitDispatcher::deliverPendingEvent(Vcpu& vcpu) {
  /* never into enclave context */
  if (vcpu.getMode() != VcpuMode::Normal || !vcpu.hasPendingEvents()) return;

  VendorBackend& cpu = vcpu.getBackend();
  PendingEvent ev;
  if (vcpu.takeEvent(
          cpu.isEventDeliverable(EventType::ExternalInterrupt),
          cpu.isEventDeliverable(EventType::Nmi), &ev)) {
    cpu.injectEvent(ev);
    vcpu.getStats().injectedEvents++;
  }

  /* whatever is left waits for the guest to open a window */
  cpu.clearEventWindow();
  if (vcpu.hasPendingEvent(EventType::Nmi))
    cpu.requestEventWindow(EventType::Nmi);
  if (vcpu.hasPendingEvent(EventType::ExternalInterrupt))
    cpu.requestEventWindow(EventType::ExternalInterrupt);
}

bool
ExitDispatcher::handleExit(Vcpu& vcpu, const ExitInfo& exit) {
  if (vcpu.getMode() == VcpuMode::InEnclave) {
    EnclaveTable::Guard enclave(table, vcpu.getEnclave());
    if (!enclave) {
      vcpu.abandonEnclave();
      if (exit.reason == ExitReason::Interrupt) reflectEvent(vcpu, exit);
      return true;
    }
  }

  if (redirector.intercept(vcpu, exit)) return true;

  VendorBackend& cpu = vcpu.getBackend();
  switch (exit.reason) {
    case ExitReason::EnclaveInstruction:
      cpu.advanceIp(insnLength(exit, HE_INSN_LEN_VMCALL));
      instructions.emulate(vcpu, exit);
      return true;
    case ExitReason::Hypercall:
      cpu.advanceIp(insnLength(exit, HE_INSN_LEN_VMCALL));
      return handleHypercall(vcpu, exit);
    case ExitReason::Interrupt:
    case ExitReason::Exception:
      reflectEvent(vcpu, exit);
      return true;
    case ExitReason::OtherPrivileged:
      handlePrivileged(vcpu, exit);
      return true;
  }
  return true;
}

bool
ExitDispatcher::handleHypercall(Vcpu& vcpu, const ExitInfo& exit) {
  VendorBackend& cpu = vcpu.getBackend();
  Error ret          = Error::Success;
  bool keepRunning   = true;

  switch (static_cast<HyperCallCode>(exit.hypercall)) {
    case HyperCallCode::HypervisorDisable:
      if (vcpu.getMode() == VcpuMode::InEnclave) {
        ret = Error::InvalidState;
        break;
      }
      HE_INFO("CPU %u: hypervisor disabled by guest", vcpu.getId());
      keepRunning = false;
      break;
    case HyperCallCode::HypervisorVersion:
      cpu.setRegister(Reg::Rbx, Config::kVersion);
      break;
    case HyperCallCode::EpcQuery:
      cpu.setRegister(Reg::Rbx, epc.getFreeCount());
      cpu.setRegister(Reg::Rcx, epc.getCapacity());
      break;
    default:
      HE_WARN(
          "CPU %u: unknown hypercall %#lx", vcpu.getId(), exit.hypercall);
      ret = Error::InvalidParameter;
      break;
  }

  cpu.setRegister(Reg::Rax, static_cast<uint64_t>(ret));
  return keepRunning;
}

void
ExitDispatcher::handlePrivileged(Vcpu& vcpu, const ExitInfo& exit) {
  VendorBackend& cpu = vcpu.getBackend();

  switch (exit.op) {
    case PrivilegedOp::Cpuid:
      emulateCpuid(vcpu);
      cpu.advanceIp(insnLength(exit, HE_INSN_LEN_CPUID));
      break;
    case PrivilegedOp::Xsetbv:
      if (vcpu.getMode() == VcpuMode::InEnclave) {
        raiseException(vcpu, Vector::InvalidOpcode, false);
        break;
      }
      emulateXsetbv(vcpu, insnLength(exit, HE_INSN_LEN_XSETBV));
      break;
    case PrivilegedOp::Hlt:
      cpu.advanceIp(insnLength(exit, HE_INSN_LEN_HLT));
      break;
    case PrivilegedOp::EventWindow:
      /* the next entry delivers what was held back */
      cpu.clearEventWindow();
      break;
    case PrivilegedOp::Msr:
      raiseException(vcpu, Vector::GeneralProtection, true);
      break;
    case PrivilegedOp::NestedPageFault:
      /* in-enclave faults were taken by the redirector */
      HE_WARN(
          "CPU %u: guest access to protected gpa %#lx", vcpu.getId(),
          exit.faultAddress);
      raiseException(vcpu, Vector::GeneralProtection, true);
      break;
    default:
      HE_ERROR(
          "CPU %u: unhandled exit %#lx at rip %#lx", vcpu.getId(),
          exit.rawCode, cpu.getRegister(Reg::Rip));
      raiseException(vcpu, Vector::InvalidOpcode, false);
      break;
  }
}

void
ExitDispatcher::emulateCpuid(Vcpu& vcpu) {
  VendorBackend& cpu = vcpu.getBackend();
  uint32_t leaf      = static_cast<uint32_t>(cpu.getRegister(Reg::Rax));
  uint32_t subleaf   = static_cast<uint32_t>(cpu.getRegister(Reg::Rcx));
  uint32_t out[4];

  if (leaf == HE_CPUID_LEAF_HYPERVISOR) {
    out[0] = HE_CPUID_LEAF_HYPERVISOR;
    memcpy(&out[1], HE_CPUID_SIGNATURE, 12);
  } else {
    cpu.cpuid(leaf, subleaf, out);
    if (leaf == 1) {
      out[2] |= CPUID_1_ECX_HYPERVISOR;
      out[2] &= ~CPUID_1_ECX_VMX;
    }
  }

  cpu.setRegister(Reg::Rax, out[0]);
  cpu.setRegister(Reg::Rbx, out[1]);
  cpu.setRegister(Reg::Rcx, out[2]);
  cpu.setRegister(Reg::Rdx, out[3]);
}

void
ExitDispatcher::emulateXsetbv(Vcpu& vcpu, unsigned length) {
  VendorBackend& cpu = vcpu.getBackend();
  uint32_t index     = static_cast<uint32_t>(cpu.getRegister(Reg::Rcx));
  uint64_t value     = (cpu.getRegister(Reg::Rdx) << 32) |
                   (cpu.getRegister(Reg::Rax) & 0xffffffffULL);

  /* x87 is mandatory and AVX needs SSE */
  if (index != 0 || !(value & XCR0_X87) ||
      ((value & XCR0_AVX) && !(value & XCR0_SSE))) {
    raiseException(vcpu, Vector::GeneralProtection, true);
    return;
  }
  cpu.setRegister(Reg::Xcr0, value);
  cpu.advanceIp(length);
}

void
ExitDispatcher::reflectEvent(Vcpu& vcpu, const ExitInfo& exit) {
  if (!exit.hasVector) return;

  PendingEvent ev;
  if (exit.reason == ExitReason::Interrupt) {
    ev = PendingEvent::interrupt(exit.vector);
    if (exit.vector == Vector::Nmi) ev.type = EventType::Nmi;
  } else {
    ev = PendingEvent::exception(
        exit.vector, exit.hasErrorCode, exit.errorCode, exit.faultAddress);
  }
  vcpu.queueEvent(ev);
}

void
ExitDispatcher::raiseException(
    Vcpu& vcpu, uint8_t vector, bool hasErrorCode) {
  if (vcpu.getMode() == VcpuMode::InEnclave) {
    ExitInfo fault     = ExitInfo::make(ExitReason::Exception);
    fault.vector       = vector;
    fault.hasVector    = true;
    fault.hasErrorCode = hasErrorCode;
    redirector.intercept(vcpu, fault);
    return;
  }
  vcpu.queueEvent(PendingEvent::exception(vector, hasErrorCode, 0, 0));
}

}  // namespace HyperEnclave
