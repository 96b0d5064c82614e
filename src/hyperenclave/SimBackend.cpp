//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "SimBackend.hpp"
#include "common.hpp"

namespace HyperEnclave {

/* length of VMCALL / VMMCALL */
#define SIM_HYPERCALL_LENGTH 3

SimBackend::SimBackend() {
  regs.clear();
  lastExit         = ExitInfo::make(ExitReason::Hypercall);
  activeRoot       = 0;
  exceptionBitmap  = 0;
  flushCount       = 0;
  entryCount       = 0;
  windowExits      = 0;
  interruptShadow  = false;
  nmiBlocked       = false;
  interruptWindow  = false;
  nmiWindow        = false;
  blockedInjection = false;
  initialized      = false;
  initFailure      = Error::Success;
}

Error
SimBackend::initVcpu(
    unsigned cpuId, const LinuxContext& linux, FrameAllocator& frames,
    const PageTable& primary) {
  (void)frames;
  if (initFailure != Error::Success) {
    HE_ERROR("simulated VCPU %u refuses to initialize", cpuId);
    return initFailure;
  }

  regs.clear();
  for (unsigned i = 0; i < HE_NUM_GPRS; i++) regs.value[i] = linux.regs.gpr[i];
  regs.set(Reg::Rip, linux.rip);
  regs.set(Reg::Rsp, linux.rsp);
  regs.set(Reg::Rflags, linux.rflags | RFLAGS_RESERVED);
  regs.set(Reg::Cr0, linux.cr0);
  regs.set(Reg::Cr3, linux.cr3);
  regs.set(Reg::Cr4, linux.cr4);
  regs.set(Reg::Efer, linux.efer);
  regs.set(Reg::FsBase, linux.fs.base);
  regs.set(Reg::GsBase, linux.gs.base);
  regs.set(Reg::Xcr0, linux.xcr0 ? linux.xcr0 : (XCR0_X87 | XCR0_SSE));

  activeRoot  = primary.getRoot();
  initialized = true;
  return Error::Success;
}

void
SimBackend::teardown() {
  initialized = false;
}

Error
SimBackend::vmEntry() {
  if (!initialized) return Error::VmEntryFailure;
  if (blockedInjection) {
    HE_ERROR("simulated entry rejects an event the guest cannot take");
    blockedInjection = false;
    return Error::VmEntryFailure;
  }
  entryCount++;

  /* a requested window opens before the guest runs anything else */
  if ((interruptWindow && isEventDeliverable(EventType::ExternalInterrupt)) ||
      (nmiWindow && isEventDeliverable(EventType::Nmi))) {
    lastExit    = ExitInfo::make(ExitReason::OtherPrivileged);
    lastExit.op = PrivilegedOp::EventWindow;
    windowExits++;
    return Error::Success;
  }

  if (script.empty()) {
    regs.set(Reg::Rax, static_cast<uint64_t>(HyperCallCode::HypervisorDisable));
    lastExit                   = ExitInfo::make(ExitReason::Hypercall);
    lastExit.hypercall         = regs.get(Reg::Rax);
    lastExit.instructionLength = SIM_HYPERCALL_LENGTH;
    return Error::Success;
  }

  ScriptedExit next = script.front();
  script.pop_front();
  if (next.step) next.step(*this);

  lastExit = next.exit;
  if (lastExit.reason == ExitReason::Hypercall ||
      lastExit.reason == ExitReason::EnclaveInstruction) {
    lastExit.hypercall = regs.get(Reg::Rax);
    lastExit.reason    = isEnclaveHyperCall(lastExit.hypercall)
                          ? ExitReason::EnclaveInstruction
                          : ExitReason::Hypercall;
    lastExit.instructionLength = SIM_HYPERCALL_LENGTH;
  }
  return Error::Success;
}

Error
SimBackend::mapGuestPhysical(
    PageTable& table, uint64_t gpa, uint64_t hpa, unsigned perms,
    bool encrypted) {
  return table.map(gpa, hpa, perms, encrypted);
}

void
SimBackend::setNestedPageTable(const PageTable& table) {
  activeRoot = table.getRoot();
  invalidateTranslation();
}

void
SimBackend::invalidateTranslation() {
  flushCount++;
}

void
SimBackend::injectEvent(const PendingEvent& event) {
  if (!isEventDeliverable(event.type)) blockedInjection = true;
  injected.push_back(event);
}

bool
SimBackend::isEventDeliverable(EventType type) const {
  switch (type) {
    case EventType::ExternalInterrupt:
      return (regs.get(Reg::Rflags) & RFLAGS_IF) && !interruptShadow;
    case EventType::Nmi:
      return !interruptShadow && !nmiBlocked;
    default:
      return true;
  }
}

void
SimBackend::requestEventWindow(EventType type) {
  if (type == EventType::Nmi)
    nmiWindow = true;
  else if (type == EventType::ExternalInterrupt)
    interruptWindow = true;
}

void
SimBackend::clearEventWindow() {
  interruptWindow = false;
  nmiWindow       = false;
}

bool
SimBackend::isEventWindowRequested(EventType type) const {
  return type == EventType::Nmi ? nmiWindow : interruptWindow;
}

void
SimBackend::advanceIp(unsigned length) {
  regs.set(Reg::Rip, regs.get(Reg::Rip) + length);
}

void
SimBackend::cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) const {
  (void)subleaf;
  /* a plain family-6 part with SSE/XSAVE, no hypervisor bit */
  out[0] = out[1] = out[2] = out[3] = 0;
  if (leaf == 0) {
    out[0] = 0xd;
    out[1] = 0x756e6547; /* "GenuineIntel" */
    out[2] = 0x6c65746e;
    out[3] = 0x49656e69;
  } else if (leaf == 1) {
    out[0] = 0x000906ea;
    out[2] = (1U << 26) | (1U << 27);
    out[3] = (1U << 24) | (1U << 25);
  }
}

void
SimBackend::queueExit(const ExitInfo& exit, GuestStep step) {
  ScriptedExit next;
  next.exit = exit;
  next.step = step;
  script.push_back(next);
}

void
SimBackend::queueHypercall(
    HyperCallCode code, uint64_t rbx, uint64_t rcx, uint64_t rdx) {
  uint64_t rax = static_cast<uint64_t>(code);
  queueExit(ExitInfo::make(ExitReason::Hypercall), [=](SimBackend& sim) {
    sim.setRegister(Reg::Rax, rax);
    sim.setRegister(Reg::Rbx, rbx);
    sim.setRegister(Reg::Rcx, rcx);
    sim.setRegister(Reg::Rdx, rdx);
  });
}

void
SimBackend::queueInterrupt(uint8_t vector) {
  ExitInfo exit  = ExitInfo::make(ExitReason::Interrupt);
  exit.vector    = vector;
  exit.hasVector = true;
  queueExit(exit);
}

void
SimBackend::queueException(
    uint8_t vector, bool hasErrorCode, uint32_t errorCode,
    uint64_t faultAddress) {
  ExitInfo exit     = ExitInfo::make(ExitReason::Exception);
  exit.vector       = vector;
  exit.hasVector    = true;
  exit.hasErrorCode = hasErrorCode;
  exit.errorCode    = errorCode;
  exit.faultAddress = faultAddress;
  queueExit(exit);
}

void
SimBackend::queueNestedPageFault(uint64_t gpa, unsigned access) {
  ExitInfo exit     = ExitInfo::make(ExitReason::OtherPrivileged);
  exit.op           = PrivilegedOp::NestedPageFault;
  exit.faultAddress = gpa;
  exit.accessPerms  = access;
  queueExit(exit);
}

}  // namespace HyperEnclave
