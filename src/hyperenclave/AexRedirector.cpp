//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "AexRedirector.hpp"
#include "HyperCall.hpp"
#include "common.hpp"

namespace HyperEnclave {

static PendingEvent
hostInterrupt(const ExitInfo& exit) {
  PendingEvent ev = PendingEvent::interrupt(exit.vector);
  if (exit.vector == Vector::Nmi) ev.type = EventType::Nmi;
  return ev;
}

AexRedirector::AexRedirector(
    EnclaveTable& enclaveTable, const GuestMemory& guestMemory,
    bool interruptEnabled)
    : table(enclaveTable),
      memory(guestMemory),
      enclaveInterrupt(interruptEnabled) {}

bool
AexRedirector::intercept(Vcpu& vcpu, const ExitInfo& exit) {
  if (vcpu.getMode() != VcpuMode::InEnclave) return false;

  bool npf = exit.reason == ExitReason::OtherPrivileged &&
             exit.op == PrivilegedOp::NestedPageFault;
  if (exit.reason != ExitReason::Interrupt &&
      exit.reason != ExitReason::Exception && !npf)
    return false;

  EnclaveTable::Guard enclave(table, vcpu.getEnclave());
  Tcs* tcs = enclave ? enclave->findTcs(vcpu.getTcsAddress()) : NULL;
  if (!tcs) {
    vcpu.abandonEnclave();
    if (exit.reason == ExitReason::Interrupt && exit.hasVector)
      vcpu.queueEvent(hostInterrupt(exit));
    return true;
  }

  if (exit.reason == ExitReason::Interrupt)
    handleInterrupt(vcpu, *enclave.get(), *tcs, exit);
  else if (exit.reason == ExitReason::Exception)
    handleException(vcpu, *enclave.get(), *tcs, exit);
  else
    handleNestedPageFault(vcpu, *enclave.get(), *tcs, exit);
  return true;
}

void
AexRedirector::handleInterrupt(
    Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit) {
  PendingEvent ev = hostInterrupt(exit);

  /* SVM does not acknowledge the interrupt on exit; it stays pending in
   * the local APIC and would trap again at once, so always leave */
  if (!exit.hasVector) {
    asyncExit(vcpu, enclave, tcs, ev, NULL);
    return;
  }
  if (!enclaveInterrupt && ev.type != EventType::Nmi) {
    vcpu.queueEvent(ev);
    return;
  }
  asyncExit(vcpu, enclave, tcs, ev, &ev);
}

void
AexRedirector::handleException(
    Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit) {
  PendingEvent fault = PendingEvent::exception(
      exit.vector, exit.hasErrorCode, exit.errorCode, exit.faultAddress);

  if (exit.vector == Vector::PageFault) {
    raisePageFault(vcpu, enclave, tcs, fault);
    return;
  }
  asyncExit(vcpu, enclave, tcs, fault, &fault);
}

void
AexRedirector::handleNestedPageFault(
    Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit) {
  uint64_t gpa    = exit.faultAddress;
  unsigned access = exit.accessPerms;
  uint32_t err    = PF_USER;
  if (access & Perm::Write) err |= PF_WRITE;
  if (access & Perm::Exec) err |= PF_FETCH;

  if (enclave.contains(gpa)) {
    if (enclave.isPageMapped(gpa)) err |= PF_PROTECTION;
  } else {
    uint64_t hpa;
    unsigned perms;
    bool mapped = memory.translate(gpa, &hpa, &perms);
    if (mapped && !(access & Perm::Exec) && (perms & access) == access) {
      Error ret = enclave.mirrorSharedPage(gpa, hpa, perms);
      if (ret == Error::Success) {
        vcpu.getBackend().invalidateTranslation();
        return;
      }
      HE_WARN(
          "cannot share gpa %#lx with enclave %#lx: %s", gpa,
          enclave.getRef().toId(), errorString(ret));
    }
    if (mapped) err |= PF_PROTECTION;
  }

  PendingEvent fault =
      PendingEvent::exception(Vector::PageFault, true, err, gpa);
  raisePageFault(vcpu, enclave, tcs, fault);
}

void
AexRedirector::raisePageFault(
    Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const PendingEvent& fault) {
  PendingEvent enclaveView;
  PendingEvent hostView;
  fixupException(
      enclave, fault, isSharedPage(enclave, fault.faultAddress), &enclaveView,
      &hostView);
  asyncExit(vcpu, enclave, tcs, enclaveView, &hostView);
}

bool
AexRedirector::isSharedPage(const Enclave& enclave, uint64_t addr) const {
  unsigned perms;
  if (enclave.contains(addr)) return false;
  return memory.translate(addr, NULL, &perms) && (perms & Perm::Read);
}

void
AexRedirector::fixupException(
    const Enclave& enclave, const PendingEvent& fault, bool sharedPage,
    PendingEvent* enclaveView, PendingEvent* hostView) {
  *enclaveView = fault;
  *hostView    = fault;
  if (fault.vector != Vector::PageFault) return;

  uint64_t addr = fault.faultAddress;
  uint32_t err  = fault.errorCode;
  hostView->faultAddress = PAGE_DOWN(addr);

  if (addr == 0) {
    HE_WARN("enclave dereferenced NULL, error code %#x", err);
  } else if (enclave.contains(addr)) {
    if (enclave.isPageMapped(addr)) err |= PF_EPCM_ATTR_MISMATCH;
    enclaveView->errorCode = err;
    hostView->errorCode    = err;
  } else if (sharedPage) {
    enclaveView->errorCode = err | PF_SHARED_MEM_FETCH;
  } else {
    HE_WARN("illegal enclave access to %#lx, error code %#x", addr, err);
    hostView->errorCode = PF_PROTECTION | PF_USER;
  }
}

void
AexRedirector::asyncExit(
    Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const PendingEvent& cause,
    const PendingEvent* hostEvent) {
  VendorBackend& cpu = vcpu.getBackend();

  SsaFrame frame;
  vcpu.saveRegisters(&frame.regs);
  frame.exitInfoValid = cause.type == EventType::HardwareException;
  frame.vector        = frame.exitInfoValid ? cause.vector : 0;
  frame.errorCode     = frame.exitInfoValid ? cause.errorCode : 0;
  frame.faultAddress  = frame.exitInfoValid ? cause.faultAddress : 0;

  Error ret = tcs.pushSsa(frame);
  if (ret != Error::Success) {
    HE_ERROR(
        "enclave %#lx: no SSA frame left on TCS %#lx",
        enclave.getRef().toId(), tcs.getLinearAddress());
    enclave.forceDestroy();
    vcpu.abandonEnclave();
    if (hostEvent) vcpu.queueEvent(*hostEvent);
    return;
  }

  uint64_t tcsAddr = tcs.getLinearAddress();
  uint64_t aep     = tcs.getAep();
  vcpu.leaveEnclave();
  ret = enclave.leave(&tcs);
  if (ret != Error::Success) {
    HE_WARN(
        "enclave %#lx: leave on AEX failed: %s", enclave.getRef().toId(),
        errorString(ret));
  }

  /* what ERESUME at the AEP expects */
  cpu.setRegister(
      Reg::Rax, static_cast<uint64_t>(HyperCallCode::EnclaveResume));
  cpu.setRegister(Reg::Rbx, tcsAddr);
  cpu.setRegister(Reg::Rcx, aep);
  cpu.setRegister(Reg::Rip, aep);

  if (hostEvent) vcpu.queueEvent(*hostEvent);
  vcpu.getStats().aex++;
  HE_DEBUG(
      "CPU %u: AEX from enclave %#lx, vector %u, cssa %u", vcpu.getId(),
      enclave.getRef().toId(), cause.vector, tcs.getCssa());
}

}  // namespace HyperEnclave
