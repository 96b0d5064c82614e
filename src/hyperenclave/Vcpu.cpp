//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Vcpu.hpp"
#include <string.h>
#include "common.hpp"

namespace HyperEnclave {

static const char* const kExitReasonNames[HE_NUM_EXIT_REASONS] = {
    "enclave-instruction", "interrupt", "exception", "hypercall",
    "other-privileged"};

Vcpu::Vcpu(unsigned cpuId, const GuestPageTable& primaryTable)
    : id(cpuId), primary(primaryTable) {
  mode       = VcpuMode::Normal;
  enclave    = EnclaveRef::none();
  tcsAddress = 0;
  hostSnapshot.clear();
  memset(&stats, 0, sizeof(stats));
}

Error
Vcpu::init(const LinuxContext& linux, FrameAllocator& frames) {
  return backend.initVcpu(id, linux, frames, primary);
}

void
Vcpu::saveRegisters(RegisterFile* regs) const {
  for (unsigned i = 0; i < HE_NUM_REGS; i++) {
    regs->value[i] = backend.getRegister(static_cast<Reg>(i));
  }
}

void
Vcpu::loadRegisters(const RegisterFile& regs) {
  for (unsigned i = 0; i < HE_NUM_REGS; i++) {
    backend.setRegister(static_cast<Reg>(i), regs.value[i]);
  }
}

void
Vcpu::enterEnclave(
    EnclaveRef ref, uint64_t tcsAddr, const GuestPageTable& table) {
  saveRegisters(&hostSnapshot);
  backend.setNestedPageTable(table);
  backend.setExceptionIntercepts(0xffffffff);
  mode       = VcpuMode::InEnclave;
  enclave    = ref;
  tcsAddress = tcsAddr;
  stats.enclaveEnters++;
}

void
Vcpu::leaveEnclave() {
  loadRegisters(hostSnapshot);
  hostSnapshot.clear();
  backend.setNestedPageTable(primary);
  backend.setExceptionIntercepts(0);
  mode       = VcpuMode::Normal;
  enclave    = EnclaveRef::none();
  tcsAddress = 0;
  stats.enclaveExits++;
}

void
Vcpu::abandonEnclave() {
  HE_ERROR(
      "CPU %u: enclave %#lx vanished while running on TCS %#lx", id,
      enclave.toId(), tcsAddress);
  leaveEnclave();
  backend.setRegister(
      Reg::Rax, static_cast<uint64_t>(Error::SecurityViolation));
}

void
Vcpu::queueEvent(const PendingEvent& event) {
  if (event.type != EventType::HardwareException) {
    for (std::deque<PendingEvent>::const_iterator it = pending.begin();
         it != pending.end(); ++it) {
      if (it->type == event.type && it->vector == event.vector) return;
    }
  }
  pending.push_back(event);
}

bool
Vcpu::hasPendingEvent(EventType type) const {
  for (std::deque<PendingEvent>::const_iterator it = pending.begin();
       it != pending.end(); ++it) {
    if (it->type == type) return true;
  }
  return false;
}

bool
Vcpu::takeEvent(bool interruptOpen, bool nmiOpen, PendingEvent* out) {
  static const EventType kOrder[3] = {EventType::HardwareException,
                                      EventType::Nmi,
                                      EventType::ExternalInterrupt};
  for (unsigned i = 0; i < 3; i++) {
    if (kOrder[i] == EventType::Nmi && !nmiOpen) continue;
    if (kOrder[i] == EventType::ExternalInterrupt && !interruptOpen) continue;
    for (std::deque<PendingEvent>::iterator it = pending.begin();
         it != pending.end(); ++it) {
      if (it->type != kOrder[i]) continue;
      *out = *it;
      pending.erase(it);
      return true;
    }
  }
  return false;
}

PendingEvent
Vcpu::popEvent() {
  PendingEvent ev = pending.front();
  pending.pop_front();
  return ev;
}

void
Vcpu::dumpStats() const {
  HE_INFO("CPU %u exit statistics:", id);
  for (unsigned i = 0; i < HE_NUM_EXIT_REASONS; i++) {
    HE_INFO("  %-20s %lu", kExitReasonNames[i], stats.exits[i]);
  }
  HE_INFO("  %-20s %lu", "aex", stats.aex);
  HE_INFO("  %-20s %lu", "enclave-enter", stats.enclaveEnters);
  HE_INFO("  %-20s %lu", "enclave-exit", stats.enclaveExits);
  HE_INFO("  %-20s %lu", "injected", stats.injectedEvents);
}

}  // namespace HyperEnclave
