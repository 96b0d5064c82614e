//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include <deque>

#include "EpcAllocator.hpp"
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "Registers.hpp"
#include "VendorBackend.hpp"

namespace HyperEnclave {

enum class VcpuMode {
  Normal,
  InEnclave,
};

#define HE_NUM_EXIT_REASONS 5

struct ExitStats {
  uint64_t exits[HE_NUM_EXIT_REASONS];
  uint64_t aex;
  uint64_t enclaveEnters;
  uint64_t enclaveExits;
  uint64_t injectedEvents;
};

/* Per-core guest context. Only the core that runs it ever touches it. */
class Vcpu {
 public:
  Vcpu(unsigned cpuId, const GuestPageTable& primary);

  Error init(const LinuxContext& linux, FrameAllocator& frames);

  VendorBackend& getBackend() { return backend; }
  const VendorBackend& getBackend() const { return backend; }
  unsigned getId() const { return id; }
  const GuestPageTable& getPrimaryTable() const { return primary; }

  VcpuMode getMode() const { return mode; }
  EnclaveRef getEnclave() const { return enclave; }
  uint64_t getTcsAddress() const { return tcsAddress; }

  /* full architectural state through the backend */
  void saveRegisters(RegisterFile* regs) const;
  void loadRegisters(const RegisterFile& regs);

  /* Snapshot the host context and switch to the enclave's nested page
   * table with every exception intercepted. */
  void enterEnclave(
      EnclaveRef ref, uint64_t tcsAddr, const GuestPageTable& table);
  /* Reload the host snapshot over whatever the enclave left in the
   * registers and switch back to the primary table. */
  void leaveEnclave();
  /* The enclave went away underneath us: scrub its state, back to the
   * host with SecurityViolation in RAX. */
  void abandonEnclave();
  const RegisterFile& getHostSnapshot() const { return hostSnapshot; }

  /* Interrupts and NMIs coalesce per vector, the way the local APIC
   * keeps one request bit each, so the queue stays bounded however long
   * the guest keeps them blocked. */
  void queueEvent(const PendingEvent& event);
  bool hasPendingEvents() const { return !pending.empty(); }
  bool hasPendingEvent(EventType type) const;
  size_t getPendingCount() const { return pending.size(); }
  PendingEvent popEvent();
  /* Oldest exception first, then an NMI, then an external interrupt;
   * the latter two only while the guest can take them. */
  bool takeEvent(bool interruptOpen, bool nmiOpen, PendingEvent* out);

  ExitStats& getStats() { return stats; }
  const ExitStats& getStats() const { return stats; }
  void dumpStats() const;

 private:
  Vcpu(const Vcpu&);
  Vcpu& operator=(const Vcpu&);

  unsigned id;
  const GuestPageTable& primary;
  VendorBackend backend;
  VcpuMode mode;
  EnclaveRef enclave;
  uint64_t tcsAddress;
  RegisterFile hostSnapshot;
  std::deque<PendingEvent> pending;
  ExitStats stats;
};

}  // namespace HyperEnclave
