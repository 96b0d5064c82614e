//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "NestedPageTable.hpp"
#include "Registers.hpp"
#include "VmxExit.hpp"

extern "C" {
/* returns 0 after a VM exit, non-zero if VMLAUNCH/VMRESUME failed */
int
he_vmx_run(HyperEnclave::GuestRegisters* regs, int launched);
void
he_vmx_exit(void);
}

namespace HyperEnclave {

/* Intel VT-x backend: one VMCS per core, EPT for nested paging. */
class VmxBackend {
 public:
  typedef NestedPageTable<EptFormat> PageTable;

  VmxBackend();
  ~VmxBackend();

  Error initVcpu(
      unsigned cpuId, const LinuxContext& linux, FrameAllocator& frames,
      const PageTable& primary);
  void teardown();

  Error vmEntry();
  ExitInfo readExitReason() const { return lastExit; }

  uint64_t getRegister(Reg r) const;
  void setRegister(Reg r, uint64_t v);

  static Error mapGuestPhysical(
      PageTable& table, uint64_t gpa, uint64_t hpa, unsigned perms,
      bool encrypted = false);
  void setNestedPageTable(const PageTable& table);
  void invalidateTranslation();
  void setExceptionIntercepts(uint32_t bitmap);
  void injectEvent(const PendingEvent& event);
  bool isEventDeliverable(EventType type) const;
  /* exit as soon as the guest can take an event of this type */
  void requestEventWindow(EventType type);
  void clearEventWindow();
  void advanceIp(unsigned length);
  void cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) const;

 private:
  VmxBackend(const VmxBackend&);
  VmxBackend& operator=(const VmxBackend&);

  Error checkFeatures();
  Error enableVmx();
  void setupControls();
  void setupHostState();
  void setupGuestState(const LinuxContext& linux);

  GuestRegisters guestRegs;
  FrameAllocator* frames;
  uint64_t vmxonRegion;
  uint64_t vmcsRegion;
  uint64_t msrBitmap;
  uint64_t eptp;
  uint64_t guestXcr0;
  uint64_t pendingCr2;
  bool hasPendingCr2;
  bool launched;
  bool vmxOn;
  ExitInfo lastExit;
};

}  // namespace HyperEnclave
