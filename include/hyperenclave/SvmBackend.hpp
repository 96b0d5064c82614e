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
#include "SvmExit.hpp"

extern "C" {
/* VMLOAD/VMRUN/VMSAVE on guestVmcb; host hidden state is kept in
 * hostVmcb */
void
he_svm_run(
    HyperEnclave::GuestRegisters* regs, uint64_t guestVmcb, uint64_t hostVmcb);
}

namespace HyperEnclave {

struct Vmcb;

/* AMD-V backend: one VMCB per core, NPT for nested paging. */
class SvmBackend {
 public:
  typedef NestedPageTable<NptFormat> PageTable;

  SvmBackend();
  ~SvmBackend();

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
  SvmBackend(const SvmBackend&);
  SvmBackend& operator=(const SvmBackend&);

  Error checkFeatures();
  void setupControls();
  void setupGuestState(const LinuxContext& linux);

  Vmcb* vmcb() const;

  GuestRegisters guestRegs;
  FrameAllocator* frames;
  uint64_t guestVmcb;
  uint64_t hostVmcb;
  uint64_t hostSaveArea;
  uint64_t guestXcr0;
  bool svmOn;
  ExitInfo lastExit;
};

}  // namespace HyperEnclave
