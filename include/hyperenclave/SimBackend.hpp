//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include <deque>
#include <functional>
#include <vector>
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "HyperCall.hpp"
#include "NestedPageTable.hpp"
#include "Registers.hpp"

namespace HyperEnclave {

/* Hosted stand-in for the hardware backends. The "guest" is a script
 * of exits; each may carry a step that mutates guest registers the way
 * guest code would have before trapping. When the script runs dry the
 * guest issues HypervisorDisable.
 *
 * Interruptibility follows RFLAGS.IF plus an STI/MOV-SS shadow and NMI
 * blocking that steps may set. Injecting an event the guest cannot take
 * fails the next entry, as the VMX entry checks do. */
class SimBackend {
 public:
  typedef NestedPageTable<EptFormat> PageTable;
  typedef std::function<void(SimBackend&)> GuestStep;

  SimBackend();

  Error initVcpu(
      unsigned cpuId, const LinuxContext& linux, FrameAllocator& frames,
      const PageTable& primary);
  void teardown();

  Error vmEntry();
  ExitInfo readExitReason() const { return lastExit; }

  uint64_t getRegister(Reg r) const { return regs.get(r); }
  void setRegister(Reg r, uint64_t v) { regs.set(r, v); }

  static Error mapGuestPhysical(
      PageTable& table, uint64_t gpa, uint64_t hpa, unsigned perms,
      bool encrypted = false);
  void setNestedPageTable(const PageTable& table);
  void invalidateTranslation();
  void setExceptionIntercepts(uint32_t bitmap) { exceptionBitmap = bitmap; }
  void injectEvent(const PendingEvent& event);
  bool isEventDeliverable(EventType type) const;
  void requestEventWindow(EventType type);
  void clearEventWindow();
  void advanceIp(unsigned length);
  void cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) const;

  /* script */
  void queueExit(const ExitInfo& exit, GuestStep step = GuestStep());
  void queueHypercall(
      HyperCallCode code, uint64_t rbx = 0, uint64_t rcx = 0,
      uint64_t rdx = 0);
  void queueInterrupt(uint8_t vector);
  void queueException(
      uint8_t vector, bool hasErrorCode, uint32_t errorCode,
      uint64_t faultAddress = 0);
  void queueNestedPageFault(uint64_t gpa, unsigned access);
  void setInterruptShadow(bool on) { interruptShadow = on; }
  void setNmiBlocked(bool on) { nmiBlocked = on; }

  size_t getScriptLength() const { return script.size(); }
  const std::vector<PendingEvent>& getInjected() const { return injected; }
  uint64_t getActiveRoot() const { return activeRoot; }
  unsigned getFlushCount() const { return flushCount; }
  unsigned getEntryCount() const { return entryCount; }
  uint32_t getExceptionIntercepts() const { return exceptionBitmap; }
  bool isInitialized() const { return initialized; }
  bool isEventWindowRequested(EventType type) const;
  unsigned getWindowExitCount() const { return windowExits; }
  void setInitFailure(Error err) { initFailure = err; }

 private:
  struct ScriptedExit {
    ExitInfo exit;
    GuestStep step;
  };

  RegisterFile regs;
  std::deque<ScriptedExit> script;
  std::vector<PendingEvent> injected;
  ExitInfo lastExit;
  uint64_t activeRoot;
  uint32_t exceptionBitmap;
  unsigned flushCount;
  unsigned entryCount;
  unsigned windowExits;
  bool interruptShadow;
  bool nmiBlocked;
  bool interruptWindow;
  bool nmiWindow;
  bool blockedInjection;
  bool initialized;
  Error initFailure;
};

}  // namespace HyperEnclave
