//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <map>
#include <vector>

#include "EpcAllocator.hpp"
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "HyperCall.hpp"
#include "Measurement.hpp"
#include "Registers.hpp"
#include "SpinLock.hpp"
#include "VendorBackend.hpp"
#include "common.hpp"

namespace HyperEnclave {

enum class EnclaveState {
  Uninitialized,
  Building,
  Initialized,
  Running,
  Suspended,
  Destroyed,
};

const char*
enclaveStateString(EnclaveState state);

/* One State Save Area frame: the enclave register file at AEX time plus
 * what caused the exit. */
struct SsaFrame {
  RegisterFile regs;
  /* clear for interrupts */
  bool exitInfoValid;
  uint8_t vector;
  uint32_t errorCode;
  uint64_t faultAddress;
};

/* Thread control structure. The descriptor is copied out of the TCS
 * page when it is added; the SSA frames live in hypervisor memory. */
class Tcs {
 public:
  Tcs(uint64_t linearAddress, EpcPageHandle page, const TcsDescriptor& desc);

  /* compare-and-set on the busy flag: at most one VCPU holds a TCS */
  bool tryAcquire();
  void release();
  bool isBusy() const { return busy.load(std::memory_order_acquire); }

  uint64_t getLinearAddress() const { return linearAddress; }
  EpcPageHandle getPage() const { return page; }
  const TcsDescriptor& getDescriptor() const { return desc; }

  unsigned getNssa() const { return static_cast<unsigned>(ssa.size()); }
  unsigned getCssa() const { return cssa; }
  /* push the frame at CSSA; SsaOverflow when all frames are in use */
  Error pushSsa(const SsaFrame& frame);
  /* pop the frame at CSSA-1 */
  Error popSsa(SsaFrame* frame);
  const SsaFrame& getSsa(unsigned idx) const { return ssa[idx]; }

  uint64_t getAep() const { return aep; }
  void setAep(uint64_t addr) { aep = addr; }

 private:
  Tcs(const Tcs&);
  Tcs& operator=(const Tcs&);

  uint64_t linearAddress;
  EpcPageHandle page;
  TcsDescriptor desc;
  std::vector<SsaFrame> ssa;
  unsigned cssa;
  uint64_t aep;
  std::atomic<bool> busy;
};

/* Lifecycle of a single enclave. Every public operation is one
 * transition: it takes the enclave lock, validates, and either applies
 * completely or leaves the enclave untouched. */
class Enclave {
 public:
  Enclave(EpcAllocator& epcAllocator, FrameAllocator& frameAllocator);
  ~Enclave();

  Error create(EnclaveRef self, const SecsParams& secs);
  Error addPage(
      uint64_t linearAddress, const void* src, EpcPageType type,
      unsigned perms);
  /* expected may be NULL */
  Error initialize(const uint8_t* expected);
  Error removePage(uint64_t linearAddress);
  Error destroy();
  /* security breach: reclaim everything regardless of busy threads */
  void forceDestroy();

  /* enter/resume: pick the TCS at tcsAddr (0 = any idle one) and mark
   * it busy */
  Error enter(uint64_t tcsAddr, bool resume, Tcs** out);
  /* exit/AEX: clear busy and fall back to Suspended */
  Error leave(Tcs* tcs);

  /* all pages owned by this enclave and in the state its lifecycle
   * implies */
  Error checkIntegrity();

  /* map a non-enclave page into the enclave table for shared access;
   * the mapping never carries Exec */
  Error mirrorSharedPage(uint64_t gpa, uint64_t hpa, unsigned perms);

  bool contains(uint64_t addr) const {
    return addr >= base && addr - base < size;
  }
  /* these take the enclave lock: another core may be tearing the
   * enclave down */
  bool isPageMapped(uint64_t linearAddress) const;
  Tcs* findTcs(uint64_t linearAddress) const;
  size_t getPageCount() const;
  size_t getTcsCount() const;
  unsigned getBusyCount() const;

  EnclaveState getState() const {
    return state.load(std::memory_order_acquire);
  }
  EnclaveRef getRef() const { return self; }
  uint64_t getBase() const { return base; }
  uint64_t getSize() const { return size; }
  const Measurement& getMeasurement() const { return measurement; }
  const GuestPageTable& getPageTable() const { return pageTable; }

 private:
  Enclave(const Enclave&);
  Enclave& operator=(const Enclave&);

  struct EnclavePage {
    EpcPageHandle handle;
    EpcPageType type;
    unsigned perms;
  };

  void setState(EnclaveState next);
  Error checkIntegrityLocked();
  Tcs* findTcsLocked(uint64_t linearAddress) const;
  Error releasePage(uint64_t linearAddress, const EnclavePage& page);
  void deleteThread(uint64_t linearAddress);
  void releaseResources();
  void forceDestroyLocked();

  EpcAllocator& epc;
  GuestPageTable pageTable;
  Measurement measurement;
  mutable SpinLock lock;

  EnclaveRef self;
  std::atomic<EnclaveState> state;
  uint64_t base;
  uint64_t size;
  uint64_t ssaFrameSize;
  uint64_t xfrm;
  uint64_t attributes;
  EpcPageHandle secsPage;
  bool hasSecsPage;
  /* keyed by linear address, so iteration follows the address order */
  std::map<uint64_t, EnclavePage> pages;
  std::vector<Tcs*> threads;
  unsigned busyCount;
};

}  // namespace HyperEnclave
