//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "Error.hpp"
#include "SpinLock.hpp"
#include "common.hpp"

namespace HyperEnclave {

/* Weak reference to an enclave: a slot in the enclave table plus the
 * generation the slot had when the reference was taken. It never keeps
 * the enclave alive; a bumped generation makes it stale. */
struct EnclaveRef {
  uint32_t slot;
  uint32_t generation;

  static EnclaveRef none() {
    EnclaveRef ref = {0, 0};
    return ref;
  }
  static EnclaveRef fromId(uint64_t id) {
    EnclaveRef ref = {static_cast<uint32_t>(id),
                      static_cast<uint32_t>(id >> 32)};
    return ref;
  }
  uint64_t toId() const {
    return (static_cast<uint64_t>(generation) << 32) | slot;
  }
  /* generation 0 is never handed out */
  bool isNone() const { return generation == 0; }
  bool operator==(const EnclaveRef& other) const {
    return slot == other.slot && generation == other.generation;
  }
  bool operator!=(const EnclaveRef& other) const { return !(*this == other); }
};

enum class EpcPageState : uint8_t {
  Free,
  Pending,
  Valid,
  Blocked,
  Reclaimed,
};

enum class EpcPageType : uint8_t {
  Regular,
  Tcs,
  Secs,
};

typedef uint32_t EpcPageHandle;

struct EpcRegion {
  uint64_t physBase;
  void* virtBase;
  size_t numPages;
};

/* Leases 4 KiB frames of the EPC pool to enclaves. The pool is handed
 * over once at startup and lives until shutdown. */
class EpcAllocator {
 public:
  explicit EpcAllocator(const EpcRegion& region);

  /* First fit. The frame is zeroed before the handle is returned and
   * starts out Pending. */
  Error allocate(EpcPageType type, EnclaveRef owner, EpcPageHandle* handle);
  /* Only Free or Reclaimed pages go back to the pool. */
  Error free(EpcPageHandle handle);

  Error validate(EpcPageHandle handle);
  Error block(EpcPageHandle handle);
  /* zero the frame and drop the owner */
  Error reclaim(EpcPageHandle handle);

  bool checkOwner(
      EpcPageHandle handle, EnclaveRef owner, EpcPageState expected) const;

  EpcPageState getState(EpcPageHandle handle) const;
  EpcPageType getType(EpcPageHandle handle) const;
  EnclaveRef getOwner(EpcPageHandle handle) const;
  uint64_t getPhysAddr(EpcPageHandle handle) const;
  void* getPtr(EpcPageHandle handle) const;
  bool lookup(uint64_t physAddr, EpcPageHandle* handle) const;

  size_t getCapacity() const { return pages.size(); }
  size_t getFreeCount() const;

 private:
  struct EpcPage {
    uint64_t pfn;
    EpcPageState state;
    EpcPageType type;
    EnclaveRef owner;
  };

  bool isValidHandle(EpcPageHandle handle) const {
    return handle < pages.size();
  }
  void markFree(EpcPageHandle handle);
  void zeroPage(EpcPageHandle handle);

  uint64_t physBase;
  uint8_t* virtBase;
  std::vector<EpcPage> pages;
  /* one bit per frame, set when free */
  std::vector<uint64_t> freeMap;
  size_t freeCount;
  mutable SpinLock lock;
};

}  // namespace HyperEnclave
