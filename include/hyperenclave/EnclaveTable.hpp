//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "Enclave.hpp"
#include "EpcAllocator.hpp"
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "HyperCall.hpp"
#include "SpinLock.hpp"

namespace HyperEnclave {

/* Fixed set of enclave slots. An EnclaveRef names a slot and the
 * generation it had; a slot is recycled only once its enclave is
 * Destroyed and no handler still holds it. */
class EnclaveTable {
 public:
  EnclaveTable(
      unsigned maxEnclaves, EpcAllocator& epcAllocator,
      FrameAllocator& frameAllocator);
  ~EnclaveTable();

  /* validates the range against every live enclave, then builds the
   * new one in a free slot */
  Error create(const SecsParams& secs, EnclaveRef* ref);
  Error destroy(EnclaveRef ref);

  /* NULL when the reference is stale or the enclave is Destroyed */
  Enclave* acquire(EnclaveRef ref);
  void release(EnclaveRef ref);

  bool findByAddress(uint64_t addr, EnclaveRef* ref) const;
  size_t getLiveCount() const;
  unsigned getCapacity() const { return static_cast<unsigned>(slots.size()); }

  /* Holds a slot for the duration of one handler. */
  class Guard {
   public:
    Guard(EnclaveTable& table, EnclaveRef ref)
        : table(table), ref(ref), enclave(table.acquire(ref)) {}
    ~Guard() {
      if (enclave) table.release(ref);
    }

    Enclave* get() const { return enclave; }
    Enclave* operator->() const { return enclave; }
    explicit operator bool() const { return enclave != NULL; }

   private:
    Guard(const Guard&);
    Guard& operator=(const Guard&);

    EnclaveTable& table;
    EnclaveRef ref;
    Enclave* enclave;
  };

 private:
  EnclaveTable(const EnclaveTable&);
  EnclaveTable& operator=(const EnclaveTable&);

  struct Slot {
    Enclave* enclave;
    uint32_t generation;
    unsigned users;
  };

  bool isLive(const Slot& slot) const {
    return slot.enclave &&
           slot.enclave->getState() != EnclaveState::Destroyed &&
           slot.enclave->getState() != EnclaveState::Uninitialized;
  }
  bool overlaps(uint64_t base, uint64_t size) const;

  EpcAllocator& epc;
  FrameAllocator& frames;
  std::vector<Slot> slots;
  mutable SpinLock lock;
};

}  // namespace HyperEnclave
