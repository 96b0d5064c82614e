//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "EnclaveTable.hpp"
#include <mutex>

namespace HyperEnclave {

EnclaveTable::EnclaveTable(
    unsigned maxEnclaves, EpcAllocator& epcAllocator,
    FrameAllocator& frameAllocator)
    : epc(epcAllocator), frames(frameAllocator) {
  Slot empty = {NULL, 0, 0};
  slots.assign(maxEnclaves, empty);
}

EnclaveTable::~EnclaveTable() {
  for (size_t i = 0; i < slots.size(); i++) delete slots[i].enclave;
}

bool
EnclaveTable::overlaps(uint64_t base, uint64_t size) const {
  for (size_t i = 0; i < slots.size(); i++) {
    if (!isLive(slots[i])) continue;
    const Enclave* e = slots[i].enclave;
    if (base < e->getBase() + e->getSize() && e->getBase() < base + size)
      return true;
  }
  return false;
}

Error
EnclaveTable::create(const SecsParams& secs, EnclaveRef* ref) {
  std::lock_guard<SpinLock> guard(lock);

  /* Enclave::create checks the wrap-around case before anything can
   * overflow here */
  if (secs.size && secs.base + secs.size > secs.base &&
      overlaps(secs.base, secs.size)) {
    HE_WARN(
        "enclave range [%#lx, %#lx) overlaps a live enclave", secs.base,
        secs.base + secs.size);
    return Error::InvalidRange;
  }

  size_t idx = slots.size();
  for (size_t i = 0; i < slots.size(); i++) {
    if (!isLive(slots[i]) && slots[i].users == 0) {
      idx = i;
      break;
    }
  }
  if (idx == slots.size()) {
    HE_WARN("enclave table full (%lu slots)", (unsigned long)slots.size());
    return Error::Exhausted;
  }

  Slot& slot       = slots[idx];
  Enclave* enclave = new Enclave(epc, frames);
  uint32_t gen     = slot.generation + 1;
  if (gen == 0) gen = 1;
  EnclaveRef newRef = {static_cast<uint32_t>(idx), gen};

  Error ret = enclave->create(newRef, secs);
  if (ret != Error::Success) {
    delete enclave;
    return ret;
  }

  delete slot.enclave;
  slot.enclave    = enclave;
  slot.generation = gen;
  *ref            = newRef;
  return Error::Success;
}

Enclave*
EnclaveTable::acquire(EnclaveRef ref) {
  std::lock_guard<SpinLock> guard(lock);
  if (ref.isNone() || ref.slot >= slots.size()) return NULL;

  Slot& slot = slots[ref.slot];
  if (slot.generation != ref.generation || !isLive(slot)) return NULL;
  slot.users++;
  return slot.enclave;
}

void
EnclaveTable::release(EnclaveRef ref) {
  std::lock_guard<SpinLock> guard(lock);
  if (ref.slot >= slots.size()) return;
  Slot& slot = slots[ref.slot];
  if (slot.generation == ref.generation && slot.users) slot.users--;
}

Error
EnclaveTable::destroy(EnclaveRef ref) {
  Guard enclave(*this, ref);
  if (!enclave) return Error::NotFound;
  return enclave->destroy();
}

bool
EnclaveTable::findByAddress(uint64_t addr, EnclaveRef* ref) const {
  std::lock_guard<SpinLock> guard(lock);
  for (size_t i = 0; i < slots.size(); i++) {
    if (isLive(slots[i]) && slots[i].enclave->contains(addr)) {
      *ref = slots[i].enclave->getRef();
      return true;
    }
  }
  return false;
}

size_t
EnclaveTable::getLiveCount() const {
  std::lock_guard<SpinLock> guard(lock);
  size_t count = 0;
  for (size_t i = 0; i < slots.size(); i++) {
    if (isLive(slots[i])) count++;
  }
  return count;
}

}  // namespace HyperEnclave
