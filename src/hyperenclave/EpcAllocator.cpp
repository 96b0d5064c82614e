//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "EpcAllocator.hpp"
#include <string.h>
#include <mutex>

namespace HyperEnclave {

EpcAllocator::EpcAllocator(const EpcRegion& region) {
  physBase  = region.physBase;
  virtBase  = reinterpret_cast<uint8_t*>(region.virtBase);
  freeCount = 0;

  pages.resize(region.numPages);
  freeMap.assign((region.numPages + 63) / 64, 0);

  for (size_t i = 0; i < region.numPages; i++) {
    pages[i].pfn   = (physBase >> PAGE_BITS) + i;
    pages[i].type  = EpcPageType::Regular;
    pages[i].owner = EnclaveRef::none();
    markFree(static_cast<EpcPageHandle>(i));
  }
}

void
EpcAllocator::markFree(EpcPageHandle handle) {
  pages[handle].state = EpcPageState::Free;
  pages[handle].owner = EnclaveRef::none();
  freeMap[handle / 64] |= 1ULL << (handle % 64);
  freeCount++;
}

void
EpcAllocator::zeroPage(EpcPageHandle handle) {
  memset(getPtr(handle), 0, PAGE_SIZE);
}

Error
EpcAllocator::allocate(
    EpcPageType type, EnclaveRef owner, EpcPageHandle* handle) {
  EpcPageHandle found = 0;
  bool ok             = false;
  {
    std::lock_guard<SpinLock> guard(lock);
    for (size_t w = 0; w < freeMap.size(); w++) {
      if (freeMap[w] == 0) continue;
      unsigned bit = __builtin_ctzll(freeMap[w]);
      found        = static_cast<EpcPageHandle>(w * 64 + bit);
      freeMap[w] &= ~(1ULL << bit);
      freeCount--;
      pages[found].state = EpcPageState::Pending;
      pages[found].type  = type;
      pages[found].owner = owner;
      ok                 = true;
      break;
    }
  }

  if (!ok) {
    HE_WARN("EPC exhausted (%lu pages)", (unsigned long)pages.size());
    return Error::Exhausted;
  }

  /* the frame is ours alone now; scrub whatever the last owner left */
  zeroPage(found);
  *handle = found;
  return Error::Success;
}

Error
EpcAllocator::free(EpcPageHandle handle) {
  std::lock_guard<SpinLock> guard(lock);
  if (!isValidHandle(handle)) return Error::InvalidParameter;

  switch (pages[handle].state) {
    case EpcPageState::Free:
      return Error::Success;
    case EpcPageState::Reclaimed:
      markFree(handle);
      return Error::Success;
    default:
      HE_ERROR(
          "refusing to free EPC page %u in state %d", handle,
          static_cast<int>(pages[handle].state));
      return Error::IllegalFree;
  }
}

Error
EpcAllocator::validate(EpcPageHandle handle) {
  std::lock_guard<SpinLock> guard(lock);
  if (!isValidHandle(handle)) return Error::InvalidParameter;
  if (pages[handle].state != EpcPageState::Pending) return Error::InvalidState;
  pages[handle].state = EpcPageState::Valid;
  return Error::Success;
}

Error
EpcAllocator::block(EpcPageHandle handle) {
  std::lock_guard<SpinLock> guard(lock);
  if (!isValidHandle(handle)) return Error::InvalidParameter;

  EpcPageState state = pages[handle].state;
  if (state == EpcPageState::Blocked) return Error::Success;
  if (state != EpcPageState::Pending && state != EpcPageState::Valid)
    return Error::InvalidState;
  pages[handle].state = EpcPageState::Blocked;
  return Error::Success;
}

Error
EpcAllocator::reclaim(EpcPageHandle handle) {
  if (!isValidHandle(handle)) return Error::InvalidParameter;
  {
    std::lock_guard<SpinLock> guard(lock);
    EpcPageState state = pages[handle].state;
    if (state == EpcPageState::Free || state == EpcPageState::Reclaimed)
      return Error::InvalidState;
  }

  zeroPage(handle);

  std::lock_guard<SpinLock> guard(lock);
  pages[handle].state = EpcPageState::Reclaimed;
  pages[handle].owner = EnclaveRef::none();
  return Error::Success;
}

bool
EpcAllocator::checkOwner(
    EpcPageHandle handle, EnclaveRef owner, EpcPageState expected) const {
  std::lock_guard<SpinLock> guard(lock);
  if (!isValidHandle(handle)) return false;
  return pages[handle].owner == owner && pages[handle].state == expected;
}

EpcPageState
EpcAllocator::getState(EpcPageHandle handle) const {
  std::lock_guard<SpinLock> guard(lock);
  return pages[handle].state;
}

EpcPageType
EpcAllocator::getType(EpcPageHandle handle) const {
  std::lock_guard<SpinLock> guard(lock);
  return pages[handle].type;
}

EnclaveRef
EpcAllocator::getOwner(EpcPageHandle handle) const {
  std::lock_guard<SpinLock> guard(lock);
  return pages[handle].owner;
}

uint64_t
EpcAllocator::getPhysAddr(EpcPageHandle handle) const {
  return pages[handle].pfn << PAGE_BITS;
}

void*
EpcAllocator::getPtr(EpcPageHandle handle) const {
  return virtBase + static_cast<size_t>(handle) * PAGE_SIZE;
}

bool
EpcAllocator::lookup(uint64_t physAddr, EpcPageHandle* handle) const {
  if (physAddr < physBase) return false;
  uint64_t idx = (physAddr - physBase) >> PAGE_BITS;
  if (idx >= pages.size()) return false;
  *handle = static_cast<EpcPageHandle>(idx);
  return true;
}

size_t
EpcAllocator::getFreeCount() const {
  std::lock_guard<SpinLock> guard(lock);
  return freeCount;
}

}  // namespace HyperEnclave
