//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "FrameAllocator.hpp"
#include <stdlib.h>
#include <string.h>
#include <mutex>

namespace HyperEnclave {

DirectMapFrameAllocator::DirectMapFrameAllocator(
    AllocFn alloc, FreeFn free, uint64_t offset) {
  allocFn         = alloc;
  freeFn          = free;
  directMapOffset = offset;
}

uint64_t
DirectMapFrameAllocator::allocFrame() {
  uint64_t pa = allocFn();
  if (!pa) return 0;
  memset(physToVirt(pa), 0, PAGE_SIZE);
  return pa;
}

void
DirectMapFrameAllocator::freeFrame(uint64_t physAddr) {
  freeFn(physAddr);
}

void*
DirectMapFrameAllocator::physToVirt(uint64_t physAddr) const {
  return reinterpret_cast<void*>(physAddr + directMapOffset);
}

SimulatedFrameAllocator::SimulatedFrameAllocator() { limit = 0; }

SimulatedFrameAllocator::~SimulatedFrameAllocator() {
  for (std::set<uint64_t>::iterator it = frames.begin(); it != frames.end();
       ++it) {
    ::free(reinterpret_cast<void*>(*it));
  }
}

uint64_t
SimulatedFrameAllocator::allocFrame() {
  std::lock_guard<SpinLock> guard(lock);
  if (limit && frames.size() >= limit) return 0;

  void* ptr = NULL;
  if (posix_memalign(&ptr, PAGE_SIZE, PAGE_SIZE) != 0) return 0;
  memset(ptr, 0, PAGE_SIZE);
  uint64_t pa = reinterpret_cast<uint64_t>(ptr);
  frames.insert(pa);
  return pa;
}

void
SimulatedFrameAllocator::freeFrame(uint64_t physAddr) {
  std::lock_guard<SpinLock> guard(lock);
  if (frames.erase(physAddr) == 0) {
    HE_ERROR("freeing unknown frame 0x%lx", (unsigned long)physAddr);
    return;
  }
  ::free(reinterpret_cast<void*>(physAddr));
}

void*
SimulatedFrameAllocator::physToVirt(uint64_t physAddr) const {
  return reinterpret_cast<void*>(physAddr);
}

}  // namespace HyperEnclave
