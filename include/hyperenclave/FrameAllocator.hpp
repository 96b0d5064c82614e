//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <set>
#include "SpinLock.hpp"
#include "common.hpp"

namespace HyperEnclave {

/* Physical frame source for non-EPC memory (page tables, VMCS/VMCB,
 * host save areas). The buddy/bitmap allocator behind it belongs to
 * platform bring-up. */
class FrameAllocator {
 public:
  virtual ~FrameAllocator() {}
  /* returns a zeroed 4 KiB frame, or 0 when out of memory */
  virtual uint64_t allocFrame() = 0;
  virtual void freeFrame(uint64_t physAddr) = 0;
  virtual void* physToVirt(uint64_t physAddr) const = 0;
};

/* Frames carved from a linear direct map: virt = phys + offset. */
class DirectMapFrameAllocator : public FrameAllocator {
 public:
  typedef uint64_t (*AllocFn)();
  typedef void (*FreeFn)(uint64_t);

  DirectMapFrameAllocator(AllocFn alloc, FreeFn free, uint64_t offset);
  uint64_t allocFrame();
  void freeFrame(uint64_t physAddr);
  void* physToVirt(uint64_t physAddr) const;

 private:
  AllocFn allocFn;
  FreeFn freeFn;
  uint64_t directMapOffset;
};

/* Hosted stand-in: frames come from the heap and "physical" addresses
 * are the host pointers themselves. */
class SimulatedFrameAllocator : public FrameAllocator {
 public:
  SimulatedFrameAllocator();
  ~SimulatedFrameAllocator();
  uint64_t allocFrame();
  void freeFrame(uint64_t physAddr);
  void* physToVirt(uint64_t physAddr) const;

  size_t getLiveFrames() const { return frames.size(); }
  void setLimit(size_t maxFrames) { limit = maxFrames; }

 private:
  std::set<uint64_t> frames;
  size_t limit;
  SpinLock lock;
};

}  // namespace HyperEnclave
