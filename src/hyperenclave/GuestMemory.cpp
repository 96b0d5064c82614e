//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "GuestMemory.hpp"
#include <string.h>
#include "common.hpp"

namespace HyperEnclave {

GuestMemory::GuestMemory(
    const GuestPageTable& primaryTable, const FrameAllocator& frameAllocator)
    : primary(primaryTable), frames(frameAllocator) {}

bool
GuestMemory::translate(uint64_t gpa, uint64_t* hpa, unsigned* perms) const {
  return primary.translate(gpa, hpa, perms);
}

Error
GuestMemory::read(uint64_t gpa, void* dst, size_t len) const {
  uint8_t* out = reinterpret_cast<uint8_t*>(dst);

  while (len) {
    uint64_t hpa;
    unsigned perms;
    if (!primary.translate(gpa, &hpa, &perms) || !(perms & Perm::Read)) {
      HE_DEBUG("guest read from unmapped gpa %#lx", gpa);
      return Error::InvalidParameter;
    }

    size_t chunk = PAGE_SIZE - (gpa & (PAGE_SIZE - 1));
    if (chunk > len) chunk = len;
    memcpy(out, frames.physToVirt(hpa), chunk);

    out += chunk;
    gpa += chunk;
    len -= chunk;
  }
  return Error::Success;
}

}  // namespace HyperEnclave
