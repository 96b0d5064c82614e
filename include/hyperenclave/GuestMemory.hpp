//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include "Error.hpp"
#include "FrameAllocator.hpp"
#include "VendorBackend.hpp"

namespace HyperEnclave {

/* Access to normal guest memory through the primary nested page table.
 * Everything the guest passes by address goes through here, so EPC and
 * unmapped memory are never reachable from a parameter block. */
class GuestMemory {
 public:
  GuestMemory(const GuestPageTable& primary, const FrameAllocator& frames);

  Error read(uint64_t gpa, void* dst, size_t len) const;
  /* host physical address of gpa, when the guest may access it */
  bool translate(uint64_t gpa, uint64_t* hpa, unsigned* perms) const;

 private:
  const GuestPageTable& primary;
  const FrameAllocator& frames;
};

}  // namespace HyperEnclave
