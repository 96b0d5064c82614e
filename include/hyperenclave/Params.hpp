//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "Config.hpp"

namespace HyperEnclave {

struct MemoryRegion {
  uint64_t base;
  uint64_t size;
};

/* Startup parameters handed over by platform bring-up. */
class Params {
 public:
  Params() {
    numCpus         = 1;
    epcPhysBase     = 0;
    directMapOffset = 0;
    epcPages        = Config::kEpcPages;
    maxEnclaves     = Config::kDefaultMaxEnclaves;
  }

  void setNumCpus(unsigned n) { numCpus = n; }
  void setEpcPhysBase(uint64_t base) { epcPhysBase = base; }
  void setDirectMapOffset(uint64_t offset) { directMapOffset = offset; }
  /* the build-time EPC size unless overridden for a hosted run */
  void setEpcPages(size_t n) { epcPages = n; }
  void setMaxEnclaves(unsigned n) { maxEnclaves = n; }
  void addGuestMemory(uint64_t base, uint64_t size) {
    MemoryRegion region = {base, size};
    guestMemory.push_back(region);
  }

  unsigned getNumCpus() const { return numCpus; }
  uint64_t getEpcPhysBase() const { return epcPhysBase; }
  uint64_t getDirectMapOffset() const { return directMapOffset; }
  size_t getEpcPages() const { return epcPages; }
  unsigned getMaxEnclaves() const { return maxEnclaves; }
  const std::vector<MemoryRegion>& getGuestMemory() const {
    return guestMemory;
  }

 private:
  unsigned numCpus;
  uint64_t epcPhysBase;
  uint64_t directMapOffset;
  size_t epcPages;
  unsigned maxEnclaves;
  std::vector<MemoryRegion> guestMemory;
};

}  // namespace HyperEnclave
