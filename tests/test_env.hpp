//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <gtest/gtest.h>
#include <stddef.h>
#include <stdint.h>

#include "FrameAllocator.hpp"
#include "HyperCall.hpp"
#include "Hypervisor.hpp"
#include "Params.hpp"
#include "Registers.hpp"
#include "SimBackend.hpp"

namespace HyperEnclave {
namespace test {

/* enclave ranges used by the tests sit well away from heap memory */
#define TEST_ENCLAVE_BASE 0x10000000ULL
#define TEST_HOST_RIP 0x401000ULL
#define TEST_AEP 0x402000ULL

/* Page-aligned heap range standing in for a physical one. */
class HostBuffer {
 public:
  explicit HostBuffer(size_t pages);
  ~HostBuffer();

  uint8_t* get() const { return mem; }
  uint64_t addr() const { return reinterpret_cast<uint64_t>(mem); }
  size_t getPages() const { return pages; }

 private:
  HostBuffer(const HostBuffer&);
  HostBuffer& operator=(const HostBuffer&);

  uint8_t* mem;
  size_t pages;
};

LinuxContext
makeLinuxContext();

SecsParams
makeSecs(uint64_t base, size_t pages);

TcsDescriptor
makeTcsDescriptor(uint64_t nssa, uint64_t oentry, uint64_t stackPointer);

/* A hypervisor over simulated memory: small EPC, a few pages of guest
 * RAM identity mapped in the primary table, one initialized VCPU. */
class SimHypervisorTest : public ::testing::Test {
 protected:
  enum { kEpcPages = 64, kGuestPages = 32 };

  SimHypervisorTest();
  ~SimHypervisorTest();

  void SetUp();
  void TearDown();

  uint64_t guestAddr(size_t offset) const { return guestRam.addr() + offset; }
  void writeGuest(size_t offset, const void* src, size_t len);

  Vcpu& vcpu() { return hv->getVcpu(0); }
  SimBackend& sim() { return hv->getVcpu(0).getBackend(); }
  EpcAllocator& epc() { return hv->getEpc(); }
  EnclaveTable& enclaves() { return hv->getEnclaves(); }

  /* Create an enclave with one TCS page at the base followed by the
   * given regular pages, all through the emulation layer. */
  EnclaveRef buildEnclave(
      uint64_t base, const uint8_t* fills, size_t count, uint64_t nssa = 2);

  SimulatedFrameAllocator frames;
  HostBuffer epcMemory;
  HostBuffer guestRam;
  Params params;
  Hypervisor* hv;
};

}  // namespace test
}  // namespace HyperEnclave
