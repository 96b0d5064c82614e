//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "AexRedirector.hpp"
#include "EnclaveInstructions.hpp"
#include "EnclaveTable.hpp"
#include "EpcAllocator.hpp"
#include "Error.hpp"
#include "ExitDispatcher.hpp"
#include "FrameAllocator.hpp"
#include "GuestMemory.hpp"
#include "Params.hpp"
#include "Registers.hpp"
#include "VendorBackend.hpp"
#include "Vcpu.hpp"

namespace HyperEnclave {

/* Everything the hypervisor owns, built once at startup. Platform
 * bring-up calls init() on the boot core, then initVcpu() and runVcpu()
 * on each core with that core's captured Linux context. */
class Hypervisor {
 public:
  Hypervisor(FrameAllocator& frames, const Params& params);
  ~Hypervisor();

  Error init();
  Error initVcpu(unsigned cpuId, const LinuxContext& linux);
  /* returns once the guest disables the hypervisor on this core */
  Error runVcpu(unsigned cpuId);

  EpcAllocator& getEpc() { return *epc; }
  EnclaveTable& getEnclaves() { return *enclaves; }
  EnclaveInstructions& getInstructions() { return *instructions; }
  const GuestPageTable& getPrimaryTable() const { return primary; }
  const GuestMemory& getGuestMemory() const { return *memory; }
  Vcpu& getVcpu(unsigned cpuId) { return *vcpus[cpuId]; }
  unsigned getNumCpus() const { return static_cast<unsigned>(vcpus.size()); }

 private:
  Hypervisor(const Hypervisor&);
  Hypervisor& operator=(const Hypervisor&);

  Error buildPrimaryTable();
  bool overlapsEpc(uint64_t addr) const;

  FrameAllocator& frames;
  Params params;
  EpcRegion epcRegion;
  GuestPageTable primary;

  EpcAllocator* epc;
  EnclaveTable* enclaves;
  GuestMemory* memory;
  EnclaveInstructions* instructions;
  AexRedirector* redirector;
  ExitDispatcher* dispatcher;
  std::vector<Vcpu*> vcpus;
};

}  // namespace HyperEnclave
