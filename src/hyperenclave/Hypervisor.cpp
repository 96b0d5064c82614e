//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "Hypervisor.hpp"
#include "Config.hpp"
#include "common.hpp"

namespace HyperEnclave {

Hypervisor::Hypervisor(FrameAllocator& frameAllocator, const Params& p)
    : frames(frameAllocator), params(p), primary(frameAllocator) {
  epcRegion.physBase = params.getEpcPhysBase();
  epcRegion.virtBase = reinterpret_cast<void*>(
      params.getEpcPhysBase() + params.getDirectMapOffset());
  epcRegion.numPages = params.getEpcPages();

  epc          = NULL;
  enclaves     = NULL;
  memory       = NULL;
  instructions = NULL;
  redirector   = NULL;
  dispatcher   = NULL;
}

Hypervisor::~Hypervisor() {
  for (size_t i = 0; i < vcpus.size(); i++) {
    vcpus[i]->getBackend().teardown();
    delete vcpus[i];
  }
  if (dispatcher) delete dispatcher;
  if (redirector) delete redirector;
  if (instructions) delete instructions;
  if (memory) delete memory;
  if (enclaves) delete enclaves;
  if (epc) delete epc;
}

bool
Hypervisor::overlapsEpc(uint64_t addr) const {
  return addr >= epcRegion.physBase &&
         addr - epcRegion.physBase < epcRegion.numPages * PAGE_SIZE;
}

Error
Hypervisor::buildPrimaryTable() {
  Error ret = primary.init();
  if (ret != Error::Success) return ret;

  const std::vector<MemoryRegion>& regions = params.getGuestMemory();
  for (size_t i = 0; i < regions.size(); i++) {
    uint64_t addr = PAGE_DOWN(regions[i].base);
    uint64_t end  = PAGE_UP(regions[i].base + regions[i].size);

    for (; addr < end; addr += PAGE_SIZE) {
      /* EPC is never reachable from normal mode */
      if (overlapsEpc(addr)) continue;
      ret = VendorBackend::mapGuestPhysical(
          primary, addr, addr, Perm::All, false);
      if (ret != Error::Success) {
        HE_ERROR(
            "cannot map guest memory at %#lx: %s", addr, errorString(ret));
        return ret;
      }
    }
  }
  return Error::Success;
}

Error
Hypervisor::init() {
  if (!epcRegion.numPages || !IS_ALIGNED(epcRegion.physBase, PAGE_SIZE)) {
    HE_ERROR("invalid EPC region at %#lx", epcRegion.physBase);
    return Error::InvalidParameter;
  }
  if (!params.getNumCpus()) return Error::InvalidParameter;

  Error ret = buildPrimaryTable();
  if (ret != Error::Success) return ret;

  epc      = new EpcAllocator(epcRegion);
  enclaves = new EnclaveTable(params.getMaxEnclaves(), *epc, frames);
  memory   = new GuestMemory(primary, frames);
  instructions = new EnclaveInstructions(*enclaves, *memory);
  redirector   = new AexRedirector(*enclaves, *memory);
  dispatcher   = new ExitDispatcher(*enclaves, *instructions, *redirector, *epc);

  for (unsigned i = 0; i < params.getNumCpus(); i++) {
    vcpus.push_back(new Vcpu(i, primary));
  }

  HE_INFO(
      "hypervisor ready: %u CPUs, %zu EPC pages at %#lx, %u enclave slots",
      params.getNumCpus(), epcRegion.numPages, epcRegion.physBase,
      params.getMaxEnclaves());
  return Error::Success;
}

Error
Hypervisor::initVcpu(unsigned cpuId, const LinuxContext& linux) {
  if (cpuId >= vcpus.size()) return Error::InvalidParameter;

  Error ret = vcpus[cpuId]->init(linux, frames);
  if (ret != Error::Success) {
    HE_ERROR(
        "CPU %u: cannot enable virtualization: %s", cpuId, errorString(ret));
  }
  return ret;
}

Error
Hypervisor::runVcpu(unsigned cpuId) {
  if (cpuId >= vcpus.size()) return Error::InvalidParameter;

  Vcpu& vcpu = *vcpus[cpuId];
  Error ret  = dispatcher->run(vcpu);
  vcpu.getBackend().teardown();
  HE_INFO("CPU %u: left the hypervisor", cpuId);
  return ret;
}

}  // namespace HyperEnclave
