//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "EnclaveTable.hpp"
#include "Error.hpp"
#include "GuestMemory.hpp"
#include "HyperCall.hpp"
#include "Registers.hpp"
#include "Vcpu.hpp"

namespace HyperEnclave {

/* Emulation of the enclave instructions on top of the enclave table.
 * The lifecycle operations take decoded arguments; emulate() does the
 * register decoding for a trapped hypercall. */
class EnclaveInstructions {
 public:
  EnclaveInstructions(EnclaveTable& table, const GuestMemory& memory);

  Error create(const SecsParams& secs, EnclaveRef* ref);
  Error addPage(EnclaveRef ref, const PageInfo& info);
  Error init(EnclaveRef ref, const uint8_t* expected);
  Error destroy(EnclaveRef ref);
  Error removePage(EnclaveRef ref, uint64_t linearAddress);

  /* RAX = CSSA, RCX = return address on success */
  Error enter(Vcpu& vcpu, EnclaveRef ref, uint64_t tcsAddr, uint64_t aep);
  Error exit(Vcpu& vcpu, uint64_t target);
  Error resume(Vcpu& vcpu, uint64_t tcsAddr, uint64_t aep);

  /* The instruction pointer must already be past the hypercall. */
  void emulate(Vcpu& vcpu, const ExitInfo& exit);

 private:
  EnclaveTable& table;
  const GuestMemory& memory;
};

}  // namespace HyperEnclave
