//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "AexRedirector.hpp"
#include "EnclaveInstructions.hpp"
#include "EnclaveTable.hpp"
#include "EpcAllocator.hpp"
#include "Error.hpp"
#include "Registers.hpp"
#include "Vcpu.hpp"

namespace HyperEnclave {

#define HE_CPUID_LEAF_HYPERVISOR 0x40000000U
#define HE_CPUID_SIGNATURE "HyperEnclave"

class ExitDispatcher {
 public:
  ExitDispatcher(
      EnclaveTable& table, EnclaveInstructions& instructions,
      AexRedirector& redirector, const EpcAllocator& epc);

  /* Enter the guest and handle exits until the guest disables the
   * hypervisor (Success) or an entry fails. */
  Error run(Vcpu& vcpu);

  /* one exit; false stops the loop */
  bool handleExit(Vcpu& vcpu, const ExitInfo& exit);

 private:
  void deliverPendingEvent(Vcpu& vcpu);
  bool handleHypercall(Vcpu& vcpu, const ExitInfo& exit);
  void handlePrivileged(Vcpu& vcpu, const ExitInfo& exit);
  void reflectEvent(Vcpu& vcpu, const ExitInfo& exit);
  void emulateCpuid(Vcpu& vcpu);
  void emulateXsetbv(Vcpu& vcpu, unsigned length);
  /* #UD/#GP for the current mode: injected into the host, or an AEX
   * when it happens inside an enclave */
  void raiseException(Vcpu& vcpu, uint8_t vector, bool hasErrorCode);

  EnclaveTable& table;
  EnclaveInstructions& instructions;
  AexRedirector& redirector;
  const EpcAllocator& epc;
};

}  // namespace HyperEnclave
