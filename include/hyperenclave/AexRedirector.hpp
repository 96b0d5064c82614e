//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "Config.hpp"
#include "Enclave.hpp"
#include "EnclaveTable.hpp"
#include "GuestMemory.hpp"
#include "Registers.hpp"
#include "Vcpu.hpp"

namespace HyperEnclave {

/* Asynchronous enclave exits. Any interrupt, exception or nested page
 * fault taken while a VCPU runs enclave code lands here; the enclave
 * state goes to the SSA and the host resumes at the AEP with nothing
 * but synthetic register values. */
class AexRedirector {
 public:
  AexRedirector(
      EnclaveTable& table, const GuestMemory& memory,
      bool enclaveInterrupt = Config::kEnclaveInterrupt);

  /* false when the exit does not concern enclave mode */
  bool intercept(Vcpu& vcpu, const ExitInfo& exit);

  /* Save the enclave context into the next SSA frame and return to the
   * host at the AEP. hostEvent, if given, is delivered to the host on
   * the next entry. */
  void asyncExit(
      Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const PendingEvent& cause,
      const PendingEvent* hostEvent);

  /* Split a fault into what the enclave records in its SSA and what the
   * host kernel gets to see. */
  static void fixupException(
      const Enclave& enclave, const PendingEvent& fault, bool sharedPage,
      PendingEvent* enclaveView, PendingEvent* hostView);

 private:
  void handleInterrupt(
      Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit);
  void handleException(
      Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit);
  void handleNestedPageFault(
      Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const ExitInfo& exit);
  void raisePageFault(
      Vcpu& vcpu, Enclave& enclave, Tcs& tcs, const PendingEvent& fault);
  bool isSharedPage(const Enclave& enclave, uint64_t addr) const;

  EnclaveTable& table;
  const GuestMemory& memory;
  bool enclaveInterrupt;
};

}  // namespace HyperEnclave
