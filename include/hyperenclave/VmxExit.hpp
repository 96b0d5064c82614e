//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "Registers.hpp"

/* Basic exit reasons, Intel SDM Vol. 3 Appendix C */
#define VMX_EXIT_EXCEPTION_NMI 0
#define VMX_EXIT_EXTERNAL_INTERRUPT 1
#define VMX_EXIT_TRIPLE_FAULT 2
#define VMX_EXIT_INTERRUPT_WINDOW 7
#define VMX_EXIT_NMI_WINDOW 8
#define VMX_EXIT_CPUID 10
#define VMX_EXIT_HLT 12
#define VMX_EXIT_VMCALL 18
#define VMX_EXIT_RDMSR 31
#define VMX_EXIT_WRMSR 32
#define VMX_EXIT_ENTRY_FAIL_GUEST 33
#define VMX_EXIT_EPT_VIOLATION 48
#define VMX_EXIT_EPT_MISCONFIG 49
#define VMX_EXIT_XSETBV 55

/* VM-exit / VM-entry interruption information */
#define VMX_INTR_INFO_VECTOR_MASK 0xffU
#define VMX_INTR_INFO_TYPE_SHIFT 8
#define VMX_INTR_INFO_TYPE_MASK (7U << VMX_INTR_INFO_TYPE_SHIFT)
#define VMX_INTR_INFO_ERROR_CODE (1U << 11)
#define VMX_INTR_INFO_VALID (1U << 31)

#define VMX_INTR_TYPE_EXTERNAL 0
#define VMX_INTR_TYPE_NMI 2
#define VMX_INTR_TYPE_HW_EXCEPTION 3

/* EPT violation qualification */
#define VMX_EPT_QUAL_READ (1ULL << 0)
#define VMX_EPT_QUAL_WRITE (1ULL << 1)
#define VMX_EPT_QUAL_FETCH (1ULL << 2)

namespace HyperEnclave {

/* Raw VMCS exit fields, read right after VM exit. */
struct VmxExitRecord {
  uint32_t exitReason;
  uint64_t qualification;
  uint32_t interruptionInfo;
  uint32_t interruptionErrorCode;
  uint64_t guestPhysAddr;
  uint32_t instructionLength;
  uint64_t rax;
};

ExitInfo
vmxDecodeExit(const VmxExitRecord& record);

}  // namespace HyperEnclave
