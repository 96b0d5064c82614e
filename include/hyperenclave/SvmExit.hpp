//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>
#include "Registers.hpp"

/* #VMEXIT codes, AMD APM Vol. 2 Appendix C */
#define SVM_EXIT_EXCP_BASE 0x040
#define SVM_EXIT_EXCP_LAST 0x05f
#define SVM_EXIT_INTR 0x060
#define SVM_EXIT_NMI 0x061
#define SVM_EXIT_VINTR 0x064
#define SVM_EXIT_CPUID 0x072
#define SVM_EXIT_HLT 0x078
#define SVM_EXIT_MSR 0x07c
#define SVM_EXIT_VMMCALL 0x081
#define SVM_EXIT_XSETBV 0x08d
#define SVM_EXIT_NPF 0x400
#define SVM_EXIT_INVALID ((uint64_t)-1)

/* EXITINFO1 for #NPF mirrors the #PF error code */
#define SVM_NPF_WRITE (1ULL << 1)
#define SVM_NPF_FETCH (1ULL << 4)

namespace HyperEnclave {

/* Raw VMCB control-area fields after #VMEXIT. */
struct SvmExitRecord {
  uint64_t exitCode;
  uint64_t exitInfo1;
  uint64_t exitInfo2;
  uint64_t rip;
  uint64_t nextRip;
  uint64_t rax;
};

ExitInfo
svmDecodeExit(const SvmExitRecord& record);

}  // namespace HyperEnclave
