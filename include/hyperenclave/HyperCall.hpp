//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stdint.h>

namespace HyperEnclave {

/* RAX on VMCALL/VMMCALL. Arguments in RBX, RCX, RDX; the Error result
 * goes back in RAX. */
enum class HyperCallCode : uint64_t {
  HypervisorDisable = 0x00,
  HypervisorVersion = 0x01,
  EpcQuery          = 0x02,

  EnclaveCreate     = 0x10,
  EnclaveAddPage    = 0x11,
  EnclaveInit       = 0x12,
  EnclaveDestroy    = 0x13,
  EnclaveRemovePage = 0x14,

  EnclaveEnter  = 0x20,
  EnclaveExit   = 0x21,
  EnclaveResume = 0x22,
};

#define HE_ENCLAVE_HC_FIRST 0x10
#define HE_ENCLAVE_HC_LAST 0x2f

inline bool
isEnclaveHyperCall(uint64_t code) {
  return code >= HE_ENCLAVE_HC_FIRST && code <= HE_ENCLAVE_HC_LAST;
}

/* Guest-physical parameter blocks. */

struct SecsParams {
  uint64_t base;
  uint64_t size;
  uint64_t ssaFrameSize;
  uint64_t xfrm;
  uint64_t attributes;
};

enum : uint64_t {
  PAGE_TYPE_REG = 0,
  PAGE_TYPE_TCS = 1,
};

struct PageInfo {
  uint64_t linearAddress;
  uint64_t sourceAddress;
  uint64_t pageType;
  uint64_t permissions;
};

/* layout of the first bytes of a TCS page */
struct TcsDescriptor {
  uint64_t flags;
  uint64_t nssa;
  uint64_t oentry;
  uint64_t ofsbase;
  uint64_t ogsbase;
  uint64_t stackPointer;
};

}  // namespace HyperEnclave
