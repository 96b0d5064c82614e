//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string.h>

namespace HyperEnclave {

/* The first sixteen follow the hardware GPR numbering; the entry stubs
 * rely on that order. */
enum class Reg : unsigned {
  Rax = 0,
  Rcx,
  Rdx,
  Rbx,
  Rsp,
  Rbp,
  Rsi,
  Rdi,
  R8,
  R9,
  R10,
  R11,
  R12,
  R13,
  R14,
  R15,
  Rip,
  Rflags,
  Cr0,
  Cr3,
  Cr4,
  Efer,
  FsBase,
  GsBase,
  Xcr0,
  Count,
};

#define HE_NUM_GPRS 16
#define HE_NUM_REGS (static_cast<unsigned>(::HyperEnclave::Reg::Count))

/* Saved by the VM-exit stubs. The rsp slot is a placeholder: the guest
 * stack pointer lives in the VMCS/VMCB. */
struct GuestRegisters {
  uint64_t gpr[HE_NUM_GPRS];
};
static_assert(sizeof(GuestRegisters) == 128, "entry stub layout");

struct RegisterFile {
  uint64_t value[HE_NUM_REGS];

  void clear() { memset(value, 0, sizeof(value)); }
  uint64_t get(Reg r) const { return value[static_cast<unsigned>(r)]; }
  void set(Reg r, uint64_t v) { value[static_cast<unsigned>(r)] = v; }
};

#define RFLAGS_IF (1ULL << 9)
#define RFLAGS_RESERVED (1ULL << 1)
#define EFER_SCE (1ULL << 0)
#define EFER_LME (1ULL << 8)
#define EFER_LMA (1ULL << 10)
#define EFER_SVME (1ULL << 12)
#define CR4_OSFXSR (1ULL << 9)
#define CR4_VMXE (1ULL << 13)
#define CR4_OSXSAVE (1ULL << 18)
#define XCR0_X87 (1ULL << 0)
#define XCR0_SSE (1ULL << 1)

namespace Vector {
enum : uint8_t {
  DivideError          = 0,
  Debug                = 1,
  Nmi                  = 2,
  Breakpoint           = 3,
  InvalidOpcode        = 6,
  DeviceNotAvailable   = 7,
  DoubleFault          = 8,
  GeneralProtection    = 13,
  PageFault            = 14,
  MachineCheck         = 18,
  IrqStart             = 32,
};
}  // namespace Vector

/* #PF error code bits */
#define PF_PROTECTION (1U << 0)
#define PF_WRITE (1U << 1)
#define PF_USER (1U << 2)
#define PF_FETCH (1U << 4)
#define PF_EPCM_ATTR_MISMATCH (1U << 15)
#define PF_SHARED_MEM_FETCH (1U << 31)

enum class ExitReason {
  EnclaveInstruction,
  Interrupt,
  Exception,
  Hypercall,
  OtherPrivileged,
};

enum class PrivilegedOp {
  None,
  Cpuid,
  Xsetbv,
  Msr,
  Hlt,
  NestedPageFault,
  /* the guest opened an interrupt or NMI window we asked for */
  EventWindow,
  Unknown,
};

enum class EventType {
  ExternalInterrupt,
  Nmi,
  HardwareException,
};

struct ExitInfo {
  ExitReason reason;
  PrivilegedOp op;
  uint64_t rawCode;
  /* interrupt / exception */
  uint8_t vector;
  bool hasVector;
  bool hasErrorCode;
  uint32_t errorCode;
  /* CR2 for #PF, guest-physical address for nested page faults */
  uint64_t faultAddress;
  unsigned accessPerms;
  /* hypercall code taken from RAX */
  uint64_t hypercall;
  unsigned instructionLength;

  static ExitInfo make(ExitReason reason) {
    ExitInfo info;
    memset(&info, 0, sizeof(info));
    info.reason = reason;
    info.op     = PrivilegedOp::None;
    return info;
  }
};

struct PendingEvent {
  EventType type;
  uint8_t vector;
  bool hasErrorCode;
  uint32_t errorCode;
  uint64_t faultAddress;

  static PendingEvent interrupt(uint8_t vector) {
    PendingEvent ev = {EventType::ExternalInterrupt, vector, false, 0, 0};
    return ev;
  }
  static PendingEvent exception(
      uint8_t vector, bool hasErrorCode, uint32_t errorCode,
      uint64_t faultAddress) {
    PendingEvent ev = {EventType::HardwareException, vector, hasErrorCode,
                       errorCode, faultAddress};
    return ev;
  }
};

struct SegmentState {
  uint16_t selector;
  uint64_t base;
  uint32_t limit;
  uint32_t accessRights;
};

/* State of the guest kernel at the moment the hypervisor takes over the
 * core; captured by the platform entry code. */
struct LinuxContext {
  SegmentState cs, ds, es, fs, gs, ss, tr, ldtr;
  uint64_t gdtrBase;
  uint32_t gdtrLimit;
  uint64_t idtrBase;
  uint32_t idtrLimit;
  uint64_t cr0, cr3, cr4;
  uint64_t efer;
  uint64_t pat;
  uint64_t rip, rsp, rflags;
  uint64_t xcr0;
  GuestRegisters regs;
};

}  // namespace HyperEnclave
