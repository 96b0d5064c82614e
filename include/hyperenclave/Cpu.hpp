//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <cpuid.h>
#include <stdint.h>
#include "Registers.hpp"

/* Privileged x86 helpers used by the hardware backends. Only valid at
 * CPL0 on the host core. */

#define MSR_IA32_FEATURE_CONTROL 0x0000003a
#define MSR_IA32_PAT 0x00000277
#define MSR_IA32_VMX_BASIC 0x00000480
#define MSR_IA32_VMX_PINBASED_CTLS 0x00000481
#define MSR_IA32_VMX_PROCBASED_CTLS 0x00000482
#define MSR_IA32_VMX_EXIT_CTLS 0x00000483
#define MSR_IA32_VMX_ENTRY_CTLS 0x00000484
#define MSR_IA32_VMX_CR0_FIXED0 0x00000486
#define MSR_IA32_VMX_CR0_FIXED1 0x00000487
#define MSR_IA32_VMX_CR4_FIXED0 0x00000488
#define MSR_IA32_VMX_CR4_FIXED1 0x00000489
#define MSR_IA32_VMX_PROCBASED_CTLS2 0x0000048b
#define MSR_IA32_VMX_EPT_VPID_CAP 0x0000048c
#define MSR_IA32_EFER 0xc0000080
#define MSR_IA32_FS_BASE 0xc0000100
#define MSR_IA32_GS_BASE 0xc0000101
#define MSR_VM_CR 0xc0010114
#define MSR_VM_HSAVE_PA 0xc0010117

#define FEATURE_CONTROL_LOCKED (1ULL << 0)
#define FEATURE_CONTROL_VMXON_OUTSIDE_SMX (1ULL << 2)
#define VM_CR_SVMDIS (1ULL << 4)

#define CPUID_1_ECX_VMX (1U << 5)
#define CPUID_1_ECX_HYPERVISOR (1U << 31)
#define CPUID_8000_0001_ECX_SVM (1U << 2)
#define CPUID_8000_000A_EDX_NP (1U << 0)
#define CPUID_8000_000A_EDX_NRIPS (1U << 3)

namespace HyperEnclave {
namespace Cpu {

struct DescriptorTable {
  uint16_t limit;
  uint64_t base;
} __attribute__((packed));

inline uint64_t
rdmsr(uint32_t msr) {
  uint32_t lo, hi;
  asm volatile("rdmsr" : "=a"(lo), "=d"(hi) : "c"(msr));
  return (static_cast<uint64_t>(hi) << 32) | lo;
}

inline void
wrmsr(uint32_t msr, uint64_t value) {
  asm volatile("wrmsr"
               :
               : "c"(msr), "a"(static_cast<uint32_t>(value)),
                 "d"(static_cast<uint32_t>(value >> 32))
               : "memory");
}

inline uint64_t
readCr0() {
  uint64_t v;
  asm volatile("mov %%cr0, %0" : "=r"(v));
  return v;
}

inline void
writeCr0(uint64_t v) {
  asm volatile("mov %0, %%cr0" : : "r"(v) : "memory");
}

inline void
writeCr2(uint64_t v) {
  asm volatile("mov %0, %%cr2" : : "r"(v) : "memory");
}

inline uint64_t
readCr3() {
  uint64_t v;
  asm volatile("mov %%cr3, %0" : "=r"(v));
  return v;
}

inline uint64_t
readCr4() {
  uint64_t v;
  asm volatile("mov %%cr4, %0" : "=r"(v));
  return v;
}

inline void
writeCr4(uint64_t v) {
  asm volatile("mov %0, %%cr4" : : "r"(v) : "memory");
}

inline uint64_t
xgetbv(uint32_t index) {
  uint32_t lo, hi;
  asm volatile("xgetbv" : "=a"(lo), "=d"(hi) : "c"(index));
  return (static_cast<uint64_t>(hi) << 32) | lo;
}

inline void
xsetbv(uint32_t index, uint64_t value) {
  asm volatile("xsetbv"
               :
               : "c"(index), "a"(static_cast<uint32_t>(value)),
                 "d"(static_cast<uint32_t>(value >> 32)));
}

inline void
sgdt(DescriptorTable* dt) {
  asm volatile("sgdt %0" : "=m"(*dt));
}

inline void
sidt(DescriptorTable* dt) {
  asm volatile("sidt %0" : "=m"(*dt));
}

inline uint16_t
readTr() {
  uint16_t sel;
  asm volatile("str %0" : "=r"(sel));
  return sel;
}

#define HE_READ_SEGMENT(seg)                                  \
  inline uint16_t read##seg() {                               \
    uint16_t sel;                                             \
    asm volatile("mov %%" #seg ", %0" : "=r"(sel));           \
    return sel;                                               \
  }
HE_READ_SEGMENT(cs)
HE_READ_SEGMENT(ss)
HE_READ_SEGMENT(ds)
HE_READ_SEGMENT(es)
HE_READ_SEGMENT(fs)
HE_READ_SEGMENT(gs)
#undef HE_READ_SEGMENT

inline void
cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) {
  __cpuid_count(leaf, subleaf, out[0], out[1], out[2], out[3]);
}

/* base of a system descriptor (TSS) in a 64-bit GDT */
inline uint64_t
systemSegmentBase(const DescriptorTable& gdt, uint16_t selector) {
  const uint8_t* d =
      reinterpret_cast<const uint8_t*>(gdt.base) + (selector & ~7U);
  uint64_t base = d[2] | (d[3] << 8) | (d[4] << 16) |
                  (static_cast<uint64_t>(d[7]) << 24);
  base |= static_cast<uint64_t>(*reinterpret_cast<const uint32_t*>(d + 8))
          << 32;
  return base;
}

}  // namespace Cpu
}  // namespace HyperEnclave
