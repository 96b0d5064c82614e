//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "VmxBackend.hpp"
#include <string.h>
#include "Cpu.hpp"
#include "common.hpp"

/* VMCS field encodings, Intel SDM Vol. 3 Appendix B */
#define VMCS_VPID 0x0000
#define VMCS_GUEST_ES_SELECTOR 0x0800
#define VMCS_HOST_ES_SELECTOR 0x0c00
#define VMCS_HOST_CS_SELECTOR 0x0c02
#define VMCS_HOST_SS_SELECTOR 0x0c04
#define VMCS_HOST_DS_SELECTOR 0x0c06
#define VMCS_HOST_FS_SELECTOR 0x0c08
#define VMCS_HOST_GS_SELECTOR 0x0c0a
#define VMCS_HOST_TR_SELECTOR 0x0c0c
#define VMCS_MSR_BITMAP 0x2004
#define VMCS_EPT_POINTER 0x201a
#define VMCS_GUEST_PHYSICAL_ADDRESS 0x2400
#define VMCS_LINK_POINTER 0x2800
#define VMCS_GUEST_IA32_PAT 0x2804
#define VMCS_GUEST_IA32_EFER 0x2806
#define VMCS_HOST_IA32_PAT 0x2c00
#define VMCS_HOST_IA32_EFER 0x2c02
#define VMCS_PIN_BASED_CTLS 0x4000
#define VMCS_PROC_BASED_CTLS 0x4002
#define VMCS_EXCEPTION_BITMAP 0x4004
#define VMCS_EXIT_CTLS 0x400c
#define VMCS_ENTRY_CTLS 0x4012
#define VMCS_ENTRY_INTR_INFO 0x4016
#define VMCS_ENTRY_EXCEPTION_ERROR_CODE 0x4018
#define VMCS_ENTRY_INSTRUCTION_LEN 0x401a
#define VMCS_PROC_BASED_CTLS2 0x401e
#define VMCS_INSTRUCTION_ERROR 0x4400
#define VMCS_EXIT_REASON 0x4402
#define VMCS_EXIT_INTR_INFO 0x4404
#define VMCS_EXIT_INTR_ERROR_CODE 0x4406
#define VMCS_EXIT_INSTRUCTION_LEN 0x440c
#define VMCS_GUEST_ES_LIMIT 0x4800
#define VMCS_GUEST_GDTR_LIMIT 0x4810
#define VMCS_GUEST_IDTR_LIMIT 0x4812
#define VMCS_GUEST_ES_ACCESS_RIGHTS 0x4814
#define VMCS_GUEST_INTERRUPTIBILITY 0x4824
#define VMCS_GUEST_ACTIVITY_STATE 0x4826
#define VMCS_HOST_SYSENTER_CS 0x4c00
#define VMCS_CR0_GUEST_HOST_MASK 0x6000
#define VMCS_CR4_GUEST_HOST_MASK 0x6002
#define VMCS_CR0_READ_SHADOW 0x6004
#define VMCS_CR4_READ_SHADOW 0x6006
#define VMCS_EXIT_QUALIFICATION 0x6400
#define VMCS_GUEST_CR0 0x6800
#define VMCS_GUEST_CR3 0x6802
#define VMCS_GUEST_CR4 0x6804
#define VMCS_GUEST_ES_BASE 0x6806
#define VMCS_GUEST_FS_BASE 0x680e
#define VMCS_GUEST_GS_BASE 0x6810
#define VMCS_GUEST_GDTR_BASE 0x6816
#define VMCS_GUEST_IDTR_BASE 0x6818
#define VMCS_GUEST_DR7 0x681a
#define VMCS_GUEST_RSP 0x681c
#define VMCS_GUEST_RIP 0x681e
#define VMCS_GUEST_RFLAGS 0x6820
#define VMCS_HOST_CR0 0x6c00
#define VMCS_HOST_CR3 0x6c02
#define VMCS_HOST_CR4 0x6c04
#define VMCS_HOST_FS_BASE 0x6c06
#define VMCS_HOST_GS_BASE 0x6c08
#define VMCS_HOST_TR_BASE 0x6c0a
#define VMCS_HOST_GDTR_BASE 0x6c0c
#define VMCS_HOST_IDTR_BASE 0x6c0e
#define VMCS_HOST_RIP 0x6c16

/* guest segment fields are laid out ES, CS, SS, DS, FS, GS, LDTR, TR */
#define VMCS_SEGMENT_FIELD(first, idx) ((first) + 2 * (idx))

#define PIN_EXTERNAL_INTERRUPT_EXITING (1U << 0)
#define PIN_NMI_EXITING (1U << 3)
#define PIN_VIRTUAL_NMIS (1U << 5)
#define PROC_INTERRUPT_WINDOW_EXITING (1U << 2)
#define PROC_HLT_EXITING (1U << 7)
#define PROC_NMI_WINDOW_EXITING (1U << 22)
#define PROC_USE_MSR_BITMAPS (1U << 28)
#define PROC_ACTIVATE_SECONDARY (1U << 31)
#define PROC2_ENABLE_EPT (1U << 1)
#define PROC2_ENABLE_RDTSCP (1U << 3)
#define PROC2_ENABLE_VPID (1U << 5)
#define PROC2_ENABLE_INVPCID (1U << 12)
#define PROC2_ENABLE_XSAVES (1U << 20)
#define EXIT_HOST_ADDR_SPACE_SIZE (1U << 9)
#define EXIT_ACK_INTERRUPT (1U << 15)
#define EXIT_SAVE_PAT (1U << 18)
#define EXIT_LOAD_PAT (1U << 19)
#define EXIT_SAVE_EFER (1U << 20)
#define EXIT_LOAD_EFER (1U << 21)
#define ENTRY_IA32E_MODE (1U << 9)
#define ENTRY_LOAD_PAT (1U << 14)
#define ENTRY_LOAD_EFER (1U << 15)

/* guest interruptibility state */
#define VMX_BLOCKING_BY_STI (1U << 0)
#define VMX_BLOCKING_BY_MOV_SS (1U << 1)
#define VMX_BLOCKING_BY_NMI (1U << 3)

#define EPTP_MEMTYPE_WB 6ULL
#define EPTP_WALK_LENGTH_4 (3ULL << 3)
#define EPT_CAP_INVEPT_SINGLE (1ULL << 41)
#define INVEPT_SINGLE_CONTEXT 1

namespace HyperEnclave {

static inline bool
vmxon(uint64_t pa) {
  uint8_t failed;
  asm volatile("vmxon %1; setna %0" : "=q"(failed) : "m"(pa) : "cc", "memory");
  return !failed;
}

static inline void
vmxoff() {
  asm volatile("vmxoff" : : : "cc");
}

static inline bool
vmclear(uint64_t pa) {
  uint8_t failed;
  asm volatile("vmclear %1; setna %0"
               : "=q"(failed)
               : "m"(pa)
               : "cc", "memory");
  return !failed;
}

static inline bool
vmptrld(uint64_t pa) {
  uint8_t failed;
  asm volatile("vmptrld %1; setna %0"
               : "=q"(failed)
               : "m"(pa)
               : "cc", "memory");
  return !failed;
}

static inline uint64_t
vmread(uint64_t field) {
  uint64_t value;
  asm volatile("vmread %1, %0" : "=r"(value) : "r"(field) : "cc");
  return value;
}

static inline void
vmwrite(uint64_t field, uint64_t value) {
  asm volatile("vmwrite %1, %0" : : "r"(field), "rm"(value) : "cc");
}

static inline void
invept(uint64_t type, uint64_t eptp) {
  struct {
    uint64_t eptp;
    uint64_t reserved;
  } desc = {eptp, 0};
  asm volatile("invept %0, %1" : : "m"(desc), "r"(type) : "cc", "memory");
}

/* allowed-0 settings in the low half, allowed-1 in the high half */
static uint32_t
adjustControls(uint32_t msr, uint32_t requested) {
  uint64_t caps = Cpu::rdmsr(msr);
  requested |= static_cast<uint32_t>(caps);
  requested &= static_cast<uint32_t>(caps >> 32);
  return requested;
}

static uint64_t
vmcsFieldFor(Reg r) {
  switch (r) {
    case Reg::Rsp:
      return VMCS_GUEST_RSP;
    case Reg::Rip:
      return VMCS_GUEST_RIP;
    case Reg::Rflags:
      return VMCS_GUEST_RFLAGS;
    case Reg::Cr0:
      return VMCS_GUEST_CR0;
    case Reg::Cr3:
      return VMCS_GUEST_CR3;
    case Reg::Cr4:
      return VMCS_GUEST_CR4;
    case Reg::Efer:
      return VMCS_GUEST_IA32_EFER;
    case Reg::FsBase:
      return VMCS_GUEST_FS_BASE;
    case Reg::GsBase:
      return VMCS_GUEST_GS_BASE;
    default:
      return 0;
  }
}

VmxBackend::VmxBackend() {
  memset(&guestRegs, 0, sizeof(guestRegs));
  frames        = NULL;
  vmxonRegion   = 0;
  vmcsRegion    = 0;
  msrBitmap     = 0;
  eptp          = 0;
  guestXcr0     = XCR0_X87 | XCR0_SSE;
  pendingCr2    = 0;
  hasPendingCr2 = false;
  launched      = false;
  vmxOn         = false;
  lastExit      = ExitInfo::make(ExitReason::OtherPrivileged);
}

VmxBackend::~VmxBackend() { teardown(); }

Error
VmxBackend::checkFeatures() {
  uint32_t regs[4];
  Cpu::cpuid(1, 0, regs);
  if (!(regs[2] & CPUID_1_ECX_VMX)) {
    HE_ERROR("CPU does not support VMX");
    return Error::UnsupportedFeature;
  }

  uint64_t basic = Cpu::rdmsr(MSR_IA32_VMX_BASIC);
  (void)basic;
  uint64_t procCaps = Cpu::rdmsr(MSR_IA32_VMX_PROCBASED_CTLS);
  if (!((procCaps >> 32) & PROC_ACTIVATE_SECONDARY)) {
    HE_ERROR("VMX secondary controls are not available");
    return Error::UnsupportedFeature;
  }
  uint64_t proc2Caps = Cpu::rdmsr(MSR_IA32_VMX_PROCBASED_CTLS2);
  if (!((proc2Caps >> 32) & PROC2_ENABLE_EPT)) {
    HE_ERROR("CPU does not support EPT");
    return Error::UnsupportedFeature;
  }
  uint64_t eptCaps = Cpu::rdmsr(MSR_IA32_VMX_EPT_VPID_CAP);
  if (!(eptCaps & EPT_CAP_INVEPT_SINGLE)) {
    HE_ERROR("CPU does not support single-context INVEPT");
    return Error::UnsupportedFeature;
  }
  return Error::Success;
}

Error
VmxBackend::enableVmx() {
  uint64_t feature = Cpu::rdmsr(MSR_IA32_FEATURE_CONTROL);
  if (feature & FEATURE_CONTROL_LOCKED) {
    if (!(feature & FEATURE_CONTROL_VMXON_OUTSIDE_SMX)) {
      HE_ERROR("VMX is disabled by firmware");
      return Error::UnsupportedFeature;
    }
  } else {
    Cpu::wrmsr(
        MSR_IA32_FEATURE_CONTROL, feature | FEATURE_CONTROL_LOCKED |
                                      FEATURE_CONTROL_VMXON_OUTSIDE_SMX);
  }

  uint64_t cr0 = Cpu::readCr0();
  cr0 |= Cpu::rdmsr(MSR_IA32_VMX_CR0_FIXED0);
  cr0 &= Cpu::rdmsr(MSR_IA32_VMX_CR0_FIXED1);
  Cpu::writeCr0(cr0);

  uint64_t cr4 = Cpu::readCr4() | CR4_VMXE;
  cr4 |= Cpu::rdmsr(MSR_IA32_VMX_CR4_FIXED0);
  cr4 &= Cpu::rdmsr(MSR_IA32_VMX_CR4_FIXED1);
  Cpu::writeCr4(cr4);

  uint32_t revision =
      static_cast<uint32_t>(Cpu::rdmsr(MSR_IA32_VMX_BASIC)) & 0x7fffffff;
  *reinterpret_cast<uint32_t*>(frames->physToVirt(vmxonRegion)) = revision;
  *reinterpret_cast<uint32_t*>(frames->physToVirt(vmcsRegion))  = revision;

  if (!vmxon(vmxonRegion)) {
    HE_ERROR("VMXON failed");
    return Error::VcpuInitFailure;
  }
  vmxOn = true;

  if (!vmclear(vmcsRegion) || !vmptrld(vmcsRegion)) {
    HE_ERROR("cannot load the VMCS");
    return Error::VcpuInitFailure;
  }
  return Error::Success;
}

void
VmxBackend::setupControls() {
  vmwrite(
      VMCS_PIN_BASED_CTLS,
      adjustControls(
          MSR_IA32_VMX_PINBASED_CTLS,
          PIN_EXTERNAL_INTERRUPT_EXITING | PIN_NMI_EXITING |
              PIN_VIRTUAL_NMIS));
  vmwrite(
      VMCS_PROC_BASED_CTLS,
      adjustControls(
          MSR_IA32_VMX_PROCBASED_CTLS,
          PROC_HLT_EXITING | PROC_USE_MSR_BITMAPS | PROC_ACTIVATE_SECONDARY));
  vmwrite(
      VMCS_PROC_BASED_CTLS2,
      adjustControls(
          MSR_IA32_VMX_PROCBASED_CTLS2,
          PROC2_ENABLE_EPT | PROC2_ENABLE_RDTSCP | PROC2_ENABLE_VPID |
              PROC2_ENABLE_INVPCID | PROC2_ENABLE_XSAVES));
  vmwrite(
      VMCS_EXIT_CTLS,
      adjustControls(
          MSR_IA32_VMX_EXIT_CTLS, EXIT_HOST_ADDR_SPACE_SIZE |
                                      EXIT_ACK_INTERRUPT | EXIT_SAVE_PAT |
                                      EXIT_LOAD_PAT | EXIT_SAVE_EFER |
                                      EXIT_LOAD_EFER));
  vmwrite(
      VMCS_ENTRY_CTLS,
      adjustControls(
          MSR_IA32_VMX_ENTRY_CTLS,
          ENTRY_IA32E_MODE | ENTRY_LOAD_PAT | ENTRY_LOAD_EFER));

  /* an all-zero bitmap lets every MSR through */
  vmwrite(VMCS_MSR_BITMAP, msrBitmap);
  vmwrite(VMCS_VPID, 1);
  vmwrite(VMCS_EXCEPTION_BITMAP, 0);
  vmwrite(VMCS_CR0_GUEST_HOST_MASK, 0);
  vmwrite(VMCS_CR4_GUEST_HOST_MASK, CR4_VMXE);
  vmwrite(VMCS_LINK_POINTER, ~0ULL);
}

void
VmxBackend::setupHostState() {
  Cpu::DescriptorTable gdt, idt;
  Cpu::sgdt(&gdt);
  Cpu::sidt(&idt);
  uint16_t tr = Cpu::readTr();

  vmwrite(VMCS_HOST_CS_SELECTOR, Cpu::readcs() & ~7U);
  vmwrite(VMCS_HOST_SS_SELECTOR, Cpu::readss() & ~7U);
  vmwrite(VMCS_HOST_DS_SELECTOR, Cpu::readds() & ~7U);
  vmwrite(VMCS_HOST_ES_SELECTOR, Cpu::reades() & ~7U);
  vmwrite(VMCS_HOST_FS_SELECTOR, Cpu::readfs() & ~7U);
  vmwrite(VMCS_HOST_GS_SELECTOR, Cpu::readgs() & ~7U);
  vmwrite(VMCS_HOST_TR_SELECTOR, tr & ~7U);

  vmwrite(VMCS_HOST_CR0, Cpu::readCr0());
  vmwrite(VMCS_HOST_CR3, Cpu::readCr3());
  vmwrite(VMCS_HOST_CR4, Cpu::readCr4());
  vmwrite(VMCS_HOST_FS_BASE, Cpu::rdmsr(MSR_IA32_FS_BASE));
  vmwrite(VMCS_HOST_GS_BASE, Cpu::rdmsr(MSR_IA32_GS_BASE));
  vmwrite(VMCS_HOST_TR_BASE, Cpu::systemSegmentBase(gdt, tr));
  vmwrite(VMCS_HOST_GDTR_BASE, gdt.base);
  vmwrite(VMCS_HOST_IDTR_BASE, idt.base);
  vmwrite(VMCS_HOST_SYSENTER_CS, 0);
  vmwrite(VMCS_HOST_IA32_PAT, Cpu::rdmsr(MSR_IA32_PAT));
  vmwrite(VMCS_HOST_IA32_EFER, Cpu::rdmsr(MSR_IA32_EFER));
  /* HOST_RSP is written by the entry stub on every run */
  vmwrite(VMCS_HOST_RIP, reinterpret_cast<uint64_t>(&he_vmx_exit));
}

void
VmxBackend::setupGuestState(const LinuxContext& linux) {
  const SegmentState* segs[8] = {&linux.es, &linux.cs, &linux.ss,
                                 &linux.ds, &linux.fs, &linux.gs,
                                 &linux.ldtr, &linux.tr};
  for (unsigned i = 0; i < 8; i++) {
    vmwrite(VMCS_SEGMENT_FIELD(VMCS_GUEST_ES_SELECTOR, i), segs[i]->selector);
    vmwrite(VMCS_SEGMENT_FIELD(VMCS_GUEST_ES_LIMIT, i), segs[i]->limit);
    vmwrite(
        VMCS_SEGMENT_FIELD(VMCS_GUEST_ES_ACCESS_RIGHTS, i),
        segs[i]->accessRights);
    vmwrite(VMCS_SEGMENT_FIELD(VMCS_GUEST_ES_BASE, i), segs[i]->base);
  }

  vmwrite(VMCS_GUEST_GDTR_BASE, linux.gdtrBase);
  vmwrite(VMCS_GUEST_GDTR_LIMIT, linux.gdtrLimit);
  vmwrite(VMCS_GUEST_IDTR_BASE, linux.idtrBase);
  vmwrite(VMCS_GUEST_IDTR_LIMIT, linux.idtrLimit);

  vmwrite(VMCS_GUEST_CR0, linux.cr0);
  vmwrite(VMCS_CR0_READ_SHADOW, linux.cr0);
  vmwrite(VMCS_GUEST_CR3, linux.cr3);
  vmwrite(VMCS_GUEST_CR4, linux.cr4 | CR4_VMXE);
  vmwrite(VMCS_CR4_READ_SHADOW, linux.cr4);
  vmwrite(VMCS_GUEST_IA32_EFER, linux.efer);
  vmwrite(VMCS_GUEST_IA32_PAT, linux.pat);
  vmwrite(VMCS_GUEST_DR7, 0x400);

  vmwrite(VMCS_GUEST_RIP, linux.rip);
  vmwrite(VMCS_GUEST_RSP, linux.rsp);
  vmwrite(VMCS_GUEST_RFLAGS, linux.rflags | RFLAGS_RESERVED);
  vmwrite(VMCS_GUEST_INTERRUPTIBILITY, 0);
  vmwrite(VMCS_GUEST_ACTIVITY_STATE, 0);

  guestRegs = linux.regs;
  if (linux.xcr0) guestXcr0 = linux.xcr0;
}

Error
VmxBackend::initVcpu(
    unsigned cpuId, const LinuxContext& linux, FrameAllocator& frameAllocator,
    const PageTable& primary) {
  frames = &frameAllocator;

  Error ret = checkFeatures();
  if (ret != Error::Success) return ret;

  vmxonRegion = frames->allocFrame();
  vmcsRegion  = frames->allocFrame();
  msrBitmap   = frames->allocFrame();
  if (!vmxonRegion || !vmcsRegion || !msrBitmap) {
    HE_ERROR("CPU %u: out of memory for VMX regions", cpuId);
    teardown();
    return Error::VcpuInitFailure;
  }

  ret = enableVmx();
  if (ret != Error::Success) {
    teardown();
    return ret;
  }

  setupControls();
  setupHostState();
  setupGuestState(linux);
  setNestedPageTable(primary);

  HE_INFO("CPU %u: VMX enabled, VMCS at %#lx", cpuId, vmcsRegion);
  return Error::Success;
}

void
VmxBackend::teardown() {
  if (vmxOn) {
    vmclear(vmcsRegion);
    vmxoff();
    Cpu::writeCr4(Cpu::readCr4() & ~CR4_VMXE);
    vmxOn = false;
  }
  if (frames) {
    if (vmxonRegion) frames->freeFrame(vmxonRegion);
    if (vmcsRegion) frames->freeFrame(vmcsRegion);
    if (msrBitmap) frames->freeFrame(msrBitmap);
  }
  vmxonRegion = vmcsRegion = msrBitmap = 0;
  launched                             = false;
}

Error
VmxBackend::vmEntry() {
  if (hasPendingCr2) {
    Cpu::writeCr2(pendingCr2);
    hasPendingCr2 = false;
  }

  uint64_t hostXcr0 = Cpu::xgetbv(0);
  if (hostXcr0 != guestXcr0) Cpu::xsetbv(0, guestXcr0);
  int failed = he_vmx_run(&guestRegs, launched ? 1 : 0);
  if (hostXcr0 != guestXcr0) Cpu::xsetbv(0, hostXcr0);

  if (failed) {
    HE_ERROR(
        "VM entry failed, instruction error %lu",
        vmread(VMCS_INSTRUCTION_ERROR));
    return Error::VmEntryFailure;
  }
  launched = true;

  VmxExitRecord record;
  record.exitReason            = static_cast<uint32_t>(vmread(VMCS_EXIT_REASON));
  record.qualification         = vmread(VMCS_EXIT_QUALIFICATION);
  record.interruptionInfo      = static_cast<uint32_t>(vmread(VMCS_EXIT_INTR_INFO));
  record.interruptionErrorCode =
      static_cast<uint32_t>(vmread(VMCS_EXIT_INTR_ERROR_CODE));
  record.guestPhysAddr = vmread(VMCS_GUEST_PHYSICAL_ADDRESS);
  record.instructionLength =
      static_cast<uint32_t>(vmread(VMCS_EXIT_INSTRUCTION_LEN));
  record.rax = guestRegs.gpr[static_cast<unsigned>(Reg::Rax)];

  if ((record.exitReason & 0xffff) == VMX_EXIT_ENTRY_FAIL_GUEST) {
    HE_ERROR("VM entry failed on invalid guest state");
    return Error::VmEntryFailure;
  }
  lastExit = vmxDecodeExit(record);
  return Error::Success;
}

uint64_t
VmxBackend::getRegister(Reg r) const {
  unsigned idx = static_cast<unsigned>(r);
  if (r == Reg::Xcr0) return guestXcr0;
  if (r == Reg::Cr4) return vmread(VMCS_CR4_READ_SHADOW);
  if (idx < HE_NUM_GPRS && r != Reg::Rsp) return guestRegs.gpr[idx];
  return vmread(vmcsFieldFor(r));
}

void
VmxBackend::setRegister(Reg r, uint64_t v) {
  unsigned idx = static_cast<unsigned>(r);
  if (r == Reg::Xcr0) {
    guestXcr0 = v;
  } else if (r == Reg::Cr4) {
    vmwrite(VMCS_CR4_READ_SHADOW, v);
    vmwrite(VMCS_GUEST_CR4, v | CR4_VMXE);
  } else if (r == Reg::Cr0) {
    vmwrite(VMCS_CR0_READ_SHADOW, v);
    vmwrite(VMCS_GUEST_CR0, v);
  } else if (idx < HE_NUM_GPRS && r != Reg::Rsp) {
    guestRegs.gpr[idx] = v;
  } else {
    vmwrite(vmcsFieldFor(r), v);
  }
}

Error
VmxBackend::mapGuestPhysical(
    PageTable& table, uint64_t gpa, uint64_t hpa, unsigned perms,
    bool encrypted) {
  /* EPT has no encryption bit */
  (void)encrypted;
  return table.map(gpa, hpa, perms, false);
}

void
VmxBackend::setNestedPageTable(const PageTable& table) {
  eptp = table.getRoot() | EPTP_MEMTYPE_WB | EPTP_WALK_LENGTH_4;
  vmwrite(VMCS_EPT_POINTER, eptp);
  invalidateTranslation();
}

void
VmxBackend::invalidateTranslation() {
  invept(INVEPT_SINGLE_CONTEXT, eptp);
}

void
VmxBackend::setExceptionIntercepts(uint32_t bitmap) {
  vmwrite(VMCS_EXCEPTION_BITMAP, bitmap);
}

void
VmxBackend::injectEvent(const PendingEvent& event) {
  uint32_t type;
  switch (event.type) {
    case EventType::Nmi:
      type = VMX_INTR_TYPE_NMI;
      break;
    case EventType::HardwareException:
      type = VMX_INTR_TYPE_HW_EXCEPTION;
      break;
    default:
      type = VMX_INTR_TYPE_EXTERNAL;
      break;
  }

  uint32_t info =
      VMX_INTR_INFO_VALID | (type << VMX_INTR_INFO_TYPE_SHIFT) | event.vector;
  if (event.hasErrorCode) {
    info |= VMX_INTR_INFO_ERROR_CODE;
    vmwrite(VMCS_ENTRY_EXCEPTION_ERROR_CODE, event.errorCode);
  }
  vmwrite(VMCS_ENTRY_INTR_INFO, info);
  vmwrite(VMCS_ENTRY_INSTRUCTION_LEN, 0);

  if (event.type == EventType::HardwareException &&
      event.vector == Vector::PageFault) {
    pendingCr2    = event.faultAddress;
    hasPendingCr2 = true;
  }
}

bool
VmxBackend::isEventDeliverable(EventType type) const {
  uint64_t blocking = vmread(VMCS_GUEST_INTERRUPTIBILITY);
  switch (type) {
    case EventType::ExternalInterrupt:
      /* VM entry rejects the injection otherwise */
      return (vmread(VMCS_GUEST_RFLAGS) & RFLAGS_IF) &&
             !(blocking & (VMX_BLOCKING_BY_STI | VMX_BLOCKING_BY_MOV_SS));
    case EventType::Nmi:
      return !(blocking & (VMX_BLOCKING_BY_STI | VMX_BLOCKING_BY_MOV_SS |
                           VMX_BLOCKING_BY_NMI));
    default:
      return true;
  }
}

void
VmxBackend::requestEventWindow(EventType type) {
  uint64_t ctls = vmread(VMCS_PROC_BASED_CTLS);
  if (type == EventType::Nmi)
    ctls |= PROC_NMI_WINDOW_EXITING;
  else if (type == EventType::ExternalInterrupt)
    ctls |= PROC_INTERRUPT_WINDOW_EXITING;
  vmwrite(VMCS_PROC_BASED_CTLS, ctls);
}

void
VmxBackend::clearEventWindow() {
  vmwrite(
      VMCS_PROC_BASED_CTLS,
      vmread(VMCS_PROC_BASED_CTLS) &
          ~(uint64_t)(PROC_INTERRUPT_WINDOW_EXITING | PROC_NMI_WINDOW_EXITING));
}

void
VmxBackend::advanceIp(unsigned length) {
  vmwrite(VMCS_GUEST_RIP, vmread(VMCS_GUEST_RIP) + length);
}

void
VmxBackend::cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) const {
  Cpu::cpuid(leaf, subleaf, out);
}

}  // namespace HyperEnclave
