//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include "SvmBackend.hpp"
#include <stddef.h>
#include <string.h>
#include "Cpu.hpp"
#include "common.hpp"

/* VMCB intercept vectors, AMD APM Vol. 2 Appendix B */
#define SVM_INTERCEPT_INTR (1U << 0)
#define SVM_INTERCEPT_NMI (1U << 1)
#define SVM_INTERCEPT_VINTR (1U << 4)
#define SVM_INTERCEPT_CPUID (1U << 18)
#define SVM_INTERCEPT_HLT (1U << 24)
#define SVM_INTERCEPT_SHUTDOWN (1U << 31)
#define SVM_INTERCEPT_VMRUN (1U << 0)
#define SVM_INTERCEPT_VMMCALL (1U << 1)
#define SVM_INTERCEPT_XSETBV (1U << 13)

#define SVM_TLB_CONTROL_NONE 0
#define SVM_TLB_CONTROL_FLUSH_GUEST 3

#define SVM_EVENTINJ_VALID (1ULL << 31)
#define SVM_EVENTINJ_ERROR_VALID (1ULL << 11)
#define SVM_EVENTINJ_TYPE_INTR 0ULL
#define SVM_EVENTINJ_TYPE_NMI 2ULL
#define SVM_EVENTINJ_TYPE_EXCEPTION 3ULL

#define SVM_V_IRQ (1ULL << 8)
#define SVM_V_IGN_TPR (1ULL << 20)
#define SVM_INTERRUPT_SHADOW (1ULL << 0)

#define SVM_GUEST_ASID 1

namespace HyperEnclave {

struct VmcbSegment {
  uint16_t selector;
  uint16_t attrib;
  uint32_t limit;
  uint64_t base;
};

struct VmcbControl {
  uint16_t interceptCrRead;
  uint16_t interceptCrWrite;
  uint16_t interceptDrRead;
  uint16_t interceptDrWrite;
  uint32_t interceptException;
  uint32_t interceptMisc1;
  uint32_t interceptMisc2;
  uint8_t reserved1[0x03c - 0x014];
  uint16_t pauseFilterThreshold;
  uint16_t pauseFilterCount;
  uint64_t iopmBasePa;
  uint64_t msrpmBasePa;
  uint64_t tscOffset;
  uint32_t guestAsid;
  uint32_t tlbControl;
  uint64_t vIntr;
  uint64_t interruptShadow;
  uint64_t exitCode;
  uint64_t exitInfo1;
  uint64_t exitInfo2;
  uint64_t exitIntInfo;
  uint64_t npEnable;
  uint64_t avicApicBar;
  uint64_t ghcbPa;
  uint64_t eventInj;
  uint64_t nCr3;
  uint64_t lbrVirtualizationEnable;
  uint64_t vmcbClean;
  uint64_t nRip;
  uint8_t reserved2[0x400 - 0x0d0];
};
static_assert(sizeof(VmcbControl) == 0x400, "VMCB control area");

struct VmcbSave {
  VmcbSegment es, cs, ss, ds, fs, gs, gdtr, ldtr, idtr, tr;
  uint8_t reserved1[0x0cb - 0x0a0];
  uint8_t cpl;
  uint32_t reserved2;
  uint64_t efer;
  uint8_t reserved3[0x148 - 0x0d8];
  uint64_t cr4;
  uint64_t cr3;
  uint64_t cr0;
  uint64_t dr7;
  uint64_t dr6;
  uint64_t rflags;
  uint64_t rip;
  uint8_t reserved4[0x1d8 - 0x180];
  uint64_t rsp;
  uint8_t reserved5[0x1f8 - 0x1e0];
  uint64_t rax;
  uint64_t star;
  uint64_t lstar;
  uint64_t cstar;
  uint64_t sfmask;
  uint64_t kernelGsBase;
  uint64_t sysenterCs;
  uint64_t sysenterEsp;
  uint64_t sysenterEip;
  uint64_t cr2;
  uint8_t reserved6[0x268 - 0x248];
  uint64_t gPat;
} __attribute__((packed));
static_assert(offsetof(VmcbSave, efer) == 0x0d0, "VMCB save area");
static_assert(offsetof(VmcbSave, rax) == 0x1f8, "VMCB save area");
static_assert(offsetof(VmcbSave, gPat) == 0x268, "VMCB save area");

struct Vmcb {
  VmcbControl control;
  VmcbSave save;
};

/* VMX-style access rights (type/S/DPL/P in 0-7, AVL/L/DB/G in 12-15)
 * to the packed 12-bit VMCB attribute */
static uint16_t
toVmcbAttrib(uint32_t accessRights) {
  return static_cast<uint16_t>(
      (accessRights & 0xff) | ((accessRights >> 4) & 0xf00));
}

static void
loadSegment(VmcbSegment* dst, const SegmentState& src) {
  dst->selector = src.selector;
  dst->attrib   = toVmcbAttrib(src.accessRights);
  dst->limit    = src.limit;
  dst->base     = src.base;
}

SvmBackend::SvmBackend() {
  memset(&guestRegs, 0, sizeof(guestRegs));
  frames       = NULL;
  guestVmcb    = 0;
  hostVmcb     = 0;
  hostSaveArea = 0;
  guestXcr0    = XCR0_X87 | XCR0_SSE;
  svmOn        = false;
  lastExit     = ExitInfo::make(ExitReason::OtherPrivileged);
}

SvmBackend::~SvmBackend() { teardown(); }

Vmcb*
SvmBackend::vmcb() const {
  return reinterpret_cast<Vmcb*>(frames->physToVirt(guestVmcb));
}

Error
SvmBackend::checkFeatures() {
  uint32_t regs[4];
  Cpu::cpuid(0x80000001, 0, regs);
  if (!(regs[2] & CPUID_8000_0001_ECX_SVM)) {
    HE_ERROR("CPU does not support SVM");
    return Error::UnsupportedFeature;
  }
  Cpu::cpuid(0x8000000a, 0, regs);
  if (!(regs[3] & CPUID_8000_000A_EDX_NP)) {
    HE_ERROR("CPU does not support nested paging");
    return Error::UnsupportedFeature;
  }
  if (!(regs[3] & CPUID_8000_000A_EDX_NRIPS)) {
    HE_ERROR("CPU does not report next RIP on exit");
    return Error::UnsupportedFeature;
  }
  if (Cpu::rdmsr(MSR_VM_CR) & VM_CR_SVMDIS) {
    HE_ERROR("SVM is disabled by firmware");
    return Error::UnsupportedFeature;
  }
  return Error::Success;
}

void
SvmBackend::setupControls() {
  VmcbControl& c = vmcb()->control;
  /* physical interrupts go straight to the guest IDT in normal mode */
  c.interceptMisc1 = SVM_INTERCEPT_NMI | SVM_INTERCEPT_CPUID |
                     SVM_INTERCEPT_HLT | SVM_INTERCEPT_SHUTDOWN;
  c.interceptMisc2 =
      SVM_INTERCEPT_VMRUN | SVM_INTERCEPT_VMMCALL | SVM_INTERCEPT_XSETBV;
  c.interceptException = 0;
  c.guestAsid          = SVM_GUEST_ASID;
  c.tlbControl         = SVM_TLB_CONTROL_FLUSH_GUEST;
  c.npEnable           = 1;
  c.vmcbClean          = 0;
}

void
SvmBackend::setupGuestState(const LinuxContext& linux) {
  VmcbSave& s = vmcb()->save;
  loadSegment(&s.es, linux.es);
  loadSegment(&s.cs, linux.cs);
  loadSegment(&s.ss, linux.ss);
  loadSegment(&s.ds, linux.ds);
  loadSegment(&s.fs, linux.fs);
  loadSegment(&s.gs, linux.gs);
  loadSegment(&s.ldtr, linux.ldtr);
  loadSegment(&s.tr, linux.tr);
  s.gdtr.base  = linux.gdtrBase;
  s.gdtr.limit = linux.gdtrLimit;
  s.idtr.base  = linux.idtrBase;
  s.idtr.limit = linux.idtrLimit;

  s.cr0    = linux.cr0;
  s.cr3    = linux.cr3;
  s.cr4    = linux.cr4;
  s.efer   = linux.efer | EFER_SVME;
  s.gPat   = linux.pat;
  s.dr7    = 0x400;
  s.rip    = linux.rip;
  s.rsp    = linux.rsp;
  s.rflags = linux.rflags | RFLAGS_RESERVED;
  s.rax    = linux.regs.gpr[static_cast<unsigned>(Reg::Rax)];
  s.cpl    = 0;

  guestRegs = linux.regs;
  if (linux.xcr0) guestXcr0 = linux.xcr0;
}

Error
SvmBackend::initVcpu(
    unsigned cpuId, const LinuxContext& linux, FrameAllocator& frameAllocator,
    const PageTable& primary) {
  frames = &frameAllocator;

  Error ret = checkFeatures();
  if (ret != Error::Success) return ret;

  guestVmcb    = frames->allocFrame();
  hostVmcb     = frames->allocFrame();
  hostSaveArea = frames->allocFrame();
  if (!guestVmcb || !hostVmcb || !hostSaveArea) {
    HE_ERROR("CPU %u: out of memory for VMCB", cpuId);
    teardown();
    return Error::VcpuInitFailure;
  }

  Cpu::wrmsr(MSR_IA32_EFER, Cpu::rdmsr(MSR_IA32_EFER) | EFER_SVME);
  Cpu::wrmsr(MSR_VM_HSAVE_PA, hostSaveArea);
  svmOn = true;

  setupControls();
  setupGuestState(linux);
  setNestedPageTable(primary);

  HE_INFO("CPU %u: SVM enabled, VMCB at %#lx", cpuId, guestVmcb);
  return Error::Success;
}

void
SvmBackend::teardown() {
  if (svmOn) {
    Cpu::wrmsr(MSR_VM_HSAVE_PA, 0);
    Cpu::wrmsr(MSR_IA32_EFER, Cpu::rdmsr(MSR_IA32_EFER) & ~EFER_SVME);
    svmOn = false;
  }
  if (frames) {
    if (guestVmcb) frames->freeFrame(guestVmcb);
    if (hostVmcb) frames->freeFrame(hostVmcb);
    if (hostSaveArea) frames->freeFrame(hostSaveArea);
  }
  guestVmcb = hostVmcb = hostSaveArea = 0;
}

Error
SvmBackend::vmEntry() {
  Vmcb* v = vmcb();

  uint64_t hostXcr0 = Cpu::xgetbv(0);
  if (hostXcr0 != guestXcr0) Cpu::xsetbv(0, guestXcr0);
  he_svm_run(&guestRegs, guestVmcb, hostVmcb);
  if (hostXcr0 != guestXcr0) Cpu::xsetbv(0, hostXcr0);

  v->control.tlbControl = SVM_TLB_CONTROL_NONE;
  v->control.eventInj   = 0;

  if (v->control.exitCode == SVM_EXIT_INVALID) {
    HE_ERROR("VMRUN failed on invalid guest state");
    return Error::VmEntryFailure;
  }

  SvmExitRecord record;
  record.exitCode  = v->control.exitCode;
  record.exitInfo1 = v->control.exitInfo1;
  record.exitInfo2 = v->control.exitInfo2;
  record.rip       = v->save.rip;
  record.nextRip   = v->control.nRip;
  record.rax       = v->save.rax;
  lastExit         = svmDecodeExit(record);
  return Error::Success;
}

uint64_t
SvmBackend::getRegister(Reg r) const {
  const VmcbSave& s = vmcb()->save;
  switch (r) {
    case Reg::Rax:
      return s.rax;
    case Reg::Rsp:
      return s.rsp;
    case Reg::Rip:
      return s.rip;
    case Reg::Rflags:
      return s.rflags;
    case Reg::Cr0:
      return s.cr0;
    case Reg::Cr3:
      return s.cr3;
    case Reg::Cr4:
      return s.cr4;
    case Reg::Efer:
      return s.efer & ~EFER_SVME;
    case Reg::FsBase:
      return s.fs.base;
    case Reg::GsBase:
      return s.gs.base;
    case Reg::Xcr0:
      return guestXcr0;
    default:
      return guestRegs.gpr[static_cast<unsigned>(r)];
  }
}

void
SvmBackend::setRegister(Reg r, uint64_t v) {
  VmcbSave& s = vmcb()->save;
  switch (r) {
    case Reg::Rax:
      s.rax = v;
      break;
    case Reg::Rsp:
      s.rsp = v;
      break;
    case Reg::Rip:
      s.rip = v;
      break;
    case Reg::Rflags:
      s.rflags = v | RFLAGS_RESERVED;
      break;
    case Reg::Cr0:
      s.cr0 = v;
      break;
    case Reg::Cr3:
      s.cr3 = v;
      break;
    case Reg::Cr4:
      s.cr4 = v;
      break;
    case Reg::Efer:
      s.efer = v | EFER_SVME;
      break;
    case Reg::FsBase:
      s.fs.base = v;
      break;
    case Reg::GsBase:
      s.gs.base = v;
      break;
    case Reg::Xcr0:
      guestXcr0 = v;
      break;
    default:
      guestRegs.gpr[static_cast<unsigned>(r)] = v;
      break;
  }
}

Error
SvmBackend::mapGuestPhysical(
    PageTable& table, uint64_t gpa, uint64_t hpa, unsigned perms,
    bool encrypted) {
  return table.map(gpa, hpa, perms, encrypted && Config::kSmeEnabled);
}

void
SvmBackend::setNestedPageTable(const PageTable& table) {
  vmcb()->control.nCr3 = table.getRoot();
  invalidateTranslation();
}

void
SvmBackend::invalidateTranslation() {
  vmcb()->control.tlbControl = SVM_TLB_CONTROL_FLUSH_GUEST;
}

void
SvmBackend::setExceptionIntercepts(uint32_t bitmap) {
  VmcbControl& c = vmcb()->control;
  c.interceptException = bitmap;
  /* enclave mode traps interrupts as well, so they end up as an AEX */
  if (bitmap)
    c.interceptMisc1 |= SVM_INTERCEPT_INTR;
  else
    c.interceptMisc1 &= ~SVM_INTERCEPT_INTR;
  c.vmcbClean = 0;
}

void
SvmBackend::injectEvent(const PendingEvent& event) {
  uint64_t type;
  switch (event.type) {
    case EventType::Nmi:
      type = SVM_EVENTINJ_TYPE_NMI;
      break;
    case EventType::HardwareException:
      type = SVM_EVENTINJ_TYPE_EXCEPTION;
      break;
    default:
      type = SVM_EVENTINJ_TYPE_INTR;
      break;
  }

  uint64_t inj = SVM_EVENTINJ_VALID | (type << 8) | event.vector;
  if (event.hasErrorCode) {
    inj |= SVM_EVENTINJ_ERROR_VALID;
    inj |= static_cast<uint64_t>(event.errorCode) << 32;
  }
  vmcb()->control.eventInj = inj;

  if (event.type == EventType::HardwareException &&
      event.vector == Vector::PageFault)
    vmcb()->save.cr2 = event.faultAddress;
}

bool
SvmBackend::isEventDeliverable(EventType type) const {
  const Vmcb* v = vmcb();
  bool shadow   = (v->control.interruptShadow & SVM_INTERRUPT_SHADOW) != 0;
  switch (type) {
    case EventType::ExternalInterrupt:
      return (v->save.rflags & RFLAGS_IF) && !shadow;
    case EventType::Nmi:
      return !shadow;
    default:
      return true;
  }
}

void
SvmBackend::requestEventWindow(EventType type) {
  /* SVM has no NMI window; a virtual interrupt opens no earlier than
   * one, and any later exit retries the NMI anyway */
  (void)type;
  VmcbControl& c = vmcb()->control;
  c.vIntr |= SVM_V_IRQ | SVM_V_IGN_TPR;
  c.interceptMisc1 |= SVM_INTERCEPT_VINTR;
  c.vmcbClean = 0;
}

void
SvmBackend::clearEventWindow() {
  VmcbControl& c = vmcb()->control;
  c.vIntr &= ~(SVM_V_IRQ | SVM_V_IGN_TPR);
  c.interceptMisc1 &= ~SVM_INTERCEPT_VINTR;
  c.vmcbClean = 0;
}

void
SvmBackend::advanceIp(unsigned length) {
  vmcb()->save.rip += length;
}

void
SvmBackend::cpuid(uint32_t leaf, uint32_t subleaf, uint32_t out[4]) const {
  Cpu::cpuid(leaf, subleaf, out);
}

}  // namespace HyperEnclave
