//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <string.h>
#include <vector>

#include "Config.hpp"
#include "Cpu.hpp"
#include "ExitDispatcher.hpp"
#include "test_env.hpp"

using namespace HyperEnclave;
using namespace HyperEnclave::test;

class ExitDispatcherTest : public SimHypervisorTest {
 protected:
  /* Queue a HLT whose guest step records the registers as the guest
   * sees them after everything queued before it. */
  void snapshot(RegisterFile* regs) {
    ExitInfo hlt = ExitInfo::make(ExitReason::OtherPrivileged);
    hlt.op       = PrivilegedOp::Hlt;
    hlt.instructionLength = 1;
    sim().queueExit(hlt, [regs](SimBackend& cpu) {
      for (unsigned i = 0; i < HE_NUM_REGS; i++)
        regs->value[i] = cpu.getRegister(static_cast<Reg>(i));
    });
  }

  void queuePrivileged(
      PrivilegedOp op, unsigned length,
      SimBackend::GuestStep step = SimBackend::GuestStep()) {
    ExitInfo exit          = ExitInfo::make(ExitReason::OtherPrivileged);
    exit.op                = op;
    exit.instructionLength = length;
    sim().queueExit(exit, step);
  }

  void queueCpuid(uint32_t leaf) {
    queuePrivileged(PrivilegedOp::Cpuid, 2, [leaf](SimBackend& cpu) {
      cpu.setRegister(Reg::Rax, leaf);
      cpu.setRegister(Reg::Rcx, 0);
    });
  }

  void queueXsetbv(uint32_t index, uint64_t value) {
    queuePrivileged(PrivilegedOp::Xsetbv, 3, [=](SimBackend& cpu) {
      cpu.setRegister(Reg::Rcx, index);
      cpu.setRegister(Reg::Rax, value & 0xffffffffULL);
      cpu.setRegister(Reg::Rdx, value >> 32);
    });
  }

  Error run() { return hv->runVcpu(0); }

  const std::vector<PendingEvent>& injected() { return sim().getInjected(); }
};

TEST_F(ExitDispatcherTest, StopsOnDisable) {
  EXPECT_EQ(run(), Error::Success);
  EXPECT_EQ(sim().getEntryCount(), 1u);
  EXPECT_FALSE(sim().isInitialized());
  EXPECT_EQ(
      vcpu().getStats().exits[static_cast<unsigned>(ExitReason::Hypercall)],
      1u);
}

TEST_F(ExitDispatcherTest, EntryFailureEndsLoop) {
  sim().teardown();
  EXPECT_EQ(run(), Error::VmEntryFailure);
}

TEST_F(ExitDispatcherTest, CpuidHypervisorLeaf) {
  RegisterFile regs;
  queueCpuid(HE_CPUID_LEAF_HYPERVISOR);
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);

  char signature[13];
  uint32_t words[3] = {static_cast<uint32_t>(regs.get(Reg::Rbx)),
                       static_cast<uint32_t>(regs.get(Reg::Rcx)),
                       static_cast<uint32_t>(regs.get(Reg::Rdx))};
  memcpy(signature, words, 12);
  signature[12] = 0;
  EXPECT_STREQ(signature, HE_CPUID_SIGNATURE);
  EXPECT_EQ(regs.get(Reg::Rax), HE_CPUID_LEAF_HYPERVISOR);
  EXPECT_EQ(regs.get(Reg::Rip), TEST_HOST_RIP + 2);
}

TEST_F(ExitDispatcherTest, CpuidHidesVmx) {
  RegisterFile regs;
  queueCpuid(1);
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_TRUE(regs.get(Reg::Rcx) & CPUID_1_ECX_HYPERVISOR);
  EXPECT_FALSE(regs.get(Reg::Rcx) & CPUID_1_ECX_VMX);
}

TEST_F(ExitDispatcherTest, VersionAndEpcQuery) {
  RegisterFile version, query;
  sim().queueHypercall(HyperCallCode::HypervisorVersion);
  snapshot(&version);
  sim().queueHypercall(HyperCallCode::EpcQuery);
  snapshot(&query);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_EQ(version.get(Reg::Rax), 0u);
  EXPECT_EQ(version.get(Reg::Rbx), Config::kVersion);
  EXPECT_EQ(version.get(Reg::Rip), TEST_HOST_RIP + 3);

  EXPECT_EQ(query.get(Reg::Rax), 0u);
  EXPECT_EQ(query.get(Reg::Rbx), (uint64_t)kEpcPages);
  EXPECT_EQ(query.get(Reg::Rcx), (uint64_t)kEpcPages);
}

TEST_F(ExitDispatcherTest, UnknownHypercall) {
  RegisterFile regs;
  sim().queueHypercall(static_cast<HyperCallCode>(0x05));
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);
  EXPECT_EQ(regs.get(Reg::Rax), static_cast<uint64_t>(Error::InvalidParameter));
}

TEST_F(ExitDispatcherTest, HltIsSkipped) {
  RegisterFile regs;
  queuePrivileged(PrivilegedOp::Hlt, 1);
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);
  EXPECT_EQ(regs.get(Reg::Rip), TEST_HOST_RIP + 1);
  EXPECT_TRUE(injected().empty());
}

TEST_F(ExitDispatcherTest, MsrAccessInjectsGp) {
  RegisterFile regs;
  queuePrivileged(PrivilegedOp::Msr, 2);
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);

  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].type, EventType::HardwareException);
  EXPECT_EQ(injected()[0].vector, Vector::GeneralProtection);
  EXPECT_TRUE(injected()[0].hasErrorCode);
  /* the faulting instruction is not skipped */
  EXPECT_EQ(regs.get(Reg::Rip), TEST_HOST_RIP);
}

TEST_F(ExitDispatcherTest, UnknownExitInjectsUd) {
  queuePrivileged(PrivilegedOp::Unknown, 0);
  ASSERT_EQ(run(), Error::Success);
  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].vector, Vector::InvalidOpcode);
}

TEST_F(ExitDispatcherTest, ProtectedGpaInjectsGp) {
  sim().queueNestedPageFault(epcMemory.addr(), Perm::Read);
  ASSERT_EQ(run(), Error::Success);
  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].vector, Vector::GeneralProtection);
}

TEST_F(ExitDispatcherTest, Xsetbv) {
  RegisterFile good, bad;
  queueXsetbv(0, XCR0_X87 | XCR0_SSE | (1ULL << 2));
  snapshot(&good);
  queueXsetbv(0, XCR0_SSE);
  snapshot(&bad);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_EQ(good.get(Reg::Xcr0), XCR0_X87 | XCR0_SSE | (1ULL << 2));
  EXPECT_EQ(good.get(Reg::Rip), TEST_HOST_RIP + 3);

  EXPECT_EQ(bad.get(Reg::Xcr0), XCR0_X87 | XCR0_SSE | (1ULL << 2));
  EXPECT_EQ(bad.get(Reg::Rip), TEST_HOST_RIP + 4);
  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].vector, Vector::GeneralProtection);
}

TEST_F(ExitDispatcherTest, OneEventPerEntry) {
  sim().queueInterrupt(0x30);
  sim().queueInterrupt(0x31);
  queuePrivileged(PrivilegedOp::Hlt, 1);
  ASSERT_EQ(run(), Error::Success);

  ASSERT_EQ(injected().size(), 2u);
  EXPECT_EQ(injected()[0].vector, 0x30);
  EXPECT_EQ(injected()[1].vector, 0x31);
  EXPECT_EQ(vcpu().getStats().injectedEvents, 2u);
  EXPECT_EQ(
      vcpu().getStats().exits[static_cast<unsigned>(ExitReason::Interrupt)],
      2u);
}

TEST_F(ExitDispatcherTest, InterruptHeldWhileGuestHasIfClear) {
  /* the guest takes two interrupts inside a cli section */
  ExitInfo irq   = ExitInfo::make(ExitReason::Interrupt);
  irq.vector     = 0x30;
  irq.hasVector  = true;
  sim().queueExit(irq, [](SimBackend& cpu) {
    cpu.setRegister(Reg::Rflags, cpu.getRegister(Reg::Rflags) & ~RFLAGS_IF);
  });
  sim().queueInterrupt(0x31);
  /* sti; hlt */
  queuePrivileged(PrivilegedOp::Hlt, 1, [](SimBackend& cpu) {
    cpu.setRegister(Reg::Rflags, cpu.getRegister(Reg::Rflags) | RFLAGS_IF);
  });
  ASSERT_EQ(run(), Error::Success);

  ASSERT_EQ(injected().size(), 2u);
  EXPECT_EQ(injected()[0].vector, 0x30);
  EXPECT_EQ(injected()[1].vector, 0x31);
  /* the second one went in at the window right after the first */
  EXPECT_EQ(sim().getWindowExitCount(), 1u);
  EXPECT_FALSE(sim().isEventWindowRequested(EventType::ExternalInterrupt));
  EXPECT_EQ(vcpu().getPendingCount(), 0u);
}

TEST_F(ExitDispatcherTest, InterruptShadowDefersInjection) {
  ExitInfo irq  = ExitInfo::make(ExitReason::Interrupt);
  irq.vector    = 0x30;
  irq.hasVector = true;
  sim().queueExit(irq, [](SimBackend& cpu) { cpu.setInterruptShadow(true); });
  queuePrivileged(PrivilegedOp::Hlt, 1, [](SimBackend& cpu) {
    EXPECT_TRUE(cpu.getInjected().empty());
    EXPECT_TRUE(cpu.isEventWindowRequested(EventType::ExternalInterrupt));
  });
  queuePrivileged(PrivilegedOp::Hlt, 1, [](SimBackend& cpu) {
    cpu.setInterruptShadow(false);
  });
  ASSERT_EQ(run(), Error::Success);

  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].vector, 0x30);
  EXPECT_EQ(vcpu().getStats().injectedEvents, 1u);
}

TEST_F(ExitDispatcherTest, BlockedNmiWaitsExceptionDoesNot) {
  ExitInfo nmi  = ExitInfo::make(ExitReason::Interrupt);
  nmi.vector    = Vector::Nmi;
  nmi.hasVector = true;
  sim().queueExit(nmi, [](SimBackend& cpu) { cpu.setNmiBlocked(true); });
  /* a fault on the next instruction still goes in */
  queuePrivileged(PrivilegedOp::Msr, 2);
  queuePrivileged(PrivilegedOp::Hlt, 1, [](SimBackend& cpu) {
    EXPECT_TRUE(cpu.isEventWindowRequested(EventType::Nmi));
    cpu.setNmiBlocked(false);
  });
  ASSERT_EQ(run(), Error::Success);

  ASSERT_EQ(injected().size(), 2u);
  EXPECT_EQ(injected()[0].vector, Vector::GeneralProtection);
  EXPECT_EQ(injected()[1].type, EventType::Nmi);
}

TEST_F(ExitDispatcherTest, BlockedInjectionFailsSimulatedEntry) {
  sim().setRegister(Reg::Rflags, RFLAGS_RESERVED);
  sim().injectEvent(PendingEvent::interrupt(0x30));
  EXPECT_EQ(run(), Error::VmEntryFailure);
}

TEST_F(ExitDispatcherTest, EnclaveRoundTrip) {
  if (!Config::kEnclaveInterrupt) return;

  const uint8_t fills[2] = {0x11, 0x22};
  EnclaveRef ref         = buildEnclave(TEST_ENCLAVE_BASE, fills, 2);
  ASSERT_EQ(hv->getInstructions().init(ref, NULL), Error::Success);

  RegisterFile entered, atAep, resumed, exited;
  sim().queueHypercall(HyperCallCode::EnclaveEnter, TEST_ENCLAVE_BASE, TEST_AEP);
  snapshot(&entered);
  sim().queueInterrupt(0xec);
  snapshot(&atAep);
  sim().queueHypercall(HyperCallCode::EnclaveResume, TEST_ENCLAVE_BASE, TEST_AEP);
  snapshot(&resumed);
  sim().queueHypercall(HyperCallCode::EnclaveExit, 0x405000);
  snapshot(&exited);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_EQ(entered.get(Reg::Rax), 0u);
  EXPECT_EQ(entered.get(Reg::Rcx), TEST_HOST_RIP + 3);
  EXPECT_EQ(entered.get(Reg::Rip), TEST_ENCLAVE_BASE + PAGE_SIZE);

  EXPECT_EQ(
      atAep.get(Reg::Rax),
      static_cast<uint64_t>(HyperCallCode::EnclaveResume));
  EXPECT_EQ(atAep.get(Reg::Rbx), TEST_ENCLAVE_BASE);
  EXPECT_EQ(atAep.get(Reg::Rip), TEST_AEP);

  /* the HLT inside the enclave moved RIP on by one before the AEX */
  EXPECT_EQ(resumed.get(Reg::Rip), TEST_ENCLAVE_BASE + PAGE_SIZE + 1);

  EXPECT_EQ(exited.get(Reg::Rip), 0x405000u);
  EXPECT_EQ(exited.get(Reg::Rax), 0u);
  EXPECT_EQ(vcpu().getMode(), VcpuMode::Normal);

  /* the host got its interrupt once back in normal mode */
  ASSERT_EQ(injected().size(), 1u);
  EXPECT_EQ(injected()[0].vector, 0xec);
  EXPECT_EQ(vcpu().getStats().aex, 1u);
  EXPECT_EQ(vcpu().getStats().enclaveEnters, 2u);

  EXPECT_EQ(hv->getInstructions().destroy(ref), Error::Success);
}

TEST_F(ExitDispatcherTest, DisableRefusedInsideEnclave) {
  const uint8_t fills[1] = {0x11};
  EnclaveRef ref         = buildEnclave(TEST_ENCLAVE_BASE, fills, 1);
  ASSERT_EQ(hv->getInstructions().init(ref, NULL), Error::Success);

  RegisterFile regs;
  sim().queueHypercall(HyperCallCode::EnclaveEnter, TEST_ENCLAVE_BASE, TEST_AEP);
  sim().queueHypercall(HyperCallCode::HypervisorDisable);
  snapshot(&regs);
  sim().queueHypercall(HyperCallCode::EnclaveExit, 0x405000);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_EQ(regs.get(Reg::Rax), static_cast<uint64_t>(Error::InvalidState));
  EXPECT_EQ(vcpu().getMode(), VcpuMode::Normal);
}

TEST_F(ExitDispatcherTest, DestroyedUnderfootReturnsToHost) {
  const uint8_t fills[1] = {0x11};
  EnclaveRef ref         = buildEnclave(TEST_ENCLAVE_BASE, fills, 1);
  ASSERT_EQ(hv->getInstructions().init(ref, NULL), Error::Success);

  EnclaveTable* table = &enclaves();
  RegisterFile regs;
  sim().queueHypercall(HyperCallCode::EnclaveEnter, TEST_ENCLAVE_BASE, TEST_AEP);
  queuePrivileged(PrivilegedOp::Cpuid, 2, [table, ref](SimBackend&) {
    EnclaveTable::Guard enclave(*table, ref);
    enclave->forceDestroy();
  });
  snapshot(&regs);
  ASSERT_EQ(run(), Error::Success);

  EXPECT_EQ(regs.get(Reg::Rax), static_cast<uint64_t>(Error::SecurityViolation));
  EXPECT_EQ(regs.get(Reg::Rip), TEST_HOST_RIP + 3);
  EXPECT_EQ(vcpu().getMode(), VcpuMode::Normal);
  EXPECT_EQ(epc().getFreeCount(), (size_t)kEpcPages);
}
