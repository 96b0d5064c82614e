//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <string.h>
#include <atomic>
#include <thread>
#include <vector>

#include "Enclave.hpp"
#include "test_env.hpp"

using namespace HyperEnclave;
using namespace HyperEnclave::test;

#define TEST_EPC_PAGES 32

class EnclaveTest : public ::testing::Test {
 protected:
  EnclaveTest()
      : memory(TEST_EPC_PAGES), self(EnclaveRef::fromId((1ULL << 32) | 2)) {
    EpcRegion region;
    region.physBase = memory.addr();
    region.virtBase = memory.get();
    region.numPages = TEST_EPC_PAGES;
    epc             = new EpcAllocator(region);
    enclave         = new Enclave(*epc, frames);
    setLogLevel(LogLevel::Error);
  }
  ~EnclaveTest() {
    delete enclave;
    delete epc;
  }

  Error addRegular(uint64_t addr, uint8_t fill, unsigned perms = Perm::All) {
    uint8_t page[PAGE_SIZE];
    memset(page, fill, sizeof(page));
    return enclave->addPage(addr, page, EpcPageType::Regular, perms);
  }

  Error addTcs(uint64_t addr, uint64_t nssa) {
    uint8_t page[PAGE_SIZE];
    memset(page, 0, sizeof(page));
    TcsDescriptor desc = makeTcsDescriptor(nssa, PAGE_SIZE, 0);
    memcpy(page, &desc, sizeof(desc));
    return enclave->addPage(addr, page, EpcPageType::Tcs, Perm::None);
  }

  /* TCS at the base, two regular pages after it */
  void build() {
    ASSERT_EQ(
        enclave->create(self, makeSecs(TEST_ENCLAVE_BASE, 3)), Error::Success);
    ASSERT_EQ(addTcs(TEST_ENCLAVE_BASE, 2), Error::Success);
    ASSERT_EQ(addRegular(TEST_ENCLAVE_BASE + PAGE_SIZE, 0x11), Error::Success);
    ASSERT_EQ(
        addRegular(TEST_ENCLAVE_BASE + 2 * PAGE_SIZE, 0x22), Error::Success);
  }

  HostBuffer memory;
  SimulatedFrameAllocator frames;
  EnclaveRef self;
  EpcAllocator* epc;
  Enclave* enclave;
};

TEST_F(EnclaveTest, CreateValidatesSecs) {
  SecsParams secs = makeSecs(TEST_ENCLAVE_BASE, 2);
  secs.base += 8;
  EXPECT_EQ(enclave->create(self, secs), Error::InvalidRange);

  secs = makeSecs(TEST_ENCLAVE_BASE, 0);
  EXPECT_EQ(enclave->create(self, secs), Error::InvalidRange);

  secs = makeSecs(HE_MAX_LINEAR_ADDR - PAGE_SIZE, 2);
  EXPECT_EQ(enclave->create(self, secs), Error::InvalidRange);

  secs      = makeSecs(TEST_ENCLAVE_BASE, 2);
  secs.xfrm = XCR0_X87;
  EXPECT_EQ(enclave->create(self, secs), Error::InvalidParameter);

  secs              = makeSecs(TEST_ENCLAVE_BASE, 2);
  secs.ssaFrameSize = 0;
  EXPECT_EQ(enclave->create(self, secs), Error::InvalidParameter);

  EXPECT_EQ(enclave->getState(), EnclaveState::Uninitialized);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);

  ASSERT_EQ(
      enclave->create(self, makeSecs(TEST_ENCLAVE_BASE, 2)), Error::Success);
  EXPECT_EQ(enclave->getState(), EnclaveState::Building);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES - 1);
  EXPECT_EQ(
      enclave->create(self, makeSecs(TEST_ENCLAVE_BASE, 2)),
      Error::InvalidState);
}

TEST_F(EnclaveTest, AddPageChecks) {
  ASSERT_EQ(
      enclave->create(self, makeSecs(TEST_ENCLAVE_BASE, 2)), Error::Success);

  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE - PAGE_SIZE, 1), Error::InvalidRange);
  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE + 2 * PAGE_SIZE, 1), Error::InvalidRange);
  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE + 16, 1), Error::InvalidRange);
  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE, 1, Perm::None), Error::InvalidParameter);
  EXPECT_EQ(addTcs(TEST_ENCLAVE_BASE, 0), Error::InvalidParameter);
  EXPECT_EQ(
      addTcs(TEST_ENCLAVE_BASE, Config::kMaxSsaFrames + 1),
      Error::InvalidParameter);

  ASSERT_EQ(addRegular(TEST_ENCLAVE_BASE, 1), Error::Success);
  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE, 2), Error::InvalidRange);
  EXPECT_EQ(enclave->getPageCount(), 1u);
  EXPECT_TRUE(enclave->isPageMapped(TEST_ENCLAVE_BASE + 0x10));

  /* the EPC copy is mapped at the linear address */
  uint64_t hpa;
  unsigned perms;
  ASSERT_TRUE(enclave->getPageTable().translate(TEST_ENCLAVE_BASE, &hpa, &perms));
  EXPECT_EQ(reinterpret_cast<uint8_t*>(hpa)[100], 1);
  EXPECT_EQ(perms, unsigned(Perm::All));
}

TEST_F(EnclaveTest, TcsPagesAreNotMapped) {
  build();
  Tcs* tcs = enclave->findTcs(TEST_ENCLAVE_BASE);
  ASSERT_TRUE(tcs != NULL);
  EXPECT_EQ(tcs->getNssa(), 2u);
  EXPECT_EQ(tcs->getDescriptor().oentry, PAGE_SIZE);
  EXPECT_EQ(enclave->getTcsCount(), 1u);
  EXPECT_FALSE(enclave->getPageTable().translate(TEST_ENCLAVE_BASE, NULL, NULL));
}

TEST_F(EnclaveTest, LifecycleIsMonotonic) {
  std::vector<EnclaveState> seen;
  seen.push_back(enclave->getState());
  build();
  seen.push_back(enclave->getState());

  EXPECT_EQ(enclave->enter(TEST_ENCLAVE_BASE, false, NULL), Error::InvalidState);
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  seen.push_back(enclave->getState());
  EXPECT_EQ(enclave->initialize(NULL), Error::AlreadyInitialized);
  EXPECT_EQ(addRegular(TEST_ENCLAVE_BASE + PAGE_SIZE, 3), Error::NotBuilding);

  for (int i = 0; i < 2; i++) {
    Tcs* tcs;
    ASSERT_EQ(enclave->enter(TEST_ENCLAVE_BASE, false, &tcs), Error::Success);
    seen.push_back(enclave->getState());
    ASSERT_EQ(enclave->leave(tcs), Error::Success);
    seen.push_back(enclave->getState());
  }
  ASSERT_EQ(enclave->destroy(), Error::Success);
  seen.push_back(enclave->getState());

  const EnclaveState expected[] = {
      EnclaveState::Uninitialized, EnclaveState::Building,
      EnclaveState::Initialized,   EnclaveState::Running,
      EnclaveState::Suspended,     EnclaveState::Running,
      EnclaveState::Suspended,     EnclaveState::Destroyed};
  ASSERT_EQ(seen.size(), sizeof(expected) / sizeof(expected[0]));
  for (size_t i = 0; i < seen.size(); i++) EXPECT_EQ(seen[i], expected[i]);
}

TEST_F(EnclaveTest, InitValidatesPagesAndSeals) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  EXPECT_TRUE(enclave->getMeasurement().isSealed());
  EXPECT_EQ(enclave->checkIntegrity(), Error::Success);

  Tcs* tcs = enclave->findTcs(TEST_ENCLAVE_BASE);
  EXPECT_EQ(epc->getState(tcs->getPage()), EpcPageState::Valid);
}

TEST_F(EnclaveTest, InitRejectsWrongDigest) {
  build();
  uint8_t wrong[MDSIZE];
  memset(wrong, 0, sizeof(wrong));
  EXPECT_EQ(enclave->initialize(wrong), Error::InvalidMeasurement);
  EXPECT_EQ(enclave->getState(), EnclaveState::Building);

  uint8_t right[MDSIZE];
  enclave->getMeasurement().peek(right);
  EXPECT_EQ(enclave->initialize(right), Error::Success);
  EXPECT_EQ(memcmp(enclave->getMeasurement().getDigest(), right, MDSIZE), 0);
}

TEST_F(EnclaveTest, DestroyRefusedWhileBusy) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  size_t freeBefore = epc->getFreeCount();

  Tcs* tcs;
  ASSERT_EQ(enclave->enter(0, false, &tcs), Error::Success);
  EXPECT_EQ(enclave->getBusyCount(), 1u);
  EXPECT_EQ(enclave->enter(0, false, &tcs), Error::NoIdleThread);

  EXPECT_EQ(enclave->destroy(), Error::EnclaveBusy);
  EXPECT_EQ(errorKind(Error::EnclaveBusy), ErrorKind::ProtocolViolation);
  EXPECT_EQ(enclave->getState(), EnclaveState::Running);
  EXPECT_EQ(epc->getFreeCount(), freeBefore);

  ASSERT_EQ(enclave->leave(tcs), Error::Success);
  ASSERT_EQ(enclave->destroy(), Error::Success);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
  EXPECT_EQ(enclave->destroy(), Error::InvalidState);
}

TEST_F(EnclaveTest, DestroyScrubsPages) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  uint64_t hpa;
  ASSERT_TRUE(enclave->getPageTable().translate(
      TEST_ENCLAVE_BASE + PAGE_SIZE, &hpa, NULL));
  uint8_t* frame = reinterpret_cast<uint8_t*>(hpa);
  ASSERT_EQ(frame[0], 0x11);

  ASSERT_EQ(enclave->destroy(), Error::Success);
  for (size_t i = 0; i < PAGE_SIZE; i++) ASSERT_EQ(frame[i], 0);
}

TEST_F(EnclaveTest, SsaAccounting) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  Tcs* tcs;

  EXPECT_EQ(enclave->enter(TEST_ENCLAVE_BASE, true, &tcs), Error::InvalidState);
  ASSERT_EQ(enclave->enter(TEST_ENCLAVE_BASE, false, &tcs), Error::Success);

  SsaFrame frame;
  memset(&frame, 0, sizeof(frame));
  frame.regs.set(Reg::Rax, 7);
  ASSERT_EQ(tcs->pushSsa(frame), Error::Success);
  ASSERT_EQ(tcs->pushSsa(frame), Error::Success);
  EXPECT_EQ(tcs->pushSsa(frame), Error::SsaOverflow);
  ASSERT_EQ(enclave->leave(tcs), Error::Success);

  /* every frame in use: a fresh entry has nowhere to go */
  EXPECT_EQ(enclave->enter(TEST_ENCLAVE_BASE, false, &tcs), Error::SsaOverflow);
  EXPECT_FALSE(tcs->isBusy());

  ASSERT_EQ(enclave->enter(TEST_ENCLAVE_BASE, true, &tcs), Error::Success);
  SsaFrame out;
  ASSERT_EQ(tcs->popSsa(&out), Error::Success);
  EXPECT_EQ(out.regs.get(Reg::Rax), 7u);
  EXPECT_EQ(tcs->getCssa(), 1u);
  EXPECT_EQ(tcs->getSsa(1).regs.get(Reg::Rax), 0u);
  ASSERT_EQ(enclave->leave(tcs), Error::Success);
}

TEST_F(EnclaveTest, RemovePageWhileBuilding) {
  build();
  size_t freeBefore = epc->getFreeCount();
  EXPECT_EQ(enclave->removePage(TEST_ENCLAVE_BASE + 2 * PAGE_SIZE), Error::Success);
  EXPECT_EQ(epc->getFreeCount(), freeBefore + 1);
  EXPECT_FALSE(enclave->isPageMapped(TEST_ENCLAVE_BASE + 2 * PAGE_SIZE));
  EXPECT_EQ(enclave->removePage(TEST_ENCLAVE_BASE + 2 * PAGE_SIZE), Error::NotFound);

  EXPECT_EQ(enclave->removePage(TEST_ENCLAVE_BASE), Error::Success);
  EXPECT_TRUE(enclave->findTcs(TEST_ENCLAVE_BASE) == NULL);
  EXPECT_EQ(enclave->getState(), EnclaveState::Building);
}

TEST_F(EnclaveTest, RemovingValidPageDestroysEnclave) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);

  EXPECT_EQ(
      enclave->removePage(TEST_ENCLAVE_BASE + PAGE_SIZE),
      Error::SecurityViolation);
  EXPECT_EQ(enclave->getState(), EnclaveState::Destroyed);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
}

TEST_F(EnclaveTest, TamperedPageFailsInit) {
  build();
  Tcs* tcs = enclave->findTcs(TEST_ENCLAVE_BASE);
  ASSERT_EQ(epc->block(tcs->getPage()), Error::Success);

  EXPECT_EQ(enclave->initialize(NULL), Error::SecurityViolation);
  EXPECT_EQ(enclave->getState(), EnclaveState::Destroyed);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
}

TEST_F(EnclaveTest, SharedMirrorNeverExecutable) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);
  uint64_t outside = TEST_ENCLAVE_BASE + 0x100000;

  EXPECT_EQ(
      enclave->mirrorSharedPage(outside, 0x9000, Perm::All), Error::InvalidState);

  Tcs* tcs;
  ASSERT_EQ(enclave->enter(0, false, &tcs), Error::Success);
  EXPECT_EQ(
      enclave->mirrorSharedPage(TEST_ENCLAVE_BASE, 0x9000, Perm::All),
      Error::InvalidRange);
  ASSERT_EQ(enclave->mirrorSharedPage(outside, 0x9000, Perm::All), Error::Success);

  unsigned perms;
  ASSERT_TRUE(enclave->getPageTable().translate(outside, NULL, &perms));
  EXPECT_EQ(perms, unsigned(Perm::Read | Perm::Write));
  ASSERT_EQ(enclave->leave(tcs), Error::Success);
}

TEST_F(EnclaveTest, ConcurrentEnterOnOneTcs) {
  build();
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);

  const unsigned kThreads = 8;
  std::atomic<unsigned> ready(0);
  std::atomic<unsigned> entered(0);
  std::atomic<unsigned> refused(0);
  std::vector<Tcs*> held(kThreads, static_cast<Tcs*>(NULL));
  std::vector<std::thread> vcpus;
  for (unsigned i = 0; i < kThreads; i++) {
    vcpus.push_back(std::thread([&, i]() {
      ready++;
      while (ready.load() < kThreads) {
      }
      Tcs* tcs = NULL;
      Error ret = enclave->enter(TEST_ENCLAVE_BASE, false, &tcs);
      if (ret == Error::Success) {
        held[i] = tcs;
        entered++;
      } else if (ret == Error::NoIdleThread) {
        refused++;
      }
    }));
  }
  for (size_t i = 0; i < vcpus.size(); i++) vcpus[i].join();

  EXPECT_EQ(entered.load(), 1u);
  EXPECT_EQ(refused.load(), kThreads - 1);
  EXPECT_EQ(enclave->getBusyCount(), 1u);
  for (unsigned i = 0; i < kThreads; i++) {
    if (held[i]) EXPECT_EQ(enclave->leave(held[i]), Error::Success);
  }
  EXPECT_EQ(enclave->getBusyCount(), 0u);
}

TEST_F(EnclaveTest, PageQueriesDuringForcedDestroy) {
  const unsigned kPages = 20;
  ASSERT_EQ(
      enclave->create(self, makeSecs(TEST_ENCLAVE_BASE, kPages)),
      Error::Success);
  ASSERT_EQ(addTcs(TEST_ENCLAVE_BASE, 2), Error::Success);
  for (unsigned i = 1; i < kPages; i++) {
    ASSERT_EQ(
        addRegular(TEST_ENCLAVE_BASE + i * PAGE_SIZE, uint8_t(i)),
        Error::Success);
  }
  ASSERT_EQ(enclave->initialize(NULL), Error::Success);

  /* another core keeps reading the page list while this one pulls a
   * valid page and tears the enclave down */
  std::atomic<bool> started(false);
  std::atomic<bool> stop(false);
  std::atomic<unsigned> lookups(0);
  std::thread reader([&]() {
    while (!stop.load()) {
      for (unsigned i = 0; i < kPages; i++) {
        if (enclave->isPageMapped(TEST_ENCLAVE_BASE + i * PAGE_SIZE)) lookups++;
      }
      if (enclave->findTcs(TEST_ENCLAVE_BASE) != NULL) lookups++;
      lookups += static_cast<unsigned>(enclave->getPageCount());
      started.store(true);
    }
  });
  while (!started.load()) {
  }

  EXPECT_EQ(
      enclave->removePage(TEST_ENCLAVE_BASE + 5 * PAGE_SIZE),
      Error::SecurityViolation);
  stop.store(true);
  reader.join();

  EXPECT_EQ(enclave->getState(), EnclaveState::Destroyed);
  EXPECT_EQ(enclave->getPageCount(), 0u);
  for (unsigned i = 0; i < kPages; i++)
    EXPECT_FALSE(enclave->isPageMapped(TEST_ENCLAVE_BASE + i * PAGE_SIZE));
  EXPECT_GT(lookups.load(), 0u);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
}
