//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <string.h>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "EpcAllocator.hpp"
#include "test_env.hpp"

using namespace HyperEnclave;
using HyperEnclave::test::HostBuffer;

#define TEST_EPC_PAGES 16

class EpcAllocatorTest : public ::testing::Test {
 protected:
  EpcAllocatorTest() : memory(TEST_EPC_PAGES), owner(EnclaveRef::fromId(1ULL << 32)) {
    EpcRegion region;
    region.physBase = memory.addr();
    region.virtBase = memory.get();
    region.numPages = TEST_EPC_PAGES;
    epc             = new EpcAllocator(region);
    setLogLevel(LogLevel::Error);
  }
  ~EpcAllocatorTest() { delete epc; }

  HostBuffer memory;
  EnclaveRef owner;
  EpcAllocator* epc;
};

TEST_F(EpcAllocatorTest, StartsFullyFree) {
  EXPECT_EQ(epc->getCapacity(), (size_t)TEST_EPC_PAGES);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
}

TEST_F(EpcAllocatorTest, FirstFit) {
  EpcPageHandle a, b;
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &a), Error::Success);
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &b), Error::Success);
  EXPECT_EQ(a, 0u);
  EXPECT_EQ(b, 1u);
  EXPECT_EQ(epc->getPhysAddr(b), memory.addr() + PAGE_SIZE);

  ASSERT_EQ(epc->block(a), Error::Success);
  ASSERT_EQ(epc->reclaim(a), Error::Success);
  ASSERT_EQ(epc->free(a), Error::Success);

  EpcPageHandle c;
  ASSERT_EQ(epc->allocate(EpcPageType::Tcs, owner, &c), Error::Success);
  EXPECT_EQ(c, a);
  EXPECT_EQ(epc->getType(c), EpcPageType::Tcs);
}

TEST_F(EpcAllocatorTest, NoTwoLiveHandlesShareAFrame) {
  std::set<uint64_t> frames;
  EpcPageHandle h;
  for (int i = 0; i < TEST_EPC_PAGES; i++) {
    ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &h), Error::Success);
    EXPECT_TRUE(frames.insert(epc->getPhysAddr(h)).second);
  }
  EXPECT_EQ(epc->getFreeCount(), 0u);
  EXPECT_EQ(epc->allocate(EpcPageType::Regular, owner, &h), Error::Exhausted);
}

TEST_F(EpcAllocatorTest, ZeroedBeforeReuse) {
  EpcPageHandle h;
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &h), Error::Success);
  memset(epc->getPtr(h), 0x5a, PAGE_SIZE);
  ASSERT_EQ(epc->block(h), Error::Success);
  ASSERT_EQ(epc->reclaim(h), Error::Success);
  ASSERT_EQ(epc->free(h), Error::Success);

  /* scribble over the free frame: allocate must scrub it again */
  memset(epc->getPtr(h), 0x77, PAGE_SIZE);
  EpcPageHandle again;
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &again), Error::Success);
  ASSERT_EQ(again, h);

  const uint8_t* p = reinterpret_cast<const uint8_t*>(epc->getPtr(again));
  for (size_t i = 0; i < PAGE_SIZE; i++) ASSERT_EQ(p[i], 0) << "offset " << i;
}

TEST_F(EpcAllocatorTest, RefusesToFreeLivePages) {
  EpcPageHandle h;
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &h), Error::Success);
  EXPECT_EQ(epc->free(h), Error::IllegalFree);

  ASSERT_EQ(epc->validate(h), Error::Success);
  EXPECT_EQ(epc->getState(h), EpcPageState::Valid);
  EXPECT_EQ(epc->free(h), Error::IllegalFree);
  EXPECT_EQ(errorKind(Error::IllegalFree), ErrorKind::ProtocolViolation);

  ASSERT_EQ(epc->block(h), Error::Success);
  EXPECT_EQ(epc->free(h), Error::IllegalFree);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES - 1);
}

TEST_F(EpcAllocatorTest, StateMachine) {
  EpcPageHandle h;
  ASSERT_EQ(epc->allocate(EpcPageType::Regular, owner, &h), Error::Success);
  EXPECT_EQ(epc->getState(h), EpcPageState::Pending);
  EXPECT_TRUE(epc->checkOwner(h, owner, EpcPageState::Pending));

  EXPECT_EQ(epc->validate(h), Error::Success);
  EXPECT_EQ(epc->validate(h), Error::InvalidState);
  EXPECT_EQ(epc->block(h), Error::Success);
  EXPECT_EQ(epc->block(h), Error::Success);
  EXPECT_EQ(epc->reclaim(h), Error::Success);
  EXPECT_EQ(epc->getState(h), EpcPageState::Reclaimed);
  EXPECT_TRUE(epc->getOwner(h).isNone());
  EXPECT_EQ(epc->reclaim(h), Error::InvalidState);
  EXPECT_EQ(epc->free(h), Error::Success);
  EXPECT_EQ(epc->getState(h), EpcPageState::Free);
  EXPECT_EQ(epc->block(h), Error::InvalidState);
}

TEST_F(EpcAllocatorTest, LookupByPhysicalAddress) {
  EpcPageHandle h;
  EXPECT_TRUE(epc->lookup(memory.addr() + 3 * PAGE_SIZE + 8, &h));
  EXPECT_EQ(h, 3u);
  EXPECT_FALSE(epc->lookup(memory.addr() + TEST_EPC_PAGES * PAGE_SIZE, &h));
  EXPECT_FALSE(epc->lookup(memory.addr() - PAGE_SIZE, &h));
  EXPECT_EQ(epc->free(TEST_EPC_PAGES), Error::InvalidParameter);
}

TEST_F(EpcAllocatorTest, ConcurrentAllocateAndFree) {
  const unsigned kThreads = 4;
  const unsigned kRounds  = 500;
  const unsigned kBatch   = 3;
  std::atomic<unsigned> holder[TEST_EPC_PAGES];
  for (unsigned i = 0; i < TEST_EPC_PAGES; i++) holder[i].store(0);
  std::atomic<unsigned> conflicts(0);
  std::atomic<unsigned> failures(0);

  std::vector<std::thread> workers;
  for (unsigned t = 0; t < kThreads; t++) {
    workers.push_back(std::thread([&, t]() {
      EnclaveRef me = EnclaveRef::fromId((uint64_t(t + 1) << 32) | t);
      for (unsigned round = 0; round < kRounds; round++) {
        EpcPageHandle held[kBatch];
        unsigned count = 0;
        for (unsigned i = 0; i < kBatch; i++) {
          if (epc->allocate(EpcPageType::Regular, me, &held[count]) !=
              Error::Success)
            continue;
          unsigned expected = 0;
          if (!holder[held[count]].compare_exchange_strong(expected, t + 1))
            conflicts++;
          memset(epc->getPtr(held[count]), t + 1, PAGE_SIZE);
          count++;
        }
        for (unsigned i = 0; i < count; i++) {
          uint8_t* page = static_cast<uint8_t*>(epc->getPtr(held[i]));
          if (page[0] != t + 1 || page[PAGE_SIZE - 1] != t + 1 ||
              !epc->checkOwner(held[i], me, EpcPageState::Pending))
            conflicts++;
          holder[held[i]].store(0);
          if (epc->block(held[i]) != Error::Success ||
              epc->reclaim(held[i]) != Error::Success ||
              epc->free(held[i]) != Error::Success)
            failures++;
        }
      }
    }));
  }
  for (size_t i = 0; i < workers.size(); i++) workers[i].join();

  EXPECT_EQ(conflicts.load(), 0u);
  EXPECT_EQ(failures.load(), 0u);
  EXPECT_EQ(epc->getFreeCount(), (size_t)TEST_EPC_PAGES);
}
