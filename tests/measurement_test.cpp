//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <string.h>

#include "Measurement.hpp"
#include "common.hpp"

using namespace HyperEnclave;

static void
digestOf(const uint8_t* fills, size_t count, uint8_t* md) {
  Measurement m;
  uint8_t page[PAGE_SIZE];
  for (size_t i = 0; i < count; i++) {
    memset(page, fills[i], sizeof(page));
    ASSERT_EQ(m.extendPage(page), Error::Success);
  }
  ASSERT_EQ(m.seal(), Error::Success);
  memcpy(md, m.getDigest(), MDSIZE);
}

TEST(Measurement, Deterministic) {
  const uint8_t fills[3] = {0xaa, 0xbb, 0xcc};
  uint8_t first[MDSIZE], second[MDSIZE];
  digestOf(fills, 3, first);
  digestOf(fills, 3, second);
  EXPECT_EQ(memcmp(first, second, MDSIZE), 0);
}

TEST(Measurement, OrderAndContentMatter) {
  const uint8_t fills[3]     = {0xaa, 0xbb, 0xcc};
  const uint8_t reordered[3] = {0xbb, 0xaa, 0xcc};
  const uint8_t changed[3]   = {0xaa, 0xbb, 0xcd};
  uint8_t a[MDSIZE], b[MDSIZE], c[MDSIZE];
  digestOf(fills, 3, a);
  digestOf(reordered, 3, b);
  digestOf(changed, 3, c);
  EXPECT_NE(memcmp(a, b, MDSIZE), 0);
  EXPECT_NE(memcmp(a, c, MDSIZE), 0);
}

TEST(Measurement, PeekMatchesSeal) {
  Measurement m;
  const char data[] = "hyperenclave";
  ASSERT_EQ(m.extend(data, sizeof(data)), Error::Success);

  uint8_t peeked[MDSIZE];
  m.peek(peeked);
  EXPECT_FALSE(m.isSealed());
  ASSERT_EQ(m.seal(), Error::Success);
  EXPECT_EQ(memcmp(peeked, m.getDigest(), MDSIZE), 0);
}

TEST(Measurement, ReadOnlyOnceSealed) {
  Measurement m;
  uint8_t page[PAGE_SIZE];
  memset(page, 1, sizeof(page));
  ASSERT_EQ(m.seal(), Error::Success);
  EXPECT_TRUE(m.isSealed());
  EXPECT_EQ(m.extendPage(page), Error::AlreadyInitialized);
  EXPECT_EQ(m.extend(page, 16), Error::AlreadyInitialized);
  EXPECT_EQ(m.seal(), Error::AlreadyInitialized);

  m.reset();
  EXPECT_FALSE(m.isSealed());
  EXPECT_EQ(m.extendPage(page), Error::Success);
}

TEST(Measurement, HashHelpersMatchAccumulator) {
  uint8_t page[PAGE_SIZE];
  memset(page, 0x3c, sizeof(page));

  hash_ctx_t ctx;
  uint8_t direct[MDSIZE];
  hash_init(&ctx);
  hash_extend_page(&ctx, page);
  hash_finalize(direct, &ctx);

  Measurement m;
  ASSERT_EQ(m.extendPage(page), Error::Success);
  ASSERT_EQ(m.seal(), Error::Success);
  EXPECT_EQ(memcmp(direct, m.getDigest(), MDSIZE), 0);
}
