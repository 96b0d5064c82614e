//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#include <gtest/gtest.h>
#include <stdio.h>
#include <string>
#include <thread>
#include <vector>

#include "Error.hpp"
#include "common.hpp"

using namespace HyperEnclave;

class LogTest : public ::testing::Test {
 protected:
  void SetUp() {
    sink  = tmpfile();
    saved = getLogLevel();
    ASSERT_TRUE(sink != NULL);
    setLogSink(sink);
  }
  void TearDown() {
    setLogSink(NULL);
    setLogLevel(saved);
    fclose(sink);
  }

  std::string contents() {
    std::string out;
    char buf[256];
    rewind(sink);
    while (fgets(buf, sizeof(buf), sink)) out += buf;
    return out;
  }

  FILE* sink;
  LogLevel saved;
};

TEST_F(LogTest, PrefixAndFormat) {
  setLogLevel(LogLevel::Debug);
  HE_ERROR("enclave %#lx gone", 0x42UL);
  std::string out = contents();
  EXPECT_NE(out.find("[HyperEnclave] "), std::string::npos);
  EXPECT_NE(out.find("log_test.cpp:"), std::string::npos);
  EXPECT_NE(out.find("enclave 0x42 gone\n"), std::string::npos);
}

TEST_F(LogTest, LevelFilters) {
  setLogLevel(LogLevel::Warn);
  HE_DEBUG("debug line");
  HE_INFO("info line");
  HE_WARN("warn line");
  HE_ERROR("error line");

  std::string out = contents();
  EXPECT_EQ(out.find("debug line"), std::string::npos);
  EXPECT_EQ(out.find("info line"), std::string::npos);
  EXPECT_NE(out.find("warn line"), std::string::npos);
  EXPECT_NE(out.find("error line"), std::string::npos);
}

TEST_F(LogTest, ConcurrentWritersAndLevelChanges) {
  const unsigned kWriters = 4;
  const unsigned kLines   = 200;
  std::vector<std::thread> cores;
  for (unsigned t = 0; t < kWriters; t++) {
    cores.push_back(std::thread([t]() {
      for (unsigned i = 0; i < kLines; i++) {
        HE_ERROR("core %u line %u", t, i);
        HE_DEBUG("core %u detail %u", t, i);
      }
    }));
  }
  for (unsigned i = 0; i < kLines; i++)
    setLogLevel(i % 2 ? LogLevel::Debug : LogLevel::Error);
  for (size_t i = 0; i < cores.size(); i++) cores[i].join();

  /* every error line made it out whole, whatever the level did */
  std::string out = contents();
  size_t errors   = 0;
  for (size_t pos = out.find(" line "); pos != std::string::npos;
       pos        = out.find(" line ", pos + 1))
    errors++;
  EXPECT_EQ(errors, size_t(kWriters * kLines));
  size_t lines = 0;
  for (size_t i = 0; i < out.size(); i++) lines += out[i] == '\n';
  EXPECT_GE(lines, errors);
  EXPECT_EQ(out.find("[HyperEnclave] "), 0u);
}

TEST(ErrorTest, Kinds) {
  EXPECT_EQ(errorKind(Error::Success), ErrorKind::None);
  EXPECT_EQ(errorKind(Error::Exhausted), ErrorKind::ResourceExhaustion);
  EXPECT_EQ(errorKind(Error::EnclaveBusy), ErrorKind::ProtocolViolation);
  EXPECT_EQ(errorKind(Error::NotBuilding), ErrorKind::ProtocolViolation);
  EXPECT_EQ(errorKind(Error::VcpuInitFailure), ErrorKind::HardwareFault);
  EXPECT_EQ(errorKind(Error::SecurityViolation), ErrorKind::SecurityBreach);
  EXPECT_STREQ(errorString(Error::NoIdleThread), "NoIdleThread");
}

TEST(ErrorTest, GuestVisibleValuesAreStable) {
  EXPECT_EQ(static_cast<int>(Error::Success), 0);
  EXPECT_EQ(static_cast<int>(Error::Exhausted), 1);
  EXPECT_EQ(static_cast<int>(Error::SecurityViolation), 15);
}
