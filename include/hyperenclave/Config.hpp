//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>
#include "common.hpp"

/* Build-time switches, normally set by CMake. */

#if !defined(HYPERENCLAVE_VENDOR_INTEL) && !defined(HYPERENCLAVE_VENDOR_AMD) && \
    !defined(HYPERENCLAVE_VENDOR_SIM)
#define HYPERENCLAVE_VENDOR_INTEL
#endif

#if defined(HYPERENCLAVE_VENDOR_INTEL) && defined(HYPERENCLAVE_VENDOR_AMD)
#error "HYPERENCLAVE_VENDOR_INTEL and HYPERENCLAVE_VENDOR_AMD are exclusive"
#endif

#ifndef HYPERENCLAVE_EPC_SIZE_MB
#define HYPERENCLAVE_EPC_SIZE_MB 48
#endif

#ifndef HYPERENCLAVE_ENCLAVE_INTERRUPT
#define HYPERENCLAVE_ENCLAVE_INTERRUPT 1
#endif

#ifndef HYPERENCLAVE_SME
#define HYPERENCLAVE_SME 0
#endif

#ifndef HYPERENCLAVE_STATS
#define HYPERENCLAVE_STATS 0
#endif

namespace HyperEnclave {
namespace Config {

enum class Vendor { Intel, Amd, Simulated };

#if defined(HYPERENCLAVE_VENDOR_AMD)
constexpr Vendor kVendor = Vendor::Amd;
#elif defined(HYPERENCLAVE_VENDOR_SIM)
constexpr Vendor kVendor = Vendor::Simulated;
#else
constexpr Vendor kVendor = Vendor::Intel;
#endif

constexpr size_t kEpcSizeMb = HYPERENCLAVE_EPC_SIZE_MB;
static_assert(
    kEpcSizeMb >= 48 && kEpcSizeMb <= 384 && kEpcSizeMb % 48 == 0,
    "EPC size must be one of 48, 96, 144, 192, 240, 288, 336, 384 MiB");

constexpr size_t kEpcPages = kEpcSizeMb * 1024 * 1024 / PAGE_SIZE;

constexpr bool kEnclaveInterrupt = HYPERENCLAVE_ENCLAVE_INTERRUPT != 0;
constexpr bool kSmeEnabled       = HYPERENCLAVE_SME != 0;
constexpr bool kStatsEnabled     = HYPERENCLAVE_STATS != 0;

static_assert(
    !kSmeEnabled || kVendor != Vendor::Intel,
    "secure memory encryption is only available on AMD");

/* SME C-bit position in nested page table entries */
constexpr uint64_t kSmeCBit = kSmeEnabled ? (1ULL << 47) : 0;

constexpr unsigned kDefaultMaxEnclaves = 64;
constexpr unsigned kMaxSsaFrames       = 4;

constexpr uint64_t kVersion = 0x00010000;

}  // namespace Config
}  // namespace HyperEnclave
