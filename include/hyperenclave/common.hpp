//******************************************************************************
// Copyright (c) 2018, The Regents of the University of California (Regents).
// All Rights Reserved. See LICENSE for license details.
//------------------------------------------------------------------------------
#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Log.hpp"

#define PAGE_BITS 12
#define PAGE_SIZE (1UL << PAGE_BITS)

#define ROUND_UP(n, b) (((((n)-1ul) >> (b)) + 1ul) << (b))
#define ROUND_DOWN(n, b) ((n) & ~((1ul << (b)) - 1ul))
#define PAGE_DOWN(n) ROUND_DOWN(n, PAGE_BITS)
#define PAGE_UP(n) ROUND_UP(n, PAGE_BITS)
#define IS_ALIGNED(x, align) (!((x) & ((align)-1)))

/* guest linear addresses must stay below the 47-bit canonical limit */
#define HE_MAX_LINEAR_ADDR (1ULL << 47)

#define HE_STR(x) #x
#define HE_XSTR(x) HE_STR(x)
#define HE_MSG(str) "[HyperEnclave] " __FILE__ ":" HE_XSTR(__LINE__) ": " str

#define HE_ERROR(str, ...)                                             \
  ::HyperEnclave::logWrite(                                            \
      ::HyperEnclave::LogLevel::Error, HE_MSG(str) "\n", ##__VA_ARGS__)
#define HE_WARN(str, ...)                                              \
  ::HyperEnclave::logWrite(                                            \
      ::HyperEnclave::LogLevel::Warn, HE_MSG(str) "\n", ##__VA_ARGS__)
#define HE_INFO(str, ...)                                              \
  ::HyperEnclave::logWrite(                                            \
      ::HyperEnclave::LogLevel::Info, HE_MSG(str) "\n", ##__VA_ARGS__)
#define HE_DEBUG(str, ...)                                             \
  ::HyperEnclave::logWrite(                                            \
      ::HyperEnclave::LogLevel::Debug, HE_MSG(str) "\n", ##__VA_ARGS__)

namespace HyperEnclave {

namespace Perm {
enum : unsigned {
  None  = 0,
  Read  = 1 << 0,
  Write = 1 << 1,
  Exec  = 1 << 2,
  All   = Read | Write | Exec,
};
}  // namespace Perm

}  // namespace HyperEnclave
